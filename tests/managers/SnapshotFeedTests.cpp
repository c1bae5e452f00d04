/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SnapshotFeedTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/SnapshotFeed.hpp"
#include "utils/JsonReader.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace PetDock;

struct FeedFixture {
    const std::string path = "tests/test_data/companions_feed.json";
    int deliveries{0};
    std::vector<CompanionSnapshot> last;

    FeedFixture() {
        PETDOCK_ENABLE_QUIET_MODE();
        std::filesystem::create_directories("tests/test_data");
    }

    ~FeedFixture() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        PETDOCK_DISABLE_QUIET_MODE();
    }

    void writeFeed(const std::string& content) {
        std::ofstream file(path, std::ios::trunc);
        file << content;
    }

    SnapshotFeed::Consumer consumer() {
        return [this](const std::vector<CompanionSnapshot>& snapshot) {
            ++deliveries;
            last = snapshot;
        };
    }

    static std::vector<CompanionSnapshot> parse(const std::string& json) {
        JsonReader reader;
        BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());
        auto result = SnapshotFeed::fromJson(reader.getRoot());
        BOOST_REQUIRE(result.has_value());
        return *result;
    }
};

BOOST_FIXTURE_TEST_SUITE(SnapshotParsingTests, FeedFixture)

BOOST_AUTO_TEST_CASE(TestFullEntry) {
    auto snapshot = parse(R"([{"id": "abc", "scale": 1.5, "sprite": "res/sprites/cat.png",
                              "stage": "adult", "default_facing": "right"}])");
    BOOST_REQUIRE_EQUAL(snapshot.size(), 1u);
    BOOST_CHECK_EQUAL(snapshot[0].id, "abc");
    BOOST_CHECK_CLOSE(snapshot[0].scale, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(snapshot[0].spritePath, "res/sprites/cat.png");
    BOOST_CHECK_EQUAL(snapshot[0].stage, "adult");
    BOOST_CHECK_EQUAL(snapshot[0].defaultFacing, SpriteFacing::Right);
}

BOOST_AUTO_TEST_CASE(TestDefaults) {
    auto snapshot = parse(R"([{"id": "abc"}])");
    BOOST_REQUIRE_EQUAL(snapshot.size(), 1u);
    BOOST_CHECK_EQUAL(snapshot[0].scale, 1.0f);
    BOOST_CHECK(snapshot[0].spritePath.empty());
    BOOST_CHECK_EQUAL(snapshot[0].stage, "egg");
    BOOST_CHECK_EQUAL(snapshot[0].defaultFacing, SpriteFacing::Left);
}

BOOST_AUTO_TEST_CASE(TestInvalidValuesFallBack) {
    auto snapshot = parse(R"([
        {"id": "a", "scale": -2, "stage": "", "default_facing": "up"},
        {"id": "b", "scale": "big", "sprite": 12, "stage": 3}
    ])");
    BOOST_REQUIRE_EQUAL(snapshot.size(), 2u);
    BOOST_CHECK_EQUAL(snapshot[0].scale, 1.0f);
    BOOST_CHECK_EQUAL(snapshot[0].stage, "egg");
    BOOST_CHECK_EQUAL(snapshot[0].defaultFacing, SpriteFacing::Left);
    BOOST_CHECK_EQUAL(snapshot[1].scale, 1.0f);
    BOOST_CHECK(snapshot[1].spritePath.empty());
    BOOST_CHECK_EQUAL(snapshot[1].stage, "egg");
}

BOOST_AUTO_TEST_CASE(TestEntriesWithoutIdSkipped) {
    auto snapshot = parse(R"([{"scale": 1}, {"id": ""}, {"id": 5}, "text", {"id": "ok"}])");
    BOOST_REQUIRE_EQUAL(snapshot.size(), 1u);
    BOOST_CHECK_EQUAL(snapshot[0].id, "ok");
}

BOOST_AUTO_TEST_CASE(TestNonArrayRootRejected) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"id": "abc"})"));
    BOOST_CHECK(!SnapshotFeed::fromJson(reader.getRoot()).has_value());
}

BOOST_AUTO_TEST_CASE(TestEmptyArrayIsValid) {
    auto snapshot = parse("[]");
    BOOST_CHECK(snapshot.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SnapshotPollingTests, FeedFixture)

BOOST_AUTO_TEST_CASE(TestFirstUpdateAlwaysPolls) {
    writeFeed(R"([{"id": "a"}, {"id": "b"}])");
    SnapshotFeed feed(path, 5000);

    BOOST_CHECK(feed.update(123, consumer()));
    BOOST_CHECK_EQUAL(deliveries, 1);
    BOOST_CHECK_EQUAL(last.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestPollingRespectsInterval) {
    writeFeed(R"([{"id": "a"}])");
    SnapshotFeed feed(path, 5000);

    BOOST_CHECK(feed.update(0, consumer()));
    BOOST_CHECK(!feed.update(4999, consumer()));
    BOOST_CHECK_EQUAL(deliveries, 1);

    writeFeed(R"([{"id": "a"}, {"id": "c"}])");
    BOOST_CHECK(feed.update(5000, consumer()));
    BOOST_CHECK_EQUAL(deliveries, 2);
    BOOST_CHECK_EQUAL(last.size(), 2u);
    BOOST_CHECK_EQUAL(last[1].id, "c");
}

BOOST_AUTO_TEST_CASE(TestFailedPollDeliversNothing) {
    SnapshotFeed missing("tests/test_data/no_such_feed.json", 1000);
    BOOST_CHECK(!missing.update(0, consumer()));

    writeFeed("[{\"id\": ");
    SnapshotFeed broken(path, 1000);
    BOOST_CHECK(!broken.update(0, consumer()));

    writeFeed(R"({"not": "an array"})");
    BOOST_CHECK(!broken.update(1000, consumer()));

    BOOST_CHECK_EQUAL(deliveries, 0);
}

BOOST_AUTO_TEST_CASE(TestEmptySnapshotIsDelivered) {
    writeFeed("[]");
    SnapshotFeed feed(path, 1000);
    BOOST_CHECK(feed.update(0, consumer()));
    BOOST_CHECK_EQUAL(deliveries, 1);
    BOOST_CHECK(last.empty());
}

BOOST_AUTO_TEST_SUITE_END()
