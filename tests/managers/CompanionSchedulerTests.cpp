/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CompanionSchedulerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/CompanionScheduler.hpp"
#include "mocks/MockCompanionVisual.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using namespace PetDock;

struct QuietLogsFixture {
    QuietLogsFixture() { PETDOCK_ENABLE_QUIET_MODE(); }
    ~QuietLogsFixture() { PETDOCK_DISABLE_QUIET_MODE(); }
};

BOOST_GLOBAL_FIXTURE(QuietLogsFixture);

namespace {

CompanionSnapshot makeSnapshot(const std::string& id, const std::string& stage = "adult",
                               float scale = 1.0f) {
    CompanionSnapshot snapshot;
    snapshot.id = id;
    snapshot.scale = scale;
    snapshot.spritePath = "res/sprites/" + id + ".png";
    snapshot.stage = stage;
    return snapshot;
}

} // namespace

struct SchedulerFixture {
    std::unordered_map<std::string, MockCompanionVisual*> visuals;
    std::unordered_map<std::string, CompanionDisplaySettings> settings;
    std::unique_ptr<CompanionScheduler> scheduler;

    SchedulerFixture() {
        SchedulerConfig config;
        config.seed = 12345;
        config.initialContainerWidth = 800.0f;

        scheduler = std::make_unique<CompanionScheduler>(config, [this](const std::string& id) {
            auto visual = std::make_unique<MockCompanionVisual>(id);
            visuals[id] = visual.get();
            return visual;
        });
        scheduler->setSettingsGetter([this](const std::string& id) {
            auto it = settings.find(id);
            return it != settings.end() ? it->second : CompanionDisplaySettings{};
        });
        scheduler->setScreenSize(1920.0f, 1080.0f);
    }

    const CompanionState& state(const std::string& id) const {
        const CompanionState* s = scheduler->getState(id);
        BOOST_REQUIRE(s != nullptr);
        return *s;
    }

    // Ticks until the companion rests, returning the tick time it started resting
    Uint64 walkUntilResting(const std::string& id, Uint64 startMs = 0) {
        Uint64 now = startMs;
        for (int i = 0; i < 5000 && !state(id).isResting; ++i) {
            scheduler->tick(now);
            now += 16;
        }
        BOOST_REQUIRE(state(id).isResting);
        return now - 16;
    }
};

BOOST_FIXTURE_TEST_SUITE(ReconcileTests, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestReconcileCreatesCompanions) {
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b")});

    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 2u);
    BOOST_CHECK(scheduler->hasCompanion("a"));
    BOOST_CHECK(scheduler->hasCompanion("b"));

    const std::vector<std::string> expected{"a", "b"};
    BOOST_CHECK(scheduler->getCompanionIds() == expected);

    for (const auto& id : expected) {
        const CompanionState& s = state(id);
        const float maxX = 800.0f - 96.0f - CompanionConstants::EDGE_MARGIN;
        BOOST_CHECK_GE(s.position, CompanionConstants::EDGE_MARGIN);
        BOOST_CHECK_LE(s.position, maxX);
        BOOST_CHECK_GE(s.speedMultiplier, CompanionConstants::SPEED_MULTIPLIER_MIN);
        BOOST_CHECK_LE(s.speedMultiplier, CompanionConstants::SPEED_MULTIPLIER_MAX);
        BOOST_CHECK_EQUAL(visuals[id]->getPosition(), s.position);
    }
}

BOOST_AUTO_TEST_CASE(TestReconcileRemovesMissingIds) {
    settings["a"].storedPosition = 100.0f;
    settings["b"].storedPosition = 500.0f;
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b")});
    auto hit = scheduler->hitTest(101.0f, 1.0f);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_EQUAL(hit->id, "a");

    scheduler->reconcile({makeSnapshot("b")});

    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 1u);
    BOOST_CHECK(!scheduler->hasCompanion("a"));
    BOOST_CHECK(scheduler->getState("a") == nullptr);
    // Handle released with the companion
    BOOST_CHECK(hit->visual.expired());
}

BOOST_AUTO_TEST_CASE(TestReconcileIsIdempotent) {
    const std::vector<CompanionSnapshot> snapshot{makeSnapshot("a"), makeSnapshot("b", "egg")};
    scheduler->reconcile(snapshot);

    const CompanionState before = state("a");
    const size_t spriteLoads = visuals["a"]->getSpriteLoads().size();

    scheduler->reconcile(snapshot);

    const CompanionState& after = state("a");
    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 2u);
    BOOST_CHECK_EQUAL(after.position, before.position);
    BOOST_CHECK_EQUAL(after.targetPosition, before.targetPosition);
    BOOST_CHECK_EQUAL(after.speedMultiplier, before.speedMultiplier);
    BOOST_CHECK_EQUAL(after.direction, before.direction);
    BOOST_CHECK_EQUAL(visuals["a"]->getSpriteLoads().size(), spriteLoads);
}

BOOST_AUTO_TEST_CASE(TestReconcileRefreshesAttributesInPlace) {
    scheduler->reconcile({makeSnapshot("a")});
    const float position = state("a").position;
    MockCompanionVisual* visual = visuals["a"];

    CompanionSnapshot grown = makeSnapshot("a", "adult", 0.5f);
    grown.spritePath = "res/sprites/a_grown.png";
    grown.defaultFacing = SpriteFacing::Right;
    scheduler->reconcile({grown});

    BOOST_CHECK_EQUAL(visuals["a"], visual);
    BOOST_CHECK_EQUAL(state("a").scaleFactor, 0.5f);
    BOOST_CHECK_EQUAL(state("a").defaultFacing, SpriteFacing::Right);
    BOOST_CHECK_EQUAL(state("a").position, position);
    BOOST_CHECK_EQUAL(visual->getWidth(), 48.0f);
    BOOST_CHECK_EQUAL(visual->getSpriteLoads().back(), "res/sprites/a_grown.png");
}

BOOST_AUTO_TEST_CASE(TestEntriesWithoutIdAreSkipped) {
    scheduler->reconcile({makeSnapshot(""), makeSnapshot("a")});
    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSpriteFailureStillCreatesCompanion) {
    // Factory output is only known after creation, so fail through the visual
    scheduler->reconcile({makeSnapshot("a")});
    visuals["a"]->failSprite("res/sprites/missing.png");

    CompanionSnapshot broken = makeSnapshot("a");
    broken.spritePath = "res/sprites/missing.png";
    scheduler->reconcile({broken});

    BOOST_CHECK(scheduler->hasCompanion("a"));
    BOOST_CHECK_EQUAL(state("a").spritePath, "res/sprites/missing.png");
}

BOOST_AUTO_TEST_CASE(TestStoredPositionUsedAtCreation) {
    CompanionDisplaySettings stored;
    stored.storedPosition = 123.0f;
    settings["a"] = stored;

    scheduler->reconcile({makeSnapshot("a")});

    BOOST_CHECK_EQUAL(state("a").position, 123.0f);
    BOOST_CHECK_EQUAL(visuals["a"]->getPosition(), 123.0f);
}

BOOST_AUTO_TEST_CASE(TestStoredPositionClampedIntoContainer) {
    CompanionDisplaySettings stored;
    stored.storedPosition = 5000.0f;
    settings["a"] = stored;

    scheduler->reconcile({makeSnapshot("a")});

    BOOST_CHECK_EQUAL(state("a").position, 800.0f - 96.0f - CompanionConstants::EDGE_MARGIN);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MotionTests, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestTickIsNoOpUntilStarted) {
    scheduler->reconcile({makeSnapshot("a")});
    const float position = state("a").position;

    scheduler->tick(0);
    BOOST_CHECK_EQUAL(state("a").position, position);
}

BOOST_AUTO_TEST_CASE(TestTickStepsTowardTarget) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();

    const CompanionState before = state("a");
    scheduler->tick(0);
    const CompanionState& after = state("a");

    const float expected = before.position + before.effectiveSpeed() * directionSign(before.direction);
    BOOST_CHECK_CLOSE(after.position, expected, 0.001f);
    BOOST_CHECK_EQUAL(visuals["a"]->getPosition(), after.position);
    BOOST_CHECK_EQUAL(before.direction, before.targetPosition > before.position
                                            ? WalkDirection::Forward
                                            : WalkDirection::Backward);
}

BOOST_AUTO_TEST_CASE(TestTargetKeepsMinimumDistance) {
    scheduler->reconcile({makeSnapshot("a")});
    const CompanionState& s = state("a");
    BOOST_CHECK_GE(std::fabs(s.targetPosition - s.position), CompanionConstants::MIN_TARGET_DISTANCE);
}

BOOST_AUTO_TEST_CASE(TestRestAfterReachingTarget) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();

    const Uint64 restStart = walkUntilResting("a");
    const CompanionState& s = state("a");

    BOOST_CHECK_GE(s.restUntil, restStart + CompanionConstants::REST_MIN_MS);
    BOOST_CHECK_LT(s.restUntil, restStart + CompanionConstants::REST_MAX_MS);
    BOOST_CHECK(!visuals["a"]->isWalking());

    // Resting companions stay put
    const float position = s.position;
    scheduler->tick(s.restUntil - 1);
    BOOST_CHECK(state("a").isResting);
    BOOST_CHECK_EQUAL(state("a").position, position);

    scheduler->tick(state("a").restUntil);
    BOOST_CHECK(!state("a").isResting);
    BOOST_CHECK(visuals["a"]->isWalking());
    BOOST_CHECK_GE(std::fabs(state("a").targetPosition - position), CompanionConstants::MIN_TARGET_DISTANCE);
}

BOOST_AUTO_TEST_CASE(TestPositionStaysInBounds) {
    CompanionDisplaySettings fast;
    fast.movementSpeed = CompanionConstants::SPEED_MAX;
    settings["a"] = fast;

    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();

    const float lo = CompanionConstants::EDGE_MARGIN;
    const float hi = 800.0f - 96.0f - CompanionConstants::EDGE_MARGIN;
    Uint64 now = 0;
    for (int i = 0; i < 20000; ++i) {
        scheduler->tick(now);
        now += 16;
        const float x = state("a").position;
        BOOST_REQUIRE_GE(x, lo);
        BOOST_REQUIRE_LE(x, hi);
    }
}

BOOST_AUTO_TEST_CASE(TestEggNeverMoves) {
    scheduler->reconcile({makeSnapshot("egg1", "egg")});
    scheduler->start();
    const float position = state("egg1").position;

    for (Uint64 now = 0; now < 20000; now += 16) {
        scheduler->tick(now);
    }

    BOOST_CHECK_EQUAL(state("egg1").position, position);
    // Eggs still play their animation
    BOOST_CHECK(visuals["egg1"]->isWalking());
}

BOOST_AUTO_TEST_CASE(TestPauseFreezesEveryCompanion) {
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b")});
    scheduler->start();
    scheduler->togglePause();
    BOOST_CHECK(scheduler->isPaused());

    const float a = state("a").position;
    const float b = state("b").position;
    scheduler->tick(0);
    scheduler->tick(16);

    BOOST_CHECK_EQUAL(state("a").position, a);
    BOOST_CHECK_EQUAL(state("b").position, b);
    BOOST_CHECK(!visuals["a"]->isWalking());

    scheduler->togglePause();
    scheduler->tick(32);
    BOOST_CHECK_NE(state("a").position, a);
}

BOOST_AUTO_TEST_CASE(TestMovementDisabledSetting) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();

    CompanionDisplaySettings disabled;
    disabled.movementEnabled = false;
    scheduler->applySettings("a", disabled);

    const float position = state("a").position;
    scheduler->tick(0);
    BOOST_CHECK_EQUAL(state("a").position, position);
    BOOST_CHECK(!visuals["a"]->isWalking());
}

BOOST_AUTO_TEST_CASE(TestSpeedSettingClamped) {
    scheduler->reconcile({makeSnapshot("a")});

    CompanionDisplaySettings s;
    s.movementSpeed = 10.0f;
    scheduler->applySettings("a", s);
    BOOST_CHECK_EQUAL(state("a").baseSpeed, CompanionConstants::SPEED_MAX);

    s.movementSpeed = 0.0f;
    scheduler->applySettings("a", s);
    BOOST_CHECK_EQUAL(state("a").baseSpeed, CompanionConstants::SPEED_MIN);

    // Unknown ids are ignored
    scheduler->applySettings("nobody", s);
    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDraggedCompanionSkippedByTick) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();

    const float committed = state("a").position;
    visuals["a"]->setDragged(true);
    visuals["a"]->setPosition(300.0f);

    scheduler->tick(0);

    BOOST_CHECK_EQUAL(state("a").position, committed);
    BOOST_CHECK_EQUAL(visuals["a"]->getPosition(), 300.0f);
}

BOOST_AUTO_TEST_CASE(TestStopAndStartToggleAnimation) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->start();
    BOOST_CHECK(scheduler->isRunning());
    BOOST_CHECK(visuals["a"]->isWalking());

    scheduler->stop();
    BOOST_CHECK(!scheduler->isRunning());
    BOOST_CHECK(!visuals["a"]->isWalking());
}

BOOST_AUTO_TEST_CASE(TestDisposeReleasesEverything) {
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b")});
    scheduler->start();
    scheduler->dispose();

    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 0u);
    BOOST_CHECK(!scheduler->isRunning());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(BoundsAndSizingTests, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestContainerShrinkClampsCompanions) {
    CompanionDisplaySettings stored;
    stored.storedPosition = 600.0f;
    settings["a"] = stored;
    scheduler->reconcile({makeSnapshot("a")});

    scheduler->setContainerWidth(400.0f);

    const float hi = 400.0f - 96.0f - CompanionConstants::EDGE_MARGIN;
    BOOST_CHECK_EQUAL(state("a").position, hi);
    BOOST_CHECK_EQUAL(visuals["a"]->getPosition(), hi);
    BOOST_CHECK_LE(state("a").targetPosition, hi);
}

BOOST_AUTO_TEST_CASE(TestNarrowContainerPinsToMargin) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->setContainerWidth(50.0f);

    BOOST_CHECK_EQUAL(state("a").position, CompanionConstants::EDGE_MARGIN);
    BOOST_CHECK_EQUAL(state("a").targetPosition, CompanionConstants::EDGE_MARGIN);
}

BOOST_AUTO_TEST_CASE(TestShortSpanAcceptsNearbyTargets) {
    scheduler->reconcile({makeSnapshot("a")});
    visuals["a"]->forceRenderedWidth(64.0f);
    // Walkable span [10, 86] is narrower than the distance rule applies to
    scheduler->setContainerWidth(160.0f);

    const float lo = CompanionConstants::EDGE_MARGIN;
    const float hi = 160.0f - 64.0f - CompanionConstants::EDGE_MARGIN;
    int nearby = 0;
    for (int i = 0; i < 200; ++i) {
        visuals["a"]->setPosition(40.0f);
        scheduler->notifyExternalReposition("a");

        const float target = state("a").targetPosition;
        BOOST_CHECK_GE(target, lo);
        BOOST_CHECK_LE(target, hi);
        if (std::fabs(target - 40.0f) < 20.0f) {
            ++nearby;
        }
    }
    // Draws closer than the 50 unit minimum are kept
    BOOST_CHECK_GT(nearby, 0);
}

BOOST_AUTO_TEST_CASE(TestVisualBoundsStandOnFloor) {
    settings["a"].storedPosition = 100.0f;
    scheduler->reconcile({makeSnapshot("a")});

    const std::vector<SDL_FRect> bounds = scheduler->getVisualBounds(200.0f);
    BOOST_REQUIRE_EQUAL(bounds.size(), 1u);
    BOOST_CHECK_EQUAL(bounds[0].x, 100.0f);
    BOOST_CHECK_EQUAL(bounds[0].w, 96.0f);
    BOOST_CHECK_EQUAL(bounds[0].h, 96.0f);
    BOOST_CHECK_EQUAL(bounds[0].y, 104.0f);

    visuals["a"]->forceRenderedWidth(0.0f);
    BOOST_CHECK(scheduler->getVisualBounds(200.0f).empty());
}

BOOST_AUTO_TEST_CASE(TestScreenScaleFactor) {
    BOOST_CHECK_CLOSE(CompanionScheduler::calculateScreenScaleFactor(1920.0f, 1080.0f), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(CompanionScheduler::calculateScreenScaleFactor(3840.0f, 2160.0f),
                      CompanionConstants::MAX_SCREEN_SCALE, 0.001f);
    BOOST_CHECK_CLOSE(CompanionScheduler::calculateScreenScaleFactor(800.0f, 600.0f),
                      CompanionConstants::MIN_SCREEN_SCALE, 0.001f);
    BOOST_CHECK_CLOSE(CompanionScheduler::calculateScreenScaleFactor(2560.0f, 1440.0f),
                      2560.0f / 1920.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestSizeFollowsScaleAndScreen) {
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b", "adult", 0.5f)});
    BOOST_CHECK_EQUAL(visuals["a"]->getWidth(), 96.0f);
    BOOST_CHECK_EQUAL(visuals["b"]->getWidth(), 48.0f);

    scheduler->setScreenSize(3840.0f, 2160.0f);
    BOOST_CHECK_EQUAL(visuals["a"]->getWidth(), 144.0f);
    BOOST_CHECK_EQUAL(visuals["b"]->getWidth(), 72.0f);
}

BOOST_AUTO_TEST_CASE(TestMirrorFollowsFacingAndHeading) {
    CompanionSnapshot right = makeSnapshot("r");
    right.defaultFacing = SpriteFacing::Right;
    scheduler->reconcile({makeSnapshot("l"), right});

    for (const std::string id : {"l", "r"}) {
        const CompanionState& s = state(id);
        BOOST_CHECK_EQUAL(visuals[id]->isMirrored(), needsMirror(s.defaultFacing, s.direction));
    }

    BOOST_CHECK(needsMirror(SpriteFacing::Left, WalkDirection::Forward));
    BOOST_CHECK(!needsMirror(SpriteFacing::Left, WalkDirection::Backward));
    BOOST_CHECK(needsMirror(SpriteFacing::Right, WalkDirection::Backward));
    BOOST_CHECK(!needsMirror(SpriteFacing::Right, WalkDirection::Forward));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ExternalRepositionTests, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestRepositionReadsBackVisual) {
    scheduler->reconcile({makeSnapshot("a")});
    visuals["a"]->setPosition(250.0f);

    scheduler->notifyExternalReposition("a");

    const CompanionState& s = state("a");
    BOOST_CHECK_EQUAL(s.position, 250.0f);
    BOOST_CHECK_GE(std::fabs(s.targetPosition - 250.0f), CompanionConstants::MIN_TARGET_DISTANCE);
    BOOST_CHECK_EQUAL(s.direction, s.targetPosition > 250.0f ? WalkDirection::Forward
                                                             : WalkDirection::Backward);
}

BOOST_AUTO_TEST_CASE(TestRepositionOfEggKeepsTarget) {
    scheduler->reconcile({makeSnapshot("e", "egg")});
    const float target = state("e").targetPosition;
    visuals["e"]->setPosition(200.0f);

    scheduler->notifyExternalReposition("e");

    BOOST_CHECK_EQUAL(state("e").position, 200.0f);
    BOOST_CHECK_EQUAL(state("e").targetPosition, target);
}

BOOST_AUTO_TEST_CASE(TestRepositionOfUnknownIdIgnored) {
    scheduler->reconcile({makeSnapshot("a")});
    scheduler->notifyExternalReposition("ghost");
    BOOST_CHECK_EQUAL(scheduler->getCompanionCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestHitTestPrefersNewestCompanion) {
    CompanionDisplaySettings first;
    first.storedPosition = 100.0f;
    CompanionDisplaySettings second;
    second.storedPosition = 150.0f;
    settings["a"] = first;
    settings["b"] = second;
    scheduler->reconcile({makeSnapshot("a"), makeSnapshot("b")});

    auto overlap = scheduler->hitTest(160.0f, 10.0f);
    BOOST_REQUIRE(overlap.has_value());
    BOOST_CHECK_EQUAL(overlap->id, "b");

    auto onlyFirst = scheduler->hitTest(110.0f, 10.0f);
    BOOST_REQUIRE(onlyFirst.has_value());
    BOOST_CHECK_EQUAL(onlyFirst->id, "a");

    BOOST_CHECK(!scheduler->hitTest(700.0f, 10.0f).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
