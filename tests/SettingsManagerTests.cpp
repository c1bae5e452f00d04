/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace PetDock;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";

    SettingsTestFixture() {
        PETDOCK_ENABLE_QUIET_MODE();
        std::filesystem::create_directories("tests/test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        PETDOCK_DISABLE_QUIET_MODE();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("window", "width", 1024));
    BOOST_CHECK_EQUAL(settings.get<int>("window", "width", 0), 1024);

    // Default when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("window", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("companion.abc", "movement_speed", 1.25f));
    BOOST_CHECK_CLOSE(settings.get<float>("companion.abc", "movement_speed", 0.0f), 1.25f, 0.001f);

    // Doubles are stored as float
    BOOST_CHECK(settings.set("companion.abc", "x", 12.5));
    BOOST_CHECK_CLOSE(settings.get<float>("companion.abc", "x", 0.0f), 12.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBool) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("graphics", "vsync", true));
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", false), true);

    BOOST_CHECK(settings.set("graphics", "vsync", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", true), false);
}

BOOST_AUTO_TEST_CASE(TestGetSetString) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("hotkey", "combination", std::string("CommandOrControl+O")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("hotkey", "combination", ""), "CommandOrControl+O");

    // String literals convert
    BOOST_CHECK(settings.set("hotkey", "pause_combination", "Ctrl+P"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("hotkey", "pause_combination", ""), "Ctrl+P");
}

BOOST_AUTO_TEST_CASE(TestNumericCoercion) {
    auto& settings = SettingsManager::Instance();

    // A position saved as int reads back as float and vice versa
    settings.set("window", "x", 300);
    BOOST_CHECK_CLOSE(settings.get<float>("window", "x", 0.0f), 300.0f, 0.001f);

    settings.set("window", "y", 40.6f);
    BOOST_CHECK_EQUAL(settings.get<int>("window", "y", 0), 41);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "value", 42);

    // Non-numeric reads fall back to the default
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");

    settings.set("test", "flag", true);
    BOOST_CHECK_EQUAL(settings.get<int>("test", "flag", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndClear) {
    auto& settings = SettingsManager::Instance();

    settings.set("companion.a", "x", 1.0f);
    settings.set("companion.a", "movement_enabled", false);
    settings.set("companion.b", "x", 2.0f);

    BOOST_CHECK(settings.has("companion.a", "x"));
    BOOST_CHECK(!settings.has("companion.a", "nonexistent"));
    BOOST_CHECK(!settings.has("nonexistent", "x"));

    BOOST_CHECK(settings.remove("companion.a", "x"));
    BOOST_CHECK(!settings.remove("companion.a", "x"));
    BOOST_CHECK(settings.has("companion.a", "movement_enabled"));

    BOOST_CHECK(settings.clearCategory("companion.a"));
    BOOST_CHECK(!settings.clearCategory("companion.a"));
    BOOST_CHECK(settings.has("companion.b", "x"));

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeysSorted) {
    auto& settings = SettingsManager::Instance();

    settings.set("window", "y", 1);
    settings.set("hotkey", "hold_ms", 500);
    settings.set("window", "x", 1);
    settings.set("graphics", "vsync", true);

    const std::vector<std::string> categories{"graphics", "hotkey", "window"};
    BOOST_CHECK(settings.getCategories() == categories);

    const std::vector<std::string> keys{"x", "y"};
    BOOST_CHECK(settings.getKeys("window") == keys);
    BOOST_CHECK(settings.getKeys("nonexistent").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "window": { "x": 120, "y": 900, "width": 640.5 },
  "hotkey": { "combination": "Ctrl+Shift+O", "hold_ms": 750 },
  "graphics": { "vsync": false },
  "ignored": { "nested": { "a": 1 }, "list": [1, 2] }
})");

    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("window", "x", 0), 120);
    BOOST_CHECK_CLOSE(settings.get<float>("window", "width", 0.0f), 640.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("hotkey", "combination", ""), "Ctrl+Shift+O");
    BOOST_CHECK_EQUAL(settings.get<int>("hotkey", "hold_ms", 0), 750);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", true), false);

    // Unsupported values are skipped
    BOOST_CHECK(!settings.has("ignored", "nested"));
    BOOST_CHECK(!settings.has("ignored", "list"));
}

BOOST_AUTO_TEST_CASE(TestLoadMergesOverExistingValues) {
    auto& settings = SettingsManager::Instance();

    // Shipped defaults first, user file second
    settings.set("hotkey", "combination", std::string("CommandOrControl+O"));
    settings.set("hotkey", "hold_ms", 500);

    createTestFile(R"({ "hotkey": { "hold_ms": 800 } })");
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("hotkey", "hold_ms", 0), 800);
    BOOST_CHECK_EQUAL(settings.get<std::string>("hotkey", "combination", ""), "CommandOrControl+O");
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.set("window", "width", 1024);
    settings.set("graphics", "vsync", true);
    settings.set("companion.abc", "movement_speed", 1.5f);
    settings.set("server", "snapshot_path", std::string("res/companions.json"));

    BOOST_CHECK(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    // Written file is valid JSON
    JsonReader reader;
    BOOST_REQUIRE(reader.loadFromFile(testFile));
    BOOST_CHECK(reader.getRoot().find("companion.abc") != nullptr);

    settings.clearAll();
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("window", "width", 0), 1024);
    BOOST_CHECK_EQUAL(settings.get<bool>("graphics", "vsync", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("companion.abc", "movement_speed", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("server", "snapshot_path", ""), "res/companions.json");
}

BOOST_AUTO_TEST_CASE(TestSaveCreatesDirectories) {
    auto& settings = SettingsManager::Instance();
    const std::string nested = "tests/test_data/nested_settings/settings.json";

    settings.set("window", "x", 10);
    BOOST_CHECK(settings.saveToFile(nested));
    BOOST_CHECK(std::filesystem::exists(nested));

    std::filesystem::remove_all("tests/test_data/nested_settings");
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    // Root must be an object
    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    std::string lastCategory;
    std::string lastKey;

    auto callbackId = settings.registerChangeListener("companion.abc",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue&) {
            callbackCount++;
            lastCategory = category;
            lastKey = key;
        });

    settings.set("companion.abc", "movement_enabled", false);
    settings.set("companion.abc", "movement_speed", 0.5f);
    settings.set("companion.xyz", "movement_speed", 0.5f); // Different category

    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(lastCategory, "companion.abc");
    BOOST_CHECK_EQUAL(lastKey, "movement_speed");

    settings.unregisterChangeListener(callbackId);
    settings.set("companion.abc", "x", 10.0f);
    BOOST_CHECK_EQUAL(callbackCount, 2);
}

BOOST_AUTO_TEST_CASE(TestGlobalChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    auto callbackId = settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            callbackCount++;
        });

    settings.set("window", "width", 800);
    settings.set("companion.abc", "x", 0.5f);
    settings.set("hotkey", "hold_ms", 600);

    BOOST_CHECK_EQUAL(callbackCount, 3);
    settings.unregisterChangeListener(callbackId);
}

BOOST_AUTO_TEST_CASE(TestListenerMayReadAndUnregister) {
    auto& settings = SettingsManager::Instance();

    size_t callbackId = 0;
    int seen = -1;
    callbackId = settings.registerChangeListener("window",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue&) {
            seen = settings.get<int>(category, key, 0);
            settings.unregisterChangeListener(callbackId);
        });

    settings.set("window", "width", 700);
    BOOST_CHECK_EQUAL(seen, 700);

    settings.set("window", "width", 900);
    BOOST_CHECK_EQUAL(seen, 700);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    const int numThreads = 8;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, t, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                const std::string category = "companion." + std::to_string(t);
                const std::string key = "key" + std::to_string(i);
                settings.set(category, key, i * t);
                settings.get<int>(category, key, -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        const std::string category = "companion." + std::to_string(t);
        for (int i = 0; i < operationsPerThread; ++i) {
            BOOST_CHECK(settings.has(category, "key" + std::to_string(i)));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
