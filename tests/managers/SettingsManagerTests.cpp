/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "collisions/PhysicsWorld.hpp"
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace Traverse;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::filesystem::path testFile =
        std::filesystem::temp_directory_path() / "traverse_settings_test.json";

    SettingsTestFixture() {
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypes) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("mover", "pool_warm_count", 4));
    BOOST_CHECK_EQUAL(settings.get<int>("mover", "pool_warm_count", 0), 4);

    BOOST_CHECK(settings.set("physics", "spatial_hash_cell_size", 32.5f));
    BOOST_CHECK_CLOSE(settings.get<float>("physics", "spatial_hash_cell_size", 0.0f), 32.5f, 0.001f);

    BOOST_CHECK(settings.set("mover", "raycast_precheck", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("mover", "raycast_precheck", true), false);

    BOOST_CHECK(settings.set("debug", "log_prefix", std::string("traverse")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("debug", "log_prefix", ""), "traverse");
}

BOOST_AUTO_TEST_CASE(TestDefaultsForMissingOrMistypedValues) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK_EQUAL(settings.get<int>("nowhere", "nothing", 42), 42);
    BOOST_CHECK(settings.set("mover", "raycast_precheck", true));
    BOOST_CHECK_EQUAL(settings.get<int>("mover", "raycast_precheck", 7), 7);
    BOOST_CHECK_EQUAL(settings.get<std::string>("mover", "raycast_precheck", "fallback"), "fallback");
}

BOOST_AUTO_TEST_CASE(TestFloatLookupAcceptsInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("physics", "spatial_hash_cell_size", 64));
    BOOST_CHECK_EQUAL(settings.get<float>("physics", "spatial_hash_cell_size", 0.0f), 64.0f);

    // The reverse is not a conversion
    BOOST_CHECK(settings.set("physics", "spatial_hash_cell_size", 64.5f));
    BOOST_CHECK_EQUAL(settings.get<int>("physics", "spatial_hash_cell_size", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.has("mover", "pool_warm_count"));
    BOOST_CHECK(settings.set("mover", "pool_warm_count", 3));
    BOOST_CHECK(settings.has("mover", "pool_warm_count"));

    BOOST_CHECK(settings.remove("mover", "pool_warm_count"));
    BOOST_CHECK(!settings.has("mover", "pool_warm_count"));
    BOOST_CHECK(!settings.remove("mover", "pool_warm_count"));
    BOOST_CHECK(!settings.remove("nowhere", "pool_warm_count"));
}

BOOST_AUTO_TEST_CASE(TestLoadFromString) {
    auto& settings = SettingsManager::Instance();

    BOOST_REQUIRE(settings.loadFromString(R"({
        "physics": {"spatial_hash_cell_size": 50, "raycasts_start_in_colliders": true},
        "mover": {"pool_warm_count": 3, "name": "player"}
    })"));

    // Whole numbers come back as int
    BOOST_CHECK_EQUAL(settings.get<int>("physics", "spatial_hash_cell_size", 0), 50);
    BOOST_CHECK_EQUAL(settings.get<float>("physics", "spatial_hash_cell_size", 0.0f), 50.0f);
    BOOST_CHECK(settings.get<bool>("physics", "raycasts_start_in_colliders", false));
    BOOST_CHECK_EQUAL(settings.get<int>("mover", "pool_warm_count", 0), 3);
    BOOST_CHECK_EQUAL(settings.get<std::string>("mover", "name", ""), "player");
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExisting) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("mover", "raycast_precheck", false));
    BOOST_CHECK(settings.set("mover", "pool_warm_count", 1));

    BOOST_REQUIRE(settings.loadFromString(R"({"mover": {"pool_warm_count": 8}})"));
    BOOST_CHECK_EQUAL(settings.get<bool>("mover", "raycast_precheck", true), false);
    BOOST_CHECK_EQUAL(settings.get<int>("mover", "pool_warm_count", 0), 8);
}

BOOST_AUTO_TEST_CASE(TestInvalidDocumentsLeaveSettingsUntouched) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("mover", "pool_warm_count", 2));

    BOOST_CHECK(!settings.loadFromString("{ invalid json }"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK(!settings.loadFromString(""));

    BOOST_CHECK_EQUAL(settings.get<int>("mover", "pool_warm_count", 0), 2);
}

BOOST_AUTO_TEST_CASE(TestUnsupportedEntriesAreSkipped) {
    auto& settings = SettingsManager::Instance();

    BOOST_REQUIRE(settings.loadFromString(R"({
        "flat": 12,
        "mover": {"layers": [1, 2], "nested": {"a": 1}, "nothing": null, "pool_warm_count": 6}
    })"));

    BOOST_CHECK(!settings.has("flat", "flat"));
    BOOST_CHECK(!settings.has("mover", "layers"));
    BOOST_CHECK(!settings.has("mover", "nested"));
    BOOST_CHECK(!settings.has("mover", "nothing"));
    BOOST_CHECK_EQUAL(settings.get<int>("mover", "pool_warm_count", 0), 6);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({"physics": {"spatial_hash_cell_size": 25.5}})");
    BOOST_REQUIRE(settings.loadFromFile(testFile.string()));
    BOOST_CHECK_CLOSE(settings.get<float>("physics", "spatial_hash_cell_size", 0.0f), 25.5f, 0.001f);

    BOOST_CHECK(!settings.loadFromFile("/nonexistent/traverse/settings.json"));
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("physics", "spatial_hash_cell_size", 48));
    BOOST_CHECK(settings.set("physics", "raycasts_start_in_colliders", true));
    BOOST_CHECK(settings.set("mover", "name", std::string("crate")));
    BOOST_REQUIRE(settings.saveToFile(testFile.string()));

    settings.clearAll();
    BOOST_CHECK(!settings.has("physics", "spatial_hash_cell_size"));

    BOOST_REQUIRE(settings.loadFromFile(testFile.string()));
    BOOST_CHECK_EQUAL(settings.get<int>("physics", "spatial_hash_cell_size", 0), 48);
    BOOST_CHECK(settings.get<bool>("physics", "raycasts_start_in_colliders", false));
    BOOST_CHECK_EQUAL(settings.get<std::string>("mover", "name", ""), "crate");
}

BOOST_AUTO_TEST_CASE(TestPhysicsSettingsFromManager) {
    auto& settings = SettingsManager::Instance();

    PhysicsSettings defaults = PhysicsSettings::fromSettings(settings);
    BOOST_CHECK_EQUAL(defaults.spatialHashCellSize, 100.0f);
    BOOST_CHECK(!defaults.raycastsStartInColliders);

    BOOST_REQUIRE(settings.loadFromString(
        R"({"physics": {"spatial_hash_cell_size": 32, "raycasts_start_in_colliders": true}})"));
    PhysicsSettings loaded = PhysicsSettings::fromSettings(settings);
    BOOST_CHECK_EQUAL(loaded.spatialHashCellSize, 32.0f);
    BOOST_CHECK(loaded.raycastsStartInColliders);
}

BOOST_AUTO_TEST_CASE(TestConcurrentAccess) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(settings.set("mover", "pool_warm_count", 0));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&settings, t]() {
            for (int i = 0; i < 100; ++i) {
                settings.set("threads", "writer" + std::to_string(t), i);
                (void)settings.get<int>("mover", "pool_warm_count", -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < 4; ++t) {
        BOOST_CHECK_EQUAL(settings.get<int>("threads", "writer" + std::to_string(t), -1), 99);
    }
}

BOOST_AUTO_TEST_SUITE_END()
