/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/MatchConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace ArenaEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = (std::filesystem::temp_directory_path() / "arena_test_settings.json").string();

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

    BOOST_CHECK(settings.set("engine", "round_cap", 300));
    BOOST_CHECK_EQUAL(settings.get<int>("engine", "round_cap", 0), 300);
    BOOST_CHECK_EQUAL(settings.get<int>("engine", "nonexistent", 42), 42);

    BOOST_CHECK(settings.set("engine", "ore_income", 2.5f));
    BOOST_CHECK_CLOSE(settings.get<float>("engine", "ore_income", 0.0f), 2.5f, 0.001f);

    BOOST_CHECK(settings.set("engine", "upkeep", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("engine", "upkeep", true), false);

    BOOST_CHECK(settings.set("game", "team_a", "idleplayer"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "team_a", ""), "idleplayer");
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    auto& settings = SettingsManager::Instance();

    settings.set("engine", "round_cap", std::string("many"));
    BOOST_CHECK_EQUAL(settings.get<int>("engine", "round_cap", 7), 7);

    // Whole numbers read back as float as well
    settings.set("engine", "starting_ore", 400);
    BOOST_CHECK_CLOSE(settings.get<float>("engine", "starting_ore", 0.0f), 400.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndCategories) {
    auto& settings = SettingsManager::Instance();

    settings.set("engine", "breakpoints", true);
    settings.set("engine", "debug_methods", true);
    settings.set("server", "save_file", "out.arena");

    BOOST_CHECK(settings.has("engine", "breakpoints"));
    BOOST_CHECK(!settings.has("engine", "missing"));

    const std::vector<std::string> categories{"engine", "server"};
    auto actual = settings.getCategories();
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), categories.begin(), categories.end());

    const std::vector<std::string> keys{"breakpoints", "debug_methods"};
    auto actualKeys = settings.getKeys("engine");
    BOOST_CHECK_EQUAL_COLLECTIONS(actualKeys.begin(), actualKeys.end(), keys.begin(), keys.end());

    BOOST_CHECK(settings.remove("server", "save_file"));
    BOOST_CHECK(!settings.remove("server", "save_file"));
    // Removing the last key drops the category
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 1u);

    BOOST_CHECK(settings.clearCategory("engine"));
    BOOST_CHECK(!settings.clearCategory("engine"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestGetListTrimsEntries) {
    auto& settings = SettingsManager::Instance();

    settings.set("game", "maps", " arena, twin_lakes ,, ,spiral");
    const std::vector<std::string> expected{"arena", "twin_lakes", "spiral"};
    auto maps = settings.getList("game", "maps");
    BOOST_CHECK_EQUAL_COLLECTIONS(maps.begin(), maps.end(), expected.begin(), expected.end());

    BOOST_CHECK(settings.getList("game", "missing").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "engine": {
            "round_cap": 150,
            "ore_income": 3.5,
            "breakpoints": false,
            "fault_policy": "silence"
        },
        "game": {
            "maps": ["arena", "twin_lakes"],
            "team_b": "idleplayer"
        },
        "ignored": 5
    })");

    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("engine", "round_cap", 0), 150);
    BOOST_CHECK_CLOSE(settings.get<float>("engine", "ore_income", 0.0f), 3.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("engine", "breakpoints", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("engine", "fault_policy", ""), "silence");
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "maps", ""), "arena,twin_lakes");
    BOOST_CHECK(!settings.has("ignored", "5"));
}

BOOST_AUTO_TEST_CASE(TestLoadFailures) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("nonexistent_settings_file.json"));

    createTestFile("{ \"engine\": { \"round_cap\": }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExisting) {
    auto& settings = SettingsManager::Instance();

    settings.set("engine", "round_cap", 100);
    settings.set("engine", "upkeep", false);
    BOOST_REQUIRE(settings.loadFromString(R"({"engine": {"round_cap": 250}})"));

    BOOST_CHECK_EQUAL(settings.get<int>("engine", "round_cap", 0), 250);
    BOOST_CHECK_EQUAL(settings.get<bool>("engine", "upkeep", true), false);
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();

    settings.set("engine", "operation_budget", 5000);
    settings.set("engine", "ore_income", 1.25f);
    settings.set("engine", "bytecodes_used", true);
    settings.set("server", "save_file", "series.arena");

    BOOST_REQUIRE(settings.saveToFile(testFile));
    settings.clearAll();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("engine", "operation_budget", 0), 5000);
    BOOST_CHECK_CLOSE(settings.get<float>("engine", "ore_income", 0.0f), 1.25f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("engine", "bytecodes_used", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("server", "save_file", ""), "series.arena");
}

BOOST_AUTO_TEST_CASE(TestChangeListeners) {
    auto& settings = SettingsManager::Instance();

    int engineChanges = 0;
    int allChanges = 0;
    std::string lastKey;

    size_t engineId = settings.registerChangeListener("engine",
        [&](const std::string&, const std::string& key, const SettingsManager::SettingValue&) {
            ++engineChanges;
            lastKey = key;
        });
    size_t allId = settings.registerChangeListener("",
        [&](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            ++allChanges;
        });

    settings.set("engine", "fault_tolerance", 3);
    settings.set("game", "team_a", "examplefuncsplayer");
    BOOST_CHECK_EQUAL(engineChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 2);
    BOOST_CHECK_EQUAL(lastKey, "fault_tolerance");

    settings.unregisterChangeListener(engineId);
    settings.set("engine", "fault_tolerance", 4);
    BOOST_CHECK_EQUAL(engineChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 3);

    settings.unregisterChangeListener(allId);
}

BOOST_AUTO_TEST_CASE(TestConcurrentAccess) {
    auto& settings = SettingsManager::Instance();
    settings.set("engine", "round_cap", 0);

    std::atomic<int> readsDone{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&settings, &readsDone, t]() {
            for (int i = 0; i < 200; ++i) {
                settings.set("threads", "writer_" + std::to_string(t), i);
                (void)settings.get<int>("engine", "round_cap", -1);
                readsDone.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(readsDone.load(), 800);
    BOOST_CHECK_EQUAL(settings.getKeys("threads").size(), 4u);
    BOOST_CHECK_EQUAL(settings.get<int>("threads", "writer_2", 0), 199);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MATCH CONFIG RESOLUTION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MatchConfigTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsWhenUnset) {
    MatchConfig config = MatchConfig::fromSettings(SettingsManager::Instance());

    BOOST_CHECK_EQUAL(config.roundCap, GameConstants::DEFAULT_ROUND_CAP);
    BOOST_CHECK_EQUAL(config.operationBudget, GameConstants::DEFAULT_OPERATION_BUDGET);
    BOOST_CHECK_EQUAL(config.faultPolicy, FaultPolicy::Continue);
    BOOST_CHECK_EQUAL(config.faultTolerance, 0);
    BOOST_CHECK(config.breakpointsEnabled);
    BOOST_CHECK_EQUAL(config.mapPath, "maps");
    BOOST_REQUIRE_EQUAL(config.maps.size(), 1u);
    BOOST_CHECK_EQUAL(config.maps[0], "arena");
    BOOST_CHECK_EQUAL(config.saveFile, "match.arena");
}

BOOST_AUTO_TEST_CASE(TestReadsEveryCategory) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromString(R"({
        "engine": {
            "round_cap": 120,
            "operation_budget": 800,
            "fault_policy": "terminate",
            "fault_tolerance": 2,
            "silence_on_budget_exhaustion": true,
            "debug_methods": false,
            "upkeep": false,
            "ore_income": 7.5,
            "starting_ore": 100
        },
        "game": {
            "map_path": "custom_maps",
            "maps": "spiral, twin_lakes",
            "team_a": "idleplayer"
        },
        "server": { "save_file": "night.arena" }
    })"));

    MatchConfig config = MatchConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.roundCap, 120);
    BOOST_CHECK_EQUAL(config.operationBudget, 800);
    BOOST_CHECK_EQUAL(config.faultPolicy, FaultPolicy::Terminate);
    BOOST_CHECK_EQUAL(config.faultTolerance, 2);
    BOOST_CHECK(config.silenceOnBudgetExhaustion);
    BOOST_CHECK(!config.debugMethodsEnabled);
    BOOST_CHECK(!config.upkeepEnabled);
    BOOST_CHECK_CLOSE(config.oreIncome, 7.5, 0.001);
    BOOST_CHECK_CLOSE(config.startingOre, 100.0, 0.001);
    BOOST_CHECK_EQUAL(config.mapPath, "custom_maps");
    BOOST_REQUIRE_EQUAL(config.maps.size(), 2u);
    BOOST_CHECK_EQUAL(config.maps[1], "twin_lakes");
    BOOST_CHECK_EQUAL(config.teamA, "idleplayer");
    BOOST_CHECK_EQUAL(config.teamB, "examplefuncsplayer");
    BOOST_CHECK_EQUAL(config.saveFile, "night.arena");
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeValuesClamped) {
    auto& settings = SettingsManager::Instance();
    settings.set("engine", "round_cap", -5);
    settings.set("engine", "operation_budget", 0);
    settings.set("engine", "fault_tolerance", -1);
    settings.set("engine", "fault_policy", "explode");
    settings.set("game", "maps", " , ");

    MatchConfig config = MatchConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.roundCap, 1);
    BOOST_CHECK_EQUAL(config.operationBudget, 1);
    BOOST_CHECK_EQUAL(config.faultTolerance, 0);
    BOOST_CHECK_EQUAL(config.faultPolicy, FaultPolicy::Continue);
    BOOST_REQUIRE_EQUAL(config.maps.size(), 1u);
    BOOST_CHECK_EQUAL(config.maps[0], "arena");
}

BOOST_AUTO_TEST_CASE(TestStoreThenResolve) {
    MatchConfig original;
    original.roundCap = 77;
    original.faultPolicy = FaultPolicy::Silence;
    original.bytecodesUsedEnabled = false;
    original.oreIncome = 4.0;
    original.maps = {"alpha", "beta", "gamma"};
    original.teamB = "idleplayer";

    auto& settings = SettingsManager::Instance();
    original.storeTo(settings);
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "maps", ""), "alpha,beta,gamma");
    BOOST_CHECK_EQUAL(settings.get<std::string>("engine", "fault_policy", ""), "silence");

    // Through a file so whole floats come back as ints
    BOOST_REQUIRE(settings.saveToFile(testFile));
    settings.clearAll();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    MatchConfig resolved = MatchConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(resolved.roundCap, 77);
    BOOST_CHECK_EQUAL(resolved.faultPolicy, FaultPolicy::Silence);
    BOOST_CHECK(!resolved.bytecodesUsedEnabled);
    BOOST_CHECK_CLOSE(resolved.oreIncome, 4.0, 0.001);
    BOOST_CHECK_EQUAL_COLLECTIONS(resolved.maps.begin(), resolved.maps.end(),
                                  original.maps.begin(), original.maps.end());
    BOOST_CHECK_EQUAL(resolved.teamB, "idleplayer");
}

BOOST_AUTO_TEST_CASE(TestFaultPolicyNames) {
    BOOST_CHECK(faultPolicyFromString("continue") == FaultPolicy::Continue);
    BOOST_CHECK(faultPolicyFromString("terminate") == FaultPolicy::Terminate);
    BOOST_CHECK(!faultPolicyFromString("Silence").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
