// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/config.h>
#include <augsweep/errors.h>

#include <algorithm>

#include "test_helpers.h"

using namespace augsweep;
using augsweep::test::TempDir;

TEST(ConfigTest, Defaults) {
    CleanerConfig config;
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.maxScanDepth, 16);
    EXPECT_EQ(config.maxWorkers, 4);
    EXPECT_FALSE(config.parallel);
    EXPECT_TRUE(config.rewriteTelemetry);
    EXPECT_TRUE(config.cleanStores);
    EXPECT_EQ(config.preserve, std::vector<std::string>{"settings.json"});
    EXPECT_NE(std::find(config.augmentExtensionIds.begin(), config.augmentExtensionIds.end(),
                        "augmentcode.augment"),
              config.augmentExtensionIds.end());
}

TEST(ConfigTest, DefaultActivePatternsOnlyAugment) {
    CleanerConfig config;
    auto patterns = config.activeKeyPatterns();
    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns[0].text, "augment");
    EXPECT_EQ(patterns[0].mode, MatchMode::SUBSTRING);
    EXPECT_FALSE(patterns[0].caseSensitive);
}

TEST(ConfigTest, ActivatingMoreGroups) {
    CleanerConfig config;
    config.activePatternGroups = {"augment", "chat"};
    auto patterns = config.activeKeyPatterns();
    EXPECT_EQ(patterns.size(), 6u);
}

TEST(ConfigTest, UnknownGroupThrows) {
    CleanerConfig config;
    config.activePatternGroups = {"nope"};
    EXPECT_THROW(config.activeKeyPatterns(), ParseError);
}

TEST(ConfigTest, JsonRoundTripKeepsSettings) {
    CleanerConfig config;
    config.maxWorkers = 2;
    config.parallel = true;
    config.extraProtectedPaths = {"/srv/keep"};

    CleanerConfig parsed = configFromJson(config.toJson());
    EXPECT_EQ(parsed.maxWorkers, 2);
    EXPECT_TRUE(parsed.parallel);
    EXPECT_EQ(parsed.extraProtectedPaths, std::vector<std::string>{"/srv/keep"});
    EXPECT_EQ(parsed.keyPatternGroups.size(), config.keyPatternGroups.size());
}

TEST(ConfigTest, MergeJsonDeep) {
    json base = {{"a", 1}, {"nested", {{"x", 1}, {"y", 2}}}, {"list", {1, 2}}};
    json overlay = {{"nested", {{"y", 3}}}, {"list", {9}}, {"b", true}};
    json merged = mergeJson(base, overlay);

    EXPECT_EQ(merged["a"], 1);
    EXPECT_EQ(merged["nested"]["x"], 1);
    EXPECT_EQ(merged["nested"]["y"], 3);
    EXPECT_EQ(merged["list"], json::array({9}));
    EXPECT_EQ(merged["b"], true);
}

TEST(ConfigTest, LoadPartialJsoncFile) {
    TempDir dir;
    fs::path file = dir.write("augsweep.jsonc", R"({
        // keep going on four threads
        "parallel": true,
        "activePatternGroups": ["augment", "analytics"],
        "keyPatterns": {"augment": ["augment%", {"text": "augmentcode", "mode": "exact"}]},
    })");

    CleanerConfig config = loadConfig(file);
    EXPECT_TRUE(config.parallel);
    EXPECT_EQ(config.maxScanDepth, 16);
    ASSERT_EQ(config.keyPatternGroups["augment"].size(), 2u);
    EXPECT_EQ(config.keyPatternGroups["augment"][0].mode, MatchMode::PREFIX);
    EXPECT_EQ(config.keyPatternGroups["augment"][1].mode, MatchMode::EXACT);
    // Groups not named in the file keep their defaults
    EXPECT_EQ(config.keyPatternGroups.count("chat"), 1u);
}

TEST(ConfigTest, LoadRejectsBadTypes) {
    TempDir dir;
    EXPECT_THROW(loadConfig(dir.write("a.json", R"({"maxWorkers": "four"})")), ParseError);
    EXPECT_THROW(loadConfig(dir.write("b.json", R"({"maxScanDepth": 0})")), ParseError);
    EXPECT_THROW(loadConfig(dir.write("c.json", R"({"activePatternGroups": ["ghost"]})")),
                 ParseError);
    EXPECT_THROW(loadConfig(dir.write("d.json", R"([1, 2])")), ParseError);
    EXPECT_THROW(loadConfig(dir.write("e.json", R"({"keyPatterns": {"augment": "x"}})")),
                 ParseError);
}

TEST(ConfigTest, LoadMissingFile) {
    TempDir dir;
    EXPECT_THROW(loadConfig(dir / "missing.json"), NotFoundError);
}

TEST(ConfigTest, DefaultConfigJsonHasEveryField) {
    json j = defaultConfigJson();
    for (const char* key : {"version", "augmentExtensionIds", "keyPatterns", "activePatternGroups",
                            "storeTables", "protectedPaths", "preserve", "augmentHomePreserve",
                            "maxScanDepth", "parallel", "maxWorkers", "rewriteTelemetry",
                            "cleanStores", "pruneEmptyDirectories"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}
