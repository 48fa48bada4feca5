// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cleaner configuration: built-in defaults, optionally overlaid by a JSON file.

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "augsweep/export.h"
#include "augsweep/types.h"

namespace augsweep {

using json = nlohmann::json;
namespace fs = std::filesystem;

struct AUGSWEEP_API CleanerConfig {
    std::string version = "1.0.0";

    // Extension folder names under globalStorage / extensions
    std::vector<std::string> augmentExtensionIds = {
        "augmentcode.augment",
        "augmentcode.augment-vscode",
        "augmentcode.augment-cursor",
        "augmentcode.augment-windsurf",
        "augmentcode.augment-vscodium",
        "augmentcode.vscode-augment",
        "augment.augment",
        "vscode-augment",
    };

    // Named groups of store key patterns; only active groups are applied
    std::map<std::string, std::vector<KeyPattern>> keyPatternGroups;
    std::vector<std::string> activePatternGroups = {"augment"};

    std::vector<std::string> storeTables = {"ItemTable", "cursorDiskKV"};
    std::vector<std::string> extraProtectedPaths;
    std::vector<std::string> preserve = {"settings.json"};
    std::vector<std::string> augmentHomePreserve = {"settings.json", "binaries"};

    int maxScanDepth = 16;
    bool parallel = false;
    int maxWorkers = 4;

    bool rewriteTelemetry = true;
    bool cleanStores = true;
    bool pruneEmptyDirectories = true;

    CleanerConfig();

    /// Patterns of every active group, in group order.
    /// @throws ParseError if an active group is not defined.
    std::vector<KeyPattern> activeKeyPatterns() const;

    json toJson() const;
};

/// Built-in defaults as a JSON document (the shape loadConfig() accepts).
AUGSWEEP_API json defaultConfigJson();

/// Build a config from a complete JSON document.
/// @throws ParseError on wrong value types or an invalid key pattern.
AUGSWEEP_API CleanerConfig configFromJson(const json& j);

/// Deep merge: objects merge key by key, everything else in `overlay` replaces.
AUGSWEEP_API json mergeJson(const json& base, const json& overlay);

/// Load a JSON/JSONC file and merge it over the defaults.
/// @throws NotFoundError if the file does not exist
/// @throws ParseError if it is malformed or not an object
AUGSWEEP_API CleanerConfig loadConfig(const fs::path& path);

} // namespace augsweep
