// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/config.h"

#include "augsweep/errors.h"
#include "augsweep/json_utils.h"

namespace augsweep {

namespace {

std::vector<KeyPattern> substrings(std::initializer_list<const char*> texts) {
    std::vector<KeyPattern> out;
    for (const char* text : texts) {
        KeyPattern p;
        p.mode = MatchMode::SUBSTRING;
        p.text = text;
        out.push_back(p);
    }
    return out;
}

template <typename T>
T getAs(const json& j, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ParseError(std::string("config field '") + key + "': " + e.what());
    }
}

} // namespace

CleanerConfig::CleanerConfig() {
    keyPatternGroups["augment"] = substrings({"augment"});
    // Opt-in groups; these also match keys of other extensions
    keyPatternGroups["chat"] = substrings({"chat", "conversation", "message", "dialog", "history"});
    keyPatternGroups["analytics"] = substrings({"analytics", "telemetry", "tracking", "metrics",
                                                "sessionId", "deviceId", "machineId", "clientId",
                                                "fingerprint"});
}

std::vector<KeyPattern> CleanerConfig::activeKeyPatterns() const {
    std::vector<KeyPattern> out;
    for (const auto& group : activePatternGroups) {
        auto it = keyPatternGroups.find(group);
        if (it == keyPatternGroups.end()) {
            throw ParseError("unknown key pattern group: " + group);
        }
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    return out;
}

json CleanerConfig::toJson() const {
    json groups = json::object();
    for (const auto& [name, patterns] : keyPatternGroups) {
        json list = json::array();
        for (const auto& p : patterns) {
            list.push_back(p.toJson());
        }
        groups[name] = list;
    }

    return json{
        {"version", version},
        {"augmentExtensionIds", augmentExtensionIds},
        {"keyPatterns", groups},
        {"activePatternGroups", activePatternGroups},
        {"storeTables", storeTables},
        {"protectedPaths", extraProtectedPaths},
        {"preserve", preserve},
        {"augmentHomePreserve", augmentHomePreserve},
        {"maxScanDepth", maxScanDepth},
        {"parallel", parallel},
        {"maxWorkers", maxWorkers},
        {"rewriteTelemetry", rewriteTelemetry},
        {"cleanStores", cleanStores},
        {"pruneEmptyDirectories", pruneEmptyDirectories},
    };
}

json defaultConfigJson() {
    return CleanerConfig().toJson();
}

CleanerConfig configFromJson(const json& j) {
    if (!j.is_object()) {
        throw ParseError("config must be a JSON object");
    }

    CleanerConfig config;
    config.version = getAs<std::string>(j, "version");
    config.augmentExtensionIds = getAs<std::vector<std::string>>(j, "augmentExtensionIds");
    config.activePatternGroups = getAs<std::vector<std::string>>(j, "activePatternGroups");
    config.storeTables = getAs<std::vector<std::string>>(j, "storeTables");
    config.extraProtectedPaths = getAs<std::vector<std::string>>(j, "protectedPaths");
    config.preserve = getAs<std::vector<std::string>>(j, "preserve");
    config.augmentHomePreserve = getAs<std::vector<std::string>>(j, "augmentHomePreserve");
    config.maxScanDepth = getAs<int>(j, "maxScanDepth");
    config.parallel = getAs<bool>(j, "parallel");
    config.maxWorkers = getAs<int>(j, "maxWorkers");
    config.rewriteTelemetry = getAs<bool>(j, "rewriteTelemetry");
    config.cleanStores = getAs<bool>(j, "cleanStores");
    config.pruneEmptyDirectories = getAs<bool>(j, "pruneEmptyDirectories");

    if (!j.contains("keyPatterns") || !j["keyPatterns"].is_object()) {
        throw ParseError("config field 'keyPatterns' must be an object of arrays");
    }
    const json& groups = j["keyPatterns"];
    config.keyPatternGroups.clear();
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        if (!it.value().is_array()) {
            throw ParseError("key pattern group '" + it.key() + "' must be an array");
        }
        std::vector<KeyPattern> patterns;
        for (const auto& p : it.value()) {
            patterns.push_back(KeyPattern::fromJson(p));
        }
        config.keyPatternGroups[it.key()] = std::move(patterns);
    }

    if (config.maxScanDepth < 1) {
        throw ParseError("config field 'maxScanDepth' must be at least 1");
    }
    if (config.maxWorkers < 1) {
        throw ParseError("config field 'maxWorkers' must be at least 1");
    }

    // Throws on an unknown active group
    config.activeKeyPatterns();
    return config;
}

json mergeJson(const json& base, const json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }
    json merged = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (merged.contains(it.key())) {
            merged[it.key()] = mergeJson(merged[it.key()], it.value());
        } else {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

CleanerConfig loadConfig(const fs::path& path) {
    ordered_json document = readJsonFile(path, true);
    if (!document.is_object()) {
        throw ParseError(path.string() + ": config must be a JSON object");
    }
    json overlay = json::parse(document.dump());
    return configFromJson(mergeJson(defaultConfigJson(), overlay));
}

} // namespace augsweep
