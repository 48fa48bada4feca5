// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/operations.h"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "augsweep/errors.h"
#include "augsweep/executor.h"
#include "augsweep/path_utils.h"
#include "augsweep/preservation.h"
#include "augsweep/safety_guard.h"
#include "augsweep/scanner.h"
#include "augsweep/store_cleaner.h"

namespace augsweep {

std::unique_ptr<OutputHandler> OperationContext::makeConsole() const {
    if (silentMode) {
        return std::make_unique<SilentConsole>(true);
    }
    return std::make_unique<TerminalConsole>(verbose);
}

namespace {

// ---- Argument helpers ----

bool boolArg(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key)) return false;
    const json& value = args[key];
    if (!value.is_boolean()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
    }
    return value.get<bool>();
}

std::string stringArg(const json& args, const char* key, const std::string& fallback = "") {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return fallback;
    const json& value = args[key];
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::vector<std::string> stringListArg(const json& args, const char* key) {
    std::vector<std::string> result;
    if (!args.is_object() || !args.contains(key)) return result;
    const json& value = args[key];
    if (value.is_string()) {
        result.push_back(value.get<std::string>());
        return result;
    }
    if (!value.is_array()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string array");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string("'") + key + "' must be a string array");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

OsFamily osArg(const OperationContext& ctx, const json& args) {
    std::string name = stringArg(args, "os");
    if (name.empty()) return ctx.os;
    auto os = parseOsFamily(name);
    if (!os) {
        throw std::invalid_argument("Unknown OS family: " + name);
    }
    return *os;
}

RootKind parseRootKind(const std::string& name) {
    static const RootKind kinds[] = {
        RootKind::CONFIG, RootKind::GLOBAL_STORAGE, RootKind::WORKSPACE_STORAGE,
        RootKind::EXTENSIONS, RootKind::CACHE, RootKind::LOGS, RootKind::AUGMENT_HOME,
    };
    for (RootKind kind : kinds) {
        if (toLower(rootKindToString(kind)) == toLower(name)) return kind;
    }
    throw std::invalid_argument("Unknown root kind: " + name);
}

// ---- Root selection ----

struct Selection {
    OsFamily os = OsFamily::LINUX;
    std::vector<EnvironmentRoot> editorRoots;
    std::optional<EnvironmentRoot> augmentHome;

    std::vector<EnvironmentRoot> all() const {
        std::vector<EnvironmentRoot> roots = editorRoots;
        if (augmentHome) roots.push_back(*augmentHome);
        return roots;
    }
};

Selection selectRoots(const OperationContext& ctx, const json& args) {
    Selection selection;
    selection.os = osArg(ctx, args);

    std::string path = stringArg(args, "path");
    if (!path.empty()) {
        RootKind kind = parseRootKind(stringArg(args, "kind", "augmentHome"));
        EnvironmentRoot root = EnvironmentRoot::forPath(path, kind, selection.os);
        if (!root.exists) {
            throw NotFoundError("root directory does not exist: " + path);
        }
        if (kind == RootKind::AUGMENT_HOME) {
            selection.augmentHome = root;
        } else {
            selection.editorRoots.push_back(root);
        }
        return selection;
    }

    EnvironmentLocator locator(ctx.host);
    if (boolArg(args, "augmentOnly")) {
        selection.augmentHome = locator.locateAugmentHome(selection.os);
        return selection;
    }

    std::string editor = stringArg(args, "editor");
    if (!editor.empty() && toLower(editor) != "all") {
        auto variant = parseEditorVariant(editor);
        if (!variant) {
            throw std::invalid_argument("Unknown editor variant: " + editor);
        }
        selection.editorRoots = locator.locate(*variant, selection.os);
        return selection;
    }

    selection.editorRoots = locator.locateAll(selection.os);
    selection.augmentHome = locator.locateAugmentHome(selection.os);
    return selection;
}

CleanerConfig configFor(const OperationContext& ctx, const json& args) {
    CleanerConfig config = ctx.config;
    if (boolArg(args, "noTelemetry")) config.rewriteTelemetry = false;
    if (boolArg(args, "noStore")) config.cleanStores = false;
    return config;
}

// The running host's system directories are always protected; a different
// target OS family only adds its own entries on top
ProtectedPathList denyListFor(const OperationContext& ctx, const CleanerConfig& config, OsFamily os) {
    const OsFamily hostOs = currentOsFamily();
    ProtectedPathList denyList = ProtectedPathList::defaults(hostOs, ctx.host.home);
    if (os != hostOs) {
        for (const auto& entry : ProtectedPathList::defaults(os, ctx.host.home).entries()) {
            denyList.add(entry.path, entry.mode);
        }
    }
    for (const auto& extra : config.extraProtectedPaths) {
        denyList.add(extra);
    }
    return denyList;
}

PreservationSet preservationFor(const CleanerConfig& config, RootKind kind, const json& args) {
    std::vector<std::string> patterns =
        kind == RootKind::AUGMENT_HOME ? config.augmentHomePreserve : config.preserve;
    for (auto& extra : stringListArg(args, "preserve")) {
        patterns.push_back(std::move(extra));
    }
    if (patterns.empty()) {
        return PreservationSet::none();
    }
    return PreservationSet(std::move(patterns));
}

json rootsToJson(const std::vector<EnvironmentRoot>& roots) {
    json list = json::array();
    for (const auto& root : roots) {
        list.push_back(root.toJson());
    }
    return list;
}

const char* statusFor(bool failed) {
    return failed ? "partial" : "ok";
}

// ---- Operations ----

json listOperation(const OperationContext& ctx, const json& args) {
    Selection selection = selectRoots(ctx, args);
    return json{{"status", "ok"},
                {"os", osFamilyToString(selection.os)},
                {"roots", rootsToJson(selection.all())}};
}

json discoverOperation(const OperationContext& ctx, const json& args) {
    OsFamily os = osArg(ctx, args);
    EnvironmentLocator locator(ctx.host);
    return json{{"status", "ok"},
                {"os", osFamilyToString(os)},
                {"editors", rootsToJson(locator.discover(os))}};
}

json envOperation(const OperationContext& ctx, const json& args) {
    OsFamily os = osArg(ctx, args);
    EnvironmentLocator locator(ctx.host);

    std::optional<EnvironmentRoot> home;
    std::string path = stringArg(args, "path");
    if (!path.empty()) {
        EnvironmentRoot root = EnvironmentRoot::forPath(path, RootKind::AUGMENT_HOME, os);
        if (root.exists) home = root;
    } else {
        home = locator.locateAugmentHome(os);
    }

    json result{{"status", "ok"}, {"exists", home.has_value()}};
    if (!home) {
        fs::path expected = path.empty() ? ctx.host.home / ".augment" : fs::path(path);
        result["augmentHome"] = expected.generic_string();
        result["items"] = json::array();
        return result;
    }

    result["augmentHome"] = home->rootPath.generic_string();
    json items = json::array();
    for (const auto& child : locator.describe(*home)) {
        items.push_back(child.toJson());
    }
    result["items"] = items;
    return result;
}

json scanOperation(const OperationContext& ctx, const json& args) {
    Selection selection = selectRoots(ctx, args);
    CleanerConfig config = configFor(ctx, args);

    json roots = json::array();
    for (const auto& root : selection.all()) {
        ScanOptions options;
        options.scope = defaultScopeFor(root.kind, config);
        options.maxDepth = config.maxScanDepth;

        std::vector<FileEntry> entries =
            scan(root, preservationFor(config, root.kind, args), options);

        std::size_t removable = 0;
        std::uintmax_t bytes = 0;
        json list = json::array();
        for (const auto& entry : entries) {
            if (entry.classification == Classification::REMOVABLE) {
                ++removable;
                bytes += entry.sizeBytes;
            }
            list.push_back(entry.toJson());
        }

        roots.push_back({{"root", root.toJson()},
                         {"entries", list},
                         {"removable", removable},
                         {"preserved", entries.size() - removable},
                         {"removableBytes", bytes}});
    }
    return json{{"status", "ok"}, {"roots", roots}};
}

json cleanOperation(const OperationContext& ctx, const json& args) {
    Selection selection = selectRoots(ctx, args);
    CleanerConfig config = configFor(ctx, args);
    bool dryRun = boolArg(args, "dryRun");

    CleanupExecutor executor(denyListFor(ctx, config, selection.os), config);
    executor.setOutputHandler(ctx.makeConsole());

    std::vector<CleanupResult> results =
        executor.executeAll(selection.editorRoots,
                            preservationFor(config, RootKind::CONFIG, args), dryRun);
    if (selection.augmentHome) {
        results.push_back(executor.execute(
            *selection.augmentHome,
            preservationFor(config, RootKind::AUGMENT_HOME, args), dryRun));
    }

    bool failed = false;
    std::uintmax_t bytesFreed = 0;
    std::size_t removed = 0;
    json list = json::array();
    for (const auto& result : results) {
        failed = failed || result.hasFailures();
        bytesFreed += result.bytesFreed;
        removed += result.totalRemoved;
        list.push_back(result.toJson());
    }

    return json{{"status", statusFor(failed)},
                {"dryRun", dryRun},
                {"totalRemoved", removed},
                {"bytesFreed", bytesFreed},
                {"results", list}};
}

// telemetry and store share this: run only the per-root operations
json rootOperations(const OperationContext& ctx, const json& args, bool telemetry) {
    Selection selection = selectRoots(ctx, args);
    CleanerConfig config = configFor(ctx, args);
    config.rewriteTelemetry = telemetry && config.rewriteTelemetry;
    config.cleanStores = !telemetry && config.cleanStores;
    bool dryRun = boolArg(args, "dryRun");

    CleanupExecutor executor(denyListFor(ctx, config, selection.os), config);
    std::unique_ptr<OutputHandler> console = ctx.makeConsole();

    bool failed = false;
    json list = json::array();
    for (const auto& root : selection.editorRoots) {
        for (const auto& op : executor.runRootOperations(
                 root, preservationFor(config, root.kind, args), dryRun)) {
            console->printOperation(op);
            failed = failed || op.outcome == OperationOutcome::FAILED;
            list.push_back(op.toJson());
        }
    }
    return json{{"status", statusFor(failed)}, {"dryRun", dryRun}, {"operations", list}};
}

json verifyOperation(const OperationContext& ctx, const json& args) {
    Selection selection = selectRoots(ctx, args);
    CleanerConfig config = configFor(ctx, args);
    StoreCleaner stores(config.storeTables);
    std::vector<KeyPattern> patterns = config.activeKeyPatterns();

    bool residue = false;
    json roots = json::array();
    for (const auto& root : selection.all()) {
        ScanOptions options;
        options.scope = defaultScopeFor(root.kind, config);
        options.maxDepth = config.maxScanDepth;

        json leftovers = json::array();
        for (const auto& entry : scan(root, preservationFor(config, root.kind, args), options)) {
            if (entry.classification == Classification::REMOVABLE) {
                leftovers.push_back(entry.path.generic_string());
            }
        }

        std::vector<fs::path> databases;
        if (root.kind == RootKind::GLOBAL_STORAGE) {
            databases.push_back(root.rootPath / "state.vscdb");
        } else if (root.kind == RootKind::WORKSPACE_STORAGE) {
            std::error_code ec;
            for (fs::directory_iterator it(root.rootPath, ec), end; !ec && it != end;
                 it.increment(ec)) {
                databases.push_back(it->path() / "state.vscdb");
            }
            std::sort(databases.begin(), databases.end());
        }

        json storeKeys = json::array();
        json storeErrors = json::array();
        for (const auto& db : databases) {
            std::error_code ec;
            if (!fs::is_regular_file(db, ec)) continue;
            try {
                std::size_t count = stores.countMatches(db, patterns);
                if (count > 0) {
                    storeKeys.push_back({{"path", db.generic_string()}, {"keys", count}});
                }
            } catch (const StoreUnavailableError& e) {
                storeErrors.push_back({{"path", db.generic_string()}, {"error", e.what()}});
            }
        }

        bool clean = leftovers.empty() && storeKeys.empty();
        residue = residue || !clean;
        json entry{{"root", root.toJson()},
                   {"clean", clean},
                   {"files", leftovers},
                   {"storeKeys", storeKeys}};
        if (!storeErrors.empty()) entry["storeErrors"] = storeErrors;
        roots.push_back(entry);
    }

    return json{{"status", statusFor(residue)}, {"clean", !residue}, {"roots", roots}};
}

std::vector<OperationParameter> selectionParameters() {
    return {
        {"editor", ParamType::STRING, false, "editor variant, or all"},
        {"os", ParamType::STRING, false, "OS family (linux, macos, windows)"},
        {"path", ParamType::STRING, false, "explicit root directory"},
        {"kind", ParamType::STRING, false, "root kind for path"},
        {"augmentOnly", ParamType::BOOLEAN, false, "only the Augment home"},
    };
}

std::vector<OperationParameter> mutatingParameters() {
    std::vector<OperationParameter> params = selectionParameters();
    params.push_back({"dryRun", ParamType::BOOLEAN, false, "report without changing anything"});
    params.push_back({"preserve", ParamType::ARRAY, false, "extra preserve patterns"});
    return params;
}

} // namespace

void registerBuiltinOperations(OperationRegistry& registry,
                               std::shared_ptr<OperationContext> context) {
    if (!context) {
        throw std::invalid_argument("operation context is null");
    }

    registry.registerOperation(
        "list", "List the editor roots and Augment home that exist on this machine",
        [context](const json& args) { return listOperation(*context, args); },
        selectionParameters());

    registry.registerOperation(
        "discover", "Find unknown VSCode-family editors by their User/globalStorage layout",
        [context](const json& args) { return discoverOperation(*context, args); },
        {{"os", ParamType::STRING, false, "OS family"}});

    registry.registerOperation(
        "env", "Describe the contents of the Augment home directory",
        [context](const json& args) { return envOperation(*context, args); },
        {{"os", ParamType::STRING, false, "OS family"},
         {"path", ParamType::STRING, false, "Augment home directory"}});

    registry.registerOperation(
        "scan", "Classify the entries under each root without changing anything",
        [context](const json& args) { return scanOperation(*context, args); },
        mutatingParameters());

    std::vector<OperationParameter> cleanParams = mutatingParameters();
    cleanParams.push_back({"noTelemetry", ParamType::BOOLEAN, false, "skip telemetry id rewrite"});
    cleanParams.push_back({"noStore", ParamType::BOOLEAN, false, "skip store key removal"});
    registry.registerOperation(
        "clean", "Remove Augment state under each root",
        [context](const json& args) { return cleanOperation(*context, args); },
        cleanParams, true);

    registry.registerOperation(
        "telemetry", "Regenerate telemetry identifiers in storage.json",
        [context](const json& args) { return rootOperations(*context, args, true); },
        mutatingParameters(), true);

    registry.registerOperation(
        "store", "Remove matching keys from state.vscdb stores",
        [context](const json& args) { return rootOperations(*context, args, false); },
        mutatingParameters(), true);

    registry.registerOperation(
        "verify", "Report Augment files and store keys that remain",
        [context](const json& args) { return verifyOperation(*context, args); },
        mutatingParameters());
}

} // namespace augsweep
