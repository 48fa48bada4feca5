// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Common types for the augsweep cleanup engine.
//
// Enumerations come with toString/parse helpers; result records serialize to
// JSON so the CLI and other callers can consume them without extra glue.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "augsweep/export.h"

namespace augsweep {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ---- Editor Variants ----

enum class EditorVariant {
    VSCODE,
    CURSOR,
    WINDSURF,
    VSCODIUM,
    CODE_OSS,
    GENERIC_OSS
};

inline std::string editorVariantToString(EditorVariant v) {
    switch (v) {
        case EditorVariant::VSCODE:      return "vscode";
        case EditorVariant::CURSOR:      return "cursor";
        case EditorVariant::WINDSURF:    return "windsurf";
        case EditorVariant::VSCODIUM:    return "vscodium";
        case EditorVariant::CODE_OSS:    return "code-oss";
        case EditorVariant::GENERIC_OSS: return "generic-oss";
    }
    return "unknown";
}

/// Parse a variant name (case-insensitive, accepts "code" and "vscode").
AUGSWEEP_API std::optional<EditorVariant> parseEditorVariant(const std::string& name);

/// All variants, in declaration order.
AUGSWEEP_API const std::vector<EditorVariant>& allEditorVariants();

// ---- Operating System Families ----

enum class OsFamily {
    WINDOWS,
    MACOS,
    LINUX
};

inline std::string osFamilyToString(OsFamily os) {
    switch (os) {
        case OsFamily::WINDOWS: return "windows";
        case OsFamily::MACOS:   return "macos";
        case OsFamily::LINUX:   return "linux";
    }
    return "unknown";
}

/// Parse an OS family name ("windows"/"win32", "macos"/"darwin"/"osx", "linux").
AUGSWEEP_API std::optional<OsFamily> parseOsFamily(const std::string& name);

/// OS family this binary was compiled for.
inline OsFamily currentOsFamily() {
#if defined(_WIN32)
    return OsFamily::WINDOWS;
#elif defined(__APPLE__)
    return OsFamily::MACOS;
#else
    return OsFamily::LINUX;
#endif
}

// ---- Roots ----

enum class RootKind {
    CONFIG,            // editor data directory, e.g. ~/.config/Code
    GLOBAL_STORAGE,    // <config>/User/globalStorage
    WORKSPACE_STORAGE, // <config>/User/workspaceStorage
    EXTENSIONS,        // ~/.vscode/extensions
    CACHE,             // ~/.cache/Code
    LOGS,              // ~/Library/Logs/Code
    AUGMENT_HOME       // ~/.augment
};

inline std::string rootKindToString(RootKind k) {
    switch (k) {
        case RootKind::CONFIG:            return "config";
        case RootKind::GLOBAL_STORAGE:    return "globalStorage";
        case RootKind::WORKSPACE_STORAGE: return "workspaceStorage";
        case RootKind::EXTENSIONS:        return "extensions";
        case RootKind::CACHE:             return "cache";
        case RootKind::LOGS:              return "logs";
        case RootKind::AUGMENT_HOME:      return "augmentHome";
    }
    return "unknown";
}

struct AUGSWEEP_API EnvironmentRoot {
    std::optional<EditorVariant> editorVariant; // empty for the Augment home
    OsFamily osFamily = OsFamily::LINUX;
    RootKind kind = RootKind::AUGMENT_HOME;
    fs::path rootPath;
    bool exists = false;
    std::string label; // editor folder name, e.g. "Code" or "Cursor"

    /// Root for an arbitrary directory; `exists` is checked immediately.
    static EnvironmentRoot forPath(const fs::path& path,
                                   RootKind kind = RootKind::AUGMENT_HOME,
                                   OsFamily os = currentOsFamily());

    json toJson() const;
};

// ---- File Entries ----

enum class EntryKind {
    CACHE,
    LOG,
    TEMP_FILE,
    WORKSPACE_STORAGE,
    CHAT_HISTORY,
    EXTENSION_CACHE,
    CONFIG,
    UNKNOWN
};

inline std::string entryKindToString(EntryKind k) {
    switch (k) {
        case EntryKind::CACHE:             return "cache";
        case EntryKind::LOG:               return "log";
        case EntryKind::TEMP_FILE:         return "tempFile";
        case EntryKind::WORKSPACE_STORAGE: return "workspaceStorage";
        case EntryKind::CHAT_HISTORY:      return "chatHistory";
        case EntryKind::EXTENSION_CACHE:   return "extensionCache";
        case EntryKind::CONFIG:            return "config";
        case EntryKind::UNKNOWN:           return "unknown";
    }
    return "unknown";
}

enum class Classification {
    PRESERVE,
    REMOVABLE
};

inline std::string classificationToString(Classification c) {
    switch (c) {
        case Classification::PRESERVE:  return "preserve";
        case Classification::REMOVABLE: return "removable";
    }
    return "unknown";
}

struct AUGSWEEP_API FileEntry {
    fs::path path; // canonical location of the entry itself (links are not followed)
    std::uintmax_t sizeBytes = 0;
    EntryKind kind = EntryKind::UNKNOWN;
    Classification classification = Classification::REMOVABLE;
    bool isSymlink = false;
    bool escapesRoot = false;

    json toJson() const;
};

// ---- Outcomes ----

enum class Outcome {
    REMOVED,
    PRESERVED,
    SKIPPED,
    FAILED
};

inline std::string outcomeToString(Outcome o) {
    switch (o) {
        case Outcome::REMOVED:   return "removed";
        case Outcome::PRESERVED: return "preserved";
        case Outcome::SKIPPED:   return "skipped";
        case Outcome::FAILED:    return "failed";
    }
    return "unknown";
}

/// Outcome of a per-root store or telemetry operation.
enum class OperationOutcome {
    APPLIED,
    PLANNED, // dry run: would be applied
    SKIPPED,
    FAILED
};

inline std::string operationOutcomeToString(OperationOutcome o) {
    switch (o) {
        case OperationOutcome::APPLIED: return "applied";
        case OperationOutcome::PLANNED: return "planned";
        case OperationOutcome::SKIPPED: return "skipped";
        case OperationOutcome::FAILED:  return "failed";
    }
    return "unknown";
}

// ---- Executor States ----

enum class ExecutorState {
    IDLE,
    SCANNING,
    VALIDATING,
    APPLYING,
    COMPLETED,
    PARTIALLY_FAILED
};

inline std::string executorStateToString(ExecutorState s) {
    switch (s) {
        case ExecutorState::IDLE:             return "IDLE";
        case ExecutorState::SCANNING:         return "SCANNING";
        case ExecutorState::VALIDATING:       return "VALIDATING";
        case ExecutorState::APPLYING:         return "APPLYING";
        case ExecutorState::COMPLETED:        return "COMPLETED";
        case ExecutorState::PARTIALLY_FAILED: return "PARTIALLY_FAILED";
    }
    return "UNKNOWN";
}

// ---- Key Patterns ----

enum class MatchMode {
    SUBSTRING,
    PREFIX,
    EXACT
};

inline std::string matchModeToString(MatchMode m) {
    switch (m) {
        case MatchMode::SUBSTRING: return "substring";
        case MatchMode::PREFIX:    return "prefix";
        case MatchMode::EXACT:     return "exact";
    }
    return "unknown";
}

/// A rule selecting key/value rows by their key.
struct AUGSWEEP_API KeyPattern {
    MatchMode mode = MatchMode::SUBSTRING;
    std::string text;
    bool caseSensitive = false;

    bool matches(const std::string& key) const;

    /// Accepts a plain string (case-insensitive substring), a SQL LIKE-style
    /// string ("%x%", "x%", "x"), or {"mode", "text", "caseSensitive"}.
    /// @throws ParseError on any other shape.
    static KeyPattern fromJson(const json& j);

    json toJson() const;
};

// ---- Results ----

struct AUGSWEEP_API ItemStatus {
    fs::path path;
    std::uintmax_t sizeBytes = 0;
    EntryKind kind = EntryKind::UNKNOWN;
    Outcome outcome = Outcome::SKIPPED;
    std::optional<std::string> error;

    json toJson() const;
};

struct AUGSWEEP_API OperationStatus {
    std::string name;   // "telemetry" or "store"
    fs::path target;
    OperationOutcome outcome = OperationOutcome::SKIPPED;
    std::string detail;
    std::optional<std::string> error;
    json data = json::object(); // operation-specific payload (ids, row counts)

    json toJson() const;
};

struct AUGSWEEP_API CleanupResult {
    EnvironmentRoot root;
    bool dryRun = false;
    ExecutorState state = ExecutorState::IDLE;

    std::size_t totalScanned = 0;
    std::size_t totalRemoved = 0;
    std::size_t preservedCount = 0; // entries left in place on purpose (preserved + skipped)
    std::size_t skippedCount = 0;
    std::size_t failedCount = 0;
    std::uintmax_t bytesFreed = 0;

    std::vector<ItemStatus> perItemStatus;
    std::vector<OperationStatus> operations;

    /// True if any item or operation failed.
    bool hasFailures() const;

    json toJson() const;

    /// One tab-separated line per item: outcome, path, bytes, kind, error.
    std::string toLines() const;

    /// Human-readable summary.
    std::string toReport() const;
};

// ---- Mutator Results ----

struct AUGSWEEP_API TelemetryRewrite {
    fs::path configPath;
    json oldIds = json::object(); // null where the field was absent
    json newIds = json::object();

    json toJson() const;
};

struct AUGSWEEP_API StoreCleanResult {
    fs::path dbPath;
    std::size_t rowsRemoved = 0;
    std::vector<std::string> tablesCleaned; // tables that existed and were searched
    std::vector<std::string> removedKeys;

    json toJson() const;
};

} // namespace augsweep
