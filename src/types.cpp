// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/types.h"

#include <iomanip>
#include <sstream>

#include "augsweep/errors.h"
#include "augsweep/path_utils.h"

namespace augsweep {

std::optional<EditorVariant> parseEditorVariant(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "vscode" || lower == "code") return EditorVariant::VSCODE;
    if (lower == "cursor") return EditorVariant::CURSOR;
    if (lower == "windsurf") return EditorVariant::WINDSURF;
    if (lower == "vscodium") return EditorVariant::VSCODIUM;
    if (lower == "code-oss" || lower == "code_oss") return EditorVariant::CODE_OSS;
    if (lower == "generic-oss" || lower == "generic_oss") return EditorVariant::GENERIC_OSS;
    return std::nullopt;
}

const std::vector<EditorVariant>& allEditorVariants() {
    static const std::vector<EditorVariant> variants = {
        EditorVariant::VSCODE,   EditorVariant::CURSOR,   EditorVariant::WINDSURF,
        EditorVariant::VSCODIUM, EditorVariant::CODE_OSS, EditorVariant::GENERIC_OSS,
    };
    return variants;
}

std::optional<OsFamily> parseOsFamily(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "windows" || lower == "win32" || lower == "win") return OsFamily::WINDOWS;
    if (lower == "macos" || lower == "darwin" || lower == "osx" || lower == "mac") return OsFamily::MACOS;
    if (lower == "linux") return OsFamily::LINUX;
    return std::nullopt;
}

// ---- EnvironmentRoot ----

EnvironmentRoot EnvironmentRoot::forPath(const fs::path& path, RootKind kind, OsFamily os) {
    EnvironmentRoot root;
    root.osFamily = os;
    root.kind = kind;
    root.rootPath = canonicalPath(path);
    root.exists = isReadableDirectory(root.rootPath);
    root.label = root.rootPath.filename().string();
    return root;
}

json EnvironmentRoot::toJson() const {
    json j;
    j["editor"] = editorVariant ? json(editorVariantToString(*editorVariant)) : json(nullptr);
    j["os"] = osFamilyToString(osFamily);
    j["kind"] = rootKindToString(kind);
    j["path"] = rootPath.string();
    j["exists"] = exists;
    if (!label.empty()) j["label"] = label;
    return j;
}

// ---- FileEntry ----

json FileEntry::toJson() const {
    return json{
        {"path", path.string()},
        {"size", sizeBytes},
        {"kind", entryKindToString(kind)},
        {"classification", classificationToString(classification)},
        {"symlink", isSymlink},
        {"escapesRoot", escapesRoot},
    };
}

// ---- KeyPattern ----

bool KeyPattern::matches(const std::string& key) const {
    if (text.empty()) {
        return false;
    }
    const std::string k = caseSensitive ? key : toLower(key);
    const std::string t = caseSensitive ? text : toLower(text);
    switch (mode) {
        case MatchMode::SUBSTRING: return k.find(t) != std::string::npos;
        case MatchMode::PREFIX:    return k.compare(0, t.size(), t) == 0;
        case MatchMode::EXACT:     return k == t;
    }
    return false;
}

KeyPattern KeyPattern::fromJson(const json& j) {
    KeyPattern p;

    if (j.is_string()) {
        std::string s = j.get<std::string>();
        bool leading = !s.empty() && s.front() == '%';
        bool trailing = s.size() > 1 && s.back() == '%';
        if (leading) s.erase(0, 1);
        if (trailing && !s.empty()) s.pop_back();
        if (s.empty()) {
            throw ParseError("empty key pattern");
        }

        // "x%" is a prefix; "%x%", "%x" and a bare "x" match anywhere
        p.mode = (trailing && !leading) ? MatchMode::PREFIX : MatchMode::SUBSTRING;
        p.text = s;
        return p;
    }

    if (!j.is_object()) {
        throw ParseError("key pattern must be a string or an object, got " + j.dump());
    }
    if (!j.contains("text") || !j["text"].is_string() || j["text"].get<std::string>().empty()) {
        throw ParseError("key pattern object needs a non-empty \"text\": " + j.dump());
    }

    if (j.contains("mode") && !j["mode"].is_string()) {
        throw ParseError("\"mode\" must be a string");
    }

    p.text = j["text"].get<std::string>();
    std::string mode = toLower(j.value("mode", std::string("substring")));
    if (mode == "substring" || mode == "contains") {
        p.mode = MatchMode::SUBSTRING;
    } else if (mode == "prefix") {
        p.mode = MatchMode::PREFIX;
    } else if (mode == "exact") {
        p.mode = MatchMode::EXACT;
    } else {
        throw ParseError("unknown key pattern mode: " + mode);
    }
    if (j.contains("caseSensitive")) {
        if (!j["caseSensitive"].is_boolean()) {
            throw ParseError("\"caseSensitive\" must be a boolean");
        }
        p.caseSensitive = j["caseSensitive"].get<bool>();
    }
    return p;
}

json KeyPattern::toJson() const {
    return json{{"mode", matchModeToString(mode)}, {"text", text}, {"caseSensitive", caseSensitive}};
}

// ---- Statuses ----

json ItemStatus::toJson() const {
    json j{
        {"path", path.string()},
        {"size", sizeBytes},
        {"kind", entryKindToString(kind)},
        {"outcome", outcomeToString(outcome)},
    };
    if (error) j["error"] = *error;
    return j;
}

json OperationStatus::toJson() const {
    json j{
        {"name", name},
        {"target", target.string()},
        {"outcome", operationOutcomeToString(outcome)},
        {"detail", detail},
    };
    if (error) j["error"] = *error;
    if (!data.empty()) j["data"] = data;
    return j;
}

// ---- CleanupResult ----

bool CleanupResult::hasFailures() const {
    if (failedCount > 0) return true;
    for (const auto& op : operations) {
        if (op.outcome == OperationOutcome::FAILED) return true;
    }
    return false;
}

json CleanupResult::toJson() const {
    json items = json::array();
    for (const auto& item : perItemStatus) {
        items.push_back(item.toJson());
    }
    json ops = json::array();
    for (const auto& op : operations) {
        ops.push_back(op.toJson());
    }

    return json{
        {"root", root.toJson()},
        {"dryRun", dryRun},
        {"state", executorStateToString(state)},
        {"totalScanned", totalScanned},
        {"totalRemoved", totalRemoved},
        {"preservedCount", preservedCount},
        {"skippedCount", skippedCount},
        {"failedCount", failedCount},
        {"bytesFreed", bytesFreed},
        {"items", items},
        {"operations", ops},
    };
}

std::string CleanupResult::toLines() const {
    std::ostringstream oss;
    for (const auto& item : perItemStatus) {
        oss << outcomeToString(item.outcome) << '\t' << item.path.string() << '\t'
            << item.sizeBytes << '\t' << entryKindToString(item.kind) << '\t'
            << item.error.value_or("") << '\n';
    }
    return oss.str();
}

namespace {

std::string formatBytes(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
    }
    return oss.str();
}

} // namespace

std::string CleanupResult::toReport() const {
    std::ostringstream oss;
    oss << (dryRun ? "Dry run for " : "Cleanup of ") << root.rootPath.string();
    if (root.editorVariant) {
        oss << " (" << editorVariantToString(*root.editorVariant) << ", "
            << rootKindToString(root.kind) << ")";
    } else {
        oss << " (" << rootKindToString(root.kind) << ")";
    }
    oss << "\n";
    oss << "  State:     " << executorStateToString(state) << "\n";
    oss << "  Scanned:   " << totalScanned << "\n";
    oss << "  " << (dryRun ? "Would remove: " : "Removed:   ") << totalRemoved
        << " (" << formatBytes(bytesFreed) << ")\n";
    oss << "  Preserved: " << preservedCount;
    if (skippedCount > 0) {
        oss << " (" << skippedCount << " skipped)";
    }
    oss << "\n";
    oss << "  Failed:    " << failedCount << "\n";

    for (const auto& op : operations) {
        oss << "  " << op.name << " " << op.target.string() << ": "
            << operationOutcomeToString(op.outcome);
        if (!op.detail.empty()) oss << " - " << op.detail;
        if (op.error) oss << " [" << *op.error << "]";
        oss << "\n";
    }

    for (const auto& item : perItemStatus) {
        if (item.outcome == Outcome::FAILED || item.outcome == Outcome::SKIPPED) {
            oss << "  " << outcomeToString(item.outcome) << ": " << item.path.string();
            if (item.error) oss << " (" << *item.error << ")";
            oss << "\n";
        }
    }
    return oss.str();
}

// ---- Mutator Results ----

json TelemetryRewrite::toJson() const {
    return json{{"path", configPath.string()}, {"oldIds", oldIds}, {"newIds", newIds}};
}

json StoreCleanResult::toJson() const {
    return json{
        {"path", dbPath.string()},
        {"rowsRemoved", rowsRemoved},
        {"tables", tablesCleaned},
        {"keys", removedKeys},
    };
}

} // namespace augsweep
