// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/scanner.h"

#include <algorithm>

#include "augsweep/config.h"
#include "augsweep/path_utils.h"

namespace augsweep {

namespace {

// Folder names differ in case between editor builds
constexpr bool SCOPE_CASE_SENSITIVE = false;

bool prefixMatches(const std::vector<std::string>& pattern, const std::vector<std::string>& path,
                   size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (!wildcardMatch(pattern[i], path[i], SCOPE_CASE_SENSITIVE)) {
            return false;
        }
    }
    return true;
}

bool anySegment(const std::vector<std::string>& segments,
                std::initializer_list<const char*> needles) {
    for (const auto& segment : segments) {
        for (const char* needle : needles) {
            if (segment.find(needle) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

bool anySegmentEquals(const std::vector<std::string>& segments,
                      std::initializer_list<const char*> names) {
    for (const auto& segment : segments) {
        for (const char* name : names) {
            if (segment == name) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

// ---- ScanScope ----

ScanScope::Match ScanScope::matchDirectory(const fs::path& relative) const {
    if (isWholeRoot()) {
        return Match::INSIDE;
    }

    std::vector<std::string> dir = pathSegments(relative);
    Match best = Match::NONE;
    for (const auto& pattern : patterns) {
        std::vector<std::string> pat = pathSegments(pattern);
        if (pat.empty()) {
            return Match::INSIDE;
        }
        if (dir.size() >= pat.size()) {
            if (prefixMatches(pat, dir, pat.size())) {
                return Match::INSIDE;
            }
        } else if (prefixMatches(pat, dir, dir.size())) {
            best = Match::PARTIAL;
        }
    }
    return best;
}

bool ScanScope::containsFile(const fs::path& relative) const {
    if (isWholeRoot()) {
        return true;
    }

    std::vector<std::string> file = pathSegments(relative);
    for (const auto& pattern : patterns) {
        std::vector<std::string> pat = pathSegments(pattern);
        if (pat.size() <= file.size() && prefixMatches(pat, file, pat.size())) {
            return true;
        }
    }
    return false;
}

// ---- Kind inference ----

EntryKind inferKind(const fs::path& relative, RootKind rootKind) {
    std::vector<std::string> segments;
    for (const auto& s : pathSegments(relative)) {
        segments.push_back(toLower(s));
    }
    std::string extension = toLower(relative.extension().string());

    if (rootKind == RootKind::WORKSPACE_STORAGE || anySegmentEquals(segments, {"workspacestorage"})) {
        return EntryKind::WORKSPACE_STORAGE;
    }
    if (rootKind == RootKind::EXTENSIONS ||
        anySegmentEquals(segments, {"cachedextensions", "cachedextensionvsixs", ".obsolete"})) {
        return EntryKind::EXTENSION_CACHE;
    }
    if (anySegment(segments, {"chat", "conversation", "history"})) {
        return EntryKind::CHAT_HISTORY;
    }
    if (rootKind == RootKind::LOGS || extension == ".log" ||
        anySegmentEquals(segments, {"logs", "crashes"})) {
        return EntryKind::LOG;
    }
    if (extension == ".tmp" || extension == ".temp" || anySegmentEquals(segments, {"tmp", "temp"})) {
        return EntryKind::TEMP_FILE;
    }
    if (rootKind == RootKind::CACHE || anySegment(segments, {"cache"})) {
        return EntryKind::CACHE;
    }
    if (extension == ".json") {
        return EntryKind::CONFIG;
    }
    return EntryKind::UNKNOWN;
}

// ---- Default scopes ----

ScanScope defaultScopeFor(RootKind kind, const CleanerConfig& config) {
    ScanScope scope;
    switch (kind) {
        case RootKind::CONFIG:
            scope.patterns = {"logs", "crashes", "CachedData", "CachedExtensions",
                              "CachedExtensionVSIXs", "GPUCache", "DawnGraphiteCache",
                              "DawnWebGPUCache", "Code Cache", "User/logs"};
            break;
        case RootKind::GLOBAL_STORAGE:
            scope.patterns = config.augmentExtensionIds;
            scope.patterns.push_back("*augment*");
            break;
        case RootKind::WORKSPACE_STORAGE:
            scope.patterns = {"*/*augment*"};
            break;
        case RootKind::EXTENSIONS:
            scope.patterns = {"augment.*", "augmentcode.*", ".obsolete"};
            break;
        case RootKind::CACHE:
        case RootKind::LOGS:
        case RootKind::AUGMENT_HOME:
            break; // whole root
    }
    return scope;
}

// ---- ScanStream ----

ScanStream::ScanStream(EnvironmentRoot root, PreservationSet preservation, ScanOptions options)
    : root_(std::move(root)), preservation_(std::move(preservation)), options_(std::move(options)) {
    root_.rootPath = canonicalPath(root_.rootPath);
}

void ScanStream::reset() {
    it_ = fs::recursive_directory_iterator();
    started_ = false;
    lastError_.clear();
}

void ScanStream::advance() {
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
        lastError_ = ec;
        it_ = fs::recursive_directory_iterator();
    }
}

std::optional<FileEntry> ScanStream::next() {
    if (!started_) {
        started_ = true;
        std::error_code ec;
        it_ = fs::recursive_directory_iterator(
            root_.rootPath, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            lastError_ = ec;
            it_ = fs::recursive_directory_iterator();
            return std::nullopt;
        }
    } else if (it_ != fs::recursive_directory_iterator()) {
        advance();
    }

    for (; it_ != fs::recursive_directory_iterator(); advance()) {
        const fs::directory_entry& entry = *it_;
        std::error_code ec;
        fs::file_status status = entry.symlink_status(ec);
        if (ec) {
            continue;
        }

        if (fs::is_symlink(status)) {
            if (auto made = makeEntry(entry, true)) {
                return made;
            }
            continue;
        }

        if (fs::is_directory(status)) {
            fs::path relative = entry.path().lexically_relative(root_.rootPath);
            bool tooDeep = it_.depth() + 1 >= options_.maxDepth;
            if (tooDeep || options_.scope.matchDirectory(relative) == ScanScope::Match::NONE ||
                !isReadableDirectory(entry.path())) {
                it_.disable_recursion_pending();
            }
            continue;
        }

        if (fs::is_regular_file(status)) {
            if (auto made = makeEntry(entry, false)) {
                return made;
            }
        }
    }
    return std::nullopt;
}

std::optional<FileEntry> ScanStream::makeEntry(const fs::directory_entry& entry, bool isSymlink) {
    fs::path relative = entry.path().lexically_relative(root_.rootPath);
    if (!options_.scope.containsFile(relative)) {
        return std::nullopt;
    }

    FileEntry file;
    file.path = root_.rootPath / relative;
    file.isSymlink = isSymlink;
    file.kind = inferKind(relative, root_.kind);

    if (isSymlink) {
        fs::path target = canonicalPath(file.path);
        file.escapesRoot = !isStrictDescendant(target, root_.rootPath);
    } else {
        std::error_code ec;
        std::uintmax_t size = entry.file_size(ec);
        file.sizeBytes = ec ? 0 : size;
    }

    std::string name = relative.filename().string();
    bool essential = std::any_of(options_.essentialFiles.begin(), options_.essentialFiles.end(),
                                 [&name](const std::string& e) { return e == name; });

    file.classification = (file.escapesRoot || essential || preservation_.matches(relative))
                              ? Classification::PRESERVE
                              : Classification::REMOVABLE;
    return file;
}

std::vector<FileEntry> scan(const EnvironmentRoot& root, const PreservationSet& preservation,
                            const ScanOptions& options) {
    ScanStream stream(root, preservation, options);
    std::vector<FileEntry> entries;
    while (auto entry = stream.next()) {
        entries.push_back(std::move(*entry));
    }
    return entries;
}

} // namespace augsweep
