// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Scanner / classifier: walks a root and yields classified file entries.
//
// Only regular files and symlinks are entries; directories are walked, never
// reported. Symlinked directories are not followed. Nothing is mutated.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "augsweep/export.h"
#include "augsweep/preservation.h"
#include "augsweep/types.h"

namespace augsweep {

namespace fs = std::filesystem;

struct CleanerConfig;

/// Relative wildcard patterns selecting the part of a root to scan.
/// "logs" selects the logs subtree, "*/*augment*" selects matching entries
/// one level down. No patterns means the whole root.
struct AUGSWEEP_API ScanScope {
    std::vector<std::string> patterns;

    enum class Match { NONE, PARTIAL, INSIDE };

    /// How a directory at `relative` relates to the scope: outside it,
    /// on the way to a pattern, or inside a matched subtree.
    Match matchDirectory(const fs::path& relative) const;

    /// True if a file at `relative` is inside the scope.
    bool containsFile(const fs::path& relative) const;

    bool isWholeRoot() const { return patterns.empty(); }
};

struct AUGSWEEP_API ScanOptions {
    ScanScope scope;
    int maxDepth = 16;

    // File names never removed, wherever they appear
    std::vector<std::string> essentialFiles = {
        "settings.json", "keybindings.json", "storage.json", "state.vscdb",
    };
};

/// Lazy, restartable walk over one root.
class AUGSWEEP_API ScanStream {
public:
    ScanStream(EnvironmentRoot root, PreservationSet preservation, ScanOptions options = {});

    /// Next entry, or nullopt when the walk is exhausted.
    std::optional<FileEntry> next();

    /// Start over from the beginning of the root.
    void reset();

    const EnvironmentRoot& root() const { return root_; }

    /// Last directory-iteration error, if the walk ended early because of one.
    const std::error_code& lastError() const { return lastError_; }

private:
    std::optional<FileEntry> makeEntry(const fs::directory_entry& entry, bool isSymlink);
    void advance();

    EnvironmentRoot root_;
    PreservationSet preservation_;
    ScanOptions options_;

    fs::recursive_directory_iterator it_;
    bool started_ = false;
    std::error_code lastError_;
};

/// Scan a root into a vector.
AUGSWEEP_API std::vector<FileEntry> scan(const EnvironmentRoot& root,
                                         const PreservationSet& preservation,
                                         const ScanOptions& options = {});

/// Infer an entry kind from its path relative to a root of the given kind.
AUGSWEEP_API EntryKind inferKind(const fs::path& relative, RootKind rootKind);

/// Scope used for a root kind.
AUGSWEEP_API ScanScope defaultScopeFor(RootKind kind, const CleanerConfig& config);

} // namespace augsweep
