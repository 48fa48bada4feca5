// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Patterns for files that must survive a cleanup run.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "augsweep/export.h"

namespace augsweep {

namespace fs = std::filesystem;

/// Immutable set of preserve patterns, matched against paths relative to a root.
///
/// A pattern without '/' is a file or directory name (wildcards allowed) and
/// matches when any segment of the relative path matches it, so "User"
/// preserves the whole User subtree. A pattern with '/' matches when its
/// segments match a leading run of the path's segments.
class AUGSWEEP_API PreservationSet {
public:
    /// Default set: {"settings.json"}.
    PreservationSet();

    /// @throws std::invalid_argument for an empty, absolute or ".."-containing pattern.
    explicit PreservationSet(std::vector<std::string> patterns);

    /// Empty set (nothing is preserved beyond the scanner's essential files).
    static PreservationSet none();

    /// @param relativePath Path relative to the root being cleaned.
    bool matches(const fs::path& relativePath) const;

    const std::vector<std::string>& patterns() const { return patterns_; }
    size_t size() const { return patterns_.size(); }
    bool isEmpty() const { return patterns_.empty(); }

private:
    struct NoDefaults {};
    explicit PreservationSet(NoDefaults) {}

    std::vector<std::string> patterns_;
    std::vector<std::vector<std::string>> segments_; // pre-split patterns
};

} // namespace augsweep
