// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Safety guard: decides whether a path may be mutated or deleted.
//
// A path is safe only if, after canonicalization, it lies strictly below the
// declared root, touches no protected location and is not preserved. The
// guard is pure: it never mutates anything and never throws for a verdict.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "augsweep/export.h"
#include "augsweep/preservation.h"
#include "augsweep/types.h"

namespace augsweep {

namespace fs = std::filesystem;

enum class ProtectionMode {
    EXACT,  // the path itself and its ancestors
    SUBTREE // the path, its ancestors and everything below it
};

inline std::string protectionModeToString(ProtectionMode m) {
    switch (m) {
        case ProtectionMode::EXACT:   return "exact";
        case ProtectionMode::SUBTREE: return "subtree";
    }
    return "unknown";
}

struct ProtectedPath {
    fs::path path; // canonical
    ProtectionMode mode = ProtectionMode::SUBTREE;
};

/// Deny-list of canonical path prefixes.
class AUGSWEEP_API ProtectedPathList {
public:
    /// @param home Home directory. Subtree entries that contain it are
    ///             downgraded to exact protection, and relative entries are
    ///             resolved against it.
    explicit ProtectedPathList(fs::path home = {});

    /// Home, OS root, Desktop/Documents/Downloads and system directories.
    static ProtectedPathList defaults(OsFamily os, const fs::path& home);

    void add(const fs::path& path, ProtectionMode mode = ProtectionMode::SUBTREE);

    /// Entry that forbids touching `canonical`, or nullptr.
    const ProtectedPath* findViolation(const fs::path& canonical) const;

    bool isProtected(const fs::path& canonical) const { return findViolation(canonical) != nullptr; }

    const std::vector<ProtectedPath>& entries() const { return entries_; }

    json toJson() const;

private:
    fs::path home_;
    std::vector<ProtectedPath> entries_;
};

enum class SafetyVerdict {
    SAFE,
    OUTSIDE_ROOT,
    PROTECTED,
    PRESERVED
};

struct SafetyCheck {
    SafetyVerdict verdict = SafetyVerdict::SAFE;
    std::string reason; // empty when safe

    bool ok() const { return verdict == SafetyVerdict::SAFE; }
};

class AUGSWEEP_API SafetyGuard {
public:
    SafetyGuard(ProtectedPathList denyList, PreservationSet preservation);

    /// Full verdict with a reason suitable for an item's error text.
    SafetyCheck check(const fs::path& path, const fs::path& declaredRoot) const;

    bool isSafe(const fs::path& path, const fs::path& declaredRoot) const {
        return check(path, declaredRoot).ok();
    }

    /// Like check(), but raises the matching error for an unsafe path.
    /// @throws PathOutsideRootError, ProtectedPathError
    void require(const fs::path& path, const fs::path& declaredRoot) const;

    const ProtectedPathList& denyList() const { return denyList_; }
    const PreservationSet& preservation() const { return preservation_; }

private:
    ProtectedPathList denyList_;
    PreservationSet preservation_;
};

} // namespace augsweep
