// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Path helpers shared by the locator, safety guard and scanner.
//
// All descent checks compare whole path components, never raw string
// prefixes, so "/home/user2" is not treated as inside "/home/user".

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "augsweep/export.h"

namespace augsweep {

namespace fs = std::filesystem;

/// Resolve symlinks and normalize separators.
/// Works for paths that do not (fully) exist: the existing prefix is
/// resolved and the remainder normalized lexically.
AUGSWEEP_API fs::path canonicalPath(const fs::path& p);

/// Canonical location of an entry without following a final symlink:
/// canonical(parent) / filename.
AUGSWEEP_API fs::path canonicalEntryPath(const fs::path& p);

/// True if `child` lies strictly below `parent`. Both must already be canonical.
AUGSWEEP_API bool isStrictDescendant(const fs::path& child, const fs::path& parent);

/// True if `child` equals `parent` or lies below it. Both must already be canonical.
AUGSWEEP_API bool isSameOrDescendant(const fs::path& child, const fs::path& parent);

/// Component-wise equality (case-insensitive on Windows).
AUGSWEEP_API bool pathEquals(const fs::path& a, const fs::path& b);

/// Split a relative path into its components ("a/b/c" -> {"a","b","c"}).
AUGSWEEP_API std::vector<std::string> pathSegments(const fs::path& relative);

/// Glob-style match supporting '*' and '?' within one string.
AUGSWEEP_API bool wildcardMatch(const std::string& pattern, const std::string& text,
                                bool caseSensitive = true);

AUGSWEEP_API std::string toLower(const std::string& s);

AUGSWEEP_API bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

/// True if the directory exists and can be opened for listing.
AUGSWEEP_API bool isReadableDirectory(const fs::path& p);

/// Write `content` to `target` by writing a temporary file in the same
/// directory and renaming it over the target. The target is never left
/// partially written; the temporary file is removed on failure.
/// Existing permissions of `target` are carried over.
/// @throws PermissionError or std::runtime_error on I/O failure.
AUGSWEEP_API void writeFileAtomically(const fs::path& target, const std::string& content);

/// Describe a filesystem error code, labelling permission failures.
AUGSWEEP_API std::string describeError(const std::error_code& ec, const fs::path& path);

} // namespace augsweep
