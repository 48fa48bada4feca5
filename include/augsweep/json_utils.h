// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// JSON document utilities.
//
// Editor configuration files are often JSONC (comments, trailing commas).
// The parser skips comments itself; trailing commas are repaired here without
// touching string contents. Files are read into insertion-ordered trees so a
// rewrite keeps key order.

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "augsweep/export.h"

namespace augsweep {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;
namespace fs = std::filesystem;

/// Remove trailing commas before } or ] outside of strings. Comments are
/// copied unchanged, and a comment between the comma and the bracket does
/// not hide the comma.
AUGSWEEP_API std::string removeTrailingCommas(const std::string& text);

/// Parse a JSON document into an insertion-ordered tree.
///
/// Attempts in order:
///   1. Parse as-is
///   2. If allowJsonc: drop trailing commas, parse again with comments ignored
///
/// @param text Document text
/// @param allowJsonc Accept comments and trailing commas
/// @return Parsed document
/// @throws ParseError if the text cannot be parsed
AUGSWEEP_API ordered_json parseJsonDocument(const std::string& text, bool allowJsonc = false);

/// Read a whole file as text.
/// @throws NotFoundError if the file does not exist
/// @throws PermissionError if it cannot be opened
AUGSWEEP_API std::string readTextFile(const fs::path& path);

/// Read and parse a JSON file. See parseJsonDocument().
/// @throws NotFoundError, PermissionError, ParseError
AUGSWEEP_API ordered_json readJsonFile(const fs::path& path, bool allowJsonc = false);

} // namespace augsweep
