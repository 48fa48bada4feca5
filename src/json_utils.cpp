// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/json_utils.h"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include "augsweep/errors.h"

namespace augsweep {

namespace {

constexpr bool IGNORE_COMMENTS = true;

// Length of the comment starting at text[i], or 0 if there is none
size_t commentLength(const std::string& text, size_t i) {
    if (text[i] != '/' || i + 1 >= text.size()) {
        return 0;
    }
    if (text[i + 1] == '/') {
        size_t end = text.find('\n', i + 2);
        return (end == std::string::npos ? text.size() : end) - i;
    }
    if (text[i + 1] == '*') {
        size_t end = text.find("*/", i + 2);
        return (end == std::string::npos ? text.size() : end + 2) - i;
    }
    return 0;
}

bool isJsonSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

std::string removeTrailingCommas(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool inString = false;
    bool escapeNext = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (inString) {
            out += c;
            if (escapeNext) {
                escapeNext = false;
            } else if (c == '\\') {
                escapeNext = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }

        if (c == '"') {
            inString = true;
            out += c;
            continue;
        }

        // Comments pass through untouched; the parser skips them
        if (size_t length = commentLength(text, i)) {
            out.append(text, i, length);
            i += length - 1;
            continue;
        }

        if (c == ',') {
            size_t j = i + 1;
            while (j < text.size()) {
                if (isJsonSpace(text[j])) {
                    ++j;
                } else if (size_t length = commentLength(text, j)) {
                    j += length;
                } else {
                    break;
                }
            }
            if (j < text.size() && (text[j] == '}' || text[j] == ']')) {
                continue; // drop the comma, keep the whitespace
            }
        }

        out += c;
    }

    return out;
}

ordered_json parseJsonDocument(const std::string& text, bool allowJsonc) {
    try {
        return ordered_json::parse(text);
    } catch (const ordered_json::parse_error& initialError) {
        if (!allowJsonc) {
            throw ParseError(initialError.what());
        }

        try {
            return ordered_json::parse(removeTrailingCommas(text), nullptr, true, IGNORE_COMMENTS);
        } catch (const ordered_json::parse_error&) {
            throw ParseError(initialError.what());
        }
    }
}

std::string readTextFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw NotFoundError(path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code openError(errno, std::generic_category());
        throw PermissionError("cannot open " + path.string() + ": " + openError.message());
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

ordered_json readJsonFile(const fs::path& path, bool allowJsonc) {
    std::string text = readTextFile(path);
    try {
        return parseJsonDocument(text, allowJsonc);
    } catch (const ParseError& e) {
        throw ParseError(path.string() + ": " + e.what());
    }
}

} // namespace augsweep
