// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/path_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <stdexcept>

#include "augsweep/errors.h"
#include "augsweep/id_generator.h"

namespace augsweep {

namespace {

fs::path stripTrailingSeparator(fs::path p) {
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

std::vector<std::string> components(const fs::path& p) {
    std::vector<std::string> parts;
    for (const auto& element : p) {
        std::string s = element.string();
        if (s.empty()) continue;
        parts.push_back(std::move(s));
    }
    return parts;
}

bool componentEquals(const std::string& a, const std::string& b) {
#ifdef _WIN32
    return toLower(a) == toLower(b);
#else
    return a == b;
#endif
}

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

/// Temporary file that is deleted on scope exit unless released.
class ScopedTempFile {
public:
    explicit ScopedTempFile(fs::path path) : path_(std::move(path)) {}

    ~ScopedTempFile() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const fs::path& path() const { return path_; }
    void release() { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

} // namespace

fs::path canonicalPath(const fs::path& p) {
    std::error_code ec;
    fs::path absolute = fs::absolute(p, ec);
    if (ec) {
        absolute = p;
    }
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return stripTrailingSeparator(absolute.lexically_normal());
    }
    return stripTrailingSeparator(resolved.lexically_normal());
}

fs::path canonicalEntryPath(const fs::path& p) {
    fs::path normal = stripTrailingSeparator(p.lexically_normal());
    fs::path name = normal.filename();
    if (name.empty() || name == "." || name == ".." || !normal.has_parent_path()) {
        return canonicalPath(normal);
    }
    return canonicalPath(normal.parent_path()) / name;
}

bool isStrictDescendant(const fs::path& child, const fs::path& parent) {
    auto cs = components(child);
    auto ps = components(parent);
    if (ps.empty() || cs.size() <= ps.size()) {
        return false;
    }
    for (size_t i = 0; i < ps.size(); ++i) {
        if (!componentEquals(cs[i], ps[i])) {
            return false;
        }
    }
    return true;
}

bool pathEquals(const fs::path& a, const fs::path& b) {
    auto as = components(a);
    auto bs = components(b);
    if (as.size() != bs.size()) {
        return false;
    }
    for (size_t i = 0; i < as.size(); ++i) {
        if (!componentEquals(as[i], bs[i])) {
            return false;
        }
    }
    return true;
}

bool isSameOrDescendant(const fs::path& child, const fs::path& parent) {
    return pathEquals(child, parent) || isStrictDescendant(child, parent);
}

std::vector<std::string> pathSegments(const fs::path& relative) {
    std::vector<std::string> segments;
    for (const auto& element : relative) {
        std::string s = element.string();
        if (s.empty() || s == ".") continue;
        segments.push_back(std::move(s));
    }
    return segments;
}

bool wildcardMatch(const std::string& pattern, const std::string& text, bool caseSensitive) {
    auto eq = [caseSensitive](char a, char b) {
        if (caseSensitive) return a == b;
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };

    size_t p = 0, t = 0;
    size_t starP = std::string::npos, starT = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || eq(pattern[p], text[t]))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool isReadableDirectory(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec) || ec) {
        return false;
    }
    fs::directory_iterator it(p, ec);
    return !ec;
}

void writeFileAtomically(const fs::path& target, const std::string& content) {
    fs::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    ScopedTempFile temp(dir / ("." + target.filename().string() + ".augsweep-" +
                               randomHex(8) + ".tmp"));
    {
        std::ofstream out(temp.path(), std::ios::binary | std::ios::trunc);
        if (!out) {
            std::error_code ec(errno, std::generic_category());
            if (isPermissionError(ec)) {
                throw PermissionError("cannot create temporary file in " + dir.string());
            }
            throw std::runtime_error("cannot create temporary file: " + describeError(ec, temp.path()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("failed writing temporary file " + temp.path().string());
        }
    }

    std::error_code ec;
    fs::file_status status = fs::status(target, ec);
    if (!ec && fs::exists(status)) {
        fs::permissions(temp.path(), status.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            throw std::runtime_error("cannot copy permissions: " + describeError(ec, temp.path()));
        }
    }

    fs::rename(temp.path(), target, ec);
    if (ec) {
        if (isPermissionError(ec)) {
            throw PermissionError("cannot replace " + target.string() + ": " + ec.message());
        }
        throw std::runtime_error("cannot replace file: " + describeError(ec, target));
    }
    temp.release();
}

std::string describeError(const std::error_code& ec, const fs::path& path) {
    std::string message = ec.message() + " (" + path.string() + ")";
    if (isPermissionError(ec)) {
        return errorKindToString(ErrorKind::PERMISSION) + ": " + message;
    }
    return message;
}

} // namespace augsweep
