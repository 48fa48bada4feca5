// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Shared fixtures for tests that touch the filesystem.

#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <augsweep/id_generator.h>
#include <augsweep/path_utils.h>

namespace augsweep {
namespace test {

namespace fs = std::filesystem;

/// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = canonicalPath(fs::temp_directory_path() / ("augsweep-test-" + randomHex(8)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path operator/(const fs::path& relative) const { return path_ / relative; }

    /// Write a file (creating parents) and return its path.
    fs::path write(const fs::path& relative, const std::string& content) const {
        fs::path target = path_ / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

    /// Write a file of exactly `size` bytes.
    fs::path writeSized(const fs::path& relative, std::size_t size) const {
        return write(relative, std::string(size, 'x'));
    }

    fs::path mkdir(const fs::path& relative) const {
        fs::path target = path_ / relative;
        fs::create_directories(target);
        return target;
    }

private:
    fs::path path_;
};

inline std::string readAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace test
} // namespace augsweep
