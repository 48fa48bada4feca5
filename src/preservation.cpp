// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/preservation.h"

#include <stdexcept>

#include "augsweep/path_utils.h"

namespace augsweep {

namespace {

bool caseSensitivePaths() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

} // namespace

PreservationSet::PreservationSet() : PreservationSet(std::vector<std::string>{"settings.json"}) {}

PreservationSet::PreservationSet(std::vector<std::string> patterns) {
    for (auto& pattern : patterns) {
        if (pattern.empty()) {
            throw std::invalid_argument("preservation pattern must not be empty");
        }
        for (auto& c : pattern) {
            if (c == '\\') c = '/';
        }
        fs::path asPath(pattern);
        if (pattern.front() == '/' || asPath.is_absolute() || asPath.has_root_name()) {
            throw std::invalid_argument("preservation pattern must be relative: " + pattern);
        }

        std::vector<std::string> segments = pathSegments(asPath);
        for (const auto& segment : segments) {
            if (segment == "..") {
                throw std::invalid_argument("preservation pattern must not contain '..': " + pattern);
            }
        }
        if (segments.empty()) {
            throw std::invalid_argument("preservation pattern has no name: " + pattern);
        }

        patterns_.push_back(pattern);
        segments_.push_back(std::move(segments));
    }
}

PreservationSet PreservationSet::none() {
    return PreservationSet(NoDefaults{});
}

bool PreservationSet::matches(const fs::path& relativePath) const {
    std::vector<std::string> path = pathSegments(relativePath.generic_string());
    if (path.empty()) {
        return false;
    }

    const bool cs = caseSensitivePaths();
    for (const auto& pattern : segments_) {
        if (pattern.size() == 1) {
            for (const auto& segment : path) {
                if (wildcardMatch(pattern[0], segment, cs)) {
                    return true;
                }
            }
            continue;
        }

        if (pattern.size() > path.size()) {
            continue;
        }
        bool all = true;
        for (size_t i = 0; i < pattern.size(); ++i) {
            if (!wildcardMatch(pattern[i], path[i], cs)) {
                all = false;
                break;
            }
        }
        if (all) {
            return true;
        }
    }
    return false;
}

} // namespace augsweep
