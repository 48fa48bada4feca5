// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/safety_guard.h"

#include <cctype>

#include "augsweep/errors.h"
#include "augsweep/path_utils.h"

namespace augsweep {

namespace {

const std::vector<std::string>& systemDirectories(OsFamily os) {
    static const std::vector<std::string> windows = {
        "C:/Windows", "C:/Program Files", "C:/Program Files (x86)", "C:/ProgramData",
    };
    static const std::vector<std::string> macos = {
        "/System", "/Library", "/Applications", "/usr", "/bin", "/sbin", "/etc", "/private/etc",
        "/Users",
    };
    static const std::vector<std::string> posix = {
        "/bin", "/boot", "/dev", "/etc", "/lib", "/lib32", "/lib64", "/opt", "/proc", "/root",
        "/run", "/sbin", "/srv", "/sys", "/usr", "/var/lib", "/var/log", "/home",
    };
    switch (os) {
        case OsFamily::WINDOWS: return windows;
        case OsFamily::MACOS:   return macos;
        case OsFamily::LINUX:   return posix;
    }
    return posix;
}

// Absolute on this host, or a drive path ("C:/...") from another OS family
bool looksAbsolute(const fs::path& p) {
    std::string s = p.generic_string();
    bool drive = s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
    return p.is_absolute() || p.has_root_directory() || drive;
}

} // namespace

// ---- ProtectedPathList ----

ProtectedPathList::ProtectedPathList(fs::path home)
    : home_(home.empty() ? fs::path() : canonicalPath(home)) {}

ProtectedPathList ProtectedPathList::defaults(OsFamily os, const fs::path& home) {
    ProtectedPathList list(home);

    if (!home.empty()) {
        list.add(home, ProtectionMode::EXACT);
        for (const char* name : {"Desktop", "Documents", "Downloads"}) {
            list.add(home / name, ProtectionMode::SUBTREE);
        }
    }

    list.add(os == OsFamily::WINDOWS ? fs::path("C:/") : fs::path("/"), ProtectionMode::EXACT);
    for (const auto& dir : systemDirectories(os)) {
        list.add(dir, ProtectionMode::SUBTREE);
    }
    return list;
}

void ProtectedPathList::add(const fs::path& path, ProtectionMode mode) {
    if (path.empty()) {
        return;
    }

    fs::path resolved = path;
    if (!looksAbsolute(path)) {
        if (home_.empty()) {
            return; // nothing to anchor a relative entry to
        }
        resolved = home_ / path;
    }
    // Foreign-OS entries (a drive path on POSIX) are kept lexically
    resolved = resolved.is_absolute() ? canonicalPath(resolved) : resolved.lexically_normal();

    // Protecting the subtree of an ancestor of home would forbid everything
    if (mode == ProtectionMode::SUBTREE && !home_.empty() && isSameOrDescendant(home_, resolved)) {
        mode = ProtectionMode::EXACT;
    }

    for (auto& entry : entries_) {
        if (pathEquals(entry.path, resolved)) {
            if (mode == ProtectionMode::SUBTREE) entry.mode = mode;
            return;
        }
    }
    entries_.push_back(ProtectedPath{resolved, mode});
}

const ProtectedPath* ProtectedPathList::findViolation(const fs::path& canonical) const {
    for (const auto& entry : entries_) {
        // Deleting an ancestor (or the entry itself) would take the entry with it
        if (isSameOrDescendant(entry.path, canonical)) {
            return &entry;
        }
        if (entry.mode == ProtectionMode::SUBTREE && isStrictDescendant(canonical, entry.path)) {
            return &entry;
        }
    }
    return nullptr;
}

json ProtectedPathList::toJson() const {
    json list = json::array();
    for (const auto& entry : entries_) {
        list.push_back(json{{"path", entry.path.string()}, {"mode", protectionModeToString(entry.mode)}});
    }
    return list;
}

// ---- SafetyGuard ----

SafetyGuard::SafetyGuard(ProtectedPathList denyList, PreservationSet preservation)
    : denyList_(std::move(denyList)), preservation_(std::move(preservation)) {}

SafetyCheck SafetyGuard::check(const fs::path& path, const fs::path& declaredRoot) const {
    if (path.empty() || declaredRoot.empty()) {
        return {SafetyVerdict::OUTSIDE_ROOT, "empty path or root"};
    }

    const fs::path root = canonicalPath(declaredRoot);
    const fs::path location = canonicalEntryPath(path); // the entry itself
    const fs::path target = canonicalPath(path);        // what it resolves to

    if (!isStrictDescendant(location, root)) {
        return {SafetyVerdict::OUTSIDE_ROOT,
                errorKindToString(ErrorKind::PATH_OUTSIDE_ROOT) + ": " + location.string() +
                    " is not inside " + root.string()};
    }
    if (!isStrictDescendant(target, root)) {
        return {SafetyVerdict::OUTSIDE_ROOT,
                errorKindToString(ErrorKind::PATH_OUTSIDE_ROOT) + ": " + location.string() +
                    " resolves to " + target.string() + " outside " + root.string()};
    }

    for (const fs::path& candidate : {location, target}) {
        if (const ProtectedPath* entry = denyList_.findViolation(candidate)) {
            return {SafetyVerdict::PROTECTED,
                    errorKindToString(ErrorKind::PROTECTED_PATH) + ": " + candidate.string() +
                        " is protected by " + entry->path.string()};
        }
    }

    fs::path relative = location.lexically_relative(root);
    if (preservation_.matches(relative)) {
        return {SafetyVerdict::PRESERVED, "preserved: " + relative.generic_string()};
    }

    return {};
}

void SafetyGuard::require(const fs::path& path, const fs::path& declaredRoot) const {
    SafetyCheck result = check(path, declaredRoot);
    switch (result.verdict) {
        case SafetyVerdict::SAFE:
            return;
        case SafetyVerdict::OUTSIDE_ROOT:
            throw PathOutsideRootError(path.string() + " (root " + declaredRoot.string() + ")");
        case SafetyVerdict::PROTECTED:
        case SafetyVerdict::PRESERVED:
            throw ProtectedPathError(result.reason);
    }
}

} // namespace augsweep
