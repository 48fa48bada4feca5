// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Environment locator: maps (editor variant, OS family) to storage roots.
//
// Resolution is table driven. Each variant has an application folder name
// ("Code", "Cursor") and a dot folder (".vscode", ".cursor"); each OS family
// has a list of root templates such as "{appData}/{app}/User/globalStorage".
// Host facts (home, APPDATA, XDG dirs) come from a HostEnvironment value so
// tests can point the locator at a temporary directory.

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "augsweep/export.h"
#include "augsweep/types.h"

namespace augsweep {

namespace fs = std::filesystem;

struct AUGSWEEP_API HostEnvironment {
    fs::path home;
    fs::path appData;      // %APPDATA%, ~/Library/Application Support, $XDG_CONFIG_HOME
    fs::path localAppData; // %LOCALAPPDATA% (Windows only)
    fs::path cacheHome;    // $XDG_CACHE_HOME, ~/Library/Caches, %LOCALAPPDATA%

    /// Read from the process environment, with the usual per-OS fallbacks.
    static HostEnvironment fromProcess(OsFamily os = currentOsFamily());

    /// Everything derived from `home` with the per-OS default layout.
    static HostEnvironment forHome(const fs::path& home, OsFamily os = currentOsFamily());
};

struct AUGSWEEP_API VariantInfo {
    std::string appFolder; // {app}
    std::string dotFolder; // {dot}
};

/// Folder names for a variant.
AUGSWEEP_API const VariantInfo& variantInfo(EditorVariant variant);

struct RootTemplate {
    RootKind kind;
    std::string pattern;
};

/// Root templates for an OS family, in resolution order.
AUGSWEEP_API const std::vector<RootTemplate>& rootTemplates(OsFamily os);

/// One immediate child of a root, as reported by describe().
struct AUGSWEEP_API RootChild {
    std::string name;
    bool isDirectory = false;
    std::size_t itemCount = 0; // recursive entry count for directories, 1 for files

    json toJson() const;
};

class AUGSWEEP_API EnvironmentLocator {
public:
    explicit EnvironmentLocator(HostEnvironment host);

    /// Existing, readable roots for a variant on an OS family.
    std::vector<EnvironmentRoot> locate(EditorVariant variant, OsFamily os) const;

    /// String overload; unknown variant or OS names yield an empty result.
    std::vector<EnvironmentRoot> locate(const std::string& variant, const std::string& os) const;

    /// Roots of every known variant, de-duplicated by path.
    std::vector<EnvironmentRoot> locateAll(OsFamily os) const;

    /// ~/.augment if it exists and is readable.
    std::optional<EnvironmentRoot> locateAugmentHome(OsFamily os = currentOsFamily()) const;

    /// Editor data directories under appData that look like VSCode derivatives
    /// (contain User/globalStorage) but are not a known variant's folder.
    /// Reported as generic-OSS CONFIG roots labelled with the folder name.
    std::vector<EnvironmentRoot> discover(OsFamily os) const;

    /// Immediate children of a root, sorted by name.
    std::vector<RootChild> describe(const EnvironmentRoot& root) const;

    /// Substitute template tokens. Unknown tokens are left in place.
    fs::path expand(const std::string& pattern, EditorVariant variant) const;

    const HostEnvironment& host() const { return host_; }

private:
    HostEnvironment host_;
};

} // namespace augsweep
