// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/locator.h"

#include <algorithm>
#include <cstdlib>
#include <set>

#include "augsweep/errors.h"
#include "augsweep/path_utils.h"

namespace augsweep {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

const std::map<std::string, VariantInfo>& variantTable() {
    static const std::map<std::string, VariantInfo> table = {
        {"vscode",      {"Code",          ".vscode"}},
        {"cursor",      {"Cursor",        ".cursor"}},
        {"windsurf",    {"Windsurf",      ".windsurf"}},
        {"vscodium",    {"VSCodium",      ".vscode-oss"}},
        {"code-oss",    {"Code - OSS",    ".vscode-oss"}},
        {"generic-oss", {"OpenVSCode",    ".openvscode-server"}},
    };
    return table;
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::size_t countItems(const fs::path& dir) {
    std::size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return 0;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        ++count;
    }
    return count;
}

bool isKnownAppFolder(const std::string& name) {
    for (const auto& [_, info] : variantTable()) {
        if (toLower(info.appFolder) == toLower(name)) {
            return true;
        }
    }
    return false;
}

} // namespace

// ---- HostEnvironment ----

HostEnvironment HostEnvironment::forHome(const fs::path& home, OsFamily os) {
    HostEnvironment host;
    host.home = home;
    switch (os) {
        case OsFamily::WINDOWS:
            host.appData = home / "AppData" / "Roaming";
            host.localAppData = home / "AppData" / "Local";
            host.cacheHome = host.localAppData;
            break;
        case OsFamily::MACOS:
            host.appData = home / "Library" / "Application Support";
            host.cacheHome = home / "Library" / "Caches";
            break;
        case OsFamily::LINUX:
            host.appData = home / ".config";
            host.cacheHome = home / ".cache";
            break;
    }
    return host;
}

HostEnvironment HostEnvironment::fromProcess(OsFamily os) {
    std::string home = envOrEmpty(os == OsFamily::WINDOWS ? "USERPROFILE" : "HOME");
    if (home.empty() && os == OsFamily::WINDOWS) {
        std::string drive = envOrEmpty("HOMEDRIVE");
        std::string path = envOrEmpty("HOMEPATH");
        if (!drive.empty() && !path.empty()) {
            home = drive + path;
        }
    }
    if (home.empty()) {
        throw NotFoundError("cannot determine the home directory from the environment");
    }

    HostEnvironment host = forHome(home, os);
    switch (os) {
        case OsFamily::WINDOWS: {
            std::string appData = envOrEmpty("APPDATA");
            std::string localAppData = envOrEmpty("LOCALAPPDATA");
            if (!appData.empty()) host.appData = appData;
            if (!localAppData.empty()) {
                host.localAppData = localAppData;
                host.cacheHome = localAppData;
            }
            break;
        }
        case OsFamily::MACOS:
            break;
        case OsFamily::LINUX: {
            std::string config = envOrEmpty("XDG_CONFIG_HOME");
            std::string cache = envOrEmpty("XDG_CACHE_HOME");
            if (!config.empty()) host.appData = config;
            if (!cache.empty()) host.cacheHome = cache;
            break;
        }
    }
    return host;
}

// ---- Tables ----

const VariantInfo& variantInfo(EditorVariant variant) {
    return variantTable().at(editorVariantToString(variant));
}

const std::vector<RootTemplate>& rootTemplates(OsFamily os) {
    static const std::vector<RootTemplate> windowsRoots = {
        {RootKind::CONFIG,            "{appData}/{app}"},
        {RootKind::GLOBAL_STORAGE,    "{appData}/{app}/User/globalStorage"},
        {RootKind::WORKSPACE_STORAGE, "{appData}/{app}/User/workspaceStorage"},
        {RootKind::EXTENSIONS,        "{home}/{dot}/extensions"},
        {RootKind::CACHE,             "{localAppData}/{app}"},
    };
    static const std::vector<RootTemplate> macosRoots = {
        {RootKind::CONFIG,            "{appData}/{app}"},
        {RootKind::GLOBAL_STORAGE,    "{appData}/{app}/User/globalStorage"},
        {RootKind::WORKSPACE_STORAGE, "{appData}/{app}/User/workspaceStorage"},
        {RootKind::EXTENSIONS,        "{home}/{dot}/extensions"},
        {RootKind::CACHE,             "{cacheHome}/{app}"},
        {RootKind::LOGS,              "{home}/Library/Logs/{app}"},
    };
    static const std::vector<RootTemplate> linuxRoots = {
        {RootKind::CONFIG,            "{appData}/{app}"},
        {RootKind::GLOBAL_STORAGE,    "{appData}/{app}/User/globalStorage"},
        {RootKind::WORKSPACE_STORAGE, "{appData}/{app}/User/workspaceStorage"},
        {RootKind::EXTENSIONS,        "{home}/{dot}/extensions"},
        {RootKind::CACHE,             "{cacheHome}/{app}"},
    };

    switch (os) {
        case OsFamily::WINDOWS: return windowsRoots;
        case OsFamily::MACOS:   return macosRoots;
        case OsFamily::LINUX:   return linuxRoots;
    }
    return linuxRoots;
}

json RootChild::toJson() const {
    return json{{"name", name}, {"isDirectory", isDirectory}, {"items", itemCount}};
}

// ---- EnvironmentLocator ----

EnvironmentLocator::EnvironmentLocator(HostEnvironment host) : host_(std::move(host)) {}

fs::path EnvironmentLocator::expand(const std::string& pattern, EditorVariant variant) const {
    const VariantInfo& info = variantInfo(variant);
    const std::vector<std::pair<std::string, fs::path>> tokens = {
        {"{appData}", host_.appData},
        {"{localAppData}", host_.localAppData},
        {"{home}", host_.home},
        {"{cacheHome}", host_.cacheHome},
        {"{app}", info.appFolder},
        {"{dot}", info.dotFolder},
    };

    std::string out = pattern;
    for (const auto& [token, value] : tokens) {
        if (out.find(token) == std::string::npos) {
            continue;
        }
        if (value.empty()) {
            return {}; // host fact not available on this OS
        }
        replaceAll(out, token, value.generic_string());
    }
    return fs::path(out).lexically_normal();
}

std::vector<EnvironmentRoot> EnvironmentLocator::locate(EditorVariant variant, OsFamily os) const {
    std::vector<EnvironmentRoot> roots;
    for (const auto& tmpl : rootTemplates(os)) {
        fs::path path = expand(tmpl.pattern, variant);
        if (path.empty() || !isReadableDirectory(path)) {
            continue;
        }

        EnvironmentRoot root;
        root.editorVariant = variant;
        root.osFamily = os;
        root.kind = tmpl.kind;
        root.rootPath = canonicalPath(path);
        root.exists = true;
        root.label = variantInfo(variant).appFolder;
        roots.push_back(std::move(root));
    }
    return roots;
}

std::vector<EnvironmentRoot> EnvironmentLocator::locate(const std::string& variant,
                                                        const std::string& os) const {
    auto v = parseEditorVariant(variant);
    auto o = parseOsFamily(os);
    if (!v || !o) {
        return {};
    }
    return locate(*v, *o);
}

std::vector<EnvironmentRoot> EnvironmentLocator::locateAll(OsFamily os) const {
    std::vector<EnvironmentRoot> all;
    std::set<std::string> seen;
    for (EditorVariant variant : allEditorVariants()) {
        for (auto& root : locate(variant, os)) {
            if (seen.insert(root.rootPath.generic_string()).second) {
                all.push_back(std::move(root));
            }
        }
    }
    return all;
}

std::optional<EnvironmentRoot> EnvironmentLocator::locateAugmentHome(OsFamily os) const {
    if (host_.home.empty()) {
        return std::nullopt;
    }
    fs::path path = host_.home / ".augment";
    if (!isReadableDirectory(path)) {
        return std::nullopt;
    }
    return EnvironmentRoot::forPath(path, RootKind::AUGMENT_HOME, os);
}

std::vector<EnvironmentRoot> EnvironmentLocator::discover(OsFamily os) const {
    std::vector<fs::path> candidates;
    std::error_code ec;

    if (isReadableDirectory(host_.appData)) {
        for (fs::directory_iterator it(host_.appData, ec), end; !ec && it != end; it.increment(ec)) {
            candidates.push_back(it->path());
        }
    }

    // Windows installs under %LOCALAPPDATA%\Programs keep their data in
    // %APPDATA% under the program name, sometimes with spaces removed
    if (os == OsFamily::WINDOWS && isReadableDirectory(host_.localAppData / "Programs")) {
        ec.clear();
        for (fs::directory_iterator it(host_.localAppData / "Programs", ec), end;
             !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            std::string compact = name;
            compact.erase(std::remove(compact.begin(), compact.end(), ' '), compact.end());
            candidates.push_back(host_.appData / name);
            candidates.push_back(host_.appData / compact);
        }
    }

    std::vector<EnvironmentRoot> found;
    std::set<std::string> seen;
    for (const auto& candidate : candidates) {
        std::string name = candidate.filename().string();
        if (isKnownAppFolder(name) || !isReadableDirectory(candidate / "User" / "globalStorage")) {
            continue;
        }
        EnvironmentRoot root;
        root.editorVariant = EditorVariant::GENERIC_OSS;
        root.osFamily = os;
        root.kind = RootKind::CONFIG;
        root.rootPath = canonicalPath(candidate);
        root.exists = true;
        root.label = name;
        if (seen.insert(root.rootPath.generic_string()).second) {
            found.push_back(std::move(root));
        }
    }

    std::sort(found.begin(), found.end(), [](const EnvironmentRoot& a, const EnvironmentRoot& b) {
        return a.rootPath < b.rootPath;
    });
    return found;
}

std::vector<RootChild> EnvironmentLocator::describe(const EnvironmentRoot& root) const {
    std::vector<RootChild> children;
    std::error_code ec;
    for (fs::directory_iterator it(root.rootPath, ec), end; !ec && it != end; it.increment(ec)) {
        RootChild child;
        child.name = it->path().filename().string();
        std::error_code typeError;
        child.isDirectory = it->is_directory(typeError) && !it->is_symlink(typeError);
        child.itemCount = child.isDirectory ? countItems(it->path()) : 1;
        children.push_back(std::move(child));
    }
    std::sort(children.begin(), children.end(),
              [](const RootChild& a, const RootChild& b) { return a.name < b.name; });
    return children;
}

} // namespace augsweep
