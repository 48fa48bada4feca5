// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/config.h>
#include <augsweep/scanner.h>

#include <algorithm>
#include <map>

#include "test_helpers.h"

using namespace augsweep;
using augsweep::test::TempDir;

class ScannerTest : public ::testing::Test {
protected:
    TempDir dir;

    EnvironmentRoot rootOf(RootKind kind) const {
        return EnvironmentRoot::forPath(dir.path(), kind, OsFamily::LINUX);
    }

    // Relative path -> entry, for order-independent assertions
    std::map<std::string, FileEntry> byPath(const std::vector<FileEntry>& entries) const {
        std::map<std::string, FileEntry> out;
        for (const auto& e : entries) {
            out[e.path.lexically_relative(canonicalPath(dir.path())).generic_string()] = e;
        }
        return out;
    }
};

// ---- ScanScope ----

TEST(ScanScopeTest, WholeRoot) {
    ScanScope scope;
    EXPECT_TRUE(scope.isWholeRoot());
    EXPECT_EQ(scope.matchDirectory("anything/deep"), ScanScope::Match::INSIDE);
    EXPECT_TRUE(scope.containsFile("a/b.txt"));
}

TEST(ScanScopeTest, NestedPatterns) {
    ScanScope scope;
    scope.patterns = {"*/*augment*"};
    EXPECT_EQ(scope.matchDirectory("ws1"), ScanScope::Match::PARTIAL);
    EXPECT_EQ(scope.matchDirectory("ws1/Augment.vscode-augment"), ScanScope::Match::INSIDE);
    EXPECT_EQ(scope.matchDirectory("ws1/other"), ScanScope::Match::NONE);
    EXPECT_FALSE(scope.containsFile("ws1/state.vscdb"));
    EXPECT_TRUE(scope.containsFile("ws1/augment.x/data.json"));
}

TEST(ScanScopeTest, MultiSegmentLiteral) {
    ScanScope scope;
    scope.patterns = {"User/logs"};
    EXPECT_EQ(scope.matchDirectory("User"), ScanScope::Match::PARTIAL);
    EXPECT_EQ(scope.matchDirectory("user/LOGS/x"), ScanScope::Match::INSIDE);
    EXPECT_EQ(scope.matchDirectory("User/globalStorage"), ScanScope::Match::NONE);
}

// ---- Kind inference ----

TEST(InferKindTest, Priorities) {
    EXPECT_EQ(inferKind("ws/state.json", RootKind::WORKSPACE_STORAGE), EntryKind::WORKSPACE_STORAGE);
    EXPECT_EQ(inferKind("augment.augment-1.0/package.json", RootKind::EXTENSIONS),
              EntryKind::EXTENSION_CACHE);
    EXPECT_EQ(inferKind("CachedExtensionVSIXs/a.vsix", RootKind::CONFIG), EntryKind::EXTENSION_CACHE);
    EXPECT_EQ(inferKind("augment/chat-history/1.json", RootKind::GLOBAL_STORAGE),
              EntryKind::CHAT_HISTORY);
    EXPECT_EQ(inferKind("logs/20240101/main.txt", RootKind::CONFIG), EntryKind::LOG);
    EXPECT_EQ(inferKind("renderer.log", RootKind::AUGMENT_HOME), EntryKind::LOG);
    EXPECT_EQ(inferKind("x/upload.tmp", RootKind::AUGMENT_HOME), EntryKind::TEMP_FILE);
    EXPECT_EQ(inferKind("GPUCache/data_0", RootKind::CONFIG), EntryKind::CACHE);
    EXPECT_EQ(inferKind("anything", RootKind::CACHE), EntryKind::CACHE);
    EXPECT_EQ(inferKind("state/agent.json", RootKind::AUGMENT_HOME), EntryKind::CONFIG);
    EXPECT_EQ(inferKind("blob.bin", RootKind::AUGMENT_HOME), EntryKind::UNKNOWN);
}

// ---- Default scopes ----

TEST(DefaultScopeTest, PerRootKind) {
    CleanerConfig config;
    EXPECT_TRUE(defaultScopeFor(RootKind::AUGMENT_HOME, config).isWholeRoot());
    EXPECT_TRUE(defaultScopeFor(RootKind::CACHE, config).isWholeRoot());

    ScanScope global = defaultScopeFor(RootKind::GLOBAL_STORAGE, config);
    EXPECT_EQ(global.matchDirectory("augmentcode.augment"), ScanScope::Match::INSIDE);
    EXPECT_EQ(global.matchDirectory("ms-python.python"), ScanScope::Match::NONE);
    EXPECT_FALSE(global.containsFile("storage.json"));

    ScanScope extensions = defaultScopeFor(RootKind::EXTENSIONS, config);
    EXPECT_EQ(extensions.matchDirectory("augment.vscode-augment-0.400.0"), ScanScope::Match::INSIDE);
    EXPECT_EQ(extensions.matchDirectory("ms-python.python-2024.1"), ScanScope::Match::NONE);
}

// ---- ScanStream ----

TEST_F(ScannerTest, ClassifiesFiles) {
    dir.writeSized("a.log", 50);
    dir.writeSized("sub/b.bin", 1000);
    dir.write("settings.json", "{}");
    dir.write("sub/storage.json", "{}");

    auto entries = byPath(scan(rootOf(RootKind::AUGMENT_HOME), PreservationSet()));
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries["a.log"].classification, Classification::REMOVABLE);
    EXPECT_EQ(entries["a.log"].sizeBytes, 50u);
    EXPECT_EQ(entries["sub/b.bin"].sizeBytes, 1000u);
    EXPECT_EQ(entries["settings.json"].classification, Classification::PRESERVE);
    EXPECT_EQ(entries["sub/storage.json"].classification, Classification::PRESERVE); // essential
}

TEST_F(ScannerTest, PreservationPatternsApply) {
    dir.write("binaries/agent", "bin");
    dir.write("cache/x", "c");

    auto entries = byPath(scan(rootOf(RootKind::AUGMENT_HOME), PreservationSet({"binaries"})));
    EXPECT_EQ(entries["binaries/agent"].classification, Classification::PRESERVE);
    EXPECT_EQ(entries["cache/x"].classification, Classification::REMOVABLE);
}

TEST_F(ScannerTest, ScopeLimitsWalk) {
    dir.write("augmentcode.augment/state.bin", "s");
    dir.write("ms-python.python/state.bin", "p");
    dir.write("storage.json", "{}");

    CleanerConfig config;
    ScanOptions options;
    options.scope = defaultScopeFor(RootKind::GLOBAL_STORAGE, config);

    auto entries = byPath(scan(rootOf(RootKind::GLOBAL_STORAGE), PreservationSet(), options));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.count("augmentcode.augment/state.bin"), 1u);
}

TEST_F(ScannerTest, SymlinksAreNotFollowed) {
    TempDir outside;
    outside.writeSized("big.bin", 4096);
    outside.write("inner/file", "x");
    fs::create_symlink(outside / "big.bin", dir / "link.bin");
    fs::create_directory_symlink(outside / "inner", dir / "linkdir");
    dir.write("local.txt", "x");
    fs::create_symlink(dir / "local.txt", dir / "inside-link");

    auto entries = byPath(scan(rootOf(RootKind::AUGMENT_HOME), PreservationSet::none()));
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_TRUE(entries["link.bin"].isSymlink);
    EXPECT_TRUE(entries["link.bin"].escapesRoot);
    EXPECT_EQ(entries["link.bin"].sizeBytes, 0u);
    EXPECT_EQ(entries["link.bin"].classification, Classification::PRESERVE);

    EXPECT_TRUE(entries["linkdir"].escapesRoot);
    EXPECT_EQ(entries.count("linkdir/file"), 0u);

    EXPECT_FALSE(entries["inside-link"].escapesRoot);
    EXPECT_EQ(entries["inside-link"].classification, Classification::REMOVABLE);
}

TEST_F(ScannerTest, MaxDepthStopsDescent) {
    dir.write("a/b/c/d/deep.txt", "x");
    dir.write("a/shallow.txt", "x");

    ScanOptions options;
    options.maxDepth = 2;
    auto entries = byPath(scan(rootOf(RootKind::AUGMENT_HOME), PreservationSet::none(), options));
    EXPECT_EQ(entries.count("a/shallow.txt"), 1u);
    EXPECT_EQ(entries.count("a/b/c/d/deep.txt"), 0u);
}

TEST_F(ScannerTest, StreamIsLazyAndRestartable) {
    dir.write("one", "1");
    dir.write("two", "2");

    ScanStream stream(rootOf(RootKind::AUGMENT_HOME), PreservationSet::none());
    ASSERT_TRUE(stream.next().has_value());
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());

    stream.reset();
    size_t count = 0;
    while (stream.next()) ++count;
    EXPECT_EQ(count, 2u);
}

TEST_F(ScannerTest, MissingRootYieldsNothing) {
    EnvironmentRoot root = EnvironmentRoot::forPath(dir / "missing");
    ScanStream stream(root, PreservationSet());
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_TRUE(static_cast<bool>(stream.lastError()));
}
