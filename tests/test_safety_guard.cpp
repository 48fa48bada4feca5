// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/errors.h>
#include <augsweep/safety_guard.h>

#include <random>

#include "test_helpers.h"

using namespace augsweep;
using augsweep::test::TempDir;

class SafetyGuardTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path home;
    fs::path root;

    void SetUp() override {
        home = dir.mkdir("home");
        root = dir.mkdir("home/.config/Code");
    }

    SafetyGuard guard(PreservationSet preservation = PreservationSet()) const {
        return SafetyGuard(ProtectedPathList::defaults(OsFamily::LINUX, home), std::move(preservation));
    }
};

// ---- ProtectedPathList ----

TEST_F(SafetyGuardTest, DefaultsProtectHomeExactly) {
    auto list = ProtectedPathList::defaults(OsFamily::LINUX, home);
    EXPECT_TRUE(list.isProtected(canonicalPath(home)));
    EXPECT_FALSE(list.isProtected(canonicalPath(root / "logs")));
    EXPECT_TRUE(list.isProtected(canonicalPath(home / "Documents/report.txt")));
}

TEST_F(SafetyGuardTest, DefaultsProtectSystemDirectories) {
    auto list = ProtectedPathList::defaults(OsFamily::LINUX, home);
    EXPECT_TRUE(list.isProtected("/"));
    EXPECT_TRUE(list.isProtected("/etc/passwd"));
    EXPECT_TRUE(list.isProtected("/usr/lib/libc.so"));
}

TEST_F(SafetyGuardTest, AncestorOfEntryIsProtected) {
    ProtectedPathList list(home);
    list.add(root / "keep", ProtectionMode::EXACT);
    EXPECT_TRUE(list.isProtected(canonicalPath(root)));
    EXPECT_TRUE(list.isProtected(canonicalPath(root / "keep")));
    EXPECT_FALSE(list.isProtected(canonicalPath(root / "keep/inner")));
}

TEST_F(SafetyGuardTest, SubtreeAncestorOfHomeDowngradedToExact) {
    ProtectedPathList list(home);
    list.add(dir.path(), ProtectionMode::SUBTREE);
    ASSERT_EQ(list.entries().size(), 1u);
    EXPECT_EQ(list.entries()[0].mode, ProtectionMode::EXACT);
}

TEST_F(SafetyGuardTest, RelativeEntriesResolveAgainstHome) {
    ProtectedPathList list(home);
    list.add("projects");
    ASSERT_EQ(list.entries().size(), 1u);
    EXPECT_TRUE(pathEquals(list.entries()[0].path, canonicalPath(home / "projects")));

    ProtectedPathList homeless;
    homeless.add("projects");
    EXPECT_TRUE(homeless.entries().empty());
}

TEST_F(SafetyGuardTest, DuplicateEntriesMerged) {
    ProtectedPathList list(home);
    list.add("/srv/data", ProtectionMode::EXACT);
    list.add("/srv/data/", ProtectionMode::SUBTREE);
    ASSERT_EQ(list.entries().size(), 1u);
    EXPECT_EQ(list.entries()[0].mode, ProtectionMode::SUBTREE);
}

TEST_F(SafetyGuardTest, WindowsDefaultsKeptLexicallyOnPosix) {
    auto list = ProtectedPathList::defaults(OsFamily::WINDOWS, "");
    EXPECT_TRUE(list.isProtected("C:/Windows/System32"));
    EXPECT_EQ(list.toJson().size(), list.entries().size());
}

// ---- SafetyGuard ----

TEST_F(SafetyGuardTest, FileInsideRootIsSafe) {
    fs::path file = dir.write("home/.config/Code/logs/main.log", "x");
    SafetyCheck result = guard().check(file, root);
    EXPECT_TRUE(result.ok()) << result.reason;
}

TEST_F(SafetyGuardTest, RootItselfIsNotSafe) {
    EXPECT_EQ(guard().check(root, root).verdict, SafetyVerdict::OUTSIDE_ROOT);
}

TEST_F(SafetyGuardTest, TraversalOutOfRoot) {
    SafetyCheck result = guard().check(root / "../../../etc/passwd", root);
    EXPECT_EQ(result.verdict, SafetyVerdict::OUTSIDE_ROOT);
    EXPECT_EQ(result.reason.rfind("PathOutsideRoot", 0), 0u);
}

TEST_F(SafetyGuardTest, SymlinkEscapingRootIsRejected) {
    fs::path outside = dir.write("outside/secret.txt", "s");
    fs::create_symlink(outside, root / "link.txt");

    SafetyCheck result = guard().check(root / "link.txt", root);
    EXPECT_EQ(result.verdict, SafetyVerdict::OUTSIDE_ROOT);
    EXPECT_NE(result.reason.find("resolves to"), std::string::npos);
}

TEST_F(SafetyGuardTest, ProtectedInsideRoot) {
    fs::path keep = dir.write("home/.config/Code/keep/data.bin", "k");
    ProtectedPathList list(home);
    list.add(root / "keep", ProtectionMode::SUBTREE);
    SafetyGuard g(list, PreservationSet::none());

    SafetyCheck result = g.check(keep, root);
    EXPECT_EQ(result.verdict, SafetyVerdict::PROTECTED);
    EXPECT_EQ(result.reason.rfind("ProtectedPathError", 0), 0u);
}

TEST_F(SafetyGuardTest, PreservationWins) {
    fs::path settings = dir.write("home/.config/Code/User/settings.json", "{}");
    SafetyCheck result = guard().check(settings, root);
    EXPECT_EQ(result.verdict, SafetyVerdict::PRESERVED);
    EXPECT_EQ(result.reason, "preserved: User/settings.json");
}

TEST_F(SafetyGuardTest, RequireThrowsTypedErrors) {
    SafetyGuard g = guard();
    EXPECT_THROW(g.require(root / "../x", root), PathOutsideRootError);
    fs::path settings = dir.write("home/.config/Code/settings.json", "{}");
    EXPECT_THROW(g.require(settings, root), ProtectedPathError);
    EXPECT_NO_THROW(g.require(dir.write("home/.config/Code/a.log", "x"), root));
}

TEST_F(SafetyGuardTest, EmptyInputsRejected) {
    EXPECT_FALSE(guard().isSafe("", root));
    EXPECT_FALSE(guard().isSafe(root / "a", ""));
}

TEST_F(SafetyGuardTest, RandomSiblingsAndAncestorsNeverSafe) {
    std::mt19937 rng(1234);
    const std::string alphabet = "abcdefghijklmnopqrstuvwxyz._-";
    auto randomName = [&]() {
        std::uniform_int_distribution<size_t> len(1, 12);
        std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
        std::string s;
        for (size_t i = len(rng); i > 0; --i) s += alphabet[pick(rng)];
        if (s == "." || s == "..") s = "x" + s;
        return s;
    };

    SafetyGuard g = guard(PreservationSet::none());
    std::vector<fs::path> ancestors;
    for (fs::path p = root; p.has_relative_path(); p = p.parent_path()) {
        ancestors.push_back(p);
    }

    for (int i = 0; i < 200; ++i) {
        // Siblings of the root, including prefix lookalikes such as "Code-old"
        fs::path sibling = root.parent_path() / (root.filename().string() + randomName());
        EXPECT_FALSE(g.isSafe(sibling / randomName(), root)) << sibling;
        EXPECT_FALSE(g.isSafe(root.parent_path() / randomName(), root));

        // Every ancestor of the root, and paths that climb back out
        const fs::path& ancestor = ancestors[static_cast<size_t>(i) % ancestors.size()];
        EXPECT_FALSE(g.isSafe(ancestor, root)) << ancestor;
        EXPECT_FALSE(g.isSafe(root / randomName() / ".." / ".." / randomName(), root));
    }
}
