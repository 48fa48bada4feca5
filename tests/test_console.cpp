// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/console.h>

#include <sstream>

using namespace augsweep;

namespace {

/// Redirects std::cout for the lifetime of the object.
class CaptureStdout {
public:
    CaptureStdout() : old_(std::cout.rdbuf(captured_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(old_); }
    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

CleanupResult sampleResult() {
    CleanupResult result;
    result.root.rootPath = "/home/user/.augment";
    result.root.kind = RootKind::AUGMENT_HOME;
    result.state = ExecutorState::COMPLETED;
    result.totalScanned = 3;
    result.totalRemoved = 2;
    result.preservedCount = 1;
    result.bytesFreed = 1200;
    return result;
}

} // namespace

// ---- SilentConsole Tests ----

TEST(ConsoleTest, SilentConsoleNoOutput) {
    CaptureStdout capture;
    SilentConsole console(true);

    EnvironmentRoot root;
    root.rootPath = "/tmp/root";
    console.printRootStart(root, true);
    console.printStateInfo("SCANNING");
    console.printItem(ItemStatus{});
    console.printOperation(OperationStatus{});
    console.printSummary(sampleResult());
    console.prettyPrintJson(json::object(), "title");
    console.printError("error");
    console.printWarning("warning");
    console.printInfo("info");
    console.startProgress("progress");
    console.stopProgress();
    console.printHeader("header");
    console.printSeparator();

    EXPECT_TRUE(capture.str().empty());
}

TEST(ConsoleTest, SilentConsoleSummaryShown) {
    CaptureStdout capture;
    SilentConsole console(false);
    console.printSummary(sampleResult());
    EXPECT_NE(capture.str().find("Cleanup of /home/user/.augment"), std::string::npos);
}

// ---- TerminalConsole Tests ----

TEST(ConsoleTest, TerminalConsoleRootStart) {
    CaptureStdout capture;
    TerminalConsole console;

    EnvironmentRoot root;
    root.rootPath = "/home/user/.config/Cursor";
    root.kind = RootKind::CONFIG;
    root.editorVariant = EditorVariant::CURSOR;
    console.printRootStart(root, true);

    std::string out = capture.str();
    EXPECT_NE(out.find("dry run"), std::string::npos);
    EXPECT_NE(out.find("cursor"), std::string::npos);
    EXPECT_NE(out.find("/home/user/.config/Cursor"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleHidesRemovedItemsUnlessVerbose) {
    ItemStatus removed;
    removed.path = "/root/a.log";
    removed.outcome = Outcome::REMOVED;

    {
        CaptureStdout capture;
        TerminalConsole quiet(false);
        quiet.printItem(removed);
        EXPECT_TRUE(capture.str().empty());
    }
    {
        CaptureStdout capture;
        TerminalConsole verbose(true);
        verbose.printItem(removed);
        EXPECT_NE(capture.str().find("/root/a.log"), std::string::npos);
    }
}

TEST(ConsoleTest, TerminalConsoleAlwaysShowsFailures) {
    CaptureStdout capture;
    TerminalConsole console(false);

    ItemStatus failed;
    failed.path = "/root/locked.db";
    failed.outcome = Outcome::FAILED;
    failed.error = "PermissionError: denied";
    console.printItem(failed);

    std::string out = capture.str();
    EXPECT_NE(out.find("failed"), std::string::npos);
    EXPECT_NE(out.find("PermissionError: denied"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleOperation) {
    CaptureStdout capture;
    TerminalConsole console;

    OperationStatus op;
    op.name = "store";
    op.target = "/g/state.vscdb";
    op.outcome = OperationOutcome::APPLIED;
    op.detail = "3 rows removed";
    console.printOperation(op);

    std::string out = capture.str();
    EXPECT_NE(out.find("store"), std::string::npos);
    EXPECT_NE(out.find("3 rows removed"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleSummaryIncludesState) {
    CaptureStdout capture;
    TerminalConsole console;
    console.printSummary(sampleResult());
    EXPECT_NE(capture.str().find("COMPLETED"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleMessages) {
    CaptureStdout capture;
    TerminalConsole console;
    console.printError("boom");
    console.printWarning("careful");
    console.printInfo("fyi");
    console.prettyPrintJson(json{{"k", 1}}, "Data");

    std::string out = capture.str();
    EXPECT_NE(out.find("ERROR: "), std::string::npos);
    EXPECT_NE(out.find("WARNING: "), std::string::npos);
    EXPECT_NE(out.find("INFO: "), std::string::npos);
    EXPECT_NE(out.find("\"k\": 1"), std::string::npos);
}

TEST(ConsoleTest, PrettyPrintReplacesInvalidUtf8) {
    StoreCleanResult result;
    result.dbPath = "/tmp/state.vscdb";
    result.rowsRemoved = 1;
    result.tablesCleaned = {"ItemTable"};
    result.removedKeys = {std::string("\xFF") + "augment"};

    CaptureStdout capture;
    TerminalConsole console;
    EXPECT_NO_THROW(console.prettyPrintJson(result.toJson()));

    std::string out = capture.str();
    EXPECT_NE(out.find("\xEF\xBF\xBD" "augment"), std::string::npos);
    EXPECT_NE(out.find("\"rowsRemoved\": 1"), std::string::npos);
}

TEST(ConsoleTest, PolymorphicOwnership) {
    std::unique_ptr<OutputHandler> handler = std::make_unique<SilentConsole>();
    handler->printInfo("ignored");
    handler = std::make_unique<TerminalConsole>();
    EXPECT_NE(handler.get(), nullptr);
}
