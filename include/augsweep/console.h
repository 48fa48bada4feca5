// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output for cleanup runs.
//
// Every component that reports progress takes an OutputHandler. The terminal
// implementation uses ANSI colors; the silent one is used by tests, worker
// threads and JSON output mode.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "augsweep/export.h"
#include "augsweep/types.h"

namespace augsweep {

using json = nlohmann::json;

/// Abstract output handler interface.
class AUGSWEEP_API OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // === Run Progress ===
    virtual void printRootStart(const EnvironmentRoot& root, bool dryRun) = 0;
    virtual void printStateInfo(const std::string& message) = 0;
    virtual void printItem(const ItemStatus& item) = 0;
    virtual void printOperation(const OperationStatus& op) = 0;
    virtual void printSummary(const CleanupResult& result) = 0;
    virtual void prettyPrintJson(const json& data, const std::string& title = "") = 0;

    // === Status Messages ===
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    // === Progress Indicators ===
    virtual void startProgress(const std::string& message) = 0;
    virtual void stopProgress() = 0;

    // === Optional Methods (default no-op) ===
    virtual void printHeader(const std::string& /*text*/) {}
    virtual void printSeparator(int /*length*/ = 50) {}
};

/// Terminal console with ANSI color output.
class AUGSWEEP_API TerminalConsole : public OutputHandler {
public:
    /// @param verbose Print every item, not only skipped and failed ones.
    explicit TerminalConsole(bool verbose = false) : verbose_(verbose) {}

    void printRootStart(const EnvironmentRoot& root, bool dryRun) override;
    void printStateInfo(const std::string& message) override;
    void printItem(const ItemStatus& item) override;
    void printOperation(const OperationStatus& op) override;
    void printSummary(const CleanupResult& result) override;
    void prettyPrintJson(const json& data, const std::string& title = "") override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void startProgress(const std::string& message) override;
    void stopProgress() override;
    void printHeader(const std::string& text) override;
    void printSeparator(int length = 50) override;

private:
    bool verbose_;

    // ANSI color codes
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* BOLD    = "\033[1m";
    static constexpr const char* DIM     = "\033[90m";
    static constexpr const char* RED     = "\033[91m";
    static constexpr const char* GREEN   = "\033[92m";
    static constexpr const char* YELLOW  = "\033[93m";
    static constexpr const char* BLUE    = "\033[94m";
    static constexpr const char* CYAN    = "\033[96m";
};

/// Silent console that suppresses all output.
/// Used for testing, parallel workers and JSON-only operation.
class AUGSWEEP_API SilentConsole : public OutputHandler {
public:
    explicit SilentConsole(bool silenceSummary = true)
        : silenceSummary_(silenceSummary) {}

    void printRootStart(const EnvironmentRoot&, bool) override {}
    void printStateInfo(const std::string&) override {}
    void printItem(const ItemStatus&) override {}
    void printOperation(const OperationStatus&) override {}
    void printSummary(const CleanupResult& result) override;
    void prettyPrintJson(const json&, const std::string&) override {}
    void printError(const std::string&) override {}
    void printWarning(const std::string&) override {}
    void printInfo(const std::string&) override {}
    void startProgress(const std::string&) override {}
    void stopProgress() override {}

private:
    bool silenceSummary_;
};

} // namespace augsweep
