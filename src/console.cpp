// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/console.h"

#include <iostream>

namespace augsweep {

// ---- TerminalConsole ----

void TerminalConsole::printRootStart(const EnvironmentRoot& root, bool dryRun) {
    std::cout << "\n" << BOLD << CYAN << (dryRun ? "Scanning (dry run)" : "Cleaning") << RESET
              << ": " << root.rootPath.string() << "\n";
    std::cout << DIM << "Kind: " << rootKindToString(root.kind);
    if (root.editorVariant) {
        std::cout << " | Editor: " << editorVariantToString(*root.editorVariant);
    }
    std::cout << " | OS: " << osFamilyToString(root.osFamily) << RESET << "\n";
}

void TerminalConsole::printStateInfo(const std::string& message) {
    std::cout << DIM << "[" << message << "]" << RESET << "\n";
}

void TerminalConsole::printItem(const ItemStatus& item) {
    switch (item.outcome) {
        case Outcome::FAILED:
            std::cout << RED << "  failed    " << RESET << item.path.string();
            if (item.error) std::cout << DIM << " (" << *item.error << ")" << RESET;
            std::cout << "\n";
            return;
        case Outcome::SKIPPED:
            std::cout << YELLOW << "  skipped   " << RESET << item.path.string();
            if (item.error) std::cout << DIM << " (" << *item.error << ")" << RESET;
            std::cout << "\n";
            return;
        case Outcome::REMOVED:
            if (verbose_) {
                std::cout << GREEN << "  removed   " << RESET << item.path.string() << DIM
                          << " " << item.sizeBytes << " B" << RESET << "\n";
            }
            return;
        case Outcome::PRESERVED:
            if (verbose_) {
                std::cout << DIM << "  preserved " << item.path.string() << RESET << "\n";
            }
            return;
    }
}

void TerminalConsole::printOperation(const OperationStatus& op) {
    const char* color = DIM;
    switch (op.outcome) {
        case OperationOutcome::APPLIED: color = GREEN; break;
        case OperationOutcome::PLANNED: color = BLUE; break;
        case OperationOutcome::SKIPPED: color = DIM; break;
        case OperationOutcome::FAILED:  color = RED; break;
    }
    std::cout << YELLOW << "Operation: " << BOLD << op.name << RESET << " " << op.target.string()
              << " " << color << operationOutcomeToString(op.outcome) << RESET;
    if (!op.detail.empty()) {
        std::cout << DIM << " - " << op.detail << RESET;
    }
    std::cout << "\n";
    if (op.error) {
        std::cout << RED << "  " << *op.error << RESET << "\n";
    }
}

void TerminalConsole::printSummary(const CleanupResult& result) {
    const char* color = result.hasFailures() ? YELLOW : GREEN;
    std::cout << "\n" << BOLD << color << executorStateToString(result.state) << RESET << "\n";
    std::cout << result.toReport();
}

void TerminalConsole::prettyPrintJson(const json& data, const std::string& title) {
    if (!title.empty()) {
        std::cout << DIM << title << ":" << RESET << "\n";
    }
    // Store keys and paths are raw bytes and need not be valid UTF-8
    std::cout << data.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cout << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << BLUE << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::startProgress(const std::string& message) {
    std::cout << DIM << message << "..." << RESET << std::flush;
}

void TerminalConsole::stopProgress() {
    std::cout << "\n";
}

void TerminalConsole::printHeader(const std::string& text) {
    std::cout << "\n" << BOLD << text << RESET << "\n";
}

void TerminalConsole::printSeparator(int length) {
    std::cout << std::string(static_cast<size_t>(length), '-') << "\n";
}

// ---- SilentConsole ----

void SilentConsole::printSummary(const CleanupResult& result) {
    if (!silenceSummary_) {
        std::cout << result.toReport();
    }
}

} // namespace augsweep
