// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cleanup executor: the state machine that runs one cleanup over a root.
//
//   IDLE -> SCANNING -> VALIDATING -> APPLYING -> COMPLETED | PARTIALLY_FAILED
//
// File removal is best effort: a failed item is recorded and the run goes
// on. The per-root telemetry rewrite and store clean are separate
// operations with their own outcomes. Partial failure is reported through
// the terminal state, never thrown.

#pragma once

#include <memory>
#include <vector>

#include "augsweep/config.h"
#include "augsweep/console.h"
#include "augsweep/export.h"
#include "augsweep/preservation.h"
#include "augsweep/safety_guard.h"
#include "augsweep/scanner.h"
#include "augsweep/store_cleaner.h"
#include "augsweep/types.h"

namespace augsweep {

class AUGSWEEP_API CleanupExecutor {
public:
    /// @throws ParseError if the config activates an undefined key pattern group
    /// @throws std::invalid_argument if a configured store table name is invalid
    explicit CleanupExecutor(ProtectedPathList denyList, CleanerConfig config = {});

    // Non-copyable
    CleanupExecutor(const CleanupExecutor&) = delete;
    CleanupExecutor& operator=(const CleanupExecutor&) = delete;

    /// Scan a root and remove what is removable.
    ///
    /// In dry-run mode the run stops after VALIDATING: outcomes are what would
    /// happen and operations are reported as planned.
    ///
    /// @throws std::invalid_argument if the root path is empty or not a directory
    CleanupResult execute(const EnvironmentRoot& root, const PreservationSet& preservation,
                          bool dryRun);

    /// Remove a caller-built list of files under a root. Relative manifest
    /// paths are taken relative to the root. No telemetry or store
    /// operations run.
    ///
    /// @throws std::invalid_argument if the root path is empty or not a directory
    CleanupResult apply(const EnvironmentRoot& root, const std::vector<fs::path>& manifest,
                        const PreservationSet& preservation, bool dryRun);

    /// Run execute() for several roots. With config.parallel, roots run on up
    /// to config.maxWorkers worker threads, each with its own pipeline; results
    /// are reported after all workers finish, in input order.
    std::vector<CleanupResult> executeAll(const std::vector<EnvironmentRoot>& roots,
                                          const PreservationSet& preservation, bool dryRun);

    /// Only the per-root telemetry and store operations, honoring the
    /// config toggles. No files are scanned or removed.
    /// @throws std::invalid_argument if the root path is empty or not a directory
    std::vector<OperationStatus> runRootOperations(const EnvironmentRoot& root,
                                                   const PreservationSet& preservation,
                                                   bool dryRun);

    ExecutorState state() const { return state_; }

    /// States visited by the last run, starting with IDLE.
    const std::vector<ExecutorState>& history() const { return history_; }

    const CleanerConfig& config() const { return config_; }
    const ProtectedPathList& denyList() const { return denyList_; }

    OutputHandler& console() { return *console_; }

    /// Set a custom output handler. The default is a SilentConsole.
    void setOutputHandler(std::unique_ptr<OutputHandler> handler);

private:
    struct Decision {
        FileEntry entry;
        Outcome outcome = Outcome::SKIPPED;
        std::string reason;
    };

    void transition(ExecutorState next);
    void begin(const EnvironmentRoot& root, bool dryRun);

    std::vector<Decision> validate(const EnvironmentRoot& root, std::vector<FileEntry> entries,
                                   const SafetyGuard& guard);

    CleanupResult finish(const EnvironmentRoot& root, std::vector<Decision> decisions,
                         const SafetyGuard& guard, const ScanScope& scope, bool dryRun,
                         bool withOperations);

    void removeEntry(Decision& decision);
    void pruneEmptyDirectories(const fs::path& root, const std::vector<Decision>& decisions,
                               const SafetyGuard& guard, const ScanScope& scope);

    std::vector<OperationStatus> runOperations(const EnvironmentRoot& root,
                                               const SafetyGuard& guard, bool dryRun);
    OperationStatus telemetryOperation(const fs::path& target, bool dryRun);
    OperationStatus storeOperation(const fs::path& target, bool dryRun);

    void report(const CleanupResult& result);

    ProtectedPathList denyList_;
    CleanerConfig config_;
    std::vector<KeyPattern> keyPatterns_;
    StoreCleaner storeCleaner_;
    std::unique_ptr<OutputHandler> console_;

    ExecutorState state_ = ExecutorState::IDLE;
    std::vector<ExecutorState> history_;
};

} // namespace augsweep
