// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/executor.h"

#include <algorithm>
#include <future>
#include <set>
#include <stdexcept>

#include "augsweep/errors.h"
#include "augsweep/path_utils.h"
#include "augsweep/telemetry.h"

namespace augsweep {

namespace {

constexpr const char* STORAGE_JSON = "storage.json";
constexpr const char* STATE_DB = "state.vscdb";

void requireRoot(const EnvironmentRoot& root) {
    if (root.rootPath.empty()) {
        throw std::invalid_argument("cleanup root path is empty");
    }
    std::error_code ec;
    if (!fs::is_directory(root.rootPath, ec)) {
        throw std::invalid_argument("cleanup root is not a directory: " + root.rootPath.string());
    }
}

OperationStatus makeOperation(const char* name, const fs::path& target) {
    OperationStatus op;
    op.name = name;
    op.target = target;
    return op;
}

} // namespace

CleanupExecutor::CleanupExecutor(ProtectedPathList denyList, CleanerConfig config)
    : denyList_(std::move(denyList)),
      config_(std::move(config)),
      keyPatterns_(config_.activeKeyPatterns()),
      storeCleaner_(config_.storeTables),
      console_(std::make_unique<SilentConsole>()) {}

void CleanupExecutor::setOutputHandler(std::unique_ptr<OutputHandler> handler) {
    if (handler) {
        console_ = std::move(handler);
    }
}

void CleanupExecutor::transition(ExecutorState next) {
    state_ = next;
    history_.push_back(next);
    console_->printStateInfo(executorStateToString(next));
}

void CleanupExecutor::begin(const EnvironmentRoot& root, bool dryRun) {
    requireRoot(root);
    state_ = ExecutorState::IDLE;
    history_.assign(1, ExecutorState::IDLE);
    console_->printRootStart(root, dryRun);
}

// ---- Public entry points ----

CleanupResult CleanupExecutor::execute(const EnvironmentRoot& root,
                                       const PreservationSet& preservation, bool dryRun) {
    begin(root, dryRun);

    EnvironmentRoot canonicalRoot = root;
    canonicalRoot.rootPath = canonicalPath(root.rootPath);

    ScanOptions options;
    options.scope = defaultScopeFor(root.kind, config_);
    options.maxDepth = config_.maxScanDepth;

    transition(ExecutorState::SCANNING);
    console_->startProgress("Scanning " + canonicalRoot.rootPath.string());
    std::vector<FileEntry> entries = scan(canonicalRoot, preservation, options);
    console_->stopProgress();

    SafetyGuard guard(denyList_, preservation);
    transition(ExecutorState::VALIDATING);
    std::vector<Decision> decisions = validate(canonicalRoot, std::move(entries), guard);

    return finish(canonicalRoot, std::move(decisions), guard, options.scope, dryRun, true);
}

CleanupResult CleanupExecutor::apply(const EnvironmentRoot& root,
                                     const std::vector<fs::path>& manifest,
                                     const PreservationSet& preservation, bool dryRun) {
    begin(root, dryRun);

    EnvironmentRoot canonicalRoot = root;
    canonicalRoot.rootPath = canonicalPath(root.rootPath);
    ScanOptions defaults;

    transition(ExecutorState::SCANNING);
    std::vector<FileEntry> entries;
    std::vector<Decision> missing;
    for (const auto& item : manifest) {
        fs::path absolute = item.is_absolute() ? item : canonicalRoot.rootPath / item;

        FileEntry entry;
        entry.path = canonicalEntryPath(absolute);
        entry.escapesRoot = !isStrictDescendant(entry.path, canonicalRoot.rootPath) ||
                            !isStrictDescendant(canonicalPath(absolute), canonicalRoot.rootPath);

        fs::path relative = entry.path.lexically_relative(canonicalRoot.rootPath);
        if (!entry.escapesRoot) {
            entry.kind = inferKind(relative, canonicalRoot.kind);
        }

        if (entry.escapesRoot) {
            entry.classification = Classification::PRESERVE;
            entries.push_back(std::move(entry));
            continue;
        }

        std::error_code ec;
        fs::file_status status = fs::symlink_status(entry.path, ec);
        if (ec || !fs::exists(status)) {
            missing.push_back({entry, Outcome::SKIPPED,
                               errorKindToString(ErrorKind::NOT_FOUND) + ": " + entry.path.string()});
            continue;
        }
        if (!fs::is_regular_file(status) && !fs::is_symlink(status)) {
            missing.push_back({entry, Outcome::SKIPPED, "not a regular file or symlink"});
            continue;
        }

        entry.isSymlink = fs::is_symlink(status);
        if (!entry.isSymlink) {
            std::uintmax_t size = fs::file_size(entry.path, ec);
            entry.sizeBytes = ec ? 0 : size;
        }

        std::string name = entry.path.filename().string();
        bool essential = std::find(defaults.essentialFiles.begin(), defaults.essentialFiles.end(),
                                   name) != defaults.essentialFiles.end();
        entry.classification = (essential || preservation.matches(relative))
                                   ? Classification::PRESERVE
                                   : Classification::REMOVABLE;
        entries.push_back(std::move(entry));
    }

    SafetyGuard guard(denyList_, preservation);
    transition(ExecutorState::VALIDATING);
    std::vector<Decision> decisions = validate(canonicalRoot, std::move(entries), guard);
    decisions.insert(decisions.end(), missing.begin(), missing.end());

    ScanScope scope; // whole root: prune anything the manifest emptied
    return finish(canonicalRoot, std::move(decisions), guard, scope, dryRun, false);
}

std::vector<CleanupResult> CleanupExecutor::executeAll(const std::vector<EnvironmentRoot>& roots,
                                                       const PreservationSet& preservation,
                                                       bool dryRun) {
    std::vector<CleanupResult> results;
    results.reserve(roots.size());

    if (!config_.parallel || roots.size() < 2) {
        for (const auto& root : roots) {
            results.push_back(execute(root, preservation, dryRun));
        }
        return results;
    }

    // Workers own their executor, guard and scanner; only this thread
    // touches `results` and the console
    const size_t batch = static_cast<size_t>(std::max(1, config_.maxWorkers));
    for (size_t start = 0; start < roots.size(); start += batch) {
        std::vector<std::future<CleanupResult>> futures;
        size_t end = std::min(roots.size(), start + batch);
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async,
                [this, &roots, &preservation, dryRun, i]() {
                    CleanupExecutor worker(denyList_, config_);
                    return worker.execute(roots[i], preservation, dryRun);
                }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }

    console_->printHeader("Results");
    for (const auto& result : results) {
        console_->printSeparator();
        report(result);
    }
    state_ = std::any_of(results.begin(), results.end(),
                         [](const CleanupResult& r) { return r.hasFailures(); })
                 ? ExecutorState::PARTIALLY_FAILED
                 : ExecutorState::COMPLETED;
    return results;
}

std::vector<OperationStatus> CleanupExecutor::runRootOperations(const EnvironmentRoot& root,
                                                                const PreservationSet& preservation,
                                                                bool dryRun) {
    requireRoot(root);
    EnvironmentRoot canonicalRoot = root;
    canonicalRoot.rootPath = canonicalPath(root.rootPath);
    SafetyGuard guard(denyList_, preservation);
    return runOperations(canonicalRoot, guard, dryRun);
}

// ---- Pipeline stages ----

std::vector<CleanupExecutor::Decision> CleanupExecutor::validate(const EnvironmentRoot& root,
                                                                 std::vector<FileEntry> entries,
                                                                 const SafetyGuard& guard) {
    std::vector<Decision> decisions;
    decisions.reserve(entries.size());

    for (auto& entry : entries) {
        Decision decision;
        if (entry.classification == Classification::PRESERVE && !entry.escapesRoot) {
            decision.outcome = Outcome::PRESERVED;
        } else {
            SafetyCheck check = guard.check(entry.path, root.rootPath);
            if (check.ok() && !entry.escapesRoot) {
                decision.outcome = Outcome::REMOVED; // planned
            } else {
                decision.outcome = Outcome::SKIPPED;
                decision.reason = check.ok() ? "target escapes root" : check.reason;
            }
        }
        decision.entry = std::move(entry);
        decisions.push_back(std::move(decision));
    }
    return decisions;
}

CleanupResult CleanupExecutor::finish(const EnvironmentRoot& root, std::vector<Decision> decisions,
                                      const SafetyGuard& guard, const ScanScope& scope,
                                      bool dryRun, bool withOperations) {
    CleanupResult result;
    result.root = root;
    result.dryRun = dryRun;

    if (!dryRun) {
        transition(ExecutorState::APPLYING);
        for (auto& decision : decisions) {
            if (decision.outcome == Outcome::REMOVED) {
                removeEntry(decision);
            }
        }
    }

    for (const auto& decision : decisions) {
        ItemStatus item;
        item.path = decision.entry.path;
        item.sizeBytes = decision.entry.sizeBytes;
        item.kind = decision.entry.kind;
        item.outcome = decision.outcome;
        if (!decision.reason.empty()) {
            item.error = decision.reason;
        }

        ++result.totalScanned;
        switch (item.outcome) {
            case Outcome::REMOVED:
                ++result.totalRemoved;
                result.bytesFreed += item.sizeBytes;
                break;
            case Outcome::PRESERVED:
                ++result.preservedCount;
                break;
            case Outcome::SKIPPED:
                ++result.preservedCount;
                ++result.skippedCount;
                break;
            case Outcome::FAILED:
                ++result.failedCount;
                break;
        }
        console_->printItem(item);
        result.perItemStatus.push_back(std::move(item));
    }

    if (withOperations) {
        result.operations = runOperations(root, guard, dryRun);
    }

    if (!dryRun && config_.pruneEmptyDirectories) {
        pruneEmptyDirectories(root.rootPath, decisions, guard, scope);
    }

    // A dry run goes straight from VALIDATING to its terminal state
    transition(result.hasFailures() ? ExecutorState::PARTIALLY_FAILED : ExecutorState::COMPLETED);
    result.state = state_;

    console_->printSummary(result);
    return result;
}

void CleanupExecutor::removeEntry(Decision& decision) {
    std::error_code ec;
    bool removed = fs::remove(decision.entry.path, ec);
    if (ec) {
        decision.outcome = Outcome::FAILED;
        decision.reason = describeError(ec, decision.entry.path);
    } else if (!removed) {
        decision.outcome = Outcome::SKIPPED;
        decision.reason = "vanished before removal";
    }
}

void CleanupExecutor::pruneEmptyDirectories(const fs::path& root,
                                            const std::vector<Decision>& decisions,
                                            const SafetyGuard& guard, const ScanScope& scope) {
    // Deepest first, so a parent is tried after its children
    auto deeperFirst = [](const fs::path& a, const fs::path& b) {
        auto da = std::distance(a.begin(), a.end());
        auto db = std::distance(b.begin(), b.end());
        return da != db ? da > db : a > b;
    };
    std::set<fs::path, decltype(deeperFirst)> candidates(deeperFirst);

    for (const auto& decision : decisions) {
        if (decision.outcome != Outcome::REMOVED) continue;
        for (fs::path dir = decision.entry.path.parent_path();
             isStrictDescendant(dir, root); dir = dir.parent_path()) {
            candidates.insert(dir);
        }
    }

    for (const auto& dir : candidates) {
        if (scope.matchDirectory(dir.lexically_relative(root)) != ScanScope::Match::INSIDE) {
            continue;
        }
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(dir, ec)) || ec) continue;
        if (!fs::is_empty(dir, ec) || ec) continue;
        if (!guard.isSafe(dir, root)) continue;
        fs::remove(dir, ec);
        if (ec) {
            console_->printWarning("could not remove empty directory: " + describeError(ec, dir));
        }
    }
}

// ---- Per-root operations ----

std::vector<OperationStatus> CleanupExecutor::runOperations(const EnvironmentRoot& root,
                                                            const SafetyGuard& guard,
                                                            bool dryRun) {
    std::vector<std::pair<std::string, fs::path>> planned;

    if (root.kind == RootKind::GLOBAL_STORAGE) {
        if (config_.rewriteTelemetry) {
            planned.emplace_back("telemetry", root.rootPath / STORAGE_JSON);
        }
        if (config_.cleanStores) {
            planned.emplace_back("store", root.rootPath / STATE_DB);
        }
    } else if (root.kind == RootKind::WORKSPACE_STORAGE && config_.cleanStores) {
        std::vector<fs::path> stores;
        std::error_code ec;
        for (fs::directory_iterator it(root.rootPath, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code fileError;
            if (it->is_directory(fileError) && fs::is_regular_file(it->path() / STATE_DB, fileError)) {
                stores.push_back(it->path() / STATE_DB);
            }
        }
        std::sort(stores.begin(), stores.end());
        for (const auto& store : stores) {
            planned.emplace_back("store", store);
        }
    }

    std::vector<OperationStatus> ops;
    for (const auto& [name, target] : planned) {
        SafetyCheck check = guard.check(target, root.rootPath);
        if (!check.ok()) {
            OperationStatus op = makeOperation(name.c_str(), target);
            op.outcome = OperationOutcome::SKIPPED;
            op.detail = check.reason;
            ops.push_back(std::move(op));
        } else if (name == "telemetry") {
            ops.push_back(telemetryOperation(target, dryRun));
        } else {
            ops.push_back(storeOperation(target, dryRun));
        }
        console_->printOperation(ops.back());
    }
    return ops;
}

OperationStatus CleanupExecutor::telemetryOperation(const fs::path& target, bool dryRun) {
    OperationStatus op = makeOperation("telemetry", target);
    try {
        if (dryRun) {
            TelemetryRewrite current = peekTelemetryIds(target);
            op.outcome = OperationOutcome::PLANNED;
            op.detail = "telemetry identifiers would be regenerated";
            op.data = current.toJson();
        } else {
            TelemetryRewrite rewrite = rewriteTelemetryIds(target);
            op.outcome = OperationOutcome::APPLIED;
            op.detail = "telemetry identifiers regenerated";
            op.data = rewrite.toJson();
        }
    } catch (const NotFoundError&) {
        op.outcome = OperationOutcome::SKIPPED;
        op.detail = std::string(STORAGE_JSON) + " not found";
    } catch (const std::exception& e) {
        op.outcome = OperationOutcome::FAILED;
        op.error = e.what();
    }
    return op;
}

OperationStatus CleanupExecutor::storeOperation(const fs::path& target, bool dryRun) {
    OperationStatus op = makeOperation("store", target);
    try {
        if (dryRun) {
            StoreCleanResult preview = storeCleaner_.preview(target, keyPatterns_);
            op.outcome = OperationOutcome::PLANNED;
            op.detail = std::to_string(preview.rowsRemoved) + " rows would be removed";
            op.data = preview.toJson();
        } else {
            StoreCleanResult cleaned = storeCleaner_.clean(target, keyPatterns_);
            op.outcome = OperationOutcome::APPLIED;
            op.detail = std::to_string(cleaned.rowsRemoved) + " rows removed";
            op.data = cleaned.toJson();
        }
    } catch (const NotFoundError&) {
        op.outcome = OperationOutcome::SKIPPED;
        op.detail = std::string(STATE_DB) + " not found";
    } catch (const std::exception& e) {
        op.outcome = OperationOutcome::FAILED;
        op.error = e.what();
    }
    return op;
}

void CleanupExecutor::report(const CleanupResult& result) {
    console_->printRootStart(result.root, result.dryRun);
    for (const auto& item : result.perItemStatus) {
        console_->printItem(item);
    }
    for (const auto& op : result.operations) {
        console_->printOperation(op);
    }
    console_->printSummary(result);
}

} // namespace augsweep
