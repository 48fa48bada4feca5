// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Built-in operations: list, discover, env, scan, clean, telemetry, store, verify.
//
// Common arguments (all optional):
//   editor      variant name; omitted means every known variant
//   os          OS family name; defaults to the context's
//   path        explicit root directory instead of located roots
//   kind        root kind for `path` (default "augmentHome")
//   augmentOnly only the ~/.augment root
//   dryRun      report what would change without changing it
//   preserve    extra preserve patterns
//   noTelemetry, noStore  skip the per-root operations
//
// Results carry "status": "ok", "partial" (something failed) or "error".

#pragma once

#include <memory>

#include "augsweep/config.h"
#include "augsweep/console.h"
#include "augsweep/export.h"
#include "augsweep/locator.h"
#include "augsweep/operation_registry.h"

namespace augsweep {

struct AUGSWEEP_API OperationContext {
    CleanerConfig config;
    HostEnvironment host;
    OsFamily os = currentOsFamily();
    bool silentMode = true; // no progress output (tests, --json, --quiet)
    bool verbose = false;   // print every item, not only skipped and failed ones

    /// SilentConsole in silent mode, otherwise a TerminalConsole.
    std::unique_ptr<OutputHandler> makeConsole() const;
};

/// Register the built-in operations. Callbacks share `context`.
AUGSWEEP_API void registerBuiltinOperations(OperationRegistry& registry,
                                            std::shared_ptr<OperationContext> context);

} // namespace augsweep
