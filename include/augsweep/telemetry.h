// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Telemetry identifier rewrite for an editor's storage.json.

#pragma once

#include <filesystem>

#include "augsweep/export.h"
#include "augsweep/types.h"

namespace augsweep {

namespace fs = std::filesystem;

constexpr const char* MACHINE_ID_KEY = "telemetry.machineId";
constexpr const char* DEV_DEVICE_ID_KEY = "telemetry.devDeviceId";

/// Replace both telemetry identifiers with fresh random values.
///
/// Only the two top-level keys change; every other key keeps its value and
/// position. The file is replaced atomically and keeps its permissions.
///
/// @param configPath Path to storage.json
/// @return Old values (null where absent) and new values
/// @throws NotFoundError if the file does not exist
/// @throws ParseError if it is not a JSON object
/// @throws PermissionError if it cannot be read or replaced
AUGSWEEP_API TelemetryRewrite rewriteTelemetryIds(const fs::path& configPath);

/// Read the current identifiers without changing anything (newIds is empty).
/// @throws NotFoundError, ParseError, PermissionError
AUGSWEEP_API TelemetryRewrite peekTelemetryIds(const fs::path& configPath);

} // namespace augsweep
