// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cryptographically random identifiers for editor telemetry fields.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "augsweep/export.h"

namespace augsweep {

/// Fill a buffer from the OpenSSL CSPRNG.
/// @throws std::runtime_error if the generator is not seeded or fails.
AUGSWEEP_API std::vector<unsigned char> randomBytes(std::size_t count);

/// Lowercase hex encoding of `byteCount` random bytes.
AUGSWEEP_API std::string randomHex(std::size_t byteCount);

/// RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9d4a-4b7e-8f21-6c0d5e9a1b23".
AUGSWEEP_API std::string generateUuidV4();

/// 64 lowercase hex characters, the format editors use for telemetry.machineId.
AUGSWEEP_API std::string generateMachineId();

AUGSWEEP_API bool isUuidV4(const std::string& s);

AUGSWEEP_API bool isMachineId(const std::string& s);

} // namespace augsweep
