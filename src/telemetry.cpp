// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/telemetry.h"

#include "augsweep/errors.h"
#include "augsweep/id_generator.h"
#include "augsweep/json_utils.h"
#include "augsweep/path_utils.h"

namespace augsweep {

namespace {

ordered_json readObject(const fs::path& configPath) {
    ordered_json document = readJsonFile(configPath);
    if (!document.is_object()) {
        throw ParseError(configPath.string() + ": expected a JSON object");
    }
    return document;
}

json currentIds(const ordered_json& document) {
    json ids = json::object();
    for (const char* key : {MACHINE_ID_KEY, DEV_DEVICE_ID_KEY}) {
        auto it = document.find(key);
        ids[key] = (it == document.end()) ? json(nullptr) : json::parse(it->dump());
    }
    return ids;
}

} // namespace

TelemetryRewrite peekTelemetryIds(const fs::path& configPath) {
    TelemetryRewrite result;
    result.configPath = configPath;
    result.oldIds = currentIds(readObject(configPath));
    return result;
}

TelemetryRewrite rewriteTelemetryIds(const fs::path& configPath) {
    ordered_json document = readObject(configPath);

    TelemetryRewrite result;
    result.configPath = configPath;
    result.oldIds = currentIds(document);

    std::string machineId = generateMachineId();
    std::string devDeviceId = generateUuidV4();
    document[MACHINE_ID_KEY] = machineId;
    document[DEV_DEVICE_ID_KEY] = devDeviceId;

    writeFileAtomically(configPath, document.dump(4));

    result.newIds = json{{MACHINE_ID_KEY, machineId}, {DEV_DEVICE_ID_KEY, devDeviceId}};
    return result;
}

} // namespace augsweep
