// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Registry of named operations (list, scan, clean, ...).
//
// Operations take JSON arguments and return a JSON result, so the CLI, tests
// and any other front end dispatch them the same way.

#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "augsweep/export.h"

namespace augsweep {

using json = nlohmann::json;

enum class ParamType {
    STRING,
    INTEGER,
    BOOLEAN,
    ARRAY,
    UNKNOWN
};

inline std::string paramTypeToString(ParamType t) {
    switch (t) {
        case ParamType::STRING:  return "string";
        case ParamType::INTEGER: return "integer";
        case ParamType::BOOLEAN: return "boolean";
        case ParamType::ARRAY:   return "array";
        case ParamType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

struct OperationParameter {
    std::string name;
    ParamType type = ParamType::UNKNOWN;
    bool required = false;
    std::string description;
};

// Takes JSON arguments, returns JSON result.
using OperationCallback = std::function<json(const json&)>;

struct OperationInfo {
    std::string name;
    std::string description;
    std::vector<OperationParameter> parameters;
    OperationCallback callback;
    bool destructive = false; // mutates the filesystem unless dry-run
};

class AUGSWEEP_API OperationRegistry {
public:
    /// @throws std::runtime_error if an operation with the same name is already registered.
    void registerOperation(OperationInfo info);

    /// Convenience overload.
    void registerOperation(const std::string& name,
                           const std::string& description,
                           OperationCallback callback,
                           std::vector<OperationParameter> params = {},
                           bool destructive = false);

    /// Look up an operation by exact name.
    /// @return Pointer to OperationInfo if found, nullptr otherwise.
    const OperationInfo* findOperation(const std::string& name) const;

    /// Resolve a loosely typed name: case-insensitive, '_' and '-' equivalent,
    /// or an unambiguous prefix ("tele" -> "telemetry").
    /// @return Resolved name, or empty string if no unique match.
    std::string resolveName(const std::string& name) const;

    bool hasOperation(const std::string& name) const;

    bool removeOperation(const std::string& name);

    /// All registered operations (ordered by name).
    const std::map<std::string, OperationInfo>& allOperations() const;

    size_t size() const;

    void clear();

    /// One line per operation: "name <param> [param?]: description".
    std::string formatHelp() const;

    /// Execute an operation by name, resolving the name if needed.
    /// Exceptions thrown by the operation are returned as
    /// {"status": "error", "error": ...}.
    json executeOperation(const std::string& name, const json& args) const;

private:
    std::map<std::string, OperationInfo> operations_;

    /// Lowercase with '_' mapped to '-'.
    static std::string normalize(const std::string& s);
};

} // namespace augsweep
