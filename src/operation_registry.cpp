// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/operation_registry.h"

#include <sstream>
#include <stdexcept>

#include "augsweep/errors.h"
#include "augsweep/path_utils.h"

namespace augsweep {

void OperationRegistry::registerOperation(OperationInfo info) {
    if (operations_.count(info.name)) {
        throw std::runtime_error("Operation already registered: " + info.name);
    }
    std::string name = info.name;
    operations_.emplace(std::move(name), std::move(info));
}

void OperationRegistry::registerOperation(const std::string& name,
                                          const std::string& description,
                                          OperationCallback callback,
                                          std::vector<OperationParameter> params,
                                          bool destructive) {
    OperationInfo info;
    info.name = name;
    info.description = description;
    info.callback = std::move(callback);
    info.parameters = std::move(params);
    info.destructive = destructive;
    registerOperation(std::move(info));
}

const OperationInfo* OperationRegistry::findOperation(const std::string& name) const {
    auto it = operations_.find(name);
    if (it != operations_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::string OperationRegistry::resolveName(const std::string& name) const {
    std::string wanted = normalize(name);
    if (wanted.empty()) {
        return "";
    }

    // Try exact match after normalization
    std::vector<std::string> matches;
    for (const auto& [registeredName, _] : operations_) {
        if (normalize(registeredName) == wanted) {
            matches.push_back(registeredName);
        }
    }
    if (matches.size() == 1) {
        return matches[0];
    }

    // Try unique prefix match
    matches.clear();
    for (const auto& [registeredName, _] : operations_) {
        std::string reg = normalize(registeredName);
        if (reg.compare(0, wanted.size(), wanted) == 0) {
            matches.push_back(registeredName);
        }
    }
    if (matches.size() == 1) {
        return matches[0];
    }

    return "";
}

bool OperationRegistry::hasOperation(const std::string& name) const {
    return operations_.count(name) > 0;
}

bool OperationRegistry::removeOperation(const std::string& name) {
    return operations_.erase(name) > 0;
}

const std::map<std::string, OperationInfo>& OperationRegistry::allOperations() const {
    return operations_;
}

size_t OperationRegistry::size() const {
    return operations_.size();
}

void OperationRegistry::clear() {
    operations_.clear();
}

std::string OperationRegistry::formatHelp() const {
    std::ostringstream oss;
    for (const auto& [name, op] : operations_) {
        oss << "  " << name;
        for (const auto& param : op.parameters) {
            oss << (param.required ? " <" : " [") << param.name << ": "
                << paramTypeToString(param.type) << (param.required ? ">" : "]");
        }
        oss << ": " << op.description;
        if (op.destructive) oss << " (destructive)";
        oss << "\n";
    }
    return oss.str();
}

json OperationRegistry::executeOperation(const std::string& name, const json& args) const {
    const OperationInfo* op = findOperation(name);
    if (!op) {
        std::string resolved = resolveName(name);
        if (!resolved.empty()) {
            op = findOperation(resolved);
        }
    }

    if (!op) {
        return json{{"status", "error"}, {"error", "Operation '" + name + "' not found"}};
    }

    if (!op->callback) {
        return json{{"status", "error"}, {"error", "Operation '" + name + "' has no callback"}};
    }

    for (const auto& param : op->parameters) {
        if (param.required && (!args.is_object() || !args.contains(param.name))) {
            return json{{"status", "error"},
                        {"error", "Operation '" + op->name + "' requires '" + param.name + "'"}};
        }
    }

    try {
        return op->callback(args);
    } catch (const CleanerError& e) {
        return json{{"status", "error"}, {"kind", errorKindToString(e.kind())}, {"error", e.what()}};
    } catch (const std::exception& e) {
        return json{{"status", "error"}, {"error", std::string("Operation failed: ") + e.what()}};
    }
}

std::string OperationRegistry::normalize(const std::string& s) {
    std::string result = toLower(s);
    for (auto& c : result) {
        if (c == '_') c = '-';
    }
    return result;
}

} // namespace augsweep
