// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Error kinds raised by the cleanup engine.
//
// Everything derives from CleanerError (a std::runtime_error), so callers can
// catch the whole family at once or branch on kind(). Programmer errors such
// as an invalid preservation pattern use std::invalid_argument instead.

#pragma once

#include <stdexcept>
#include <string>

namespace augsweep {

enum class ErrorKind {
    PATH_OUTSIDE_ROOT,
    PROTECTED_PATH,
    NOT_FOUND,
    PARSE,
    STORE_UNAVAILABLE,
    PERMISSION,
    PARTIAL_FAILURE
};

inline std::string errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::PATH_OUTSIDE_ROOT: return "PathOutsideRoot";
        case ErrorKind::PROTECTED_PATH:    return "ProtectedPathError";
        case ErrorKind::NOT_FOUND:         return "NotFoundError";
        case ErrorKind::PARSE:             return "ParseError";
        case ErrorKind::STORE_UNAVAILABLE: return "StoreUnavailableError";
        case ErrorKind::PERMISSION:        return "PermissionError";
        case ErrorKind::PARTIAL_FAILURE:   return "PartialFailure";
    }
    return "UnknownError";
}

class CleanerError : public std::runtime_error {
public:
    CleanerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(errorKindToString(kind) + ": " + message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class PathOutsideRootError : public CleanerError {
public:
    explicit PathOutsideRootError(const std::string& message)
        : CleanerError(ErrorKind::PATH_OUTSIDE_ROOT, message) {}
};

class ProtectedPathError : public CleanerError {
public:
    explicit ProtectedPathError(const std::string& message)
        : CleanerError(ErrorKind::PROTECTED_PATH, message) {}
};

/// Expected-absent resource. Callers usually treat this as a no-op.
class NotFoundError : public CleanerError {
public:
    explicit NotFoundError(const std::string& message)
        : CleanerError(ErrorKind::NOT_FOUND, message) {}
};

class ParseError : public CleanerError {
public:
    explicit ParseError(const std::string& message)
        : CleanerError(ErrorKind::PARSE, message) {}
};

/// Store is locked by a running editor, corrupt, or a transaction failed.
class StoreUnavailableError : public CleanerError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : CleanerError(ErrorKind::STORE_UNAVAILABLE, message) {}
};

class PermissionError : public CleanerError {
public:
    explicit PermissionError(const std::string& message)
        : CleanerError(ErrorKind::PERMISSION, message) {}
};

} // namespace augsweep
