// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Structured store cleaner: removes matching rows from an editor's SQLite
// key/value store (state.vscdb) in one all-or-nothing transaction.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "augsweep/export.h"
#include "augsweep/types.h"

namespace augsweep {

namespace fs = std::filesystem;

class AUGSWEEP_API StoreCleaner {
public:
    /// @param tables Key/value tables to inspect. Each needs a `key` column.
    /// @throws std::invalid_argument if a table name is not a plain identifier.
    explicit StoreCleaner(std::vector<std::string> tables = defaultTables());

    /// {"ItemTable", "cursorDiskKV"}
    static const std::vector<std::string>& defaultTables();

    /// Delete every row whose key matches any pattern.
    ///
    /// Runs inside one BEGIN IMMEDIATE transaction and commits only if every
    /// deletion succeeds; otherwise the store is left exactly as it was.
    /// Missing tables, or tables without a `key` column, are skipped.
    ///
    /// @throws NotFoundError if dbPath does not exist
    /// @throws StoreUnavailableError if the store is locked, corrupt, or any
    ///         statement fails (after rolling back)
    StoreCleanResult clean(const fs::path& dbPath, const std::vector<KeyPattern>& patterns) const;

    /// Rows that clean() would remove, without modifying the store.
    /// rowsRemoved holds the would-be count. Opens the store read-only.
    /// @throws NotFoundError, StoreUnavailableError
    StoreCleanResult preview(const fs::path& dbPath, const std::vector<KeyPattern>& patterns) const;

    /// Number of rows clean() would remove.
    std::size_t countMatches(const fs::path& dbPath, const std::vector<KeyPattern>& patterns) const;

    const std::vector<std::string>& tables() const { return tables_; }

private:
    std::vector<std::string> tables_;
};

/// StoreCleaner with the default tables.
AUGSWEEP_API StoreCleanResult cleanStore(const fs::path& dbPath,
                                         const std::vector<KeyPattern>& patterns);

} // namespace augsweep
