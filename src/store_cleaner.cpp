// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/store_cleaner.h"

#include <cctype>
#include <stdexcept>

#include <sqlite3.h>

#include "augsweep/errors.h"

namespace augsweep {

namespace {

std::string describe(sqlite3* db, int rc, const std::string& what) {
    std::string message = what + ": " + sqlite3_errstr(rc);
    if (db) {
        const char* detail = sqlite3_errmsg(db);
        if (detail && message.find(detail) == std::string::npos) {
            message += " (" + std::string(detail) + ")";
        }
    }
    return message;
}

[[noreturn]] void fail(sqlite3* db, int rc, const std::string& what) {
    throw StoreUnavailableError(describe(db, rc, what));
}

/// Owns a sqlite3 connection.
class Database {
public:
    Database(const fs::path& path, bool readOnly) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            throw NotFoundError(path.string());
        }

        int flags = readOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
        int rc = sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = describe(db_, rc, "cannot open " + path.string());
            sqlite3_close(db_);
            db_ = nullptr;
            throw StoreUnavailableError(message);
        }
        // A running editor holding the lock must surface immediately
        sqlite3_busy_timeout(db_, 0);
    }

    ~Database() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* get() const { return db_; }

    void exec(const char* sql) {
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            fail(db_, rc, sql);
        }
    }

private:
    sqlite3* db_ = nullptr;
};

/// Owns a prepared statement.
class Statement {
public:
    Statement(Database& db, const std::string& sql) : db_(db.get()) {
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            fail(db_, rc, "prepare '" + sql + "'");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT), "bind");
    }

    void bindInt64(int index, sqlite3_int64 value) {
        check(sqlite3_bind_int64(stmt_, index, value), "bind");
    }

    /// @return true if a row is available, false when done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, rc, "step");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int columnType(int col) const { return sqlite3_column_type(stmt_, col); }

    sqlite3_int64 columnInt64(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::string columnBytes(int col) const {
        const void* data = columnType(col) == SQLITE_BLOB ? sqlite3_column_blob(stmt_, col)
                                                          : static_cast<const void*>(sqlite3_column_text(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) return {};
        return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
    }

private:
    void check(int rc, const char* what) {
        if (rc != SQLITE_OK) fail(db_, rc, what);
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/// Rolls back on scope exit unless committed.
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) { db_.exec("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        committed_ = true;
    }

private:
    Database& db_;
    bool committed_ = false;
};

struct MatchedKey {
    sqlite3_int64 rowid = 0;
    std::string bytes;
};

bool isIdentifier(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string quoted(const std::string& table) {
    return "\"" + table + "\"";
}

bool hasKeyTable(Database& db, const std::string& table) {
    Statement exists(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
    exists.bindText(1, table);
    if (!exists.step()) {
        return false;
    }

    Statement columns(db, "PRAGMA table_info(" + quoted(table) + ")");
    while (columns.step()) {
        if (columns.columnBytes(1) == "key") {
            return true;
        }
    }
    return false;
}

bool anyMatch(const std::vector<KeyPattern>& patterns, const std::string& key) {
    for (const auto& p : patterns) {
        if (p.matches(key)) return true;
    }
    return false;
}

std::vector<MatchedKey> matchingKeys(Database& db, const std::string& table,
                                     const std::vector<KeyPattern>& patterns) {
    std::vector<MatchedKey> keys;
    Statement select(db, "SELECT rowid, key FROM " + quoted(table));
    while (select.step()) {
        int type = select.columnType(1);
        if (type != SQLITE_TEXT && type != SQLITE_BLOB) {
            continue;
        }
        MatchedKey key{select.columnInt64(0), select.columnBytes(1)};
        if (anyMatch(patterns, key.bytes)) {
            keys.push_back(std::move(key));
        }
    }
    return keys;
}

StoreCleanResult run(const std::vector<std::string>& tables, const fs::path& dbPath,
                     const std::vector<KeyPattern>& patterns, bool apply) {
    StoreCleanResult result;
    result.dbPath = dbPath;

    Database db(dbPath, !apply);

    if (!apply) {
        for (const auto& table : tables) {
            if (!hasKeyTable(db, table)) continue;
            result.tablesCleaned.push_back(table);
            for (auto& key : matchingKeys(db, table, patterns)) {
                result.removedKeys.push_back(std::move(key.bytes));
                ++result.rowsRemoved;
            }
        }
        return result;
    }

    Transaction tx(db);
    for (const auto& table : tables) {
        if (!hasKeyTable(db, table)) continue;
        result.tablesCleaned.push_back(table);

        std::vector<MatchedKey> keys = matchingKeys(db, table, patterns);
        if (keys.empty()) continue;

        // Rows are addressed by rowid so duplicate keys each go exactly once
        Statement del(db, "DELETE FROM " + quoted(table) + " WHERE rowid = ?1");
        for (const auto& key : keys) {
            del.bindInt64(1, key.rowid);
            del.step();
            result.rowsRemoved += static_cast<std::size_t>(sqlite3_changes(db.get()));
            result.removedKeys.push_back(key.bytes);
            del.reset();
        }
    }
    tx.commit();
    return result;
}

} // namespace

StoreCleaner::StoreCleaner(std::vector<std::string> tables) : tables_(std::move(tables)) {
    for (const auto& table : tables_) {
        if (!isIdentifier(table)) {
            throw std::invalid_argument("invalid store table name: '" + table + "'");
        }
    }
}

const std::vector<std::string>& StoreCleaner::defaultTables() {
    static const std::vector<std::string> tables = {"ItemTable", "cursorDiskKV"};
    return tables;
}

StoreCleanResult StoreCleaner::clean(const fs::path& dbPath,
                                     const std::vector<KeyPattern>& patterns) const {
    return run(tables_, dbPath, patterns, true);
}

StoreCleanResult StoreCleaner::preview(const fs::path& dbPath,
                                       const std::vector<KeyPattern>& patterns) const {
    return run(tables_, dbPath, patterns, false);
}

std::size_t StoreCleaner::countMatches(const fs::path& dbPath,
                                       const std::vector<KeyPattern>& patterns) const {
    return preview(dbPath, patterns).rowsRemoved;
}

StoreCleanResult cleanStore(const fs::path& dbPath, const std::vector<KeyPattern>& patterns) {
    return StoreCleaner().clean(dbPath, patterns);
}

} // namespace augsweep
