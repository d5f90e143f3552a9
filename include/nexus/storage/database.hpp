#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace nexus::storage {

/**
 * @brief Owning handle to the service's SQLite database
 *
 * One connection is shared by the session store, the file index and the
 * dedup index. Callers serialise access through lock(); every statement
 * and transaction runs while holding it.
 *
 * Throws std::runtime_error when the database cannot be opened.
 */
class Database {
public:
    explicit Database(const std::filesystem::path& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    // Runs one or more statements; throws std::runtime_error on failure.
    void exec(const std::string& sql);

    // Number of rows touched by the last INSERT/UPDATE/DELETE.
    int changes() const;

    std::string last_error() const;

    sqlite3* handle() { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

/**
 * @brief RAII prepared statement
 *
 * Bind indices are 1-based, column indices 0-based, as in the C API.
 * Throws std::runtime_error when the SQL does not compile.
 */
class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind_null(int index);

    // true when a row is available, false when done; throws on error.
    bool step();

    std::string column_text(int index) const;
    std::int64_t column_int64(int index) const;
    bool column_is_null(int index) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Scoped BEGIN IMMEDIATE / COMMIT, rolled back unless commit() ran
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool committed_ = false;
};

} // namespace nexus::storage
