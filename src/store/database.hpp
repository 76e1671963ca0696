#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "sqlite3.h"

namespace agentyard::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// One SQLite connection shared by the collector, the ledger and the task
// store. Every use of Handle() or Statement must hold Lock().
class Database {
public:
    explicit Database(const std::filesystem::path& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    std::unique_lock<std::mutex> Lock() { return std::unique_lock<std::mutex>(mutex_); }
    sqlite3* Handle() const { return db_; }
    const std::filesystem::path& Path() const { return path_; }

    // Runs `sql`, throwing StoreError with sqlite's message on failure.
    void Exec(const std::string& sql);

    static std::string SafeText(const unsigned char* text);

private:
    std::filesystem::path path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

// Prepared statement, finalized on destruction.
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& Bind(int index, const std::string& value);
    Statement& Bind(int index, long long value);
    Statement& BindBlob(int index, const std::string& value);
    Statement& BindNull(int index);

    // True when a row is available, false once the statement is done.
    bool Step();
    void Reset();

    std::string ColumnText(int index) const;
    std::string ColumnBlob(int index) const;
    long long ColumnInt64(int index) const;
    bool ColumnIsNull(int index) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace agentyard::store
