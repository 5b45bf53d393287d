#pragma once

#include <verity/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace verity::storage {

enum class OpenMode {
    Create,  // Open read-write, creating the file when missing
    InMemory // Private database that disappears on close
};

/**
 * @brief Prepared statement owning its sqlite3_stmt.
 *
 * Parameters are 1-based, result columns 0-based, as in the SQLite C API.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, std::span<const std::byte> blob);

    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        return value ? bind(index, *value) : bind(index, nullptr);
    }

    // Binds args to parameters 1..N
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        int index = 0;
        Result<void> status;
        ((status ? (status = bind(++index, args), 0) : 0), ...);
        return status;
    }

    // Runs to completion, ignoring any rows
    Result<void> execute();

    // true while a row is available
    Result<bool> step();

    // Rewind and clear bindings so the statement can run again
    Result<void> reset();

    int64_t int64At(int column) const;
    double doubleAt(int column) const;
    std::string textAt(int column) const;
    std::vector<std::byte> blobAt(int column) const;
    bool nullAt(int column) const;
    std::optional<int64_t> optionalInt64At(int column) const;
    std::optional<std::string> optionalTextAt(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Error stepError(int rc) const;

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection. Not thread-safe; the owner serializes access.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, OpenMode mode);
    void close();
    bool isOpen() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    Result<Statement> prepare(std::string_view sql);

    // Runs one or more ';'-separated statements that return no rows
    Result<void> execute(const std::string& sql);

    // Runs body inside BEGIN IMMEDIATE/COMMIT, rolling back when body fails or throws
    template <typename Body> Result<void> transaction(Body&& body) {
        if (auto r = execute("BEGIN IMMEDIATE"); !r) {
            return r;
        }
        Result<void> outcome;
        try {
            outcome = body();
        } catch (...) {
            rollbackQuietly();
            throw;
        }
        if (!outcome) {
            rollbackQuietly();
            return outcome;
        }
        return execute("COMMIT");
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    // Checks the linked library by creating a throwaway FTS5 table
    Result<bool> hasFTS5();
    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

private:
    void rollbackQuietly();

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace verity::storage
