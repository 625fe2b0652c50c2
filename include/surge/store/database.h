#pragma once

#include <surge/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace surge::store {

// File opens create the database when missing.
enum class OpenMode { File, Memory };

// Immediate takes the write lock at BEGIN, so read-then-write sequences
// cannot interleave with another connection on the same file.
enum class TransactionMode { Deferred, Immediate };

/**
 * @brief Owning handle for one prepared sqlite3 statement
 *
 * Busy and locked results from step() are retried with a short doubling
 * backoff; several worker processes write to the same store file.
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
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value)
            return bind(index, nullptr);
        return bind(index, *value);
    }

    // Binds the arguments to ?1..?N in order.
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 1;
        Result<void> result{};
        ((result = result ? bind(index++, std::forward<Args>(args)) : result), ...);
        return result;
    }

    // For writes; a row result is an error.
    Result<void> execute();

    // True while a row is available.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    std::optional<int64_t> getOptionalInt64(int column) const {
        return isNull(column) ? std::nullopt : std::optional<int64_t>(getInt64(column));
    }
    std::optional<std::string> getOptionalString(int column) const {
        return isNull(column) ? std::nullopt : std::optional<std::string>(getString(column));
    }

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<int> stepWithRetry();

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning handle for one sqlite3 connection
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

    Result<Statement> prepare(std::string_view sql);

    // Runs one or more statements without results (schema, pragmas).
    Result<void> execute(const std::string& sql);

    /**
     * @brief Run func inside BEGIN/COMMIT
     *
     * func returns Result<void>. An error result rolls back and is returned;
     * an exception rolls back and propagates.
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        if (auto begun = execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
            !begun)
            return begun;
        try {
            auto result = func();
            if (!result) {
                rollbackQuietly();
                return result;
            }
            return execute("COMMIT");
        } catch (...) {
            rollbackQuietly();
            throw;
        }
    }

    // Rows touched by the last write on this connection.
    int changes() const;

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    static std::string version();

private:
    void rollbackQuietly();
    void closeHandle();

    sqlite3* db_ = nullptr;
};

} // namespace surge::store
