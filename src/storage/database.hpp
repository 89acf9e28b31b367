#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tagsync::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    Result<bool, Error> step();  // true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection.
 *
 * Every failure is reported as an ErrorKind::Persistence error carrying the
 * SQLite result code.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (creating if needed) a database file in WAL mode with full
     * fsync on commit.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run a statement and hand every row to `callback`.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(persistence_error(
                    result.unwrap_err().message + " (rollback failed: " +
                        rollback_result.unwrap_err().message + ")",
                    rollback_result.unwrap_err().code));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(persistence_error(
                    commit_result.unwrap_err().message + " (rollback failed: " +
                        rollback_result.unwrap_err().message + ")",
                    commit_result.unwrap_err().code));
            }
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] std::string last_error() const;

    sqlite3* db_ = nullptr;
};

} // namespace tagsync::storage
