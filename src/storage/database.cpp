#include "storage/database.hpp"

namespace tagsync::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(persistence_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(persistence_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(persistence_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        persistence_error(std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(persistence_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(persistence_error(error, rc));
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, 5000);

    // A commit must be on disk before the caller is told it succeeded.
    auto pragmas = db.execute("PRAGMA journal_mode = WAL;"
                              "PRAGMA synchronous = FULL;"
                              "PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(persistence_error("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(persistence_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(persistence_error("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(persistence_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tagsync::storage
