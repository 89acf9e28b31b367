#include "storage/sqlite_backing_store.hpp"
#include "storage/migrations.hpp"
#include "core/types.hpp"

namespace tagsync::storage {

namespace {

Res<std::unique_ptr<SqliteBackingStore>> finish_open(Res<Database> opened) {
    if (opened.is_err()) {
        return Res<std::unique_ptr<SqliteBackingStore>>::err(opened.unwrap_err());
    }
    auto db = std::move(opened).unwrap();
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        return Res<std::unique_ptr<SqliteBackingStore>>::err(migrated.unwrap_err());
    }
    return Res<std::unique_ptr<SqliteBackingStore>>::ok(
        std::make_unique<SqliteBackingStore>(std::move(db)));
}

} // namespace

Res<std::unique_ptr<SqliteBackingStore>> SqliteBackingStore::open(const std::string& path) {
    return finish_open(Database::open(path));
}

Res<std::unique_ptr<SqliteBackingStore>> SqliteBackingStore::open_memory() {
    return finish_open(Database::open_memory());
}

Res<std::optional<std::string>> SqliteBackingStore::get(const std::string& key) {
    auto stmt_result = db_.prepare("SELECT value FROM kv_store WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Res<std::optional<std::string>>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_text(1, key); bound.is_err()) {
        return Res<std::optional<std::string>>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Res<std::optional<std::string>>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Res<std::optional<std::string>>::ok(std::nullopt);
    }
    return Res<std::optional<std::string>>::ok(stmt.column_text(0));
}

Res<std::map<std::string, std::string>> SqliteBackingStore::get_multiple(
    const std::vector<std::string>& keys) {
    std::map<std::string, std::string> out;
    for (const auto& key : keys) {
        auto value = get(key);
        if (value.is_err()) {
            return Res<std::map<std::string, std::string>>::err(value.unwrap_err());
        }
        if (value.unwrap()) {
            out.emplace(key, std::move(*value.unwrap()));
        }
    }
    return Res<std::map<std::string, std::string>>::ok(std::move(out));
}

Res<void> SqliteBackingStore::upsert(const std::string& key, const std::string& value) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO kv_store (key, value, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Res<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key)
        .and_then([&] { return stmt.bind_text(2, value); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Res<void>::err(step_result.unwrap_err());
    }
    return Res<void>::ok();
}

Res<void> SqliteBackingStore::erase(const std::string& key) {
    auto stmt_result = db_.prepare("DELETE FROM kv_store WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Res<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (auto bound = stmt.bind_text(1, key); bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Res<void>::err(step_result.unwrap_err());
    }
    return Res<void>::ok();
}

Res<void> SqliteBackingStore::set(const std::string& key, const std::string& value) {
    return upsert(key, value);
}

Res<void> SqliteBackingStore::set_multiple(const std::map<std::string, std::string>& entries) {
    if (entries.empty()) {
        return Res<void>::ok();
    }
    return db_.transaction([&]() -> Res<void> {
        for (const auto& [key, value] : entries) {
            auto result = upsert(key, value);
            if (result.is_err()) {
                return result;
            }
        }
        return Res<void>::ok();
    });
}

Res<void> SqliteBackingStore::remove(const std::string& key) {
    return erase(key);
}

Res<void> SqliteBackingStore::remove_multiple(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return Res<void>::ok();
    }
    return db_.transaction([&]() -> Res<void> {
        for (const auto& key : keys) {
            auto result = erase(key);
            if (result.is_err()) {
                return result;
            }
        }
        return Res<void>::ok();
    });
}

Res<std::vector<std::string>> SqliteBackingStore::keys() {
    std::vector<std::string> out;
    auto result = db_.query("SELECT key FROM kv_store ORDER BY key;", [&](Statement& stmt) {
        out.push_back(stmt.column_text(0));
    });
    if (result.is_err()) {
        return Res<std::vector<std::string>>::err(result.unwrap_err());
    }
    return Res<std::vector<std::string>>::ok(std::move(out));
}

} // namespace tagsync::storage
