#include "storage/migrations.hpp"
#include "core/types.hpp"

#include <QLoggingCategory>
#include <QString>

namespace tagsync::storage {

Q_LOGGING_CATEGORY(tagsyncMigrationsLog, "tagsync.storage.migrations")

namespace {

std::string describe(const Migration& m) {
    return std::to_string(m.version) + " (" + m.name + ")";
}

} // namespace

Result<void, Error> MigrationRunner::check_order() const {
    for (size_t i = 1; i < migrations_.size(); ++i) {
        if (migrations_[i].version <= migrations_[i - 1].version) {
            return Result<void, Error>::err(persistence_error(
                "migration " + describe(migrations_[i]) + " is out of order"));
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<std::set<int>, Error> MigrationRunner::applied_versions() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Result<std::set<int>, Error>::err(ensured.unwrap_err());
    }

    auto stmt_result = db_.prepare("SELECT version FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<std::set<int>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    std::set<int> versions;
    while (true) {
        auto row = stmt.step();
        if (row.is_err()) {
            return Result<std::set<int>, Error>::err(row.unwrap_err());
        }
        if (!row.unwrap()) {
            break;
        }
        versions.insert(stmt.column_int(0));
    }
    return Result<std::set<int>, Error>::ok(std::move(versions));
}

Result<int, Error> MigrationRunner::current_version() {
    return applied_versions().map([](const std::set<int>& versions) {
        return versions.empty() ? 0 : *versions.rbegin();
    });
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto executed = db_.execute(m.up_sql);
    if (executed.is_err()) {
        return Result<void, Error>::err(persistence_error(
            "migration " + describe(m) + " failed: " + executed.unwrap_err().message,
            executed.unwrap_err().code));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return Result<void, Error>::err(stepped.unwrap_err());
    }

    qCInfo(tagsyncMigrationsLog) << "applied migration" << QString::fromStdString(describe(m));
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(persistence_error(
            "migration " + describe(m) + " cannot be rolled back"));
    }

    auto executed = db_.execute(m.down_sql);
    if (executed.is_err()) {
        return Result<void, Error>::err(persistence_error(
            "rollback of migration " + describe(m) + " failed: " + executed.unwrap_err().message,
            executed.unwrap_err().code));
    }

    auto stmt_result = db_.prepare("DELETE FROM schema_migrations WHERE version = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int64(1, m.version);
    if (bound.is_err()) {
        return bound;
    }
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return Result<void, Error>::err(stepped.unwrap_err());
    }

    qCInfo(tagsyncMigrationsLog) << "rolled back migration" << QString::fromStdString(describe(m));
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(target_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto ordered = check_order();
    if (ordered.is_err()) {
        return ordered;
    }
    auto applied_result = applied_versions();
    if (applied_result.is_err()) {
        return Result<void, Error>::err(applied_result.unwrap_err());
    }
    const auto applied = std::move(applied_result).unwrap();

    std::vector<const Migration*> pending;
    for (const auto& m : migrations_) {
        if (m.version <= target_version && !applied.contains(m.version)) {
            pending.push_back(&m);
        }
    }
    if (pending.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto* m : pending) {
            auto result = apply(*m);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback() {
    auto current = current_version();
    if (current.is_err()) {
        return Result<void, Error>::err(current.unwrap_err());
    }
    if (current.unwrap() == 0) {
        return Result<void, Error>::ok();
    }
    return rollback_to(current.unwrap() - 1);
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto applied_result = applied_versions();
    if (applied_result.is_err()) {
        return Result<void, Error>::err(applied_result.unwrap_err());
    }
    const auto applied = std::move(applied_result).unwrap();

    std::vector<const Migration*> undo;
    for (auto it = migrations_.rbegin(); it != migrations_.rend(); ++it) {
        if (it->version > target_version && applied.contains(it->version)) {
            undo.push_back(&*it);
        }
    }
    if (undo.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto* m : undo) {
            auto result = revert(*m);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace tagsync::storage
