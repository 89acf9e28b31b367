#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <set>
#include <string>
#include <vector>

namespace tagsync::storage {

/**
 * Migration - one versioned schema step.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * The tagsync schema, oldest first.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "kv_store",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS kv_store (
                key TEXT PRIMARY KEY,
                value TEXT NOT NULL,
                updated_at INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS kv_store;
        )SQL"
    }
};

/**
 * MigrationRunner - applies and reverts schema migrations, tracking the
 * applied set in `schema_migrations`.
 *
 * Any pending migration at or below the target is applied, including one
 * older than the newest applied version. Each migrate/rollback call runs
 * in a single transaction.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db, const std::vector<Migration>& migrations = ALL_MIGRATIONS)
        : db_(db), migrations_(migrations) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Revert the newest applied migration.
     */
    [[nodiscard]] Result<void, Error> rollback();
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<std::set<int>, Error> applied_versions();
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] int target_version() const {
        return migrations_.empty() ? 0 : migrations_.back().version;
    }

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    [[nodiscard]] Result<void, Error> check_order() const;
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);

    Database& db_;
    const std::vector<Migration>& migrations_;
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tagsync::storage
