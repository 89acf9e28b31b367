#pragma once

#include "storage/backing_store.hpp"
#include "storage/database.hpp"
#include <memory>

namespace tagsync::storage {

/**
 * SqliteBackingStore - BackingStore over the `kv_store` table.
 */
class SqliteBackingStore final : public BackingStore {
public:
    explicit SqliteBackingStore(Database db) : db_(std::move(db)) {}

    /**
     * Open the database at `path` (parent directory must exist) and bring
     * the schema up to date.
     */
    [[nodiscard]] static Res<std::unique_ptr<SqliteBackingStore>> open(const std::string& path);

    [[nodiscard]] static Res<std::unique_ptr<SqliteBackingStore>> open_memory();

    [[nodiscard]] Res<std::optional<std::string>> get(const std::string& key) override;
    [[nodiscard]] Res<std::map<std::string, std::string>> get_multiple(
        const std::vector<std::string>& keys) override;
    [[nodiscard]] Res<void> set(const std::string& key, const std::string& value) override;
    [[nodiscard]] Res<void> set_multiple(const std::map<std::string, std::string>& entries) override;
    [[nodiscard]] Res<void> remove(const std::string& key) override;
    [[nodiscard]] Res<void> remove_multiple(const std::vector<std::string>& keys) override;
    [[nodiscard]] Res<std::vector<std::string>> keys() override;

    [[nodiscard]] Database& database() { return db_; }

private:
    [[nodiscard]] Res<void> upsert(const std::string& key, const std::string& value);
    [[nodiscard]] Res<void> erase(const std::string& key);

    Database db_;
};

} // namespace tagsync::storage
