#pragma once

#include "core/entities.hpp"
#include "core/result.hpp"
#include "core/tombstone.hpp"
#include "core/types.hpp"
#include "storage/backing_store.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tagsync::store {

struct DataStats {
    size_t tags_count = 0;
    size_t pages_count = 0;
    size_t tagged_pages_count = 0;
    size_t pending_tombstones = 0;
};

struct ImportSummary {
    size_t tags_count = 0;
    size_t pages_count = 0;
};

/**
 * EntityStore - in-memory authoritative tag and page collections plus the
 * tombstone ledger, backed by a BackingStore.
 *
 * Mutations only touch memory and mark the affected part dirty; nothing
 * reaches the backing store until commit(), which writes every dirty part
 * in one atomic set_multiple(). Validation happens before any mutation, so
 * a rejected call leaves the store untouched.
 */
class EntityStore {
public:
    explicit EntityStore(storage::BackingStore& backing,
                         const Clock& clock = SystemClock::instance());

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /**
     * Rehydrate from the backing store unless already loaded.
     */
    [[nodiscard]] Res<void> ensure_loaded();

    [[nodiscard]] bool is_loaded() const noexcept { return loaded_; }

    /**
     * Drop in-memory state; the next ensure_loaded() re-reads durable state.
     */
    void invalidate();

    [[nodiscard]] bool is_dirty() const noexcept {
        return dirty_tags_ || dirty_pages_ || dirty_tombstones_ || dirty_creations_ || dirty_meta_;
    }

    /**
     * Persist every dirty part in one atomic write. A no-op when clean.
     */
    [[nodiscard]] Res<void> commit();

    // ------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------

    [[nodiscard]] const TagsCollection& tags() const noexcept { return tags_; }
    [[nodiscard]] const PageCollection& pages() const noexcept { return pages_; }
    [[nodiscard]] const TombstoneLedger& tombstones() const noexcept { return tombstones_; }

    /**
     * Entities created or re-created locally that the remote has not
     * acknowledged yet. A remote soft-deleted row with the same id would
     * otherwise exclude them on the next merge.
     */
    [[nodiscard]] const std::set<TombstoneKey>& pending_creations() const noexcept { return pending_creations_; }
    [[nodiscard]] Snapshot snapshot() const { return Snapshot{.tags = tags_, .pages = pages_}; }

    /**
     * All tags ordered by name (case-insensitive).
     */
    [[nodiscard]] std::vector<Tag> all_tags() const;

    [[nodiscard]] const Tag* tag(const std::string& id) const;
    [[nodiscard]] const Tag* find_tag_by_name(const std::string& name) const;
    [[nodiscard]] const Page* page(const std::string& id) const;
    [[nodiscard]] const Page* page_by_url(const std::string& url) const;

    /**
     * Pages carrying at least one tag (or `tag_id` when given), newest first.
     */
    [[nodiscard]] std::vector<Page> tagged_pages(const std::optional<std::string>& tag_id = std::nullopt) const;

    /**
     * Number of pages carrying each tag; every tag is present, unused ones
     * with 0.
     */
    [[nodiscard]] std::map<std::string, size_t> tag_usage_counts() const;

    [[nodiscard]] DataStats stats() const;

    [[nodiscard]] std::optional<Timestamp> last_sync_at() const noexcept { return last_sync_at_; }

    // ------------------------------------------------------------------
    // Tag mutations
    // ------------------------------------------------------------------

    [[nodiscard]] Res<Tag> create_tag(const std::string& name,
                                      std::optional<std::string> description = std::nullopt,
                                      std::optional<std::string> color = std::nullopt);

    [[nodiscard]] Res<Tag> rename_tag(const std::string& id, const std::string& name);

    /**
     * Remove a tag from the store, from every page and from every binding,
     * and record its tombstone.
     */
    [[nodiscard]] Res<void> delete_tag(const std::string& id);

    [[nodiscard]] Res<void> bind_tags(const std::string& a, const std::string& b);
    [[nodiscard]] Res<void> unbind_tags(const std::string& a, const std::string& b);

    // ------------------------------------------------------------------
    // Page mutations
    // ------------------------------------------------------------------

    /**
     * Register a page by URL. An existing page keeps its tags; its title
     * (unless manually edited) and favicon are refreshed, and updatedAt only
     * moves when something actually changed.
     */
    [[nodiscard]] Res<Page> create_or_update_page(const std::string& url,
                                                  const std::string& title,
                                                  std::optional<std::string> favicon = std::nullopt);

    [[nodiscard]] Res<Page> update_page_title(const std::string& page_id,
                                              const std::string& title,
                                              bool manual = true);

    [[nodiscard]] Res<Page> add_tag_to_page(const std::string& page_id, const std::string& tag_id);
    [[nodiscard]] Res<Page> remove_tag_from_page(const std::string& page_id, const std::string& tag_id);

    /**
     * Attach a tag by name, creating it when no tag has that name yet.
     */
    [[nodiscard]] Res<Page> create_tag_and_add_to_page(const std::string& name, const std::string& page_id);

    [[nodiscard]] Res<void> delete_page(const std::string& id);

    // ------------------------------------------------------------------
    // Bulk
    // ------------------------------------------------------------------

    [[nodiscard]] QJsonObject export_json() const;

    /**
     * Import an export document. Merge mode keeps existing entities on id
     * collisions; replace mode swaps both collections and tombstones what the
     * import dropped.
     */
    [[nodiscard]] Res<ImportSummary> import_json(const QByteArray& document, bool merge_mode);

    /**
     * Swap in collections produced by a sync merge.
     */
    void replace_collections(Snapshot merged);

    bool clear_tombstone(const TombstoneKey& key);

    bool clear_pending_creation(const TombstoneKey& key);

    void set_last_sync_at(Timestamp when);

    [[nodiscard]] Timestamp now() const { return clock_.now(); }

private:
    [[nodiscard]] Res<void> require_loaded() const;
    [[nodiscard]] Tag* mutable_tag(const std::string& id);
    [[nodiscard]] Page* mutable_page(const std::string& id);

    void put_tag(Tag tag);
    void put_page(Page page);
    void record_tombstone(EntityKind kind, const std::string& id);
    void revive(EntityKind kind, const std::string& id);

    storage::BackingStore& backing_;
    const Clock& clock_;

    TagsCollection tags_;
    PageCollection pages_;
    TombstoneLedger tombstones_;
    std::set<TombstoneKey> pending_creations_;
    std::optional<Timestamp> last_sync_at_;

    bool loaded_ = false;
    bool dirty_tags_ = false;
    bool dirty_pages_ = false;
    bool dirty_tombstones_ = false;
    bool dirty_creations_ = false;
    bool dirty_meta_ = false;
};

} // namespace tagsync::store
