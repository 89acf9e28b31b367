#pragma once

#include "core/entities.hpp"
#include <compare>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tagsync {

/**
 * TombstoneKey - identifies one locally deleted entity.
 *
 * Serialized as "<kind>:<id>" (e.g. "tag:work"). The id may itself contain
 * ':'; only the first separator splits.
 */
struct TombstoneKey {
    EntityKind kind = EntityKind::Tag;
    std::string id;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<TombstoneKey> parse(std::string_view text);

    auto operator<=>(const TombstoneKey&) const = default;
    bool operator==(const TombstoneKey&) const = default;
};

/**
 * TombstoneLedger - pending-delete markers for entities deleted locally
 * whose removal the remote replica has not yet confirmed.
 *
 * The merge engine consults is_pending() to keep a stale remote copy from
 * resurrecting a deleted entity. The sync coordinator clears a marker once
 * it observes the remote without the entity (or with it soft-deleted).
 */
class TombstoneLedger {
public:
    TombstoneLedger() = default;

    /**
     * Record a local deletion. Idempotent; returns false if already pending.
     */
    bool record_deletion(EntityKind kind, std::string id);

    /**
     * Forget a marker after remote confirmation. Returns false if absent.
     */
    bool clear_deletion(EntityKind kind, const std::string& id);

    [[nodiscard]] bool is_pending(EntityKind kind, const std::string& id) const;

    [[nodiscard]] const std::set<TombstoneKey>& keys() const noexcept { return keys_; }
    [[nodiscard]] std::vector<std::string> ids(EntityKind kind) const;
    [[nodiscard]] size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }
    void clear() noexcept { keys_.clear(); }

    /**
     * Flat "<kind>:<id>" form used for persistence.
     */
    [[nodiscard]] std::vector<std::string> to_strings() const;

    /**
     * Rebuild from persisted strings; malformed entries are returned in
     * `rejected` (when given) and otherwise ignored.
     */
    [[nodiscard]] static TombstoneLedger from_strings(const std::vector<std::string>& entries,
                                                      std::vector<std::string>* rejected = nullptr);

    bool operator==(const TombstoneLedger&) const = default;

private:
    std::set<TombstoneKey> keys_;
};

} // namespace tagsync
