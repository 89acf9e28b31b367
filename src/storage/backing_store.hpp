#pragma once

#include "core/result.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagsync::storage {

/**
 * Storage keys for the persisted snapshot.
 */
namespace keys {
inline constexpr const char* kTags = "tagsync.tags";
inline constexpr const char* kPages = "tagsync.pages";
inline constexpr const char* kTombstones = "tagsync.tombstones";
inline constexpr const char* kLastSyncAt = "tagsync.sync.last_sync_at";
inline constexpr const char* kPendingCreations = "tagsync.sync.pending_creations";
} // namespace keys

/**
 * BackingStore - durable key -> value storage.
 *
 * Implementations are read-after-write consistent and survive process
 * restarts. set_multiple() and remove_multiple() are all-or-nothing.
 */
class BackingStore {
public:
    virtual ~BackingStore() = default;

    [[nodiscard]] virtual Res<std::optional<std::string>> get(const std::string& key) = 0;

    /**
     * Values for the keys that exist; missing keys are absent from the map.
     */
    [[nodiscard]] virtual Res<std::map<std::string, std::string>> get_multiple(
        const std::vector<std::string>& keys) = 0;

    [[nodiscard]] virtual Res<void> set(const std::string& key, const std::string& value) = 0;

    [[nodiscard]] virtual Res<void> set_multiple(const std::map<std::string, std::string>& entries) = 0;

    [[nodiscard]] virtual Res<void> remove(const std::string& key) = 0;

    [[nodiscard]] virtual Res<void> remove_multiple(const std::vector<std::string>& keys) = 0;

    [[nodiscard]] virtual Res<std::vector<std::string>> keys() = 0;
};

} // namespace tagsync::storage
