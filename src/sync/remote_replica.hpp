#pragma once

#include "core/entities.hpp"
#include "core/result.hpp"
#include "core/tombstone.hpp"
#include "core/types.hpp"

namespace tagsync::sync {

/**
 * RemoteReplica - the upstream copy of both collections.
 *
 * Every failure is an ErrorKind::Sync error. Calls block the caller until
 * the exchange completes or times out.
 */
class RemoteReplica {
public:
    virtual ~RemoteReplica() = default;

    /**
     * Every remote row, including soft-deleted ones (`deleted == true`).
     */
    [[nodiscard]] virtual Res<Snapshot> fetch_snapshot() = 0;

    [[nodiscard]] virtual Res<void> upsert_tag(const Tag& tag) = 0;
    [[nodiscard]] virtual Res<void> upsert_page(const Page& page) = 0;

    /**
     * Soft-delete one row (deleted = true, updated_at = `when`). Deleting a
     * row the remote never had is not an error.
     */
    [[nodiscard]] virtual Res<void> mark_deleted(const TombstoneKey& key, Timestamp when) = 0;
};

} // namespace tagsync::sync
