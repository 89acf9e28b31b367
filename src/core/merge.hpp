#pragma once

#include "core/entities.hpp"
#include "core/tombstone.hpp"
#include <cstddef>

namespace tagsync {

/**
 * Per-collection tally of how each id was resolved. Purely informational.
 */
struct MergeStats {
    size_t kept_local = 0;
    size_t taken_remote = 0;
    size_t excluded_tombstoned = 0;
    size_t excluded_remote_deleted = 0;

    MergeStats& operator+=(const MergeStats& other) {
        kept_local += other.kept_local;
        taken_remote += other.taken_remote;
        excluded_tombstoned += other.excluded_tombstoned;
        excluded_remote_deleted += other.excluded_remote_deleted;
        return *this;
    }
};

/**
 * Reconcile a local and a remote copy of one collection.
 *
 * For every id in the union of both key sets:
 *   - pending tombstone: excluded, whatever the remote holds
 *   - remote copy flagged deleted: excluded
 *   - local only: kept as is
 *   - remote only: taken from remote
 *   - both: the larger updated_at wins, local on a tie
 *
 * Deterministic and free of side effects apart from debug logging.
 */
template<typename Entity>
[[nodiscard]] std::map<std::string, Entity> merge_collection(
    const std::map<std::string, Entity>& local,
    const std::map<std::string, Entity>& remote,
    const TombstoneLedger& tombstones,
    MergeStats* stats = nullptr);

/**
 * Merge both collections of a snapshot.
 */
[[nodiscard]] Snapshot merge_snapshot(const Snapshot& local,
                                      const Snapshot& remote,
                                      const TombstoneLedger& tombstones,
                                      MergeStats* stats = nullptr);

extern template std::map<std::string, Tag> merge_collection<Tag>(
    const std::map<std::string, Tag>&, const std::map<std::string, Tag>&,
    const TombstoneLedger&, MergeStats*);
extern template std::map<std::string, Page> merge_collection<Page>(
    const std::map<std::string, Page>&, const std::map<std::string, Page>&,
    const TombstoneLedger&, MergeStats*);

} // namespace tagsync
