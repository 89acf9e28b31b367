#include "core/merge.hpp"

#include <QLoggingCategory>
#include <QString>

namespace tagsync {

Q_LOGGING_CATEGORY(tagsyncMergeLog, "tagsync.merge")

namespace {

enum class Resolution {
    KeepLocal,
    TakeRemote,
    ExcludeTombstoned,
    ExcludeRemoteDeleted
};

template<typename Entity>
Resolution resolve(const Entity* local, const Entity* remote, bool tombstoned) {
    if (tombstoned) {
        return Resolution::ExcludeTombstoned;
    }
    if (remote == nullptr) {
        return Resolution::KeepLocal;
    }
    if (remote->deleted) {
        return Resolution::ExcludeRemoteDeleted;
    }
    if (local == nullptr) {
        return Resolution::TakeRemote;
    }
    return local->updated_at >= remote->updated_at ? Resolution::KeepLocal
                                                   : Resolution::TakeRemote;
}

QString describe(EntityKind kind, const std::string& id) {
    return QString::fromUtf8(entity_kind_name(kind).data(),
                             static_cast<qsizetype>(entity_kind_name(kind).size()))
        + QLatin1Char(':') + QString::fromStdString(id);
}

} // namespace

template<typename Entity>
std::map<std::string, Entity> merge_collection(
    const std::map<std::string, Entity>& local,
    const std::map<std::string, Entity>& remote,
    const TombstoneLedger& tombstones,
    MergeStats* stats) {
    constexpr EntityKind kind = EntityTraits<Entity>::kind;

    std::map<std::string, Entity> merged;
    MergeStats tally;

    auto visit = [&](const std::string& id, const Entity* l, const Entity* r) {
        switch (resolve(l, r, tombstones.is_pending(kind, id))) {
            case Resolution::KeepLocal:
                merged.emplace(id, *l);
                ++tally.kept_local;
                break;
            case Resolution::TakeRemote:
                merged.emplace(id, *r);
                ++tally.taken_remote;
                break;
            case Resolution::ExcludeTombstoned:
                ++tally.excluded_tombstoned;
                qCDebug(tagsyncMergeLog) << "skip tombstoned" << describe(kind, id)
                                         << (r ? "(remote still has it)" : "(confirmed absent)");
                break;
            case Resolution::ExcludeRemoteDeleted:
                ++tally.excluded_remote_deleted;
                qCDebug(tagsyncMergeLog) << "skip remote-deleted" << describe(kind, id);
                break;
        }
    };

    // Both maps are ordered by id; walk them together.
    auto li = local.begin();
    auto ri = remote.begin();
    while (li != local.end() || ri != remote.end()) {
        if (ri == remote.end() || (li != local.end() && li->first < ri->first)) {
            visit(li->first, &li->second, nullptr);
            ++li;
        } else if (li == local.end() || ri->first < li->first) {
            visit(ri->first, nullptr, &ri->second);
            ++ri;
        } else {
            visit(li->first, &li->second, &ri->second);
            ++li;
            ++ri;
        }
    }

    if (stats) {
        *stats += tally;
    }
    return merged;
}

template std::map<std::string, Tag> merge_collection<Tag>(
    const std::map<std::string, Tag>&, const std::map<std::string, Tag>&,
    const TombstoneLedger&, MergeStats*);
template std::map<std::string, Page> merge_collection<Page>(
    const std::map<std::string, Page>&, const std::map<std::string, Page>&,
    const TombstoneLedger&, MergeStats*);

Snapshot merge_snapshot(const Snapshot& local,
                        const Snapshot& remote,
                        const TombstoneLedger& tombstones,
                        MergeStats* stats) {
    return Snapshot{
        .tags = merge_collection(local.tags, remote.tags, tombstones, stats),
        .pages = merge_collection(local.pages, remote.pages, tombstones, stats)
    };
}

} // namespace tagsync
