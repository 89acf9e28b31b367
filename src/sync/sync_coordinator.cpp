#include "sync/sync_coordinator.hpp"

#include "app/logging.hpp"
#include <QLoggingCategory>
#include <QScopeGuard>
#include <algorithm>
#include <set>

namespace tagsync::sync {

Q_LOGGING_CATEGORY(tagsyncSyncLog, "tagsync.sync")

namespace {

template<typename Entity>
bool same_remote_fields(const Entity& local, const Entity& remote) {
    return local == remote;
}

// The remote has no column for the manual-title flag.
template<>
bool same_remote_fields<Page>(const Page& local, const Page& remote) {
    Page normalized = remote;
    normalized.title_manually_edited = local.title_manually_edited;
    return local == normalized;
}

/**
 * Local entities the remote has not seen yet: missing upstream, older
 * upstream, or tied on updated_at with different content (local won the tie).
 */
template<typename Entity>
std::vector<const Entity*> needs_push(const std::map<std::string, Entity>& merged,
                                      const std::map<std::string, Entity>& remote) {
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : merged) {
        auto it = remote.find(id);
        if (it == remote.end()
            || it->second.updated_at < entity.updated_at
            || (it->second.updated_at == entity.updated_at && !same_remote_fields(entity, it->second))) {
            out.push_back(&entity);
        }
    }
    return out;
}

bool remote_confirms(const TombstoneKey& key, const Snapshot& remote) {
    if (key.kind == EntityKind::Tag) {
        auto it = remote.tags.find(key.id);
        return it == remote.tags.end() || it->second.deleted;
    }
    auto it = remote.pages.find(key.id);
    return it == remote.pages.end() || it->second.deleted;
}

bool remote_soft_deleted(const TombstoneKey& key, const Snapshot& remote) {
    if (key.kind == EntityKind::Tag) {
        auto it = remote.tags.find(key.id);
        return it != remote.tags.end() && it->second.deleted;
    }
    auto it = remote.pages.find(key.id);
    return it != remote.pages.end() && it->second.deleted;
}

bool present_locally(const TombstoneKey& key, const store::EntityStore& store) {
    return key.kind == EntityKind::Tag ? store.tag(key.id) != nullptr : store.page(key.id) != nullptr;
}

} // namespace

std::chrono::milliseconds RetryPolicy::delay_for(int failures) const {
    if (failures <= 0) {
        return base;
    }
    auto delay = base;
    for (int i = 1; i < failures && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}

SyncCoordinator::SyncCoordinator(store::EntityStore& store, RemoteReplica& remote, QObject* parent)
    : QObject(parent)
    , store_(store)
    , remote_(remote)
{
    qRegisterMetaType<tagsync::sync::SyncReport>();

    trigger_timer_.setSingleShot(true);
    trigger_timer_.setInterval(0);
    connect(&trigger_timer_, &QTimer::timeout, this, &SyncCoordinator::on_trigger);

    retry_timer_.setSingleShot(true);
    connect(&retry_timer_, &QTimer::timeout, this, &SyncCoordinator::request_sync);

    connect(&interval_timer_, &QTimer::timeout, this, &SyncCoordinator::request_sync);
}

SyncCoordinator::~SyncCoordinator() = default;

void SyncCoordinator::set_interval(std::chrono::milliseconds interval) {
    interval_timer_.setInterval(static_cast<int>(interval.count()));
    if (interval.count() <= 0) {
        interval_timer_.stop();
    }
}

void SyncCoordinator::start() {
    if (interval_timer_.interval() > 0) {
        interval_timer_.start();
    }
    request_sync();
}

void SyncCoordinator::stop() {
    interval_timer_.stop();
    retry_timer_.stop();
    trigger_timer_.stop();
    rerun_requested_ = false;
}

void SyncCoordinator::request_sync() {
    if (in_flight_) {
        rerun_requested_ = true;
        return;
    }
    if (!trigger_timer_.isActive()) {
        trigger_timer_.start();
    }
}

SyncStatus SyncCoordinator::status() const {
    return SyncStatus{
        .syncing = in_flight_,
        .last_sync_at = store_.last_sync_at(),
        .pending_tombstones = store_.tombstones().size(),
        .consecutive_failures = consecutive_failures_,
        .last_error = last_error_
    };
}

void SyncCoordinator::on_trigger() {
    auto result = run_cycle();
    if (result.is_err()) {
        // Fired during a cycle someone else started; run again once it ends.
        if (in_flight_) {
            rerun_requested_ = true;
            return;
        }
        schedule_retry();
        // The retry timer owns the next attempt.
        rerun_requested_ = false;
    } else {
        const auto& report = result.unwrap();
        // Pushed deletes are only cleared once a later pull observes them.
        if (report.pushed_deletes > 0 && !confirming_deletes_) {
            confirming_deletes_ = true;
            rerun_requested_ = true;
        } else {
            confirming_deletes_ = false;
        }
    }

    if (rerun_requested_) {
        rerun_requested_ = false;
        request_sync();
    }
}

void SyncCoordinator::schedule_retry() {
    const auto delay = retry_policy_.delay_for(consecutive_failures_);
    qCInfo(tagsyncSyncLog) << "retrying sync in" << delay.count() << "ms (failure"
                           << consecutive_failures_ << ")";
    retry_timer_.start(static_cast<int>(delay.count()));
}

Res<SyncReport> SyncCoordinator::run_cycle() {
    if (in_flight_) {
        return Res<SyncReport>::err(sync_error("sync already in progress"));
    }
    in_flight_ = true;
    auto reset_flag = qScopeGuard([this] { in_flight_ = false; });

    emit syncStarted();
    auto result = exchange();

    if (result.is_err()) {
        const auto& err = result.unwrap_err();
        ++consecutive_failures_;
        last_error_ = QString::fromStdString(err.message);
        qCWarning(tagsyncSyncLog) << "sync failed:" << last_error_;
        emit syncFailed(last_error_);
        return result;
    }

    consecutive_failures_ = 0;
    last_error_.clear();
    retry_timer_.stop();
    const auto& report = result.unwrap();
    if (app::sync_debug_enabled()) {
        qCInfo(tagsyncSyncLog) << "SYNC: done remote_tags=" << report.remote_tags
                               << "remote_pages=" << report.remote_pages
                               << "cleared=" << report.cleared_tombstones
                               << "revived=" << report.revived
                               << "deletes=" << report.pushed_deletes
                               << "upserts=" << report.pushed_upserts;
    }
    emit syncFinished(report);
    return result;
}

Res<SyncReport> SyncCoordinator::exchange() {
    SyncReport report;

    auto loaded = store_.ensure_loaded();
    if (loaded.is_err()) {
        return Res<SyncReport>::err(loaded.unwrap_err());
    }

    // 1. Pull. This may spin the event loop, so the local side is read after.
    auto pulled = remote_.fetch_snapshot();
    if (pulled.is_err()) {
        return Res<SyncReport>::err(pulled.unwrap_err());
    }
    auto remote = std::move(pulled).unwrap();
    report.remote_tags = remote.tags.size();
    report.remote_pages = remote.pages.size();

    auto reloaded = store_.ensure_loaded();
    if (reloaded.is_err()) {
        return Res<SyncReport>::err(reloaded.unwrap_err());
    }

    // A local creation the remote has not acknowledged outranks a soft
    // deleted row left upstream under the same id.
    const auto creations = store_.pending_creations();
    for (const auto& key : creations) {
        if (!present_locally(key, store_) || !remote_soft_deleted(key, remote)) {
            continue;
        }
        if (key.kind == EntityKind::Tag) {
            remote.tags.erase(key.id);
        } else {
            remote.pages.erase(key.id);
        }
        ++report.revived;
        if (app::sync_debug_enabled()) {
            qCInfo(tagsyncSyncLog) << "SYNC: re-created" << QString::fromStdString(key.to_string())
                                   << "over a remote soft delete";
        }
    }

    // 2-4. Merge and apply locally in one uninterrupted step.
    const auto ledger = store_.tombstones();
    auto merged = merge_snapshot(store_.snapshot(), remote, ledger, &report.merge);

    for (const auto& key : ledger.keys()) {
        if (remote_confirms(key, remote) && store_.clear_tombstone(key)) {
            ++report.cleared_tombstones;
            if (app::sync_debug_enabled()) {
                qCInfo(tagsyncSyncLog) << "SYNC: remote confirmed delete of"
                                       << QString::fromStdString(key.to_string());
            }
        }
    }

    const auto push_tags = needs_push(merged.tags, remote.tags);
    const auto push_pages = needs_push(merged.pages, remote.pages);

    // Copies for pushing; the merged snapshot moves into the store.
    std::vector<Tag> tags_out;
    std::vector<Page> pages_out;
    tags_out.reserve(push_tags.size());
    pages_out.reserve(push_pages.size());
    for (const auto* t : push_tags) tags_out.push_back(*t);
    for (const auto* p : push_pages) pages_out.push_back(*p);

    store_.replace_collections(std::move(merged));
    auto committed = store_.commit();
    if (committed.is_err()) {
        store_.invalidate();
        return Res<SyncReport>::err(committed.unwrap_err());
    }

    // 5. Push. Deletes first so a re-created id cannot be soft-deleted after
    // its replacement was uploaded.
    std::optional<Error> first_failure;
    const auto pending = store_.tombstones().keys();
    const auto now = store_.now();
    for (const auto& key : pending) {
        auto pushed = remote_.mark_deleted(key, now);
        if (pushed.is_err()) {
            ++report.failed_pushes;
            if (!first_failure) first_failure = pushed.unwrap_err();
            continue;
        }
        ++report.pushed_deletes;
    }
    std::set<TombstoneKey> failed_upserts;
    for (const auto& tag : tags_out) {
        auto pushed = remote_.upsert_tag(tag);
        if (pushed.is_err()) {
            ++report.failed_pushes;
            failed_upserts.insert(TombstoneKey{EntityKind::Tag, tag.id});
            if (!first_failure) first_failure = pushed.unwrap_err();
            continue;
        }
        ++report.pushed_upserts;
    }
    for (const auto& page : pages_out) {
        auto pushed = remote_.upsert_page(page);
        if (pushed.is_err()) {
            ++report.failed_pushes;
            failed_upserts.insert(TombstoneKey{EntityKind::Page, page.id});
            if (!first_failure) first_failure = pushed.unwrap_err();
            continue;
        }
        ++report.pushed_upserts;
    }

    // Creations that went up, or that the remote already holds live.
    for (const auto& key : creations) {
        if (!failed_upserts.contains(key)) {
            store_.clear_pending_creation(key);
        }
    }
    auto acknowledged = store_.commit();
    if (acknowledged.is_err()) {
        store_.invalidate();
        return Res<SyncReport>::err(acknowledged.unwrap_err());
    }

    if (first_failure) {
        // The merge is already applied; whatever did not go up is retried
        // on the next cycle because it still differs from the remote.
        return Res<SyncReport>::err(sync_error(
            std::to_string(report.failed_pushes) + " push(es) failed, first: " + first_failure->message,
            first_failure->code));
    }

    report.finished_at = store_.now();
    store_.set_last_sync_at(report.finished_at);
    auto stamped = store_.commit();
    if (stamped.is_err()) {
        store_.invalidate();
        return Res<SyncReport>::err(stamped.unwrap_err());
    }
    return Res<SyncReport>::ok(report);
}

} // namespace tagsync::sync
