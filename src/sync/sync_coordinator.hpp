#pragma once

#include "core/merge.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "store/entity_store.hpp"
#include "sync/remote_replica.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>
#include <chrono>
#include <optional>

namespace tagsync::sync {

/**
 * What one sync cycle did.
 */
struct SyncReport {
    size_t remote_tags = 0;
    size_t remote_pages = 0;
    MergeStats merge;
    size_t cleared_tombstones = 0;
    size_t revived = 0;
    size_t pushed_deletes = 0;
    size_t pushed_upserts = 0;
    size_t failed_pushes = 0;
    Timestamp finished_at;
};

struct SyncStatus {
    bool syncing = false;
    std::optional<Timestamp> last_sync_at;
    size_t pending_tombstones = 0;
    int consecutive_failures = 0;
    QString last_error;
};

/**
 * Exponential backoff: base, 2*base, 4*base, ... capped at max.
 */
struct RetryPolicy {
    std::chrono::milliseconds base{2000};
    std::chrono::milliseconds max{300000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int failures) const;
};

/**
 * SyncCoordinator - reconciles the entity store with a remote replica.
 *
 * One cycle:
 *   1. pull the remote snapshot
 *   2. merge it with the local snapshot under the tombstone ledger
 *   3. drop tombstones the remote confirms (id absent or soft-deleted)
 *   4. swap the merged collections in and commit them in one write
 *   5. push pending deletes, then entities where the local copy won
 *
 * Steps 2-4 run without yielding to the event loop, so no command can
 * interleave with them. Cycles are single-flight; triggers that arrive
 * while one is running are coalesced into one follow-up cycle. Failures
 * are logged and retried with backoff and never reach command callers.
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

public:
    SyncCoordinator(store::EntityStore& store, RemoteReplica& remote, QObject* parent = nullptr);
    ~SyncCoordinator() override;

    void set_retry_policy(RetryPolicy policy) { retry_policy_ = policy; }

    /**
     * Period for background cycles; zero disables them.
     */
    void set_interval(std::chrono::milliseconds interval);

    void start();
    void stop();

    /**
     * Run one cycle now. Fails with a Sync error if a cycle is in flight.
     */
    [[nodiscard]] Res<SyncReport> run_cycle();

    [[nodiscard]] bool in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] SyncStatus status() const;

public slots:
    /**
     * Ask for a cycle soon. Never blocks and never fails.
     */
    void request_sync();

signals:
    void syncStarted();
    void syncFinished(const tagsync::sync::SyncReport& report);
    void syncFailed(const QString& message);

private:
    void on_trigger();
    void schedule_retry();

    [[nodiscard]] Res<SyncReport> exchange();

    store::EntityStore& store_;
    RemoteReplica& remote_;
    RetryPolicy retry_policy_;

    QTimer trigger_timer_;
    QTimer retry_timer_;
    QTimer interval_timer_;

    bool in_flight_ = false;
    bool rerun_requested_ = false;
    bool confirming_deletes_ = false;
    int consecutive_failures_ = 0;
    QString last_error_;
};

} // namespace tagsync::sync

Q_DECLARE_METATYPE(tagsync::sync::SyncReport)
