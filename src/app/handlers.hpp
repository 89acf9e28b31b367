#pragma once

#include "app/command_pipeline.hpp"
#include "sync/sync_coordinator.hpp"
#include <QJsonObject>

namespace tagsync::app {

/**
 * Register every tag/page/import/export operation on `pipeline`.
 *
 * Payload keys are camelCase (`tagId`, `pageId`, `name`, ...). A missing or
 * blank required key is a Validation error raised before the store is
 * touched.
 */
void register_store_handlers(CommandPipeline& pipeline);

/**
 * Register `getSyncStatus`. `coordinator` must outlive `pipeline`.
 */
void register_sync_handlers(CommandPipeline& pipeline, sync::SyncCoordinator& coordinator);

/**
 * {syncing, lastSyncAt, pendingTombstones, consecutiveFailures, lastError}
 */
[[nodiscard]] QJsonObject sync_status_to_json(const sync::SyncStatus& status);

[[nodiscard]] QJsonObject sync_report_to_json(const sync::SyncReport& report);

} // namespace tagsync::app
