#include "app/handlers.hpp"

#include "core/json_codec.hpp"
#include "core/validation.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <set>

namespace tagsync::app {

Q_LOGGING_CATEGORY(tagsyncHandlersLog, "tagsync.pipeline.handlers")

namespace {

using store::EntityStore;

std::string string_field(const QJsonObject& payload, const char* key) {
    return payload.value(QLatin1String(key)).toString().toStdString();
}

std::optional<std::string> optional_string_field(const QJsonObject& payload, const char* key) {
    const auto value = payload.value(QLatin1String(key));
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString().toStdString();
}

Res<std::string> required_id(const QJsonObject& payload, const char* key) {
    return require_id(string_field(payload, key), key);
}

// Trimmed, non-empty, de-duplicated strings in first-seen order.
std::vector<std::string> string_list(const QJsonObject& payload, const char* key) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& entry : payload.value(QLatin1String(key)).toArray()) {
        if (!entry.isString()) continue;
        auto s = trimmed(entry.toString().toStdString());
        if (!s.empty() && seen.insert(s).second) {
            out.push_back(std::move(s));
        }
    }
    return out;
}

template<typename T>
Res<QJsonValue> fail(const Res<T>& r) {
    return Res<QJsonValue>::err(r.unwrap_err());
}

Res<QJsonValue> done(QJsonValue value = QJsonValue()) {
    return Res<QJsonValue>::ok(std::move(value));
}

QJsonValue optional_timestamp(const std::optional<Timestamp>& t) {
    return t ? QJsonValue(static_cast<qint64>(t->millis())) : QJsonValue();
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

Res<QJsonValue> get_all_tags(EntityStore& store, const QJsonObject&) {
    QJsonArray out;
    for (const auto& tag : store.all_tags()) {
        out.append(tag_to_json(tag));
    }
    return done(out);
}

Res<QJsonValue> get_all_tagged_pages(EntityStore& store, const QJsonObject& payload) {
    std::optional<std::string> tag_id;
    if (auto id = trimmed(string_field(payload, "tagId")); !id.empty()) {
        tag_id = std::move(id);
    }
    QJsonArray out;
    for (const auto& page : store.tagged_pages(tag_id)) {
        out.append(page_to_json(page));
    }
    return done(out);
}

Res<QJsonValue> get_page(EntityStore& store, const QJsonObject& payload) {
    const auto id = trimmed(string_field(payload, "pageId"));
    const auto url = trimmed(string_field(payload, "url"));
    if (id.empty() && url.empty()) {
        return Res<QJsonValue>::err(validation_error("pageId or url is required"));
    }
    const Page* page = id.empty() ? store.page_by_url(url) : store.page(id);
    if (!page) {
        return done(QJsonValue::Null);
    }
    return done(page_to_json(*page));
}

Res<QJsonValue> get_tag_usage_counts(EntityStore& store, const QJsonObject&) {
    QJsonObject out;
    for (const auto& [id, count] : store.tag_usage_counts()) {
        out.insert(to_qstring(id), static_cast<qint64>(count));
    }
    return done(out);
}

Res<QJsonValue> get_data_stats(EntityStore& store, const QJsonObject&) {
    const auto stats = store.stats();
    return done(QJsonObject{
        {"tagsCount", static_cast<qint64>(stats.tags_count)},
        {"pagesCount", static_cast<qint64>(stats.pages_count)},
        {"taggedPagesCount", static_cast<qint64>(stats.tagged_pages_count)},
        {"pendingTombstones", static_cast<qint64>(stats.pending_tombstones)},
        {"lastSyncAt", optional_timestamp(store.last_sync_at())},
    });
}

Res<QJsonValue> local_sync_status(EntityStore& store, const QJsonObject&) {
    return done(QJsonObject{
        {"enabled", false},
        {"syncing", false},
        {"lastSyncAt", optional_timestamp(store.last_sync_at())},
        {"pendingTombstones", static_cast<qint64>(store.tombstones().size())},
    });
}

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------

Res<QJsonValue> create_tag(EntityStore& store, const QJsonObject& payload) {
    auto created = store.create_tag(string_field(payload, "name"),
                                    optional_string_field(payload, "description"),
                                    optional_string_field(payload, "color"));
    if (created.is_err()) return fail(created);
    return done(tag_to_json(created.unwrap()));
}

Res<QJsonValue> update_tag(EntityStore& store, const QJsonObject& payload) {
    auto id = required_id(payload, "tagId");
    if (id.is_err()) return fail(id);
    auto renamed = store.rename_tag(id.unwrap(), string_field(payload, "name"));
    if (renamed.is_err()) return fail(renamed);
    return done(tag_to_json(renamed.unwrap()));
}

Res<QJsonValue> delete_tag(EntityStore& store, const QJsonObject& payload) {
    auto id = required_id(payload, "tagId");
    if (id.is_err()) return fail(id);
    auto deleted = store.delete_tag(id.unwrap());
    if (deleted.is_err()) return fail(deleted);
    return done();
}

Res<QJsonValue> bind_tags(EntityStore& store, const QJsonObject& payload) {
    auto a = required_id(payload, "tagId");
    if (a.is_err()) return fail(a);
    auto b = required_id(payload, "otherTagId");
    if (b.is_err()) return fail(b);
    auto bound = store.bind_tags(a.unwrap(), b.unwrap());
    if (bound.is_err()) return fail(bound);
    return done();
}

Res<QJsonValue> unbind_tags(EntityStore& store, const QJsonObject& payload) {
    auto a = required_id(payload, "tagId");
    if (a.is_err()) return fail(a);
    auto b = required_id(payload, "otherTagId");
    if (b.is_err()) return fail(b);
    auto unbound = store.unbind_tags(a.unwrap(), b.unwrap());
    if (unbound.is_err()) return fail(unbound);
    return done();
}

// ---------------------------------------------------------------------------
// Pages
// ---------------------------------------------------------------------------

Res<QJsonValue> register_page(EntityStore& store, const QJsonObject& payload) {
    auto page = store.create_or_update_page(string_field(payload, "url"),
                                            string_field(payload, "title"),
                                            optional_string_field(payload, "favicon"));
    if (page.is_err()) return fail(page);
    return done(page_to_json(page.unwrap()));
}

Res<QJsonValue> update_page_title(EntityStore& store, const QJsonObject& payload) {
    auto id = required_id(payload, "pageId");
    if (id.is_err()) return fail(id);
    auto page = store.update_page_title(id.unwrap(), string_field(payload, "title"));
    if (page.is_err()) return fail(page);
    return done(page_to_json(page.unwrap()));
}

Res<QJsonValue> add_tag_to_page(EntityStore& store, const QJsonObject& payload) {
    auto page_id = required_id(payload, "pageId");
    if (page_id.is_err()) return fail(page_id);
    auto tag_id = required_id(payload, "tagId");
    if (tag_id.is_err()) return fail(tag_id);
    auto page = store.add_tag_to_page(page_id.unwrap(), tag_id.unwrap());
    if (page.is_err()) return fail(page);
    return done(page_to_json(page.unwrap()));
}

Res<QJsonValue> remove_tag_from_page(EntityStore& store, const QJsonObject& payload) {
    auto page_id = required_id(payload, "pageId");
    if (page_id.is_err()) return fail(page_id);
    auto tag_id = required_id(payload, "tagId");
    if (tag_id.is_err()) return fail(tag_id);
    auto page = store.remove_tag_from_page(page_id.unwrap(), tag_id.unwrap());
    if (page.is_err()) return fail(page);
    return done(page_to_json(page.unwrap()));
}

Res<QJsonValue> create_tag_and_add_to_page(EntityStore& store, const QJsonObject& payload) {
    auto page_id = required_id(payload, "pageId");
    if (page_id.is_err()) return fail(page_id);
    auto page = store.create_tag_and_add_to_page(string_field(payload, "tagName"), page_id.unwrap());
    if (page.is_err()) return fail(page);
    return done(page_to_json(page.unwrap()));
}

/**
 * tagsToAdd are names (created when missing); tagsToRemove are ids or
 * names, unknown ones are skipped. Every name is validated up front.
 */
Res<QJsonValue> update_page_tags(EntityStore& store, const QJsonObject& payload) {
    auto page_id = required_id(payload, "pageId");
    if (page_id.is_err()) return fail(page_id);
    if (!store.page(page_id.unwrap())) {
        return Res<QJsonValue>::err(business_error("page not found: " + page_id.unwrap()));
    }

    const auto to_add = string_list(payload, "tagsToAdd");
    const auto to_remove = string_list(payload, "tagsToRemove");
    for (const auto& name : to_add) {
        if (auto valid = validate_tag_name(name); valid.is_err()) return fail(valid);
    }

    for (const auto& name : to_add) {
        auto added = store.create_tag_and_add_to_page(name, page_id.unwrap());
        if (added.is_err()) return fail(added);
    }
    for (const auto& identifier : to_remove) {
        const Tag* tag = store.tag(identifier);
        if (!tag) tag = store.find_tag_by_name(identifier);
        if (!tag) {
            qCDebug(tagsyncHandlersLog) << "updatePageTags: no tag" << to_qstring(identifier);
            continue;
        }
        auto removed = store.remove_tag_from_page(page_id.unwrap(), tag->id);
        if (removed.is_err()) return fail(removed);
    }

    return done(page_to_json(*store.page(page_id.unwrap())));
}

Res<QJsonValue> delete_page(EntityStore& store, const QJsonObject& payload) {
    auto id = required_id(payload, "pageId");
    if (id.is_err()) return fail(id);
    auto deleted = store.delete_page(id.unwrap());
    if (deleted.is_err()) return fail(deleted);
    return done();
}

// ---------------------------------------------------------------------------
// Bulk
// ---------------------------------------------------------------------------

Res<QJsonValue> export_data(EntityStore& store, const QJsonObject&) {
    return done(store.export_json());
}

Res<QJsonValue> import_data(EntityStore& store, const QJsonObject& payload) {
    const auto data = payload.value(QStringLiteral("data"));
    QByteArray document;
    if (data.isString()) {
        document = data.toString().toUtf8();
    } else if (data.isObject()) {
        document = to_bytes(data.toObject());
    } else {
        return Res<QJsonValue>::err(validation_error("data must be an export document"));
    }

    auto imported = store.import_json(document, payload.value(QStringLiteral("mergeMode")).toBool(false));
    if (imported.is_err()) return fail(imported);
    const auto& summary = imported.unwrap();
    return done(QJsonObject{
        {"tagsCount", static_cast<qint64>(summary.tags_count)},
        {"pagesCount", static_cast<qint64>(summary.pages_count)},
    });
}

} // namespace

QJsonObject sync_status_to_json(const sync::SyncStatus& status) {
    QJsonObject out{
        {"enabled", true},
        {"syncing", status.syncing},
        {"lastSyncAt", optional_timestamp(status.last_sync_at)},
        {"pendingTombstones", static_cast<qint64>(status.pending_tombstones)},
        {"consecutiveFailures", status.consecutive_failures},
    };
    if (!status.last_error.isEmpty()) {
        out.insert("lastError", status.last_error);
    }
    return out;
}

QJsonObject sync_report_to_json(const sync::SyncReport& report) {
    return QJsonObject{
        {"remoteTags", static_cast<qint64>(report.remote_tags)},
        {"remotePages", static_cast<qint64>(report.remote_pages)},
        {"keptLocal", static_cast<qint64>(report.merge.kept_local)},
        {"takenRemote", static_cast<qint64>(report.merge.taken_remote)},
        {"excludedTombstoned", static_cast<qint64>(report.merge.excluded_tombstoned)},
        {"excludedRemoteDeleted", static_cast<qint64>(report.merge.excluded_remote_deleted)},
        {"clearedTombstones", static_cast<qint64>(report.cleared_tombstones)},
        {"revived", static_cast<qint64>(report.revived)},
        {"pushedDeletes", static_cast<qint64>(report.pushed_deletes)},
        {"pushedUpserts", static_cast<qint64>(report.pushed_upserts)},
        {"finishedAt", static_cast<qint64>(report.finished_at.millis())},
    };
}

void register_store_handlers(CommandPipeline& pipeline) {
    pipeline.register_handler(QStringLiteral("getAllTags"), get_all_tags);
    pipeline.register_handler(QStringLiteral("getAllTaggedPages"), get_all_tagged_pages);
    pipeline.register_handler(QStringLiteral("getPage"), get_page);
    pipeline.register_handler(QStringLiteral("getTagUsageCounts"), get_tag_usage_counts);
    pipeline.register_handler(QStringLiteral("getDataStats"), get_data_stats);
    pipeline.register_handler(QStringLiteral("getSyncStatus"), local_sync_status);

    pipeline.register_handler(QStringLiteral("createTag"), create_tag);
    pipeline.register_handler(QStringLiteral("updateTag"), update_tag);
    pipeline.register_handler(QStringLiteral("deleteTag"), delete_tag);
    pipeline.register_handler(QStringLiteral("bindTags"), bind_tags);
    pipeline.register_handler(QStringLiteral("unbindTags"), unbind_tags);

    pipeline.register_handler(QStringLiteral("registerPage"), register_page);
    pipeline.register_handler(QStringLiteral("updatePageTitle"), update_page_title);
    pipeline.register_handler(QStringLiteral("addTagToPage"), add_tag_to_page);
    pipeline.register_handler(QStringLiteral("removeTagFromPage"), remove_tag_from_page);
    pipeline.register_handler(QStringLiteral("createTagAndAddToPage"), create_tag_and_add_to_page);
    pipeline.register_handler(QStringLiteral("updatePageTags"), update_page_tags);
    pipeline.register_handler(QStringLiteral("deletePage"), delete_page);

    pipeline.register_handler(QStringLiteral("exportData"), export_data);
    pipeline.register_handler(QStringLiteral("importData"), import_data);
}

void register_sync_handlers(CommandPipeline& pipeline, sync::SyncCoordinator& coordinator) {
    pipeline.register_handler(QStringLiteral("getSyncStatus"),
                              [&coordinator](EntityStore&, const QJsonObject&) -> Res<QJsonValue> {
                                  return Res<QJsonValue>::ok(sync_status_to_json(coordinator.status()));
                              });
}

} // namespace tagsync::app
