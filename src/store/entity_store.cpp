#include "store/entity_store.hpp"

#include "core/json_codec.hpp"
#include "core/validation.hpp"
#include <QJsonArray>
#include <QLoggingCategory>
#include <QString>
#include <algorithm>

namespace tagsync::store {

Q_LOGGING_CATEGORY(tagsyncStoreLog, "tagsync.store")

namespace {

bool same_name(const std::string& a, const std::string& b) {
    return QString::compare(QString::fromStdString(a), QString::fromStdString(b),
                            Qt::CaseInsensitive) == 0;
}

Res<QJsonValue> decode_stored(const std::map<std::string, std::string>& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return Res<QJsonValue>::ok(QJsonValue());
    }
    auto parsed = parse_json(QByteArray::fromStdString(it->second), ErrorKind::Persistence);
    if (parsed.is_err()) {
        return Res<QJsonValue>::err(persistence_error(
            std::string("stored value for ") + key + " is corrupt: " + parsed.unwrap_err().message));
    }
    return parsed;
}

QJsonArray keys_to_json(const std::set<TombstoneKey>& keys) {
    QJsonArray arr;
    for (const auto& key : keys) {
        arr.append(QString::fromStdString(key.to_string()));
    }
    return arr;
}

std::set<TombstoneKey> keys_from_json(const QJsonValue& value) {
    std::set<TombstoneKey> keys;
    for (const auto& item : value.toArray()) {
        auto key = TombstoneKey::parse(item.toString().toStdString());
        if (key) {
            keys.insert(std::move(*key));
        } else {
            qCWarning(tagsyncStoreLog) << "ignoring malformed pending creation" << item.toString();
        }
    }
    return keys;
}

} // namespace

EntityStore::EntityStore(storage::BackingStore& backing, const Clock& clock)
    : backing_(backing)
    , clock_(clock)
{
}

// ============================================================================
// Lifecycle
// ============================================================================

Res<void> EntityStore::ensure_loaded() {
    if (loaded_) {
        return Res<void>::ok();
    }

    auto values = backing_.get_multiple({storage::keys::kTags,
                                         storage::keys::kPages,
                                         storage::keys::kTombstones,
                                         storage::keys::kPendingCreations,
                                         storage::keys::kLastSyncAt});
    if (values.is_err()) {
        return Res<void>::err(values.unwrap_err());
    }
    const auto& stored = values.unwrap();

    auto tags_json = decode_stored(stored, storage::keys::kTags);
    if (tags_json.is_err()) return Res<void>::err(tags_json.unwrap_err());
    auto pages_json = decode_stored(stored, storage::keys::kPages);
    if (pages_json.is_err()) return Res<void>::err(pages_json.unwrap_err());
    auto tombstones_json = decode_stored(stored, storage::keys::kTombstones);
    if (tombstones_json.is_err()) return Res<void>::err(tombstones_json.unwrap_err());
    auto creations_json = decode_stored(stored, storage::keys::kPendingCreations);
    if (creations_json.is_err()) return Res<void>::err(creations_json.unwrap_err());

    const auto now = clock_.now();
    size_t dropped = 0;
    tags_ = normalize_tags(tags_json.unwrap(), now, &dropped);
    pages_ = normalize_pages(pages_json.unwrap(), now, &dropped);
    tombstones_ = tombstones_from_json(tombstones_json.unwrap());
    pending_creations_ = keys_from_json(creations_json.unwrap());
    if (dropped > 0) {
        qCWarning(tagsyncStoreLog) << "rehydrate dropped" << dropped << "invalid entries";
    }

    last_sync_at_.reset();
    if (auto it = stored.find(storage::keys::kLastSyncAt); it != stored.end()) {
        bool ok = false;
        const auto millis = QByteArray::fromStdString(it->second).toLongLong(&ok);
        if (ok) {
            last_sync_at_ = Timestamp(millis);
        }
    }

    loaded_ = true;
    dirty_tags_ = dirty_pages_ = dirty_tombstones_ = dirty_creations_ = dirty_meta_ = false;
    qCDebug(tagsyncStoreLog) << "rehydrated" << tags_.size() << "tags," << pages_.size()
                             << "pages," << tombstones_.size() << "tombstones";
    return Res<void>::ok();
}

void EntityStore::invalidate() {
    tags_.clear();
    pages_.clear();
    tombstones_.clear();
    pending_creations_.clear();
    last_sync_at_.reset();
    loaded_ = false;
    dirty_tags_ = dirty_pages_ = dirty_tombstones_ = dirty_creations_ = dirty_meta_ = false;
}

Res<void> EntityStore::commit() {
    if (!is_dirty()) {
        return Res<void>::ok();
    }

    std::map<std::string, std::string> entries;
    if (dirty_tags_) {
        entries.emplace(storage::keys::kTags, to_bytes(tags_to_json(tags_)).toStdString());
    }
    if (dirty_pages_) {
        entries.emplace(storage::keys::kPages, to_bytes(pages_to_json(pages_)).toStdString());
    }
    if (dirty_tombstones_) {
        entries.emplace(storage::keys::kTombstones, to_bytes(tombstones_to_json(tombstones_)).toStdString());
    }
    if (dirty_creations_) {
        entries.emplace(storage::keys::kPendingCreations, to_bytes(keys_to_json(pending_creations_)).toStdString());
    }
    if (dirty_meta_ && last_sync_at_) {
        entries.emplace(storage::keys::kLastSyncAt, std::to_string(last_sync_at_->millis()));
    }

    auto written = backing_.set_multiple(entries);
    if (written.is_err()) {
        qCWarning(tagsyncStoreLog) << "commit failed:" << QString::fromStdString(written.unwrap_err().message);
        auto err = written.unwrap_err();
        err.kind = ErrorKind::Persistence;
        return Res<void>::err(std::move(err));
    }

    dirty_tags_ = dirty_pages_ = dirty_tombstones_ = dirty_creations_ = dirty_meta_ = false;
    return Res<void>::ok();
}

Res<void> EntityStore::require_loaded() const {
    if (!loaded_) {
        return Res<void>::err(Error("entity store used before rehydration", 0, ErrorKind::Internal));
    }
    return Res<void>::ok();
}

// ============================================================================
// Reads
// ============================================================================

std::vector<Tag> EntityStore::all_tags() const {
    std::vector<Tag> out;
    out.reserve(tags_.size());
    for (const auto& [id, tag] : tags_) {
        out.push_back(tag);
    }
    std::stable_sort(out.begin(), out.end(), [](const Tag& a, const Tag& b) {
        return QString::compare(QString::fromStdString(a.name), QString::fromStdString(b.name),
                                Qt::CaseInsensitive) < 0;
    });
    return out;
}

const Tag* EntityStore::tag(const std::string& id) const {
    auto it = tags_.find(id);
    return it == tags_.end() ? nullptr : &it->second;
}

const Tag* EntityStore::find_tag_by_name(const std::string& name) const {
    const auto wanted = trimmed(name);
    for (const auto& [id, tag] : tags_) {
        if (same_name(tag.name, wanted)) {
            return &tag;
        }
    }
    return nullptr;
}

const Page* EntityStore::page(const std::string& id) const {
    auto it = pages_.find(id);
    return it == pages_.end() ? nullptr : &it->second;
}

const Page* EntityStore::page_by_url(const std::string& url) const {
    return page(generate_page_id(trimmed(url)));
}

std::vector<Page> EntityStore::tagged_pages(const std::optional<std::string>& tag_id) const {
    std::vector<Page> out;
    for (const auto& [id, page] : pages_) {
        const bool matches = tag_id ? page.tags.contains(*tag_id) : !page.tags.empty();
        if (matches) {
            out.push_back(page);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Page& a, const Page& b) {
        return a.updated_at > b.updated_at;
    });
    return out;
}

std::map<std::string, size_t> EntityStore::tag_usage_counts() const {
    std::map<std::string, size_t> counts;
    for (const auto& [id, tag] : tags_) {
        counts.emplace(id, 0);
    }
    for (const auto& [id, page] : pages_) {
        for (const auto& tag_id : page.tags) {
            if (auto it = counts.find(tag_id); it != counts.end()) {
                ++it->second;
            }
        }
    }
    return counts;
}

DataStats EntityStore::stats() const {
    DataStats stats;
    stats.tags_count = tags_.size();
    stats.pages_count = pages_.size();
    stats.tagged_pages_count = static_cast<size_t>(
        std::count_if(pages_.begin(), pages_.end(), [](const auto& kv) { return !kv.second.tags.empty(); }));
    stats.pending_tombstones = tombstones_.size();
    return stats;
}

// ============================================================================
// Internal helpers
// ============================================================================

Tag* EntityStore::mutable_tag(const std::string& id) {
    auto it = tags_.find(id);
    return it == tags_.end() ? nullptr : &it->second;
}

Page* EntityStore::mutable_page(const std::string& id) {
    auto it = pages_.find(id);
    return it == pages_.end() ? nullptr : &it->second;
}

void EntityStore::put_tag(Tag tag) {
    auto id = tag.id;
    tags_.insert_or_assign(std::move(id), std::move(tag));
    dirty_tags_ = true;
}

void EntityStore::put_page(Page page) {
    auto id = page.id;
    pages_.insert_or_assign(std::move(id), std::move(page));
    dirty_pages_ = true;
}

void EntityStore::record_tombstone(EntityKind kind, const std::string& id) {
    if (tombstones_.record_deletion(kind, id)) {
        dirty_tombstones_ = true;
    }
    if (pending_creations_.erase(TombstoneKey{kind, id}) > 0) {
        dirty_creations_ = true;
    }
}

void EntityStore::revive(EntityKind kind, const std::string& id) {
    if (tombstones_.clear_deletion(kind, id)) {
        qCDebug(tagsyncStoreLog) << "re-created" << QString::fromStdString(TombstoneKey{kind, id}.to_string())
                                 << "- dropping its tombstone";
        dirty_tombstones_ = true;
    }
    if (pending_creations_.insert(TombstoneKey{kind, id}).second) {
        dirty_creations_ = true;
    }
}

// ============================================================================
// Tag mutations
// ============================================================================

Res<Tag> EntityStore::create_tag(const std::string& name,
                                 std::optional<std::string> description,
                                 std::optional<std::string> color) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Tag>::err(loaded.unwrap_err());
    }
    auto valid = validate_tag_name(name);
    if (valid.is_err()) {
        return Res<Tag>::err(valid.unwrap_err());
    }
    auto clean_name = std::move(valid).unwrap();

    if (find_tag_by_name(clean_name)) {
        return Res<Tag>::err(business_error("a tag named \"" + clean_name + "\" already exists"));
    }
    auto id = generate_tag_id(clean_name);
    if (tags_.contains(id)) {
        return Res<Tag>::err(business_error("tag id \"" + id + "\" is already taken"));
    }

    if (description && description->empty()) {
        description.reset();
    }
    if (!color || color->empty()) {
        color = default_tag_color(id);
    }
    auto tag = tagsync::create_tag(id, std::move(clean_name), clock_.now(),
                                   std::move(description), std::move(color));
    revive(EntityKind::Tag, id);
    put_tag(tag);
    return Res<Tag>::ok(std::move(tag));
}

Res<Tag> EntityStore::rename_tag(const std::string& id, const std::string& name) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Tag>::err(loaded.unwrap_err());
    }
    auto valid = validate_tag_name(name);
    if (valid.is_err()) {
        return Res<Tag>::err(valid.unwrap_err());
    }
    auto clean_name = std::move(valid).unwrap();

    const Tag* existing = tag(id);
    if (!existing) {
        return Res<Tag>::err(business_error("tag not found: " + id));
    }
    if (const Tag* other = find_tag_by_name(clean_name); other && other->id != id) {
        return Res<Tag>::err(business_error("a tag named \"" + clean_name + "\" already exists"));
    }
    if (existing->name == clean_name) {
        return Res<Tag>::ok(*existing);
    }

    auto renamed = with_name(*existing, std::move(clean_name), clock_.now());
    put_tag(renamed);
    return Res<Tag>::ok(std::move(renamed));
}

Res<void> EntityStore::delete_tag(const std::string& id) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return loaded;
    }
    const Tag* existing = tag(id);
    if (!existing) {
        return Res<void>::err(business_error("tag not found: " + id));
    }

    const auto now = clock_.now();
    const auto bindings = existing->bindings;
    for (const auto& other_id : bindings) {
        if (Tag* other = mutable_tag(other_id); other && other->bindings.erase(id) > 0) {
            *other = touched(std::move(*other), now);
        }
    }

    size_t affected_pages = 0;
    for (auto& [page_id, page] : pages_) {
        if (page.tags.contains(id)) {
            page = without_tag(std::move(page), id, now);
            ++affected_pages;
        }
    }
    if (affected_pages > 0) {
        dirty_pages_ = true;
    }

    tags_.erase(id);
    dirty_tags_ = true;
    record_tombstone(EntityKind::Tag, id);
    qCDebug(tagsyncStoreLog) << "deleted tag" << QString::fromStdString(id)
                             << "from" << affected_pages << "pages";
    return Res<void>::ok();
}

Res<void> EntityStore::bind_tags(const std::string& a, const std::string& b) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return loaded;
    }
    if (a == b) {
        return Res<void>::err(validation_error("a tag cannot be bound to itself"));
    }
    Tag* ta = mutable_tag(a);
    Tag* tb = mutable_tag(b);
    if (!ta || !tb) {
        return Res<void>::err(business_error("tag not found: " + (ta ? b : a)));
    }

    const auto now = clock_.now();
    if (ta->bindings.insert(b).second) {
        *ta = touched(std::move(*ta), now);
        dirty_tags_ = true;
    }
    if (tb->bindings.insert(a).second) {
        *tb = touched(std::move(*tb), now);
        dirty_tags_ = true;
    }
    return Res<void>::ok();
}

Res<void> EntityStore::unbind_tags(const std::string& a, const std::string& b) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return loaded;
    }
    Tag* ta = mutable_tag(a);
    Tag* tb = mutable_tag(b);
    if (!ta || !tb) {
        return Res<void>::err(business_error("tag not found: " + (ta ? b : a)));
    }

    const auto now = clock_.now();
    if (ta->bindings.erase(b) > 0) {
        *ta = touched(std::move(*ta), now);
        dirty_tags_ = true;
    }
    if (tb->bindings.erase(a) > 0) {
        *tb = touched(std::move(*tb), now);
        dirty_tags_ = true;
    }
    return Res<void>::ok();
}

// ============================================================================
// Page mutations
// ============================================================================

Res<Page> EntityStore::create_or_update_page(const std::string& url,
                                             const std::string& title,
                                             std::optional<std::string> favicon) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Page>::err(loaded.unwrap_err());
    }
    auto valid = validate_url(url);
    if (valid.is_err()) {
        return Res<Page>::err(valid.unwrap_err());
    }
    auto clean_url = std::move(valid).unwrap();
    auto clean_title = trimmed(title);
    if (clean_title.empty()) {
        clean_title = clean_url;
    }

    const auto id = generate_page_id(clean_url);
    if (const Page* existing = page(id)) {
        Page updated = *existing;
        bool changed = false;
        if (!updated.title_manually_edited && updated.title != clean_title) {
            updated.title = clean_title;
            changed = true;
        }
        if (favicon && !favicon->empty() && updated.favicon != favicon) {
            updated.favicon = std::move(favicon);
            changed = true;
        }
        if (!changed) {
            return Res<Page>::ok(updated);
        }
        updated = touched(std::move(updated), clock_.now());
        put_page(updated);
        return Res<Page>::ok(std::move(updated));
    }

    if (favicon && favicon->empty()) {
        favicon.reset();
    }
    auto created = tagsync::create_page(id, clean_url, std::move(clean_title),
                                        extract_domain(clean_url), clock_.now(), std::move(favicon));
    revive(EntityKind::Page, id);
    put_page(created);
    return Res<Page>::ok(std::move(created));
}

Res<Page> EntityStore::update_page_title(const std::string& page_id, const std::string& title, bool manual) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Page>::err(loaded.unwrap_err());
    }
    auto valid = validate_page_title(title);
    if (valid.is_err()) {
        return Res<Page>::err(valid.unwrap_err());
    }
    const Page* existing = page(page_id);
    if (!existing) {
        return Res<Page>::err(business_error("page not found: " + page_id));
    }

    auto updated = with_title(*existing, std::move(valid).unwrap(), manual, clock_.now());
    put_page(updated);
    return Res<Page>::ok(std::move(updated));
}

Res<Page> EntityStore::add_tag_to_page(const std::string& page_id, const std::string& tag_id) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Page>::err(loaded.unwrap_err());
    }
    const Page* existing = page(page_id);
    if (!existing) {
        return Res<Page>::err(business_error("page not found: " + page_id));
    }
    if (!tag(tag_id)) {
        return Res<Page>::err(business_error("tag not found: " + tag_id));
    }
    if (existing->tags.contains(tag_id)) {
        return Res<Page>::ok(*existing);
    }

    auto updated = with_tag(*existing, tag_id, clock_.now());
    put_page(updated);
    return Res<Page>::ok(std::move(updated));
}

Res<Page> EntityStore::remove_tag_from_page(const std::string& page_id, const std::string& tag_id) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Page>::err(loaded.unwrap_err());
    }
    const Page* existing = page(page_id);
    if (!existing) {
        return Res<Page>::err(business_error("page not found: " + page_id));
    }
    if (!existing->tags.contains(tag_id)) {
        return Res<Page>::ok(*existing);
    }

    auto updated = without_tag(*existing, tag_id, clock_.now());
    put_page(updated);
    return Res<Page>::ok(std::move(updated));
}

Res<Page> EntityStore::create_tag_and_add_to_page(const std::string& name, const std::string& page_id) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<Page>::err(loaded.unwrap_err());
    }
    auto valid = validate_tag_name(name);
    if (valid.is_err()) {
        return Res<Page>::err(valid.unwrap_err());
    }
    if (!page(page_id)) {
        return Res<Page>::err(business_error("page not found: " + page_id));
    }

    std::string tag_id;
    if (const Tag* existing = find_tag_by_name(valid.unwrap())) {
        tag_id = existing->id;
    } else {
        auto created = create_tag(valid.unwrap());
        if (created.is_err()) {
            return Res<Page>::err(created.unwrap_err());
        }
        tag_id = created.unwrap().id;
    }
    return add_tag_to_page(page_id, tag_id);
}

Res<void> EntityStore::delete_page(const std::string& id) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return loaded;
    }
    if (pages_.erase(id) == 0) {
        return Res<void>::err(business_error("page not found: " + id));
    }
    dirty_pages_ = true;
    record_tombstone(EntityKind::Page, id);
    return Res<void>::ok();
}

// ============================================================================
// Bulk
// ============================================================================

QJsonObject EntityStore::export_json() const {
    return export_document(snapshot(), clock_.now());
}

Res<ImportSummary> EntityStore::import_json(const QByteArray& document, bool merge_mode) {
    if (auto loaded = require_loaded(); loaded.is_err()) {
        return Res<ImportSummary>::err(loaded.unwrap_err());
    }
    auto parsed = parse_export_document(document, clock_.now());
    if (parsed.is_err()) {
        return Res<ImportSummary>::err(parsed.unwrap_err());
    }
    auto incoming = std::move(parsed).unwrap();
    ImportSummary summary{.tags_count = incoming.tags.size(), .pages_count = incoming.pages.size()};

    if (merge_mode) {
        for (auto& [id, tag] : incoming.tags) {
            if (!tags_.contains(id)) {
                revive(EntityKind::Tag, id);
                tags_.emplace(id, std::move(tag));
            }
        }
        for (auto& [id, page] : incoming.pages) {
            if (!pages_.contains(id)) {
                revive(EntityKind::Page, id);
                pages_.emplace(id, std::move(page));
            }
        }
    } else {
        for (const auto& [id, tag] : tags_) {
            if (!incoming.tags.contains(id)) record_tombstone(EntityKind::Tag, id);
        }
        for (const auto& [id, page] : pages_) {
            if (!incoming.pages.contains(id)) record_tombstone(EntityKind::Page, id);
        }
        for (const auto& [id, tag] : incoming.tags) revive(EntityKind::Tag, id);
        for (const auto& [id, page] : incoming.pages) revive(EntityKind::Page, id);
        tags_ = std::move(incoming.tags);
        pages_ = std::move(incoming.pages);
    }

    dirty_tags_ = true;
    dirty_pages_ = true;
    qCInfo(tagsyncStoreLog) << "imported" << summary.tags_count << "tags and" << summary.pages_count
                            << "pages" << (merge_mode ? "(merge)" : "(replace)");
    return Res<ImportSummary>::ok(summary);
}

void EntityStore::replace_collections(Snapshot merged) {
    if (merged.tags != tags_) {
        tags_ = std::move(merged.tags);
        dirty_tags_ = true;
    }
    if (merged.pages != pages_) {
        pages_ = std::move(merged.pages);
        dirty_pages_ = true;
    }
}

bool EntityStore::clear_tombstone(const TombstoneKey& key) {
    if (!tombstones_.clear_deletion(key.kind, key.id)) {
        return false;
    }
    dirty_tombstones_ = true;
    return true;
}

bool EntityStore::clear_pending_creation(const TombstoneKey& key) {
    if (pending_creations_.erase(key) == 0) {
        return false;
    }
    dirty_creations_ = true;
    return true;
}

void EntityStore::set_last_sync_at(Timestamp when) {
    last_sync_at_ = when;
    dirty_meta_ = true;
}

} // namespace tagsync::store
