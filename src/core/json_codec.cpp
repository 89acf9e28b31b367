#include "core/json_codec.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

namespace tagsync {

Q_LOGGING_CATEGORY(tagsyncCodecLog, "tagsync.codec")

namespace {

std::optional<std::string> non_empty_string(const QJsonObject& obj, const char* key) {
    const auto v = obj.value(QLatin1String(key));
    if (!v.isString() || v.toString().isEmpty()) {
        return std::nullopt;
    }
    return v.toString().toStdString();
}

Timestamp timestamp_or(const QJsonObject& obj, const char* key, Timestamp fallback) {
    const auto v = obj.value(QLatin1String(key));
    if (!v.isDouble()) {
        return fallback;
    }
    return Timestamp(static_cast<int64_t>(v.toDouble()));
}

std::set<std::string> string_set(const QJsonObject& obj, const char* key, const std::string& owner) {
    std::set<std::string> out;
    const auto v = obj.value(QLatin1String(key));
    if (v.isArray()) {
        for (const auto& item : v.toArray()) {
            if (item.isString()) {
                out.insert(item.toString().toStdString());
            }
        }
    } else if (!v.isUndefined() && !v.isNull()) {
        qCWarning(tagsyncCodecLog) << key << "is not an array on" << to_qstring(owner) << "- reset to empty";
    }
    return out;
}

QJsonArray string_array(const std::set<std::string>& values) {
    QJsonArray arr;
    for (const auto& v : values) {
        arr.append(to_qstring(v));
    }
    return arr;
}

template<typename Entity, typename Normalize>
std::map<std::string, Entity> normalize_collection(const QJsonValue& value,
                                                   Normalize normalize,
                                                   size_t* dropped) {
    std::map<std::string, Entity> out;
    auto take = [&](const QJsonValue& item) {
        if (auto entity = normalize(item)) {
            auto id = entity->id;
            out.insert_or_assign(std::move(id), std::move(*entity));
        } else if (dropped) {
            ++*dropped;
        }
    };

    if (value.isObject()) {
        const auto obj = value.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            take(it.value());
        }
    } else if (value.isArray()) {
        for (const auto& item : value.toArray()) {
            take(item);
        }
    } else if (!value.isUndefined() && !value.isNull()) {
        qCWarning(tagsyncCodecLog) << "collection is neither an object nor an array";
    }
    return out;
}

} // namespace

QJsonObject tag_to_json(const Tag& tag) {
    QJsonObject obj{
        {"id", to_qstring(tag.id)},
        {"name", to_qstring(tag.name)},
        {"bindings", string_array(tag.bindings)},
        {"createdAt", static_cast<double>(tag.created_at.millis())},
        {"updatedAt", static_cast<double>(tag.updated_at.millis())},
    };
    if (tag.description) obj.insert("description", to_qstring(*tag.description));
    if (tag.color) obj.insert("color", to_qstring(*tag.color));
    if (tag.deleted) obj.insert("deleted", true);
    return obj;
}

QJsonObject page_to_json(const Page& page) {
    QJsonObject obj{
        {"id", to_qstring(page.id)},
        {"url", to_qstring(page.url)},
        {"title", to_qstring(page.title)},
        {"domain", to_qstring(page.domain)},
        {"tags", string_array(page.tags)},
        {"createdAt", static_cast<double>(page.created_at.millis())},
        {"updatedAt", static_cast<double>(page.updated_at.millis())},
    };
    if (page.favicon) obj.insert("favicon", to_qstring(*page.favicon));
    if (page.description) obj.insert("description", to_qstring(*page.description));
    if (page.deleted) obj.insert("deleted", true);
    if (page.title_manually_edited) obj.insert("titleManuallyEdited", true);
    return obj;
}

std::optional<Tag> normalize_tag(const QJsonValue& value, Timestamp now) {
    if (!value.isObject()) {
        qCWarning(tagsyncCodecLog) << "dropping tag: not an object";
        return std::nullopt;
    }
    const auto obj = value.toObject();
    auto id = non_empty_string(obj, "id");
    auto name = non_empty_string(obj, "name");
    if (!id || !name) {
        qCWarning(tagsyncCodecLog) << "dropping tag: missing id or name" << to_bytes(obj);
        return std::nullopt;
    }

    Tag tag;
    tag.id = std::move(*id);
    tag.name = std::move(*name);
    tag.description = non_empty_string(obj, "description");
    tag.color = non_empty_string(obj, "color");
    tag.bindings = string_set(obj, "bindings", tag.id);
    tag.created_at = timestamp_or(obj, "createdAt", now);
    tag.updated_at = timestamp_or(obj, "updatedAt", now);
    tag.deleted = obj.value("deleted").toBool(false);
    return tag;
}

std::optional<Page> normalize_page(const QJsonValue& value, Timestamp now) {
    if (!value.isObject()) {
        qCWarning(tagsyncCodecLog) << "dropping page: not an object";
        return std::nullopt;
    }
    const auto obj = value.toObject();
    auto id = non_empty_string(obj, "id");
    auto url = non_empty_string(obj, "url");
    if (!id || !url) {
        qCWarning(tagsyncCodecLog) << "dropping page: missing id or url" << to_bytes(obj);
        return std::nullopt;
    }

    Page page;
    page.id = std::move(*id);
    page.url = std::move(*url);
    page.title = non_empty_string(obj, "title").value_or(std::string{});
    page.domain = non_empty_string(obj, "domain").value_or(std::string{});
    page.tags = string_set(obj, "tags", page.id);
    page.created_at = timestamp_or(obj, "createdAt", now);
    page.updated_at = timestamp_or(obj, "updatedAt", now);
    page.deleted = obj.value("deleted").toBool(false);
    page.favicon = non_empty_string(obj, "favicon");
    page.description = non_empty_string(obj, "description");
    page.title_manually_edited = obj.value("titleManuallyEdited").toBool(false);
    return page;
}

QJsonObject tags_to_json(const TagsCollection& tags) {
    QJsonObject obj;
    for (const auto& [id, tag] : tags) {
        obj.insert(to_qstring(id), tag_to_json(tag));
    }
    return obj;
}

QJsonObject pages_to_json(const PageCollection& pages) {
    QJsonObject obj;
    for (const auto& [id, page] : pages) {
        obj.insert(to_qstring(id), page_to_json(page));
    }
    return obj;
}

TagsCollection normalize_tags(const QJsonValue& value, Timestamp now, size_t* dropped) {
    return normalize_collection<Tag>(
        value, [now](const QJsonValue& v) { return normalize_tag(v, now); }, dropped);
}

PageCollection normalize_pages(const QJsonValue& value, Timestamp now, size_t* dropped) {
    return normalize_collection<Page>(
        value, [now](const QJsonValue& v) { return normalize_page(v, now); }, dropped);
}

QJsonArray tombstones_to_json(const TombstoneLedger& ledger) {
    QJsonArray arr;
    for (const auto& key : ledger.to_strings()) {
        arr.append(to_qstring(key));
    }
    return arr;
}

TombstoneLedger tombstones_from_json(const QJsonValue& value) {
    std::vector<std::string> entries;
    for (const auto& item : value.toArray()) {
        if (item.isString()) {
            entries.push_back(item.toString().toStdString());
        }
    }
    std::vector<std::string> rejected;
    auto ledger = TombstoneLedger::from_strings(entries, &rejected);
    for (const auto& bad : rejected) {
        qCWarning(tagsyncCodecLog) << "ignoring malformed tombstone" << to_qstring(bad);
    }
    return ledger;
}

QJsonObject export_document(const Snapshot& snapshot, Timestamp exported_at) {
    return QJsonObject{
        {"tags", tags_to_json(snapshot.tags)},
        {"pages", pages_to_json(snapshot.pages)},
        {"version", QLatin1String(kExportFormatVersion)},
        {"exportDate", QString::fromStdString(exported_at.to_iso_string())},
    };
}

Res<Snapshot> parse_export_document(const QByteArray& bytes, Timestamp now) {
    auto parsed = parse_json(bytes, ErrorKind::Validation);
    if (parsed.is_err()) {
        return Res<Snapshot>::err(parsed.unwrap_err());
    }
    const auto root = parsed.unwrap().toObject();
    const auto tags = root.value("tags");
    const auto pages = root.value("pages");
    auto is_collection = [](const QJsonValue& v) { return v.isObject() || v.isArray(); };
    if (!is_collection(tags) || !is_collection(pages)) {
        return Res<Snapshot>::err(validation_error("import data must contain tags and pages collections"));
    }

    size_t dropped = 0;
    Snapshot snapshot{
        .tags = normalize_tags(tags, now, &dropped),
        .pages = normalize_pages(pages, now, &dropped)
    };
    if (dropped > 0) {
        qCWarning(tagsyncCodecLog) << "import dropped" << dropped << "invalid entries";
    }
    return Res<Snapshot>::ok(std::move(snapshot));
}

QByteArray to_bytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray to_bytes(const QJsonArray& arr) {
    return QJsonDocument(arr).toJson(QJsonDocument::Compact);
}

Res<QJsonValue> parse_json(const QByteArray& bytes, ErrorKind kind) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return Res<QJsonValue>::err(Error("invalid JSON: " + err.errorString().toStdString(), 0, kind));
    }
    if (doc.isArray()) {
        return Res<QJsonValue>::ok(QJsonValue(doc.array()));
    }
    return Res<QJsonValue>::ok(QJsonValue(doc.object()));
}

} // namespace tagsync
