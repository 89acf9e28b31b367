#pragma once

#include "core/entities.hpp"
#include "core/result.hpp"
#include "core/tombstone.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

namespace tagsync {

/**
 * JSON codec for entities, collections and tombstones.
 *
 * Field names are camelCase with numeric millisecond timestamps. Decoding
 * normalizes: entries missing required fields (tag: id + name, page: id +
 * url) are dropped with a warning, non-string set members are filtered and
 * missing timestamps default to `now`.
 */
inline constexpr const char* kExportFormatVersion = "1.0";

[[nodiscard]] inline QString to_qstring(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QJsonObject tag_to_json(const Tag& tag);
[[nodiscard]] QJsonObject page_to_json(const Page& page);

[[nodiscard]] std::optional<Tag> normalize_tag(const QJsonValue& value, Timestamp now);
[[nodiscard]] std::optional<Page> normalize_page(const QJsonValue& value, Timestamp now);

/**
 * Collections encode as an object keyed by id. Decoding also accepts an
 * array of entities. `dropped` (when given) is incremented per rejected entry.
 */
[[nodiscard]] QJsonObject tags_to_json(const TagsCollection& tags);
[[nodiscard]] QJsonObject pages_to_json(const PageCollection& pages);
[[nodiscard]] TagsCollection normalize_tags(const QJsonValue& value, Timestamp now, size_t* dropped = nullptr);
[[nodiscard]] PageCollection normalize_pages(const QJsonValue& value, Timestamp now, size_t* dropped = nullptr);

[[nodiscard]] QJsonArray tombstones_to_json(const TombstoneLedger& ledger);
[[nodiscard]] TombstoneLedger tombstones_from_json(const QJsonValue& value);

/**
 * {tags, pages, version, exportDate}
 */
[[nodiscard]] QJsonObject export_document(const Snapshot& snapshot, Timestamp exported_at);

/**
 * Parse an export document. Both `tags` and `pages` must be present and be
 * objects or arrays; individual bad entries are normalized away.
 */
[[nodiscard]] Res<Snapshot> parse_export_document(const QByteArray& bytes, Timestamp now);

[[nodiscard]] QByteArray to_bytes(const QJsonObject& obj);
[[nodiscard]] QByteArray to_bytes(const QJsonArray& arr);

/**
 * Parse a JSON document; a parse failure is reported as `kind`.
 */
[[nodiscard]] Res<QJsonValue> parse_json(const QByteArray& bytes, ErrorKind kind);

} // namespace tagsync
