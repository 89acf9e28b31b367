#pragma once

#include "core/entities.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace tagsync::sync {

// Row codec for the remote `tags` / `pages` tables. Columns are snake_case
// and every row carries the owning `user_id`. Upserted rows always go out
// with deleted = false.

[[nodiscard]] QJsonObject tag_to_row(const Tag& tag, const QString& user_id);
[[nodiscard]] QJsonObject page_to_row(const Page& page, const QString& user_id);

[[nodiscard]] std::optional<Tag> tag_from_row(const QJsonObject& row);
[[nodiscard]] std::optional<Page> page_from_row(const QJsonObject& row);

/**
 * Decode a result set; rows that fail to decode are counted in `rejected`.
 */
[[nodiscard]] TagsCollection tags_from_rows(const QJsonArray& rows, size_t* rejected = nullptr);
[[nodiscard]] PageCollection pages_from_rows(const QJsonArray& rows, size_t* rejected = nullptr);

} // namespace tagsync::sync
