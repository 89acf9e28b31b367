#include "sync/remote_rows.hpp"

#include <QJsonValue>

namespace tagsync::sync {

namespace {

QJsonValue nullable(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return QJsonValue(QJsonValue::Null);
    }
    return QString::fromStdString(*value);
}

std::optional<std::string> optional_text(const QJsonObject& row, const char* column) {
    const auto v = row.value(QLatin1String(column));
    if (!v.isString() || v.toString().isEmpty()) return std::nullopt;
    return v.toString().toStdString();
}

Timestamp millis(const QJsonObject& row, const char* column) {
    return Timestamp(static_cast<int64_t>(row.value(QLatin1String(column)).toDouble(0)));
}

QJsonArray to_array(const std::set<std::string>& ids) {
    QJsonArray arr;
    for (const auto& id : ids) {
        arr.append(QString::fromStdString(id));
    }
    return arr;
}

std::set<std::string> to_set(const QJsonValue& value) {
    std::set<std::string> out;
    for (const auto& item : value.toArray()) {
        if (item.isString()) {
            out.insert(item.toString().toStdString());
        }
    }
    return out;
}

template<typename Entity, typename Decode>
std::map<std::string, Entity> decode_rows(const QJsonArray& rows, Decode decode, size_t* rejected) {
    std::map<std::string, Entity> out;
    for (const auto& row : rows) {
        auto entity = row.isObject() ? decode(row.toObject()) : std::nullopt;
        if (!entity) {
            if (rejected) ++*rejected;
            continue;
        }
        auto id = entity->id;
        out.insert_or_assign(std::move(id), std::move(*entity));
    }
    return out;
}

} // namespace

QJsonObject tag_to_row(const Tag& tag, const QString& user_id) {
    return QJsonObject{
        {"id", QString::fromStdString(tag.id)},
        {"user_id", user_id},
        {"name", QString::fromStdString(tag.name)},
        {"description", nullable(tag.description)},
        {"color", nullable(tag.color)},
        {"bindings", to_array(tag.bindings)},
        {"created_at", static_cast<double>(tag.created_at.millis())},
        {"updated_at", static_cast<double>(tag.updated_at.millis())},
        {"deleted", false},
    };
}

QJsonObject page_to_row(const Page& page, const QString& user_id) {
    return QJsonObject{
        {"id", QString::fromStdString(page.id)},
        {"user_id", user_id},
        {"url", QString::fromStdString(page.url)},
        {"title", QString::fromStdString(page.title)},
        {"domain", QString::fromStdString(page.domain)},
        {"tags", to_array(page.tags)},
        {"favicon", nullable(page.favicon)},
        {"description", nullable(page.description)},
        {"created_at", static_cast<double>(page.created_at.millis())},
        {"updated_at", static_cast<double>(page.updated_at.millis())},
        {"deleted", false},
    };
}

std::optional<Tag> tag_from_row(const QJsonObject& row) {
    auto id = optional_text(row, "id");
    auto name = optional_text(row, "name");
    if (!id || !name) {
        return std::nullopt;
    }
    Tag tag;
    tag.id = std::move(*id);
    tag.name = std::move(*name);
    tag.description = optional_text(row, "description");
    tag.color = optional_text(row, "color");
    tag.bindings = to_set(row.value("bindings"));
    tag.created_at = millis(row, "created_at");
    tag.updated_at = millis(row, "updated_at");
    tag.deleted = row.value("deleted").toBool(false);
    return tag;
}

std::optional<Page> page_from_row(const QJsonObject& row) {
    auto id = optional_text(row, "id");
    auto url = optional_text(row, "url");
    if (!id || !url) {
        return std::nullopt;
    }
    Page page;
    page.id = std::move(*id);
    page.url = std::move(*url);
    page.title = optional_text(row, "title").value_or(std::string{});
    page.domain = optional_text(row, "domain").value_or(std::string{});
    page.tags = to_set(row.value("tags"));
    page.favicon = optional_text(row, "favicon");
    page.description = optional_text(row, "description");
    page.created_at = millis(row, "created_at");
    page.updated_at = millis(row, "updated_at");
    page.deleted = row.value("deleted").toBool(false);
    return page;
}

TagsCollection tags_from_rows(const QJsonArray& rows, size_t* rejected) {
    return decode_rows<Tag>(rows, tag_from_row, rejected);
}

PageCollection pages_from_rows(const QJsonArray& rows, size_t* rejected) {
    return decode_rows<Page>(rows, page_from_row, rejected);
}

} // namespace tagsync::sync
