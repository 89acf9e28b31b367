#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace tagsync {

enum class EntityKind {
    Tag,
    Page
};

[[nodiscard]] constexpr std::string_view entity_kind_name(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Tag: return "tag";
        case EntityKind::Page: return "page";
    }
    return "tag";
}

[[nodiscard]] inline std::optional<EntityKind> parse_entity_kind(std::string_view name) {
    if (name == "tag") return EntityKind::Tag;
    if (name == "page") return EntityKind::Page;
    return std::nullopt;
}

/**
 * Tag - a user-defined label.
 *
 * `bindings` holds the ids of tags bound to this one; the store keeps the
 * relation symmetric. `deleted` is only ever set by a remote replica.
 */
struct Tag {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::set<std::string> bindings;
    Timestamp created_at;
    Timestamp updated_at;
    bool deleted = false;

    bool operator==(const Tag&) const = default;
};

/**
 * Page - a tagged web page, keyed by an id derived from its URL.
 */
struct Page {
    std::string id;
    std::string url;
    std::string title;
    std::string domain;
    std::set<std::string> tags;
    Timestamp created_at;
    Timestamp updated_at;
    bool deleted = false;
    std::optional<std::string> favicon;
    std::optional<std::string> description;
    bool title_manually_edited = false;

    bool operator==(const Page&) const = default;
};

using TagsCollection = std::map<std::string, Tag>;
using PageCollection = std::map<std::string, Page>;

/**
 * Snapshot - both entity collections as one value.
 */
struct Snapshot {
    TagsCollection tags;
    PageCollection pages;

    bool operator==(const Snapshot&) const = default;
};

template<typename Entity>
struct EntityTraits;

template<>
struct EntityTraits<Tag> {
    static constexpr EntityKind kind = EntityKind::Tag;
};

template<>
struct EntityTraits<Page> {
    static constexpr EntityKind kind = EntityKind::Page;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Stamp a write. `updated_at` never moves backwards, even if the clock does.
 */
template<typename Entity>
[[nodiscard]] Entity touched(Entity entity, Timestamp now) {
    entity.updated_at = std::max(now, entity.updated_at);
    return entity;
}

[[nodiscard]] inline Tag create_tag(std::string id,
                                    std::string name,
                                    Timestamp now,
                                    std::optional<std::string> description = std::nullopt,
                                    std::optional<std::string> color = std::nullopt) {
    return Tag{
        .id = std::move(id),
        .name = std::move(name),
        .description = std::move(description),
        .color = std::move(color),
        .bindings = {},
        .created_at = now,
        .updated_at = now,
        .deleted = false
    };
}

[[nodiscard]] inline Page create_page(std::string id,
                                      std::string url,
                                      std::string title,
                                      std::string domain,
                                      Timestamp now,
                                      std::optional<std::string> favicon = std::nullopt) {
    return Page{
        .id = std::move(id),
        .url = std::move(url),
        .title = std::move(title),
        .domain = std::move(domain),
        .tags = {},
        .created_at = now,
        .updated_at = now,
        .deleted = false,
        .favicon = std::move(favicon),
        .description = std::nullopt,
        .title_manually_edited = false
    };
}

[[nodiscard]] inline Tag with_name(Tag tag, std::string name, Timestamp now) {
    tag.name = std::move(name);
    return touched(std::move(tag), now);
}

[[nodiscard]] inline Page with_title(Page page, std::string title, bool manual, Timestamp now) {
    page.title = std::move(title);
    page.title_manually_edited = manual;
    return touched(std::move(page), now);
}

[[nodiscard]] inline Page with_tag(Page page, const std::string& tag_id, Timestamp now) {
    page.tags.insert(tag_id);
    return touched(std::move(page), now);
}

[[nodiscard]] inline Page without_tag(Page page, const std::string& tag_id, Timestamp now) {
    page.tags.erase(tag_id);
    return touched(std::move(page), now);
}

// ============================================================================
// Identifier derivation
// ============================================================================

/**
 * Derive a tag id from a (trimmed) tag name.
 *
 * ASCII names are lower-cased with anything outside [a-z0-9_] mapped to '_'.
 * Names containing non-ASCII characters become "tag_" + base64 of the UTF-8
 * bytes.
 */
[[nodiscard]] std::string generate_tag_id(std::string_view name);

/**
 * Derive a page id from its URL: base64 of the URL, alphanumerics only.
 */
[[nodiscard]] std::string generate_page_id(std::string_view url);

/**
 * Host of the URL, or "<scheme>-page" / "internal-page" when it has none.
 */
[[nodiscard]] std::string extract_domain(std::string_view url);

/**
 * Deterministic palette color for a tag id.
 */
[[nodiscard]] std::string default_tag_color(std::string_view tag_id);

} // namespace tagsync
