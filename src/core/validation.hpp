#pragma once

#include "core/result.hpp"
#include <cctype>
#include <string>
#include <string_view>

namespace tagsync {

inline constexpr size_t kMaxTagNameLength = 50;

[[nodiscard]] inline std::string trimmed(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

/**
 * Number of Unicode code points in a UTF-8 string.
 */
[[nodiscard]] inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

/**
 * Validate a tag name; returns it trimmed.
 */
[[nodiscard]] inline Res<std::string> validate_tag_name(std::string_view name) {
    auto t = trimmed(name);
    if (t.empty()) {
        return Res<std::string>::err(validation_error("tag name must not be empty"));
    }
    if (utf8_length(t) > kMaxTagNameLength) {
        return Res<std::string>::err(validation_error(
            "tag name must be at most " + std::to_string(kMaxTagNameLength) + " characters"));
    }
    return Res<std::string>::ok(std::move(t));
}

[[nodiscard]] inline Res<std::string> validate_page_title(std::string_view title) {
    auto t = trimmed(title);
    if (t.empty()) {
        return Res<std::string>::err(validation_error("page title must not be empty"));
    }
    return Res<std::string>::ok(std::move(t));
}

[[nodiscard]] inline Res<std::string> validate_url(std::string_view url) {
    auto t = trimmed(url);
    if (t.empty()) {
        return Res<std::string>::err(validation_error("url must not be empty"));
    }
    return Res<std::string>::ok(std::move(t));
}

[[nodiscard]] inline Res<std::string> require_id(std::string_view id, std::string_view what) {
    auto t = trimmed(id);
    if (t.empty()) {
        return Res<std::string>::err(validation_error(std::string(what) + " is required"));
    }
    return Res<std::string>::ok(std::move(t));
}

} // namespace tagsync
