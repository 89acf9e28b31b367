#include "core/entities.hpp"

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <array>
#include <cctype>
#include <functional>

namespace tagsync {

namespace {

constexpr std::array<std::string_view, 10> kTagPalette = {
    "oklch(0.70 0.20 25)",
    "oklch(0.75 0.15 180)",
    "oklch(0.70 0.15 220)",
    "oklch(0.75 0.12 150)",
    "oklch(0.85 0.15 90)",
    "oklch(0.75 0.12 300)",
    "oklch(0.75 0.10 160)",
    "oklch(0.80 0.15 85)",
    "oklch(0.70 0.10 310)",
    "oklch(0.75 0.12 210)",
};

bool has_non_ascii(std::string_view s) {
    for (unsigned char c : s) {
        if (c > 0x7F) return true;
    }
    return false;
}

} // namespace

std::string generate_tag_id(std::string_view name) {
    const auto trimmed = QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size()))
                             .trimmed()
                             .toStdString();

    if (has_non_ascii(trimmed)) {
        const QByteArray bytes(trimmed.data(), static_cast<qsizetype>(trimmed.size()));
        return "tag_" + bytes.toBase64().toStdString();
    }

    std::string id;
    id.reserve(trimmed.size());
    bool in_space = false;
    for (unsigned char c : trimmed) {
        if (std::isspace(c)) {
            // A whitespace run collapses to a single separator.
            if (!in_space) id += '_';
            in_space = true;
            continue;
        }
        in_space = false;
        const auto lower = static_cast<char>(std::tolower(c));
        const bool keep = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') || lower == '_';
        id += keep ? lower : '_';
    }
    return id;
}

std::string generate_page_id(std::string_view url) {
    const QByteArray encoded = QByteArray(url.data(), static_cast<qsizetype>(url.size())).toBase64();
    std::string id;
    id.reserve(static_cast<size_t>(encoded.size()));
    for (char c : encoded) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            id += c;
        }
    }
    return id;
}

std::string extract_domain(std::string_view url) {
    const QUrl parsed(QString::fromUtf8(url.data(), static_cast<qsizetype>(url.size())));
    if (parsed.isValid() && !parsed.host().isEmpty()) {
        return parsed.host().toStdString();
    }
    if (parsed.isValid() && !parsed.scheme().isEmpty()) {
        return parsed.scheme().toStdString() + "-page";
    }
    return "internal-page";
}

std::string default_tag_color(std::string_view tag_id) {
    const auto h = std::hash<std::string_view>{}(tag_id);
    return std::string(kTagPalette[h % kTagPalette.size()]);
}

} // namespace tagsync
