#include "app/cli.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <vector>

namespace tagsync::app {

namespace {

struct CommandSpec {
    const char* name;
    const char* operation;
    QStringList arg_keys;
    qsizetype required;
};

const std::vector<CommandSpec>& command_specs() {
    static const std::vector<CommandSpec> specs{
        {"tags", "getAllTags", {}, 0},
        {"pages", "getAllTaggedPages", {QStringLiteral("tagId")}, 0},
        {"create-tag", "createTag", {QStringLiteral("name")}, 1},
        {"rename-tag", "updateTag", {QStringLiteral("tagId"), QStringLiteral("name")}, 2},
        {"delete-tag", "deleteTag", {QStringLiteral("tagId")}, 1},
        {"add-page", "registerPage", {QStringLiteral("url"), QStringLiteral("title")}, 1},
        {"tag-page", "createTagAndAddToPage", {QStringLiteral("pageId"), QStringLiteral("tagName")}, 2},
        {"untag-page", "removeTagFromPage", {QStringLiteral("pageId"), QStringLiteral("tagId")}, 2},
        {"delete-page", "deletePage", {QStringLiteral("pageId")}, 1},
        {"export", "exportData", {}, 0},
        {"stats", "getDataStats", {}, 0},
    };
    return specs;
}

[[nodiscard]] Res<Request> import_request(const QStringList& args, const CliOptions& options) {
    if (args.size() < 2) {
        return Res<Request>::err(validation_error("usage: import <file> [--merge]"));
    }
    QFile file(args.at(1));
    if (!file.open(QIODevice::ReadOnly)) {
        return Res<Request>::err(validation_error(
            "cannot read " + args.at(1).toStdString() + ": " + file.errorString().toStdString()));
    }
    const auto bytes = file.readAll();
    return Res<Request>::ok(Request{
        .operation = QStringLiteral("importData"),
        .payload = QJsonObject{{"data", QString::fromUtf8(bytes)}, {"mergeMode", options.merge}},
    });
}

[[nodiscard]] QString tag_line(const QJsonObject& tag) {
    return QStringLiteral("- ") + tag.value(QStringLiteral("name")).toString()
        + QStringLiteral(" (") + tag.value(QStringLiteral("id")).toString() + QStringLiteral(")");
}

[[nodiscard]] QString page_line(const QJsonObject& page) {
    QStringList tags;
    for (const auto& t : page.value(QStringLiteral("tags")).toArray()) {
        tags << t.toString();
    }
    auto line = QStringLiteral("- ") + page.value(QStringLiteral("title")).toString()
        + QStringLiteral(" <") + page.value(QStringLiteral("url")).toString() + QStringLiteral(">")
        + QStringLiteral(" (") + page.value(QStringLiteral("id")).toString() + QStringLiteral(")");
    if (!tags.isEmpty()) {
        line += QStringLiteral(" [") + tags.join(QStringLiteral(", ")) + QStringLiteral("]");
    }
    return line;
}

[[nodiscard]] QString key_values(const QJsonObject& obj) {
    QStringList lines;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const auto v = it.value();
        QString text;
        if (v.isBool()) {
            text = v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        } else if (v.isDouble()) {
            text = QString::number(v.toInteger());
        } else if (v.isNull() || v.isUndefined()) {
            text = QStringLiteral("-");
        } else {
            text = v.toString();
        }
        lines << it.key() + QStringLiteral(": ") + text;
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace

Res<Request> request_for_command(const QStringList& args, const CliOptions& options) {
    if (args.isEmpty()) {
        return Res<Request>::err(validation_error("no command given"));
    }
    const auto& command = args.first();
    if (command == QStringLiteral("import")) {
        return import_request(args, options);
    }

    for (const auto& spec : command_specs()) {
        if (command != QLatin1String(spec.name)) {
            continue;
        }
        const auto given = args.size() - 1;
        if (given < spec.required) {
            QString usage = QLatin1String(spec.name);
            for (const auto& key : spec.arg_keys) {
                usage += QStringLiteral(" <") + key + QStringLiteral(">");
            }
            return Res<Request>::err(validation_error("usage: " + usage.toStdString()));
        }
        QJsonObject payload;
        for (qsizetype i = 0; i < spec.arg_keys.size() && i < given; ++i) {
            payload.insert(spec.arg_keys.at(i), args.at(i + 1));
        }
        return Res<Request>::ok(Request{.operation = QLatin1String(spec.operation), .payload = payload});
    }
    return Res<Request>::err(validation_error("unknown command: " + command.toStdString()));
}

QString format_response(const QString& command, const Response& response, const CliOptions& options) {
    if (options.json) {
        return QString::fromUtf8(QJsonDocument(response.to_json()).toJson(QJsonDocument::Indented));
    }
    if (!response.success) {
        QString prefix = QStringLiteral("error");
        if (response.error_kind) {
            const auto name = error_kind_name(*response.error_kind);
            prefix += QStringLiteral(" (") + QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()))
                + QStringLiteral(")");
        }
        return prefix + QStringLiteral(": ") + response.error + QLatin1Char('\n');
    }

    const auto& data = response.data;
    QStringList lines;
    if (command == QStringLiteral("tags")) {
        for (const auto& t : data.toArray()) lines << tag_line(t.toObject());
    } else if (command == QStringLiteral("pages")) {
        for (const auto& p : data.toArray()) lines << page_line(p.toObject());
    } else if (command == QStringLiteral("export")) {
        return QString::fromUtf8(QJsonDocument(data.toObject()).toJson(QJsonDocument::Indented));
    } else if (data.isObject()) {
        const auto obj = data.toObject();
        if (obj.contains(QStringLiteral("url"))) {
            lines << page_line(obj);
        } else if (obj.contains(QStringLiteral("name")) && obj.contains(QStringLiteral("id"))) {
            lines << tag_line(obj);
        } else {
            lines << key_values(obj);
        }
    } else {
        lines << QStringLiteral("ok");
    }
    if (lines.isEmpty()) {
        return QString();
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString cli_usage() {
    return QStringLiteral(
        "commands:\n"
        "  tags                          list tags\n"
        "  pages [tagId]                 list tagged pages\n"
        "  create-tag <name>\n"
        "  rename-tag <tagId> <name>\n"
        "  delete-tag <tagId>\n"
        "  add-page <url> [title]\n"
        "  tag-page <pageId> <tagName>\n"
        "  untag-page <pageId> <tagId>\n"
        "  delete-page <pageId>\n"
        "  stats\n"
        "  export                        print an export document\n"
        "  import <file> [--merge]\n"
        "  sync                          run one sync cycle\n"
        "  status                        show sync status\n"
        "  run                           stay running and sync periodically\n");
}

} // namespace tagsync::app
