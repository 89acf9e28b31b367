#include "sync/http_remote_replica.hpp"

#include "core/json_codec.hpp"
#include "sync/remote_rows.hpp"
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <memory>

namespace tagsync::sync {

Q_LOGGING_CATEGORY(tagsyncRemoteLog, "tagsync.remote")

namespace {

const QString kTagsTable = QStringLiteral("tags");
const QString kPagesTable = QStringLiteral("pages");

QString table_for(EntityKind kind) {
    return kind == EntityKind::Tag ? kTagsTable : kPagesTable;
}

struct ReplyDeleter {
    void operator()(QNetworkReply* reply) const {
        if (reply) reply->deleteLater();
    }
};

} // namespace

HttpRemoteReplica::HttpRemoteReplica(Config config)
    : config_(std::move(config))
{
}

QUrl HttpRemoteReplica::table_url(const QString& table, const QUrlQuery& query) const {
    QUrl url = config_.base_url;
    auto path = url.path();
    if (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path + QStringLiteral("/rest/v1/") + table);
    url.setQuery(query);
    return url;
}

Res<QByteArray> HttpRemoteReplica::send(const QByteArray& verb,
                                        const QUrl& url,
                                        const QByteArray& body,
                                        const QByteArray& prefer) {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/json"));
    request.setRawHeader("apikey", config_.api_key.toUtf8());
    request.setRawHeader("Authorization", "Bearer " + config_.api_key.toUtf8());
    if (!prefer.isEmpty()) {
        request.setRawHeader("Prefer", prefer);
    }
    request.setTransferTimeout(static_cast<int>(config_.timeout.count()));

    std::unique_ptr<QNetworkReply, ReplyDeleter> reply(
        network_.sendCustomRequest(request, verb, body));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const auto payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        qCWarning(tagsyncRemoteLog) << verb << url.path() << "failed:" << status << reply->errorString();
        return Res<QByteArray>::err(sync_error(
            verb.toStdString() + " " + url.path().toStdString() + ": " +
                reply->errorString().toStdString(),
            status));
    }
    if (status < 200 || status >= 300) {
        return Res<QByteArray>::err(sync_error(
            verb.toStdString() + " " + url.path().toStdString() + " returned HTTP " +
                std::to_string(status),
            status));
    }
    return Res<QByteArray>::ok(payload);
}

Res<Snapshot> HttpRemoteReplica::fetch_snapshot() {
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("select"), QStringLiteral("*"));
    query.addQueryItem(QStringLiteral("user_id"), QStringLiteral("eq.") + config_.user_id);

    auto fetch_rows = [&](const QString& table) -> Res<QJsonArray> {
        auto body = send("GET", table_url(table, query), {});
        if (body.is_err()) {
            return Res<QJsonArray>::err(body.unwrap_err());
        }
        auto parsed = parse_json(body.unwrap(), ErrorKind::Sync);
        if (parsed.is_err()) {
            return Res<QJsonArray>::err(parsed.unwrap_err());
        }
        if (!parsed.unwrap().isArray()) {
            return Res<QJsonArray>::err(sync_error("expected a JSON array from " + table.toStdString()));
        }
        return Res<QJsonArray>::ok(parsed.unwrap().toArray());
    };

    auto tag_rows = fetch_rows(kTagsTable);
    if (tag_rows.is_err()) {
        return Res<Snapshot>::err(tag_rows.unwrap_err());
    }
    auto page_rows = fetch_rows(kPagesTable);
    if (page_rows.is_err()) {
        return Res<Snapshot>::err(page_rows.unwrap_err());
    }

    size_t rejected = 0;
    Snapshot snapshot{
        .tags = tags_from_rows(tag_rows.unwrap(), &rejected),
        .pages = pages_from_rows(page_rows.unwrap(), &rejected)
    };
    if (rejected > 0) {
        qCWarning(tagsyncRemoteLog) << "ignored" << rejected << "malformed remote rows";
    }
    return Res<Snapshot>::ok(std::move(snapshot));
}

Res<void> HttpRemoteReplica::upsert_row(const QString& table, const QJsonObject& row) {
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("on_conflict"), QStringLiteral("id,user_id"));
    auto result = send("POST", table_url(table, query), to_bytes(QJsonArray{row}),
                       QByteArrayLiteral("resolution=merge-duplicates,return=minimal"));
    if (result.is_err()) {
        return Res<void>::err(result.unwrap_err());
    }
    return Res<void>::ok();
}

Res<void> HttpRemoteReplica::upsert_tag(const Tag& tag) {
    return upsert_row(kTagsTable, tag_to_row(tag, config_.user_id));
}

Res<void> HttpRemoteReplica::upsert_page(const Page& page) {
    return upsert_row(kPagesTable, page_to_row(page, config_.user_id));
}

Res<void> HttpRemoteReplica::mark_deleted(const TombstoneKey& key, Timestamp when) {
    QUrlQuery query;
    // Tag ids may carry base64 '+', which a query string would read as a space.
    const auto encoded_id = QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(key.id)));
    query.addQueryItem(QStringLiteral("id"), QStringLiteral("eq.") + encoded_id);
    query.addQueryItem(QStringLiteral("user_id"), QStringLiteral("eq.") + config_.user_id);

    const QJsonObject patch{
        {"deleted", true},
        {"updated_at", static_cast<double>(when.millis())},
    };
    auto result = send("PATCH", table_url(table_for(key.kind), query), to_bytes(patch),
                       QByteArrayLiteral("return=minimal"));
    if (result.is_err()) {
        return Res<void>::err(result.unwrap_err());
    }
    qCDebug(tagsyncRemoteLog) << "soft-deleted" << QString::fromStdString(key.to_string());
    return Res<void>::ok();
}

} // namespace tagsync::sync
