#pragma once

#include "sync/remote_replica.hpp"
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <chrono>

namespace tagsync::sync {

/**
 * HttpRemoteReplica - RemoteReplica over a PostgREST-style REST endpoint
 * (`<base>/rest/v1/tags`, `<base>/rest/v1/pages`).
 *
 * Rows are scoped by `user_id`. Deletes are soft: the row stays with
 * deleted = true so other replicas learn about it. Each call spins a local
 * event loop until the reply arrives or the transfer timeout fires.
 */
class HttpRemoteReplica final : public RemoteReplica {
public:
    struct Config {
        QUrl base_url;
        QString api_key;
        QString user_id;
        std::chrono::milliseconds timeout{10000};
    };

    explicit HttpRemoteReplica(Config config);

    [[nodiscard]] Res<Snapshot> fetch_snapshot() override;
    [[nodiscard]] Res<void> upsert_tag(const Tag& tag) override;
    [[nodiscard]] Res<void> upsert_page(const Page& page) override;
    [[nodiscard]] Res<void> mark_deleted(const TombstoneKey& key, Timestamp when) override;

private:
    [[nodiscard]] QUrl table_url(const QString& table, const QUrlQuery& query) const;
    [[nodiscard]] Res<QByteArray> send(const QByteArray& verb,
                                       const QUrl& url,
                                       const QByteArray& body,
                                       const QByteArray& prefer = {});
    [[nodiscard]] Res<void> upsert_row(const QString& table, const QJsonObject& row);

    Config config_;
    QNetworkAccessManager network_;
};

} // namespace tagsync::sync
