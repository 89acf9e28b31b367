#pragma once

#include "core/result.hpp"
#include "store/entity_store.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QStringList>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <optional>

namespace tagsync::app {

struct Request {
    QString operation;
    QJsonObject payload;
};

struct Response {
    bool success = false;
    QJsonValue data;
    QString error;
    std::optional<ErrorKind> error_kind;

    [[nodiscard]] static Response ok(QJsonValue data);
    [[nodiscard]] static Response failure(const Error& error);

    /**
     * {success, data?, error?, errorKind?}
     */
    [[nodiscard]] QJsonObject to_json() const;
};

/**
 * Business logic for one operation, run against rehydrated state.
 */
using Handler = std::function<Res<QJsonValue>(store::EntityStore&, const QJsonObject&)>;

/**
 * CommandPipeline - runs each request as
 *   rehydrate -> execute -> commit -> respond -> notify sync.
 *
 * A request is reported successful only after its commit reached the
 * backing store. Requests run strictly one at a time: dispatch() refuses
 * re-entry and submit() queues behind whatever is running.
 *
 * After a successful commit that wrote something, `committed` is emitted.
 * The sync coordinator listens through a queued connection, so it runs
 * after the caller has its response and its failures never reach it.
 */
class CommandPipeline : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const Response&)>;

    explicit CommandPipeline(store::EntityStore& store, QObject* parent = nullptr);
    ~CommandPipeline() override;

    void register_handler(const QString& operation, Handler handler);
    [[nodiscard]] bool has_handler(const QString& operation) const;
    [[nodiscard]] QStringList operations() const;

    /**
     * Run one request to completion.
     */
    Response dispatch(const Request& request);

    /**
     * Queue a request; `done` receives the response from the event loop.
     */
    void submit(Request request, Callback done);

    [[nodiscard]] size_t queued() const noexcept { return queue_.size(); }

    void set_slow_threshold(std::chrono::milliseconds threshold) { slow_threshold_ = threshold; }

signals:
    void committed(const QString& operation);

private:
    struct Pending {
        Request request;
        Callback done;
    };

    Response run(const Request& request);
    void schedule_drain();
    void drain();

    store::EntityStore& store_;
    std::map<QString, Handler> handlers_;
    std::deque<Pending> queue_;
    std::chrono::milliseconds slow_threshold_{200};
    bool running_ = false;
    bool drain_scheduled_ = false;
};

} // namespace tagsync::app
