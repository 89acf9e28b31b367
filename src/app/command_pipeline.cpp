#include "app/command_pipeline.hpp"

#include <QElapsedTimer>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QStringList>
#include <exception>

namespace tagsync::app {

Q_LOGGING_CATEGORY(tagsyncPipelineLog, "tagsync.pipeline")

namespace {

QString kind_name(ErrorKind kind) {
    const auto name = error_kind_name(kind);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

} // namespace

Response Response::ok(QJsonValue data) {
    Response r;
    r.success = true;
    r.data = std::move(data);
    return r;
}

Response Response::failure(const Error& error) {
    Response r;
    r.success = false;
    r.error = QString::fromStdString(error.message);
    r.error_kind = error.kind;
    return r;
}

QJsonObject Response::to_json() const {
    QJsonObject obj{{"success", success}};
    if (success) {
        if (!data.isUndefined() && !data.isNull()) {
            obj.insert("data", data);
        }
    } else {
        obj.insert("error", error);
        if (error_kind) {
            obj.insert("errorKind", kind_name(*error_kind));
        }
    }
    return obj;
}

CommandPipeline::CommandPipeline(store::EntityStore& store, QObject* parent)
    : QObject(parent)
    , store_(store)
{
}

CommandPipeline::~CommandPipeline() = default;

void CommandPipeline::register_handler(const QString& operation, Handler handler) {
    handlers_.insert_or_assign(operation, std::move(handler));
}

bool CommandPipeline::has_handler(const QString& operation) const {
    return handlers_.contains(operation);
}

QStringList CommandPipeline::operations() const {
    QStringList out;
    for (const auto& [name, handler] : handlers_) {
        out << name;
    }
    return out;
}

Response CommandPipeline::dispatch(const Request& request) {
    if (running_) {
        return Response::failure(Error("dispatch re-entered while a command is running", 0,
                                       ErrorKind::Internal));
    }
    running_ = true;
    auto response = run(request);
    running_ = false;
    if (!queue_.empty()) {
        schedule_drain();
    }
    return response;
}

void CommandPipeline::submit(Request request, Callback done) {
    queue_.push_back(Pending{std::move(request), std::move(done)});
    schedule_drain();
}

void CommandPipeline::schedule_drain() {
    if (drain_scheduled_) return;
    drain_scheduled_ = true;
    QMetaObject::invokeMethod(this, [this] { drain(); }, Qt::QueuedConnection);
}

void CommandPipeline::drain() {
    drain_scheduled_ = false;
    if (running_) {
        // dispatch() reschedules when it finishes.
        return;
    }
    while (!queue_.empty()) {
        auto next = std::move(queue_.front());
        queue_.pop_front();
        running_ = true;
        const auto response = run(next.request);
        running_ = false;
        if (next.done) {
            next.done(response);
        }
    }
}

Response CommandPipeline::run(const Request& request) {
    QElapsedTimer timer;
    timer.start();

    auto it = handlers_.find(request.operation);
    if (it == handlers_.end()) {
        return Response::failure(validation_error("unknown operation: " + request.operation.toStdString()));
    }

    // 1. Rehydrate
    auto loaded = store_.ensure_loaded();
    if (loaded.is_err()) {
        qCWarning(tagsyncPipelineLog) << request.operation << "rehydrate failed:"
                                      << QString::fromStdString(loaded.unwrap_err().message);
        store_.invalidate();
        return Response::failure(loaded.unwrap_err());
    }

    // 2. Execute
    std::optional<Res<QJsonValue>> outcome;
    try {
        outcome = it->second(store_, request.payload);
    } catch (const std::exception& e) {
        qCWarning(tagsyncPipelineLog) << request.operation << "handler threw:" << e.what();
        store_.invalidate();
        return Response::failure(Error(std::string("handler failed: ") + e.what(), 0, ErrorKind::Internal));
    }

    if (outcome->is_err()) {
        const auto& err = outcome->unwrap_err();
        qCDebug(tagsyncPipelineLog) << request.operation << "rejected:" << kind_name(err.kind)
                                    << QString::fromStdString(err.message);
        if (store_.is_dirty()) {
            // Whatever the handler left behind must not outlive the request.
            store_.invalidate();
        }
        return Response::failure(err);
    }

    // 3. Commit
    const bool wrote = store_.is_dirty();
    auto committed_result = store_.commit();
    if (committed_result.is_err()) {
        qCWarning(tagsyncPipelineLog) << request.operation << "commit failed:"
                                      << QString::fromStdString(committed_result.unwrap_err().message);
        store_.invalidate();
        return Response::failure(committed_result.unwrap_err());
    }

    const auto elapsed = timer.elapsed();
    if (elapsed > slow_threshold_.count()) {
        qCWarning(tagsyncPipelineLog) << "slow command" << request.operation << elapsed << "ms";
    }

    // 4. Respond; 5. notify sync (delivered later through the event loop).
    auto response = Response::ok(std::move(outcome->unwrap()));
    if (wrote) {
        emit committed(request.operation);
    }
    return response;
}

} // namespace tagsync::app
