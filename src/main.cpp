#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <memory>

#include "app/cli.hpp"
#include "app/command_pipeline.hpp"
#include "app/handlers.hpp"
#include "app/logging.hpp"
#include "app/settings.hpp"
#include "storage/sqlite_backing_store.hpp"
#include "store/entity_store.hpp"
#include "sync/http_remote_replica.hpp"
#include "sync/sync_coordinator.hpp"

namespace {

int print_response(const QString& command, const tagsync::app::Response& response,
                   const tagsync::app::CliOptions& options) {
    const auto text = tagsync::app::format_response(command, response, options);
    if (response.success || options.json) {
        QTextStream(stdout) << text;
    } else {
        QTextStream(stderr) << text;
    }
    return response.success ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("tagsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("tagsync");
    app.setOrganizationDomain("tagsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local-first tag store with remote sync\n\n")
                                     + tagsync::app::cli_usage());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TAGSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON responses."));
    parser.addOption(jsonOption);

    const QCommandLineOption mergeOption(
        QStringList{QStringLiteral("merge")},
        QStringLiteral("For 'import': keep existing entities instead of replacing them."));
    parser.addOption(mergeOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets TAGSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'tags')."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TAGSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    const bool debugSync = parser.isSet(debugSyncOption);
    if (debugSync) {
        qputenv("TAGSYNC_DEBUG_SYNC", "1");
        tagsync::app::enable_debug_logging();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        QTextStream(stderr) << tagsync::app::cli_usage();
        return 2;
    }
    const auto command = positional.first();
    const tagsync::app::CliOptions options{.json = parser.isSet(jsonOption),
                                           .merge = parser.isSet(mergeOption)};

    // Long-running mode keeps a log file; one-shot commands only use stderr.
    if (command == QStringLiteral("run")) {
        const auto log_path = tagsync::app::default_log_file_path();
        tagsync::app::install_file_logging(log_path);
        qInfo() << "tagsync: logging to" << log_path;
    }
    if (debugSync) {
        qInfo() << "tagsync: sync debug enabled";
    }

    const auto settings = tagsync::app::load_settings();
    QDir().mkpath(QFileInfo(settings.db_path).absolutePath());
    auto opened = tagsync::storage::SqliteBackingStore::open(settings.db_path.toStdString());
    if (opened.is_err()) {
        qCritical() << "Failed to open database" << settings.db_path << ":"
                    << opened.unwrap_err().message.c_str();
        return 1;
    }
    auto backing = std::move(opened).unwrap();

    tagsync::store::EntityStore store(*backing);
    tagsync::app::CommandPipeline pipeline(store);
    tagsync::app::register_store_handlers(pipeline);

    std::unique_ptr<tagsync::sync::HttpRemoteReplica> remote;
    std::unique_ptr<tagsync::sync::SyncCoordinator> coordinator;
    if (settings.sync_enabled()) {
        remote = std::make_unique<tagsync::sync::HttpRemoteReplica>(tagsync::sync::HttpRemoteReplica::Config{
            .base_url = settings.remote_url,
            .api_key = settings.remote_api_key,
            .user_id = settings.user_id,
            .timeout = std::chrono::milliseconds(settings.remote_timeout_ms)});
        coordinator = std::make_unique<tagsync::sync::SyncCoordinator>(store, *remote);
        coordinator->set_retry_policy(tagsync::sync::RetryPolicy{
            .base = std::chrono::milliseconds(settings.retry_base_ms),
            .max = std::chrono::milliseconds(settings.retry_max_ms)});
        coordinator->set_interval(std::chrono::milliseconds(settings.sync_interval_ms));
        tagsync::app::register_sync_handlers(pipeline, *coordinator);
        QObject::connect(&pipeline, &tagsync::app::CommandPipeline::committed,
                         coordinator.get(), &tagsync::sync::SyncCoordinator::request_sync,
                         Qt::QueuedConnection);
    }

    if (command == QStringLiteral("status")) {
        const auto response = pipeline.dispatch({QStringLiteral("getSyncStatus"), {}});
        return print_response(command, response, options);
    }

    if (command == QStringLiteral("sync")) {
        if (!coordinator) {
            QTextStream(stderr) << "sync is not configured (set TAGSYNC_REMOTE_URL and TAGSYNC_USER_ID)\n";
            return 1;
        }
        auto report = coordinator->run_cycle();
        if (report.is_err()) {
            return print_response(command, tagsync::app::Response::failure(report.unwrap_err()), options);
        }
        return print_response(command,
                              tagsync::app::Response::ok(tagsync::app::sync_report_to_json(report.unwrap())),
                              options);
    }

    if (command == QStringLiteral("run")) {
        if (!coordinator) {
            qWarning() << "tagsync: remote sync not configured; nothing to run";
            return 1;
        }
        QObject::connect(coordinator.get(), &tagsync::sync::SyncCoordinator::syncFailed,
                         [](const QString& message) { qWarning() << "tagsync: sync failed:" << message; });
        coordinator->start();
        return app.exec();
    }

    auto request = tagsync::app::request_for_command(positional, options);
    if (request.is_err()) {
        QTextStream(stderr) << QString::fromStdString(request.unwrap_err().message) << QLatin1Char('\n');
        return 2;
    }
    bool wrote = false;
    QObject::connect(&pipeline, &tagsync::app::CommandPipeline::committed,
                     [&wrote](const QString&) { wrote = true; });
    const auto response = pipeline.dispatch(request.unwrap());
    const int rc = print_response(command, response, options);

    // The process exits before a queued sync trigger would run, so a one-shot
    // write is pushed here. Its outcome never changes the exit code.
    if (wrote && coordinator) {
        auto synced = coordinator->run_cycle();
        if (synced.is_err()) {
            qWarning() << "tagsync: sync after write failed:" << synced.unwrap_err().message.c_str();
        }
    }
    return rc;
}
