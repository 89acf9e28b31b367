#include "app/settings.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace tagsync::app {
namespace {

QString env_or(const char* name, const QString& fallback) {
    const auto value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : value;
}

int env_int_or(const char* name, int fallback) {
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    return ok ? value : fallback;
}

} // namespace

QString default_db_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("tagsync.db");
    }
    return QDir(base).filePath(QStringLiteral("tagsync.db"));
}

Settings load_settings(QSettings& store) {
    const Settings defaults;
    Settings s;

    s.db_path = env_or("TAGSYNC_DB_PATH",
                       store.value(QStringLiteral("storage/path"), default_db_path()).toString());
    s.remote_url = QUrl(env_or("TAGSYNC_REMOTE_URL",
                               store.value(QStringLiteral("remote/url")).toString()));
    s.remote_api_key = env_or("TAGSYNC_REMOTE_API_KEY",
                              store.value(QStringLiteral("remote/apiKey")).toString());
    s.user_id = env_or("TAGSYNC_USER_ID",
                       store.value(QStringLiteral("remote/userId")).toString());
    s.remote_timeout_ms = env_int_or(
        "TAGSYNC_REMOTE_TIMEOUT_MS",
        store.value(QStringLiteral("remote/timeoutMs"), defaults.remote_timeout_ms).toInt());
    s.sync_interval_ms = env_int_or(
        "TAGSYNC_SYNC_INTERVAL_MS",
        store.value(QStringLiteral("sync/intervalMs"), defaults.sync_interval_ms).toInt());
    s.retry_base_ms = store.value(QStringLiteral("sync/retryBaseMs"), defaults.retry_base_ms).toInt();
    s.retry_max_ms = store.value(QStringLiteral("sync/retryMaxMs"), defaults.retry_max_ms).toInt();

    if (s.retry_base_ms <= 0) s.retry_base_ms = defaults.retry_base_ms;
    if (s.retry_max_ms < s.retry_base_ms) s.retry_max_ms = s.retry_base_ms;
    if (s.remote_timeout_ms <= 0) s.remote_timeout_ms = defaults.remote_timeout_ms;
    if (s.sync_interval_ms < 0) s.sync_interval_ms = 0;
    return s;
}

Settings load_settings() {
    QSettings store;
    return load_settings(store);
}

void save_settings(const Settings& settings, QSettings& store) {
    store.setValue(QStringLiteral("storage/path"), settings.db_path);
    store.setValue(QStringLiteral("remote/url"), settings.remote_url.toString());
    store.setValue(QStringLiteral("remote/apiKey"), settings.remote_api_key);
    store.setValue(QStringLiteral("remote/userId"), settings.user_id);
    store.setValue(QStringLiteral("remote/timeoutMs"), settings.remote_timeout_ms);
    store.setValue(QStringLiteral("sync/intervalMs"), settings.sync_interval_ms);
    store.setValue(QStringLiteral("sync/retryBaseMs"), settings.retry_base_ms);
    store.setValue(QStringLiteral("sync/retryMaxMs"), settings.retry_max_ms);
    store.sync();
}

} // namespace tagsync::app
