#pragma once

#include <QSettings>
#include <QString>
#include <QUrl>

namespace tagsync::app {

/**
 * Settings - runtime configuration.
 *
 * Loaded from QSettings; TAGSYNC_* environment variables take precedence.
 */
struct Settings {
    QString db_path;
    QUrl remote_url;
    QString remote_api_key;
    QString user_id;
    int remote_timeout_ms = 10000;
    int sync_interval_ms = 300000;
    int retry_base_ms = 2000;
    int retry_max_ms = 300000;

    [[nodiscard]] bool sync_enabled() const {
        return remote_url.isValid() && !remote_url.isEmpty() && !user_id.isEmpty();
    }
};

/**
 * <AppLocalDataLocation>/tagsync.db
 */
[[nodiscard]] QString default_db_path();

[[nodiscard]] Settings load_settings(QSettings& store);

/**
 * Uses the application's default QSettings location.
 */
[[nodiscard]] Settings load_settings();

void save_settings(const Settings& settings, QSettings& store);

} // namespace tagsync::app
