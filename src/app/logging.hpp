#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace tagsync::app {

inline constexpr qint64 kDefaultMaxLogBytes = 4 * 1024 * 1024;

// TAGSYNC_LOG_FILE if set, otherwise <AppLocalDataLocation>/logs/tagsync.log.
// May be empty if no writable location exists.
QString default_log_file_path();

/**
 * "<utc time> <level> <category> <message>\n", level being one of D I W C F.
 */
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const char* category,
                                      const QString& message,
                                      const QDateTime& when);

/**
 * Route Qt messages to `path` as well as to the previously installed
 * handler. When the file grows past `max_bytes` it is moved to
 * `<path>.1` and a fresh one is started.
 */
void install_file_logging(const QString& path = default_log_file_path(),
                          qint64 max_bytes = kDefaultMaxLogBytes);

// Restore the handler that was active before install_file_logging().
void uninstall_file_logging();

// Turns on debug output for every tagsync.* category.
void enable_debug_logging();

// True when TAGSYNC_DEBUG_SYNC=1.
bool sync_debug_enabled();

} // namespace tagsync::app
