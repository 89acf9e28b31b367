#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>
#include <cstdio>

namespace tagsync::app {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

class RotatingLogFile {
public:
    bool open(const QString& path, qint64 max_bytes) {
        close();
        max_bytes_ = max_bytes;
        if (path.isEmpty() || !QDir().mkpath(QFileInfo(path).absolutePath())) {
            return false;
        }
        file_.setFileName(path);
        return file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    void close() {
        if (file_.isOpen()) {
            file_.close();
        }
    }

    void write(const QByteArray& bytes) {
        if (!file_.isOpen()) return;
        if (max_bytes_ > 0 && file_.size() + bytes.size() > max_bytes_ && file_.size() > 0) {
            rotate();
        }
        file_.write(bytes);
        file_.flush();
    }

private:
    void rotate() {
        const auto path = file_.fileName();
        const auto previous = path + QStringLiteral(".1");
        file_.close();
        QFile::remove(previous);
        QFile::rename(path, previous);
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "tagsync: cannot reopen log file %s\n", qPrintable(path));
        }
    }

    QFile file_;
    qint64 max_bytes_ = 0;
};

struct LogSink {
    QMutex mu;
    RotatingLogFile file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    const auto bytes = format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc()).toUtf8();
    QtMessageHandler forward = nullptr;
    {
        QMutexLocker lock(&s.mu);
        s.file.write(bytes);
        forward = s.previous;
    }
    if (forward) {
        forward(type, ctx, msg);
    } else {
        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    }
}

} // namespace

QString default_log_file_path() {
    const auto override_path = qEnvironmentVariable("TAGSYNC_LOG_FILE");
    if (!override_path.isEmpty()) {
        return override_path;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString();
    }
    return QDir(base).filePath(QStringLiteral("logs/tagsync.log"));
}

QString format_log_line(QtMsgType type, const char* category, const QString& message, const QDateTime& when) {
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs),
             QString::fromLatin1(level_tag(type)),
             category ? QString::fromLatin1(category) : QString(),
             message);
}

void install_file_logging(const QString& path, qint64 max_bytes) {
    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        if (!s.file.open(path, max_bytes)) {
            std::fprintf(stderr, "tagsync: cannot open log file %s\n", qPrintable(path));
        }
        if (s.installed) {
            return;
        }
        s.installed = true;
    }
    // The forwarded stderr copy gets the category; the file line carries its own stamp.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    auto previous = qInstallMessageHandler(message_handler);
    QMutexLocker lock(&s.mu);
    s.previous = previous;
}

void uninstall_file_logging() {
    auto& s = sink();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        if (!s.installed) {
            return;
        }
        s.installed = false;
        s.file.close();
        previous = s.previous;
        s.previous = nullptr;
    }
    qInstallMessageHandler(previous);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("tagsync.*.debug=true\n"));
}

bool sync_debug_enabled() {
    return qEnvironmentVariableIntValue("TAGSYNC_DEBUG_SYNC") == 1;
}

} // namespace tagsync::app
