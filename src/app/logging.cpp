#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>

#include <cstdio>

namespace manuscripts::app {
namespace {

int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 4;
}

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

// Shared with the commit pool threads, hence the mutex.
struct Sink {
    QMutex mu;
    QFile file;
    int stderr_min = 2;
};

Sink& sink() {
    static Sink s;
    return s;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto bytes = (format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc())
                        + QLatin1Char('\n')).toUtf8();

    auto& s = sink();
    QMutexLocker lock(&s.mu);
    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    if (severity(type) >= s.stderr_min || !s.file.isOpen()) {
        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
        std::fflush(stderr);
    }
}

} // namespace

QString format_log_line(QtMsgType type, const char* category, const QString& message,
                        const QDateTime& when) {
    const QString cat = category ? QString::fromLatin1(category) : QStringLiteral("default");
    return QStringLiteral("%1 %2 %3 %4")
        .arg(when.toUTC().toString(Qt::ISODateWithMs), QString::fromLatin1(level_tag(type)), cat, message);
}

Result<QString, Error> install_logging(const LogOptions& options) {
    QLoggingCategory::setFilterRules(options.debug
        ? QStringLiteral("manuscripts.*.debug=true")
        : QStringLiteral("manuscripts.*.debug=false"));

    const QString path = options.file_path.isEmpty() ? default_log_file_path() : options.file_path;

    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        s.stderr_min = options.debug ? 0 : severity(options.stderr_threshold);
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    qInstallMessageHandler(message_handler);

    if (path.isEmpty()) {
        return Result<QString, Error>::fail(ErrorCode::Internal, "No writable location for the log file");
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return Result<QString, Error>::fail(ErrorCode::Internal,
            "Cannot create " + QFileInfo(path).absolutePath().toStdString());
    }

    QMutexLocker lock(&s.mu);
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return Result<QString, Error>::fail(ErrorCode::Internal,
            "Cannot open " + path.toStdString() + ": " + s.file.errorString().toStdString());
    }
    return Result<QString, Error>::ok(path);
}

void uninstall_logging() {
    qInstallMessageHandler(nullptr);
    QLoggingCategory::setFilterRules(QString());

    auto& s = sink();
    QMutexLocker lock(&s.mu);
    s.file.close();
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/manuscripts.log"));
}

} // namespace manuscripts::app
