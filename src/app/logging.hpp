#pragma once

#include "core/result.hpp"

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace manuscripts::app {

struct LogOptions {
    // Empty means default_log_file_path().
    QString file_path;
    // Enables the manuscripts.*.debug categories and mirrors them to stderr.
    bool debug = false;
    // Lines below this level go to the file only.
    QtMsgType stderr_threshold = QtWarningMsg;
};

/**
 * Route Qt logging for the whole process: every enabled line is appended to
 * the log file, lines at or above the stderr threshold are mirrored to
 * stderr. Category rules follow options.debug.
 *
 * @return The log file in use. On error the handler is still installed and
 *         writes to stderr only.
 */
Result<QString, Error> install_logging(const LogOptions& options);

/**
 * Restore Qt's default handler and category rules, closing the file.
 */
void uninstall_logging();

// <AppLocalDataLocation>/logs/manuscripts.log, or empty if unavailable.
QString default_log_file_path();

// "<utc iso time> <level> <category> <message>", no trailing newline.
QString format_log_line(QtMsgType type, const char* category, const QString& message,
                        const QDateTime& when);

} // namespace manuscripts::app
