#pragma once

#include "core/result.hpp"
#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace tally::app {

// Size at which the log is moved to <path>.1 when a command starts.
inline constexpr qint64 MAX_LOG_BYTES = 4 * 1024 * 1024;

/**
 * Route Qt messages to `path` (appended) and stderr.
 *
 * Several tallyd processes can share one data directory, so every line
 * names the command and process it came from:
 *   <ts> <level> <command>[<pid>] <category> <message>
 */
[[nodiscard]] Result<void, Error> install_file_logging(const QString& path, const QString& command);

// <data dir>/logs/tally.log
QString log_file_path(const QString& data_dir);

/**
 * Move `path` to `path`.1 when it has grown past `max_bytes`.
 * Returns true when the file was rotated.
 */
[[nodiscard]] Result<bool, Error> rotate_log_file(const QString& path, qint64 max_bytes);

QString format_log_line(const QDateTime& when, QtMsgType type, const QString& origin,
                        const char* category, const QString& message);

} // namespace tally::app
