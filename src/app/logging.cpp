#include "app/logging.hpp"
#include "core/error_codes.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>

#include <cstdio>

namespace tally::app {
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

struct LogSink {
    QMutex mu;
    QFile file;
    QString origin;  // "<command>[<pid>]"
};

LogSink& sink() {
    static LogSink s;
    return s;
}

void write_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);

    const auto bytes = format_log_line(QDateTime::currentDateTimeUtc(), type, s.origin,
                                       ctx.category, msg).toUtf8();
    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
}

} // namespace

QString format_log_line(const QDateTime& when, QtMsgType type, const QString& origin,
                        const char* category, const QString& message) {
    return QStringLiteral("%1 %2 %3 %4 %5\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs),
             QString::fromLatin1(level_tag(type)),
             origin.isEmpty() ? QStringLiteral("-") : origin,
             category ? QString::fromLatin1(category) : QStringLiteral("default"),
             message);
}

Result<bool, Error> rotate_log_file(const QString& path, qint64 max_bytes) {
    const QFileInfo info(path);
    if (!info.exists() || info.size() <= max_bytes) {
        return Result<bool, Error>::ok(false);
    }
    const QString previous = path + QStringLiteral(".1");
    if (QFile::exists(previous) && !QFile::remove(previous)) {
        return Result<bool, Error>::err(Error{"Cannot remove " + previous.toStdString(), codes::IO});
    }
    if (!QFile::rename(path, previous)) {
        return Result<bool, Error>::err(Error{"Cannot rotate " + path.toStdString(), codes::IO});
    }
    return Result<bool, Error>::ok(true);
}

Result<void, Error> install_file_logging(const QString& path, const QString& command) {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return Result<void, Error>::err(
            Error{"Cannot create log directory for " + path.toStdString(), codes::IO});
    }
    auto rotated = rotate_log_file(path, MAX_LOG_BYTES);
    if (rotated.is_err()) {
        return Result<void, Error>::err(rotated.unwrap_err());
    }

    {
        auto& s = sink();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return Result<void, Error>::err(Error{
                "Cannot open " + path.toStdString() + ": " + s.file.errorString().toStdString(),
                codes::IO});
        }
        s.origin = command + QLatin1Char('[') + QString::number(QCoreApplication::applicationPid()) +
                   QLatin1Char(']');
    }

    qInstallMessageHandler(write_message);
    return Result<void, Error>::ok();
}

QString log_file_path(const QString& data_dir) {
    return QDir(data_dir).filePath(QStringLiteral("logs/tally.log"));
}

} // namespace tally::app
