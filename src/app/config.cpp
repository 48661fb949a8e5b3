#include "app/config.hpp"
#include "app/logging.hpp"
#include "core/error_codes.hpp"
#include "network/http_message.hpp"
#include "network/sync_protocol.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace tally::app {

namespace {

QString option_or_env(const QCommandLineParser& parser, const QCommandLineOption& option,
                      const char* env_name) {
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    return qEnvironmentVariable(env_name);
}

bool env_flag(const char* name) {
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true") || value == QStringLiteral("yes");
}

} // namespace

QString AppConfig::database_path() const {
    return QDir(data_dir).filePath(QStringLiteral("tally.sqlite"));
}

QString AppConfig::receipt_base() const {
    return QDir(data_dir).filePath(QStringLiteral("Belege"));
}

QString AppConfig::pairing_path() const {
    return QDir(data_dir).filePath(QStringLiteral("sync_state.json"));
}

QString AppConfig::log_path() const {
    return log_file_path(data_dir);
}

ConfigOptions::ConfigOptions()
    : data_dir(QStringList{QStringLiteral("data-dir")},
               QStringLiteral("Data directory (also TALLY_DATA_DIR)."),
               QStringLiteral("path"))
    , port(QStringList{QStringLiteral("port")},
           QStringLiteral("Sync server port (also TALLY_SYNC_PORT, default 48080)."),
           QStringLiteral("port"))
    , device_name(QStringList{QStringLiteral("device-name")},
                  QStringLiteral("Display name of this device (also TALLY_DEVICE_NAME)."),
                  QStringLiteral("name"))
    , debug_sync(QStringList{QStringLiteral("debug-sync")},
                 QStringLiteral("Enable sync debug logging (also TALLY_DEBUG_SYNC=1)."))
    , max_body_mb(QStringList{QStringLiteral("max-body-mb")},
                  QStringLiteral("Largest accepted request body in MiB (also TALLY_MAX_BODY_MB, default 512)."),
                  QStringLiteral("mib"))
{
}

void ConfigOptions::add_to(QCommandLineParser& parser) const {
    parser.addOption(data_dir);
    parser.addOption(port);
    parser.addOption(device_name);
    parser.addOption(debug_sync);
    parser.addOption(max_body_mb);
}

Result<AppConfig, Error> resolve_config(const QCommandLineParser& parser, const ConfigOptions& options) {
    AppConfig config;

    config.data_dir = option_or_env(parser, options.data_dir, "TALLY_DATA_DIR");
    if (config.data_dir.isEmpty()) {
        config.data_dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    if (config.data_dir.isEmpty()) {
        return Result<AppConfig, Error>::err(Error{"No data directory available", codes::CONFIG});
    }
    config.data_dir = QDir(config.data_dir).absolutePath();

    config.port = network::DEFAULT_SYNC_PORT;
    if (const auto port_text = option_or_env(parser, options.port, "TALLY_SYNC_PORT"); !port_text.isEmpty()) {
        bool ok = false;
        const auto port = port_text.toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            return Result<AppConfig, Error>::err(
                Error{"Invalid port: " + port_text.toStdString(), codes::CONFIG});
        }
        config.port = static_cast<uint16_t>(port);
    }

    if (const auto name = option_or_env(parser, options.device_name, "TALLY_DEVICE_NAME").trimmed();
        !name.isEmpty()) {
        config.device_name = name.toStdString();
    }

    config.debug_sync = parser.isSet(options.debug_sync) || env_flag("TALLY_DEBUG_SYNC");

    config.max_body_bytes = network::HttpRequestParser::DEFAULT_MAX_BODY;
    if (const auto mib_text = option_or_env(parser, options.max_body_mb, "TALLY_MAX_BODY_MB");
        !mib_text.isEmpty()) {
        bool ok = false;
        const auto mib = mib_text.toLongLong(&ok);
        if (!ok || mib <= 0) {
            return Result<AppConfig, Error>::err(
                Error{"Invalid body limit: " + mib_text.toStdString(), codes::CONFIG});
        }
        config.max_body_bytes = mib * 1024 * 1024;
    }

    return Result<AppConfig, Error>::ok(std::move(config));
}

std::string default_device_name() {
    for (const char* name : {"HOSTNAME", "COMPUTERNAME"}) {
        const auto value = qEnvironmentVariable(name).trimmed();
        if (!value.isEmpty()) {
            return value.toStdString();
        }
    }
    return "Tally";
}

} // namespace tally::app
