#pragma once

#include "core/result.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <cstdint>
#include <optional>
#include <string>

namespace tally::app {

/**
 * Runtime configuration of tallyd.
 *
 * Precedence: command-line option, then environment variable, then
 * default.
 */
struct AppConfig {
    QString data_dir;
    uint16_t port = 0;
    std::optional<std::string> device_name;
    bool debug_sync = false;
    int64_t max_body_bytes = 0;

    [[nodiscard]] QString database_path() const;   // <data>/tally.sqlite
    [[nodiscard]] QString receipt_base() const;    // <data>/Belege
    [[nodiscard]] QString pairing_path() const;    // <data>/sync_state.json
    [[nodiscard]] QString log_path() const;        // <data>/logs/tally.log
};

/**
 * The options tallyd understands, registered on a parser.
 */
struct ConfigOptions {
    QCommandLineOption data_dir;
    QCommandLineOption port;
    QCommandLineOption device_name;
    QCommandLineOption debug_sync;
    QCommandLineOption max_body_mb;

    ConfigOptions();
    void add_to(QCommandLineParser& parser) const;
};

/**
 * Build the configuration from a processed parser and the environment:
 * TALLY_DATA_DIR, TALLY_SYNC_PORT, TALLY_DEVICE_NAME, TALLY_DEBUG_SYNC,
 * TALLY_MAX_BODY_MB. Invalid numbers are reported, not defaulted.
 */
[[nodiscard]] Result<AppConfig, Error> resolve_config(const QCommandLineParser& parser,
                                                      const ConfigOptions& options);

/**
 * $HOSTNAME, then $COMPUTERNAME, then "Tally".
 */
[[nodiscard]] std::string default_device_name();

} // namespace tally::app
