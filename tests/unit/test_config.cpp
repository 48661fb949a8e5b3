#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"
#include "app/logging.hpp"
#include "core/error_codes.hpp"
#include "network/sync_protocol.hpp"

#include <QDate>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTime>
#include <QTimeZone>
#include <QStringList>

using namespace tally;
using namespace tally::app;

namespace {

struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

    static void clear() {
        for (const char* name : {"TALLY_DATA_DIR", "TALLY_SYNC_PORT", "TALLY_DEVICE_NAME",
                                 "TALLY_DEBUG_SYNC", "TALLY_MAX_BODY_MB"}) {
            qunsetenv(name);
        }
    }
};

Result<AppConfig, Error> resolve(const QStringList& args) {
    QCommandLineParser parser;
    const ConfigOptions options;
    options.add_to(parser);
    REQUIRE(parser.parse(QStringList{QStringLiteral("tallyd")} + args));
    return resolve_config(parser, options);
}

} // namespace

TEST_CASE("Configuration defaults", "[config]") {
    EnvGuard env;
    auto config = resolve({});
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().port == network::DEFAULT_SYNC_PORT);
    REQUIRE_FALSE(config.unwrap().data_dir.isEmpty());
    REQUIRE_FALSE(config.unwrap().device_name.has_value());
    REQUIRE_FALSE(config.unwrap().debug_sync);
    REQUIRE(config.unwrap().max_body_bytes == 512LL * 1024 * 1024);
}

TEST_CASE("Environment fills in what the command line leaves out", "[config]") {
    EnvGuard env;
    qputenv("TALLY_DATA_DIR", QDir::tempPath().toUtf8() + "/tally-env");
    qputenv("TALLY_SYNC_PORT", "49000");
    qputenv("TALLY_DEVICE_NAME", "  Kasse 2 ");
    qputenv("TALLY_DEBUG_SYNC", "true");
    qputenv("TALLY_MAX_BODY_MB", "8");

    auto config = resolve({});
    REQUIRE(config.is_ok());
    const auto& c = config.unwrap();
    REQUIRE(c.data_dir == QDir(QDir::tempPath() + "/tally-env").absolutePath());
    REQUIRE(c.port == 49000);
    REQUIRE(c.device_name == std::optional<std::string>("Kasse 2"));
    REQUIRE(c.debug_sync);
    REQUIRE(c.max_body_bytes == 8LL * 1024 * 1024);
    REQUIRE(c.database_path().endsWith("/tally.sqlite"));
    REQUIRE(c.receipt_base().endsWith("/Belege"));

    SECTION("Options win over the environment") {
        auto overridden = resolve({QStringLiteral("--port"), QStringLiteral("49001"),
                                   QStringLiteral("--data-dir"), QDir::tempPath() + "/tally-opt"});
        REQUIRE(overridden.is_ok());
        REQUIRE(overridden.unwrap().port == 49001);
        REQUIRE(overridden.unwrap().data_dir == QDir(QDir::tempPath() + "/tally-opt").absolutePath());
    }
}

TEST_CASE("Invalid numbers are configuration errors", "[config]") {
    EnvGuard env;

    SECTION("Port out of range") {
        auto config = resolve({QStringLiteral("--port"), QStringLiteral("70000")});
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().code == codes::CONFIG);
    }

    SECTION("Port that is not a number") {
        qputenv("TALLY_SYNC_PORT", "http");
        auto config = resolve({});
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().code == codes::CONFIG);
    }

    SECTION("Body limit of zero") {
        auto config = resolve({QStringLiteral("--max-body-mb"), QStringLiteral("0")});
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().code == codes::CONFIG);
    }
}

TEST_CASE("Log lines name the command and process", "[config][logging]") {
    const QDateTime when(QDate(2024, 3, 15), QTime(10, 30, 0, 250), QTimeZone::utc());

    REQUIRE(format_log_line(when, QtWarningMsg, QStringLiteral("resolve[4242]"), "tally.sync",
                            QStringLiteral("conflict cleared")) ==
            QStringLiteral("2024-03-15T10:30:00.250Z W resolve[4242] tally.sync conflict cleared\n"));

    SECTION("Missing origin and category") {
        REQUIRE(format_log_line(when, QtInfoMsg, QString(), nullptr, QStringLiteral("hi")) ==
                QStringLiteral("2024-03-15T10:30:00.250Z I - default hi\n"));
    }
}

TEST_CASE("Oversized log is rotated", "[config][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = log_file_path(dir.path());
    REQUIRE(path == dir.filePath(QStringLiteral("logs/tally.log")));
    REQUIRE(QDir().mkpath(QFileInfo(path).absolutePath()));

    auto write = [](const QString& target, const QByteArray& bytes) {
        QFile file(target);
        REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        REQUIRE(file.write(bytes) == bytes.size());
    };

    SECTION("Missing file is left alone") {
        auto rotated = rotate_log_file(path, 8);
        REQUIRE(rotated.is_ok());
        REQUIRE_FALSE(rotated.unwrap());
    }

    SECTION("Small file stays in place") {
        write(path, "short\n");
        auto rotated = rotate_log_file(path, 64);
        REQUIRE(rotated.is_ok());
        REQUIRE_FALSE(rotated.unwrap());
        REQUIRE(QFile::exists(path));
    }

    SECTION("Large file replaces the previous rotation") {
        write(path + QStringLiteral(".1"), "old\n");
        write(path, QByteArray(128, 'x'));
        auto rotated = rotate_log_file(path, 64);
        REQUIRE(rotated.is_ok());
        REQUIRE(rotated.unwrap());
        REQUIRE_FALSE(QFile::exists(path));
        QFile previous(path + QStringLiteral(".1"));
        REQUIRE(previous.open(QIODevice::ReadOnly));
        REQUIRE(previous.readAll().size() == 128);
    }
}
