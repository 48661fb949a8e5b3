#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QTextStream>
#include <QUrl>

#include "app/application.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "core/log.hpp"
#include "crypto/random.hpp"
#include "network/sync_protocol.hpp"

namespace {

int fail(const tally::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.to_string()) << QLatin1Char('\n');
    return 1;
}

int usage(const QCommandLineParser& parser) {
    QTextStream(stderr) << parser.helpText();
    return 2;
}

QUrl peer_url(const QString& text) {
    auto url = QUrl::fromUserInput(text);
    if (url.port() == -1) {
        url.setPort(tally::network::DEFAULT_SYNC_PORT);
    }
    return url;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("tally");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tally");
    app.setOrganizationDomain("tally.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Tally ledger sync daemon.\n\n"
        "Commands:\n"
        "  serve                 run the sync server\n"
        "  status                print identity, pairing code, peers and pending conflict\n"
        "  resolve <action>      resolve the pending conflict (KEEP_LOCAL, USE_REMOTE, MERGE)\n"
        "  pair <peer> <code>    pair with a peer using its pairing code\n"
        "  pull <peer>           replace local data with the peer's\n"
        "  push <peer>           send local data to the peer"));
    parser.addHelpOption();
    parser.addVersionOption();

    const tally::app::ConfigOptions options;
    options.add_to(parser);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'serve')."));
    parser.process(app);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser);
    }
    const auto command = positional.first();

    auto config = tally::app::resolve_config(parser, options);
    if (config.is_err()) {
        return fail(config.unwrap_err());
    }
    tally::enable_sync_debug(config.unwrap().debug_sync);

    // serve and the one-shot commands share the log file.
    auto logging = tally::app::install_file_logging(config.unwrap().log_path(), command);
    if (logging.is_err()) {
        if (command == QStringLiteral("serve")) {
            return fail(logging.unwrap_err());
        }
        qWarning() << "Tally: file logging unavailable:"
                   << QString::fromStdString(logging.unwrap_err().to_string());
    } else if (command == QStringLiteral("serve")) {
        qInfo() << "Tally: logging to" << config.unwrap().log_path();
    }

    // Initialize crypto
    auto crypto_result = tally::crypto::init();
    if (crypto_result.is_err()) {
        return fail(crypto_result.unwrap_err());
    }

    auto opened = tally::app::Application::open(std::move(config).unwrap());
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto& application = *opened.unwrap();

    if (command == QStringLiteral("serve")) {
        auto served = application.serve();
        return served.is_ok() ? 0 : fail(served.unwrap_err());
    }

    if (command == QStringLiteral("status")) {
        auto report = application.status_report();
        if (report.is_err()) {
            return fail(report.unwrap_err());
        }
        QTextStream(stdout) << QJsonDocument(report.unwrap()).toJson(QJsonDocument::Indented);
        return 0;
    }

    if (command == QStringLiteral("resolve")) {
        if (positional.size() != 2) {
            return usage(parser);
        }
        auto resolved = application.resolve(positional.at(1).toStdString());
        if (resolved.is_err()) {
            return fail(resolved.unwrap_err());
        }
        QTextStream(stdout) << "Conflict resolved\n";
        return 0;
    }

    if (command == QStringLiteral("pair")) {
        if (positional.size() != 3) {
            return usage(parser);
        }
        auto paired = application.pair(peer_url(positional.at(1)), positional.at(2).toStdString());
        if (paired.is_err()) {
            return fail(paired.unwrap_err());
        }
        QTextStream(stdout) << "Paired\n";
        return 0;
    }

    if (command == QStringLiteral("pull") || command == QStringLiteral("push")) {
        if (positional.size() != 2) {
            return usage(parser);
        }
        const auto peer = peer_url(positional.at(1));
        auto synced = command == QStringLiteral("pull") ? application.pull(peer) : application.push(peer);
        if (synced.is_err()) {
            return fail(synced.unwrap_err());
        }
        QTextStream(stdout) << (command == QStringLiteral("pull") ? "Pulled\n" : "Pushed\n");
        return 0;
    }

    return usage(parser);
}
