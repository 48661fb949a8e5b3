#include <QCoreApplication>
#include <QDebug>
#include <QHostAddress>
#include <QTemporaryDir>
#include <QUrl>

#include "app/application.hpp"
#include "crypto/random.hpp"
#include "network/http_server.hpp"
#include "network/sync_client.hpp"
#include "storage/change_log.hpp"
#include "storage/ledger_repository.hpp"
#include "sync/peer_sync.hpp"
#include "sync/sync_service.hpp"

// Pairs two data directories over a loopback socket, pushes A to B and
// pulls it back. Exit code 0 on success, otherwise the failing step.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    if (tally::crypto::init().is_err()) {
        return 1;
    }

    QTemporaryDir dirA;
    QTemporaryDir dirB;
    if (!dirA.isValid() || !dirB.isValid()) {
        return 1;
    }

    auto make = [](const QString& dir, const char* name) {
        tally::app::AppConfig config;
        config.data_dir = dir;
        config.device_name = name;
        config.max_body_bytes = tally::network::HttpRequestParser::DEFAULT_MAX_BODY;
        return tally::app::Application::open(config);
    };
    auto a = make(dirA.path(), "A");
    auto b = make(dirB.path(), "B");
    if (a.is_err() || b.is_err()) {
        qCritical() << "cannot open data directories";
        return 1;
    }
    auto& ctxA = a.unwrap()->context();
    auto& ctxB = b.unwrap()->context();

    // One category on A so there is something to carry over.
    auto seeded = ctxA.ledger().with_db([](tally::storage::Database& db) {
        return db.transaction([&]() -> tally::Result<void, tally::Error> {
            tally::storage::LedgerRepository repo(db);
            auto id = repo.insert_category(tally::Category{.id = 0, .name = "Loopback",
                                                           .description = std::nullopt,
                                                           .default_mwst_rate = 8.1,
                                                           .is_active = true});
            if (id.is_err()) {
                return tally::Result<void, tally::Error>::err(id.unwrap_err());
            }
            auto logged = tally::storage::ChangeLog(db).append(
                tally::ChangeEntry{.actor = "tool", .action = "CREATE", .entity_type = "CATEGORY"});
            if (logged.is_err()) {
                return tally::Result<void, tally::Error>::err(logged.unwrap_err());
            }
            return tally::Result<void, tally::Error>::ok();
        });
    });
    if (seeded.is_err()) {
        qCritical() << QString::fromStdString(seeded.unwrap_err().to_string());
        return 1;
    }

    tally::sync::SyncService service(ctxB);
    tally::network::HttpServerThread server(
        [&service](const tally::network::HttpRequest& request) { return service.handle(request); });
    auto port = server.start(QHostAddress::LocalHost, 0);
    if (port.is_err()) {
        qCritical() << QString::fromStdString(port.unwrap_err().to_string());
        return 2;
    }

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral("127.0.0.1"));
    url.setPort(port.unwrap());
    tally::network::SyncClient client(url, 10'000);

    const auto code = ctxB.pairing().snapshot().pair_code;
    if (auto paired = tally::sync::pair_with_peer(client, ctxA, code); paired.is_err()) {
        qCritical() << "pair:" << QString::fromStdString(paired.unwrap_err().to_string());
        return 3;
    }
    if (auto pushed = tally::sync::push_to_peer(client, ctxA); pushed.is_err()) {
        qCritical() << "push:" << QString::fromStdString(pushed.unwrap_err().to_string());
        return 4;
    }

    auto carried = ctxB.ledger().with_db([](tally::storage::Database& db) {
        return tally::storage::LedgerRepository(db).find_category_id("Loopback");
    });
    if (carried.is_err() || !carried.unwrap()) {
        qCritical() << "category did not arrive on B";
        return 5;
    }

    // B's restore logged a newer change, so A may pull it back.
    if (auto pulled = tally::sync::pull_from_peer(client, ctxA); pulled.is_err()) {
        qCritical() << "pull:" << QString::fromStdString(pulled.unwrap_err().to_string());
        return 6;
    }

    server.stop();
    qInfo() << "loopback sync ok";
    return 0;
}
