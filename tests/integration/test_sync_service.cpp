#include <catch2/catch_test_macros.hpp>
#include "support/test_node.hpp"
#include "sync/conflict_detector.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/sync_service.hpp"
#include "network/sync_protocol.hpp"
#include "core/error_codes.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>

#include <chrono>

using namespace tally;
using namespace tally::sync;
using namespace tally::network;
using tally::test::TestNode;

namespace {

struct Peer {
    std::string device_id;
    std::string token;
};

Peer pair_into(TestNode& server, TestNode& client) {
    const auto code = server.pairing->snapshot().pair_code;
    auto token = server.pairing->pair(code, client.device_id(), "client", std::nullopt);
    REQUIRE(token.is_ok());
    return Peer{client.device_id(), token.unwrap()};
}

HttpRequest request(const std::string& method, const std::string& path) {
    HttpRequest req;
    req.method = method;
    req.path = path;
    req.peer_ip = "127.0.0.1";
    return req;
}

HttpRequest authed(const std::string& method, const std::string& path, const Peer& peer,
                   const std::string& remote_last) {
    auto req = request(method, path);
    req.headers.emplace_back(HEADER_DEVICE_ID, peer.device_id);
    req.headers.emplace_back(HEADER_DEVICE_TOKEN, peer.token);
    req.headers.emplace_back(HEADER_REMOTE_LAST_CHANGE, remote_last);
    return req;
}

QJsonObject body_of(const HttpResponse& response) {
    return QJsonDocument::fromJson(response.body).object();
}

QString code_of(const HttpResponse& response) {
    return body_of(response).value(QStringLiteral("code")).toString();
}

QByteArray archive_of(TestNode& node) {
    auto path = node.ctx->create_outgoing_archive();
    REQUIRE(path.is_ok());
    auto bytes = node.ctx->read_archive(path.unwrap());
    REQUIRE(bytes.is_ok());
    REQUIRE(QFile::remove(path.unwrap()));
    return bytes.unwrap();
}

std::string in_one_hour() {
    return (Timestamp::now() + std::chrono::hours(1)).to_iso_string();
}

// Give both peers a sync point in the past, then move the server past it.
void diverge(TestNode& server, const Peer& peer) {
    REQUIRE(server.pairing->update_device_sync(peer.device_id, std::nullopt).is_ok());
    QThread::msleep(5);
    server.touch();
}

} // namespace

TEST_CASE("SyncService answers status without authentication", "[sync_service]") {
    TestNode server("Kasse");
    server.touch();
    SyncService service(*server.ctx);

    const auto response = service.handle(request("GET", ROUTE_STATUS));
    REQUIRE(response.status == 200);
    const auto body = body_of(response);
    REQUIRE(body.value("device_id").toString().toStdString() == server.device_id());
    REQUIRE(body.value("device_name").toString() == "Kasse");
    REQUIRE(body.value("last_change").toString().toStdString() == server.last_change());
    REQUIRE_FALSE(body.contains("pair_code"));
}

TEST_CASE("SyncService rejects unknown routes", "[sync_service]") {
    TestNode server("Kasse");
    SyncService service(*server.ctx);

    const auto response = service.handle(request("GET", "/sync/unknown"));
    REQUIRE(response.status == 404);
    REQUIRE(code_of(response) == codes::SYNC_NOT_FOUND);

    REQUIRE(service.handle(request("POST", ROUTE_STATUS)).status == 404);
}

TEST_CASE("SyncService pairs with the right code only", "[sync_service]") {
    TestNode server("Kasse");
    SyncService service(*server.ctx);

    auto pair_request = [](const QString& code) {
        QJsonObject payload;
        payload.insert(QStringLiteral("code"), code);
        payload.insert(QStringLiteral("device_id"), QStringLiteral("peer-1"));
        payload.insert(QStringLiteral("device_name"), QStringLiteral("Laptop"));
        auto req = request("POST", ROUTE_PAIR);
        req.body = QJsonDocument(payload).toJson();
        return req;
    };

    SECTION("Wrong code") {
        const auto response = service.handle(pair_request(QStringLiteral("0000000000x")));
        REQUIRE(response.status == 401);
        REQUIRE(code_of(response) == codes::SYNC_PAIR_CODE);
    }

    SECTION("Not JSON") {
        auto req = request("POST", ROUTE_PAIR);
        req.body = "code=123";
        const auto response = service.handle(req);
        REQUIRE(response.status == 400);
        REQUIRE(code_of(response) == codes::SYNC_PAIR);
    }

    SECTION("Right code") {
        const auto code = QString::fromStdString(server.pairing->snapshot().pair_code);
        const auto response = service.handle(pair_request(code));
        REQUIRE(response.status == 200);
        const auto body = body_of(response);
        const auto token = body.value("device_token").toString().toStdString();
        REQUIRE(token.size() == 32);
        REQUIRE(body.value("server_device_id").toString().toStdString() == server.device_id());
        REQUIRE(server.pairing->device_for_token("peer-1", token).has_value());
        REQUIRE(server.pairing->find_device("peer-1")->last_known_ip ==
                std::optional<std::string>("127.0.0.1"));

        SECTION("Pairing again returns the same token") {
            const auto again = body_of(service.handle(pair_request(code)));
            REQUIRE(again.value("device_token").toString().toStdString() == token);
        }
    }
}

TEST_CASE("SyncService requires a valid device token", "[sync_service]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    SyncService service(*server.ctx);

    SECTION("Missing token") {
        auto req = request("GET", ROUTE_BACKUP);
        req.headers.emplace_back(HEADER_DEVICE_ID, peer.device_id);
        req.headers.emplace_back(HEADER_REMOTE_LAST_CHANGE, std::string(EPOCH_SENTINEL));
        const auto response = service.handle(req);
        REQUIRE(response.status == 401);
        REQUIRE(code_of(response) == codes::SYNC_AUTH);
    }

    SECTION("Token of another device") {
        const auto response = service.handle(
            authed("GET", ROUTE_BACKUP, Peer{"someone-else", peer.token}, std::string(EPOCH_SENTINEL)));
        REQUIRE(response.status == 401);
        REQUIRE(code_of(response) == codes::SYNC_AUTH);
    }

    SECTION("Malformed change timestamp") {
        const auto response = service.handle(authed("GET", ROUTE_BACKUP, peer, "last tuesday"));
        REQUIRE(response.status == 400);
        REQUIRE(code_of(response) == codes::SYNC_REMOTE_CHANGE);
    }
}

TEST_CASE("SyncService serves its archive to a peer that never synced", "[sync_service]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    server.add_booking("tx-server", 50.0, "2024-03-15T10:00:00.000Z");
    server.touch();
    client.touch();
    SyncService service(*server.ctx);

    SECTION("Older remote gets the archive") {
        const auto response = service.handle(
            authed("GET", ROUTE_BACKUP, peer, std::string(EPOCH_SENTINEL)));
        REQUIRE(response.status == 200);
        REQUIRE(response.content_type == "application/zip");
        REQUIRE(response.body.startsWith("PK"));
        REQUIRE(QDir(server.ctx->paths().temp_dir())
                    .entryList({QStringLiteral("sync_snapshot_*")}, QDir::Files).isEmpty());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
        REQUIRE(server.pairing->find_device(peer.device_id)->last_sync_at.has_value());
    }

    SECTION("Newer remote is told so") {
        const auto response = service.handle(authed("GET", ROUTE_BACKUP, peer, in_one_hour()));
        REQUIRE(response.status == 409);
        REQUIRE(code_of(response) == codes::SYNC_REMOTE_NEWER);
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
    }
}

TEST_CASE("SyncService restores a newer pushed archive", "[sync_service]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    server.add_booking("tx-server", 50.0, "2024-03-15T10:00:00.000Z");
    server.touch();
    QThread::msleep(5);
    client.add_booking("tx-client", 75.0, "2024-03-16T10:00:00.000Z");
    const auto client_last = client.touch();
    const auto archive = archive_of(client);
    SyncService service(*server.ctx);

    SECTION("Empty body") {
        const auto response = service.handle(authed("POST", ROUTE_RESTORE, peer, client_last));
        REQUIRE(response.status == 400);
        REQUIRE(code_of(response) == codes::SYNC_RESTORE);
    }

    SECTION("Newer archive replaces the ledger") {
        auto req = authed("POST", ROUTE_RESTORE, peer, client_last);
        req.body = archive;
        const auto response = service.handle(req);
        REQUIRE(response.status == 200);
        REQUIRE(body_of(response).value("ok").toBool());

        REQUIRE(server.booking("tx-client").has_value());
        REQUIRE_FALSE(server.booking("tx-server").has_value());
        REQUIRE(is_after(server.last_change(), client_last));
        REQUIRE(server.pairing->find_device(peer.device_id)->last_sync_at.has_value());
        REQUIRE(QDir(server.ctx->paths().temp_dir()).entryList(QDir::Files).isEmpty());
    }

    SECTION("Older archive is refused") {
        server.touch();
        auto req = authed("POST", ROUTE_RESTORE, peer, std::string("2000-01-01T00:00:00.000Z"));
        req.body = archive;
        const auto response = service.handle(req);
        REQUIRE(response.status == 409);
        REQUIRE(code_of(response) == codes::SYNC_LOCAL_NEWER);
        REQUIRE(server.booking("tx-server").has_value());
    }
}

TEST_CASE("A conflicting push is kept for the operator and can be merged", "[sync_service][conflict]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);

    server.add_category("Material");
    server.add_booking("tx-server", 50.0, "2024-03-15T10:00:00.000Z");
    client.add_category("Miete");
    client.add_booking("tx-client", -1200.0, "2024-03-01T09:00:00.000Z");
    client.close_month(2024, 2, "2024-03-01T08:00:00.000Z");
    client.touch();
    const auto archive = archive_of(client);

    diverge(server, peer);
    const auto server_last = server.last_change();
    const auto remote_last = in_one_hour();

    SyncService service(*server.ctx);
    auto req = authed("POST", ROUTE_RESTORE, peer, remote_last);
    req.body = archive;
    const auto response = service.handle(req);
    REQUIRE(response.status == 409);
    REQUIRE(code_of(response) == codes::SYNC_CONFLICT);

    // Nothing applied yet.
    REQUIRE_FALSE(server.booking("tx-client").has_value());
    REQUIRE(server.last_change() == server_last);

    const auto pending = server.pairing->pending_conflict();
    REQUIRE(pending.has_value());
    REQUIRE(pending->device_id == peer.device_id);
    REQUIRE(pending->local_last_change == server_last);
    REQUIRE(pending->remote_last_change == remote_last);
    REQUIRE(pending->archive_path.has_value());
    REQUIRE(QFile::exists(QString::fromStdString(*pending->archive_path)));
    REQUIRE(pending->local_summary.has_value());
    REQUIRE(pending->local_summary->tx_count == 1);
    REQUIRE(pending->remote_summary.has_value());
    REQUIRE(pending->remote_summary->tx_count == 1);
    REQUIRE(pending->remote_summary->last_items.size() == 1);

    SECTION("MERGE folds the remote data in") {
        ConflictResolver resolver(*server.ctx);
        REQUIRE(resolver.resolve("merge").is_ok());

        REQUIRE(server.booking("tx-server").has_value());
        REQUIRE(server.booking("tx-client").has_value());
        auto miete = server.ledger->with_db([](storage::Database& db) {
            return storage::LedgerRepository(db).find_category_id("Miete");
        });
        REQUIRE(miete.is_ok());
        REQUIRE(miete.unwrap().has_value());
        const auto closing = server.month(2024, 2);
        REQUIRE(closing.has_value());
        REQUIRE(closing->is_closed);
        REQUIRE(is_after(server.last_change(), server_last));

        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
        REQUIRE_FALSE(QFile::exists(QString::fromStdString(*pending->archive_path)));
        REQUIRE(server.pairing->find_device(peer.device_id)->last_remote_change ==
                std::optional<std::string>(remote_last));
    }

    SECTION("USE_REMOTE replaces the ledger") {
        ConflictResolver resolver(*server.ctx);
        REQUIRE(resolver.resolve(ResolveAction::UseRemote).is_ok());

        REQUIRE(server.booking("tx-client").has_value());
        REQUIRE_FALSE(server.booking("tx-server").has_value());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
    }

    SECTION("KEEP_LOCAL leaves the ledger alone") {
        ConflictResolver resolver(*server.ctx);
        REQUIRE(resolver.resolve("KEEP_LOCAL").is_ok());

        REQUIRE(server.last_change() == server_last);
        REQUIRE_FALSE(server.booking("tx-client").has_value());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
        REQUIRE_FALSE(QFile::exists(QString::fromStdString(*pending->archive_path)));
    }
}

TEST_CASE("A conflicting pull leaves nothing to apply", "[sync_service][conflict]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    diverge(server, peer);
    const auto server_last = server.last_change();

    SyncService service(*server.ctx);
    const auto response = service.handle(authed("GET", ROUTE_BACKUP, peer, in_one_hour()));
    REQUIRE(response.status == 409);
    REQUIRE(code_of(response) == codes::SYNC_CONFLICT);

    const auto pending = server.pairing->pending_conflict();
    REQUIRE(pending.has_value());
    REQUIRE_FALSE(pending->archive_path.has_value());
    REQUIRE_FALSE(pending->remote_summary.has_value());

    ConflictResolver resolver(*server.ctx);

    SECTION("USE_REMOTE and MERGE fail and keep the conflict") {
        for (auto action : {ResolveAction::UseRemote, ResolveAction::Merge}) {
            auto result = resolver.resolve(action);
            REQUIRE(result.is_err());
            REQUIRE(result.unwrap_err().code == codes::SYNC_CONFLICT);
            REQUIRE(server.pairing->pending_conflict().has_value());
        }
    }

    SECTION("KEEP_LOCAL closes it") {
        REQUIRE(resolver.resolve("KEEP_LOCAL").is_ok());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
        REQUIRE(server.last_change() == server_last);
    }

    SECTION("Unknown action is rejected") {
        auto result = resolver.resolve("THROW_AWAY");
        REQUIRE(result.is_err());
        REQUIRE(server.pairing->pending_conflict().has_value());
    }
}

TEST_CASE("Resolving without a pending conflict fails", "[conflict]") {
    TestNode node("Kasse");
    ConflictResolver resolver(*node.ctx);
    auto result = resolver.resolve(ResolveAction::KeepLocal);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == codes::SYNC_CONFLICT);
}

TEST_CASE("A conflict that cannot be stored is a server error", "[sync_service][conflict]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    client.touch();
    const auto archive = archive_of(client);
    diverge(server, peer);

    // Replace the state document with a directory: it can no longer be written.
    const QString state_path = server.pairing->path();
    REQUIRE(QFile::remove(state_path));
    REQUIRE(QDir().mkpath(state_path));

    SyncService service(*server.ctx);

    SECTION("Pull") {
        const auto response = service.handle(authed("GET", ROUTE_BACKUP, peer, in_one_hour()));
        REQUIRE(response.status == 500);
        REQUIRE(code_of(response) == codes::SYNC_STORE);
    }

    SECTION("Push") {
        auto req = authed("POST", ROUTE_RESTORE, peer, in_one_hour());
        req.body = archive;
        const auto response = service.handle(req);
        REQUIRE(response.status == 500);
        REQUIRE(code_of(response) == codes::SYNC_STORE);
        REQUIRE(QDir(server.ctx->paths().conflicts_dir()).entryList(QDir::Files).isEmpty());
    }

    REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
}

TEST_CASE("A conflict resolved from another process is seen by the server", "[sync_service][conflict]") {
    TestNode server("Kasse");
    TestNode client("Laptop");
    const auto peer = pair_into(server, client);
    server.add_booking("tx-server", 50.0, "2024-03-15T10:00:00.000Z");
    client.add_booking("tx-client", 75.0, "2024-03-16T10:00:00.000Z");
    client.touch();
    const auto archive = archive_of(client);
    diverge(server, peer);

    SyncService service(*server.ctx);
    auto conflicting = authed("POST", ROUTE_RESTORE, peer, in_one_hour());
    conflicting.body = archive;
    REQUIRE(service.handle(conflicting).status == 409);
    REQUIRE(server.pairing->pending_conflict().has_value());
    QThread::msleep(5);

    // What `tallyd resolve` opens next to a running `tallyd serve`.
    const QString data_dir = server.dir.path();
    auto ledger = storage::LedgerStore::open((data_dir + "/tally.sqlite").toStdString());
    REQUIRE(ledger.is_ok());
    auto pairing = PairingStore::open(data_dir + "/sync_state.json", "Kasse");
    REQUIRE(pairing.is_ok());
    SyncContext cli_ctx(*ledger.unwrap(), *pairing.unwrap(),
                        SyncPaths{.data_dir = data_dir, .receipt_base = server.receipt_base()});
    ConflictResolver resolver(cli_ctx);

    SECTION("KEEP_LOCAL lets the next push through") {
        REQUIRE(resolver.resolve(ResolveAction::KeepLocal).is_ok());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
        REQUIRE(server.pairing->find_device(peer.device_id)->last_sync_at.has_value());

        auto retry = authed("POST", ROUTE_RESTORE, peer, in_one_hour());
        retry.body = archive;
        const auto response = service.handle(retry);
        REQUIRE(response.status == 200);
        REQUIRE(server.booking("tx-client").has_value());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());
    }

    SECTION("USE_REMOTE is visible through the server's connection") {
        REQUIRE(resolver.resolve(ResolveAction::UseRemote).is_ok());
        REQUIRE(server.booking("tx-client").has_value());
        REQUIRE_FALSE(server.booking("tx-server").has_value());
        REQUIRE_FALSE(server.pairing->pending_conflict().has_value());

        const auto status = service.handle(request("GET", ROUTE_STATUS));
        REQUIRE(status.status == 200);
        REQUIRE(body_of(status).value("last_change").toString().toStdString() ==
                cli_ctx.last_change().unwrap());
    }
}
