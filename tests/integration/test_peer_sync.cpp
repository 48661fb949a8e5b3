#include <catch2/catch_test_macros.hpp>
#include "support/test_node.hpp"
#include "sync/conflict_detector.hpp"
#include "sync/peer_sync.hpp"
#include "sync/sync_service.hpp"
#include "network/http_server.hpp"
#include "network/sync_client.hpp"
#include "core/error_codes.hpp"

#include <QHostAddress>
#include <QThread>
#include <QUrl>

using namespace tally;
using namespace tally::sync;
using namespace tally::network;
using tally::test::TestNode;

namespace {

// The answering device, served over a loopback socket.
struct ServedNode {
    TestNode node;
    SyncService service;
    HttpServerThread server;
    uint16_t port = 0;

    explicit ServedNode(const std::string& name)
        : node(name)
        , service(*node.ctx)
        , server([this](const HttpRequest& request) { return service.handle(request); })
    {
        auto started = server.start(QHostAddress::LocalHost, 0);
        REQUIRE(started.is_ok());
        port = started.unwrap();
    }

    ~ServedNode() { server.stop(); }

    [[nodiscard]] QUrl url() const {
        QUrl url;
        url.setScheme(QStringLiteral("http"));
        url.setHost(QStringLiteral("127.0.0.1"));
        url.setPort(port);
        return url;
    }
};

} // namespace

TEST_CASE("Peers pair, push and pull over HTTP", "[peer_sync][network]") {
    ServedNode office("Buero");
    TestNode laptop("Laptop");
    SyncClient client(office.url(), 10'000);

    SECTION("Status needs no pairing") {
        auto status = client.status();
        REQUIRE(status.is_ok());
        REQUIRE(status.unwrap().device_id == office.node.device_id());
        REQUIRE(status.unwrap().device_name == "Buero");
    }

    SECTION("Pulling before pairing is refused locally") {
        auto pulled = pull_from_peer(client, *laptop.ctx);
        REQUIRE(pulled.is_err());
        REQUIRE(pulled.unwrap_err().code == codes::SYNC_AUTH);
    }

    SECTION("A wrong pairing code is reported with the peer's code") {
        auto paired = pair_with_peer(client, *laptop.ctx, "not-the-code");
        REQUIRE(paired.is_err());
        REQUIRE(paired.unwrap_err().code == codes::SYNC_PAIR_CODE);
        REQUIRE(laptop.pairing->snapshot().paired_devices.empty());
    }

    SECTION("Paired peers exchange their ledgers") {
        const auto code = office.node.pairing->snapshot().pair_code;
        auto paired = pair_with_peer(client, *laptop.ctx, code);
        REQUIRE(paired.is_ok());
        REQUIRE(paired.unwrap().server_device_id == office.node.device_id());

        const auto remembered = laptop.pairing->find_device(office.node.device_id());
        REQUIRE(remembered.has_value());
        REQUIRE(remembered->token == paired.unwrap().device_token);
        REQUIRE(office.node.pairing->device_for_token(laptop.device_id(), remembered->token).has_value());

        office.node.add_booking("tx-office", 10.0, "2024-03-15T10:00:00.000Z");
        office.node.touch();
        QThread::msleep(5);
        laptop.add_booking("tx-laptop", 20.0, "2024-03-16T10:00:00.000Z");
        laptop.touch();

        REQUIRE(push_to_peer(client, *laptop.ctx).is_ok());
        REQUIRE(office.node.booking("tx-laptop").has_value());
        REQUIRE_FALSE(office.node.booking("tx-office").has_value());
        REQUIRE(laptop.pairing->find_device(office.node.device_id())->last_sync_at.has_value());

        SECTION("Pushing again is refused as not newer") {
            auto again = push_to_peer(client, *laptop.ctx);
            REQUIRE(again.is_err());
            REQUIRE(again.unwrap_err().code == codes::SYNC_LOCAL_NEWER);
        }

        SECTION("Pulling brings the restore entry back") {
            const auto before = laptop.last_change();
            REQUIRE(pull_from_peer(client, *laptop.ctx).is_ok());
            REQUIRE(laptop.booking("tx-laptop").has_value());
            REQUIRE(is_after(laptop.last_change(), before));
        }
    }
}

TEST_CASE("An unreachable peer is a transport error", "[peer_sync][network]") {
    QUrl url(QStringLiteral("http://127.0.0.1:1"));
    SyncClient client(url, 2'000);
    auto status = client.status();
    REQUIRE(status.is_err());
    REQUIRE(status.unwrap_err().code == codes::SYNC_TRANSPORT);
}
