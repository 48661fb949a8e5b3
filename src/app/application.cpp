#include "app/application.hpp"
#include "network/http_server.hpp"
#include "network/sync_client.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/peer_sync.hpp"
#include "sync/sync_service.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QJsonArray>

namespace tally::app {

Application::Application(AppConfig config,
                         std::unique_ptr<storage::LedgerStore> ledger,
                         std::unique_ptr<sync::PairingStore> pairing)
    : config_(std::move(config))
    , ledger_(std::move(ledger))
    , pairing_(std::move(pairing))
    , context_(std::make_unique<sync::SyncContext>(
          *ledger_, *pairing_, sync::SyncPaths{.data_dir = config_.data_dir,
                                               .receipt_base = config_.receipt_base()}))
{
}

Result<std::unique_ptr<Application>, Error> Application::open(AppConfig config) {
    using R = Result<std::unique_ptr<Application>, Error>;

    if (!QDir().mkpath(config.data_dir) || !QDir().mkpath(config.receipt_base())) {
        return R::err(Error{"Cannot create data directory " + config.data_dir.toStdString(), codes::IO});
    }

    auto ledger = storage::LedgerStore::open(config.database_path().toStdString());
    if (ledger.is_err()) {
        return R::err(ledger.unwrap_err());
    }

    auto pairing = sync::PairingStore::open(config.pairing_path(),
                                            config.device_name.value_or(default_device_name()));
    if (pairing.is_err()) {
        return R::err(pairing.unwrap_err());
    }
    if (config.device_name && pairing.unwrap()->identity().device_name != *config.device_name) {
        TALLY_TRY(R, pairing.unwrap()->set_device_name(*config.device_name));
    }

    return R::ok(std::unique_ptr<Application>(new Application(
        std::move(config), std::move(ledger).unwrap(), std::move(pairing).unwrap())));
}

Result<void, Error> Application::serve() {
    context_->sweep_temp();

    sync::SyncService service(*context_);
    network::HttpServerThread server(
        [&service](const network::HttpRequest& request) { return service.handle(request); },
        config_.max_body_bytes);

    auto bound = server.start(QHostAddress::Any, config_.port);
    if (bound.is_err()) {
        return Result<void, Error>::err(bound.unwrap_err());
    }

    const auto identity = pairing_->identity();
    qCInfo(tallySyncLog) << "serving" << QString::fromStdString(identity.device_name)
                         << QString::fromStdString(identity.device_id) << "on port" << bound.unwrap();

    const int rc = QCoreApplication::exec();
    server.stop();
    if (rc != 0) {
        return Result<void, Error>::err(Error{"Event loop exited with " + std::to_string(rc), codes::IO});
    }
    return Result<void, Error>::ok();
}

Result<QJsonObject, Error> Application::status_report() {
    auto last_change = context_->last_change();
    if (last_change.is_err()) {
        return Result<QJsonObject, Error>::err(last_change.unwrap_err());
    }
    const auto snapshot = pairing_->snapshot();

    QJsonArray peers;
    for (const auto& device : snapshot.paired_devices) {
        peers.append(sync::to_json(device, false));
    }

    QJsonObject report;
    report.insert(QStringLiteral("device_id"), QString::fromStdString(snapshot.identity.device_id));
    report.insert(QStringLiteral("device_name"), QString::fromStdString(snapshot.identity.device_name));
    report.insert(QStringLiteral("pair_code"), QString::fromStdString(snapshot.pair_code));
    report.insert(QStringLiteral("port"), static_cast<int>(config_.port));
    report.insert(QStringLiteral("last_change"), QString::fromStdString(last_change.unwrap()));
    report.insert(QStringLiteral("paired_devices"), peers);
    report.insert(QStringLiteral("pending_conflict"),
                  snapshot.pending_conflict ? QJsonValue(sync::to_json(*snapshot.pending_conflict, false))
                                            : QJsonValue(QJsonValue::Null));
    return Result<QJsonObject, Error>::ok(report);
}

Result<void, Error> Application::resolve(std::string_view action) {
    sync::ConflictResolver resolver(*context_);
    return resolver.resolve(action);
}

Result<void, Error> Application::pair(const QUrl& peer, const std::string& code) {
    network::SyncClient client(peer);
    auto paired = sync::pair_with_peer(client, *context_, code);
    if (paired.is_err()) {
        return Result<void, Error>::err(paired.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Application::pull(const QUrl& peer) {
    network::SyncClient client(peer);
    return sync::pull_from_peer(client, *context_);
}

Result<void, Error> Application::push(const QUrl& peer) {
    network::SyncClient client(peer);
    return sync::push_to_peer(client, *context_);
}

} // namespace tally::app
