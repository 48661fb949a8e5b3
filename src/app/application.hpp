#pragma once

#include "app/config.hpp"
#include "sync/pairing_store.hpp"
#include "sync/sync_context.hpp"
#include "storage/ledger_store.hpp"
#include "core/result.hpp"
#include <QJsonObject>
#include <QUrl>
#include <memory>
#include <string>
#include <string_view>

namespace tally::app {

/**
 * Application - owns the ledger, the pairing store and the sync context
 * for one data directory, and implements the tallyd commands on top.
 */
class Application {
public:
    [[nodiscard]] static Result<std::unique_ptr<Application>, Error> open(AppConfig config);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    [[nodiscard]] const AppConfig& config() const { return config_; }
    [[nodiscard]] sync::SyncContext& context() { return *context_; }

    /**
     * Run the sync server until the event loop exits.
     */
    [[nodiscard]] Result<void, Error> serve();

    /**
     * Identity, pairing code, peers (without tokens), pending conflict and
     * the current last change.
     */
    [[nodiscard]] Result<QJsonObject, Error> status_report();

    [[nodiscard]] Result<void, Error> resolve(std::string_view action);

    [[nodiscard]] Result<void, Error> pair(const QUrl& peer, const std::string& code);
    [[nodiscard]] Result<void, Error> pull(const QUrl& peer);
    [[nodiscard]] Result<void, Error> push(const QUrl& peer);

private:
    Application(AppConfig config,
                std::unique_ptr<storage::LedgerStore> ledger,
                std::unique_ptr<sync::PairingStore> pairing);

    AppConfig config_;
    std::unique_ptr<storage::LedgerStore> ledger_;
    std::unique_ptr<sync::PairingStore> pairing_;
    std::unique_ptr<sync::SyncContext> context_;
};

} // namespace tally::app
