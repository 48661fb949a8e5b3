#include "sync/peer_sync.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QFile>

namespace tally::sync {

namespace {

struct PeerSession {
    network::PeerStatus status;
    network::PeerCredentials credentials;
};

Result<PeerSession, Error> open_session(network::SyncClient& client, SyncContext& ctx) {
    auto status = client.status();
    if (status.is_err()) {
        return Result<PeerSession, Error>::err(status.unwrap_err());
    }
    const auto peer = ctx.pairing().find_device(status.unwrap().device_id);
    if (!peer) {
        return Result<PeerSession, Error>::err(Error{
            "Not paired with " + status.unwrap().device_name + "; pair first", codes::SYNC_AUTH});
    }
    return Result<PeerSession, Error>::ok(PeerSession{
        .status = status.unwrap(),
        .credentials = {.device_id = ctx.pairing().identity().device_id, .token = peer->token}
    });
}

void remove_quietly(const QString& path) {
    if (QFile::exists(path) && !QFile::remove(path)) {
        qCWarning(tallySyncLog) << "cannot remove" << path;
    }
}

} // namespace

Result<network::PairResponse, Error> pair_with_peer(network::SyncClient& client, SyncContext& ctx,
                                                    const std::string& code) {
    const auto identity = ctx.pairing().identity();
    auto paired = client.pair(code, identity.device_id, identity.device_name);
    if (paired.is_err()) {
        return paired;
    }
    const auto& response = paired.unwrap();
    TALLY_TRY(Result<network::PairResponse>,
              ctx.pairing().remember_peer(response.server_device_id, response.server_device_name,
                                          response.device_token,
                                          client.base_url().host().toStdString()));
    qCInfo(tallySyncLog) << "paired with" << QString::fromStdString(response.server_device_name);
    return paired;
}

Result<void, Error> pull_from_peer(network::SyncClient& client, SyncContext& ctx) {
    auto session_result = open_session(client, ctx);
    if (session_result.is_err()) {
        return Result<void, Error>::err(session_result.unwrap_err());
    }
    const auto session = std::move(session_result).unwrap();

    auto local_last = ctx.last_change();
    if (local_last.is_err()) {
        return Result<void, Error>::err(local_last.unwrap_err());
    }

    auto bytes = client.fetch_backup(session.credentials, local_last.unwrap());
    if (bytes.is_err()) {
        return Result<void, Error>::err(bytes.unwrap_err());
    }

    auto written = ctx.write_archive(ctx.paths().temp_dir(), QStringLiteral("sync_pull"), bytes.unwrap());
    if (written.is_err()) {
        return Result<void, Error>::err(written.unwrap_err());
    }
    auto applied = ctx.apply_remote_restore(written.unwrap(), "SYNC_RESTORE");
    remove_quietly(written.unwrap());
    if (applied.is_err()) {
        return applied;
    }

    qCInfo(tallySyncLog) << "pulled" << bytes.unwrap().size() << "bytes from"
                         << QString::fromStdString(session.status.device_name);
    return ctx.pairing().update_device_sync(session.status.device_id, session.status.last_change);
}

Result<void, Error> push_to_peer(network::SyncClient& client, SyncContext& ctx) {
    auto session_result = open_session(client, ctx);
    if (session_result.is_err()) {
        return Result<void, Error>::err(session_result.unwrap_err());
    }
    const auto session = std::move(session_result).unwrap();

    auto local_last = ctx.last_change();
    if (local_last.is_err()) {
        return Result<void, Error>::err(local_last.unwrap_err());
    }

    auto archive = ctx.create_outgoing_archive();
    if (archive.is_err()) {
        return Result<void, Error>::err(archive.unwrap_err());
    }
    auto bytes = ctx.read_archive(archive.unwrap());
    remove_quietly(archive.unwrap());
    if (bytes.is_err()) {
        return Result<void, Error>::err(bytes.unwrap_err());
    }

    TALLY_TRY(Result<void>, client.push_restore(session.credentials, local_last.unwrap(), bytes.unwrap()));

    qCInfo(tallySyncLog) << "pushed" << bytes.unwrap().size() << "bytes to"
                         << QString::fromStdString(session.status.device_name);
    return ctx.pairing().update_device_sync(session.status.device_id, session.status.last_change);
}

} // namespace tally::sync
