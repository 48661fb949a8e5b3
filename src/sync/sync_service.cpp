#include "sync/sync_service.hpp"
#include "sync/conflict_detector.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"
#include "core/types.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <cctype>

namespace tally::sync {

using network::HttpRequest;
using network::HttpResponse;
using network::HEADER_DEVICE_ID;
using network::HEADER_DEVICE_TOKEN;
using network::HEADER_REMOTE_LAST_CHANGE;

namespace {

QString qstr(const std::string& text) {
    return QString::fromStdString(text);
}

// Peer-supplied ids end up in file names.
QString file_safe(const std::string& text) {
    QString out;
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        const bool keep = std::isalnum(uc) || c == '-' || c == '_';
        out.append(QLatin1Char(keep ? c : '_'));
    }
    return out.isEmpty() ? QStringLiteral("unknown") : out;
}

HttpResponse server_error(const char* code, const Error& error) {
    return HttpResponse::error(500, code, error.to_string());
}

} // namespace

HttpResponse SyncService::handle(const HttpRequest& request) {
    qCInfo(tallyHttpLog) << qstr(request.method) << qstr(request.path)
                         << "from" << qstr(request.peer_ip.value_or("?"));

    HttpResponse response;
    if (request.method == "GET" && request.path == network::ROUTE_STATUS) {
        response = handle_status();
    } else if (request.method == "POST" && request.path == network::ROUTE_PAIR) {
        response = handle_pair(request);
    } else if (request.method == "GET" && request.path == network::ROUTE_BACKUP) {
        response = handle_backup(request);
    } else if (request.method == "POST" && request.path == network::ROUTE_RESTORE) {
        response = handle_restore(request);
    } else {
        response = HttpResponse::error(404, codes::SYNC_NOT_FOUND, "Route not found");
    }

    qCDebug(tallyHttpLog) << "->" << response.status << response.body.size() << "bytes";
    return response;
}

HttpResponse SyncService::handle_status() {
    auto last_change = ctx_.last_change();
    if (last_change.is_err()) {
        return server_error(codes::DB, last_change.unwrap_err());
    }
    const auto identity = ctx_.pairing().identity();

    QJsonObject payload;
    payload.insert(QStringLiteral("device_id"), qstr(identity.device_id));
    payload.insert(QStringLiteral("device_name"), qstr(identity.device_name));
    payload.insert(QStringLiteral("last_change"), qstr(last_change.unwrap()));
    return HttpResponse::json(200, payload);
}

HttpResponse SyncService::handle_pair(const HttpRequest& request) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(request.body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return HttpResponse::error(400, codes::SYNC_PAIR, "Pairing request is not valid JSON");
    }
    const auto body = doc.object();
    const auto code = body.value(QStringLiteral("code"));
    const auto device_id = body.value(QStringLiteral("device_id"));
    const auto device_name = body.value(QStringLiteral("device_name"));
    if (!code.isString() || !device_id.isString() || !device_name.isString()) {
        return HttpResponse::error(400, codes::SYNC_PAIR,
                                   "Pairing request needs code, device_id and device_name");
    }

    auto token = ctx_.pairing().pair(code.toString().toStdString(), device_id.toString().toStdString(),
                                     device_name.toString().toStdString(), request.peer_ip);
    if (token.is_err()) {
        const auto& error = token.unwrap_err();
        qCWarning(tallySyncLog) << "pairing with" << device_id.toString() << "failed:"
                                << qstr(error.to_string());
        if (error.code == codes::SYNC_PAIR_CODE) {
            return HttpResponse::error(401, error.code, error.message);
        }
        if (error.code == codes::SYNC_PAIR) {
            return HttpResponse::error(400, error.code, error.message);
        }
        return server_error(codes::SYNC_STORE, error);
    }

    auto last_change = ctx_.last_change();
    if (last_change.is_err()) {
        return server_error(codes::DB, last_change.unwrap_err());
    }
    const auto identity = ctx_.pairing().identity();
    qCInfo(tallySyncLog) << "paired with" << device_name.toString() << device_id.toString();

    QJsonObject payload;
    payload.insert(QStringLiteral("device_token"), qstr(token.unwrap()));
    payload.insert(QStringLiteral("server_device_id"), qstr(identity.device_id));
    payload.insert(QStringLiteral("server_device_name"), qstr(identity.device_name));
    payload.insert(QStringLiteral("last_change"), qstr(last_change.unwrap()));
    return HttpResponse::json(200, payload);
}

HttpResponse SyncService::handle_backup(const HttpRequest& request) {
    auto peer_result = authorize(request);
    if (peer_result.is_err()) {
        return peer_result.unwrap_err();
    }
    const auto peer = std::move(peer_result).unwrap();

    auto remote_result = read_remote_last_change(request);
    if (remote_result.is_err()) {
        return remote_result.unwrap_err();
    }
    const auto remote_last = std::move(remote_result).unwrap();

    auto local_result = ctx_.last_change();
    if (local_result.is_err()) {
        return server_error(codes::SYNC_BACKUP, local_result.unwrap_err());
    }
    const auto local_last = local_result.unwrap();

    if (has_conflict(peer.last_sync_at, local_last, remote_last)) {
        auto recorded = record_conflict(peer, local_last, remote_last, std::nullopt, std::nullopt);
        if (recorded.is_err()) {
            return server_error(codes::SYNC_STORE, recorded.unwrap_err());
        }
        return HttpResponse::error(409, codes::SYNC_CONFLICT, "Both sides changed since the last sync");
    }
    if (!is_after(local_last, remote_last)) {
        note_remote_change(peer, remote_last);
        return HttpResponse::error(409, codes::SYNC_REMOTE_NEWER, "Remote data is newer");
    }

    auto archive = ctx_.create_outgoing_archive();
    if (archive.is_err()) {
        return server_error(codes::SYNC_BACKUP, archive.unwrap_err());
    }
    const auto archive_path = archive.unwrap();

    auto bytes = ctx_.read_archive(archive_path);
    ctx_.schedule_cleanup(archive_path);
    if (bytes.is_err()) {
        return server_error(codes::SYNC_BACKUP, bytes.unwrap_err());
    }

    mark_synced(peer, remote_last);
    qCInfo(tallySyncLog) << "served archive to" << qstr(peer.device_name) << bytes.unwrap().size() << "bytes";
    return HttpResponse::binary("application/zip", std::move(bytes).unwrap());
}

HttpResponse SyncService::handle_restore(const HttpRequest& request) {
    auto peer_result = authorize(request);
    if (peer_result.is_err()) {
        return peer_result.unwrap_err();
    }
    const auto peer = std::move(peer_result).unwrap();

    auto remote_result = read_remote_last_change(request);
    if (remote_result.is_err()) {
        return remote_result.unwrap_err();
    }
    const auto remote_last = std::move(remote_result).unwrap();

    if (request.body.isEmpty()) {
        return HttpResponse::error(400, codes::SYNC_RESTORE, "Request carries no archive");
    }

    auto local_result = ctx_.last_change();
    if (local_result.is_err()) {
        return server_error(codes::SYNC_RESTORE, local_result.unwrap_err());
    }
    const auto local_last = local_result.unwrap();

    if (has_conflict(peer.last_sync_at, local_last, remote_last)) {
        auto written = ctx_.write_archive(ctx_.paths().conflicts_dir(),
                                          QStringLiteral("conflict_") + file_safe(peer.device_id),
                                          request.body);
        if (written.is_err()) {
            qCWarning(tallySyncLog) << "cannot keep pushed archive:"
                                    << qstr(written.unwrap_err().to_string());
            return server_error(codes::SYNC_STORE, written.unwrap_err());
        }
        std::optional<ConflictSummary> remote_summary;
        auto summary = ctx_.archive_summary(written.unwrap());
        if (summary.is_ok()) {
            remote_summary = summary.unwrap();
        } else {
            qCWarning(tallySyncLog) << "cannot summarize pushed archive:"
                                    << qstr(summary.unwrap_err().to_string());
        }
        auto recorded = record_conflict(peer, local_last, remote_last, written.unwrap().toStdString(),
                                        std::move(remote_summary));
        if (recorded.is_err()) {
            if (!QFile::remove(written.unwrap())) {
                qCWarning(tallySyncLog) << "cannot remove" << written.unwrap();
            }
            return server_error(codes::SYNC_STORE, recorded.unwrap_err());
        }
        return HttpResponse::error(409, codes::SYNC_CONFLICT, "Both sides changed since the last sync");
    }
    if (!is_after(remote_last, local_last)) {
        note_remote_change(peer, remote_last);
        return HttpResponse::error(409, codes::SYNC_LOCAL_NEWER, "Local data is newer");
    }

    auto written = ctx_.write_archive(ctx_.paths().temp_dir(), QStringLiteral("sync_restore"), request.body);
    if (written.is_err()) {
        return server_error(codes::SYNC_RESTORE, written.unwrap_err());
    }
    const auto archive_path = written.unwrap();

    auto applied = ctx_.apply_remote_restore(archive_path, "SYNC_RESTORE");
    if (!QFile::remove(archive_path)) {
        qCWarning(tallySyncLog) << "cannot remove" << archive_path;
    }
    if (applied.is_err()) {
        qCWarning(tallySyncLog) << "restore from" << qstr(peer.device_name) << "failed:"
                                << qstr(applied.unwrap_err().to_string());
        return server_error(codes::SYNC_RESTORE, applied.unwrap_err());
    }

    mark_synced(peer, remote_last);
    QJsonObject payload;
    payload.insert(QStringLiteral("ok"), true);
    return HttpResponse::json(200, payload);
}

Result<SyncService::AuthorizedPeer, HttpResponse> SyncService::authorize(const HttpRequest& request) {
    using R = Result<AuthorizedPeer, HttpResponse>;

    const auto device_id = request.header(HEADER_DEVICE_ID);
    if (!device_id || device_id->empty()) {
        return R::err(HttpResponse::error(401, codes::SYNC_AUTH, "Missing device id"));
    }
    const auto token = request.header(HEADER_DEVICE_TOKEN);
    if (!token || token->empty()) {
        return R::err(HttpResponse::error(401, codes::SYNC_AUTH, "Missing device token"));
    }
    const auto device = ctx_.pairing().device_for_token(*device_id, *token);
    if (!device) {
        qCWarning(tallySyncLog) << "rejected request from" << qstr(*device_id);
        return R::err(HttpResponse::error(401, codes::SYNC_AUTH, "Access denied"));
    }

    auto seen = ctx_.pairing().update_device_seen(device->device_id, device->device_name,
                                                  request.peer_ip, std::nullopt);
    if (seen.is_err()) {
        qCWarning(tallySyncLog) << "cannot record peer" << qstr(device->device_id) << ":"
                                << qstr(seen.unwrap_err().to_string());
    }
    return R::ok(AuthorizedPeer{
        .device_id = device->device_id,
        .device_name = device->device_name,
        .last_sync_at = device->last_sync_at
    });
}

Result<std::string, HttpResponse> SyncService::read_remote_last_change(const HttpRequest& request) {
    using R = Result<std::string, HttpResponse>;
    auto value = request.header(HEADER_REMOTE_LAST_CHANGE);
    if (!value || value->empty()) {
        return R::err(HttpResponse::error(400, codes::SYNC_REMOTE_CHANGE, "Missing remote change timestamp"));
    }
    if (!is_timestamp_well_formed(*value)) {
        return R::err(HttpResponse::error(400, codes::SYNC_REMOTE_CHANGE,
                                          "Remote change timestamp is not RFC 3339"));
    }
    return R::ok(std::move(*value));
}

Result<void, Error> SyncService::record_conflict(const AuthorizedPeer& peer, const std::string& local_last,
                                                 const std::string& remote_last,
                                                 std::optional<std::string> archive_path,
                                                 std::optional<ConflictSummary> remote_summary) {
    std::optional<ConflictSummary> local_summary;
    auto summary = ctx_.local_summary();
    if (summary.is_ok()) {
        local_summary = summary.unwrap();
    } else {
        qCWarning(tallySyncLog) << "cannot summarize local ledger:" << qstr(summary.unwrap_err().to_string());
    }

    PendingConflict conflict{
        .device_id = peer.device_id,
        .device_name = peer.device_name,
        .local_last_change = local_last,
        .remote_last_change = remote_last,
        .received_at = Timestamp::now().to_iso_string(),
        .archive_path = std::move(archive_path),
        .local_summary = std::move(local_summary),
        .remote_summary = std::move(remote_summary)
    };
    qCWarning(tallySyncLog) << "conflict with" << qstr(peer.device_name)
                            << "local" << qstr(local_last) << "remote" << qstr(remote_last);

    auto stored = ctx_.pairing().set_pending_conflict(conflict);
    if (stored.is_err()) {
        qCWarning(tallySyncLog) << "cannot persist conflict:" << qstr(stored.unwrap_err().to_string());
    }
    return stored;
}

void SyncService::note_remote_change(const AuthorizedPeer& peer, const std::string& remote_last) {
    auto seen = ctx_.pairing().update_device_seen(peer.device_id, std::nullopt, std::nullopt, remote_last);
    if (seen.is_err()) {
        qCWarning(tallySyncLog) << "cannot record remote change:" << qstr(seen.unwrap_err().to_string());
    }
}

void SyncService::mark_synced(const AuthorizedPeer& peer, const std::string& remote_last) {
    auto synced = ctx_.pairing().update_device_sync(peer.device_id, remote_last);
    if (synced.is_err()) {
        qCWarning(tallySyncLog) << "cannot record sync with" << qstr(peer.device_id) << ":"
                                << qstr(synced.unwrap_err().to_string());
    }
}

} // namespace tally::sync
