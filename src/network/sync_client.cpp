#include "network/sync_client.hpp"
#include "network/sync_protocol.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QTimer>

#include <optional>

namespace tally::network {

namespace {

QByteArray utf8(const std::string& text) {
    return QByteArray(text.data(), static_cast<qsizetype>(text.size()));
}

Error transport_error(const QString& message) {
    return Error{message.toStdString(), codes::SYNC_TRANSPORT};
}

std::optional<QJsonObject> json_object(const QByteArray& body) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

std::string field(const QJsonObject& obj, const char* key) {
    return obj.value(QLatin1String(key)).toString().toStdString();
}

} // namespace

SyncClient::SyncClient(QUrl base_url, int timeout_ms)
    : base_url_(std::move(base_url))
    , timeout_ms_(timeout_ms)
{
}

QNetworkRequest SyncClient::make_request(const char* route) const {
    QUrl url = base_url_;
    url.setPath(QString::fromLatin1(route));
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, QByteArrayLiteral("tallyd/1.0"));
    return request;
}

void SyncClient::add_auth(QNetworkRequest& request, const PeerCredentials& credentials,
                          const std::string& local_last_change) {
    request.setRawHeader(HEADER_DEVICE_ID, utf8(credentials.device_id));
    request.setRawHeader(HEADER_DEVICE_TOKEN, utf8(credentials.token));
    request.setRawHeader(HEADER_REMOTE_LAST_CHANGE, utf8(local_last_change));
}

Result<SyncClient::Reply, Error> SyncClient::send(const QNetworkRequest& request, const QByteArray& verb,
                                                  const QByteArray& body) {
    qCDebug(tallyHttpLog) << verb << request.url().toString() << body.size() << "bytes";

    QNetworkReply* reply = verb == "GET" ? manager_.get(request) : manager_.post(request, body);

    // Wait for completion with timeout
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(timeout_ms_);
    loop.exec();

    if (timeout.isActive()) {
        timeout.stop();
    } else {
        reply->abort();
        reply->deleteLater();
        return Result<Reply, Error>::err(
            transport_error(QStringLiteral("Timed out waiting for %1").arg(request.url().toString())));
    }

    const auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0) {
        const auto message = reply->errorString();
        reply->deleteLater();
        return Result<Reply, Error>::err(transport_error(message));
    }

    Reply result{.status = status, .body = reply->readAll()};
    reply->deleteLater();
    qCDebug(tallyHttpLog) << "<-" << result.status << result.body.size() << "bytes";
    return Result<Reply, Error>::ok(std::move(result));
}

Error SyncClient::reply_error(const Reply& reply) {
    if (auto obj = json_object(reply.body)) {
        const auto code = field(*obj, "code");
        const auto message = field(*obj, "message");
        if (!code.empty()) {
            return Error{message, code};
        }
    }
    return Error{"Peer answered HTTP " + std::to_string(reply.status), codes::SYNC_TRANSPORT};
}

Result<PeerStatus, Error> SyncClient::status() {
    auto reply = send(make_request(ROUTE_STATUS), QByteArrayLiteral("GET"), {});
    if (reply.is_err()) {
        return Result<PeerStatus, Error>::err(reply.unwrap_err());
    }
    if (reply.unwrap().status != 200) {
        return Result<PeerStatus, Error>::err(reply_error(reply.unwrap()));
    }
    auto obj = json_object(reply.unwrap().body);
    if (!obj) {
        return Result<PeerStatus, Error>::err(transport_error(QStringLiteral("Malformed status reply")));
    }
    return Result<PeerStatus, Error>::ok(PeerStatus{
        .device_id = field(*obj, "device_id"),
        .device_name = field(*obj, "device_name"),
        .last_change = field(*obj, "last_change")
    });
}

Result<PairResponse, Error> SyncClient::pair(const std::string& code, const std::string& device_id,
                                             const std::string& device_name) {
    QJsonObject payload;
    payload.insert(QStringLiteral("code"), QString::fromStdString(code));
    payload.insert(QStringLiteral("device_id"), QString::fromStdString(device_id));
    payload.insert(QStringLiteral("device_name"), QString::fromStdString(device_name));

    auto request = make_request(ROUTE_PAIR);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/json"));
    auto reply = send(request, QByteArrayLiteral("POST"), QJsonDocument(payload).toJson(QJsonDocument::Compact));
    if (reply.is_err()) {
        return Result<PairResponse, Error>::err(reply.unwrap_err());
    }
    if (reply.unwrap().status != 200) {
        return Result<PairResponse, Error>::err(reply_error(reply.unwrap()));
    }
    auto obj = json_object(reply.unwrap().body);
    if (!obj || field(*obj, "device_token").empty()) {
        return Result<PairResponse, Error>::err(transport_error(QStringLiteral("Malformed pairing reply")));
    }
    return Result<PairResponse, Error>::ok(PairResponse{
        .device_token = field(*obj, "device_token"),
        .server_device_id = field(*obj, "server_device_id"),
        .server_device_name = field(*obj, "server_device_name"),
        .last_change = field(*obj, "last_change")
    });
}

Result<QByteArray, Error> SyncClient::fetch_backup(const PeerCredentials& credentials,
                                                   const std::string& local_last_change) {
    auto request = make_request(ROUTE_BACKUP);
    add_auth(request, credentials, local_last_change);
    auto reply = send(request, QByteArrayLiteral("GET"), {});
    if (reply.is_err()) {
        return Result<QByteArray, Error>::err(reply.unwrap_err());
    }
    if (reply.unwrap().status != 200) {
        return Result<QByteArray, Error>::err(reply_error(reply.unwrap()));
    }
    return Result<QByteArray, Error>::ok(std::move(reply).unwrap().body);
}

Result<void, Error> SyncClient::push_restore(const PeerCredentials& credentials,
                                             const std::string& local_last_change,
                                             const QByteArray& archive) {
    auto request = make_request(ROUTE_RESTORE);
    add_auth(request, credentials, local_last_change);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/zip"));
    auto reply = send(request, QByteArrayLiteral("POST"), archive);
    if (reply.is_err()) {
        return Result<void, Error>::err(reply.unwrap_err());
    }
    if (reply.unwrap().status != 200) {
        return Result<void, Error>::err(reply_error(reply.unwrap()));
    }
    return Result<void, Error>::ok();
}

} // namespace tally::network
