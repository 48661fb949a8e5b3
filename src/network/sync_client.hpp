#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QUrl>
#include <string>

namespace tally::network {

struct PeerStatus {
    std::string device_id;
    std::string device_name;
    std::string last_change;
};

struct PairResponse {
    std::string device_token;
    std::string server_device_id;
    std::string server_device_name;
    std::string last_change;
};

/**
 * This device's id and the token the peer issued to it.
 */
struct PeerCredentials {
    std::string device_id;
    std::string token;
};

/**
 * SyncClient - the requesting side of the sync protocol.
 *
 * Calls block on a local event loop until the reply arrives or the
 * timeout passes. A non-2xx reply becomes an Error carrying the code
 * from the peer's {code, message} body; transport failures use
 * SYNC_TRANSPORT.
 */
class SyncClient {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 120'000;

    explicit SyncClient(QUrl base_url, int timeout_ms = DEFAULT_TIMEOUT_MS);

    [[nodiscard]] Result<PeerStatus, Error> status();

    [[nodiscard]] Result<PairResponse, Error> pair(const std::string& code,
                                                   const std::string& device_id,
                                                   const std::string& device_name);

    /**
     * Pull the peer's archive. `local_last_change` is sent as
     * Remote-Last-Change; the peer compares it against its own.
     */
    [[nodiscard]] Result<QByteArray, Error> fetch_backup(const PeerCredentials& credentials,
                                                         const std::string& local_last_change);

    /**
     * Push this device's archive to the peer.
     */
    [[nodiscard]] Result<void, Error> push_restore(const PeerCredentials& credentials,
                                                   const std::string& local_last_change,
                                                   const QByteArray& archive);

    [[nodiscard]] const QUrl& base_url() const { return base_url_; }

private:
    struct Reply {
        int status = 0;
        QByteArray body;
    };

    [[nodiscard]] QNetworkRequest make_request(const char* route) const;
    static void add_auth(QNetworkRequest& request, const PeerCredentials& credentials,
                         const std::string& local_last_change);

    [[nodiscard]] Result<Reply, Error> send(const QNetworkRequest& request, const QByteArray& verb,
                                            const QByteArray& body);
    [[nodiscard]] static Error reply_error(const Reply& reply);

    QUrl base_url_;
    int timeout_ms_;
    QNetworkAccessManager manager_;
};

} // namespace tally::network
