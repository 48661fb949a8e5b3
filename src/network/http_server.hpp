#pragma once

#include "network/http_message.hpp"
#include "core/result.hpp"
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThread>
#include <QTimer>
#include <functional>
#include <memory>

namespace tally::network {

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * HttpConnection - one accepted socket. Reads a single request, runs
 * the handler, writes the response and closes. Deletes itself once the
 * socket is gone.
 */
class HttpConnection : public QObject {
    Q_OBJECT

public:
    static constexpr int IDLE_TIMEOUT_MS = 120'000;

    HttpConnection(QTcpSocket* socket, HttpHandler handler, int64_t max_body,
                   QObject* parent = nullptr);

private slots:
    void onReadyRead();
    void onDisconnected();
    void onIdleTimeout();

private:
    void respond(const HttpResponse& response);

    QTcpSocket* socket_;
    HttpHandler handler_;
    HttpRequestParser parser_;
    QTimer idle_timer_;
    bool responded_ = false;
};

/**
 * HttpServer - Listens for incoming connections and hands each one to
 * an HttpConnection.
 */
class HttpServer : public QObject {
    Q_OBJECT

public:
    explicit HttpServer(HttpHandler handler,
                        int64_t max_body = HttpRequestParser::DEFAULT_MAX_BODY,
                        QObject* parent = nullptr);
    ~HttpServer() override;

    /**
     * Start listening.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(const QHostAddress& address, uint16_t port);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
    HttpHandler handler_;
    int64_t max_body_;
};

/**
 * HttpServerThread - runs an HttpServer on a dedicated QThread with its
 * own event loop, so request handling never blocks the caller's thread.
 */
class HttpServerThread {
public:
    explicit HttpServerThread(HttpHandler handler,
                              int64_t max_body = HttpRequestParser::DEFAULT_MAX_BODY);
    ~HttpServerThread();

    HttpServerThread(const HttpServerThread&) = delete;
    HttpServerThread& operator=(const HttpServerThread&) = delete;

    /**
     * Start the thread and bind. Blocks until the server is listening or
     * has failed to.
     */
    Result<uint16_t, Error> start(const QHostAddress& address, uint16_t port);

    void stop();

    [[nodiscard]] bool isRunning() const;

private:
    HttpHandler handler_;
    int64_t max_body_;
    std::unique_ptr<QThread> thread_;
    HttpServer* server_ = nullptr;  // Deleted by thread finished signal
};

} // namespace tally::network
