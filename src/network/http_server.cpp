#include "network/http_server.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QMetaObject>

#include <optional>

namespace tally::network {

// ============================================================================
// HttpConnection
// ============================================================================

HttpConnection::HttpConnection(QTcpSocket* socket, HttpHandler handler, int64_t max_body,
                               QObject* parent)
    : QObject(parent)
    , socket_(socket)
    , handler_(std::move(handler))
    , parser_(max_body)
{
    socket_->setParent(this);

    connect(socket_, &QTcpSocket::readyRead,
            this, &HttpConnection::onReadyRead);
    connect(socket_, &QTcpSocket::disconnected,
            this, &HttpConnection::onDisconnected);

    idle_timer_.setSingleShot(true);
    idle_timer_.setInterval(IDLE_TIMEOUT_MS);
    connect(&idle_timer_, &QTimer::timeout,
            this, &HttpConnection::onIdleTimeout);
    idle_timer_.start();
}

void HttpConnection::onReadyRead() {
    if (responded_) {
        return;
    }
    idle_timer_.start();

    switch (parser_.feed(socket_->readAll())) {
        case HttpRequestParser::State::Incomplete:
            return;
        case HttpRequestParser::State::Failed:
            qCWarning(tallyHttpLog) << "rejected request from" << socket_->peerAddress().toString()
                                    << parser_.failure().status;
            respond(parser_.failure());
            return;
        case HttpRequestParser::State::Complete:
            break;
    }

    auto request = parser_.take_request();
    request.peer_ip = socket_->peerAddress().toString().toStdString();
    respond(handler_(request));
}

void HttpConnection::respond(const HttpResponse& response) {
    responded_ = true;
    idle_timer_.stop();
    socket_->write(response.serialize());
    // Pending bytes are flushed before the socket actually closes.
    socket_->disconnectFromHost();
}

void HttpConnection::onDisconnected() {
    idle_timer_.stop();
    deleteLater();
}

void HttpConnection::onIdleTimeout() {
    qCWarning(tallyHttpLog) << "closing idle connection from" << socket_->peerAddress().toString();
    socket_->abort();
    deleteLater();
}

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(HttpHandler handler, int64_t max_body, QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
    , handler_(std::move(handler))
    , max_body_(max_body)
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &HttpServer::onNewConnection);
}

HttpServer::~HttpServer() {
    close();
}

Result<uint16_t, Error> HttpServer::listen(const QHostAddress& address, uint16_t port) {
    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::err(
            Error{server_->errorString().toStdString(), codes::IO});
    }

    qCInfo(tallyHttpLog) << "listening on" << address.toString() << server_->serverPort();
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void HttpServer::close() {
    server_->close();
}

uint16_t HttpServer::port() const {
    return server_->serverPort();
}

bool HttpServer::isListening() const {
    return server_->isListening();
}

void HttpServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        new HttpConnection(socket, handler_, max_body_, this);
    }
}

// ============================================================================
// HttpServerThread
// ============================================================================

HttpServerThread::HttpServerThread(HttpHandler handler, int64_t max_body)
    : handler_(std::move(handler))
    , max_body_(max_body)
{
}

HttpServerThread::~HttpServerThread() {
    stop();
}

Result<uint16_t, Error> HttpServerThread::start(const QHostAddress& address, uint16_t port) {
    if (isRunning()) {
        return Result<uint16_t, Error>::err(Error{"Server already running", codes::IO});
    }

    thread_ = std::make_unique<QThread>();
    thread_->setObjectName(QStringLiteral("tally-http"));
    server_ = new HttpServer(handler_, max_body_);
    server_->moveToThread(thread_.get());

    // Clean up server when thread finishes
    QObject::connect(thread_.get(), &QThread::finished,
                     server_, &QObject::deleteLater);
    thread_->start();

    std::optional<Result<uint16_t, Error>> bound;
    auto* server = server_;
    QMetaObject::invokeMethod(server, [&bound, server, address, port]() {
        bound = server->listen(address, port);
    }, Qt::BlockingQueuedConnection);

    if (!bound || bound->is_err()) {
        stop();
        return bound ? *bound
                     : Result<uint16_t, Error>::err(Error{"Server thread did not start", codes::IO});
    }
    return *bound;
}

void HttpServerThread::stop() {
    if (!thread_) {
        return;
    }
    thread_->quit();
    if (!thread_->wait(5000)) {
        qCWarning(tallyHttpLog) << "server thread did not stop in time, waiting";
        thread_->wait();
    }
    thread_.reset();
    server_ = nullptr;
    qCDebug(tallyHttpLog) << "server thread stopped";
}

bool HttpServerThread::isRunning() const {
    return thread_ && thread_->isRunning();
}

} // namespace tally::network
