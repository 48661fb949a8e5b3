#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::network {

/**
 * A fully received HTTP/1.1 request.
 */
struct HttpRequest {
    std::string method;   // upper case as sent, e.g. "GET"
    std::string path;     // request target without the query string
    std::vector<std::pair<std::string, std::string>> headers;
    QByteArray body;
    std::optional<std::string> peer_ip;

    /**
     * First header named `name`, compared case-insensitively.
     * Values are returned with surrounding whitespace removed.
     */
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    QByteArray body;

    [[nodiscard]] static HttpResponse json(int status, const QJsonObject& payload);

    /**
     * Error body: {"code": ..., "message": ...}
     */
    [[nodiscard]] static HttpResponse error(int status, std::string_view code, std::string_view message);

    [[nodiscard]] static HttpResponse binary(std::string content_type, QByteArray bytes);

    /**
     * Status line, Content-Type, Content-Length, Connection: close, body.
     */
    [[nodiscard]] QByteArray serialize() const;
};

[[nodiscard]] const char* reason_phrase(int status);

/**
 * HttpRequestParser - incremental request reader.
 *
 * Bytes are appended with feed() as they arrive from the socket. Once the
 * head and the Content-Length body are complete the parser reports
 * Complete and take_request() hands the request out. Malformed framing or
 * an oversized body puts the parser into Failed; failure() then holds the
 * response to send back.
 */
class HttpRequestParser {
public:
    static constexpr int64_t DEFAULT_MAX_BODY = 512LL * 1024 * 1024;
    static constexpr int MAX_HEAD_SIZE = 64 * 1024;

    enum class State {
        Incomplete,
        Complete,
        Failed
    };

    explicit HttpRequestParser(int64_t max_body = DEFAULT_MAX_BODY) : max_body_(max_body) {}

    State feed(const QByteArray& data);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] const HttpResponse& failure() const { return failure_; }
    [[nodiscard]] HttpRequest take_request();

private:
    State parse_head();
    State fail(int status, std::string_view code, std::string_view message);

    int64_t max_body_;
    State state_ = State::Incomplete;
    bool head_done_ = false;
    int64_t content_length_ = 0;
    QByteArray buffer_;
    HttpRequest request_;
    HttpResponse failure_;
};

} // namespace tally::network
