#include <catch2/catch_test_macros.hpp>
#include "network/http_message.hpp"
#include "core/error_codes.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace tally;
using namespace tally::network;

namespace {

QString error_code(const HttpResponse& response) {
    return QJsonDocument::fromJson(response.body).object().value("code").toString();
}

} // namespace

TEST_CASE("HttpRequestParser reads a request delivered in pieces", "[http]") {
    const QByteArray raw =
        "POST /sync/restore?x=1 HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "device-id:  peer-1 \r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "hello world";

    HttpRequestParser parser;
    for (qsizetype i = 0; i < raw.size() - 1; ++i) {
        REQUIRE(parser.feed(raw.mid(i, 1)) == HttpRequestParser::State::Incomplete);
    }
    REQUIRE(parser.feed(raw.right(1)) == HttpRequestParser::State::Complete);

    const auto request = parser.take_request();
    REQUIRE(request.method == "POST");
    REQUIRE(request.path == "/sync/restore");
    REQUIRE(request.header("Device-Id") == std::optional<std::string>("peer-1"));
    REQUIRE(request.header("DEVICE-ID") == std::optional<std::string>("peer-1"));
    REQUIRE_FALSE(request.header("Device-Token").has_value());
    REQUIRE(request.body == "hello world");
}

TEST_CASE("HttpRequestParser handles requests without a body", "[http]") {
    HttpRequestParser parser;
    REQUIRE(parser.feed("GET /sync/status HTTP/1.1\r\nHost: x\r\n\r\n") ==
            HttpRequestParser::State::Complete);
    const auto request = parser.take_request();
    REQUIRE(request.method == "GET");
    REQUIRE(request.path == "/sync/status");
    REQUIRE(request.body.isEmpty());
}

TEST_CASE("HttpRequestParser rejects bad framing", "[http]") {
    HttpRequestParser parser(1024);

    SECTION("Oversized body") {
        REQUIRE(parser.feed("POST /sync/restore HTTP/1.1\r\nContent-Length: 4096\r\n\r\n") ==
                HttpRequestParser::State::Failed);
        REQUIRE(parser.failure().status == 413);
        REQUIRE(error_code(parser.failure()) == codes::SYNC_TOO_LARGE);
    }

    SECTION("Chunked encoding") {
        REQUIRE(parser.feed("POST /sync/restore HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n") ==
                HttpRequestParser::State::Failed);
        REQUIRE(parser.failure().status == 400);
        REQUIRE(error_code(parser.failure()) == codes::HTTP_BAD_REQUEST);
    }

    SECTION("Invalid Content-Length") {
        REQUIRE(parser.feed("POST /sync/pair HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n") ==
                HttpRequestParser::State::Failed);
        REQUIRE(parser.failure().status == 400);
    }

    SECTION("Malformed request line") {
        REQUIRE(parser.feed("GARBAGE\r\n\r\n") == HttpRequestParser::State::Failed);
        REQUIRE(parser.failure().status == 400);
    }

    SECTION("Header without a colon") {
        REQUIRE(parser.feed("GET / HTTP/1.1\r\nno colon here\r\n\r\n") == HttpRequestParser::State::Failed);
        REQUIRE(parser.failure().status == 400);
    }

    SECTION("Head that never ends") {
        const QByteArray filler(HttpRequestParser::MAX_HEAD_SIZE + 1, 'a');
        REQUIRE(parser.feed("GET / HTTP/1.1\r\nX: " + filler) == HttpRequestParser::State::Failed);
    }
}

TEST_CASE("HttpResponse serializes with framing headers", "[http]") {
    const auto response = HttpResponse::error(401, codes::SYNC_AUTH, "Access denied");
    REQUIRE(response.status == 401);
    REQUIRE(error_code(response) == codes::SYNC_AUTH);

    const auto wire = response.serialize();
    REQUIRE(wire.startsWith("HTTP/1.1 401 Unauthorized\r\n"));
    REQUIRE(wire.contains("Content-Type: application/json\r\n"));
    REQUIRE(wire.contains("Content-Length: " + QByteArray::number(response.body.size()) + "\r\n"));
    REQUIRE(wire.contains("Connection: close\r\n"));
    REQUIRE(wire.endsWith(response.body));

    const auto zip = HttpResponse::binary("application/zip", QByteArray("PK\x03\x04", 4));
    REQUIRE(zip.status == 200);
    REQUIRE(zip.serialize().contains("Content-Type: application/zip\r\n"));
}
