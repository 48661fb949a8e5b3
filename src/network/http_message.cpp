#include "network/http_message.hpp"
#include "core/error_codes.hpp"

#include <QJsonDocument>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tally::network {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

std::string_view view_of(const QByteArray& bytes, qsizetype from, qsizetype to) {
    return std::string_view(bytes.constData() + from, static_cast<size_t>(to - from));
}

} // namespace

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string(trim(value));
        }
    }
    return std::nullopt;
}

HttpResponse HttpResponse::json(int status, const QJsonObject& payload) {
    HttpResponse response;
    response.status = status;
    response.content_type = "application/json";
    response.body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    return response;
}

HttpResponse HttpResponse::error(int status, std::string_view code, std::string_view message) {
    QJsonObject payload;
    payload.insert(QStringLiteral("code"), QString::fromUtf8(code.data(), static_cast<qsizetype>(code.size())));
    payload.insert(QStringLiteral("message"),
                   QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size())));
    return json(status, payload);
}

HttpResponse HttpResponse::binary(std::string content_type, QByteArray bytes) {
    HttpResponse response;
    response.status = 200;
    response.content_type = std::move(content_type);
    response.body = std::move(bytes);
    return response;
}

QByteArray HttpResponse::serialize() const {
    QByteArray out;
    out.reserve(body.size() + 160);
    out.append("HTTP/1.1 ");
    out.append(QByteArray::number(status));
    out.append(' ');
    out.append(reason_phrase(status));
    out.append("\r\nContent-Type: ");
    out.append(content_type.data(), static_cast<qsizetype>(content_type.size()));
    out.append("\r\nContent-Length: ");
    out.append(QByteArray::number(body.size()));
    out.append("\r\nConnection: close\r\n\r\n");
    out.append(body);
    return out;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

HttpRequestParser::State HttpRequestParser::feed(const QByteArray& data) {
    if (state_ != State::Incomplete) {
        return state_;
    }
    buffer_.append(data);

    if (!head_done_) {
        auto head_state = parse_head();
        if (head_state != State::Incomplete || !head_done_) {
            return head_state;
        }
    }

    if (static_cast<int64_t>(buffer_.size()) < content_length_) {
        return state_;
    }
    request_.body = buffer_.left(static_cast<qsizetype>(content_length_));
    buffer_.clear();
    state_ = State::Complete;
    return state_;
}

HttpRequestParser::State HttpRequestParser::parse_head() {
    const auto end = buffer_.indexOf("\r\n\r\n");
    if (end < 0) {
        if (buffer_.size() > MAX_HEAD_SIZE) {
            return fail(400, codes::HTTP_BAD_REQUEST, "Request head too large");
        }
        return state_;
    }
    if (end > MAX_HEAD_SIZE) {
        return fail(400, codes::HTTP_BAD_REQUEST, "Request head too large");
    }

    // Request line
    auto line_end = buffer_.indexOf("\r\n");
    const auto request_line = view_of(buffer_, 0, line_end);
    const auto first_space = request_line.find(' ');
    const auto last_space = request_line.rfind(' ');
    if (first_space == std::string_view::npos || last_space == first_space) {
        return fail(400, codes::HTTP_BAD_REQUEST, "Malformed request line");
    }
    const auto version = request_line.substr(last_space + 1);
    if (version.substr(0, 5) != "HTTP/") {
        return fail(400, codes::HTTP_BAD_REQUEST, "Unsupported protocol");
    }
    request_.method = std::string(request_line.substr(0, first_space));
    auto target = request_line.substr(first_space + 1, last_space - first_space - 1);
    if (auto query = target.find('?'); query != std::string_view::npos) {
        target = target.substr(0, query);
    }
    if (target.empty()) {
        return fail(400, codes::HTTP_BAD_REQUEST, "Malformed request line");
    }
    request_.path = std::string(target);

    // Header lines
    auto pos = line_end + 2;
    while (pos < end) {
        auto next = buffer_.indexOf("\r\n", pos);
        if (next < 0 || next > end) {
            next = end;
        }
        const auto line = view_of(buffer_, pos, next);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return fail(400, codes::HTTP_BAD_REQUEST, "Malformed header line");
        }
        request_.headers.emplace_back(std::string(trim(line.substr(0, colon))),
                                      std::string(trim(line.substr(colon + 1))));
        pos = next + 2;
    }
    buffer_.remove(0, end + 4);
    head_done_ = true;

    if (request_.header("Transfer-Encoding")) {
        return fail(400, codes::HTTP_BAD_REQUEST, "Chunked request bodies are not supported");
    }
    if (auto length = request_.header("Content-Length")) {
        int64_t parsed = 0;
        const auto* first = length->data();
        const auto* last = first + length->size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec != std::errc{} || ptr != last || parsed < 0) {
            return fail(400, codes::HTTP_BAD_REQUEST, "Invalid Content-Length");
        }
        if (parsed > max_body_) {
            return fail(413, codes::SYNC_TOO_LARGE, "Request body too large");
        }
        content_length_ = parsed;
    }
    return state_;
}

HttpRequestParser::State HttpRequestParser::fail(int status, std::string_view code, std::string_view message) {
    failure_ = HttpResponse::error(status, code, message);
    buffer_.clear();
    state_ = State::Failed;
    return state_;
}

HttpRequest HttpRequestParser::take_request() {
    return std::move(request_);
}

} // namespace tally::network
