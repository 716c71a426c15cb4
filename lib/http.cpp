#include "http.hpp"

#include <algorithm>
#include <array>
#include <boost/beast/http.hpp>
#include <cctype>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace beast = boost::beast;

    namespace {
        constexpr std::size_t BODY_CHUNK = 32 * 1024;
        const std::string USER_AGENT = "dockwire";

        bool methodCarriesBody(const std::string& method) {
            return method == "POST" || method == "PUT" || method == "PATCH";
        }

        std::string hex(std::size_t value) {
            std::ostringstream out;
            out << std::hex << value;
            return out.str();
        }

        void writeBody(Connection& connection, const RequestBody& body) {
            switch (body.kind) {
                case RequestBody::Kind::Empty:
                    return;
                case RequestBody::Kind::Buffered:
                    connection.write(body.data);
                    return;
                case RequestBody::Kind::Producer: {
                    std::vector<char> buffer(BODY_CHUNK);
                    while (std::size_t n = body.produce(buffer.data(), buffer.size())) {
                        std::string chunk = hex(n) + "\r\n";
                        chunk.append(buffer.data(), n);
                        chunk += "\r\n";
                        connection.write(chunk);
                    }
                    connection.write(std::string("0\r\n\r\n"));
                    return;
                }
            }
        }

        ProtocolError headerError(const boost::system::error_code& ec) {
            if (ec == beast::http::error::header_limit) {
                return ProtocolError(ProtocolError::Code::HeaderSectionTooLarge,
                                     "response header exceeds " + std::to_string(MAX_HEADER_SECTION) + " bytes");
            }
            return ProtocolError(ProtocolError::Code::MalformedStatusLine, "malformed response header: " + ec.message());
        }
    }

    bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    }

    RequestBody RequestBody::buffered(std::string data, std::string contentType) {
        RequestBody body;
        body.kind = Kind::Buffered;
        body.data = std::move(data);
        body.contentType = std::move(contentType);
        return body;
    }

    RequestBody RequestBody::producer(Producer produce, std::string contentType) {
        RequestBody body;
        body.kind = Kind::Producer;
        body.produce = std::move(produce);
        body.contentType = std::move(contentType);
        return body;
    }

    std::string serializeHead(const Request& request, const std::string& host) {
        std::string head = request.method + " " + request.target + " HTTP/1.1\r\n";
        head += "Host: " + host + "\r\n";
        head += "User-Agent: " + USER_AGENT + "\r\n";
        for (const auto& [name, value] : request.headers) {
            head += name + ": " + value + "\r\n";
        }
        if (!request.body.contentType.empty() && request.headers.find("Content-Type") == request.headers.end()) {
            head += "Content-Type: " + request.body.contentType + "\r\n";
        }
        switch (request.body.kind) {
            case RequestBody::Kind::Empty:
                if (methodCarriesBody(request.method)) head += "Content-Length: 0\r\n";
                break;
            case RequestBody::Kind::Buffered:
                head += "Content-Length: " + std::to_string(request.body.data.size()) + "\r\n";
                break;
            case RequestBody::Kind::Producer:
                head += "Transfer-Encoding: chunked\r\n";
                break;
        }
        head += "\r\n";
        return head;
    }

    std::string urlEncode(const std::string& value) {
        static const char digits[] = "0123456789ABCDEF";
        std::string out;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += digits[c >> 4];
                out += digits[c & 0x0f];
            }
        }
        return out;
    }

    std::string queryString(const std::vector<std::pair<std::string, std::string>>& params) {
        std::string query;
        for (const auto& [key, value] : params) {
            query += query.empty() ? "?" : "&";
            query += urlEncode(key) + "=" + urlEncode(value);
        }
        return query;
    }

    Response::Response(unsigned status, std::string reason, Headers headers, std::unique_ptr<Connection> connection,
                       Framing framing, std::uint64_t contentLength)
        : status_(status), reason_(std::move(reason)), headers_(std::move(headers)), framing_(framing),
          connection_(std::move(connection)) {
        raw_ = std::make_unique<ConnectionSource>(*connection_);
        switch (framing_) {
            case Framing::None:
                body_ = std::make_unique<StringSource>(std::string());
                break;
            case Framing::Chunked:
                body_ = std::make_unique<ChunkedDecoder>(*raw_);
                break;
            case Framing::Length:
                body_ = std::make_unique<LengthLimitedSource>(*raw_, contentLength);
                break;
            case Framing::UntilClose:
                break;
        }
    }

    Response::~Response() {
        close();
    }

    std::optional<std::string> Response::header(const std::string& name) const {
        auto it = headers_.find(name);
        if (it == headers_.end()) return std::nullopt;
        return it->second;
    }

    ByteSource& Response::body() {
        if (!connection_) {
            throw SessionError(SessionError::Code::InvalidState, "response body is no longer available");
        }
        return body_ ? *body_ : *raw_;
    }

    std::string Response::readBody() {
        return readAll(body());
    }

    void Response::setTimeout(std::chrono::milliseconds timeout) {
        if (connection_) connection_->setTimeout(timeout);
    }

    std::unique_ptr<Connection> Response::upgrade() {
        if (status_ != 101) {
            throw ProtocolError(ProtocolError::Code::UnexpectedStatus,
                                "expected 101 Switching Protocols, got " + std::to_string(status_));
        }
        if (!connection_) {
            throw SessionError(SessionError::Code::InvalidState, "connection already taken from the response");
        }
        body_.reset();
        raw_.reset();
        return std::move(connection_);
    }

    void Response::close() {
        body_.reset();
        raw_.reset();
        if (connection_) {
            connection_->close();
            connection_.reset();
        }
    }

    Response readResponse(std::unique_ptr<Connection> connection, bool headRequest) {
        beast::http::response_parser<beast::http::empty_body> parser;
        parser.eager(false);
        parser.header_limit(static_cast<std::uint32_t>(MAX_HEADER_SECTION));

        std::string buffer;
        std::array<char, 4096> chunk{};
        for (;;) {
            std::size_t n = connection->readSome(chunk.data(), chunk.size());
            if (n == 0) {
                throw ProtocolError(ProtocolError::Code::ShortRead,
                                    buffer.empty() ? "connection closed before any response"
                                                   : "connection closed inside the response header");
            }
            buffer.append(chunk.data(), n);

            boost::system::error_code ec;
            std::size_t used = parser.put(net::buffer(buffer), ec);
            if (ec == beast::http::error::need_more) {
                if (buffer.size() > MAX_HEADER_SECTION) throw headerError(beast::http::error::header_limit);
                continue;
            }
            if (ec) throw headerError(ec);
            if (!parser.is_header_done()) continue;

            if (used < buffer.size()) connection->unread(buffer.substr(used));
            break;
        }

        const auto& message = parser.get();
        const unsigned status = message.result_int();
        Headers headers;
        for (const auto& field : message) {
            auto name = field.name_string();
            auto value = field.value();
            headers.emplace(std::string(name.data(), name.size()), std::string(value.data(), value.size()));
        }

        Response::Framing framing = Response::Framing::UntilClose;
        std::uint64_t length = 0;
        if (headRequest || status < 200 || status == 204 || status == 304) {
            framing = Response::Framing::None;
        } else if (parser.chunked()) {
            framing = Response::Framing::Chunked;
        } else if (auto declared = parser.content_length()) {
            framing = *declared == 0 ? Response::Framing::None : Response::Framing::Length;
            length = *declared;
        }

        auto reason = message.reason();
        Log::debug(connection->description() + ": HTTP " + std::to_string(status));
        return Response(status, std::string(reason.data(), reason.size()), std::move(headers), std::move(connection),
                        framing, length);
    }

    Response execute(std::unique_ptr<Connection> connection, const Request& request, const std::string& host) {
        Log::trace(connection->description() + ": " + request.method + " " + request.target);
        connection->write(serializeHead(request, host));
        writeBody(*connection, request.body);
        return readResponse(std::move(connection), request.method == "HEAD");
    }
}
