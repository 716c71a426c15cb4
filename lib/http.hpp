#ifndef DOCKWIRE_HTTP_HPP
#define DOCKWIRE_HTTP_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "decoder.hpp"
#include "lib/connection.hpp"

namespace Dockwire {
    constexpr std::size_t MAX_HEADER_SECTION = 64 * 1024;

    struct CaseInsensitiveLess {
        bool operator()(const std::string& a, const std::string& b) const;
    };

    using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

    struct RequestBody {
        // Fills data with up to size bytes and returns the count; 0 ends the body.
        using Producer = std::function<std::size_t(char* data, std::size_t size)>;

        enum class Kind { Empty, Buffered, Producer };

        Kind kind = Kind::Empty;
        std::string data;
        Producer produce;
        std::string contentType;

        static RequestBody empty() { return {}; }
        static RequestBody buffered(std::string data, std::string contentType = "application/json");
        static RequestBody producer(Producer produce, std::string contentType);
    };

    struct Request {
        std::string method = "GET";
        std::string target = "/";
        Headers headers;
        RequestBody body;
    };

    // Request line and header section, ending with the blank line.
    std::string serializeHead(const Request& request, const std::string& host);

    std::string urlEncode(const std::string& value);
    std::string queryString(const std::vector<std::pair<std::string, std::string>>& params);

    // Parsed status and headers plus a lazily read body. Owns the connection: destroying
    // the response closes it.
    class Response {
    public:
        enum class Framing { None, Chunked, Length, UntilClose };

        Response(unsigned status, std::string reason, Headers headers, std::unique_ptr<Connection> connection,
                 Framing framing, std::uint64_t contentLength);
        Response(Response&&) noexcept = default;
        Response& operator=(Response&&) noexcept = default;
        ~Response();

        unsigned status() const { return status_; }
        const std::string& reason() const { return reason_; }
        const Headers& headers() const { return headers_; }
        std::optional<std::string> header(const std::string& name) const;
        Framing framing() const { return framing_; }

        ByteSource& body();
        std::string readBody();

        // Applies to the remaining body reads. Zero disables the timeout.
        void setTimeout(std::chrono::milliseconds timeout);

        // Only valid for 101 responses. Bytes the daemon sent after the header are
        // served first by the returned connection.
        std::unique_ptr<Connection> upgrade();

        void close();

    private:
        unsigned status_;
        std::string reason_;
        Headers headers_;
        Framing framing_;
        std::unique_ptr<Connection> connection_;
        std::unique_ptr<ByteSource> raw_;
        std::unique_ptr<ByteSource> body_;
    };

    // Sends one request over the connection and reads the response header.
    // Throws TransportError or ProtocolError.
    Response execute(std::unique_ptr<Connection> connection, const Request& request, const std::string& host);

    // Reads and parses a response header from an already written request.
    Response readResponse(std::unique_ptr<Connection> connection, bool headRequest);
}

#endif // DOCKWIRE_HTTP_HPP
