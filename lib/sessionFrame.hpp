#ifndef DOCKWIRE_SESSION_FRAME_HPP
#define DOCKWIRE_SESSION_FRAME_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Dockwire {
    // [u32 BE payload length][u8 type][u32 BE stream id][payload]
    enum class FrameType : std::uint8_t { Open = 1, Data = 2, Close = 3, Error = 4, Cancel = 5 };

    constexpr std::size_t SESSION_FRAME_HEADER = 9;
    constexpr std::uint32_t MAX_SESSION_PAYLOAD = 8u * 1024u * 1024u;

    // gRPC status codes carried by Error frames.
    namespace StatusCode {
        constexpr unsigned Cancelled = 1;
        constexpr unsigned Unknown = 2;
        constexpr unsigned InvalidArgument = 3;
        constexpr unsigned NotFound = 5;
        constexpr unsigned Unimplemented = 12;
        constexpr unsigned Internal = 13;
        constexpr unsigned Unavailable = 14;
    }

    using Metadata = std::map<std::string, std::vector<std::string>>;

    struct SessionFrame {
        FrameType type;
        std::uint32_t stream;
        std::string payload;
    };

    struct OpenRequest {
        std::string method;
        Metadata metadata;
    };

    struct ErrorStatus {
        unsigned code;
        std::string message;
    };

    std::string encodeSessionFrame(const SessionFrame& frame);

    std::string encodeOpen(const OpenRequest& open);
    OpenRequest decodeOpen(const std::string& payload);
    std::string encodeErrorStatus(const ErrorStatus& status);
    ErrorStatus decodeErrorStatus(const std::string& payload);

    std::string toString(FrameType type);

    // Incremental decoder for the control stream. next() throws ProtocolError(InvalidFrame)
    // for unknown types and oversized payloads.
    class SessionFrameReader {
        std::string buffer_;
        std::size_t pos_ = 0;

    public:
        void feed(const char* data, std::size_t size);
        std::optional<SessionFrame> next();
        std::size_t buffered() const { return buffer_.size() - pos_; }
    };
}

#endif // DOCKWIRE_SESSION_FRAME_HPP
