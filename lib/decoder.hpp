#ifndef DOCKWIRE_DECODER_HPP
#define DOCKWIRE_DECODER_HPP

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Dockwire {
    class Connection;

    // Pull side of a response body. read() returns 0 only when the stream has ended.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;
        virtual std::size_t read(char* data, std::size_t size) = 0;
    };

    // Reads until size bytes arrived or the source ended; returns the count read.
    std::size_t readFull(ByteSource& source, char* data, std::size_t size);
    std::string readAll(ByteSource& source);

    class StringSource : public ByteSource {
        std::string data_;
        std::size_t pos_ = 0;
        std::size_t maxRead_;

    public:
        // maxRead caps each read() to simulate a fragmented network stream.
        explicit StringSource(std::string data, std::size_t maxRead = std::numeric_limits<std::size_t>::max());

        std::size_t read(char* data, std::size_t size) override;
    };

    class ConnectionSource : public ByteSource {
        Connection& connection_;

    public:
        explicit ConnectionSource(Connection& connection) : connection_(connection) {}

        std::size_t read(char* data, std::size_t size) override;
    };

    // Content-Length framing: ends after exactly `length` bytes, and a source that ends
    // earlier is a ShortRead.
    class LengthLimitedSource : public ByteSource {
        ByteSource& inner_;
        std::uint64_t remaining_;

    public:
        LengthLimitedSource(ByteSource& inner, std::uint64_t length) : inner_(inner), remaining_(length) {}

        std::size_t read(char* data, std::size_t size) override;
    };

    class ChunkedDecoder : public ByteSource {
    public:
        explicit ChunkedDecoder(ByteSource& inner) : inner_(inner) {}

        std::size_t read(char* data, std::size_t size) override;

        const std::vector<std::pair<std::string, std::string>>& trailers() const { return trailers_; }

    private:
        enum class State { Size, Data, DataEnd, Trailer, Done };

        bool fill();
        std::string readLine();
        static std::uint64_t parseSize(const std::string& line);

        ByteSource& inner_;
        std::string buffer_;
        std::size_t pos_ = 0;
        State state_ = State::Size;
        std::uint64_t remaining_ = 0;
        std::vector<std::pair<std::string, std::string>> trailers_;
    };

    enum class StreamKind : std::uint8_t { Stdin = 0, Stdout = 1, Stderr = 2 };

    struct DemuxFrame {
        StreamKind kind;
        std::string payload;

        bool operator==(const DemuxFrame& other) const = default;
    };

    constexpr std::size_t DEMUX_HEADER_SIZE = 8;
    constexpr std::uint32_t MAX_DEMUX_FRAME = 64u * 1024u * 1024u;

    std::string encodeDemuxFrame(StreamKind kind, std::string_view payload);

    // [kind][0][0][0][u32 big-endian length][payload]. next() returns nullopt only when the
    // stream ends exactly on a frame boundary.
    class DemuxDecoder {
        ByteSource& source_;

    public:
        explicit DemuxDecoder(ByteSource& source) : source_(source) {}

        std::optional<DemuxFrame> next();
    };

    enum class OutputKind { Stdin, Stdout, Stderr, Console };

    struct LogOutput {
        OutputKind kind;
        std::string message;

        bool operator==(const LogOutput& other) const = default;
    };

    // Container output: demultiplexed frames, or raw Console chunks when a TTY was allocated.
    class LogStream {
        ByteSource& source_;
        bool tty_;
        DemuxDecoder demux_;

    public:
        LogStream(ByteSource& source, bool tty) : source_(source), tty_(tty), demux_(source) {}

        std::optional<LogOutput> next();
        bool tty() const { return tty_; }
    };

    // Newline-delimited JSON documents (build and pull progress).
    class JsonLineDecoder {
        ByteSource& source_;
        std::string buffer_;
        bool ended_ = false;

    public:
        explicit JsonLineDecoder(ByteSource& source) : source_(source) {}

        std::optional<nlohmann::json> next();
    };

    std::string toString(OutputKind kind);
}

#endif // DOCKWIRE_DECODER_HPP
