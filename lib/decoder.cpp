#include "decoder.hpp"

#include <algorithm>
#include <array>

#include "errors.hpp"
#include "lib/connection.hpp"

namespace Dockwire {
    namespace {
        constexpr std::size_t READ_CHUNK = 16 * 1024;
        constexpr std::size_t MAX_CHUNK_LINE = 4096;
        constexpr std::size_t MAX_JSON_LINE = 1024 * 1024;

        std::string trim(const std::string& value) {
            auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return {};
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }
    }

    std::size_t readFull(ByteSource& source, char* data, std::size_t size) {
        std::size_t total = 0;
        while (total < size) {
            std::size_t n = source.read(data + total, size - total);
            if (n == 0) break;
            total += n;
        }
        return total;
    }

    std::string readAll(ByteSource& source) {
        std::string result;
        std::array<char, READ_CHUNK> chunk{};
        while (std::size_t n = source.read(chunk.data(), chunk.size())) {
            result.append(chunk.data(), n);
        }
        return result;
    }

    StringSource::StringSource(std::string data, std::size_t maxRead) : data_(std::move(data)), maxRead_(maxRead) {}

    std::size_t StringSource::read(char* data, std::size_t size) {
        std::size_t n = std::min({size, maxRead_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, n, data);
        pos_ += n;
        return n;
    }

    std::size_t ConnectionSource::read(char* data, std::size_t size) {
        return connection_.readSome(data, size);
    }

    std::size_t LengthLimitedSource::read(char* data, std::size_t size) {
        if (remaining_ == 0 || size == 0) return 0;
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining_));
        std::size_t n = inner_.read(data, want);
        if (n == 0) {
            throw ProtocolError(ProtocolError::Code::ShortRead,
                                "body ended with " + std::to_string(remaining_) + " bytes of Content-Length missing");
        }
        remaining_ -= n;
        return n;
    }

    bool ChunkedDecoder::fill() {
        if (pos_ > 0 && pos_ == buffer_.size()) {
            buffer_.clear();
            pos_ = 0;
        } else if (pos_ > READ_CHUNK) {
            buffer_.erase(0, pos_);
            pos_ = 0;
        }
        std::array<char, READ_CHUNK> chunk{};
        std::size_t n = inner_.read(chunk.data(), chunk.size());
        if (n == 0) return false;
        buffer_.append(chunk.data(), n);
        return true;
    }

    std::string ChunkedDecoder::readLine() {
        for (;;) {
            auto end = buffer_.find("\r\n", pos_);
            if (end != std::string::npos) {
                std::string line = buffer_.substr(pos_, end - pos_);
                pos_ = end + 2;
                return line;
            }
            if (buffer_.size() - pos_ > MAX_CHUNK_LINE) {
                if (state_ == State::Trailer) {
                    throw ProtocolError(ProtocolError::Code::TrailerMalformed, "trailer line too long");
                }
                throw ProtocolError(ProtocolError::Code::ChunkSizeInvalid, "chunk size line too long");
            }
            if (!fill()) {
                throw ProtocolError(ProtocolError::Code::ShortRead, "stream ended inside chunked framing");
            }
        }
    }

    std::uint64_t ChunkedDecoder::parseSize(const std::string& line) {
        std::string digits = line.substr(0, line.find(';'));
        while (!digits.empty() && (digits.back() == ' ' || digits.back() == '\t')) digits.pop_back();
        if (digits.empty() || digits.size() > 16) {
            throw ProtocolError(ProtocolError::Code::ChunkSizeInvalid, "invalid chunk size line '" + line + "'");
        }
        std::uint64_t size = 0;
        for (char c : digits) {
            int value;
            if (c >= '0' && c <= '9') value = c - '0';
            else if (c >= 'a' && c <= 'f') value = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') value = c - 'A' + 10;
            else throw ProtocolError(ProtocolError::Code::ChunkSizeInvalid, "invalid chunk size line '" + line + "'");
            size = size * 16 + static_cast<std::uint64_t>(value);
        }
        return size;
    }

    std::size_t ChunkedDecoder::read(char* data, std::size_t size) {
        if (size == 0) return 0;
        for (;;) {
            switch (state_) {
                case State::Size: {
                    remaining_ = parseSize(readLine());
                    state_ = remaining_ == 0 ? State::Trailer : State::Data;
                    break;
                }
                case State::Data: {
                    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining_));
                    std::size_t n;
                    if (pos_ < buffer_.size()) {
                        n = std::min(want, buffer_.size() - pos_);
                        std::copy_n(buffer_.data() + pos_, n, data);
                        pos_ += n;
                    } else {
                        n = inner_.read(data, want);
                        if (n == 0) {
                            throw ProtocolError(ProtocolError::Code::ShortRead,
                                                "stream ended with " + std::to_string(remaining_) +
                                                    " bytes of the current chunk missing");
                        }
                    }
                    remaining_ -= n;
                    if (remaining_ == 0) state_ = State::DataEnd;
                    return n;
                }
                case State::DataEnd: {
                    if (!readLine().empty()) {
                        throw ProtocolError(ProtocolError::Code::ChunkSizeInvalid,
                                            "chunk data is longer than its declared size");
                    }
                    state_ = State::Size;
                    break;
                }
                case State::Trailer: {
                    std::string line = readLine();
                    if (line.empty()) {
                        state_ = State::Done;
                        return 0;
                    }
                    auto colon = line.find(':');
                    if (colon == std::string::npos || colon == 0 || line.front() == ' ' || line.front() == '\t') {
                        throw ProtocolError(ProtocolError::Code::TrailerMalformed, "invalid trailer '" + line + "'");
                    }
                    trailers_.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
                    break;
                }
                case State::Done:
                    return 0;
            }
        }
    }

    std::string encodeDemuxFrame(StreamKind kind, std::string_view payload) {
        if (payload.size() > MAX_DEMUX_FRAME) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "payload too large for one frame");
        }
        auto length = static_cast<std::uint32_t>(payload.size());
        std::string frame(DEMUX_HEADER_SIZE, '\0');
        frame[0] = static_cast<char>(kind);
        frame[4] = static_cast<char>((length >> 24) & 0xff);
        frame[5] = static_cast<char>((length >> 16) & 0xff);
        frame[6] = static_cast<char>((length >> 8) & 0xff);
        frame[7] = static_cast<char>(length & 0xff);
        frame.append(payload);
        return frame;
    }

    std::optional<DemuxFrame> DemuxDecoder::next() {
        std::array<char, DEMUX_HEADER_SIZE> header{};
        std::size_t got = readFull(source_, header.data(), header.size());
        if (got == 0) return std::nullopt;
        if (got < header.size()) {
            throw ProtocolError(ProtocolError::Code::ShortRead,
                                "stream ended inside a frame header (" + std::to_string(got) + " of 8 bytes)");
        }

        auto kind = static_cast<std::uint8_t>(header[0]);
        if (kind > static_cast<std::uint8_t>(StreamKind::Stderr)) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "unknown stream kind " + std::to_string(kind));
        }
        std::uint32_t length = (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[4])) << 24) |
                               (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[5])) << 16) |
                               (static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[6])) << 8) |
                               static_cast<std::uint32_t>(static_cast<std::uint8_t>(header[7]));
        if (length > MAX_DEMUX_FRAME) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "frame length " + std::to_string(length) + " exceeds limit");
        }

        DemuxFrame frame{static_cast<StreamKind>(kind), std::string(length, '\0')};
        got = readFull(source_, frame.payload.data(), length);
        if (got < length) {
            throw ProtocolError(ProtocolError::Code::ShortRead,
                                "stream ended after " + std::to_string(got) + " of " + std::to_string(length) +
                                    " payload bytes");
        }
        return frame;
    }

    std::optional<LogOutput> LogStream::next() {
        if (tty_) {
            std::string chunk(READ_CHUNK, '\0');
            std::size_t n = source_.read(chunk.data(), chunk.size());
            if (n == 0) return std::nullopt;
            chunk.resize(n);
            return LogOutput{OutputKind::Console, std::move(chunk)};
        }
        auto frame = demux_.next();
        if (!frame) return std::nullopt;
        switch (frame->kind) {
            case StreamKind::Stdin: return LogOutput{OutputKind::Stdin, std::move(frame->payload)};
            case StreamKind::Stdout: return LogOutput{OutputKind::Stdout, std::move(frame->payload)};
            case StreamKind::Stderr: return LogOutput{OutputKind::Stderr, std::move(frame->payload)};
        }
        return std::nullopt;
    }

    std::optional<nlohmann::json> JsonLineDecoder::next() {
        std::size_t scanFrom = 0;
        for (;;) {
            auto newline = buffer_.find('\n', scanFrom);
            if (newline != std::string::npos || (ended_ && !buffer_.empty())) {
                std::size_t end = newline == std::string::npos ? buffer_.size() : newline;
                std::string text = trim(buffer_.substr(0, end));
                if (text.empty()) {
                    buffer_.erase(0, newline == std::string::npos ? buffer_.size() : newline + 1);
                    scanFrom = 0;
                    continue;
                }
                try {
                    auto document = nlohmann::json::parse(text);
                    buffer_.erase(0, newline == std::string::npos ? buffer_.size() : newline + 1);
                    return document;
                } catch (const nlohmann::json::parse_error& e) {
                    // A document can span lines; wait for more input when the parser only ran out of text.
                    bool incomplete = e.byte > text.size();
                    if (!incomplete || ended_ && newline == std::string::npos) {
                        throw ProtocolError(ProtocolError::Code::InvalidJson, e.what());
                    }
                    scanFrom = newline == std::string::npos ? buffer_.size() : newline + 1;
                    if (scanFrom < buffer_.size()) continue;
                }
            }
            if (ended_) {
                if (!trim(buffer_).empty()) {
                    throw ProtocolError(ProtocolError::Code::InvalidJson, "stream ended inside a JSON document");
                }
                return std::nullopt;
            }
            if (buffer_.size() > MAX_JSON_LINE) {
                throw ProtocolError(ProtocolError::Code::InvalidJson, "JSON document exceeds 1 MiB");
            }
            std::array<char, READ_CHUNK> chunk{};
            std::size_t n = source_.read(chunk.data(), chunk.size());
            if (n == 0) {
                ended_ = true;
            } else {
                buffer_.append(chunk.data(), n);
            }
        }
    }

    std::string toString(OutputKind kind) {
        switch (kind) {
            case OutputKind::Stdin: return "stdin";
            case OutputKind::Stdout: return "stdout";
            case OutputKind::Stderr: return "stderr";
            case OutputKind::Console: return "console";
        }
        return "unknown";
    }
}
