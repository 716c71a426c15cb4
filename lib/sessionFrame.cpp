#include "sessionFrame.hpp"

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace Dockwire {
    namespace {
        void putU32(std::string& out, std::uint32_t value) {
            out += static_cast<char>((value >> 24) & 0xff);
            out += static_cast<char>((value >> 16) & 0xff);
            out += static_cast<char>((value >> 8) & 0xff);
            out += static_cast<char>(value & 0xff);
        }

        std::uint32_t getU32(const char* data) {
            return (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[0])) << 24) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[1])) << 16) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[2])) << 8) |
                   static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[3]));
        }

        nlohmann::json parsePayload(const std::string& payload, const char* what) {
            auto document = nlohmann::json::parse(payload, nullptr, false);
            if (document.is_discarded() || !document.is_object()) {
                throw ProtocolError(ProtocolError::Code::InvalidFrame, std::string("malformed ") + what + " payload");
            }
            return document;
        }
    }

    std::string encodeSessionFrame(const SessionFrame& frame) {
        if (frame.payload.size() > MAX_SESSION_PAYLOAD) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "session frame payload exceeds 8 MiB");
        }
        std::string out;
        out.reserve(SESSION_FRAME_HEADER + frame.payload.size());
        putU32(out, static_cast<std::uint32_t>(frame.payload.size()));
        out += static_cast<char>(frame.type);
        putU32(out, frame.stream);
        out += frame.payload;
        return out;
    }

    std::string encodeOpen(const OpenRequest& open) {
        nlohmann::json document = {{"method", open.method}, {"metadata", nlohmann::json::object()}};
        for (const auto& [key, values] : open.metadata) {
            document["metadata"][key] = values;
        }
        return document.dump();
    }

    OpenRequest decodeOpen(const std::string& payload) {
        auto document = parsePayload(payload, "open");
        if (!document.contains("method") || !document["method"].is_string()) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "open frame without a method");
        }
        OpenRequest open;
        open.method = document["method"].get<std::string>();
        if (document.contains("metadata") && document["metadata"].is_object()) {
            for (const auto& [key, values] : document["metadata"].items()) {
                auto& target = open.metadata[key];
                if (values.is_string()) {
                    target.push_back(values.get<std::string>());
                } else if (values.is_array()) {
                    for (const auto& value : values) {
                        if (value.is_string()) target.push_back(value.get<std::string>());
                    }
                }
            }
        }
        return open;
    }

    std::string encodeErrorStatus(const ErrorStatus& status) {
        return nlohmann::json{{"code", status.code}, {"message", status.message}}.dump();
    }

    ErrorStatus decodeErrorStatus(const std::string& payload) {
        auto document = parsePayload(payload, "error");
        ErrorStatus status{StatusCode::Unknown, ""};
        if (document.contains("code") && document["code"].is_number_unsigned()) status.code = document["code"].get<unsigned>();
        if (document.contains("message") && document["message"].is_string()) {
            status.message = document["message"].get<std::string>();
        }
        return status;
    }

    std::string toString(FrameType type) {
        switch (type) {
            case FrameType::Open: return "open";
            case FrameType::Data: return "data";
            case FrameType::Close: return "close";
            case FrameType::Error: return "error";
            case FrameType::Cancel: return "cancel";
        }
        return "unknown";
    }

    void SessionFrameReader::feed(const char* data, std::size_t size) {
        if (pos_ > 0 && pos_ == buffer_.size()) {
            buffer_.clear();
            pos_ = 0;
        } else if (pos_ > 64 * 1024) {
            buffer_.erase(0, pos_);
            pos_ = 0;
        }
        buffer_.append(data, size);
    }

    std::optional<SessionFrame> SessionFrameReader::next() {
        if (buffered() < SESSION_FRAME_HEADER) return std::nullopt;
        const char* header = buffer_.data() + pos_;
        std::uint32_t length = getU32(header);
        auto type = static_cast<std::uint8_t>(header[4]);
        if (type < static_cast<std::uint8_t>(FrameType::Open) || type > static_cast<std::uint8_t>(FrameType::Cancel)) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame, "unknown session frame type " + std::to_string(type));
        }
        if (length > MAX_SESSION_PAYLOAD) {
            throw ProtocolError(ProtocolError::Code::InvalidFrame,
                                "session frame payload of " + std::to_string(length) + " bytes exceeds 8 MiB");
        }
        if (buffered() < SESSION_FRAME_HEADER + length) return std::nullopt;

        SessionFrame frame{static_cast<FrameType>(type), getU32(header + 5),
                           buffer_.substr(pos_ + SESSION_FRAME_HEADER, length)};
        pos_ += SESSION_FRAME_HEADER + length;
        return frame;
    }
}
