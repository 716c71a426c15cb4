#include "sshForward.hpp"

#include <array>
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <cstdlib>
#include <deque>
#include <filesystem>

#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        const std::string CHECK_AGENT = "/moby.sshforward.v1.SSH/CheckAgent";
        const std::string FORWARD_AGENT = "/moby.sshforward.v1.SSH/ForwardAgent";
        const std::string DEFAULT_AGENT = "default";

        std::uint32_t getU32(const char* data) {
            return (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[0])) << 24) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[1])) << 16) |
                   (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[2])) << 8) |
                   static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[3]));
        }

        // Relays one agent connection. Runs entirely on the call's worker thread.
        class AgentForward : public Invocation {
            using Socket = boost::asio::local::stream_protocol::socket;

            std::string path_;
            InvocationChannel* channel_ = nullptr;
            std::unique_ptr<Socket> socket_;
            std::array<char, 16 * 1024> buffer_{};
            SshAgentPacketFilter filter_;
            AgentReplyQueue replies_;
            std::deque<std::string> writes_;
            bool connected_ = false;
            bool writing_ = false;
            bool ended_ = false;

            void readAgent() {
                socket_->async_read_some(boost::asio::buffer(buffer_), [this](const boost::system::error_code& ec, std::size_t n) {
                    if (ended_) return;
                    if (ec) {
                        if (ec != boost::asio::error::eof) Log::debug("agent " + path_ + ": " + ec.message());
                        end();
                        return;
                    }
                    try {
                        for (auto& reply : replies_.fromAgent(buffer_.data(), n)) channel_->send(std::move(reply));
                    } catch (const ProtocolError& e) {
                        closeSocket();
                        channel_->fail(StatusCode::Internal, "agent " + path_ + ": " + e.what());
                        return;
                    }
                    readAgent();
                });
            }

            void writeNext() {
                if (writing_ || !connected_ || writes_.empty() || ended_) return;
                writing_ = true;
                boost::asio::async_write(*socket_, boost::asio::buffer(writes_.front()),
                    [this](const boost::system::error_code& ec, std::size_t) {
                        writing_ = false;
                        if (ended_) return;
                        if (ec) {
                            channel_->fail(StatusCode::Unavailable, "agent " + path_ + ": " + ec.message());
                            closeSocket();
                            return;
                        }
                        writes_.pop_front();
                        writeNext();
                    });
            }

            void closeSocket() {
                ended_ = true;
                if (socket_) {
                    boost::system::error_code ignored;
                    socket_->close(ignored);
                }
            }

            void end() {
                if (ended_) return;
                closeSocket();
                channel_->finish();
            }

        public:
            explicit AgentForward(std::string path) : path_(std::move(path)) {}

            void start(InvocationChannel& channel) override {
                channel_ = &channel;
                socket_ = std::make_unique<Socket>(channel.context());
                socket_->async_connect(boost::asio::local::stream_protocol::endpoint(path_),
                    [this](const boost::system::error_code& ec) {
                        if (ended_) return;
                        if (ec) {
                            closeSocket();
                            channel_->fail(StatusCode::Unavailable, "cannot connect to agent " + path_ + ": " + ec.message());
                            return;
                        }
                        connected_ = true;
                        readAgent();
                        writeNext();
                    });
            }

            void onData(const std::string& data) override {
                if (ended_) return;
                filter_.feed(data.data(), data.size());
                try {
                    while (auto packet = filter_.next()) {
                        if (packet->local) {
                            for (auto& reply : replies_.local(std::move(packet->bytes))) channel_->send(std::move(reply));
                        } else {
                            replies_.forwarded();
                            writes_.push_back(std::move(packet->bytes));
                        }
                    }
                } catch (const ProtocolError& e) {
                    closeSocket();
                    channel_->fail(StatusCode::InvalidArgument, e.what());
                    return;
                }
                writeNext();
            }

            void onClose() override {
                end();
            }

            void cancel() override {
                closeSocket();
            }
        };

        // Picks the agent from the call's `id` metadata once the call starts.
        class ResolvingForward : public Invocation {
            const SshForwardProvider& provider_;
            std::unique_ptr<AgentForward> forward_;

        public:
            explicit ResolvingForward(const SshForwardProvider& provider) : provider_(provider) {}

            void start(InvocationChannel& channel) override {
                std::string path;
                try {
                    path = provider_.agentSocket(channel.metadataValue("id", DEFAULT_AGENT));
                } catch (const InvocationFailure& e) {
                    channel.fail(e.code(), e.what());
                    return;
                }
                forward_ = std::make_unique<AgentForward>(path);
                forward_->start(channel);
            }
            void onData(const std::string& data) override { if (forward_) forward_->onData(data); }
            void onClose() override { if (forward_) forward_->onClose(); }
            void cancel() override { if (forward_) forward_->cancel(); }
        };
    }

    void AgentReplyQueue::flushLocal(std::vector<std::string>& out) {
        while (!slots_.empty() && slots_.front().local) {
            out.push_back(std::move(slots_.front().bytes));
            slots_.pop_front();
        }
    }

    void AgentReplyQueue::forwarded() {
        slots_.push_back(Slot{false, {}});
    }

    std::vector<std::string> AgentReplyQueue::local(std::string reply) {
        std::vector<std::string> out;
        if (slots_.empty()) {
            out.push_back(std::move(reply));
            return out;
        }
        slots_.push_back(Slot{true, std::move(reply)});
        return out;
    }

    std::vector<std::string> AgentReplyQueue::fromAgent(const char* data, std::size_t size) {
        agentBuffer_.append(data, size);
        std::vector<std::string> out;
        while (agentBuffer_.size() >= 4) {
            std::uint32_t length = getU32(agentBuffer_.data());
            if (length > MAX_AGENT_MESSAGE) {
                throw ProtocolError(ProtocolError::Code::InvalidPacket,
                                    "agent reply of " + std::to_string(length) + " bytes exceeds 1 MiB");
            }
            if (agentBuffer_.size() < 4 + static_cast<std::size_t>(length)) break;
            out.push_back(agentBuffer_.substr(0, 4 + length));
            agentBuffer_.erase(0, 4 + length);
            if (!slots_.empty()) slots_.pop_front();
            flushLocal(out);
        }
        return out;
    }

    void SshAgentPacketFilter::feed(const char* data, std::size_t size) {
        buffer_.append(data, size);
    }

    std::optional<AgentPacket> SshAgentPacketFilter::next() {
        if (buffer_.size() < 5) return std::nullopt;
        std::uint32_t length = getU32(buffer_.data());
        if (length > MAX_AGENT_MESSAGE) {
            throw ProtocolError(ProtocolError::Code::InvalidPacket,
                                "agent message of " + std::to_string(length) + " bytes exceeds 1 MiB");
        }
        if (length == 0) {
            throw ProtocolError(ProtocolError::Code::InvalidPacket, "empty agent message");
        }
        auto type = static_cast<std::uint8_t>(buffer_[4]);
        switch (type) {
            case SshAgentMessage::RequestIdentities:
            case SshAgentMessage::SignRequest:
            case SshAgentMessage::Extension:
                break;
            default:
                throw ProtocolError(ProtocolError::Code::InvalidPacket, "agent message type " + std::to_string(type) + " not allowed");
        }
        if (buffer_.size() < 4 + static_cast<std::size_t>(length)) return std::nullopt;

        std::string packet = buffer_.substr(0, 4 + length);
        buffer_.erase(0, 4 + length);
        if (type == SshAgentMessage::Extension) {
            Log::debug("answering agent extension request locally");
            return AgentPacket{true, std::string("\0\0\0\x01", 4) + static_cast<char>(SshAgentMessage::Success)};
        }
        return AgentPacket{false, std::move(packet)};
    }

    std::map<std::string, std::string> SshForwardProvider::agentsFromEnvironment() {
        std::map<std::string, std::string> agents;
        const char* socket = std::getenv("SSH_AUTH_SOCK");
        if (socket != nullptr && *socket != '\0') agents[DEFAULT_AGENT] = socket;
        return agents;
    }

    std::vector<std::string> SshForwardProvider::methods() const {
        return {CHECK_AGENT, FORWARD_AGENT};
    }

    std::string SshForwardProvider::agentSocket(const std::string& id) const {
        auto it = agents_.find(id.empty() ? DEFAULT_AGENT : id);
        if (it == agents_.end()) {
            throw InvocationFailure(StatusCode::NotFound, "no SSH agent configured for id '" + id + "'");
        }
        return it->second;
    }

    std::unique_ptr<Invocation> SshForwardProvider::invoke(const std::string& method) {
        if (method == CHECK_AGENT) {
            return std::make_unique<UnaryInvocation>([this](const std::string&, InvocationChannel& channel) {
                std::string path = agentSocket(channel.metadataValue("id", DEFAULT_AGENT));
                std::error_code ec;
                if (!std::filesystem::exists(path, ec)) {
                    throw InvocationFailure(StatusCode::NotFound, "agent socket " + path + " does not exist");
                }
                return std::string();
            });
        }
        return std::make_unique<ResolvingForward>(*this);
    }
}
