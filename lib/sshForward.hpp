#ifndef DOCKWIRE_SSH_FORWARD_HPP
#define DOCKWIRE_SSH_FORWARD_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sessionService.hpp"

namespace Dockwire {
    namespace SshAgentMessage {
        constexpr std::uint8_t Failure = 5;
        constexpr std::uint8_t Success = 6;
        constexpr std::uint8_t RequestIdentities = 11;
        constexpr std::uint8_t SignRequest = 13;
        constexpr std::uint8_t Extension = 27;
    }

    constexpr std::uint32_t MAX_AGENT_MESSAGE = 1024 * 1024;

    struct AgentPacket {
        // true: `bytes` is a reply for the daemon; false: forward `bytes` to the agent
        bool local;
        std::string bytes;
    };

    // Splits daemon-to-agent traffic into [u32 BE length][u8 type][body] packets and
    // filters them. Throws ProtocolError(InvalidPacket) for disallowed types or sizes.
    class SshAgentPacketFilter {
        std::string buffer_;

    public:
        void feed(const char* data, std::size_t size);
        std::optional<AgentPacket> next();
    };

    // Orders replies to the daemon: a locally answered request waits behind every earlier
    // request still pending at the agent. Agent output is split into whole packets.
    class AgentReplyQueue {
        struct Slot {
            bool local;
            std::string bytes;
        };

        std::deque<Slot> slots_;
        std::string agentBuffer_;

        void flushLocal(std::vector<std::string>& out);

    public:
        // A request was written to the agent.
        void forwarded();
        // Replies now ready for the daemon, in order.
        std::vector<std::string> local(std::string reply);
        // Throws ProtocolError(InvalidPacket) for an agent message over MAX_AGENT_MESSAGE.
        std::vector<std::string> fromAgent(const char* data, std::size_t size);

        bool pending() const { return !slots_.empty(); }
    };

    // Serves /moby.sshforward.v1.SSH/CheckAgent and /ForwardAgent. Agents are chosen by
    // the `id` metadata.
    class SshForwardProvider : public SessionService {
        std::map<std::string, std::string> agents_;

    public:
        // id to agent socket path
        explicit SshForwardProvider(std::map<std::string, std::string> agents) : agents_(std::move(agents)) {}

        // "default" mapped to SSH_AUTH_SOCK, when set.
        static std::map<std::string, std::string> agentsFromEnvironment();

        std::string name() const override { return "moby.sshforward.v1.SSH"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;

        // Socket path for an agent id. Throws InvocationFailure(NotFound).
        std::string agentSocket(const std::string& id) const;
    };
}

#endif // DOCKWIRE_SSH_FORWARD_HPP
