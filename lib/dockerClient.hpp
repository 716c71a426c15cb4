#ifndef DOCKWIRE_DOCKER_CLIENT_HPP
#define DOCKWIRE_DOCKER_CLIENT_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "apiVersion.hpp"
#include "buildSession.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "lib/endpoint.hpp"

namespace Dockwire {
    struct ClientOptions {
        std::chrono::milliseconds timeout{std::chrono::seconds(120)};
        std::optional<ApiVersion> pinnedVersion;

        // DOCKER_API_VERSION and DOCKWIRE_TIMEOUT (seconds).
        static ClientOptions fromEnvironment();
    };

    struct LogsOptions {
        bool follow = false;
        std::optional<unsigned> tail;    // unset: all lines
        bool showStdout = true;
        bool showStderr = true;
        bool timestamps = false;
        std::optional<bool> tty;         // unset: read from the container config
    };

    struct AttachOptions {
        bool attachStdin = true;
        bool attachStdout = true;
        bool attachStderr = true;
        bool logs = false;
        std::optional<bool> tty;
    };

    struct BuildOptions {
        std::string contextDirectory;
        std::string dockerfile = "Dockerfile";
        std::vector<std::string> tags;
        std::map<std::string, std::string> buildArgs;
        std::map<std::string, std::string> labels;
        std::string target;
        std::string platform;
        bool noCache = false;
        bool pull = false;
        bool remove = true;
        // Session builds only: where the daemon fetches the context from.
        std::string remote = "client-session";
    };

    using ProgressCallback = std::function<void(const nlohmann::json&)>;

    // Container output owning its response; destroying it closes the connection.
    class ContainerLogs {
        Response response_;
        LogStream stream_;

    public:
        ContainerLogs(Response response, bool tty);

        ContainerLogs(const ContainerLogs&) = delete;
        ContainerLogs& operator=(const ContainerLogs&) = delete;

        std::optional<LogOutput> next() { return stream_.next(); }
        bool tty() const { return stream_.tty(); }
    };

    // Hijacked attach connection: container output in, stdin out.
    class AttachedStream {
        std::unique_ptr<Connection> connection_;
        ConnectionSource source_;
        LogStream stream_;

    public:
        AttachedStream(std::unique_ptr<Connection> connection, bool tty);

        AttachedStream(const AttachedStream&) = delete;
        AttachedStream& operator=(const AttachedStream&) = delete;

        std::optional<LogOutput> next() { return stream_.next(); }
        void write(const std::string& input);
        void closeStdin();
        void close() noexcept { connection_->close(); }
    };

    class DockerClient {
    public:
        explicit DockerClient(Endpoint endpoint, ClientOptions options = {});
        ~DockerClient();

        static DockerClient fromEnvironment();

        DockerClient(DockerClient&&) noexcept;
        DockerClient& operator=(DockerClient&&) noexcept;

        const Endpoint& endpoint() const;

        ApiVersion negotiateVersion();
        ApiVersion apiVersion();

        // Versioned request; statuses other than 2xx and 304 become DaemonError.
        Response send(const std::string& method, const std::string& resource, RequestBody body = {},
                      const Headers& headers = {});
        nlohmann::json getJson(const std::string& resource);

        // Unversioned GET /_ping; returns the body ("OK").
        std::string ping();
        nlohmann::json version();

        // Expects 101 Switching Protocols and hands back the raw connection.
        std::unique_ptr<Connection> upgrade(const std::string& method, const std::string& resource,
                                            const Headers& headers = {}, const std::string& protocol = "tcp");

        std::unique_ptr<ContainerLogs> logs(const std::string& container, const LogsOptions& options = {});
        std::unique_ptr<AttachedStream> attach(const std::string& container, const AttachOptions& options = {});

        // Streams the context directory as a tar archive honoring .dockerignore.
        void build(const BuildOptions& options, const ProgressCallback& onProgress = {});
        // The daemon pulls the context through the session's file sync service.
        void build(const BuildOptions& options, BuildSession& session, const ProgressCallback& onProgress = {});

        // Upgrades POST /session and starts serving the session on it.
        void openSession(BuildSession& session);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl_;
    };

    // DaemonError from a failed response, using the JSON "message" when present.
    DaemonError daemonError(Response& response);
}

#endif // DOCKWIRE_DOCKER_CLIENT_HPP
