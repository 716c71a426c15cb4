#include "dockerClient.hpp"

#include <cstdlib>
#include <utility>

#include "contextArchive.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    namespace {
        std::string env(const char* name) {
            const char* value = std::getenv(name);
            return value == nullptr ? "" : value;
        }

        std::string flag(bool value) { return value ? "1" : "0"; }

        std::string containerPath(const std::string& container, const std::string& action) {
            return "/containers/" + urlEncode(container) + "/" + action;
        }

        void reportProgress(Response& response, const ProgressCallback& onProgress) {
            JsonLineDecoder decoder(response.body());
            while (auto message = decoder.next()) {
                if (message->is_object() && (message->contains("errorDetail") || message->contains("error"))) {
                    std::string text;
                    if (message->contains("errorDetail") && (*message)["errorDetail"].is_object()) {
                        text = (*message)["errorDetail"].value("message", "");
                    }
                    if (text.empty()) text = message->value("error", "build failed");
                    throw DaemonError(response.status(), text);
                }
                if (onProgress) {
                    onProgress(*message);
                } else if (message->is_object() && message->contains("stream") && (*message)["stream"].is_string()) {
                    Log::info((*message)["stream"].get<std::string>());
                }
            }
        }

        std::vector<std::pair<std::string, std::string>> buildQuery(const BuildOptions& options) {
            std::vector<std::pair<std::string, std::string>> query;
            for (const auto& tag : options.tags) query.emplace_back("t", tag);
            query.emplace_back("dockerfile", options.dockerfile);
            if (!options.buildArgs.empty()) query.emplace_back("buildargs", nlohmann::json(options.buildArgs).dump());
            if (!options.labels.empty()) query.emplace_back("labels", nlohmann::json(options.labels).dump());
            if (!options.target.empty()) query.emplace_back("target", options.target);
            if (!options.platform.empty()) query.emplace_back("platform", options.platform);
            if (options.noCache) query.emplace_back("nocache", "1");
            if (options.pull) query.emplace_back("pull", "1");
            query.emplace_back("rm", flag(options.remove));
            return query;
        }

        // Closes the session when the build request is done, however it ends.
        class SessionGuard {
            BuildSession& session_;

        public:
            explicit SessionGuard(BuildSession& session) : session_(session) {}
            ~SessionGuard() {
                try {
                    session_.close();
                } catch (const std::exception& e) {
                    Log::warn("closing build session " + session_.id() + ": " + e.what());
                }
            }
        };
    }

    ClientOptions ClientOptions::fromEnvironment() {
        ClientOptions options;
        const std::string pinned = env("DOCKER_API_VERSION");
        if (!pinned.empty()) options.pinnedVersion = ApiVersion::parse(pinned);

        const std::string timeout = env("DOCKWIRE_TIMEOUT");
        if (!timeout.empty()) {
            try {
                options.timeout = std::chrono::seconds(std::stoul(timeout));
            } catch (const std::exception&) {
                throw std::runtime_error("DOCKWIRE_TIMEOUT is not a number of seconds: " + timeout);
            }
        }
        return options;
    }

    ContainerLogs::ContainerLogs(Response response, bool tty)
        : response_(std::move(response)), stream_(response_.body(), tty) {}

    AttachedStream::AttachedStream(std::unique_ptr<Connection> connection, bool tty)
        : connection_(std::move(connection)), source_(*connection_), stream_(source_, tty) {}

    void AttachedStream::write(const std::string& input) {
        connection_->write(input);
    }

    void AttachedStream::closeStdin() {
        connection_->shutdownWrite();
    }

    DaemonError daemonError(Response& response) {
        std::string body;
        try {
            body = response.readBody();
        } catch (const Error& e) {
            Log::debug("reading error body: " + std::string(e.what()));
        }
        auto json = nlohmann::json::parse(body, nullptr, false);
        std::string message;
        if (!json.is_discarded() && json.is_object() && json.contains("message") && json["message"].is_string()) {
            message = json["message"].get<std::string>();
        } else {
            auto end = body.find_last_not_of(" \t\r\n");
            message = end == std::string::npos ? response.reason() : body.substr(0, end + 1);
        }
        return DaemonError(response.status(), message);
    }

    struct DockerClient::Impl {
        Endpoint endpoint;
        ClientOptions options;
        VersionNegotiator negotiator;

        Impl(Endpoint endpoint, ClientOptions options)
            : endpoint(std::move(endpoint)), options(options), negotiator(options.pinnedVersion) {}

        Response execute(Request request) {
            return Dockwire::execute(connect(endpoint, options.timeout), request, endpoint.hostHeader());
        }

        Response checked(Request request) {
            Response response = execute(std::move(request));
            if ((response.status() < 200 || response.status() > 299) && response.status() != 304) {
                throw daemonError(response);
            }
            return response;
        }

        std::string versioned(const std::string& resource) {
            negotiator.negotiate([this] {
                Request request;
                request.target = "/version";
                return checked(std::move(request)).readBody();
            });
            return negotiator.path(resource);
        }
    };

    DockerClient::DockerClient(Endpoint endpoint, ClientOptions options)
        : pimpl_(std::make_unique<Impl>(std::move(endpoint), options)) {}

    DockerClient::~DockerClient() = default;
    DockerClient::DockerClient(DockerClient&&) noexcept = default;
    DockerClient& DockerClient::operator=(DockerClient&&) noexcept = default;

    DockerClient DockerClient::fromEnvironment() {
        return DockerClient(Endpoint::fromEnvironment(), ClientOptions::fromEnvironment());
    }

    const Endpoint& DockerClient::endpoint() const {
        return pimpl_->endpoint;
    }

    ApiVersion DockerClient::negotiateVersion() {
        pimpl_->versioned("/");
        return *pimpl_->negotiator.negotiated();
    }

    ApiVersion DockerClient::apiVersion() {
        auto version = pimpl_->negotiator.negotiated();
        return version ? *version : negotiateVersion();
    }

    Response DockerClient::send(const std::string& method, const std::string& resource, RequestBody body,
                                const Headers& headers) {
        Request request;
        request.method = method;
        request.target = pimpl_->versioned(resource);
        request.headers = headers;
        request.body = std::move(body);
        return pimpl_->checked(std::move(request));
    }

    nlohmann::json DockerClient::getJson(const std::string& resource) {
        std::string body = send("GET", resource).readBody();
        auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded()) {
            throw ProtocolError(ProtocolError::Code::InvalidJson, "GET " + resource + " returned invalid JSON");
        }
        return json;
    }

    std::string DockerClient::ping() {
        Request request;
        request.target = "/_ping";
        return pimpl_->checked(std::move(request)).readBody();
    }

    nlohmann::json DockerClient::version() {
        return getJson("/version");
    }

    std::unique_ptr<Connection> DockerClient::upgrade(const std::string& method, const std::string& resource,
                                                      const Headers& headers, const std::string& protocol) {
        Request request;
        request.method = method;
        request.target = pimpl_->versioned(resource);
        request.headers = headers;
        request.headers.emplace("Connection", "Upgrade");
        request.headers.emplace("Upgrade", protocol);

        Response response = pimpl_->execute(std::move(request));
        if (response.status() >= 400) throw daemonError(response);
        auto connection = response.upgrade();
        connection->setTimeout(std::chrono::milliseconds(0));
        return connection;
    }

    std::unique_ptr<ContainerLogs> DockerClient::logs(const std::string& container, const LogsOptions& options) {
        bool tty;
        if (options.tty) {
            tty = *options.tty;
        } else {
            auto inspect = getJson(containerPath(container, "json"));
            tty = inspect.contains("Config") && inspect["Config"].is_object() && inspect["Config"].value("Tty", false);
        }

        std::vector<std::pair<std::string, std::string>> query = {
            {"stdout", flag(options.showStdout)},
            {"stderr", flag(options.showStderr)},
            {"follow", flag(options.follow)},
            {"timestamps", flag(options.timestamps)},
            {"tail", options.tail ? std::to_string(*options.tail) : "all"},
        };
        Response response = send("GET", containerPath(container, "logs") + queryString(query));
        if (options.follow) response.setTimeout(std::chrono::milliseconds(0));
        return std::make_unique<ContainerLogs>(std::move(response), tty);
    }

    std::unique_ptr<AttachedStream> DockerClient::attach(const std::string& container, const AttachOptions& options) {
        bool tty;
        if (options.tty) {
            tty = *options.tty;
        } else {
            auto inspect = getJson(containerPath(container, "json"));
            tty = inspect.contains("Config") && inspect["Config"].is_object() && inspect["Config"].value("Tty", false);
        }

        std::vector<std::pair<std::string, std::string>> query = {
            {"stream", "1"},
            {"stdin", flag(options.attachStdin)},
            {"stdout", flag(options.attachStdout)},
            {"stderr", flag(options.attachStderr)},
            {"logs", flag(options.logs)},
        };
        return std::make_unique<AttachedStream>(upgrade("POST", containerPath(container, "attach") + queryString(query)),
                                                tty);
    }

    void DockerClient::build(const BuildOptions& options, const ProgressCallback& onProgress) {
        ContextArchive archive = ContextArchive::fromDirectory(options.contextDirectory, options.dockerfile);
        Log::info("sending build context (" + std::to_string(archive.size()) + " bytes)");

        Response response = send("POST", "/build" + queryString(buildQuery(options)), archive.body());
        response.setTimeout(std::chrono::milliseconds(0));
        reportProgress(response, onProgress);
    }

    void DockerClient::build(const BuildOptions& options, BuildSession& session, const ProgressCallback& onProgress) {
        if (session.state() == BuildSession::State::Init) openSession(session);
        SessionGuard guard(session);

        auto query = buildQuery(options);
        query.emplace_back("version", "2");
        query.emplace_back("session", session.id());
        query.emplace_back("remote", options.remote);

        Response response = send("POST", "/build" + queryString(query));
        response.setTimeout(std::chrono::milliseconds(0));
        reportProgress(response, onProgress);

        if (auto failure = session.failure()) {
            throw SessionError(SessionError::Code::ControlStreamBroken, *failure);
        }
    }

    void DockerClient::openSession(BuildSession& session) {
        auto control = upgrade("POST", "/session", session.exposeHeaders(), "session");
        Log::debug("session " + session.id() + " upgraded on " + control->description());
        session.start(std::move(control));
    }
}
