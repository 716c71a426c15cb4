#ifndef DOCKWIRE_SESSION_PROVIDERS_HPP
#define DOCKWIRE_SESSION_PROVIDERS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sessionService.hpp"

namespace Dockwire {
    class HealthService : public SessionService {
    public:
        std::string name() const override { return "grpc.health.v1.Health"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;
    };

    struct Credentials {
        std::string username;
        std::string secret;
    };

    // Registry credentials by host. Unknown hosts get empty credentials.
    class AuthProvider : public SessionService {
        std::map<std::string, Credentials> credentials_;

    public:
        explicit AuthProvider(std::map<std::string, Credentials> credentials) : credentials_(std::move(credentials)) {}

        std::string name() const override { return "moby.filesync.v1.Auth"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;

        std::string answer(const std::string& request) const;
    };

    // A secret comes from a file or, when file is empty, an environment variable.
    struct SecretSource {
        std::string file;
        std::string env;
    };

    class SecretsProvider : public SessionService {
        std::map<std::string, SecretSource> secrets_;

    public:
        explicit SecretsProvider(std::map<std::string, SecretSource> secrets) : secrets_(std::move(secrets)) {}

        std::string name() const override { return "moby.buildkit.secrets.v1.Secrets"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;

        // Throws InvocationFailure(NotFound) for unknown or unreadable secrets.
        std::string answer(const std::string& request) const;
    };

    // Serves in-memory payloads (a Dockerfile read from stdin, a remote context) that the
    // daemon pulls back through the session by URL.
    class UploadProvider : public SessionService {
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<const std::string>> uploads_;

    public:
        std::string name() const override { return "moby.upload.v1.Upload"; }
        std::vector<std::string> methods() const override;
        std::unique_ptr<Invocation> invoke(const std::string& method) override;

        // Returns the http://buildkit-session/<id> URL the daemon requests the data by.
        std::string add(std::string data);
        std::shared_ptr<const std::string> find(const std::string& urlPath) const;
    };
}

#endif // DOCKWIRE_SESSION_PROVIDERS_HPP
