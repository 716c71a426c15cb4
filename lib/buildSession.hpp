#ifndef DOCKWIRE_BUILD_SESSION_HPP
#define DOCKWIRE_BUILD_SESSION_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http.hpp"
#include "sessionService.hpp"

namespace Dockwire {
    // 25 base-36 characters from 136 random bits.
    std::string newSessionId();

    // Secondary channel the daemon uses during a build to call back into the client.
    // Services are registered before start(); close() (also run by the destructor)
    // cancels and joins every running call.
    class BuildSession {
    public:
        enum class State { Init, Active, Closed };

        explicit BuildSession(std::string name = "dockwire", std::string sharedKey = "");
        ~BuildSession();

        BuildSession(const BuildSession&) = delete;
        BuildSession& operator=(const BuildSession&) = delete;

        void addService(std::shared_ptr<SessionService> service);

        const std::string& id() const;
        const std::string& name() const;
        const std::string& sharedKey() const;
        std::vector<std::string> methods() const;

        // Headers for the POST /session upgrade request.
        Headers exposeHeaders() const;

        // Takes over an upgraded control connection and starts serving it.
        void start(std::unique_ptr<Connection> control);

        // Blocks until the control stream ends or the session is closed.
        void wait();
        void close();

        State state() const;
        std::size_t activeInvocations() const;
        // Reason the control stream failed, if it did.
        std::optional<std::string> failure() const;

        static bool isLive(const std::string& id);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl_;
    };
}

#endif // DOCKWIRE_BUILD_SESSION_HPP
