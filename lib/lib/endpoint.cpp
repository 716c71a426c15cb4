#include "endpoint.hpp"

#include <cstdlib>
#include <filesystem>

#include "../errors.hpp"

namespace Dockwire {
    const std::string DEFAULT_SOCKET_PATH = "/var/run/docker.sock";
    const std::string DEFAULT_NAMED_PIPE_PATH = "//./pipe/docker_engine";
    const std::string DEFAULT_TCP_HOST = "localhost";
    const std::string DEFAULT_TCP_PORT = "2375";
    const std::string DEFAULT_TLS_PORT = "2376";

    namespace {
        std::string env(const char* name) {
            const char* value = std::getenv(name);
            return value == nullptr ? std::string() : std::string(value);
        }

        bool isDigits(const std::string& value) {
            if (value.empty()) return false;
            for (char c : value) {
                if (c < '0' || c > '9') return false;
            }
            return true;
        }

        bool hasExplicitPort(const std::string& address) {
            auto pos = address.find("://");
            std::string authority = pos == std::string::npos ? address : address.substr(pos + 3);
            authority = authority.substr(0, authority.find('/'));
            auto bracket = authority.find(']');
            if (bracket != std::string::npos) authority = authority.substr(bracket + 1);
            return authority.find(':') != std::string::npos;
        }

        // Splits "host[:port][/ignored]" and "[v6]:port" forms.
        void splitHostPort(const std::string& authority, Endpoint& endpoint, const std::string& defaultPort) {
            std::string hostPort = authority.substr(0, authority.find('/'));
            if (hostPort.empty()) {
                endpoint.host = DEFAULT_TCP_HOST;
                endpoint.port = defaultPort;
                return;
            }
            if (hostPort.front() == '[') {
                auto close = hostPort.find(']');
                if (close == std::string::npos) {
                    throw TransportError(TransportError::Code::AddressInvalid, "unterminated IPv6 address: " + authority);
                }
                endpoint.host = hostPort.substr(1, close - 1);
                std::string rest = hostPort.substr(close + 1);
                if (rest.empty()) {
                    endpoint.port = defaultPort;
                } else if (rest.front() == ':' && isDigits(rest.substr(1))) {
                    endpoint.port = rest.substr(1);
                } else {
                    throw TransportError(TransportError::Code::AddressInvalid, "invalid port in " + authority);
                }
                return;
            }
            auto colon = hostPort.rfind(':');
            if (colon == std::string::npos) {
                endpoint.host = hostPort;
                endpoint.port = defaultPort;
                return;
            }
            endpoint.host = hostPort.substr(0, colon);
            endpoint.port = hostPort.substr(colon + 1);
            if (endpoint.host.empty()) endpoint.host = DEFAULT_TCP_HOST;
            if (!isDigits(endpoint.port)) {
                throw TransportError(TransportError::Code::AddressInvalid, "invalid port in " + authority);
            }
        }
    }

    std::string defaultCertPath() {
        std::string path = env("DOCKER_CERT_PATH");
        if (!path.empty()) return path;
        path = env("DOCKER_CONFIG");
        if (!path.empty()) return path;
        std::string home = env("HOME");
        if (home.empty()) return {};
        return (std::filesystem::path(home) / ".docker").string();
    }

    TlsMaterial Endpoint::tlsFromDirectory(const std::string& directory, bool verify) {
        TlsMaterial material;
        material.verify = verify;
        if (directory.empty()) return material;

        const std::filesystem::path root(directory);
        std::error_code ec;
        if (std::filesystem::exists(root / "ca.pem", ec)) material.caFile = (root / "ca.pem").string();
        if (std::filesystem::exists(root / "cert.pem", ec) && std::filesystem::exists(root / "key.pem", ec)) {
            material.certFile = (root / "cert.pem").string();
            material.keyFile = (root / "key.pem").string();
        }
        return material;
    }

    Endpoint Endpoint::parse(const std::string& address) {
        auto pos = address.find("://");
        if (pos == std::string::npos) {
            throw TransportError(TransportError::Code::AddressInvalid, "missing scheme in daemon address: " + address);
        }
        const std::string scheme = address.substr(0, pos);
        const std::string rest = address.substr(pos + 3);

        Endpoint endpoint;
        if (scheme == "unix") {
            endpoint.scheme = Scheme::Unix;
            endpoint.path = rest.empty() ? DEFAULT_SOCKET_PATH : rest;
        } else if (scheme == "npipe") {
            endpoint.scheme = Scheme::NamedPipe;
            endpoint.path = rest.empty() ? DEFAULT_NAMED_PIPE_PATH : rest;
        } else if (scheme == "tcp" || scheme == "http") {
            endpoint.scheme = Scheme::Tcp;
            splitHostPort(rest, endpoint, DEFAULT_TCP_PORT);
        } else if (scheme == "https") {
            endpoint.scheme = Scheme::Tls;
            splitHostPort(rest, endpoint, DEFAULT_TLS_PORT);
            endpoint.tls = TlsMaterial{};
        } else if (scheme == "ssh") {
            endpoint.scheme = Scheme::Ssh;
            std::string authority = rest.substr(0, rest.find('/'));
            auto at = authority.find('@');
            if (at != std::string::npos) {
                endpoint.user = authority.substr(0, at);
                authority = authority.substr(at + 1);
            }
            if (authority.empty()) {
                throw TransportError(TransportError::Code::AddressInvalid, "missing host in " + address);
            }
            // ssh picks its own default port when none is given
            splitHostPort(authority, endpoint, "");
        } else {
            throw TransportError(TransportError::Code::AddressInvalid, "unsupported scheme '" + scheme + "'");
        }
        return endpoint;
    }

    Endpoint Endpoint::local() {
#ifdef _WIN32
        return parse("npipe://" + DEFAULT_NAMED_PIPE_PATH);
#else
        return parse("unix://" + DEFAULT_SOCKET_PATH);
#endif
    }

    Endpoint Endpoint::fromEnvironment() {
        const std::string host = env("DOCKER_HOST");
        Endpoint endpoint = host.empty() ? local() : parse(host);

        const std::string verifyFlag = env("DOCKER_TLS_VERIFY");
        const bool verify = !verifyFlag.empty() && verifyFlag != "0";

        if (endpoint.scheme == Scheme::Tcp && verify) {
            endpoint.scheme = Scheme::Tls;
            if (!hasExplicitPort(host)) endpoint.port = DEFAULT_TLS_PORT;
        }
        if (endpoint.scheme == Scheme::Tls) {
            endpoint.tls = tlsFromDirectory(defaultCertPath(), verify || verifyFlag.empty());
        }
        return endpoint;
    }

    std::string Endpoint::hostHeader() const {
        switch (scheme) {
            case Scheme::Tcp:
            case Scheme::Tls:
                if (host.find(':') != std::string::npos) return "[" + host + "]:" + port;
                return host + ":" + port;
            default:
                // The daemon ignores Host on local channels; Go clients send this placeholder.
                return "docker";
        }
    }

    std::string Endpoint::toString() const {
        switch (scheme) {
            case Scheme::Unix: return "unix://" + path;
            case Scheme::NamedPipe: return "npipe://" + path;
            case Scheme::Tcp: return "tcp://" + hostHeader();
            case Scheme::Tls: return "https://" + hostHeader();
            case Scheme::Ssh:
                return "ssh://" + (user.empty() ? std::string() : user + "@") + host + (port.empty() ? "" : ":" + port);
        }
        return "unknown://";
    }
}
