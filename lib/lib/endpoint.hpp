#ifndef DOCKWIRE_ENDPOINT_HPP
#define DOCKWIRE_ENDPOINT_HPP

#include <optional>
#include <string>

namespace Dockwire {
    extern const std::string DEFAULT_SOCKET_PATH;
    extern const std::string DEFAULT_NAMED_PIPE_PATH;
    extern const std::string DEFAULT_TCP_HOST;
    extern const std::string DEFAULT_TCP_PORT;
    extern const std::string DEFAULT_TLS_PORT;

    enum class Scheme { Unix, NamedPipe, Tcp, Tls, Ssh };

    struct TlsMaterial {
        std::string caFile;    // empty: OS trust store
        std::string certFile;
        std::string keyFile;
        bool verify = true;
    };

    struct Endpoint {
        Scheme scheme = Scheme::Unix;
        std::string path;      // unix socket or named pipe
        std::string host;
        std::string port;
        std::string user;      // ssh only
        std::optional<TlsMaterial> tls;

        // Accepts unix://, npipe://, tcp://, http://, https:// and ssh:// addresses.
        // Throws TransportError(AddressInvalid).
        static Endpoint parse(const std::string& address);

        // DOCKER_HOST, DOCKER_CERT_PATH (or DOCKER_CONFIG, ~/.docker) and DOCKER_TLS_VERIFY.
        static Endpoint fromEnvironment();

        static Endpoint local();

        // Looks for ca.pem, cert.pem and key.pem under directory.
        static TlsMaterial tlsFromDirectory(const std::string& directory, bool verify);

        std::string hostHeader() const;
        std::string toString() const;
    };

    std::string defaultCertPath();
}

#endif // DOCKWIRE_ENDPOINT_HPP
