#ifndef DOCKWIRE_CONNECTION_HPP
#define DOCKWIRE_CONNECTION_HPP

#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/process.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "endpoint.hpp"

namespace Dockwire {
    namespace net = boost::asio;

    using UnixSocket = net::local::stream_protocol::socket;
    using TcpSocket = net::ip::tcp::socket;

    struct TlsChannel {
        TlsChannel(net::ssl::context tlsContext, TcpSocket socket);

        net::ssl::context context;
        net::ssl::stream<TcpSocket> stream;
    };

    // `ssh host docker system dial-stdio`: the child's stdin/stdout carry the daemon stream.
    struct SshChannel {
        explicit SshChannel(net::io_context& ioContext);

        boost::process::async_pipe input;
        boost::process::async_pipe output;
        boost::process::child child;
    };

#ifdef _WIN32
    using PipeHandle = net::windows::stream_handle;
#endif

    namespace detail {
        inline UnixSocket& source(UnixSocket& socket) { return socket; }
        inline TcpSocket& source(TcpSocket& socket) { return socket; }
        inline net::ssl::stream<TcpSocket>& source(std::unique_ptr<TlsChannel>& tls) { return tls->stream; }
        inline boost::process::async_pipe& source(std::unique_ptr<SshChannel>& ssh) { return ssh->output; }

        inline UnixSocket& sink(UnixSocket& socket) { return socket; }
        inline TcpSocket& sink(TcpSocket& socket) { return socket; }
        inline net::ssl::stream<TcpSocket>& sink(std::unique_ptr<TlsChannel>& tls) { return tls->stream; }
        inline boost::process::async_pipe& sink(std::unique_ptr<SshChannel>& ssh) { return ssh->input; }
#ifdef _WIN32
        inline PipeHandle& source(PipeHandle& pipe) { return pipe; }
        inline PipeHandle& sink(PipeHandle& pipe) { return pipe; }
#endif
    }

    // One open byte stream to the daemon. Owned by exactly one request (or one session)
    // at a time; the OS handle is released by close() or the destructor.
    class Connection {
    public:
#ifdef _WIN32
        using Channel = std::variant<UnixSocket, TcpSocket, std::unique_ptr<TlsChannel>, std::unique_ptr<SshChannel>, PipeHandle>;
#else
        using Channel = std::variant<UnixSocket, TcpSocket, std::unique_ptr<TlsChannel>, std::unique_ptr<SshChannel>>;
#endif

        // The channel must have been created on *ioContext.
        Connection(std::unique_ptr<net::io_context> ioContext, Channel channel, std::string description);
        ~Connection();

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        // Blocking operations. readSome returns 0 at end of stream.
        std::size_t readSome(char* data, std::size_t size);
        void write(const char* data, std::size_t size);
        void write(const std::string& data);

        void shutdownWrite();
        void close() noexcept;
        bool isOpen() const { return open_; }

        // Bytes already pulled off the wire (e.g. past an upgrade response) are served first.
        void unread(std::string bytes);

        // Zero disables the timeout.
        void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
        std::chrono::milliseconds timeout() const { return timeout_; }

        net::io_context& context() { return *ioContext_; }
        const std::string& description() const { return description_; }

        template<typename MutableBuffer, typename Handler>
        void asyncReadSome(const MutableBuffer& buffer, Handler&& handler) {
            if (!pending_.empty()) {
                std::size_t n = net::buffer_copy(buffer, net::buffer(pending_));
                pending_.erase(0, n);
                net::post(*ioContext_, [handler = std::forward<Handler>(handler), n]() mutable {
                    handler(boost::system::error_code(), n);
                });
                return;
            }
            std::visit([&](auto& channel) {
                detail::source(channel).async_read_some(buffer, std::forward<Handler>(handler));
            }, channel_);
        }

        template<typename ConstBuffer, typename Handler>
        void asyncWrite(const ConstBuffer& buffer, Handler&& handler) {
            std::visit([&](auto& channel) {
                net::async_write(detail::sink(channel), buffer, std::forward<Handler>(handler));
            }, channel_);
        }

    private:
        void runUntilDone(const std::string& what);
        void checkSshExit();

        std::unique_ptr<net::io_context> ioContext_;
        Channel channel_;
        std::string description_;
        std::string pending_;
        std::chrono::milliseconds timeout_{0};
        bool open_ = true;
        bool receivedAny_ = false;
    };

    // Opens a connection for the endpoint's channel kind. Throws TransportError.
    std::unique_ptr<Connection> connect(const Endpoint& endpoint, std::chrono::milliseconds timeout);
}

#endif // DOCKWIRE_CONNECTION_HPP
