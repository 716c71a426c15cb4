#include "connection.hpp"

#include <algorithm>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <optional>
#include <vector>

#include "../errors.hpp"
#include "../log.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

namespace Dockwire {
    namespace {
        // Runs the context until its work is done or the timeout expires.
        bool runFor(net::io_context& ioContext, std::chrono::milliseconds timeout) {
            ioContext.restart();
            if (timeout.count() <= 0) {
                ioContext.run();
                return true;
            }
            ioContext.run_for(timeout);
            return ioContext.stopped();
        }

        std::string millis(std::chrono::milliseconds timeout) {
            return std::to_string(timeout.count()) + "ms";
        }

        template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        bool isIpAddress(const std::string& host) {
            boost::system::error_code ec;
            net::ip::make_address(host, ec);
            return !ec;
        }

        TcpSocket connectTcp(net::io_context& ioContext, const Endpoint& endpoint, std::chrono::milliseconds timeout) {
            net::ip::tcp::resolver resolver(ioContext);
            TcpSocket socket(ioContext);
            std::optional<boost::system::error_code> result;

            resolver.async_resolve(endpoint.host, endpoint.port,
                [&](const boost::system::error_code& ec, const net::ip::tcp::resolver::results_type& results) {
                    if (ec) {
                        result = ec;
                        return;
                    }
                    net::async_connect(socket, results,
                        [&](const boost::system::error_code& connectEc, const net::ip::tcp::endpoint&) {
                            result = connectEc;
                        });
                });

            if (!runFor(ioContext, timeout)) {
                boost::system::error_code ignored;
                resolver.cancel();
                socket.close(ignored);
                ioContext.run();
                throw TransportError(TransportError::Code::TimedOut,
                                     "connect " + endpoint.toString() + " timed out after " + millis(timeout));
            }
            if (!result || *result) {
                throw transportError(result.value_or(net::error::not_connected), "connect " + endpoint.toString());
            }
            boost::system::error_code ignored;
            socket.set_option(net::ip::tcp::no_delay(true), ignored);
            return socket;
        }

        net::ssl::context tlsContext(const TlsMaterial& material) {
            net::ssl::context context(net::ssl::context::tls_client);
            try {
                context.set_options(net::ssl::context::default_workarounds | net::ssl::context::no_sslv2 |
                                    net::ssl::context::no_sslv3 | net::ssl::context::no_tlsv1 |
                                    net::ssl::context::no_tlsv1_1);
                if (material.verify) {
                    context.set_verify_mode(net::ssl::verify_peer);
                    if (material.caFile.empty()) {
                        context.set_default_verify_paths();
                    } else {
                        context.load_verify_file(material.caFile);
                    }
                } else {
                    context.set_verify_mode(net::ssl::verify_none);
                }
                if (!material.certFile.empty()) {
                    context.use_certificate_chain_file(material.certFile);
                    context.use_private_key_file(material.keyFile, net::ssl::context::pem);
                }
            } catch (const boost::system::system_error& e) {
                throw TransportError(TransportError::Code::TlsHandshakeFailed,
                                     std::string("could not load TLS material: ") + e.what());
            }
            return context;
        }

        std::unique_ptr<Connection> connectUnix(std::unique_ptr<net::io_context> ioContext, const Endpoint& endpoint) {
            UnixSocket socket(*ioContext);
            boost::system::error_code ec;
            try {
                socket.connect(net::local::stream_protocol::endpoint(endpoint.path), ec);
            } catch (const boost::system::system_error& e) {
                throw TransportError(TransportError::Code::AddressInvalid, endpoint.path + ": " + e.what());
            }
            if (ec) throw transportError(ec, "connect " + endpoint.toString());
            return std::make_unique<Connection>(std::move(ioContext), Connection::Channel(std::move(socket)),
                                                endpoint.toString());
        }

        std::unique_ptr<Connection> connectTls(std::unique_ptr<net::io_context> ioContext, const Endpoint& endpoint,
                                               std::chrono::milliseconds timeout) {
            const TlsMaterial material = endpoint.tls.value_or(TlsMaterial{});
            auto channel = std::make_unique<TlsChannel>(tlsContext(material), connectTcp(*ioContext, endpoint, timeout));

            if (!isIpAddress(endpoint.host) &&
                !SSL_set_tlsext_host_name(channel->stream.native_handle(), endpoint.host.c_str())) {
                throw TransportError(TransportError::Code::TlsHandshakeFailed, "could not set SNI host " + endpoint.host);
            }
            if (material.verify) {
                channel->stream.set_verify_callback(net::ssl::host_name_verification(endpoint.host));
            }

            std::optional<boost::system::error_code> result;
            channel->stream.async_handshake(net::ssl::stream_base::client,
                [&](const boost::system::error_code& ec) { result = ec; });
            if (!runFor(*ioContext, timeout)) {
                boost::system::error_code ignored;
                channel->stream.lowest_layer().close(ignored);
                ioContext->run();
                throw TransportError(TransportError::Code::TimedOut,
                                     "TLS handshake with " + endpoint.toString() + " timed out");
            }
            if (result && *result) {
                throw TransportError(TransportError::Code::TlsHandshakeFailed,
                                     endpoint.toString() + ": " + result->message());
            }
            return std::make_unique<Connection>(std::move(ioContext), Connection::Channel(std::move(channel)),
                                                endpoint.toString());
        }

        std::unique_ptr<Connection> connectSsh(std::unique_ptr<net::io_context> ioContext, const Endpoint& endpoint,
                                               std::chrono::milliseconds timeout) {
            auto ssh = boost::process::search_path("ssh");
            if (ssh.empty()) {
                throw TransportError(TransportError::Code::AddressInvalid, "ssh executable not found in PATH");
            }

            std::vector<std::string> args;
            if (!endpoint.user.empty()) {
                args.emplace_back("-l");
                args.push_back(endpoint.user);
            }
            if (!endpoint.port.empty()) {
                args.emplace_back("-p");
                args.push_back(endpoint.port);
            }
            if (timeout.count() > 0) {
                auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
                args.emplace_back("-o");
                args.push_back("ConnectTimeout=" + std::to_string(seconds > 0 ? seconds : 1));
            }
            args.emplace_back("--");
            args.push_back(endpoint.host);
            args.emplace_back("docker");
            args.emplace_back("system");
            args.emplace_back("dial-stdio");

            auto channel = std::make_unique<SshChannel>(*ioContext);
            std::error_code ec;
            channel->child = boost::process::child(
                ssh,
                boost::process::args(args),
                boost::process::std_in < channel->input,
                boost::process::std_out > channel->output,
                ec
            );
            if (ec) {
                throw TransportError(TransportError::Code::ConnectRefused, "could not start ssh: " + ec.message());
            }
            Log::debug("spawned ssh tunnel to " + endpoint.toString());
            return std::make_unique<Connection>(std::move(ioContext), Connection::Channel(std::move(channel)),
                                                endpoint.toString());
        }

        std::unique_ptr<Connection> connectNamedPipe(std::unique_ptr<net::io_context> ioContext, const Endpoint& endpoint,
                                                     std::chrono::milliseconds timeout) {
#ifdef _WIN32
            std::string path = endpoint.path;
            for (auto& c : path) {
                if (c == '/') c = '\\';
            }
            HANDLE handle = INVALID_HANDLE_VALUE;
            for (;;) {
                handle = ::CreateFileA(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_EXISTING,
                                       FILE_FLAG_OVERLAPPED, nullptr);
                if (handle != INVALID_HANDLE_VALUE) break;
                DWORD error = ::GetLastError();
                if (error == ERROR_PIPE_BUSY) {
                    DWORD wait = timeout.count() > 0 ? static_cast<DWORD>(timeout.count()) : NMPWAIT_WAIT_FOREVER;
                    if (!::WaitNamedPipeA(path.c_str(), wait)) {
                        throw TransportError(TransportError::Code::TimedOut, "named pipe busy: " + endpoint.path);
                    }
                    continue;
                }
                if (error == ERROR_ACCESS_DENIED) {
                    throw TransportError(TransportError::Code::AuthFailed, "access denied: " + endpoint.path);
                }
                if (error == ERROR_FILE_NOT_FOUND) {
                    throw TransportError(TransportError::Code::AddressInvalid, "no such pipe: " + endpoint.path);
                }
                throw TransportError(TransportError::Code::ConnectRefused,
                                     endpoint.path + ": error " + std::to_string(error));
            }
            PipeHandle pipe(*ioContext, handle);
            return std::make_unique<Connection>(std::move(ioContext), Connection::Channel(std::move(pipe)),
                                                endpoint.toString());
#else
            (void)ioContext;
            (void)timeout;
            throw TransportError(TransportError::Code::AddressInvalid,
                                 "named pipes are only available on Windows: " + endpoint.path);
#endif
        }
    }

    TlsChannel::TlsChannel(net::ssl::context tlsContext, TcpSocket socket)
        : context(std::move(tlsContext)), stream(std::move(socket), context) {}

    SshChannel::SshChannel(net::io_context& ioContext) : input(ioContext), output(ioContext) {}

    Connection::Connection(std::unique_ptr<net::io_context> ioContext, Channel channel, std::string description)
        : ioContext_(std::move(ioContext)), channel_(std::move(channel)), description_(std::move(description)) {}

    Connection::~Connection() {
        close();
    }

    void Connection::runUntilDone(const std::string& what) {
        if (runFor(*ioContext_, timeout_)) return;
        close();
        ioContext_->run();
        throw TransportError(TransportError::Code::TimedOut,
                             description_ + ": " + what + " timed out after " + millis(timeout_));
    }

    void Connection::checkSshExit() {
        auto* ssh = std::get_if<std::unique_ptr<SshChannel>>(&channel_);
        if (ssh == nullptr || receivedAny_) return;
        std::error_code ec;
        if ((*ssh)->child.wait_for(std::chrono::milliseconds(500), ec) && !ec && (*ssh)->child.exit_code() == 255) {
            throw TransportError(TransportError::Code::AuthFailed,
                                 description_ + ": ssh exited with status 255 before the daemon answered");
        }
    }

    std::size_t Connection::readSome(char* data, std::size_t size) {
        if (size == 0) return 0;
        if (!pending_.empty()) {
            std::size_t n = std::min(size, pending_.size());
            std::copy_n(pending_.data(), n, data);
            pending_.erase(0, n);
            return n;
        }
        if (!open_) {
            throw TransportError(TransportError::Code::ConnectionReset, description_ + ": connection is closed");
        }

        boost::system::error_code result;
        std::size_t transferred = 0;
        asyncReadSome(net::buffer(data, size), [&](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            transferred = n;
        });
        runUntilDone("read");

        if (result == net::error::eof || result == net::ssl::error::stream_truncated) {
            checkSshExit();
            return transferred;
        }
        if (result) throw transportError(result, description_ + ": read failed");
        receivedAny_ = receivedAny_ || transferred > 0;
        return transferred;
    }

    void Connection::write(const char* data, std::size_t size) {
        if (size == 0) return;
        if (!open_) {
            throw TransportError(TransportError::Code::ConnectionReset, description_ + ": connection is closed");
        }
        boost::system::error_code result;
        asyncWrite(net::buffer(data, size), [&](const boost::system::error_code& ec, std::size_t) { result = ec; });
        runUntilDone("write");
        if (result) throw transportError(result, description_ + ": write failed");
    }

    void Connection::write(const std::string& data) {
        write(data.data(), data.size());
    }

    void Connection::shutdownWrite() {
        boost::system::error_code ec;
        std::visit(overloaded{
            [&](UnixSocket& socket) { socket.shutdown(net::socket_base::shutdown_send, ec); },
            [&](TcpSocket& socket) { socket.shutdown(net::socket_base::shutdown_send, ec); },
            // TLS has no half-close; the peer sees the end of stdin when the connection closes
            [&](std::unique_ptr<TlsChannel>&) {},
            [&](std::unique_ptr<SshChannel>& ssh) { ssh->input.close(ec); },
#ifdef _WIN32
            [&](PipeHandle&) {},
#endif
        }, channel_);
        if (ec) Log::debug(description_ + ": shutdown failed: " + ec.message());
    }

    void Connection::close() noexcept {
        if (!open_) return;
        open_ = false;
        boost::system::error_code ec;
        std::visit(overloaded{
            [&](UnixSocket& socket) {
                socket.shutdown(net::socket_base::shutdown_both, ec);
                socket.close(ec);
            },
            [&](TcpSocket& socket) {
                socket.shutdown(net::socket_base::shutdown_both, ec);
                socket.close(ec);
            },
            [&](std::unique_ptr<TlsChannel>& tls) {
                tls->stream.lowest_layer().shutdown(net::socket_base::shutdown_both, ec);
                tls->stream.lowest_layer().close(ec);
            },
            [&](std::unique_ptr<SshChannel>& ssh) {
                ssh->input.close(ec);
                ssh->output.close(ec);
                std::error_code childEc;
                if (ssh->child.valid() && ssh->child.running(childEc)) {
                    ssh->child.terminate(childEc);
                }
                if (ssh->child.valid()) ssh->child.wait(childEc);
            },
#ifdef _WIN32
            [&](PipeHandle& pipe) { pipe.close(ec); },
#endif
        }, channel_);
        Log::trace(description_ + ": connection closed");
    }

    void Connection::unread(std::string bytes) {
        pending_.insert(0, bytes);
    }

    std::unique_ptr<Connection> connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
        auto ioContext = std::make_unique<net::io_context>();
        std::unique_ptr<Connection> connection;

        switch (endpoint.scheme) {
            case Scheme::Unix:
                connection = connectUnix(std::move(ioContext), endpoint);
                break;
            case Scheme::NamedPipe:
                connection = connectNamedPipe(std::move(ioContext), endpoint, timeout);
                break;
            case Scheme::Tcp: {
                TcpSocket socket = connectTcp(*ioContext, endpoint, timeout);
                connection = std::make_unique<Connection>(std::move(ioContext), Connection::Channel(std::move(socket)),
                                                          endpoint.toString());
                break;
            }
            case Scheme::Tls:
                connection = connectTls(std::move(ioContext), endpoint, timeout);
                break;
            case Scheme::Ssh:
                connection = connectSsh(std::move(ioContext), endpoint, timeout);
                break;
        }
        connection->setTimeout(timeout);
        Log::debug("connected to " + endpoint.toString());
        return connection;
    }
}
