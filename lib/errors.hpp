#ifndef DOCKWIRE_ERRORS_HPP
#define DOCKWIRE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <boost/system/error_code.hpp>

namespace Dockwire {
    enum class ErrorKind { Transport, Protocol, Version, Session, Daemon };

    class Error : public std::runtime_error {
        ErrorKind kind_;

    public:
        Error(ErrorKind kind, const std::string& message);

        ErrorKind kind() const noexcept { return kind_; }
    };

    // Connection establishment and I/O failures. Never retried here.
    class TransportError : public Error {
    public:
        enum class Code { AddressInvalid, ConnectRefused, TimedOut, TlsHandshakeFailed, AuthFailed, ConnectionReset, Io };

        TransportError(Code code, const std::string& message);

        Code code() const noexcept { return code_; }

    private:
        Code code_;
    };

    // Malformed wire data. Fatal for the affected stream.
    class ProtocolError : public Error {
    public:
        enum class Code {
            MalformedStatusLine,
            HeaderSectionTooLarge,
            ChunkSizeInvalid,
            TrailerMalformed,
            ShortRead,
            InvalidFrame,
            InvalidPacket,
            InvalidJson,
            UnexpectedStatus
        };

        ProtocolError(Code code, const std::string& message);

        Code code() const noexcept { return code_; }

    private:
        Code code_;
    };

    class VersionError : public Error {
    public:
        enum class Code { Unparseable, PinnedAboveServer, VersionTooOld };

        VersionError(Code code, const std::string& message);

        Code code() const noexcept { return code_; }

    private:
        Code code_;
    };

    class SessionError : public Error {
    public:
        enum class Code { UnknownMethod, ControlStreamBroken, Closed, InvalidState };

        SessionError(Code code, const std::string& message);

        Code code() const noexcept { return code_; }

    private:
        Code code_;
    };

    // Error reported by the daemon itself: a non-success status with its JSON message,
    // or an error entry inside a progress stream.
    class DaemonError : public Error {
        unsigned status_;
        std::string message_;

    public:
        DaemonError(unsigned status, const std::string& message);

        unsigned status() const noexcept { return status_; }
        const std::string& message() const noexcept { return message_; }
    };

    std::string toString(TransportError::Code code);
    std::string toString(ProtocolError::Code code);
    std::string toString(VersionError::Code code);
    std::string toString(SessionError::Code code);

    // Maps an asio/system error to the matching transport error code.
    TransportError transportError(const boost::system::error_code& ec, const std::string& what);
}

#endif // DOCKWIRE_ERRORS_HPP
