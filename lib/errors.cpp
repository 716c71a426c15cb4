#include "errors.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

namespace Dockwire {
    Error::Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    TransportError::TransportError(Code code, const std::string& message)
        : Error(ErrorKind::Transport, toString(code) + ": " + message), code_(code) {}

    ProtocolError::ProtocolError(Code code, const std::string& message)
        : Error(ErrorKind::Protocol, toString(code) + ": " + message), code_(code) {}

    VersionError::VersionError(Code code, const std::string& message)
        : Error(ErrorKind::Version, toString(code) + ": " + message), code_(code) {}

    SessionError::SessionError(Code code, const std::string& message)
        : Error(ErrorKind::Session, toString(code) + ": " + message), code_(code) {}

    DaemonError::DaemonError(unsigned status, const std::string& message)
        : Error(ErrorKind::Daemon, "daemon responded with status " + std::to_string(status) +
                                       (message.empty() ? std::string() : ": " + message)),
          status_(status), message_(message) {}

    std::string toString(TransportError::Code code) {
        switch (code) {
            case TransportError::Code::AddressInvalid: return "AddressInvalid";
            case TransportError::Code::ConnectRefused: return "ConnectRefused";
            case TransportError::Code::TimedOut: return "TimedOut";
            case TransportError::Code::TlsHandshakeFailed: return "TlsHandshakeFailed";
            case TransportError::Code::AuthFailed: return "AuthFailed";
            case TransportError::Code::ConnectionReset: return "ConnectionReset";
            case TransportError::Code::Io: return "Io";
        }
        return "TransportError";
    }

    std::string toString(ProtocolError::Code code) {
        switch (code) {
            case ProtocolError::Code::MalformedStatusLine: return "MalformedStatusLine";
            case ProtocolError::Code::HeaderSectionTooLarge: return "HeaderSectionTooLarge";
            case ProtocolError::Code::ChunkSizeInvalid: return "ChunkSizeInvalid";
            case ProtocolError::Code::TrailerMalformed: return "TrailerMalformed";
            case ProtocolError::Code::ShortRead: return "ShortRead";
            case ProtocolError::Code::InvalidFrame: return "InvalidFrame";
            case ProtocolError::Code::InvalidPacket: return "InvalidPacket";
            case ProtocolError::Code::InvalidJson: return "InvalidJson";
            case ProtocolError::Code::UnexpectedStatus: return "UnexpectedStatus";
        }
        return "ProtocolError";
    }

    std::string toString(VersionError::Code code) {
        switch (code) {
            case VersionError::Code::Unparseable: return "Unparseable";
            case VersionError::Code::PinnedAboveServer: return "PinnedAboveServer";
            case VersionError::Code::VersionTooOld: return "VersionTooOld";
        }
        return "VersionError";
    }

    std::string toString(SessionError::Code code) {
        switch (code) {
            case SessionError::Code::UnknownMethod: return "UnknownMethod";
            case SessionError::Code::ControlStreamBroken: return "ControlStreamBroken";
            case SessionError::Code::Closed: return "Closed";
            case SessionError::Code::InvalidState: return "InvalidState";
        }
        return "SessionError";
    }

    TransportError transportError(const boost::system::error_code& ec, const std::string& what) {
        namespace error = boost::asio::error;
        const std::string message = what + ": " + ec.message();

        if (ec == error::connection_refused) {
            return {TransportError::Code::ConnectRefused, message};
        }
        if (ec == error::timed_out || ec == error::operation_aborted) {
            return {TransportError::Code::TimedOut, message};
        }
        if (ec == error::host_not_found || ec == error::host_not_found_try_again ||
            ec == error::address_family_not_supported || ec == error::invalid_argument ||
            ec == boost::system::errc::no_such_file_or_directory || ec == error::service_not_found) {
            return {TransportError::Code::AddressInvalid, message};
        }
        if (ec == error::access_denied || ec == boost::system::errc::permission_denied) {
            return {TransportError::Code::AuthFailed, message};
        }
        if (ec == error::connection_reset || ec == error::broken_pipe || ec == error::connection_aborted ||
            ec == error::eof || ec == boost::asio::ssl::error::stream_truncated) {
            return {TransportError::Code::ConnectionReset, message};
        }
        if (ec.category() == boost::asio::error::get_ssl_category()) {
            return {TransportError::Code::TlsHandshakeFailed, message};
        }
        return {TransportError::Code::Io, message};
    }
}
