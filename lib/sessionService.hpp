#pragma once

#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sessionFrame.hpp"

namespace Dockwire {
    // Back channel of one call. Safe to use from the invocation's worker thread; send()
    // blocks while the session's outgoing queue is full.
    class InvocationChannel {
    public:
        virtual ~InvocationChannel() = default;

        virtual void send(std::string data) = 0;
        // Ends the call successfully; later sends are dropped.
        virtual void finish() = 0;
        // Ends the call with a gRPC status code.
        virtual void fail(unsigned code, const std::string& message) = 0;

        virtual boost::asio::io_context& context() = 0;
        virtual const std::string& method() const = 0;
        virtual const Metadata& metadata() const = 0;

        // First value of a metadata key, or fallback.
        std::string metadataValue(const std::string& key, const std::string& fallback = "") const {
            auto it = metadata().find(key);
            if (it == metadata().end() || it->second.empty()) return fallback;
            return it->second.front();
        }
    };

    // One running call. Every method runs on the call's worker thread, in frame order.
    class Invocation {
    public:
        virtual ~Invocation() = default;

        virtual void start(InvocationChannel& channel) = 0;
        virtual void onData(const std::string& data) = 0;
        // The daemon finished sending.
        virtual void onClose() = 0;
        // Must release every pending async operation on the worker's context.
        virtual void cancel() = 0;
    };

    class SessionService {
    public:
        virtual ~SessionService() = default;

        virtual std::string name() const = 0;
        virtual std::vector<std::string> methods() const = 0;
        virtual std::unique_ptr<Invocation> invoke(const std::string& method) = 0;
    };

    // Thrown by handlers to end a call with a specific status code.
    class InvocationFailure : public std::runtime_error {
        unsigned code_;

    public:
        InvocationFailure(unsigned code, const std::string& message) : std::runtime_error(message), code_(code) {}

        unsigned code() const noexcept { return code_; }
    };

    // Request/response call: collects the request until the daemon closes its side,
    // then answers once.
    class UnaryInvocation : public Invocation {
    public:
        using Handler = std::function<std::string(const std::string& request, InvocationChannel& channel)>;

        explicit UnaryInvocation(Handler handler) : handler_(std::move(handler)) {}

        void start(InvocationChannel& channel) override { channel_ = &channel; }
        void onData(const std::string& data) override { request_ += data; }

        void onClose() override {
            if (channel_ == nullptr) return;
            try {
                channel_->send(handler_(request_, *channel_));
                channel_->finish();
            } catch (const InvocationFailure& e) {
                channel_->fail(e.code(), e.what());
            } catch (const std::exception& e) {
                channel_->fail(StatusCode::Internal, e.what());
            }
        }

        void cancel() override { channel_ = nullptr; }

    private:
        Handler handler_;
        InvocationChannel* channel_ = nullptr;
        std::string request_;
    };
}
