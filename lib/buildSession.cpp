#include "buildSession.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <thread>

#include "errors.hpp"
#include "invocationWorker.hpp"
#include "log.hpp"
#include "sessionProviders.hpp"

namespace Dockwire {
    namespace {
        constexpr std::size_t MAX_QUEUED_BYTES = 8 * 1024 * 1024;
        constexpr std::size_t CONTROL_READ_BUFFER = 64 * 1024;

        std::mutex registryMutex;
        std::set<std::string> liveSessions;

        bool registerId(const std::string& id) {
            std::lock_guard<std::mutex> lock(registryMutex);
            return liveSessions.insert(id).second;
        }

        void unregisterId(const std::string& id) {
            std::lock_guard<std::mutex> lock(registryMutex);
            liveSessions.erase(id);
        }
    }

    std::string newSessionId() {
        static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::random_device device;
        std::array<std::uint8_t, 17> number{};
        for (auto& byte : number) byte = static_cast<std::uint8_t>(device() & 0xff);
        number[0] |= 0x80;

        std::string digits;
        while (std::any_of(number.begin(), number.end(), [](std::uint8_t b) { return b != 0; })) {
            unsigned remainder = 0;
            for (auto& byte : number) {
                unsigned value = (remainder << 8) | byte;
                byte = static_cast<std::uint8_t>(value / 36);
                remainder = value % 36;
            }
            digits += alphabet[remainder];
        }
        std::reverse(digits.begin(), digits.end());
        return digits.substr(1, 25);
    }

    struct BuildSession::Impl {
        struct Call : InvocationChannel {
            Impl& session;
            std::uint32_t stream;
            std::string methodName;
            Metadata meta;
            std::unique_ptr<InvocationWorker> worker;
            std::unique_ptr<Invocation> invocation;
            std::atomic<bool> done{false};
            // Set before the worker is joined; releases a send blocked on a full queue.
            std::atomic<bool> cancelled{false};

            Call(Impl& session, std::uint32_t stream, OpenRequest request) :
                session(session),
                stream(stream),
                methodName(std::move(request.method)),
                meta(std::move(request.metadata)),
                worker(std::make_unique<InvocationWorker>("session " + session.id + " stream " + std::to_string(stream)))
            {}

            void send(std::string data) override {
                std::size_t offset = 0;
                do {
                    if (done) return;
                    std::size_t n = std::min<std::size_t>(MAX_SESSION_PAYLOAD, data.size() - offset);
                    session.enqueue(SessionFrame{FrameType::Data, stream, data.substr(offset, n)}, &cancelled);
                    offset += n;
                } while (offset < data.size());
            }

            void finish() override {
                if (done.exchange(true)) return;
                session.enqueue(SessionFrame{FrameType::Close, stream, {}}, &cancelled);
                session.retire(stream);
            }

            void fail(unsigned code, const std::string& message) override {
                if (done.exchange(true)) return;
                Log::debug("session " + session.id + " stream " + std::to_string(stream) + " failed: " + message);
                session.enqueue(SessionFrame{FrameType::Error, stream, encodeErrorStatus({code, message})}, &cancelled);
                session.retire(stream);
            }

            boost::asio::io_context& context() override { return worker->context(); }
            const std::string& method() const override { return methodName; }
            const Metadata& metadata() const override { return meta; }

            // Worker first, so no handler is running while the invocation is destroyed.
            void teardown() {
                if (!worker) return;
                worker->stop();
                invocation.reset();
                worker.reset();
            }
        };

        std::string id;
        std::string name;
        std::string sharedKey;

        mutable std::mutex mutex;
        std::map<std::string, std::shared_ptr<SessionService>> services;
        std::vector<std::string> methodOrder;
        std::map<std::uint32_t, std::shared_ptr<Call>> calls;
        std::vector<std::shared_ptr<Call>> finished;
        State state = State::Init;
        bool controlEnded = false;
        std::optional<std::string> failure;
        std::condition_variable endedCondition;

        std::unique_ptr<Connection> control;
        std::thread pump;
        std::atomic<std::thread::id> pumpId{};
        SessionFrameReader reader;
        std::array<char, CONTROL_READ_BUFFER> readBuffer{};

        std::mutex writeMutex;
        std::condition_variable writable;
        std::deque<std::string> outgoing;
        std::size_t queuedBytes = 0;
        bool closing = false;
        // pump thread only
        bool writing = false;
        std::string current;

        Impl(std::string name, std::string sharedKey) : name(std::move(name)), sharedKey(std::move(sharedKey)) {
            do {
                id = newSessionId();
            } while (!registerId(id));
            if (this->sharedKey.empty()) this->sharedKey = id;
        }

        void enqueue(const SessionFrame& frame, const std::atomic<bool>* cancelled = nullptr) {
            std::string bytes = encodeSessionFrame(frame);
            {
                std::unique_lock<std::mutex> lock(writeMutex);
                // The pump thread drains the queue, so it must never wait on it.
                if (std::this_thread::get_id() != pumpId.load()) {
                    writable.wait(lock, [this, cancelled]() {
                        return queuedBytes < MAX_QUEUED_BYTES || closing || (cancelled != nullptr && *cancelled);
                    });
                }
                if (closing || (cancelled != nullptr && *cancelled)) return;
                queuedBytes += bytes.size();
                outgoing.push_back(std::move(bytes));
            }
            boost::asio::post(control->context(), [this]() { writeNext(); });
        }

        void writeNext() {
            if (writing) return;
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                if (outgoing.empty() || closing) return;
                current = std::move(outgoing.front());
                outgoing.pop_front();
            }
            writing = true;
            control->asyncWrite(boost::asio::buffer(current), [this](const boost::system::error_code& ec, std::size_t) {
                writing = false;
                {
                    std::lock_guard<std::mutex> lock(writeMutex);
                    queuedBytes -= current.size();
                }
                writable.notify_all();
                if (ec) {
                    endControl(ec == boost::asio::error::operation_aborted
                                   ? std::nullopt
                                   : std::optional<std::string>("control stream write failed: " + ec.message()));
                    return;
                }
                writeNext();
            });
        }

        void readNext() {
            control->asyncReadSome(boost::asio::buffer(readBuffer), [this](const boost::system::error_code& ec, std::size_t n) {
                if (ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted) {
                    endControl(std::nullopt);
                    return;
                }
                if (ec) {
                    endControl("control stream read failed: " + ec.message());
                    return;
                }
                try {
                    reader.feed(readBuffer.data(), n);
                    while (auto frame = reader.next()) dispatch(*frame);
                } catch (const Error& e) {
                    endControl(std::string(e.what()));
                    return;
                }
                readNext();
            });
        }

        void dispatch(SessionFrame& frame) {
            Log::trace("session " + id + ": " + toString(frame.type) + " frame for stream " + std::to_string(frame.stream));
            switch (frame.type) {
                case FrameType::Open:
                    open(frame);
                    break;
                case FrameType::Data:
                    deliver(frame.stream, [data = std::move(frame.payload)](Invocation& invocation) {
                        invocation.onData(data);
                    });
                    break;
                case FrameType::Close:
                    deliver(frame.stream, [](Invocation& invocation) { invocation.onClose(); });
                    break;
                case FrameType::Error: {
                    ErrorStatus status = decodeErrorStatus(frame.payload);
                    Log::debug("session " + id + ": daemon ended stream " + std::to_string(frame.stream) +
                               " with code " + std::to_string(status.code) + ": " + status.message);
                    cancel(frame.stream);
                    break;
                }
                case FrameType::Cancel:
                    cancel(frame.stream);
                    break;
            }
        }

        void open(const SessionFrame& frame) {
            OpenRequest request = decodeOpen(frame.payload);
            std::shared_ptr<SessionService> service;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (state != State::Active) return;
                if (calls.count(frame.stream) != 0) {
                    throw ProtocolError(ProtocolError::Code::InvalidFrame,
                                        "stream " + std::to_string(frame.stream) + " opened twice");
                }
                auto it = services.find(request.method);
                if (it != services.end()) service = it->second;
            }
            if (!service) {
                Log::warn("session " + id + ": no service for " + request.method);
                enqueue(SessionFrame{FrameType::Error, frame.stream,
                                     encodeErrorStatus({StatusCode::Unimplemented, "unknown method " + request.method})});
                return;
            }

            auto call = std::make_shared<Call>(*this, frame.stream, std::move(request));
            try {
                call->invocation = service->invoke(call->methodName);
            } catch (const std::exception& e) {
                call->done = true;
                call->teardown();
                enqueue(SessionFrame{FrameType::Error, frame.stream, encodeErrorStatus({StatusCode::Internal, e.what()})});
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                calls.emplace(frame.stream, call);
            }
            Log::debug("session " + id + ": stream " + std::to_string(frame.stream) + " calls " + call->methodName);
            run(call, [call](Invocation& invocation) { invocation.start(*call); });
        }

        void run(const std::shared_ptr<Call>& call, std::function<void(Invocation&)> step) {
            call->worker->post([call, step = std::move(step)]() {
                if (call->done || !call->invocation) return;
                try {
                    step(*call->invocation);
                } catch (const std::exception& e) {
                    call->fail(StatusCode::Internal, e.what());
                }
            });
        }

        void deliver(std::uint32_t stream, std::function<void(Invocation&)> step) {
            std::shared_ptr<Call> call;
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = calls.find(stream);
                if (it != calls.end()) call = it->second;
            }
            if (!call) {
                Log::debug("session " + id + ": frame for inactive stream " + std::to_string(stream));
                return;
            }
            run(call, std::move(step));
        }

        void cancel(std::uint32_t stream) {
            std::shared_ptr<Call> call;
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = calls.find(stream);
                if (it == calls.end()) return;
                call = it->second;
                calls.erase(it);
            }
            stopCall(call);
        }

        void stopCall(const std::shared_ptr<Call>& call) {
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                call->cancelled = true;
            }
            writable.notify_all();
            if (!call->done.exchange(true) && call->worker) {
                call->worker->post([call]() {
                    if (call->invocation) call->invocation->cancel();
                });
            }
            call->teardown();
        }

        void retire(std::uint32_t stream) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = calls.find(stream);
                if (it == calls.end()) return;
                finished.push_back(it->second);
                calls.erase(it);
            }
            boost::asio::post(control->context(), [this]() { reap(); });
        }

        void reap() {
            std::vector<std::shared_ptr<Call>> done;
            {
                std::lock_guard<std::mutex> lock(mutex);
                done.swap(finished);
            }
            for (auto& call : done) call->teardown();
        }

        void cancelAll() {
            std::vector<std::shared_ptr<Call>> all;
            {
                std::lock_guard<std::mutex> lock(mutex);
                for (auto& [stream, call] : calls) all.push_back(call);
                calls.clear();
                all.insert(all.end(), finished.begin(), finished.end());
                finished.clear();
            }
            for (auto& call : all) stopCall(call);
        }

        void stopWriters() {
            {
                std::lock_guard<std::mutex> lock(writeMutex);
                closing = true;
            }
            writable.notify_all();
        }

        void endControl(std::optional<std::string> reason) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (controlEnded) return;
                controlEnded = true;
                if (reason && state == State::Active) failure = reason;
            }
            if (reason) {
                Log::warn("session " + id + ": " + *reason);
            } else {
                Log::debug("session " + id + ": control stream ended");
            }
            stopWriters();
            cancelAll();
            control->close();
            endedCondition.notify_all();
        }
    };

    BuildSession::BuildSession(std::string name, std::string sharedKey)
        : pimpl_(std::make_unique<Impl>(std::move(name), std::move(sharedKey))) {
        addService(std::make_shared<HealthService>());
    }

    BuildSession::~BuildSession() {
        close();
    }

    void BuildSession::addService(std::shared_ptr<SessionService> service) {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->state != State::Init) {
            throw SessionError(SessionError::Code::InvalidState, "services can only be added before the session starts");
        }
        for (const auto& method : service->methods()) {
            if (pimpl_->services.count(method) != 0) {
                throw SessionError(SessionError::Code::InvalidState, "method registered twice: " + method);
            }
            pimpl_->services.emplace(method, service);
            pimpl_->methodOrder.push_back(method);
        }
    }

    const std::string& BuildSession::id() const {
        return pimpl_->id;
    }

    const std::string& BuildSession::name() const {
        return pimpl_->name;
    }

    const std::string& BuildSession::sharedKey() const {
        return pimpl_->sharedKey;
    }

    std::vector<std::string> BuildSession::methods() const {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        return pimpl_->methodOrder;
    }

    Headers BuildSession::exposeHeaders() const {
        Headers headers;
        headers.emplace("X-Docker-Expose-Session-Uuid", pimpl_->id);
        headers.emplace("X-Docker-Expose-Session-Name", pimpl_->name);
        headers.emplace("X-Docker-Expose-Session-Sharedkey", pimpl_->sharedKey);
        for (const auto& method : methods()) {
            headers.emplace("X-Docker-Expose-Session-Grpc-Method", method);
        }
        return headers;
    }

    void BuildSession::start(std::unique_ptr<Connection> control) {
        {
            std::lock_guard<std::mutex> lock(pimpl_->mutex);
            if (pimpl_->state == State::Closed) {
                throw SessionError(SessionError::Code::Closed, "session " + pimpl_->id + " is closed");
            }
            if (pimpl_->state != State::Init) {
                throw SessionError(SessionError::Code::InvalidState, "session " + pimpl_->id + " already started");
            }
            pimpl_->state = State::Active;
        }
        pimpl_->control = std::move(control);
        pimpl_->readNext();
        pimpl_->pump = std::thread([impl = pimpl_.get()]() {
            impl->pumpId = std::this_thread::get_id();
            try {
                impl->control->context().restart();
                impl->control->context().run();
            } catch (const std::exception& e) {
                impl->endControl(std::string(e.what()));
            }
        });
        Log::debug("session " + pimpl_->id + " started with " + std::to_string(methods().size()) + " methods");
    }

    void BuildSession::wait() {
        std::unique_lock<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->state == State::Init) {
            throw SessionError(SessionError::Code::InvalidState, "session " + pimpl_->id + " was never started");
        }
        pimpl_->endedCondition.wait(lock, [this]() { return pimpl_->controlEnded || pimpl_->state == State::Closed; });
    }

    void BuildSession::close() {
        {
            std::lock_guard<std::mutex> lock(pimpl_->mutex);
            if (pimpl_->state == State::Closed) return;
            pimpl_->state = State::Closed;
        }
        pimpl_->stopWriters();
        if (pimpl_->pump.joinable()) {
            boost::asio::post(pimpl_->control->context(), [impl = pimpl_.get()]() { impl->endControl(std::nullopt); });
            pimpl_->pump.join();
        }
        pimpl_->cancelAll();
        if (pimpl_->control) pimpl_->control->close();
        {
            std::lock_guard<std::mutex> lock(pimpl_->mutex);
            pimpl_->controlEnded = true;
        }
        pimpl_->endedCondition.notify_all();
        unregisterId(pimpl_->id);
        Log::debug("session " + pimpl_->id + " closed");
    }

    BuildSession::State BuildSession::state() const {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        return pimpl_->state;
    }

    std::size_t BuildSession::activeInvocations() const {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        return pimpl_->calls.size();
    }

    std::optional<std::string> BuildSession::failure() const {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        return pimpl_->failure;
    }

    bool BuildSession::isLive(const std::string& id) {
        std::lock_guard<std::mutex> lock(registryMutex);
        return liveSessions.count(id) != 0;
    }
}
