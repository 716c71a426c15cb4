#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <thread>

#include "../lib/buildSession.hpp"
#include "../lib/errors.hpp"
#include "../lib/sessionProviders.hpp"
#include "test_helpers.hpp"

using namespace Dockwire;
using Dockwire::test::FakeDaemon;

namespace {
    const std::string HEALTH_CHECK = "/grpc.health.v1.Health/Check";
    const std::string HANG = "/dockwire.test.Hang/Wait";

    // A call that never finishes on its own and records its cancellation.
    class HangingService : public SessionService {
    public:
        std::shared_ptr<std::atomic<int>> cancelled = std::make_shared<std::atomic<int>>(0);
        std::shared_ptr<std::atomic<int>> started = std::make_shared<std::atomic<int>>(0);

        std::string name() const override { return "dockwire.test.Hang"; }
        std::vector<std::string> methods() const override { return {HANG}; }

        std::unique_ptr<Invocation> invoke(const std::string&) override {
            class Call : public Invocation {
                std::shared_ptr<std::atomic<int>> started_;
                std::shared_ptr<std::atomic<int>> cancelled_;

            public:
                Call(std::shared_ptr<std::atomic<int>> started, std::shared_ptr<std::atomic<int>> cancelled) :
                    started_(std::move(started)), cancelled_(std::move(cancelled)) {}

                void start(InvocationChannel&) override { ++*started_; }
                void onData(const std::string&) override {}
                void onClose() override {}
                void cancel() override { ++*cancelled_; }
            };
            return std::make_unique<Call>(started, cancelled);
        }
    };

    const std::string FLOOD = "/dockwire.test.Flood/Stream";
    constexpr int FLOOD_MESSAGES = 24;

    // Sends 1 MiB messages from start() until the call is cancelled or all are out.
    class FloodService : public SessionService {
    public:
        std::shared_ptr<std::atomic<int>> sent = std::make_shared<std::atomic<int>>(0);

        std::string name() const override { return "dockwire.test.Flood"; }
        std::vector<std::string> methods() const override { return {FLOOD}; }

        std::unique_ptr<Invocation> invoke(const std::string&) override {
            class Call : public Invocation {
                std::shared_ptr<std::atomic<int>> sent_;

            public:
                explicit Call(std::shared_ptr<std::atomic<int>> sent) : sent_(std::move(sent)) {}

                void start(InvocationChannel& channel) override {
                    for (int i = 0; i < FLOOD_MESSAGES; ++i) {
                        channel.send(std::string(1024 * 1024, 'f'));
                        ++*sent_;
                    }
                    channel.finish();
                }
                void onData(const std::string&) override {}
                void onClose() override {}
                void cancel() override {}
            };
            return std::make_unique<Call>(sent);
        }
    };

    template<typename Predicate>
    bool eventually(Predicate predicate) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    SessionError::Code sessionCode(const std::function<void()>& action) {
        try {
            action();
        } catch (const SessionError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no SessionError thrown";
        return SessionError::Code::UnknownMethod;
    }
}

TEST(SessionIdTest, IsTwentyFiveBase36Characters) {
    std::string first = newSessionId();
    std::string second = newSessionId();
    ASSERT_EQ(first.size(), 25u);
    for (char c : first) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z')) << first;
    }
    EXPECT_NE(first, second);
}

TEST(BuildSessionTest, RegistersAndReleasesItsId) {
    std::string id;
    {
        BuildSession session;
        id = session.id();
        EXPECT_TRUE(BuildSession::isLive(id));
        EXPECT_EQ(session.sharedKey(), id);
        EXPECT_EQ(session.state(), BuildSession::State::Init);
    }
    EXPECT_FALSE(BuildSession::isLive(id));

    BuildSession keyed("builder", "shared-secret-key");
    EXPECT_EQ(keyed.sharedKey(), "shared-secret-key");
    EXPECT_EQ(keyed.name(), "builder");
}

TEST(BuildSessionTest, ExposesEveryMethodInHeaders) {
    BuildSession session("builder");
    session.addService(std::make_shared<AuthProvider>(std::map<std::string, Credentials>{}));

    Headers headers = session.exposeHeaders();
    EXPECT_EQ(headers.find("X-Docker-Expose-Session-Uuid")->second, session.id());
    EXPECT_EQ(headers.find("X-Docker-Expose-Session-Name")->second, "builder");
    EXPECT_EQ(headers.find("X-Docker-Expose-Session-Sharedkey")->second, session.id());

    std::vector<std::string> exposed;
    auto range = headers.equal_range("X-Docker-Expose-Session-Grpc-Method");
    for (auto it = range.first; it != range.second; ++it) exposed.push_back(it->second);
    EXPECT_EQ(exposed, (std::vector<std::string>{HEALTH_CHECK, "/moby.filesync.v1.Auth/Credentials"}));
}

TEST(BuildSessionTest, ServicesAreFixedOnceStarted) {
    BuildSession session;
    EXPECT_EQ(sessionCode([&] { session.addService(std::make_shared<HealthService>()); }),
              SessionError::Code::InvalidState);
    EXPECT_EQ(sessionCode([&] { session.wait(); }), SessionError::Code::InvalidState);

    auto control = Dockwire::test::connectionPair();
    session.start(std::move(control.first));
    EXPECT_EQ(session.state(), BuildSession::State::Active);
    EXPECT_EQ(sessionCode([&] { session.addService(std::make_shared<HangingService>()); }),
              SessionError::Code::InvalidState);

    auto again = Dockwire::test::connectionPair();
    EXPECT_EQ(sessionCode([&] { session.start(std::move(again.first)); }), SessionError::Code::InvalidState);
    session.close();

    auto late = Dockwire::test::connectionPair();
    EXPECT_EQ(sessionCode([&] { session.start(std::move(late.first)); }), SessionError::Code::Closed);
}

class BuildSessionStreamTest : public ::testing::Test {
protected:
    std::shared_ptr<HangingService> hanging = std::make_shared<HangingService>();
    std::unique_ptr<BuildSession> session;
    std::unique_ptr<FakeDaemon> daemon;

    void SetUp() override {
        session = std::make_unique<BuildSession>("stream-test");
        session->addService(hanging);
        auto [client, peer] = Dockwire::test::connectionPair();
        session->start(std::move(client));
        daemon = std::make_unique<FakeDaemon>(std::move(peer));
    }

    void TearDown() override {
        session->close();
    }
};

TEST_F(BuildSessionStreamTest, HealthCheckAnswersServing) {
    daemon->open(1, HEALTH_CHECK);
    daemon->send({FrameType::Data, 1, "{}"});
    daemon->send({FrameType::Close, 1, ""});

    SessionFrame data = daemon->next();
    EXPECT_EQ(data.type, FrameType::Data);
    EXPECT_EQ(data.stream, 1u);
    EXPECT_EQ(data.payload, R"({"status":"SERVING"})");

    SessionFrame close = daemon->next();
    EXPECT_EQ(close.type, FrameType::Close);
    EXPECT_EQ(close.stream, 1u);
    EXPECT_TRUE(eventually([&] { return session->activeInvocations() == 0; }));
}

TEST_F(BuildSessionStreamTest, UnknownMethodIsUnimplemented) {
    daemon->open(7, "/moby.nothing.v1.Nothing/Call");
    SessionFrame error = daemon->next();
    EXPECT_EQ(error.type, FrameType::Error);
    EXPECT_EQ(error.stream, 7u);
    EXPECT_EQ(decodeErrorStatus(error.payload).code, StatusCode::Unimplemented);

    // the session keeps serving
    daemon->open(9, HEALTH_CHECK);
    daemon->send({FrameType::Close, 9, ""});
    EXPECT_EQ(daemon->next().stream, 9u);
    EXPECT_FALSE(session->failure().has_value());
}

TEST_F(BuildSessionStreamTest, DaemonCancelStopsTheCall) {
    daemon->open(3, HANG);
    ASSERT_TRUE(eventually([&] { return hanging->started->load() == 1; }));
    EXPECT_EQ(session->activeInvocations(), 1u);

    daemon->send({FrameType::Cancel, 3, ""});
    EXPECT_TRUE(eventually([&] { return hanging->cancelled->load() == 1; }));
    EXPECT_TRUE(eventually([&] { return session->activeInvocations() == 0; }));
}

TEST_F(BuildSessionStreamTest, CloseCancelsRunningCalls) {
    daemon->open(1, HANG);
    daemon->open(3, HANG);
    ASSERT_TRUE(eventually([&] { return hanging->started->load() == 2; }));

    session->close();
    EXPECT_EQ(hanging->cancelled->load(), 2);
    EXPECT_EQ(session->activeInvocations(), 0u);
    EXPECT_EQ(session->state(), BuildSession::State::Closed);
    EXPECT_FALSE(BuildSession::isLive(session->id()));
    EXPECT_TRUE(daemon->readsToEnd());
}

TEST_F(BuildSessionStreamTest, DaemonHangupEndsTheSession) {
    daemon->open(5, HANG);
    ASSERT_TRUE(eventually([&] { return hanging->started->load() == 1; }));

    daemon->close();
    session->wait();
    EXPECT_FALSE(session->failure().has_value());
    EXPECT_TRUE(eventually([&] { return hanging->cancelled->load() == 1; }));
    EXPECT_TRUE(eventually([&] { return session->activeInvocations() == 0; }));
}

TEST_F(BuildSessionStreamTest, StreamOpenedTwiceBreaksControl) {
    daemon->open(5, HANG);
    daemon->open(5, HANG);
    session->wait();
    ASSERT_TRUE(session->failure().has_value());
    EXPECT_NE(session->failure()->find("opened twice"), std::string::npos);
    EXPECT_TRUE(eventually([&] { return hanging->cancelled->load() == 1; }));
}

TEST_F(BuildSessionStreamTest, UnknownFrameTypeIsFatal) {
    // frames for streams nobody opened are dropped
    daemon->send({FrameType::Data, 99, "stray"});

    std::string bytes = encodeSessionFrame({FrameType::Data, 1, "x"});
    bytes[4] = '\x09';
    daemon->sendRaw(bytes);
    session->wait();
    ASSERT_TRUE(session->failure().has_value());
    EXPECT_TRUE(daemon->readsToEnd());
}

TEST(BuildSessionBackpressureTest, CancelReleasesCallBlockedOnFullQueue) {
    auto flood = std::make_shared<FloodService>();
    BuildSession session("flood-test");
    session.addService(flood);
    auto control = Dockwire::test::connectionPair();
    session.start(std::move(control.first));
    FakeDaemon daemon(std::move(control.second));

    // nothing is read, so the outgoing queue fills and the call blocks
    daemon.open(1, FLOOD);
    ASSERT_TRUE(eventually([&] { return flood->sent->load() >= 8; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_LT(flood->sent->load(), FLOOD_MESSAGES);

    daemon.send({FrameType::Cancel, 1, ""});
    daemon.open(9, HEALTH_CHECK);
    daemon.send({FrameType::Close, 9, ""});

    SessionFrame frame = daemon.next();
    while (frame.stream == 1) frame = daemon.next();
    EXPECT_EQ(frame.stream, 9u);
    EXPECT_EQ(frame.type, FrameType::Data);
    EXPECT_EQ(frame.payload, R"({"status":"SERVING"})");
    EXPECT_TRUE(eventually([&] { return session.activeInvocations() == 0; }));
    EXPECT_FALSE(session.failure().has_value());
    session.close();
}
