#include "realtime/ClientSession.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <functional>
#include <vector>

using namespace desk::domain;
using namespace desk::realtime;
using namespace std::chrono_literals;

// --- Test fakes ---

namespace {

class FakeConnection : public IConnection {
public:
    std::atomic<bool> fail_sends{false};
    std::atomic<bool> fail_pings{false};

    bool send_text(const std::string& frame, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        if (fail_sends) return false;
        sent_.push_back(frame);
        return true;
    }

    bool ping() override {
        ++pings_;
        return !fail_pings;
    }

    void close(int code, const std::string& reason) override {
        std::lock_guard lock(mutex_);
        ++closes_;
        close_code_ = code;
        close_reason_ = reason;
    }

    std::vector<std::string> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }
    int pings() const { return pings_; }
    int closes() const {
        std::lock_guard lock(mutex_);
        return closes_;
    }
    int close_code() const {
        std::lock_guard lock(mutex_);
        return close_code_;
    }
    std::string close_reason() const {
        std::lock_guard lock(mutex_);
        return close_reason_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    std::atomic<int> pings_{0};
    int closes_ = 0;
    int close_code_ = 0;
    std::string close_reason_;
};

// Stands in for the hub: release closes the session's outbound queue.
class FakeRouter : public SessionRouter {
public:
    std::vector<TicketId> subscribed;
    std::vector<TicketId> unsubscribed;
    std::atomic<int> releases{0};

    void subscribe(const std::shared_ptr<ClientSession>& session, TicketId ticket_id) override {
        subscribed.push_back(ticket_id);
        session->add_subscription(ticket_id);
    }

    void unsubscribe(const std::shared_ptr<ClientSession>& session, TicketId ticket_id) override {
        unsubscribed.push_back(ticket_id);
        session->remove_subscription(ticket_id);
    }

    void release(const std::shared_ptr<ClientSession>& session) override {
        ++releases;
        session->close_outbound();
    }
};

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

Frame make_frame(const std::string& text) {
    return std::make_shared<const std::string>(text);
}

} // namespace

// --- Fixture ---

class ClientSessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeConnection> connection = std::make_shared<FakeConnection>();
    FakeRouter router;

    std::shared_ptr<ClientSession> make_session(SessionLimits limits = {}) {
        return std::make_shared<ClientSession>("s-1", UserId("alice"), connection, router, limits);
    }

    static SessionLimits short_limits() {
        SessionLimits limits;
        limits.read_timeout = 5000ms;
        limits.ping_interval = 4000ms;
        limits.write_timeout = 50ms;
        return limits;
    }
};

// --- Construction ---

TEST_F(ClientSessionTest, RejectsPingIntervalNotBelowReadTimeout) {
    SessionLimits limits;
    limits.ping_interval = limits.read_timeout;
    EXPECT_THROW(make_session(limits), std::invalid_argument);
}

TEST(SessionLimits, FromSettings) {
    desk::config::RealtimeSettings settings;
    settings.read_timeout_seconds = 30;
    settings.ping_interval_seconds = 25;
    settings.write_timeout_seconds = 5;
    settings.max_message_bytes = 2048;
    settings.outbound_queue_capacity = 16;

    auto limits = SessionLimits::from_settings(settings);
    EXPECT_EQ(limits.read_timeout, 30s);
    EXPECT_EQ(limits.ping_interval, 25s);
    EXPECT_EQ(limits.write_timeout, 5s);
    EXPECT_EQ(limits.max_message_bytes, 2048u);
    EXPECT_EQ(limits.outbound_capacity, 16u);
}

// --- Inbound frames ---

TEST_F(ClientSessionTest, SubscribeAndUnsubscribeGoThroughRouter) {
    auto session = make_session();

    session->on_frame(R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":42}})");
    EXPECT_TRUE(session->is_subscribed(42));

    session->on_frame(R"({"type":"UNSUBSCRIBE_FROM_TICKET","payload":{"ticketId":42}})");
    EXPECT_FALSE(session->is_subscribed(42));

    EXPECT_EQ(router.subscribed, std::vector<TicketId>{42});
    EXPECT_EQ(router.unsubscribed, std::vector<TicketId>{42});
}

TEST_F(ClientSessionTest, PingQueuesPong) {
    auto session = make_session();

    session->on_frame(R"({"type":"PING"})");

    EXPECT_EQ(session->outbound_depth(), 1u);
}

TEST_F(ClientSessionTest, PongIsSkippedWhenQueueIsFull) {
    SessionLimits limits;
    limits.outbound_capacity = 1;
    auto session = make_session(limits);
    ASSERT_TRUE(session->try_enqueue(make_frame("event")));

    session->on_frame(R"({"type":"PING"})");

    EXPECT_EQ(session->outbound_depth(), 1u);
    EXPECT_FALSE(session->disconnect_requested());
}

TEST_F(ClientSessionTest, MalformedAndUnknownMessagesAreIgnored) {
    auto session = make_session();

    session->on_frame("{garbage");
    session->on_frame(R"({"type":"DELETE_TICKET","payload":{"ticketId":1}})");
    session->on_frame(R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":0}})");

    EXPECT_TRUE(router.subscribed.empty());
    EXPECT_FALSE(session->disconnect_requested());
    EXPECT_EQ(session->outbound_depth(), 0u);
}

TEST_F(ClientSessionTest, OversizeFrameDisconnects) {
    SessionLimits limits;
    limits.max_message_bytes = 64;
    auto session = make_session(limits);

    session->on_frame(R"({"type":"PING","padding":")" + std::string(100, 'x') + R"("})");

    EXPECT_TRUE(session->disconnect_requested());
    EXPECT_EQ(router.releases, 1);
    EXPECT_TRUE(session->outbound_closed());
}

TEST_F(ClientSessionTest, DisconnectReleasesOnce) {
    auto session = make_session();

    session->disconnect("first");
    session->disconnect("second");

    EXPECT_EQ(router.releases, 1);
}

TEST_F(ClientSessionTest, ClosedQueueRejectsFrames) {
    auto session = make_session();
    EXPECT_TRUE(session->close_outbound());
    EXPECT_FALSE(session->close_outbound());
    EXPECT_FALSE(session->try_enqueue(make_frame("late")));
}

// --- Outbound thread ---

TEST_F(ClientSessionTest, WritesFramesInOrderAndClosesNormally) {
    auto session = make_session(short_limits());
    session->start();

    session->try_enqueue(make_frame("one"));
    session->try_enqueue(make_frame("two"));
    ASSERT_TRUE(wait_until([&] { return connection->sent().size() == 2; }));

    session->close_outbound("server shutdown");
    session->join();

    EXPECT_EQ(connection->sent(), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(connection->closes(), 1);
    EXPECT_EQ(connection->close_code(), 1000);
    EXPECT_EQ(connection->close_reason(), "server shutdown");
}

TEST_F(ClientSessionTest, QueuedFramesAreFlushedBeforeClose) {
    auto session = make_session(short_limits());
    session->try_enqueue(make_frame("a"));
    session->try_enqueue(make_frame("b"));
    session->close_outbound();

    session->start();
    session->join();

    EXPECT_EQ(connection->sent(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(connection->closes(), 1);
}

TEST_F(ClientSessionTest, WriteFailureDisconnects) {
    connection->fail_sends = true;
    auto session = make_session(short_limits());
    session->start();

    session->try_enqueue(make_frame("lost"));
    session->join();

    EXPECT_EQ(router.releases, 1);
    EXPECT_EQ(connection->close_reason(), "write failed");
}

TEST_F(ClientSessionTest, SendsKeepalivePings) {
    SessionLimits limits;
    limits.read_timeout = 2000ms;
    limits.ping_interval = 20ms;
    limits.write_timeout = 50ms;
    auto session = make_session(limits);
    session->start();

    EXPECT_TRUE(wait_until([&] { return connection->pings() >= 2; }, 1500ms));

    session->close_outbound();
    session->join();
    EXPECT_FALSE(session->disconnect_requested());
}

TEST_F(ClientSessionTest, FailedPingDisconnects) {
    connection->fail_pings = true;
    SessionLimits limits;
    limits.read_timeout = 2000ms;
    limits.ping_interval = 20ms;
    limits.write_timeout = 50ms;
    auto session = make_session(limits);
    session->start();
    session->join();

    EXPECT_EQ(router.releases, 1);
    EXPECT_EQ(connection->close_reason(), "ping failed");
}

TEST_F(ClientSessionTest, SilentClientHitsReadDeadline) {
    SessionLimits limits;
    limits.read_timeout = 60ms;
    limits.ping_interval = 40ms;
    limits.write_timeout = 50ms;
    auto session = make_session(limits);
    session->start();
    session->join();

    EXPECT_TRUE(session->disconnect_requested());
    EXPECT_EQ(connection->close_reason(), "read deadline expired");
}

TEST_F(ClientSessionTest, InboundTrafficExtendsReadDeadline) {
    SessionLimits limits;
    limits.read_timeout = 150ms;
    limits.ping_interval = 100ms;
    limits.write_timeout = 50ms;
    auto session = make_session(limits);
    session->start();

    for (int i = 0; i < 10; ++i) {
        std::this_thread::sleep_for(30ms);
        session->touch();
    }
    EXPECT_FALSE(session->disconnect_requested());

    session->close_outbound();
    session->join();
}
