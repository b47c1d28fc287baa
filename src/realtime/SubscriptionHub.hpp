#pragma once

#include "domain/events/TicketEvent.hpp"
#include "realtime/BoundedQueue.hpp"
#include "realtime/ClientSession.hpp"
#include "realtime/SessionRouter.hpp"
#include "services/IEventBroadcaster.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>

namespace desk::realtime {

using SessionPtr = std::shared_ptr<ClientSession>;

// Routes committed ticket events to the sessions subscribed to the ticket.
//
// broadcast() never blocks: events go through a bounded dispatch queue and a
// single dispatch thread fans each one out to the room members' outbound
// queues. A member whose queue is full is evicted rather than waited for.
//
// Lock order: hub -> session -> queue. Sessions hold a reference to the hub,
// so their outbound threads must be joined before the hub is destroyed.
class SubscriptionHub : public desk::services::IEventBroadcaster, public SessionRouter {
public:
    using SubscriptionPolicy = std::function<bool(const desk::domain::UserId&, desk::domain::TicketId)>;

    explicit SubscriptionHub(std::size_t dispatch_capacity = 256);
    ~SubscriptionHub() override;

    SubscriptionHub(const SubscriptionHub&) = delete;
    SubscriptionHub& operator=(const SubscriptionHub&) = delete;

    // Must be set before sessions connect.
    void set_subscription_policy(SubscriptionPolicy policy);

    void start();
    // Drains pending events, then unregisters every session. Idempotent.
    void stop();

    void register_session(const SessionPtr& session);
    // Idempotent. Returns true when the session was registered.
    bool unregister_session(const SessionPtr& session);

    // SessionRouter
    void subscribe(const SessionPtr& session, desk::domain::TicketId ticket_id) override;
    void unsubscribe(const SessionPtr& session, desk::domain::TicketId ticket_id) override;
    void release(const SessionPtr& session) override;

    // IEventBroadcaster
    void broadcast(const desk::domain::TicketEvent& event) override;

    // Dispatches queued events on the calling thread. Only meaningful while
    // the dispatch thread is not running. Returns the number dispatched.
    std::size_t dispatch_pending();

    // Best effort direct delivery to every session of `user`; full queues
    // are skipped. Returns the number of sessions that accepted the frame.
    std::size_t send_to_user(const desk::domain::UserId& user, const std::string& frame);

    std::size_t session_count() const;
    std::size_t room_count() const;
    std::size_t room_membership(desk::domain::TicketId ticket_id) const;
    bool is_user_connected(const desk::domain::UserId& user) const;

    uint64_t dispatched_events() const noexcept { return dispatched_events_; }
    uint64_t dropped_events() const noexcept { return dropped_events_; }
    uint64_t evicted_sessions() const noexcept { return evicted_sessions_; }

private:
    void run_dispatch();
    void dispatch(const desk::domain::TicketEvent& event);
    bool is_registered_locked(const SessionPtr& session) const;

    mutable std::shared_mutex mutex_;
    std::map<desk::domain::UserId, std::set<SessionPtr>> users_;
    std::map<desk::domain::TicketId, std::set<SessionPtr>> rooms_;
    SubscriptionPolicy policy_;

    BoundedQueue<desk::domain::TicketEvent> dispatch_queue_;
    std::thread dispatch_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> dispatched_events_{0};
    std::atomic<uint64_t> dropped_events_{0};
    std::atomic<uint64_t> evicted_sessions_{0};
};

} // namespace desk::realtime
