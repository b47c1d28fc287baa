#include "realtime/SubscriptionHub.hpp"

#include "realtime/RealtimeProtocol.hpp"

#include <iostream>
#include <mutex>
#include <vector>

using namespace desk::domain;

namespace desk::realtime {

SubscriptionHub::SubscriptionHub(std::size_t dispatch_capacity)
    : dispatch_queue_(dispatch_capacity) {}

SubscriptionHub::~SubscriptionHub() {
    stop();
}

void SubscriptionHub::set_subscription_policy(SubscriptionPolicy policy) {
    std::unique_lock lock(mutex_);
    policy_ = std::move(policy);
}

void SubscriptionHub::start() {
    if (running_.exchange(true)) return;
    dispatch_thread_ = std::thread([this]() { run_dispatch(); });
    std::cout << "[hub] Dispatch started" << std::endl;
}

void SubscriptionHub::stop() {
    dispatch_queue_.close();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    running_ = false;
    dispatch_pending();

    std::vector<SessionPtr> sessions;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [user, members] : users_) {
            sessions.insert(sessions.end(), members.begin(), members.end());
        }
    }
    for (const auto& session : sessions) {
        unregister_session(session);
    }
}

void SubscriptionHub::register_session(const SessionPtr& session) {
    std::unique_lock lock(mutex_);
    auto& members = users_[session->user_id()];
    members.insert(session);
    std::cout << "[hub] Registered session " << session->id()
              << " user=" << session->user_id().value()
              << " connections=" << members.size() << std::endl;
}

bool SubscriptionHub::unregister_session(const SessionPtr& session) {
    bool was_registered = false;
    {
        std::unique_lock lock(mutex_);

        if (auto it = users_.find(session->user_id()); it != users_.end()) {
            was_registered = it->second.erase(session) > 0;
            if (it->second.empty()) users_.erase(it);
        }

        for (auto ticket_id : session->subscriptions()) {
            if (auto room = rooms_.find(ticket_id); room != rooms_.end()) {
                room->second.erase(session);
                if (room->second.empty()) rooms_.erase(room);
            }
        }

        session->close_outbound();
    }

    if (was_registered) {
        std::cout << "[hub] Unregistered session " << session->id()
                  << " user=" << session->user_id().value() << std::endl;
    }
    return was_registered;
}

bool SubscriptionHub::is_registered_locked(const SessionPtr& session) const {
    auto it = users_.find(session->user_id());
    return it != users_.end() && it->second.count(session) > 0;
}

void SubscriptionHub::subscribe(const SessionPtr& session, TicketId ticket_id) {
    SubscriptionPolicy policy;
    {
        std::shared_lock lock(mutex_);
        policy = policy_;
    }

    // The policy may hit storage, so it runs without the hub lock.
    if (policy && !policy(session->user_id(), ticket_id)) {
        std::cerr << "[hub] Denied subscription session=" << session->id()
                  << " user=" << session->user_id().value()
                  << " ticket=" << ticket_id << std::endl;
        return;
    }

    std::unique_lock lock(mutex_);
    if (!is_registered_locked(session)) return;

    rooms_[ticket_id].insert(session);
    session->add_subscription(ticket_id);
}

void SubscriptionHub::unsubscribe(const SessionPtr& session, TicketId ticket_id) {
    std::unique_lock lock(mutex_);
    if (auto room = rooms_.find(ticket_id); room != rooms_.end()) {
        room->second.erase(session);
        if (room->second.empty()) rooms_.erase(room);
    }
    session->remove_subscription(ticket_id);
}

void SubscriptionHub::release(const SessionPtr& session) {
    unregister_session(session);
}

void SubscriptionHub::broadcast(const TicketEvent& event) {
    if (!dispatch_queue_.try_push(event)) {
        ++dropped_events_;
        std::cerr << "[hub] Dispatch queue full, dropping event " << event.id
                  << " type=" << to_string(event.type)
                  << " ticket=" << event.ticket_id << std::endl;
    }
}

std::size_t SubscriptionHub::dispatch_pending() {
    if (running_) return 0;

    std::size_t count = 0;
    while (auto event = dispatch_queue_.try_pop()) {
        dispatch(*event);
        ++count;
    }
    return count;
}

void SubscriptionHub::run_dispatch() {
    while (auto event = dispatch_queue_.pop()) {
        try {
            dispatch(*event);
        } catch (const std::exception& e) {
            std::cerr << "[hub] Dispatch of event " << event->id << " failed: " << e.what() << std::endl;
        }
    }
}

void SubscriptionHub::dispatch(const TicketEvent& event) {
    std::vector<SessionPtr> members;
    {
        std::shared_lock lock(mutex_);
        auto room = rooms_.find(event.ticket_id);
        if (room != rooms_.end()) {
            members.assign(room->second.begin(), room->second.end());
        }
    }
    ++dispatched_events_;
    if (members.empty()) return;

    auto frame = std::make_shared<const std::string>(RealtimeProtocol::encode_event(event));

    for (const auto& session : members) {
        if (session->try_enqueue(frame)) continue;

        if (unregister_session(session)) {
            ++evicted_sessions_;
            std::cerr << "[hub] Evicted slow consumer session=" << session->id()
                      << " user=" << session->user_id().value()
                      << " ticket=" << event.ticket_id << std::endl;
        }
    }
}

std::size_t SubscriptionHub::send_to_user(const UserId& user, const std::string& frame) {
    std::vector<SessionPtr> sessions;
    {
        std::shared_lock lock(mutex_);
        auto it = users_.find(user);
        if (it == users_.end()) return 0;
        sessions.assign(it->second.begin(), it->second.end());
    }

    auto shared = std::make_shared<const std::string>(frame);
    std::size_t delivered = 0;
    for (const auto& session : sessions) {
        if (session->try_enqueue(shared)) ++delivered;
    }
    return delivered;
}

std::size_t SubscriptionHub::session_count() const {
    std::shared_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& [user, members] : users_) count += members.size();
    return count;
}

std::size_t SubscriptionHub::room_count() const {
    std::shared_lock lock(mutex_);
    return rooms_.size();
}

std::size_t SubscriptionHub::room_membership(TicketId ticket_id) const {
    std::shared_lock lock(mutex_);
    auto it = rooms_.find(ticket_id);
    return it == rooms_.end() ? 0 : it->second.size();
}

bool SubscriptionHub::is_user_connected(const UserId& user) const {
    std::shared_lock lock(mutex_);
    return users_.count(user) > 0;
}

} // namespace desk::realtime
