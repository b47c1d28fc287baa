#include "realtime/ClientSession.hpp"

#include "realtime/RealtimeProtocol.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace desk::domain;

namespace desk::realtime {

namespace {

constexpr int kNormalClosure = 1000;

} // namespace

SessionLimits SessionLimits::from_settings(const desk::config::RealtimeSettings& settings) {
    SessionLimits limits;
    limits.read_timeout = std::chrono::seconds(settings.read_timeout_seconds);
    limits.ping_interval = std::chrono::seconds(settings.ping_interval_seconds);
    limits.write_timeout = std::chrono::seconds(settings.write_timeout_seconds);
    limits.max_message_bytes = static_cast<std::size_t>(settings.max_message_bytes);
    limits.outbound_capacity = static_cast<std::size_t>(settings.outbound_queue_capacity);
    return limits;
}

ClientSession::ClientSession(std::string id,
                             UserId user_id,
                             std::shared_ptr<IConnection> connection,
                             SessionRouter& router,
                             SessionLimits limits)
    : id_(std::move(id))
    , user_id_(std::move(user_id))
    , connection_(std::move(connection))
    , router_(router)
    , limits_(limits)
    , outbound_(limits.outbound_capacity)
    , last_read_(SteadyClock::now().time_since_epoch().count()) {
    if (limits_.ping_interval >= limits_.read_timeout) {
        throw std::invalid_argument("ping interval must be shorter than the read timeout");
    }
}

ClientSession::~ClientSession() {
    if (!outbound_thread_.joinable()) return;
    if (outbound_thread_.get_id() == std::this_thread::get_id()) {
        // Last reference dropped by the outbound thread itself on exit.
        outbound_thread_.detach();
    } else {
        outbound_.close();
        outbound_thread_.join();
    }
}

void ClientSession::start() {
    auto self = shared_from_this();
    outbound_thread_ = std::thread([self]() { self->run_outbound(); });
}

void ClientSession::join() {
    if (outbound_thread_.joinable() && outbound_thread_.get_id() != std::this_thread::get_id()) {
        outbound_thread_.join();
    }
}

void ClientSession::touch() {
    last_read_ = SteadyClock::now().time_since_epoch().count();
}

ClientSession::SteadyClock::time_point ClientSession::read_deadline() const {
    SteadyClock::time_point last_read{SteadyClock::duration(last_read_.load())};
    return last_read + limits_.read_timeout;
}

void ClientSession::on_frame(const std::string& text) {
    touch();

    if (text.size() > limits_.max_message_bytes) {
        std::cerr << "[session] " << id_ << " frame of " << text.size()
                  << " bytes exceeds limit " << limits_.max_message_bytes << std::endl;
        disconnect("message too large");
        return;
    }

    ClientMessage message;
    try {
        message = RealtimeProtocol::parse_client_message(text);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[session] " << id_ << " ignoring client message: " << e.what() << std::endl;
        return;
    }

    switch (message.type) {
        case ClientMessageType::SubscribeToTicket:
            router_.subscribe(shared_from_this(), message.ticket_id);
            break;
        case ClientMessageType::UnsubscribeFromTicket:
            router_.unsubscribe(shared_from_this(), message.ticket_id);
            break;
        case ClientMessageType::Ping:
            // Skipped when the queue is full; the client will ping again.
            try_enqueue(std::make_shared<const std::string>(RealtimeProtocol::encode_pong()));
            break;
    }
}

bool ClientSession::try_enqueue(Frame frame) {
    return outbound_.try_push(std::move(frame));
}

bool ClientSession::close_outbound(const std::string& reason) {
    {
        std::lock_guard lock(mutex_);
        if (close_reason_.empty()) close_reason_ = reason;
    }
    return outbound_.close();
}

void ClientSession::disconnect(const std::string& reason) {
    if (released_.exchange(true)) return;

    {
        std::lock_guard lock(mutex_);
        if (close_reason_.empty()) close_reason_ = reason;
    }
    std::cout << "[session] " << id_ << " user=" << user_id_.value()
              << " disconnecting: " << reason << std::endl;
    router_.release(shared_from_this());
}

bool ClientSession::add_subscription(TicketId ticket_id) {
    std::lock_guard lock(mutex_);
    return subscriptions_.insert(ticket_id).second;
}

bool ClientSession::remove_subscription(TicketId ticket_id) {
    std::lock_guard lock(mutex_);
    return subscriptions_.erase(ticket_id) > 0;
}

bool ClientSession::is_subscribed(TicketId ticket_id) const {
    std::lock_guard lock(mutex_);
    return subscriptions_.count(ticket_id) > 0;
}

std::set<TicketId> ClientSession::subscriptions() const {
    std::lock_guard lock(mutex_);
    return subscriptions_;
}

void ClientSession::run_outbound() {
    auto next_ping = SteadyClock::now() + limits_.ping_interval;
    bool writable = true;

    while (true) {
        auto now = SteadyClock::now();

        if (writable && now >= read_deadline()) {
            writable = false;
            disconnect("read deadline expired");
        }
        if (writable && now >= next_ping) {
            if (!connection_->ping()) {
                writable = false;
                disconnect("ping failed");
            }
            next_ping = now + limits_.ping_interval;
        }

        auto wake = writable ? std::min(next_ping, read_deadline()) : now + limits_.write_timeout;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(wake - now);
        wait = std::max(wait, std::chrono::milliseconds(1));

        Frame frame;
        auto status = outbound_.pop_for(wait, frame);
        if (status == PopStatus::Closed) break;
        if (status == PopStatus::Timeout) continue;

        if (writable && !connection_->send_text(*frame, limits_.write_timeout)) {
            writable = false;
            disconnect("write failed");
        }
    }

    std::string reason;
    {
        std::lock_guard lock(mutex_);
        reason = close_reason_;
    }
    connection_->close(kNormalClosure, reason);
}

} // namespace desk::realtime
