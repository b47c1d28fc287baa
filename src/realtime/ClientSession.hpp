#pragma once

#include "config/Settings.hpp"
#include "domain/value_objects/Identifiers.hpp"
#include "domain/value_objects/UserId.hpp"
#include "realtime/BoundedQueue.hpp"
#include "realtime/IConnection.hpp"
#include "realtime/SessionRouter.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace desk::realtime {

// Encoded once per event and shared by every recipient queue.
using Frame = std::shared_ptr<const std::string>;

struct SessionLimits {
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds ping_interval{54000};
    std::chrono::milliseconds write_timeout{10000};
    std::size_t max_message_bytes = 1024;
    std::size_t outbound_capacity = 256;

    static SessionLimits from_settings(const desk::config::RealtimeSettings& settings);
};

// One authenticated WebSocket connection. Inbound frames arrive on the
// library's read thread through on_frame(); a dedicated outbound thread
// drains the queue to the connection, pings, and enforces the read deadline.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    ClientSession(std::string id,
                  desk::domain::UserId user_id,
                  std::shared_ptr<IConnection> connection,
                  SessionRouter& router,
                  SessionLimits limits = {});
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Spawns the outbound thread. The session must already be owned by a
    // shared_ptr; the thread keeps it alive until the queue is closed.
    void start();
    // Blocks until the outbound thread has finished. No-op on that thread.
    void join();

    // Inbound side
    void on_frame(const std::string& text);
    void touch();

    // Outbound side
    bool try_enqueue(Frame frame);
    bool close_outbound(const std::string& reason = "session closed");

    // Asks the router to release this session. Only the first call has an effect.
    void disconnect(const std::string& reason);

    // Subscription set, maintained by the router.
    bool add_subscription(desk::domain::TicketId ticket_id);
    bool remove_subscription(desk::domain::TicketId ticket_id);
    bool is_subscribed(desk::domain::TicketId ticket_id) const;
    std::set<desk::domain::TicketId> subscriptions() const;

    const std::string& id() const noexcept { return id_; }
    const desk::domain::UserId& user_id() const noexcept { return user_id_; }
    std::size_t outbound_depth() const { return outbound_.size(); }
    bool outbound_closed() const { return outbound_.closed(); }
    bool disconnect_requested() const noexcept { return released_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    void run_outbound();
    SteadyClock::time_point read_deadline() const;

    const std::string id_;
    const desk::domain::UserId user_id_;
    std::shared_ptr<IConnection> connection_;
    SessionRouter& router_;
    const SessionLimits limits_;

    BoundedQueue<Frame> outbound_;
    std::atomic<SteadyClock::rep> last_read_;
    std::atomic<bool> released_{false};

    mutable std::mutex mutex_;
    std::set<desk::domain::TicketId> subscriptions_;
    std::string close_reason_;

    std::thread outbound_thread_;
};

} // namespace desk::realtime
