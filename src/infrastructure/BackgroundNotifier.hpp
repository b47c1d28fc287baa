#pragma once

#include "realtime/BoundedQueue.hpp"
#include "services/INotifier.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace desk::infrastructure {

// Moves delivery off the request thread. notify() only enqueues; a full
// queue drops the notification.
class BackgroundNotifier : public desk::services::INotifier {
public:
    BackgroundNotifier(desk::services::INotifier& inner, std::size_t capacity);
    ~BackgroundNotifier() override;

    void notify(const desk::services::Notification& notification) override;

    // Delivers what is queued, then stops the worker. Idempotent.
    void shutdown();

    uint64_t delivered() const noexcept { return delivered_; }
    uint64_t dropped() const noexcept { return dropped_; }
    uint64_t failed() const noexcept { return failed_; }

private:
    void run();

    desk::services::INotifier& inner_;
    desk::realtime::BoundedQueue<desk::services::Notification> queue_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_{0};
    std::thread worker_;
};

} // namespace desk::infrastructure
