#include "infrastructure/BackgroundNotifier.hpp"

#include <iostream>

namespace desk::infrastructure {

BackgroundNotifier::BackgroundNotifier(desk::services::INotifier& inner, std::size_t capacity)
    : inner_(inner)
    , queue_(capacity)
    , worker_([this]() { run(); }) {}

BackgroundNotifier::~BackgroundNotifier() {
    shutdown();
}

void BackgroundNotifier::notify(const desk::services::Notification& notification) {
    if (!queue_.try_push(notification)) {
        ++dropped_;
        std::cerr << "[notify] Queue full, dropping notification for ticket "
                  << notification.ticket_id << std::endl;
    }
}

void BackgroundNotifier::shutdown() {
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BackgroundNotifier::run() {
    while (auto notification = queue_.pop()) {
        try {
            inner_.notify(*notification);
            ++delivered_;
        } catch (const std::exception& e) {
            ++failed_;
            std::cerr << "[notify] Delivery for ticket " << notification->ticket_id
                      << " failed: " << e.what() << std::endl;
        }
    }
}

} // namespace desk::infrastructure
