#pragma once

#include "services/INotifier.hpp"

#include <iostream>

namespace desk::infrastructure {

// Writes notifications to a stream instead of delivering them.
class LoggingNotifier : public desk::services::INotifier {
public:
    explicit LoggingNotifier(std::ostream& out = std::cout) : out_(out) {}

    void notify(const desk::services::Notification& notification) override {
        out_ << "[notify] to=" << notification.recipient.value()
             << " ticket=" << notification.ticket_id
             << " subject=\"" << notification.subject << "\"" << std::endl;
    }

private:
    std::ostream& out_;
};

} // namespace desk::infrastructure
