#pragma once

#include "domain/value_objects/Identifiers.hpp"
#include "domain/value_objects/UserId.hpp"

#include <string>

namespace desk::services {

struct Notification {
    desk::domain::UserId recipient;
    std::string subject;
    std::string message;
    desk::domain::TicketId ticket_id;
};

class INotifier {
public:
    virtual void notify(const Notification& notification) = 0;
    virtual ~INotifier() = default;
};

} // namespace desk::services
