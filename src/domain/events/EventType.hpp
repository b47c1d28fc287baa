#pragma once

#include <stdexcept>
#include <string>

namespace desk::domain {

enum class EventType { TICKET_CREATED, STATUS_UPDATED, TICKET_ASSIGNED, COMMENT_ADDED };

inline EventType event_type_from_string(const std::string& str) {
    if (str == "TICKET_CREATED") return EventType::TICKET_CREATED;
    if (str == "STATUS_UPDATED") return EventType::STATUS_UPDATED;
    if (str == "TICKET_ASSIGNED") return EventType::TICKET_ASSIGNED;
    if (str == "COMMENT_ADDED") return EventType::COMMENT_ADDED;
    throw std::invalid_argument("Invalid event type: " + str);
}

inline std::string to_string(EventType type) {
    switch (type) {
        case EventType::TICKET_CREATED: return "TICKET_CREATED";
        case EventType::STATUS_UPDATED: return "STATUS_UPDATED";
        case EventType::TICKET_ASSIGNED: return "TICKET_ASSIGNED";
        case EventType::COMMENT_ADDED: return "COMMENT_ADDED";
    }
    return "UNKNOWN";
}

} // namespace desk::domain
