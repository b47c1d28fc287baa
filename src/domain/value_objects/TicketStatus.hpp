#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace desk::domain {

enum class TicketStatus { OPEN, IN_PROGRESS, CLOSED };

inline std::optional<TicketStatus> try_parse_ticket_status(const std::string& str) {
    if (str == "OPEN") return TicketStatus::OPEN;
    if (str == "IN_PROGRESS") return TicketStatus::IN_PROGRESS;
    if (str == "CLOSED") return TicketStatus::CLOSED;
    return std::nullopt;
}

inline TicketStatus ticket_status_from_string(const std::string& str) {
    if (auto status = try_parse_ticket_status(str)) return *status;
    throw std::invalid_argument("Invalid ticket status: " + str);
}

inline std::string to_string(TicketStatus status) {
    switch (status) {
        case TicketStatus::OPEN: return "OPEN";
        case TicketStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TicketStatus::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

} // namespace desk::domain
