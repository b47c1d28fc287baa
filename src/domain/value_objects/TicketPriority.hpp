#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace desk::domain {

enum class TicketPriority { LOW, MEDIUM, HIGH };

inline std::optional<TicketPriority> try_parse_ticket_priority(const std::string& str) {
    if (str == "LOW") return TicketPriority::LOW;
    if (str == "MEDIUM") return TicketPriority::MEDIUM;
    if (str == "HIGH") return TicketPriority::HIGH;
    return std::nullopt;
}

inline TicketPriority ticket_priority_from_string(const std::string& str) {
    if (auto priority = try_parse_ticket_priority(str)) return *priority;
    throw std::invalid_argument("Invalid ticket priority: " + str);
}

inline std::string to_string(TicketPriority priority) {
    switch (priority) {
        case TicketPriority::LOW: return "LOW";
        case TicketPriority::MEDIUM: return "MEDIUM";
        case TicketPriority::HIGH: return "HIGH";
    }
    return "UNKNOWN";
}

} // namespace desk::domain
