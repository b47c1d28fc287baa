#pragma once

#include "domain/events/EventType.hpp"
#include "domain/value_objects/Identifiers.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/UserId.hpp"

#include <string>

namespace desk::domain {

// One row of the event log. `payload` is the JSON snapshot of the ticket or
// comment as it was after the mutation; it is never rewritten.
struct TicketEvent {
    EventId id;
    TicketId ticket_id;
    EventType type;
    std::string payload;
    UserId actor_id;
    Timestamp created_at;

    bool operator==(const TicketEvent&) const = default;
};

} // namespace desk::domain
