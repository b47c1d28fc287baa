#pragma once

#include "domain/aggregates/Comment.hpp"
#include "domain/aggregates/Ticket.hpp"
#include "domain/events/TicketEvent.hpp"

#include <vector>

namespace desk::services {

struct ReplayedState {
    std::vector<desk::domain::Ticket> tickets;
    std::vector<desk::domain::Comment> comments;
    std::vector<desk::domain::TicketEvent> events;
};

// Rebuilds current rows from archived events. Every payload is a full
// snapshot, so the latest ticket event per ticket is its current state.
ReplayedState replay_events(std::vector<desk::domain::TicketEvent> events);

} // namespace desk::services
