#pragma once

#include "domain/aggregates/Ticket.hpp"

#include <optional>
#include <vector>

namespace desk::repositories {

struct TicketFilter {
    std::optional<desk::domain::TicketStatus> status;
    std::optional<desk::domain::TicketPriority> priority;
    std::optional<desk::domain::UserId> requester_id;  // unset: every requester
    int limit = 50;
    int offset = 0;
};

class ITicketRepository {
public:
    // Assigns the next id and returns the stored ticket.
    virtual desk::domain::Ticket create(const desk::domain::Ticket& ticket) = 0;
    virtual std::optional<desk::domain::Ticket> find_by_id(desk::domain::TicketId id) const = 0;
    // Throws NotFound when no ticket with that id exists.
    virtual desk::domain::Ticket update(const desk::domain::Ticket& ticket) = 0;
    // Newest first.
    virtual std::vector<desk::domain::Ticket> list(const TicketFilter& filter) const = 0;

    virtual ~ITicketRepository() = default;
};

} // namespace desk::repositories
