#pragma once

#include "domain/events/TicketEvent.hpp"

#include <cstddef>
#include <vector>

namespace desk::repositories {

// Append-only. There is deliberately no update or delete.
class IEventLogRepository {
public:
    // The id of `event` is ignored; the stored row carries the next log id.
    virtual desk::domain::TicketEvent append(const desk::domain::TicketEvent& event) = 0;

    // Events of `ticket_id` with id > after_id, ascending by id, at most `limit`.
    virtual std::vector<desk::domain::TicketEvent> list_by_ticket(
        desk::domain::TicketId ticket_id, desk::domain::EventId after_id, std::size_t limit) const = 0;

    virtual ~IEventLogRepository() = default;
};

} // namespace desk::repositories
