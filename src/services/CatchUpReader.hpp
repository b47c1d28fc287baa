#pragma once

#include "config/Settings.hpp"
#include "domain/events/TicketEvent.hpp"
#include "repositories/ITransactionManager.hpp"
#include "services/TicketService.hpp"

#include <optional>
#include <vector>

namespace desk::services {

struct EventPage {
    std::vector<desk::domain::TicketEvent> events;
    // Id of the last event in `events`; absent when the page is empty.
    std::optional<desk::domain::EventId> next_cursor;
};

// Serves missed events to a client that reconnects with its last seen id.
class CatchUpReader {
public:
    CatchUpReader(desk::repositories::ITransactionManager& transactions,
                  const TicketService& tickets,
                  const desk::config::CatchUpSettings& settings);

    // after_id <= 0 reads from the start. limit <= 0 selects the default
    // page size; larger limits are clamped to the configured maximum.
    EventPage read(const desk::domain::UserId& viewer,
                   desk::domain::TicketId ticket_id,
                   desk::domain::EventId after_id = 0,
                   int limit = 0) const;

    int effective_limit(int requested) const noexcept;

private:
    desk::repositories::ITransactionManager& transactions_;
    const TicketService& tickets_;
    desk::config::CatchUpSettings settings_;
};

} // namespace desk::services
