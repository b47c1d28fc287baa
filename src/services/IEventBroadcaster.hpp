#pragma once

#include "domain/events/TicketEvent.hpp"

namespace desk::services {

// Receives committed events only. Must not block the caller.
class IEventBroadcaster {
public:
    virtual void broadcast(const desk::domain::TicketEvent& event) = 0;
    virtual ~IEventBroadcaster() = default;
};

} // namespace desk::services
