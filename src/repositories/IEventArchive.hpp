#pragma once

#include "domain/events/TicketEvent.hpp"

#include <vector>

namespace desk::repositories {

// Durable copy of committed events. `archive` runs as part of the commit, so
// throwing from it fails the transaction.
class IEventArchive {
public:
    virtual void archive(const std::vector<desk::domain::TicketEvent>& events) = 0;
    virtual std::vector<desk::domain::TicketEvent> load_all() const = 0;

    virtual ~IEventArchive() = default;
};

} // namespace desk::repositories
