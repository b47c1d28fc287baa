#include "services/OutboxCoordinator.hpp"

#include <iostream>
#include <optional>

using namespace desk::domain;

namespace desk::services {

OutboxCoordinator::OutboxCoordinator(desk::repositories::ITransactionManager& transactions,
                                     IEventBroadcaster& broadcaster,
                                     Clock clock)
    : transactions_(transactions)
    , broadcaster_(broadcaster)
    , clock_(std::move(clock)) {}

TicketEvent OutboxCoordinator::record(const Mutation& mutation) {
    std::optional<TicketEvent> committed;

    transactions_.with_transaction([&](desk::repositories::IUnitOfWork& uow) {
        PendingEvent pending = mutation(uow);
        committed = uow.events().append(TicketEvent{
            0, pending.ticket_id, pending.type, std::move(pending.payload),
            std::move(pending.actor_id), clock_()});
    });

    // Live delivery is best effort; the row is already durable.
    try {
        broadcaster_.broadcast(*committed);
    } catch (const std::exception& e) {
        ++broadcast_failures_;
        std::cerr << "[outbox] Broadcast of event " << committed->id
                  << " failed: " << e.what() << std::endl;
    }

    return *committed;
}

} // namespace desk::services
