#pragma once

#include "domain/events/TicketEvent.hpp"
#include "repositories/ITransactionManager.hpp"
#include "services/Clock.hpp"
#include "services/IEventBroadcaster.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace desk::services {

// The event a mutation wants recorded alongside its own writes.
struct PendingEvent {
    desk::domain::TicketId ticket_id;
    desk::domain::EventType type;
    std::string payload;
    desk::domain::UserId actor_id;
};

// Commits a mutation together with its event row, then hands the committed
// event to the broadcaster. Nothing is broadcast for a rolled back unit.
class OutboxCoordinator {
public:
    using Mutation = std::function<PendingEvent(desk::repositories::IUnitOfWork&)>;

    OutboxCoordinator(desk::repositories::ITransactionManager& transactions,
                      IEventBroadcaster& broadcaster,
                      Clock clock = &desk::domain::Timestamp::now);

    desk::domain::TicketEvent record(const Mutation& mutation);

    uint64_t broadcast_failures() const noexcept { return broadcast_failures_; }

private:
    desk::repositories::ITransactionManager& transactions_;
    IEventBroadcaster& broadcaster_;
    Clock clock_;
    std::atomic<uint64_t> broadcast_failures_{0};
};

} // namespace desk::services
