#pragma once

#include "domain/aggregates/Ticket.hpp"
#include "repositories/ITicketRepository.hpp"
#include "repositories/ITransactionManager.hpp"
#include "services/Clock.hpp"
#include "services/IAuthorizer.hpp"
#include "services/INotifier.hpp"
#include "services/OutboxCoordinator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace desk::services {

struct ListTicketsParams {
    desk::domain::UserId viewer_id;
    std::optional<std::string> status;
    std::optional<std::string> priority;
    int limit = 50;
    int offset = 0;
};

class TicketService {
public:
    TicketService(desk::repositories::ITransactionManager& transactions,
                  OutboxCoordinator& outbox,
                  const IAuthorizer& authorizer,
                  INotifier& notifier,
                  Clock clock = &desk::domain::Timestamp::now);

    desk::domain::Ticket create_ticket(const desk::domain::TicketDraft& draft);

    // Owner or assignee may read; anyone else needs tickets:read:all.
    desk::domain::Ticket get_ticket(desk::domain::TicketId id, const desk::domain::UserId& viewer) const;

    desk::domain::Ticket update_status(desk::domain::TicketId id,
                                       desk::domain::TicketStatus status,
                                       const desk::domain::UserId& actor);

    desk::domain::Ticket assign_ticket(desk::domain::TicketId id,
                                       const desk::domain::UserId& assignee,
                                       const desk::domain::UserId& actor);

    // Viewers without tickets:list:all only see tickets they requested.
    std::vector<desk::domain::Ticket> list_tickets(const ListTicketsParams& params) const;

    // Same access rule as get_ticket, without the fetch result.
    bool can_view(desk::domain::TicketId id, const desk::domain::UserId& viewer) const;

private:
    void require(const desk::domain::UserId& actor, const char* permission) const;
    desk::domain::Ticket load(desk::repositories::IUnitOfWork& uow, desk::domain::TicketId id) const;
    void notify_requester(const desk::domain::Ticket& ticket, const desk::domain::UserId& actor);

    desk::repositories::ITransactionManager& transactions_;
    OutboxCoordinator& outbox_;
    const IAuthorizer& authorizer_;
    INotifier& notifier_;
    Clock clock_;
};

} // namespace desk::services
