#include "services/TicketService.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "services/EventPayloads.hpp"

#include <iostream>

using namespace desk::domain;
using desk::repositories::IUnitOfWork;

namespace desk::services {

TicketService::TicketService(desk::repositories::ITransactionManager& transactions,
                             OutboxCoordinator& outbox,
                             const IAuthorizer& authorizer,
                             INotifier& notifier,
                             Clock clock)
    : transactions_(transactions)
    , outbox_(outbox)
    , authorizer_(authorizer)
    , notifier_(notifier)
    , clock_(std::move(clock)) {}

void TicketService::require(const UserId& actor, const char* permission) const {
    if (!authorizer_.can(actor, permission)) {
        throw AuthorizationDenied(permission);
    }
}

Ticket TicketService::load(IUnitOfWork& uow, TicketId id) const {
    auto ticket = uow.tickets().find_by_id(id);
    if (!ticket) {
        throw NotFound("ticket " + std::to_string(id) + " not found");
    }
    return *ticket;
}

Ticket TicketService::create_ticket(const TicketDraft& draft) {
    if (!draft.requester_id.empty()) {
        require(UserId(draft.requester_id), permissions::TICKETS_CREATE);
    }

    Ticket ticket = Ticket::create(draft, clock_());
    std::optional<Ticket> stored;

    outbox_.record([&](IUnitOfWork& uow) {
        stored = uow.tickets().create(ticket);
        return PendingEvent{stored->id(), EventType::TICKET_CREATED,
                            EventPayloads::ticket_snapshot(*stored), stored->requester_id()};
    });

    std::cout << "[tickets] Created ticket " << stored->id()
              << " requester=" << stored->requester_id().value() << std::endl;
    return *stored;
}

Ticket TicketService::get_ticket(TicketId id, const UserId& viewer) const {
    require(viewer, permissions::TICKETS_READ);

    std::optional<Ticket> ticket;
    transactions_.with_transaction([&](IUnitOfWork& uow) {
        ticket = load(uow, id);
    });

    if (!ticket->is_owned_by(viewer) && !ticket->is_assigned_to(viewer)) {
        require(viewer, permissions::TICKETS_READ_ALL);
    }
    return *ticket;
}

bool TicketService::can_view(TicketId id, const UserId& viewer) const {
    try {
        get_ticket(id, viewer);
        return true;
    } catch (const AuthorizationDenied&) {
        return false;
    } catch (const NotFound&) {
        return false;
    }
}

Ticket TicketService::update_status(TicketId id, TicketStatus status, const UserId& actor) {
    require(actor, permissions::TICKETS_UPDATE_STATUS);

    std::optional<Ticket> updated;
    outbox_.record([&](IUnitOfWork& uow) {
        Ticket current = load(uow, id);
        updated = uow.tickets().update(current.with_status(status, clock_()));
        return PendingEvent{id, EventType::STATUS_UPDATED,
                            EventPayloads::ticket_snapshot(*updated), actor};
    });

    notify_requester(*updated, actor);
    return *updated;
}

Ticket TicketService::assign_ticket(TicketId id, const UserId& assignee, const UserId& actor) {
    require(actor, permissions::TICKETS_ASSIGN);

    std::optional<Ticket> updated;
    outbox_.record([&](IUnitOfWork& uow) {
        Ticket current = load(uow, id);
        updated = uow.tickets().update(current.assigned_to(assignee, clock_()));
        return PendingEvent{id, EventType::TICKET_ASSIGNED,
                            EventPayloads::ticket_snapshot(*updated), actor};
    });
    return *updated;
}

std::vector<Ticket> TicketService::list_tickets(const ListTicketsParams& params) const {
    desk::repositories::TicketFilter filter;
    filter.limit = params.limit;
    filter.offset = params.offset;

    ValidationError::FieldErrors errors;
    if (params.status) {
        filter.status = try_parse_ticket_status(*params.status);
        if (!filter.status) errors["status"].push_back("Status must be one of OPEN, IN_PROGRESS, CLOSED");
    }
    if (params.priority) {
        filter.priority = try_parse_ticket_priority(*params.priority);
        if (!filter.priority) errors["priority"].push_back("Priority must be one of LOW, MEDIUM, HIGH");
    }
    if (params.limit <= 0) errors["limit"].push_back("Limit must be positive");
    if (params.offset < 0) errors["offset"].push_back("Offset must not be negative");
    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    if (!authorizer_.can(params.viewer_id, permissions::TICKETS_LIST_ALL)) {
        filter.requester_id = params.viewer_id;
    }

    std::vector<Ticket> tickets;
    transactions_.with_transaction([&](IUnitOfWork& uow) {
        tickets = uow.tickets().list(filter);
    });
    return tickets;
}

void TicketService::notify_requester(const Ticket& ticket, const UserId& actor) {
    if (ticket.is_owned_by(actor)) return;

    try {
        notifier_.notify(Notification{
            ticket.requester_id(),
            "Your ticket status has been updated: #" + std::to_string(ticket.id()),
            "The status of your ticket '" + ticket.title() + "' was changed to "
                + to_string(ticket.status()) + ".",
            ticket.id(),
        });
    } catch (const std::exception& e) {
        std::cerr << "[tickets] Notification for ticket " << ticket.id()
                  << " failed: " << e.what() << std::endl;
    }
}

} // namespace desk::services
