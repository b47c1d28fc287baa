#include "services/CommentService.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "services/EventPayloads.hpp"

#include <iostream>
#include <optional>

using namespace desk::domain;
using desk::repositories::IUnitOfWork;

namespace desk::services {

CommentService::CommentService(desk::repositories::ITransactionManager& transactions,
                               OutboxCoordinator& outbox,
                               const TicketService& tickets,
                               const IAuthorizer& authorizer,
                               INotifier& notifier,
                               Clock clock)
    : transactions_(transactions)
    , outbox_(outbox)
    , tickets_(tickets)
    , authorizer_(authorizer)
    , notifier_(notifier)
    , clock_(std::move(clock)) {}

Comment CommentService::add_comment(TicketId ticket_id, const UserId& author, const std::string& body) {
    if (!authorizer_.can(author, permissions::COMMENTS_CREATE)) {
        throw AuthorizationDenied(permissions::COMMENTS_CREATE);
    }

    // Throws NotFound or AuthorizationDenied when the author cannot see the ticket.
    Ticket ticket = tickets_.get_ticket(ticket_id, author);
    Comment comment = Comment::create(CommentDraft{ticket_id, author.value(), body}, clock_());

    std::optional<Comment> stored;
    outbox_.record([&](IUnitOfWork& uow) {
        stored = uow.comments().create(comment);
        return PendingEvent{ticket_id, EventType::COMMENT_ADDED,
                            EventPayloads::comment_snapshot(*stored), author};
    });

    if (!ticket.is_owned_by(author)) {
        try {
            notifier_.notify(Notification{
                ticket.requester_id(),
                "A new comment was added to your ticket: #" + std::to_string(ticket.id()),
                "A new comment has been added to your ticket '" + ticket.title() + "'.",
                ticket.id(),
            });
        } catch (const std::exception& e) {
            std::cerr << "[comments] Notification for ticket " << ticket.id()
                      << " failed: " << e.what() << std::endl;
        }
    }

    return *stored;
}

std::vector<Comment> CommentService::list_comments(TicketId ticket_id, const UserId& viewer) const {
    if (!authorizer_.can(viewer, permissions::COMMENTS_READ)) {
        throw AuthorizationDenied(permissions::COMMENTS_READ);
    }
    tickets_.get_ticket(ticket_id, viewer);

    std::vector<Comment> comments;
    transactions_.with_transaction([&](IUnitOfWork& uow) {
        comments = uow.comments().list_by_ticket(ticket_id);
    });
    return comments;
}

} // namespace desk::services
