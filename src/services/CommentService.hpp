#pragma once

#include "domain/aggregates/Comment.hpp"
#include "services/IAuthorizer.hpp"
#include "services/INotifier.hpp"
#include "services/OutboxCoordinator.hpp"
#include "services/TicketService.hpp"

#include <string>
#include <vector>

namespace desk::services {

class CommentService {
public:
    CommentService(desk::repositories::ITransactionManager& transactions,
                   OutboxCoordinator& outbox,
                   const TicketService& tickets,
                   const IAuthorizer& authorizer,
                   INotifier& notifier,
                   Clock clock = &desk::domain::Timestamp::now);

    desk::domain::Comment add_comment(desk::domain::TicketId ticket_id,
                                      const desk::domain::UserId& author,
                                      const std::string& body);

    std::vector<desk::domain::Comment> list_comments(desk::domain::TicketId ticket_id,
                                                     const desk::domain::UserId& viewer) const;

private:
    desk::repositories::ITransactionManager& transactions_;
    OutboxCoordinator& outbox_;
    const TicketService& tickets_;
    const IAuthorizer& authorizer_;
    INotifier& notifier_;
    Clock clock_;
};

} // namespace desk::services
