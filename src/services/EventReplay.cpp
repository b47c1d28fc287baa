#include "services/EventReplay.hpp"

#include "services/EventPayloads.hpp"

#include <algorithm>
#include <map>

using namespace desk::domain;

namespace desk::services {

ReplayedState replay_events(std::vector<TicketEvent> events) {
    std::sort(events.begin(), events.end(),
              [](const TicketEvent& a, const TicketEvent& b) { return a.id < b.id; });

    std::map<TicketId, Ticket> tickets;
    std::map<CommentId, Comment> comments;

    for (const auto& event : events) {
        switch (event.type) {
            case EventType::TICKET_CREATED:
            case EventType::STATUS_UPDATED:
            case EventType::TICKET_ASSIGNED: {
                Ticket ticket = EventPayloads::parse_ticket(event.payload);
                tickets.insert_or_assign(ticket.id(), std::move(ticket));
                break;
            }
            case EventType::COMMENT_ADDED: {
                Comment comment = EventPayloads::parse_comment(event.payload);
                comments.insert_or_assign(comment.id(), std::move(comment));
                break;
            }
        }
    }

    ReplayedState state;
    for (auto& [id, ticket] : tickets) state.tickets.push_back(std::move(ticket));
    for (auto& [id, comment] : comments) state.comments.push_back(std::move(comment));
    state.events = std::move(events);
    return state;
}

} // namespace desk::services
