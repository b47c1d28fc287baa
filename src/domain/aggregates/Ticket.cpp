#include "domain/aggregates/Ticket.hpp"

#include "domain/errors/DomainErrors.hpp"

namespace desk::domain {

Ticket::Ticket(TicketId id, std::string title, std::string description,
               TicketStatus status, TicketPriority priority,
               UserId requester_id, std::optional<UserId> assignee_id,
               Timestamp created_at, std::optional<Timestamp> updated_at,
               std::optional<Timestamp> closed_at)
    : id_(id)
    , title_(std::move(title))
    , description_(std::move(description))
    , status_(status)
    , priority_(priority)
    , requester_id_(std::move(requester_id))
    , assignee_id_(std::move(assignee_id))
    , created_at_(created_at)
    , updated_at_(updated_at)
    , closed_at_(closed_at) {}

Ticket Ticket::create(const TicketDraft& draft, Timestamp now) {
    ValidationError::FieldErrors errors;

    if (draft.title.empty()) {
        errors["title"].push_back("Title is required");
    } else if (draft.title.size() > kMaxTitleLength) {
        errors["title"].push_back("Title must be 255 characters or less");
    }

    if (draft.description.size() > kMaxDescriptionLength) {
        errors["description"].push_back("Description must be 10000 characters or less");
    }

    auto priority = try_parse_ticket_priority(draft.priority);
    if (!priority) {
        errors["priority"].push_back("Priority must be one of LOW, MEDIUM, HIGH");
    }

    if (draft.requester_id.empty()) {
        errors["requesterId"].push_back("Requester ID is required");
    }

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    return Ticket(0, draft.title, draft.description, TicketStatus::OPEN, *priority,
                  UserId(draft.requester_id), std::nullopt,
                  now, std::nullopt, std::nullopt);
}

Ticket Ticket::rehydrate(TicketId id, std::string title, std::string description,
                         TicketStatus status, TicketPriority priority,
                         UserId requester_id, std::optional<UserId> assignee_id,
                         Timestamp created_at, std::optional<Timestamp> updated_at,
                         std::optional<Timestamp> closed_at) {
    return Ticket(id, std::move(title), std::move(description), status, priority,
                  std::move(requester_id), std::move(assignee_id),
                  created_at, updated_at, closed_at);
}

// OPEN <-> IN_PROGRESS, either -> CLOSED. Self transitions and anything
// out of CLOSED are rejected.
bool Ticket::can_transition(TicketStatus from, TicketStatus to) noexcept {
    switch (from) {
        case TicketStatus::OPEN:
            return to == TicketStatus::IN_PROGRESS || to == TicketStatus::CLOSED;
        case TicketStatus::IN_PROGRESS:
            return to == TicketStatus::OPEN || to == TicketStatus::CLOSED;
        case TicketStatus::CLOSED:
            return false;
    }
    return false;
}

Ticket Ticket::with_id(TicketId id) const {
    Ticket copy = *this;
    copy.id_ = id;
    return copy;
}

Ticket Ticket::with_status(TicketStatus next, Timestamp now) const {
    if (!can_transition(status_, next)) {
        throw InvalidStateTransition(status_, next);
    }

    Ticket copy = *this;
    copy.status_ = next;
    copy.updated_at_ = now;
    if (next == TicketStatus::CLOSED) {
        copy.closed_at_ = now;
    }
    return copy;
}

Ticket Ticket::assigned_to(const UserId& assignee, Timestamp now) const {
    if (is_closed()) {
        throw CannotAssignClosed();
    }

    Ticket copy = *this;
    copy.assignee_id_ = assignee;
    copy.updated_at_ = now;
    return copy;
}

} // namespace desk::domain
