#include "domain/aggregates/Comment.hpp"

#include "domain/errors/DomainErrors.hpp"

namespace desk::domain {

Comment::Comment(CommentId id, TicketId ticket_id, UserId author_id,
                 std::string body, Timestamp created_at)
    : id_(id)
    , ticket_id_(ticket_id)
    , author_id_(std::move(author_id))
    , body_(std::move(body))
    , created_at_(created_at) {}

Comment Comment::create(const CommentDraft& draft, Timestamp now) {
    ValidationError::FieldErrors errors;

    if (draft.ticket_id <= 0) {
        errors["ticketId"].push_back("Ticket ID is required");
    }
    if (draft.author_id.empty()) {
        errors["authorId"].push_back("Author ID is required");
    }
    if (draft.body.empty()) {
        errors["body"].push_back("Comment body is required");
    } else if (draft.body.size() > kMaxBodyLength) {
        errors["body"].push_back("Comment body must be 5000 characters or less");
    }

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }

    return Comment(0, draft.ticket_id, UserId(draft.author_id), draft.body, now);
}

Comment Comment::rehydrate(CommentId id, TicketId ticket_id, UserId author_id,
                           std::string body, Timestamp created_at) {
    return Comment(id, ticket_id, std::move(author_id), std::move(body), created_at);
}

Comment Comment::with_id(CommentId id) const {
    Comment copy = *this;
    copy.id_ = id;
    return copy;
}

} // namespace desk::domain
