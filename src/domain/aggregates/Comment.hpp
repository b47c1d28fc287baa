#pragma once

#include "domain/value_objects/Identifiers.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/UserId.hpp"

#include <cstddef>
#include <string>

namespace desk::domain {

struct CommentDraft {
    TicketId ticket_id = 0;
    std::string author_id;
    std::string body;
};

class Comment {
public:
    static constexpr std::size_t kMaxBodyLength = 5000;

    // Factory. Throws ValidationError listing every invalid field.
    static Comment create(const CommentDraft& draft, Timestamp now);

    static Comment rehydrate(CommentId id, TicketId ticket_id, UserId author_id,
                             std::string body, Timestamp created_at);

    Comment with_id(CommentId id) const;

    CommentId id() const noexcept { return id_; }
    TicketId ticket_id() const noexcept { return ticket_id_; }
    const UserId& author_id() const noexcept { return author_id_; }
    const std::string& body() const noexcept { return body_; }
    Timestamp created_at() const noexcept { return created_at_; }

    bool operator==(const Comment&) const = default;

private:
    Comment(CommentId id, TicketId ticket_id, UserId author_id,
            std::string body, Timestamp created_at);

    CommentId id_;
    TicketId ticket_id_;
    UserId author_id_;
    std::string body_;
    Timestamp created_at_;
};

} // namespace desk::domain
