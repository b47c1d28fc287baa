#pragma once

#include "domain/aggregates/Comment.hpp"

#include <vector>

namespace desk::repositories {

class ICommentRepository {
public:
    virtual desk::domain::Comment create(const desk::domain::Comment& comment) = 0;
    // Oldest first.
    virtual std::vector<desk::domain::Comment> list_by_ticket(desk::domain::TicketId ticket_id) const = 0;

    virtual ~ICommentRepository() = default;
};

} // namespace desk::repositories
