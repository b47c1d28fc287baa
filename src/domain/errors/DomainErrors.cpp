#include "domain/errors/DomainErrors.hpp"

namespace desk::domain {

namespace {

std::string summarize(const ValidationError::FieldErrors& errors) {
    std::string message = "validation failed:";
    for (const auto& [field, messages] : errors) {
        for (const auto& m : messages) {
            message += " " + field + ": " + m + ";";
        }
    }
    return message;
}

} // namespace

ValidationError::ValidationError(FieldErrors errors)
    : DomainError(summarize(errors))
    , errors_(std::move(errors)) {}

AuthorizationDenied::AuthorizationDenied(std::string permission)
    : DomainError("action forbidden: missing permission " + permission)
    , permission_(std::move(permission)) {}

InvalidStateTransition::InvalidStateTransition(TicketStatus from, TicketStatus to)
    : DomainError("invalid status transition: " + to_string(from) + " -> " + to_string(to))
    , from_(from)
    , to_(to) {}

CannotAssignClosed::CannotAssignClosed()
    : DomainError("cannot assign a closed ticket") {}

} // namespace desk::domain
