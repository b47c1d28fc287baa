#pragma once

#include "domain/value_objects/TicketStatus.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace desk::domain {

class DomainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Carries every violated field, not only the first one.
class ValidationError : public DomainError {
public:
    using FieldErrors = std::map<std::string, std::vector<std::string>>;

    explicit ValidationError(FieldErrors errors);

    const FieldErrors& errors() const noexcept { return errors_; }
    bool has_field(const std::string& field) const { return errors_.count(field) > 0; }

private:
    FieldErrors errors_;
};

class AuthorizationDenied : public DomainError {
public:
    explicit AuthorizationDenied(std::string permission);

    const std::string& permission() const noexcept { return permission_; }

private:
    std::string permission_;
};

class NotFound : public DomainError {
public:
    using DomainError::DomainError;
};

class InvalidStateTransition : public DomainError {
public:
    InvalidStateTransition(TicketStatus from, TicketStatus to);

    TicketStatus from() const noexcept { return from_; }
    TicketStatus to() const noexcept { return to_; }

private:
    TicketStatus from_;
    TicketStatus to_;
};

class CannotAssignClosed : public DomainError {
public:
    CannotAssignClosed();
};

// Commit or storage failure. Reported to the caller, never retried by the writer.
class TransientInfraError : public DomainError {
public:
    using DomainError::DomainError;
};

} // namespace desk::domain
