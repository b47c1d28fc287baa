#pragma once

#include "domain/value_objects/Identifiers.hpp"
#include "domain/value_objects/TicketPriority.hpp"
#include "domain/value_objects/TicketStatus.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/UserId.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace desk::domain {

// Unvalidated input for Ticket::create. Priority and requester stay raw
// strings so that bad values are reported as field errors.
struct TicketDraft {
    std::string title;
    std::string description;
    std::string priority;
    std::string requester_id;
};

class Ticket {
public:
    static constexpr std::size_t kMaxTitleLength = 255;
    static constexpr std::size_t kMaxDescriptionLength = 10000;

    // Factory. Throws ValidationError listing every invalid field.
    static Ticket create(const TicketDraft& draft, Timestamp now);

    // Rebuilds a ticket from stored state without running validation.
    static Ticket rehydrate(TicketId id, std::string title, std::string description,
                            TicketStatus status, TicketPriority priority,
                            UserId requester_id, std::optional<UserId> assignee_id,
                            Timestamp created_at, std::optional<Timestamp> updated_at,
                            std::optional<Timestamp> closed_at);

    static bool can_transition(TicketStatus from, TicketStatus to) noexcept;

    // Transitions return a new Ticket; the receiver is left untouched.
    Ticket with_id(TicketId id) const;
    Ticket with_status(TicketStatus next, Timestamp now) const;
    Ticket assigned_to(const UserId& assignee, Timestamp now) const;

    TicketId id() const noexcept { return id_; }
    const std::string& title() const noexcept { return title_; }
    const std::string& description() const noexcept { return description_; }
    TicketStatus status() const noexcept { return status_; }
    TicketPriority priority() const noexcept { return priority_; }
    const UserId& requester_id() const noexcept { return requester_id_; }
    const std::optional<UserId>& assignee_id() const noexcept { return assignee_id_; }
    Timestamp created_at() const noexcept { return created_at_; }
    const std::optional<Timestamp>& updated_at() const noexcept { return updated_at_; }
    const std::optional<Timestamp>& closed_at() const noexcept { return closed_at_; }

    bool is_closed() const noexcept { return status_ == TicketStatus::CLOSED; }
    bool is_owned_by(const UserId& user) const noexcept { return requester_id_ == user; }
    bool is_assigned_to(const UserId& user) const noexcept {
        return assignee_id_.has_value() && *assignee_id_ == user;
    }

    bool operator==(const Ticket&) const = default;

private:
    Ticket(TicketId id, std::string title, std::string description,
           TicketStatus status, TicketPriority priority,
           UserId requester_id, std::optional<UserId> assignee_id,
           Timestamp created_at, std::optional<Timestamp> updated_at,
           std::optional<Timestamp> closed_at);

    TicketId id_;
    std::string title_;
    std::string description_;
    TicketStatus status_;
    TicketPriority priority_;
    UserId requester_id_;
    std::optional<UserId> assignee_id_;
    Timestamp created_at_;
    std::optional<Timestamp> updated_at_;
    std::optional<Timestamp> closed_at_;
};

} // namespace desk::domain
