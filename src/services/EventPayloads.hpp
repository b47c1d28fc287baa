#pragma once

#include "domain/aggregates/Comment.hpp"
#include "domain/aggregates/Ticket.hpp"

#include <string>

namespace desk::services {

// JSON snapshots stored as event payloads. camelCase keys, RFC 3339 UTC
// timestamps, absent optionals encoded as null.
class EventPayloads {
public:
    static std::string ticket_snapshot(const desk::domain::Ticket& ticket);
    static std::string comment_snapshot(const desk::domain::Comment& comment);

    // Throw std::invalid_argument on malformed payloads.
    static desk::domain::Ticket parse_ticket(const std::string& payload);
    static desk::domain::Comment parse_comment(const std::string& payload);
};

} // namespace desk::services
