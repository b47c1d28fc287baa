#pragma once

#include "domain/value_objects/Identifiers.hpp"

#include <memory>

namespace desk::realtime {

class ClientSession;

// The part of the hub a session is allowed to call.
class SessionRouter {
public:
    virtual void subscribe(const std::shared_ptr<ClientSession>& session, desk::domain::TicketId ticket_id) = 0;
    virtual void unsubscribe(const std::shared_ptr<ClientSession>& session, desk::domain::TicketId ticket_id) = 0;
    virtual void release(const std::shared_ptr<ClientSession>& session) = 0;
    virtual ~SessionRouter() = default;
};

} // namespace desk::realtime
