#pragma once

#include "domain/events/TicketEvent.hpp"

#include <string>

namespace desk::realtime {

enum class ClientMessageType { SubscribeToTicket, UnsubscribeFromTicket, Ping };

struct ClientMessage {
    ClientMessageType type = ClientMessageType::Ping;
    desk::domain::TicketId ticket_id = 0;  // only set for (un)subscribe
};

// JSON text frames exchanged with WebSocket clients.
class RealtimeProtocol {
public:
    // Throws std::invalid_argument for malformed JSON, unknown message types
    // and (un)subscribe requests without a positive payload.ticketId.
    static ClientMessage parse_client_message(const std::string& text);

    // {id, type, payload, ticketId, actorId, createdAt}. The stored payload
    // is embedded as a JSON value, not as a string.
    static std::string encode_event(const desk::domain::TicketEvent& event);
    static std::string encode_pong();

    // Client side, used by the probe tool.
    static std::string encode_subscribe(desk::domain::TicketId ticket_id);
    static std::string encode_unsubscribe(desk::domain::TicketId ticket_id);
    static std::string encode_ping();
};

} // namespace desk::realtime
