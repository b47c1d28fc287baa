#include "realtime/RealtimeProtocol.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;
using namespace desk::domain;

namespace desk::realtime {

namespace {

TicketId parse_ticket_id(const json& obj) {
    if (!obj.contains("payload") || !obj["payload"].is_object()) {
        throw std::invalid_argument("Missing payload");
    }
    const auto& payload = obj["payload"];
    if (!payload.contains("ticketId") || !payload["ticketId"].is_number_integer()) {
        throw std::invalid_argument("Missing or non-integer payload.ticketId");
    }
    auto ticket_id = payload["ticketId"].get<TicketId>();
    if (ticket_id <= 0) {
        throw std::invalid_argument("Invalid ticket ID: " + std::to_string(ticket_id));
    }
    return ticket_id;
}

std::string encode_ticket_request(const char* type, TicketId ticket_id) {
    return json{{"type", type}, {"payload", {{"ticketId", ticket_id}}}}.dump();
}

} // namespace

ClientMessage RealtimeProtocol::parse_client_message(const std::string& text) {
    auto obj = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!obj.is_object()) {
        throw std::invalid_argument("Client message is not a JSON object");
    }
    if (!obj.contains("type") || !obj["type"].is_string()) {
        throw std::invalid_argument("Client message has no type");
    }

    auto type = obj["type"].get<std::string>();
    if (type == "SUBSCRIBE_TO_TICKET") {
        return ClientMessage{ClientMessageType::SubscribeToTicket, parse_ticket_id(obj)};
    }
    if (type == "UNSUBSCRIBE_FROM_TICKET") {
        return ClientMessage{ClientMessageType::UnsubscribeFromTicket, parse_ticket_id(obj)};
    }
    if (type == "PING") {
        return ClientMessage{ClientMessageType::Ping};
    }
    throw std::invalid_argument("Unknown message type: " + type);
}

std::string RealtimeProtocol::encode_event(const TicketEvent& event) {
    auto payload = json::parse(event.payload, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded()) {
        payload = event.payload;
    }

    json frame = {
        {"id", event.id},
        {"type", to_string(event.type)},
        {"payload", std::move(payload)},
        {"ticketId", event.ticket_id},
        {"actorId", event.actor_id.value()},
        {"createdAt", event.created_at.to_iso8601()},
    };
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RealtimeProtocol::encode_pong() {
    return R"({"type":"PONG"})";
}

std::string RealtimeProtocol::encode_subscribe(TicketId ticket_id) {
    return encode_ticket_request("SUBSCRIBE_TO_TICKET", ticket_id);
}

std::string RealtimeProtocol::encode_unsubscribe(TicketId ticket_id) {
    return encode_ticket_request("UNSUBSCRIBE_FROM_TICKET", ticket_id);
}

std::string RealtimeProtocol::encode_ping() {
    return R"({"type":"PING"})";
}

} // namespace desk::realtime
