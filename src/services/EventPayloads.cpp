#include "services/EventPayloads.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;
using namespace desk::domain;

namespace desk::services {

namespace {

json optional_timestamp(const std::optional<Timestamp>& ts) {
    return ts ? json(ts->to_iso8601()) : json(nullptr);
}

std::optional<Timestamp> parse_optional_timestamp(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return Timestamp::from_iso8601(obj[key].get<std::string>());
}

json parse_object(const std::string& payload) {
    auto obj = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (!obj.is_object()) {
        throw std::invalid_argument("Payload is not a JSON object");
    }
    return obj;
}

} // namespace

std::string EventPayloads::ticket_snapshot(const Ticket& ticket) {
    json obj = {
        {"id", ticket.id()},
        {"title", ticket.title()},
        {"description", ticket.description()},
        {"status", to_string(ticket.status())},
        {"priority", to_string(ticket.priority())},
        {"requesterId", ticket.requester_id().value()},
        {"assigneeId", ticket.assignee_id() ? json(ticket.assignee_id()->value()) : json(nullptr)},
        {"createdAt", ticket.created_at().to_iso8601()},
        {"updatedAt", optional_timestamp(ticket.updated_at())},
        {"closedAt", optional_timestamp(ticket.closed_at())},
    };
    return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string EventPayloads::comment_snapshot(const Comment& comment) {
    json obj = {
        {"id", std::to_string(comment.id())},
        {"ticketId", comment.ticket_id()},
        {"authorId", comment.author_id().value()},
        {"body", comment.body()},
        {"createdAt", comment.created_at().to_iso8601()},
    };
    return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

Ticket EventPayloads::parse_ticket(const std::string& payload) {
    auto obj = parse_object(payload);
    try {
        std::optional<UserId> assignee;
        if (obj.contains("assigneeId") && !obj["assigneeId"].is_null()) {
            assignee = UserId(obj["assigneeId"].get<std::string>());
        }
        return Ticket::rehydrate(
            obj.at("id").get<TicketId>(),
            obj.at("title").get<std::string>(),
            obj.value("description", ""),
            ticket_status_from_string(obj.at("status").get<std::string>()),
            ticket_priority_from_string(obj.at("priority").get<std::string>()),
            UserId(obj.at("requesterId").get<std::string>()),
            std::move(assignee),
            Timestamp::from_iso8601(obj.at("createdAt").get<std::string>()),
            parse_optional_timestamp(obj, "updatedAt"),
            parse_optional_timestamp(obj, "closedAt"));
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed ticket payload: ") + e.what());
    }
}

Comment EventPayloads::parse_comment(const std::string& payload) {
    auto obj = parse_object(payload);
    try {
        return Comment::rehydrate(
            std::stoll(obj.at("id").get<std::string>()),
            obj.at("ticketId").get<TicketId>(),
            UserId(obj.at("authorId").get<std::string>()),
            obj.at("body").get<std::string>(),
            Timestamp::from_iso8601(obj.at("createdAt").get<std::string>()));
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed comment payload: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw std::invalid_argument(std::string("Malformed comment payload: ") + e.what());
    }
}

} // namespace desk::services
