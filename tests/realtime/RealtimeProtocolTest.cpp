#include "realtime/RealtimeProtocol.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace desk::domain;
using namespace desk::realtime;

// --- Client messages ---

TEST(RealtimeProtocol, ParsesSubscribe) {
    auto msg = RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":42}})");
    EXPECT_EQ(msg.type, ClientMessageType::SubscribeToTicket);
    EXPECT_EQ(msg.ticket_id, 42);
}

TEST(RealtimeProtocol, ParsesUnsubscribe) {
    auto msg = RealtimeProtocol::parse_client_message(
        R"({"type":"UNSUBSCRIBE_FROM_TICKET","payload":{"ticketId":7}})");
    EXPECT_EQ(msg.type, ClientMessageType::UnsubscribeFromTicket);
    EXPECT_EQ(msg.ticket_id, 7);
}

TEST(RealtimeProtocol, ParsesPingWithoutPayload) {
    auto msg = RealtimeProtocol::parse_client_message(R"({"type":"PING"})");
    EXPECT_EQ(msg.type, ClientMessageType::Ping);
}

TEST(RealtimeProtocol, RejectsMalformedJson) {
    EXPECT_THROW(RealtimeProtocol::parse_client_message("{not json"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message("[1,2]"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(""), std::invalid_argument);
}

TEST(RealtimeProtocol, RejectsUnknownOrMissingType) {
    EXPECT_THROW(RealtimeProtocol::parse_client_message(R"({"type":"SHUTDOWN"})"),
                 std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(R"({"payload":{"ticketId":1}})"),
                 std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(R"({"type":5})"),
                 std::invalid_argument);
}

TEST(RealtimeProtocol, RejectsBadTicketIds) {
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":0}})"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":-3}})"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":"42"}})"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET","payload":{"ticketId":4.5}})"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"UNSUBSCRIBE_FROM_TICKET","payload":{}})"), std::invalid_argument);
    EXPECT_THROW(RealtimeProtocol::parse_client_message(
        R"({"type":"SUBSCRIBE_TO_TICKET"})"), std::invalid_argument);
}

// --- Server frames ---

TEST(RealtimeProtocol, EncodesEventWithEmbeddedPayload) {
    TicketEvent event{
        12, 42, EventType::STATUS_UPDATED,
        R"({"id":42,"status":"IN_PROGRESS"})",
        UserId("agent-7"), Timestamp(1752571800250)
    };

    auto frame = json::parse(RealtimeProtocol::encode_event(event));
    EXPECT_EQ(frame["id"], 12);
    EXPECT_EQ(frame["type"], "STATUS_UPDATED");
    EXPECT_EQ(frame["ticketId"], 42);
    EXPECT_EQ(frame["actorId"], "agent-7");
    EXPECT_EQ(frame["createdAt"], "2025-07-15T09:30:00.250Z");
    ASSERT_TRUE(frame["payload"].is_object());
    EXPECT_EQ(frame["payload"]["status"], "IN_PROGRESS");
}

TEST(RealtimeProtocol, NonJsonPayloadIsSentAsString) {
    TicketEvent event{1, 1, EventType::COMMENT_ADDED, "plain text", UserId("a"), Timestamp(0)};

    auto frame = json::parse(RealtimeProtocol::encode_event(event));
    EXPECT_EQ(frame["payload"], "plain text");
}

TEST(RealtimeProtocol, InvalidUtf8IsReplacedInFrame) {
    TicketEvent event{1, 1, EventType::COMMENT_ADDED, "jam \xfe", UserId("a"), Timestamp(0)};

    auto frame = json::parse(RealtimeProtocol::encode_event(event));
    EXPECT_EQ(frame["payload"], "jam \xEF\xBF\xBD");
}

TEST(RealtimeProtocol, PongFrame) {
    auto frame = json::parse(RealtimeProtocol::encode_pong());
    EXPECT_EQ(frame, json({{"type", "PONG"}}));
}

TEST(RealtimeProtocol, ClientEncodersAreAcceptedByParser) {
    auto sub = RealtimeProtocol::parse_client_message(RealtimeProtocol::encode_subscribe(5));
    EXPECT_EQ(sub.type, ClientMessageType::SubscribeToTicket);
    EXPECT_EQ(sub.ticket_id, 5);

    auto unsub = RealtimeProtocol::parse_client_message(RealtimeProtocol::encode_unsubscribe(5));
    EXPECT_EQ(unsub.type, ClientMessageType::UnsubscribeFromTicket);

    auto ping = RealtimeProtocol::parse_client_message(RealtimeProtocol::encode_ping());
    EXPECT_EQ(ping.type, ClientMessageType::Ping);
}
