#include "services/EventReplay.hpp"

#include "services/EventPayloads.hpp"

#include <gtest/gtest.h>

using namespace desk::domain;
using namespace desk::services;

namespace {

TicketEvent ticket_event(EventId id, EventType type, const Ticket& ticket) {
    return TicketEvent{id, ticket.id(), type, EventPayloads::ticket_snapshot(ticket),
                       UserId("agent-1"), Timestamp(id * 1000)};
}

TicketEvent comment_event(EventId id, const Comment& comment) {
    return TicketEvent{id, comment.ticket_id(), EventType::COMMENT_ADDED,
                       EventPayloads::comment_snapshot(comment), comment.author_id(), Timestamp(id * 1000)};
}

} // namespace

TEST(EventReplay, LatestSnapshotWinsRegardlessOfInputOrder) {
    auto created = Ticket::create(TicketDraft{"Printer down", "", "HIGH", "customer-1"}, Timestamp(1000)).with_id(1);
    auto assigned = created.assigned_to(UserId("agent-1"), Timestamp(2000));
    auto closed = assigned.with_status(TicketStatus::CLOSED, Timestamp(3000));
    auto comment = Comment::create(CommentDraft{1, "agent-1", "done"}, Timestamp(2500)).with_id(1);

    auto state = replay_events({
        ticket_event(4, EventType::STATUS_UPDATED, closed),
        ticket_event(1, EventType::TICKET_CREATED, created),
        comment_event(3, comment),
        ticket_event(2, EventType::TICKET_ASSIGNED, assigned),
    });

    ASSERT_EQ(state.tickets.size(), 1u);
    EXPECT_EQ(state.tickets[0], closed);
    ASSERT_EQ(state.comments.size(), 1u);
    EXPECT_EQ(state.comments[0], comment);

    ASSERT_EQ(state.events.size(), 4u);
    for (size_t i = 0; i < state.events.size(); ++i) {
        EXPECT_EQ(state.events[i].id, static_cast<EventId>(i + 1));
    }
}

TEST(EventReplay, SeparateTicketsAreKeptApart) {
    auto a = Ticket::create(TicketDraft{"a", "", "LOW", "u1"}, Timestamp(1)).with_id(1);
    auto b = Ticket::create(TicketDraft{"b", "", "LOW", "u2"}, Timestamp(2)).with_id(2);

    auto state = replay_events({ticket_event(1, EventType::TICKET_CREATED, a),
                                ticket_event(2, EventType::TICKET_CREATED, b)});

    ASSERT_EQ(state.tickets.size(), 2u);
    EXPECT_EQ(state.tickets[0].title(), "a");
    EXPECT_EQ(state.tickets[1].title(), "b");
}

TEST(EventReplay, EmptyLogYieldsEmptyState) {
    auto state = replay_events({});
    EXPECT_TRUE(state.tickets.empty());
    EXPECT_TRUE(state.comments.empty());
    EXPECT_TRUE(state.events.empty());
}

TEST(EventReplay, CorruptPayloadIsReported) {
    std::vector<TicketEvent> events{
        TicketEvent{1, 1, EventType::TICKET_CREATED, "{", UserId("u"), Timestamp(1)},
    };
    EXPECT_THROW(replay_events(events), std::invalid_argument);
}
