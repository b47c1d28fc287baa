#include "services/CommentService.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "repositories/InMemoryDatabase.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <map>
#include <set>

using namespace desk::domain;
using namespace desk::services;
using desk::repositories::InMemoryDatabase;

// --- Test fakes ---

namespace {

class FakeAuthorizer : public IAuthorizer {
public:
    std::map<UserId, std::set<std::string>> grants;

    void grant(const std::string& user, std::initializer_list<const char*> permissions) {
        for (const char* p : permissions) grants[UserId(user)].insert(p);
    }

    bool can(const UserId& actor, const std::string& permission) const override {
        auto it = grants.find(actor);
        return it != grants.end() && it->second.count(permission) > 0;
    }
};

class RecordingBroadcaster : public IEventBroadcaster {
public:
    std::vector<TicketEvent> events;
    void broadcast(const TicketEvent& event) override { events.push_back(event); }
};

class RecordingNotifier : public INotifier {
public:
    std::vector<Notification> sent;
    void notify(const Notification& notification) override { sent.push_back(notification); }
};

} // namespace

// --- Fixture ---

class CommentServiceTest : public ::testing::Test {
protected:
    Clock clock = [] { return Timestamp(5000); };

    InMemoryDatabase db;
    RecordingBroadcaster broadcaster;
    RecordingNotifier notifier;
    FakeAuthorizer authorizer;
    OutboxCoordinator outbox{db, broadcaster, clock};
    TicketService tickets{db, outbox, authorizer, notifier, clock};
    CommentService comments{db, outbox, tickets, authorizer, notifier, clock};

    TicketId ticket_id = 0;

    void SetUp() override {
        authorizer.grant("customer-1", {permissions::TICKETS_CREATE, permissions::TICKETS_READ,
                                        permissions::COMMENTS_CREATE, permissions::COMMENTS_READ});
        authorizer.grant("customer-2", {permissions::TICKETS_CREATE, permissions::TICKETS_READ,
                                        permissions::COMMENTS_CREATE, permissions::COMMENTS_READ});
        authorizer.grant("agent-1", {permissions::TICKETS_READ, permissions::TICKETS_READ_ALL,
                                     permissions::COMMENTS_CREATE, permissions::COMMENTS_READ});
        authorizer.grant("auditor", {permissions::TICKETS_READ, permissions::TICKETS_READ_ALL});

        ticket_id = tickets.create_ticket(TicketDraft{"Printer down", "", "HIGH", "customer-1"}).id();
        broadcaster.events.clear();
    }
};

TEST_F(CommentServiceTest, AddCommentStoresAndRecordsEvent) {
    auto comment = comments.add_comment(ticket_id, UserId("agent-1"), "Looking into it");

    EXPECT_EQ(comment.id(), 1);
    EXPECT_EQ(comment.ticket_id(), ticket_id);
    EXPECT_EQ(comment.author_id(), UserId("agent-1"));
    EXPECT_EQ(comment.created_at(), Timestamp(5000));

    auto events = db.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, EventType::COMMENT_ADDED);
    EXPECT_EQ(events[1].ticket_id, ticket_id);
    auto payload = nlohmann::json::parse(events[1].payload);
    EXPECT_EQ(payload["body"], "Looking into it");
    EXPECT_EQ(payload["id"], "1");

    ASSERT_EQ(broadcaster.events.size(), 1u);
    EXPECT_EQ(broadcaster.events[0].type, EventType::COMMENT_ADDED);
}

TEST_F(CommentServiceTest, InvalidUtf8InBodyIsReplacedInPayload) {
    auto comment = comments.add_comment(ticket_id, UserId("agent-1"), "Toner \xc3 low");

    EXPECT_EQ(comment.body(), "Toner \xc3 low");
    auto events = db.events();
    ASSERT_EQ(events.size(), 2u);
    auto payload = nlohmann::json::parse(events[1].payload);
    EXPECT_EQ(payload["body"], "Toner \xEF\xBF\xBD low");
    EXPECT_EQ(broadcaster.events.size(), 1u);
}

TEST_F(CommentServiceTest, AgentCommentNotifiesRequester) {
    comments.add_comment(ticket_id, UserId("agent-1"), "Looking into it");

    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].recipient, UserId("customer-1"));
    EXPECT_EQ(notifier.sent[0].subject, "A new comment was added to your ticket: #1");
}

TEST_F(CommentServiceTest, RequesterCommentDoesNotNotify) {
    comments.add_comment(ticket_id, UserId("customer-1"), "Still broken");
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(CommentServiceTest, EmptyBodyIsRejected) {
    EXPECT_THROW(comments.add_comment(ticket_id, UserId("agent-1"), ""), ValidationError);
    EXPECT_EQ(db.comment_count(), 0u);
    EXPECT_TRUE(broadcaster.events.empty());
}

TEST_F(CommentServiceTest, CommentingRequiresPermission) {
    EXPECT_THROW(comments.add_comment(ticket_id, UserId("auditor"), "hi"), AuthorizationDenied);
}

TEST_F(CommentServiceTest, CommentingRequiresTicketAccess) {
    EXPECT_THROW(comments.add_comment(ticket_id, UserId("customer-2"), "me too"), AuthorizationDenied);
    EXPECT_THROW(comments.add_comment(404, UserId("agent-1"), "hello?"), NotFound);
    EXPECT_EQ(db.comment_count(), 0u);
}

TEST_F(CommentServiceTest, ListReturnsCommentsOldestFirst) {
    comments.add_comment(ticket_id, UserId("agent-1"), "first");
    comments.add_comment(ticket_id, UserId("customer-1"), "second");

    auto listed = comments.list_comments(ticket_id, UserId("customer-1"));
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].body(), "first");
    EXPECT_EQ(listed[1].body(), "second");
}

TEST_F(CommentServiceTest, ListingRequiresPermissionAndAccess) {
    EXPECT_THROW(comments.list_comments(ticket_id, UserId("auditor")), AuthorizationDenied);
    EXPECT_THROW(comments.list_comments(ticket_id, UserId("customer-2")), AuthorizationDenied);
}
