#pragma once

#include "repositories/IEventArchive.hpp"
#include "repositories/ITransactionManager.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace desk::repositories {

// Process-local store for tickets, comments and the event log. Units of work
// are serialized by one writer lock; each stages its writes in an overlay
// that is applied only when the work function returns normally.
class InMemoryDatabase : public ITransactionManager {
public:
    InMemoryDatabase() = default;
    // `archive` is not owned and may be null.
    explicit InMemoryDatabase(IEventArchive* archive);

    void with_transaction(const std::function<void(IUnitOfWork&)>& work) override;

    // Replaces the whole state, e.g. with rows rebuilt from the event archive.
    // Id counters continue after the largest restored ids.
    void restore(std::vector<desk::domain::Ticket> tickets,
                 std::vector<desk::domain::Comment> comments,
                 std::vector<desk::domain::TicketEvent> events);

    // Test helpers
    void inject_commit_failure(int count = 1);
    std::size_t ticket_count() const;
    std::size_t comment_count() const;
    std::vector<desk::domain::TicketEvent> events() const;

private:
    struct State {
        std::map<desk::domain::TicketId, desk::domain::Ticket> tickets;
        std::map<desk::domain::CommentId, desk::domain::Comment> comments;
        std::vector<desk::domain::TicketEvent> events;  // ascending by id
        desk::domain::TicketId next_ticket_id = 1;
        desk::domain::CommentId next_comment_id = 1;
        desk::domain::EventId next_event_id = 1;
    };

    class Transaction;

    void commit(Transaction& tx);

    mutable std::mutex mutex_;
    State state_;
    IEventArchive* archive_ = nullptr;
    int failing_commits_ = 0;
};

} // namespace desk::repositories
