#include "repositories/InMemoryDatabase.hpp"

#include "domain/errors/DomainErrors.hpp"

#include <algorithm>

using namespace desk::domain;

namespace desk::repositories {

class InMemoryDatabase::Transaction : public IUnitOfWork {
public:
    explicit Transaction(const State& committed)
        : committed_(committed)
        , next_ticket_id_(committed.next_ticket_id)
        , next_comment_id_(committed.next_comment_id)
        , next_event_id_(committed.next_event_id)
        , tickets_(*this)
        , comments_(*this)
        , events_(*this) {}

    ITicketRepository& tickets() override { return tickets_; }
    ICommentRepository& comments() override { return comments_; }
    IEventLogRepository& events() override { return events_; }

private:
    friend class InMemoryDatabase;

    class Tickets : public ITicketRepository {
    public:
        explicit Tickets(Transaction& tx) : tx_(tx) {}

        Ticket create(const Ticket& ticket) override {
            Ticket stored = ticket.with_id(tx_.next_ticket_id_++);
            tx_.staged_tickets_.insert_or_assign(stored.id(), stored);
            return stored;
        }

        std::optional<Ticket> find_by_id(TicketId id) const override {
            if (auto it = tx_.staged_tickets_.find(id); it != tx_.staged_tickets_.end()) {
                return it->second;
            }
            if (auto it = tx_.committed_.tickets.find(id); it != tx_.committed_.tickets.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        Ticket update(const Ticket& ticket) override {
            if (!find_by_id(ticket.id())) {
                throw NotFound("ticket " + std::to_string(ticket.id()) + " not found");
            }
            tx_.staged_tickets_.insert_or_assign(ticket.id(), ticket);
            return ticket;
        }

        std::vector<Ticket> list(const TicketFilter& filter) const override {
            std::map<TicketId, Ticket> merged = tx_.committed_.tickets;
            for (const auto& [id, ticket] : tx_.staged_tickets_) {
                merged.insert_or_assign(id, ticket);
            }

            std::vector<Ticket> matching;
            for (const auto& [id, ticket] : merged) {
                if (filter.status && ticket.status() != *filter.status) continue;
                if (filter.priority && ticket.priority() != *filter.priority) continue;
                if (filter.requester_id && !ticket.is_owned_by(*filter.requester_id)) continue;
                matching.push_back(ticket);
            }

            std::sort(matching.begin(), matching.end(), [](const Ticket& a, const Ticket& b) {
                if (a.created_at() != b.created_at()) return a.created_at() > b.created_at();
                return a.id() > b.id();
            });

            auto offset = static_cast<std::size_t>(std::max(filter.offset, 0));
            auto limit = static_cast<std::size_t>(std::max(filter.limit, 0));
            if (offset >= matching.size()) return {};
            auto first = matching.begin() + static_cast<std::ptrdiff_t>(offset);
            auto last = first + static_cast<std::ptrdiff_t>(std::min(limit, matching.size() - offset));
            return {first, last};
        }

    private:
        Transaction& tx_;
    };

    class Comments : public ICommentRepository {
    public:
        explicit Comments(Transaction& tx) : tx_(tx) {}

        Comment create(const Comment& comment) override {
            Comment stored = comment.with_id(tx_.next_comment_id_++);
            tx_.staged_comments_.push_back(stored);
            return stored;
        }

        std::vector<Comment> list_by_ticket(TicketId ticket_id) const override {
            std::vector<Comment> result;
            for (const auto& [id, comment] : tx_.committed_.comments) {
                if (comment.ticket_id() == ticket_id) result.push_back(comment);
            }
            for (const auto& comment : tx_.staged_comments_) {
                if (comment.ticket_id() == ticket_id) result.push_back(comment);
            }
            return result;
        }

    private:
        Transaction& tx_;
    };

    class Events : public IEventLogRepository {
    public:
        explicit Events(Transaction& tx) : tx_(tx) {}

        TicketEvent append(const TicketEvent& event) override {
            TicketEvent stored = event;
            stored.id = tx_.next_event_id_++;
            tx_.staged_events_.push_back(stored);
            return stored;
        }

        std::vector<TicketEvent> list_by_ticket(TicketId ticket_id, EventId after_id,
                                                std::size_t limit) const override {
            std::vector<TicketEvent> result;
            if (limit == 0) return result;

            const auto& committed = tx_.committed_.events;
            auto start = std::upper_bound(committed.begin(), committed.end(), after_id,
                [](EventId id, const TicketEvent& e) { return id < e.id; });
            for (auto it = start; it != committed.end() && result.size() < limit; ++it) {
                if (it->ticket_id == ticket_id) result.push_back(*it);
            }
            for (const auto& e : tx_.staged_events_) {
                if (result.size() >= limit) break;
                if (e.ticket_id == ticket_id && e.id > after_id) result.push_back(e);
            }
            return result;
        }

    private:
        Transaction& tx_;
    };

    const State& committed_;
    TicketId next_ticket_id_;
    CommentId next_comment_id_;
    EventId next_event_id_;
    std::map<TicketId, Ticket> staged_tickets_;
    std::vector<Comment> staged_comments_;
    std::vector<TicketEvent> staged_events_;

    Tickets tickets_;
    Comments comments_;
    Events events_;
};

InMemoryDatabase::InMemoryDatabase(IEventArchive* archive)
    : archive_(archive) {}

void InMemoryDatabase::with_transaction(const std::function<void(IUnitOfWork&)>& work) {
    std::lock_guard lock(mutex_);
    Transaction tx(state_);
    work(tx);
    commit(tx);
}

void InMemoryDatabase::commit(Transaction& tx) {
    if (failing_commits_ > 0) {
        --failing_commits_;
        throw TransientInfraError("commit failed: injected failure");
    }

    if (archive_ && !tx.staged_events_.empty()) {
        try {
            archive_->archive(tx.staged_events_);
        } catch (const std::exception& e) {
            throw TransientInfraError(std::string("commit failed: ") + e.what());
        }
    }

    for (auto& [id, ticket] : tx.staged_tickets_) {
        state_.tickets.insert_or_assign(id, std::move(ticket));
    }
    for (auto& comment : tx.staged_comments_) {
        state_.comments.insert_or_assign(comment.id(), std::move(comment));
    }
    for (auto& event : tx.staged_events_) {
        state_.events.push_back(std::move(event));
    }
    state_.next_ticket_id = tx.next_ticket_id_;
    state_.next_comment_id = tx.next_comment_id_;
    state_.next_event_id = tx.next_event_id_;
}

void InMemoryDatabase::restore(std::vector<Ticket> tickets,
                               std::vector<Comment> comments,
                               std::vector<TicketEvent> events) {
    std::lock_guard lock(mutex_);
    State restored;

    for (auto& ticket : tickets) {
        restored.next_ticket_id = std::max(restored.next_ticket_id, ticket.id() + 1);
        restored.tickets.insert_or_assign(ticket.id(), std::move(ticket));
    }
    for (auto& comment : comments) {
        restored.next_comment_id = std::max(restored.next_comment_id, comment.id() + 1);
        restored.comments.insert_or_assign(comment.id(), std::move(comment));
    }

    std::sort(events.begin(), events.end(),
              [](const TicketEvent& a, const TicketEvent& b) { return a.id < b.id; });
    if (!events.empty()) {
        restored.next_event_id = events.back().id + 1;
    }
    restored.events = std::move(events);

    state_ = std::move(restored);
}

void InMemoryDatabase::inject_commit_failure(int count) {
    std::lock_guard lock(mutex_);
    failing_commits_ += count;
}

std::size_t InMemoryDatabase::ticket_count() const {
    std::lock_guard lock(mutex_);
    return state_.tickets.size();
}

std::size_t InMemoryDatabase::comment_count() const {
    std::lock_guard lock(mutex_);
    return state_.comments.size();
}

std::vector<TicketEvent> InMemoryDatabase::events() const {
    std::lock_guard lock(mutex_);
    return state_.events;
}

} // namespace desk::repositories
