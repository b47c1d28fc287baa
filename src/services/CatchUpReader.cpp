#include "services/CatchUpReader.hpp"

#include <algorithm>

using namespace desk::domain;

namespace desk::services {

CatchUpReader::CatchUpReader(desk::repositories::ITransactionManager& transactions,
                             const TicketService& tickets,
                             const desk::config::CatchUpSettings& settings)
    : transactions_(transactions)
    , tickets_(tickets)
    , settings_(settings) {}

int CatchUpReader::effective_limit(int requested) const noexcept {
    if (requested <= 0) return settings_.default_limit;
    return std::min(requested, settings_.max_limit);
}

EventPage CatchUpReader::read(const UserId& viewer, TicketId ticket_id,
                              EventId after_id, int limit) const {
    tickets_.get_ticket(ticket_id, viewer);

    EventPage page;
    auto page_size = static_cast<std::size_t>(effective_limit(limit));
    transactions_.with_transaction([&](desk::repositories::IUnitOfWork& uow) {
        page.events = uow.events().list_by_ticket(ticket_id, std::max<EventId>(after_id, 0), page_size);
    });

    if (!page.events.empty()) {
        page.next_cursor = page.events.back().id;
    }
    return page;
}

} // namespace desk::services
