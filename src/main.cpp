#include "config/Settings.hpp"
#include "infrastructure/BackgroundNotifier.hpp"
#include "infrastructure/LoggingNotifier.hpp"
#include "infrastructure/RealtimeServer.hpp"
#include "infrastructure/RolePermissionAuthorizer.hpp"
#include "infrastructure/StaticTokenVerifier.hpp"
#include "realtime/SubscriptionHub.hpp"
#include "repositories/IEventArchive.hpp"
#include "repositories/InMemoryDatabase.hpp"
#include "services/EventReplay.hpp"
#include "services/OutboxCoordinator.hpp"
#include "services/TicketService.hpp"

#ifdef DESK_HAS_PARQUET
#include "repositories/parquet/ParquetEventArchive.hpp"
#endif

#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main() {
    auto settings = desk::config::Settings::from_environment();
    std::vector<desk::infrastructure::TokenGrant> grants;
    try {
        settings.validate();
        grants = desk::infrastructure::parse_token_grants(settings.auth.tokens);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    if (grants.empty()) {
        std::cerr << "No credentials configured; every connection will be refused. "
                  << "Set DESK_TOKENS=token:user:role,..." << std::endl;
    }

    std::unique_ptr<desk::repositories::IEventArchive> archive;

    if (settings.storage.backend == "parquet") {
#ifdef DESK_HAS_PARQUET
        auto fs = desk::repositories::pq::ParquetEventArchive::make_local_fs(
            settings.storage.data_directory);
        archive = std::make_unique<desk::repositories::pq::ParquetEventArchive>(fs, settings.storage);
#else
        std::cerr << "Parquet backend requested but not compiled in. "
                  << "Rebuild with Apache Arrow installed." << std::endl;
        return 1;
#endif
    }

    desk::repositories::InMemoryDatabase db(archive.get());
    if (archive) {
        auto replayed = desk::services::replay_events(archive->load_all());
        std::cout << "[storage] Restored " << replayed.tickets.size() << " tickets, "
                  << replayed.comments.size() << " comments, "
                  << replayed.events.size() << " events" << std::endl;
        db.restore(std::move(replayed.tickets), std::move(replayed.comments),
                   std::move(replayed.events));
    }

    desk::infrastructure::RolePermissionAuthorizer authorizer(grants);
    desk::infrastructure::StaticTokenVerifier verifier(grants);
    desk::infrastructure::LoggingNotifier log_notifier;
    desk::infrastructure::BackgroundNotifier notifier(
        log_notifier, static_cast<size_t>(settings.notifier.queue_capacity));

    desk::realtime::SubscriptionHub hub(static_cast<size_t>(settings.realtime.dispatch_queue_capacity));
    desk::services::OutboxCoordinator outbox(db, hub);
    desk::services::TicketService tickets(db, outbox, authorizer, notifier);

    hub.set_subscription_policy([&tickets](const desk::domain::UserId& user, desk::domain::TicketId id) {
        return tickets.can_view(id, user);
    });

    ix::initNetSystem();
    desk::infrastructure::RealtimeServer server(settings.realtime, hub, verifier);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    hub.start();
    try {
        server.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "[server] " << e.what() << std::endl;
        hub.stop();
        ix::uninitNetSystem();
        return 1;
    }
    std::cout << "[desk] Started" << std::endl;

    // Log-mode stats loop
    uint64_t last_dispatched = 0;
    auto last_stats_time = std::chrono::steady_clock::now();

    while (running) {
        for (int i = 0; i < 10 && running; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running) break;

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_stats_time).count();
        uint64_t dispatched = hub.dispatched_events();
        double events_per_sec = (elapsed > 0) ? (dispatched - last_dispatched) / elapsed : 0;

        std::cout << "[stats] sessions=" << hub.session_count()
                  << " rooms=" << hub.room_count()
                  << " events/sec=" << static_cast<int>(events_per_sec)
                  << " dropped=" << hub.dropped_events()
                  << " evicted=" << hub.evicted_sessions()
                  << std::endl;

        last_dispatched = dispatched;
        last_stats_time = now;
    }

    server.stop();
    hub.stop();
    notifier.shutdown();
    ix::uninitNetSystem();

    std::cout << "\n[desk] Done. Dispatched " << hub.dispatched_events() << " events." << std::endl;
    return 0;
}
