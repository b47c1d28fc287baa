#pragma once

#include "config/Settings.hpp"
#include "realtime/ClientSession.hpp"
#include "realtime/ICredentialVerifier.hpp"
#include "realtime/SubscriptionHub.hpp"

#include <ixwebsocket/IXWebSocketServer.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace desk::infrastructure {

// WebSocket edge. Authenticates the open handshake, then binds every
// connection to a ClientSession registered with the hub.
class RealtimeServer {
public:
    static constexpr int kUnauthorizedCloseCode = 4401;

    RealtimeServer(const desk::config::RealtimeSettings& settings,
                   desk::realtime::SubscriptionHub& hub,
                   const desk::realtime::ICredentialVerifier& verifier);
    ~RealtimeServer();

    // Throws std::runtime_error when the port cannot be bound.
    void start();
    void stop();

    size_t connection_count() const;

private:
    void on_message(const std::shared_ptr<ix::ConnectionState>& state,
                    ix::WebSocket& ws,
                    const ix::WebSocketMessagePtr& msg);
    void on_open(const std::string& connection_id, ix::WebSocket& ws,
                 const ix::WebSocketMessagePtr& msg);
    void on_close(const std::string& connection_id);
    desk::realtime::SessionPtr find(const std::string& connection_id) const;

    desk::config::RealtimeSettings settings_;
    desk::realtime::SessionLimits limits_;
    desk::realtime::SubscriptionHub& hub_;
    const desk::realtime::ICredentialVerifier& verifier_;
    ix::WebSocketServer server_;

    mutable std::mutex mutex_;
    std::map<std::string, desk::realtime::SessionPtr> sessions_;
};

} // namespace desk::infrastructure
