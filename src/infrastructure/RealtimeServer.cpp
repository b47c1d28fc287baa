#include "infrastructure/RealtimeServer.hpp"

#include "infrastructure/BearerToken.hpp"
#include "infrastructure/IxConnection.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

namespace desk::infrastructure {

RealtimeServer::RealtimeServer(const desk::config::RealtimeSettings& settings,
                               desk::realtime::SubscriptionHub& hub,
                               const desk::realtime::ICredentialVerifier& verifier)
    : settings_(settings)
    , limits_(desk::realtime::SessionLimits::from_settings(settings))
    , hub_(hub)
    , verifier_(verifier)
    , server_(settings.port, settings.host, ix::SocketServer::kDefaultTcpBacklog,
              static_cast<size_t>(settings.max_connections)) {
    server_.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state,
               ix::WebSocket& ws,
               const ix::WebSocketMessagePtr& msg) {
            on_message(state, ws, msg);
        });
}

RealtimeServer::~RealtimeServer() {
    stop();
}

void RealtimeServer::start() {
    auto result = server_.listen();
    if (!result.first) {
        throw std::runtime_error("Cannot listen on " + settings_.host + ":"
                                 + std::to_string(settings_.port) + ": " + result.second);
    }
    server_.start();
    std::cout << "[server] Listening on " << settings_.host << ":" << settings_.port << std::endl;
}

void RealtimeServer::stop() {
    server_.stop();

    // Connections the library did not report as closed.
    std::vector<desk::realtime::SessionPtr> remaining;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, session] : sessions_) remaining.push_back(session);
        sessions_.clear();
    }
    for (const auto& session : remaining) {
        session->disconnect("server shutting down");
        session->join();
    }
}

size_t RealtimeServer::connection_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

desk::realtime::SessionPtr RealtimeServer::find(const std::string& connection_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(connection_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void RealtimeServer::on_message(const std::shared_ptr<ix::ConnectionState>& state,
                                ix::WebSocket& ws,
                                const ix::WebSocketMessagePtr& msg) {
    const std::string connection_id = state->getId();
    try {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                on_open(connection_id, ws, msg);
                break;

            case ix::WebSocketMessageType::Message:
                if (auto session = find(connection_id)) {
                    session->on_frame(msg->str);
                }
                break;

            case ix::WebSocketMessageType::Ping:
            case ix::WebSocketMessageType::Pong:
                if (auto session = find(connection_id)) {
                    session->touch();
                }
                break;

            case ix::WebSocketMessageType::Close:
                on_close(connection_id);
                break;

            case ix::WebSocketMessageType::Error:
                std::cerr << "[server] Connection " << connection_id
                          << " error: " << msg->errorInfo.reason << std::endl;
                break;

            default:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[server] Connection " << connection_id
                  << " callback failed: " << e.what() << std::endl;
    }
}

void RealtimeServer::on_open(const std::string& connection_id, ix::WebSocket& ws,
                             const ix::WebSocketMessagePtr& msg) {
    std::string authorization;
    if (auto it = msg->openInfo.headers.find("Authorization"); it != msg->openInfo.headers.end()) {
        authorization = it->second;
    }

    std::optional<desk::domain::UserId> user;
    if (auto token = extract_bearer_token(msg->openInfo.uri, authorization)) {
        user = verifier_.verify(*token);
    }
    if (!user) {
        std::cerr << "[server] Rejected connection " << connection_id
                  << ": missing or invalid credentials" << std::endl;
        ws.close(kUnauthorizedCloseCode, "unauthorized");
        return;
    }

    auto session = std::make_shared<desk::realtime::ClientSession>(
        connection_id, *user, std::make_shared<IxConnection>(ws), hub_, limits_);
    {
        std::lock_guard lock(mutex_);
        sessions_.insert_or_assign(connection_id, session);
    }
    hub_.register_session(session);
    session->start();
}

void RealtimeServer::on_close(const std::string& connection_id) {
    desk::realtime::SessionPtr session;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(connection_id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }

    // The socket is destroyed once this callback returns.
    session->disconnect("connection closed");
    session->join();
}

} // namespace desk::infrastructure
