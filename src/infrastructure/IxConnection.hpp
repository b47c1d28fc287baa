#pragma once

#include "realtime/IConnection.hpp"

#include <ixwebsocket/IXWebSocket.h>

namespace desk::infrastructure {

// Adapts a server-side ix::WebSocket. The socket is owned by the server and
// must outlive the session that writes to it.
class IxConnection : public desk::realtime::IConnection {
public:
    explicit IxConnection(ix::WebSocket& ws) : ws_(ws) {}

    bool send_text(const std::string& frame, std::chrono::milliseconds timeout) override;
    bool ping() override;
    void close(int code, const std::string& reason) override;

private:
    ix::WebSocket& ws_;
};

} // namespace desk::infrastructure
