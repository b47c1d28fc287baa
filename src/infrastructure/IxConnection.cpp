#include "infrastructure/IxConnection.hpp"

#include <thread>

namespace desk::infrastructure {

bool IxConnection::send_text(const std::string& frame, std::chrono::milliseconds timeout) {
    if (ws_.getReadyState() != ix::ReadyState::Open) return false;
    if (!ws_.sendText(frame).success) return false;

    // sendText only queues; wait for the socket thread to flush.
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (ws_.bufferedAmount() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

bool IxConnection::ping() {
    if (ws_.getReadyState() != ix::ReadyState::Open) return false;
    return ws_.ping("").success;
}

void IxConnection::close(int code, const std::string& reason) {
    ws_.close(static_cast<uint16_t>(code), reason);
}

} // namespace desk::infrastructure
