#pragma once

#include <chrono>
#include <string>

namespace desk::realtime {

// Write side of one client connection, as seen by its outbound task.
class IConnection {
public:
    // Returns false when the frame could not be written within `timeout`.
    virtual bool send_text(const std::string& frame, std::chrono::milliseconds timeout) = 0;
    virtual bool ping() = 0;
    virtual void close(int code, const std::string& reason) = 0;
    virtual ~IConnection() = default;
};

} // namespace desk::realtime
