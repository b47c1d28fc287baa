#include "domain/value_objects/Timestamp.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace desk::domain {

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

Timestamp Timestamp::from_string(const std::string& str) {
    return Timestamp(std::stoll(str));
}

Timestamp Timestamp::from_iso8601(const std::string& str) {
    std::tm tm{};
    std::istringstream iss(str);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid RFC 3339 timestamp: " + str);
    }

    int64_t millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            char c = static_cast<char>(iss.get());
            if (digits < 3) {
                millis = millis * 10 + (c - '0');
            }
            ++digits;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (iss.get() != 'Z') {
        throw std::invalid_argument("Timestamp must be UTC ('Z' suffix): " + str);
    }

    int64_t seconds = static_cast<int64_t>(timegm(&tm));
    return Timestamp(seconds * 1000 + millis);
}

std::string Timestamp::to_iso8601() const {
    std::time_t time = static_cast<std::time_t>(ms_ / 1000);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (ms_ % 1000) << 'Z';
    return oss.str();
}

} // namespace desk::domain
