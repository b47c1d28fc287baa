#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace desk::domain {

class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    static Timestamp now();
    static Timestamp from_string(const std::string& str);

    // RFC 3339 UTC with millisecond precision, e.g. "2025-07-15T09:30:00.250Z".
    // Parsing also accepts the form without fractional seconds.
    static Timestamp from_iso8601(const std::string& str);
    std::string to_iso8601() const;

    int64_t milliseconds() const noexcept { return ms_; }

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace desk::domain
