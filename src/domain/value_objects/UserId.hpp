#pragma once

#include <compare>
#include <string>

namespace desk::domain {

class UserId {
public:
    explicit UserId(std::string value);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const UserId&) const = default;
    auto operator<=>(const UserId&) const = default;

private:
    std::string value_;
};

} // namespace desk::domain
