#include "domain/value_objects/UserId.hpp"

#include <stdexcept>

namespace desk::domain {

UserId::UserId(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw std::invalid_argument("UserId must not be empty");
    }
}

} // namespace desk::domain
