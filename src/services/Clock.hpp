#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <functional>

namespace desk::services {

using Clock = std::function<desk::domain::Timestamp()>;

} // namespace desk::services
