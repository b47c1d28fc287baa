#pragma once

#include "domain/value_objects/UserId.hpp"

#include <string>

namespace desk::services {

namespace permissions {
inline constexpr const char* TICKETS_CREATE = "tickets:create";
inline constexpr const char* TICKETS_READ = "tickets:read";
inline constexpr const char* TICKETS_READ_ALL = "tickets:read:all";
inline constexpr const char* TICKETS_UPDATE_STATUS = "tickets:update:status";
inline constexpr const char* TICKETS_ASSIGN = "tickets:assign";
inline constexpr const char* TICKETS_LIST_ALL = "tickets:list:all";
inline constexpr const char* COMMENTS_CREATE = "comments:create";
inline constexpr const char* COMMENTS_READ = "comments:read";
} // namespace permissions

class IAuthorizer {
public:
    virtual bool can(const desk::domain::UserId& actor, const std::string& permission) const = 0;
    virtual ~IAuthorizer() = default;
};

} // namespace desk::services
