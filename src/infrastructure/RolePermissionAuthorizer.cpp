#include "infrastructure/RolePermissionAuthorizer.hpp"

#include <stdexcept>

namespace desk::infrastructure {

namespace perm = desk::services::permissions;

namespace {

const std::map<std::string, std::set<std::string>>& role_table() {
    static const std::map<std::string, std::set<std::string>> table = {
        {"customer", {
            perm::TICKETS_CREATE, perm::TICKETS_READ,
            perm::COMMENTS_CREATE, perm::COMMENTS_READ,
        }},
        {"agent", {
            perm::TICKETS_CREATE, perm::TICKETS_READ, perm::TICKETS_READ_ALL,
            perm::TICKETS_UPDATE_STATUS, perm::TICKETS_ASSIGN, perm::TICKETS_LIST_ALL,
            perm::COMMENTS_CREATE, perm::COMMENTS_READ,
        }},
        {"admin", {
            perm::TICKETS_CREATE, perm::TICKETS_READ, perm::TICKETS_READ_ALL,
            perm::TICKETS_UPDATE_STATUS, perm::TICKETS_ASSIGN, perm::TICKETS_LIST_ALL,
            perm::COMMENTS_CREATE, perm::COMMENTS_READ,
            "admin:access",
        }},
    };
    return table;
}

} // namespace

RolePermissionAuthorizer::RolePermissionAuthorizer(const std::vector<TokenGrant>& grants) {
    for (const auto& grant : grants) {
        assign_role(desk::domain::UserId(grant.user_id), grant.role);
    }
}

void RolePermissionAuthorizer::assign_role(const desk::domain::UserId& user, const std::string& role) {
    if (role_table().count(role) == 0) {
        throw std::invalid_argument("Unknown role: " + role);
    }
    roles_.insert_or_assign(user, role);
}

bool RolePermissionAuthorizer::can(const desk::domain::UserId& actor, const std::string& permission) const {
    auto it = roles_.find(actor);
    if (it == roles_.end()) return false;
    return permissions_for(it->second).count(permission) > 0;
}

const std::set<std::string>& RolePermissionAuthorizer::permissions_for(const std::string& role) {
    static const std::set<std::string> none;
    auto it = role_table().find(role);
    return it == role_table().end() ? none : it->second;
}

} // namespace desk::infrastructure
