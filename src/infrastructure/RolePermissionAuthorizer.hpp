#pragma once

#include "infrastructure/StaticTokenVerifier.hpp"
#include "services/IAuthorizer.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace desk::infrastructure {

// Role based permissions with a fixed role table: customer, agent, admin.
class RolePermissionAuthorizer : public desk::services::IAuthorizer {
public:
    RolePermissionAuthorizer() = default;
    // Throws std::invalid_argument for an unknown role.
    explicit RolePermissionAuthorizer(const std::vector<TokenGrant>& grants);

    void assign_role(const desk::domain::UserId& user, const std::string& role);

    bool can(const desk::domain::UserId& actor, const std::string& permission) const override;

    static const std::set<std::string>& permissions_for(const std::string& role);

private:
    std::map<desk::domain::UserId, std::string> roles_;
};

} // namespace desk::infrastructure
