#pragma once

#include "domain/value_objects/UserId.hpp"

#include <optional>
#include <string>

namespace desk::realtime {

class ICredentialVerifier {
public:
    // Returns the authenticated user, or nullopt for an unknown token.
    virtual std::optional<desk::domain::UserId> verify(const std::string& token) const = 0;
    virtual ~ICredentialVerifier() = default;
};

} // namespace desk::realtime
