#pragma once

#include "realtime/ICredentialVerifier.hpp"

#include <map>
#include <string>
#include <vector>

namespace desk::infrastructure {

struct TokenGrant {
    std::string token;
    std::string user_id;
    std::string role;
};

// Parses "token:user:role" triples separated by commas. Whitespace around
// entries is ignored. Throws std::invalid_argument on malformed entries.
std::vector<TokenGrant> parse_token_grants(const std::string& text);

class StaticTokenVerifier : public desk::realtime::ICredentialVerifier {
public:
    explicit StaticTokenVerifier(const std::vector<TokenGrant>& grants);

    std::optional<desk::domain::UserId> verify(const std::string& token) const override;

    size_t token_count() const noexcept { return users_.size(); }

private:
    std::map<std::string, desk::domain::UserId> users_;
};

} // namespace desk::infrastructure
