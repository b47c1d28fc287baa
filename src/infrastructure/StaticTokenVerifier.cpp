#include "infrastructure/StaticTokenVerifier.hpp"

#include <sstream>
#include <stdexcept>

namespace desk::infrastructure {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::vector<TokenGrant> parse_token_grants(const std::string& text) {
    std::vector<TokenGrant> grants;
    std::istringstream entries(text);
    std::string entry;

    while (std::getline(entries, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) continue;

        auto first = entry.find(':');
        auto second = first == std::string::npos ? std::string::npos : entry.find(':', first + 1);
        if (second == std::string::npos) {
            throw std::invalid_argument("Token grant must be token:user:role, got: " + entry);
        }

        TokenGrant grant{entry.substr(0, first),
                         entry.substr(first + 1, second - first - 1),
                         entry.substr(second + 1)};
        if (grant.token.empty() || grant.user_id.empty() || grant.role.empty()) {
            throw std::invalid_argument("Token grant has an empty field: " + entry);
        }
        grants.push_back(std::move(grant));
    }
    return grants;
}

StaticTokenVerifier::StaticTokenVerifier(const std::vector<TokenGrant>& grants) {
    for (const auto& grant : grants) {
        users_.insert_or_assign(grant.token, desk::domain::UserId(grant.user_id));
    }
}

std::optional<desk::domain::UserId> StaticTokenVerifier::verify(const std::string& token) const {
    auto it = users_.find(token);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

} // namespace desk::infrastructure
