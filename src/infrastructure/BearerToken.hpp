#pragma once

#include <optional>
#include <string>

namespace desk::infrastructure {

// Credential from the `token` query parameter of `uri`, falling back to an
// "Authorization: Bearer <token>" header value. Empty tokens count as absent.
std::optional<std::string> extract_bearer_token(const std::string& uri,
                                                const std::string& authorization_header);

} // namespace desk::infrastructure
