#include "infrastructure/BearerToken.hpp"

#include <cctype>

namespace desk::infrastructure {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i] == '+' ? ' ' : in[i]);
    }
    return out;
}

std::optional<std::string> query_token(const std::string& uri) {
    auto query_start = uri.find('?');
    if (query_start == std::string::npos) return std::nullopt;

    auto query = uri.substr(query_start + 1);
    if (auto fragment = query.find('#'); fragment != std::string::npos) {
        query.resize(fragment);
    }

    size_t pos = 0;
    while (pos <= query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        auto pair = query.substr(pos, end - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == "token") {
            auto value = percent_decode(pair.substr(eq + 1));
            if (!value.empty()) return value;
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> header_token(const std::string& header) {
    const std::string scheme = "bearer ";
    if (header.size() <= scheme.size()) return std::nullopt;
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != scheme[i]) return std::nullopt;
    }
    auto token = header.substr(scheme.size());
    auto first = token.find_first_not_of(' ');
    if (first == std::string::npos) return std::nullopt;
    auto last = token.find_last_not_of(' ');
    return token.substr(first, last - first + 1);
}

} // namespace

std::optional<std::string> extract_bearer_token(const std::string& uri,
                                                const std::string& authorization_header) {
    if (auto token = query_token(uri)) return token;
    return header_token(authorization_header);
}

} // namespace desk::infrastructure
