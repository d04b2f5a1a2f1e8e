#include "resolvers/header_key_resolver.hpp"
#include "rate_limit_errors.hpp"

#include <openssl/sha.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace turnstile {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Strips a case-insensitive "Bearer " scheme.
std::string strip_bearer(const std::string& value) {
    static const std::string scheme = "bearer ";
    if (value.size() <= scheme.size()) {
        return value;
    }
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != scheme[i]) {
            return value;
        }
    }
    return trim(value.substr(scheme.size()));
}

}

HeaderKeyResolver::HeaderKeyResolver(std::string header_name,
                                     std::string salt,
                                     std::vector<std::string> fallback_headers,
                                     IpResolverOptions ip_options)
    : header_name_(std::move(header_name))
    , salt_(std::move(salt))
    , fallback_headers_(std::move(fallback_headers))
    , ip_(ip_options)
{
    if (header_name_.empty()) {
        throw ConfigError("Header resolver requires a header name");
    }
}

std::optional<std::string> HeaderKeyResolver::token(const ClientRequest& request) const {
    auto read = [&request](const std::string& name) -> std::optional<std::string> {
        auto value = request.header(name);
        if (!value) {
            return std::nullopt;
        }
        std::string t = strip_bearer(trim(*value));
        if (t.empty()) {
            return std::nullopt;
        }
        return t;
    };

    if (auto t = read(header_name_)) {
        return t;
    }
    for (const auto& name : fallback_headers_) {
        if (auto t = read(name)) {
            return t;
        }
    }
    return std::nullopt;
}

std::string HeaderKeyResolver::fingerprint(const std::string& token) const {
    std::string data = salt_ + token;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return ss.str();
}

std::string HeaderKeyResolver::resolve(const ClientRequest& request) const {
    if (auto t = token(request)) {
        return "header:" + fingerprint(*t);
    }
    return ip_.resolve(request);
}

}
