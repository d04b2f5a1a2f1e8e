#include "client_request.hpp"

#include <utility>

namespace turnstile {

namespace http = boost::beast::http;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}

ClientRequest::ClientRequest(const HttpRequest& req,
                             std::string remote_addr,
                             std::optional<std::string> user_id)
    : req_(req)
    , remote_addr_(std::move(remote_addr))
    , user_id_(std::move(user_id))
{}

std::optional<std::string> ClientRequest::header(std::string_view name) const {
    auto it = req_.find(boost::beast::string_view(name.data(), name.size()));
    if (it == req_.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

std::optional<std::string> ClientRequest::cookie(std::string_view name) const {
    // A request may carry several Cookie fields.
    for (const auto& field : req_) {
        if (field.name() != http::field::cookie) {
            continue;
        }
        std::string_view rest(field.value().data(), field.value().size());
        while (!rest.empty()) {
            auto semi = rest.find(';');
            std::string_view pair = trim(rest.substr(0, semi));
            rest = (semi == std::string_view::npos) ? std::string_view{} : rest.substr(semi + 1);

            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                continue;
            }
            if (trim(pair.substr(0, eq)) == name) {
                std::string_view value = trim(pair.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                return std::string(value);
            }
        }
    }
    return std::nullopt;
}

std::string ClientRequest::target() const {
    return std::string(req_.target());
}

}
