#pragma once

#include <boost/beast/http.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace turnstile {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

// Read-only view of an inbound request as seen by the key resolvers.
// The wrapped request must outlive this object.
class ClientRequest {
public:
    ClientRequest(const HttpRequest& req,
                  std::string remote_addr,
                  std::optional<std::string> user_id = std::nullopt);

    // Case-insensitive lookup. Returns std::nullopt when absent.
    std::optional<std::string> header(std::string_view name) const;

    // Value of a cookie from the Cookie header.
    std::optional<std::string> cookie(std::string_view name) const;

    // Transport peer address; may be empty when the socket had none.
    const std::string& remote_address() const { return remote_addr_; }

    // Identity established by an upstream authenticator, if any.
    const std::optional<std::string>& user_id() const { return user_id_; }

    std::string target() const;
    const HttpRequest& raw() const { return req_; }

private:
    const HttpRequest& req_;
    std::string remote_addr_;
    std::optional<std::string> user_id_;
};

} 
