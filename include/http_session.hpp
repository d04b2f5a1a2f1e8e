#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <optional>
#include <string>

#include "server_config.hpp"
#include "route_table.hpp"
#include "handlers/health_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace turnstile {

 
// One keep-alive HTTP/1.1 connection. Requests are routed through the
// rate-limit middleware of the matching route before being answered.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        RouteTable& routes,
        HealthHandler& health
    );
    
    ~HttpSession();
    
    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_; 
    
    const ServerConfig& config_;
    RouteTable& routes_;
    HealthHandler& health_handler_;
    
    std::string remote_addr_;
    
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    
    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    
    bool is_loopback_peer() const;

    // Identity asserted by a trusted upstream proxy.
    std::optional<std::string> trusted_user() const;

    http::response<http::string_body> handle_accepted(const ClientRequest& request);
    http::response<http::string_body> handle_not_found();
    http::response<http::string_body> handle_error();
    
    template<class Body>
    void add_security_headers(http::response<Body>& res);
};

} 
