#include "http_session.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <iostream>

namespace json = boost::json;

namespace turnstile {

HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    RouteTable& routes,
    HealthHandler& health
)
    : stream_(std::move(stream))
    , config_(config)
    , routes_(routes)
    , health_handler_(health)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "" : ep.address().to_string();
    MetricsRegistry::instance().increment_gauge("http_active_sessions");
}

HttpSession::~HttpSession() {
    MetricsRegistry::instance().decrement_gauge("http_active_sessions");
}

void HttpSession::run() {
    // Dispatch onto the strand the acceptor assigned to this socket.
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};
    
    // Enforce connection timeout to prevent slow-loris attacks
    stream_.expires_after(std::chrono::seconds(config_.connection_timeout_sec));
    
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    auto self = shared_from_this();
    http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

void HttpSession::on_read(beast::error_code ec, std::size_t  ) {
    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        if (ec == http::error::body_limit) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                remote_addr_, "Request body over limit");
        }
        return;
    }
    
    req_ = parser_->release();
    handle_request();
}

bool HttpSession::is_loopback_peer() const {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(remote_addr_, ec);
    if (ec) {
        return false;
    }
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return net::ip::make_address_v4(net::ip::v4_mapped, addr.to_v6()).is_loopback();
    }
    return addr.is_loopback();
}

std::optional<std::string> HttpSession::trusted_user() const {
    if (config_.trusted_user_header.empty() || !is_loopback_peer()) {
        return std::nullopt;
    }
    auto it = req_.find(config_.trusted_user_header);
    if (it == req_.end() || it->value().empty()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

void HttpSession::handle_request() {
    auto target = req_.target();
    auto method = req_.method();

    // --- Operational endpoints, never throttled ---
    if (target == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
        return;
    }
    if (target == "/metrics" && method == http::verb::get) {
        if (is_loopback_peer() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }
        return;
    }

    // --- Protected routes ---
    RateLimitMiddleware* middleware = routes_.match(std::string_view(target.data(), target.size()));
    if (!middleware) {
        send_response(handle_not_found());
        return;
    }

    ClientRequest request(req_, remote_addr_, trusted_user());
    try {
        auto res = middleware->handle(request, [this](const ClientRequest& r) {
            return handle_accepted(r);
        });
        add_security_headers(res);
        send_response(std::move(res));
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE,
                            remote_addr_, std::string("Request handling failed: ") + e.what());
        send_response(handle_error());
    }
}

http::response<http::string_body> HttpSession::handle_accepted(const ClientRequest& request) {
    json::object response;
    response["status"] = "ok";
    response["path"] = request.target();

    http::response<http::string_body> res{http::status::ok, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req_.keep_alive());
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";
    
    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req_.keep_alive());
    res.body() = json::serialize(response);
    res.prepare_payload();
    
    add_security_headers(res);
    
    return res;
}

http::response<http::string_body> HttpSession::handle_error() {
    json::object response;
    response["error"] = "Internal Server Error";

    http::response<http::string_body> res{http::status::internal_server_error, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "Turnstile/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("Cache-Control", "no-store");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    
    auto self = shared_from_this();
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t  ) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }
    
    if (close) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    
    do_read();
}

}
