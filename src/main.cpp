#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <functional>

#include "server_config.hpp"
#include "http_session.hpp"
#include "memory_store.hpp"
#include "redis_store.hpp"
#include "route_table.hpp"
#include "rate_limit_errors.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace turnstile {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        RouteTable& routes,
        HealthHandler& health
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , routes_(routes)
        , health_(health)
    {
        beast::error_code ec;
        
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }
        
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }
        
        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }
        
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }
    
    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    
    const ServerConfig& config_;
    RouteTable& routes_;
    HealthHandler& health_;
    
    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }
    
    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED,
                                "internal", "Accept error: " + ec.message());
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)),
                config_,
                routes_,
                health_
            )->run();
        }
        
        do_accept();
    }
};

// Header-token keys are only as private as the salt that hashes them.
bool uses_header_tokens(const ServerConfig& config) {
    for (const auto& route : config.routes) {
        for (const auto& limit : route.limits) {
            if (limit.identifier() == IdentifierKind::Header) return true;
            if (limit.identifier() == IdentifierKind::Composite) {
                for (auto part : limit.composite_parts()) {
                    if (part == IdentifierKind::Header) return true;
                }
            }
        }
    }
    return false;
}

} 

int main(int argc, char* argv[]) {
    using turnstile::SecurityLogger;
    try {
        turnstile::ServerConfig config;
        
        // --- Environment Variable Overrides ---
        try {
            config = turnstile::load_config_from_env(config);
        } catch (const turnstile::ConfigError& e) {
            SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", e.what());
            return 1;
        }

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port]\n"
                          << "Configuration is read from TURNSTILE_* environment variables, e.g.\n"
                          << "  TURNSTILE_ROUTES=\"/api=60,1,sliding,ip;/login=5,1\"\n"
                          << "  TURNSTILE_STORE=redis TURNSTILE_REDIS_URL=tcp://127.0.0.1:6379\n";
                return 0;
            }
            try {
                config.port = turnstile::parse_port(arg);
            } catch (const turnstile::ConfigError& e) {
                std::cerr << "[!] Invalid port '" << arg << "': " << e.what() << "\n";
                return 1;
            }
        }
        
        if (config.secret_salt == turnstile::ServerConfig::kDefaultSalt && turnstile::uses_header_tokens(config)) {
            std::cerr << "CRITICAL SECURITY ERROR: DEFAULT SECRET SALT DETECTED\n";
            std::cerr << "Set 'TURNSTILE_SECRET_SALT' before enabling header-token limits.\n";
            return 1;
        }
        
        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }
        
        net::io_context ioc{config.thread_count};
        
        // --- Counter Store ---
        std::unique_ptr<turnstile::CounterStore> store;
        turnstile::MemoryStore* memory_store = nullptr;
        if (config.store_backend == "redis") {
            auto redis = std::make_unique<turnstile::RedisStore>(config.redis_url);
            if (!redis->is_connected()) {
                SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORE_FAILURE,
                                    "internal", "Redis unreachable at startup; requests are admitted unchecked until it recovers");
            }
            store = std::move(redis);
        } else {
            auto memory = std::make_unique<turnstile::MemoryStore>();
            memory_store = memory.get();
            store = std::move(memory);
        }

        turnstile::ResolverDeps deps;
        deps.session_cookie = config.session_cookie;
        deps.token_salt = config.secret_salt;
        deps.ip.ipv4_prefix = config.ipv4_prefix;
        deps.ip.ipv6_prefix = config.ipv6_prefix;

        std::unique_ptr<turnstile::RouteTable> routes;
        try {
            routes = turnstile::RouteTable::build(config, *store, deps);
        } catch (const turnstile::ConfigError& e) {
            SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", e.what());
            return 1;
        }
        turnstile::HealthHandler health(config, *store);

        for (const auto& route : config.routes) {
            for (const auto& limit : route.limits) {
                std::cout << "[*] " << route.prefix << " -> " << limit.describe() << "\n";
            }
        }

        // Memory store entries expire lazily; sweep the rest periodically.
        net::steady_timer purge_timer(ioc, std::chrono::seconds(config.purge_interval_sec));
        std::function<void(beast::error_code)> on_purge;
        on_purge = [&](beast::error_code ec) {
            if (!ec && memory_store) {
                size_t dropped = memory_store->purge_expired();
                turnstile::MetricsRegistry::instance().set_gauge("rate_limit_memory_entries",
                                                                 static_cast<double>(memory_store->size()));
                if (dropped > 0) {
                    std::cout << "[*] Purged " << dropped << " expired counters\n";
                }
                purge_timer.expires_after(std::chrono::seconds(config.purge_interval_sec));
                purge_timer.async_wait(on_purge);
            }
        };
        if (memory_store) {
            purge_timer.async_wait(on_purge);
        }
        
        auto listener = std::make_shared<turnstile::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            *routes,
            health
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Listening on " + config.address + ":" + std::to_string(config.port)
                            + " with " + store->backend() + " store");
        
        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener, &purge_timer](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                beast::error_code ec;
                purge_timer.cancel(ec);
                listener->stop();
                ioc.stop();
            });
        
        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);
        
        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }
        
        ioc.run();
        
        for (auto& t : threads) {
            t.join();
        }
        
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
