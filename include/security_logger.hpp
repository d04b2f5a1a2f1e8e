#pragma once

#include <string>
#include <cctype>
#include <exception>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace turnstile {

// Logs rate-limiting events using blinded client identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        RATE_LIMIT_HIT,
        STORE_FAILURE,
        CONFIG_ERROR,
        KEY_FALLBACK,
        CONNECTION_REJECTED,
        LIFECYCLE
    };
    
    /**
     * Records a rate-limiting event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param subject Client address or rate-limit key (blinded before logging).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject, 
                   const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "id=" << blind(subject);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        // Log to appropriate destination based on severity
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    // Subjects that are not client identifiers are logged verbatim.
    static std::string blind(const std::string& subject) {
        if (subject.empty() || subject == "unknown" || subject == "internal") {
            return subject.empty() ? "none" : subject;
        }

        // The salt is regenerated every 6 hours so that past log lines cannot
        // be linked to clients once the salt is gone.
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                    std::terminate(); 
                }
                std::stringstream salt_ss;
                for(int i=0; i<32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;
            }
            salt = log_salt;
        }

        std::string data = subject + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
        
        std::stringstream hs;
        for(int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
    
private:
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
    
    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::STORE_FAILURE: return "STORE_FAILURE";
            case EventType::CONFIG_ERROR: return "CONFIG_ERROR";
            case EventType::KEY_FALLBACK: return "KEY_FALLBACK";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
