#include "rate_limit_headers.hpp"

namespace turnstile {

RateLimitHeaders::RateLimitHeaders(HeaderNames names)
    : names_(std::move(names))
{}

std::vector<std::pair<std::string, std::string>> RateLimitHeaders::fields(const RateLimitResult& result) const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(4);
    out.emplace_back(names_.limit, std::to_string(result.limit));
    out.emplace_back(names_.remaining, std::to_string(result.allowed ? result.remaining : 0));
    out.emplace_back(names_.reset, std::to_string(result.reset_time));
    if (!result.allowed) {
        out.emplace_back(names_.retry_after, std::to_string(result.retry_after.value_or(1)));
    }
    return out;
}

}
