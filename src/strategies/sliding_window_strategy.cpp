#include "strategies/sliding_window_strategy.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <utility>

#include <boost/json.hpp>

namespace turnstile {

namespace json = boost::json;

SlidingWindowStrategy::SlidingWindowStrategy(CounterStore& store, std::string key_prefix)
    : RateLimitStrategy(store, std::move(key_prefix))
{}

std::vector<Timestamp> SlidingWindowStrategy::load_live(const std::string& record, int window_sec, Timestamp now) {
    std::vector<Timestamp> stamps;
    auto raw = store_.get(record);
    if (!raw) {
        return stamps;
    }

    try {
        json::value doc = json::parse(*raw);
        for (const auto& item : doc.as_array()) {
            stamps.push_back(json::value_to<Timestamp>(item));
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_FAILURE,
                            "internal", std::string("Discarding malformed sliding window record: ") + e.what());
        return {};
    }

    const Timestamp cutoff = now - window_sec;
    stamps.erase(std::remove_if(stamps.begin(), stamps.end(),
                                [cutoff](Timestamp t) { return t < cutoff; }),
                 stamps.end());
    std::sort(stamps.begin(), stamps.end());
    return stamps;
}

RateLimitResult SlidingWindowStrategy::attempt(const std::string& key, int limit, int window_sec, Timestamp now) {
    const std::string record = record_key(key);
    std::vector<Timestamp> stamps = load_live(record, window_sec, now);

    if (stamps.size() >= static_cast<size_t>(limit)) {
        const Timestamp reset = stamps.front() + window_sec;
        return RateLimitResult::denied(limit, reset, std::max<long long>(1, reset - now), key, name());
    }

    stamps.insert(std::upper_bound(stamps.begin(), stamps.end(), now), now);

    json::array out;
    out.reserve(stamps.size());
    for (Timestamp t : stamps) {
        out.emplace_back(t);
    }
    store_.put(record, json::serialize(out), record_ttl(window_sec, 1, kTtlSlackSec));

    const int left = limit - static_cast<int>(stamps.size());
    return RateLimitResult::admitted(limit, left, stamps.front() + window_sec, key, name());
}

bool SlidingWindowStrategy::clear(const std::string& key, int /*window_sec*/, Timestamp /*now*/) {
    return store_.forget(record_key(key));
}

RateLimitUsage SlidingWindowStrategy::usage(const std::string& key, int /*limit*/, int window_sec, Timestamp now) {
    const std::vector<Timestamp> stamps = load_live(record_key(key), window_sec, now);

    RateLimitUsage u;
    u.count = static_cast<long long>(stamps.size());
    u.tokens = static_cast<double>(u.count);
    u.window_start = now - window_sec;
    u.window_end = stamps.empty() ? now : stamps.front() + window_sec;
    return u;
}

}
