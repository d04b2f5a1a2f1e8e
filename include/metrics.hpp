#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

namespace turnstile {

using MetricLabels = std::vector<std::pair<std::string, std::string>>;

 
// Singleton Metrics Registry for admission counters and service gauges.
// Series are grouped by family name and exported in Prometheus text format.
class MetricsRegistry {
public:
    /**
     * Access the global instance of the metrics registry.
     */
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        increment_counter(name, {}, value);
    }

    void increment_counter(const std::string& name, const MetricLabels& labels, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][series(labels)] += value;
    }

    // Value of one labelled series.
    double get_counter(const std::string& name, const MetricLabels& labels = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(counters_, name, series(labels));
    }

    // Sum over every series of a family.
    double counter_total(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        if (it == counters_.end()) return 0.0;
        double total = 0.0;
        for (const auto& [labels, val] : it->second) total += val;
        return total;
    }

    // Sets a gauge to a specific instantaneous value.
    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] = value;
    }

    // Adjusts a gauge by a specific offset.
    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] -= value;
    }

    // Retrieves current value of a gauge.
    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(gauges_, name, "");
    }

    // Drops every series. Used by tests.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        
        for (const auto& [name, family] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            for (const auto& [labels, val] : family) {
                ss << name << labels << " " << val << "\n";
            }
        }
        
        for (const auto& [name, family] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            for (const auto& [labels, val] : family) {
                ss << name << labels << " " << val << "\n";
            }
        }
        
        return ss.str();
    }

private:
    using Family = std::map<std::string, double>;

    MetricsRegistry() = default;

    // {k="v",...} with quotes, backslashes and newlines escaped; empty for no labels.
    static std::string series(const MetricLabels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) out += ",";
            out += labels[i].first + "=\"";
            for (char c : labels[i].second) {
                if (c == '\\' || c == '"') out += '\\';
                if (c == '\n') { out += "\\n"; continue; }
                out += c;
            }
            out += "\"";
        }
        return out + "}";
    }

    static double lookup(const std::map<std::string, Family>& families, const std::string& name,
                         const std::string& key) {
        auto it = families.find(name);
        if (it == families.end()) return 0.0;
        auto s = it->second.find(key);
        return (s != it->second.end()) ? s->second : 0.0;
    }

    std::map<std::string, Family> counters_;
    std::map<std::string, Family> gauges_;
    std::mutex mutex_;
};

} 
