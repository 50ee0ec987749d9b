#pragma once
// Hive configuration: one struct per component, defaults in-class
//
// Components take their own struct by value. HiveConfig bundles them for
// applications that keep everything in one JSON document; missing keys keep
// their defaults.

#include "types.hpp"
#include "retrieval/provider.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hive {

using json = nlohmann::json;

struct SchedulerConfig {
    size_t max_concurrent = 4;           // Worker bench size
    int64_t timeout_ms = 300000;         // Per attempt, 0 = unbounded
    uint32_t max_retries = 1;            // Extra attempts after the first
    int64_t backoff_base_ms = 2000;      // Delay scale between attempts
    double backoff_multiplier = 2.0;     // Growth per retry
    int64_t backoff_cap_ms = 30000;      // Never wait longer than this
    bool drain_handoffs = true;          // Run one wave of HIGH+ handoffs
};

struct StoreConfig {
    std::string snapshot_path = "data/cache/environment.json";
};

struct CacheConfig {
    bool enabled = true;
    int64_t ttl_seconds = 3600;
    std::string path = "data/cache/search.db";  // Empty = memory only
};

struct QuotaConfig {
    bool enabled = true;
    std::string path = "data/cache/quota.json";  // Empty = memory only
};

struct ProviderConfig {
    bool enabled = true;
    int priority = 10;
    std::optional<int> daily_quota;
    std::optional<int> rate_limit;
};

// Per-role retrieval preferences
struct SearchProfile {
    std::vector<std::string> preferred_providers;
    size_t max_results = 10;
    std::optional<AggregationMode> mode;   // Overrides RetrievalConfig::mode
};

struct RetrievalConfig {
    AggregationMode mode = AggregationMode::Priority;
    size_t max_parallel_providers = 2;
    bool deduplication = true;
    SortStrategy sort = SortStrategy::Score;
    size_t max_results = 10;
    TimeRange time_range = TimeRange::OneYear;
    std::vector<std::string> preferred_providers;   // Empty = all registered
    std::map<std::string, ProviderConfig> providers;
    std::map<std::string, SearchProfile> profiles;
};

struct HiveConfig {
    SchedulerConfig scheduler;
    StoreConfig store;
    CacheConfig cache;
    QuotaConfig quota;
    RetrievalConfig retrieval;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

template <typename T>
std::optional<T> optional_value(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

// Counts are read signed so negative input clamps instead of wrapping
template <typename T>
T count_value(const json& j, const char* key, T fallback, T minimum) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    int64_t v = j.at(key).get<int64_t>();
    if (v < static_cast<int64_t>(minimum)) {
        std::cerr << "[Config] " << key << " = " << v << " out of range, using " << minimum << "\n";
        return minimum;
    }
    return static_cast<T>(v);
}

} // namespace detail

inline void from_json(const json& j, SchedulerConfig& c) {
    c.max_concurrent = detail::count_value<size_t>(j, "max_concurrent", c.max_concurrent, 1);
    c.timeout_ms = j.value("timeout_ms", c.timeout_ms);
    c.max_retries = detail::count_value<uint32_t>(j, "max_retries", c.max_retries, 0);
    c.backoff_base_ms = j.value("backoff_base_ms", c.backoff_base_ms);
    c.backoff_multiplier = j.value("backoff_multiplier", c.backoff_multiplier);
    c.backoff_cap_ms = j.value("backoff_cap_ms", c.backoff_cap_ms);
    c.drain_handoffs = j.value("drain_handoffs", c.drain_handoffs);
}

inline void from_json(const json& j, StoreConfig& c) {
    c.snapshot_path = j.value("snapshot_path", c.snapshot_path);
}

inline void from_json(const json& j, CacheConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.ttl_seconds = j.value("ttl_seconds", c.ttl_seconds);
    c.path = j.value("path", c.path);
}

inline void from_json(const json& j, QuotaConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.path = j.value("path", c.path);
}

inline void from_json(const json& j, ProviderConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.priority = j.value("priority", c.priority);
    c.daily_quota = detail::optional_value<int>(j, "daily_quota");
    c.rate_limit = detail::optional_value<int>(j, "rate_limit");
}

inline void from_json(const json& j, SearchProfile& p) {
    p.preferred_providers = j.value("preferred_providers", p.preferred_providers);
    p.max_results = detail::count_value<size_t>(j, "max_results", p.max_results, 1);
    if (j.contains("mode") && j.at("mode").is_string()) {
        p.mode = parse_aggregation_mode(j.at("mode").get<std::string>());
    }
}

inline void from_json(const json& j, RetrievalConfig& c) {
    if (j.contains("mode")) {
        auto mode = parse_aggregation_mode(j.at("mode").get<std::string>());
        if (mode) c.mode = *mode;
    }
    if (j.contains("sort")) {
        auto sort = parse_sort_strategy(j.at("sort").get<std::string>());
        if (sort) c.sort = *sort;
    }
    if (j.contains("time_range")) {
        auto range = parse_time_range(j.at("time_range").get<std::string>());
        if (range) c.time_range = *range;
    }
    c.max_parallel_providers = detail::count_value<size_t>(
        j, "max_parallel_providers", c.max_parallel_providers, 1);
    c.deduplication = j.value("deduplication", c.deduplication);
    c.max_results = detail::count_value<size_t>(j, "max_results", c.max_results, 1);
    c.preferred_providers = j.value("preferred_providers", c.preferred_providers);
    if (j.contains("providers")) {
        for (const auto& [name, pj] : j.at("providers").items()) {
            c.providers[name] = pj.get<ProviderConfig>();
        }
    }
    if (j.contains("profiles")) {
        for (const auto& [role, pj] : j.at("profiles").items()) {
            c.profiles[role] = pj.get<SearchProfile>();
        }
    }
}

inline void from_json(const json& j, HiveConfig& c) {
    if (j.contains("scheduler")) c.scheduler = j.at("scheduler").get<SchedulerConfig>();
    if (j.contains("store")) c.store = j.at("store").get<StoreConfig>();
    if (j.contains("cache")) c.cache = j.at("cache").get<CacheConfig>();
    if (j.contains("quota")) c.quota = j.at("quota").get<QuotaConfig>();
    if (j.contains("retrieval")) c.retrieval = j.at("retrieval").get<RetrievalConfig>();
}

// Parse a configuration document; nullopt (and a log line) when malformed
inline std::optional<HiveConfig> parse_config(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[Config] Top-level value must be an object\n";
            return std::nullopt;
        }
        return j.get<HiveConfig>();
    } catch (const json::exception& e) {
        std::cerr << "[Config] Invalid configuration: " << e.what() << "\n";
        return std::nullopt;
    }
}

inline std::optional<HiveConfig> load_config(const std::string& path) {
    auto text = read_text(path);
    if (!text) {
        std::cerr << "[Config] Cannot read " << path << "\n";
        return std::nullopt;
    }
    return parse_config(*text);
}

} // namespace hive
