#pragma once
// Search providers: the pluggable edge of retrieval
//
// A provider wraps one external search backend. It may throw, time out or
// return nothing; the aggregator treats all three the same way.

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hive {

using json = nlohmann::json;

// Time window a query is restricted to
enum class TimeRange : uint8_t {
    OneDay = 0,
    OneWeek = 1,
    OneMonth = 2,
    OneYear = 3,
    NoLimit = 4,
};

inline std::string time_range_name(TimeRange range) {
    switch (range) {
        case TimeRange::OneDay: return "oneDay";
        case TimeRange::OneWeek: return "oneWeek";
        case TimeRange::OneMonth: return "oneMonth";
        case TimeRange::OneYear: return "oneYear";
        case TimeRange::NoLimit: return "noLimit";
    }
    return "oneYear";
}

inline std::optional<TimeRange> parse_time_range(const std::string& s) {
    if (s == "oneDay") return TimeRange::OneDay;
    if (s == "oneWeek") return TimeRange::OneWeek;
    if (s == "oneMonth") return TimeRange::OneMonth;
    if (s == "oneYear") return TimeRange::OneYear;
    if (s == "noLimit") return TimeRange::NoLimit;
    return std::nullopt;
}

// How providers are picked for a query
enum class AggregationMode : uint8_t {
    Priority = 0,   // First non-empty provider wins
    Parallel = 1,   // Up to K providers at once
    All = 2,        // Every healthy provider
};

inline std::string aggregation_mode_name(AggregationMode mode) {
    switch (mode) {
        case AggregationMode::Priority: return "priority";
        case AggregationMode::Parallel: return "parallel";
        case AggregationMode::All: return "all";
    }
    return "priority";
}

inline std::optional<AggregationMode> parse_aggregation_mode(const std::string& s) {
    if (s == "priority") return AggregationMode::Priority;
    if (s == "parallel") return AggregationMode::Parallel;
    if (s == "all") return AggregationMode::All;
    return std::nullopt;
}

// Ordering of merged results
enum class SortStrategy : uint8_t {
    Score = 0,
    Latest = 1,
    Diverse = 2,
};

inline std::string sort_strategy_name(SortStrategy s) {
    switch (s) {
        case SortStrategy::Score: return "score";
        case SortStrategy::Latest: return "latest";
        case SortStrategy::Diverse: return "diverse";
    }
    return "score";
}

inline std::optional<SortStrategy> parse_sort_strategy(const std::string& s) {
    if (s == "score") return SortStrategy::Score;
    if (s == "latest") return SortStrategy::Latest;
    if (s == "diverse") return SortStrategy::Diverse;
    return std::nullopt;
}

// One hit from one provider
struct SearchResult {
    std::string url;
    std::string title;
    std::string summary;
    std::string site_name;
    std::string published_date;   // ISO date, empty when unknown
    float score = 0.0f;           // Provider relevance
    std::string provider;         // Stamped by the aggregator
};

inline void to_json(json& j, const SearchResult& r) {
    j = json{
        {"url", r.url},
        {"title", r.title},
        {"summary", r.summary},
        {"site_name", r.site_name},
        {"published_date", r.published_date},
        {"score", r.score},
        {"provider", r.provider}
    };
}

inline void from_json(const json& j, SearchResult& r) {
    r.url = j.at("url").get<std::string>();
    r.title = j.value("title", "");
    r.summary = j.value("summary", "");
    r.site_name = j.value("site_name", "");
    r.published_date = j.value("published_date", "");
    r.score = j.value("score", 0.0f);
    r.provider = j.value("provider", "");
}

// Static description of a provider's capabilities
struct ProviderMetadata {
    std::string name;
    std::optional<int> rate_limit;    // Requests per minute, none = unlimited
    std::optional<int> daily_quota;   // Requests per day, none = unlimited
    bool supports_time_range = false;
    int priority = 0;                 // Higher is tried first
    std::string description;
};

// Backend interface
class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    virtual std::vector<SearchResult> search(const std::string& query,
                                             TimeRange time_range,
                                             size_t max_results) = 0;
    virtual bool health_check() = 0;
    virtual ProviderMetadata metadata() const = 0;
};

} // namespace hive
