#pragma once
// Result Aggregator: merge, deduplicate and rank results from many providers
//
// Dedup key is the normalized URL:
//   - lower-cased, scheme forced to https
//   - utm_*, fbclid=, gclid= query parameters dropped
//   - fragment dropped
// On collision the higher-scored result survives, in the slot the URL was
// first seen at.

#include "provider.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hive {

// Results of one provider, in the order providers were consulted
using ProviderResults = std::vector<std::pair<std::string, std::vector<SearchResult>>>;

struct AggregatedResult {
    std::vector<SearchResult> results;
    size_t total_count = 0;                        // Before dedup
    std::map<std::string, size_t> provider_counts;
    size_t deduped_count = 0;                      // After dedup, before truncation
};

inline bool is_tracking_param(const std::string& param) {
    return param.find("utm_") != std::string::npos ||
           param.find("fbclid=") != std::string::npos ||
           param.find("gclid=") != std::string::npos;
}

inline std::string normalize_url(const std::string& url) {
    std::string s = url;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Fragment
    auto hash = s.find('#');
    if (hash != std::string::npos) s.resize(hash);

    // Scheme
    auto scheme_end = s.find("://");
    std::string rest = (scheme_end == std::string::npos) ? s : s.substr(scheme_end + 3);

    // Query
    std::string query;
    auto q = rest.find('?');
    if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest.resize(q);
    }

    std::string kept;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        if (amp == std::string::npos) amp = query.size();
        std::string param = query.substr(start, amp - start);
        if (!param.empty() && !is_tracking_param(param)) {
            if (!kept.empty()) kept += '&';
            kept += param;
        }
        start = amp + 1;
    }

    std::string out = "https://" + rest;
    if (!kept.empty()) out += "?" + kept;
    return out;
}

class ResultAggregator {
public:
    explicit ResultAggregator(bool deduplication = true, SortStrategy sort = SortStrategy::Score)
        : deduplication_(deduplication), sort_(sort) {}

    AggregatedResult aggregate(const ProviderResults& provider_results,
                               size_t max_results = 10) const {
        AggregatedResult out;
        std::vector<SearchResult> all;

        for (const auto& [provider, results] : provider_results) {
            for (const auto& r : results) {
                SearchResult tagged = r;
                tagged.provider = provider;
                all.push_back(std::move(tagged));
            }
            out.provider_counts[provider] += results.size();
        }
        out.total_count = all.size();

        if (deduplication_) all = deduplicate(std::move(all));
        out.deduped_count = all.size();

        all = sorted(std::move(all), sort_);
        if (all.size() > max_results) all.resize(max_results);
        out.results = std::move(all);
        return out;
    }

    static std::vector<SearchResult> deduplicate(std::vector<SearchResult> results) {
        std::vector<SearchResult> kept;
        std::unordered_map<std::string, size_t> seen;   // normalized url -> index in kept
        for (auto& r : results) {
            std::string key = normalize_url(r.url);
            auto it = seen.find(key);
            if (it == seen.end()) {
                seen.emplace(key, kept.size());
                kept.push_back(std::move(r));
            } else if (r.score > kept[it->second].score) {
                kept[it->second] = std::move(r);
            }
        }
        return kept;
    }

    static std::vector<SearchResult> sorted(std::vector<SearchResult> results, SortStrategy strategy) {
        switch (strategy) {
            case SortStrategy::Latest: return by_date(std::move(results));
            case SortStrategy::Diverse: return by_diversity(std::move(results));
            case SortStrategy::Score: break;
        }
        return by_score(std::move(results));
    }

private:
    static std::vector<SearchResult> by_score(std::vector<SearchResult> results) {
        std::stable_sort(results.begin(), results.end(),
                         [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });
        return results;
    }

    // Dated results first, newest first; undated keep their order
    static std::vector<SearchResult> by_date(std::vector<SearchResult> results) {
        std::stable_sort(results.begin(), results.end(),
                         [](const SearchResult& a, const SearchResult& b) {
            bool da = !a.published_date.empty();
            bool db = !b.published_date.empty();
            if (da != db) return da;
            return a.published_date > b.published_date;
        });
        return results;
    }

    // Round-robin across providers (first-seen order), each score-sorted
    static std::vector<SearchResult> by_diversity(std::vector<SearchResult> results) {
        std::vector<std::string> order;
        std::unordered_map<std::string, std::vector<SearchResult>> groups;
        for (auto& r : results) {
            auto it = groups.find(r.provider);
            if (it == groups.end()) {
                order.push_back(r.provider);
                it = groups.emplace(r.provider, std::vector<SearchResult>{}).first;
            }
            it->second.push_back(std::move(r));
        }

        size_t longest = 0;
        for (auto& [_, group] : groups) {
            group = by_score(std::move(group));
            longest = std::max(longest, group.size());
        }

        std::vector<SearchResult> out;
        out.reserve(results.size());
        for (size_t i = 0; i < longest; ++i) {
            for (const auto& provider : order) {
                auto& group = groups[provider];
                if (i < group.size()) out.push_back(std::move(group[i]));
            }
        }
        return out;
    }

    bool deduplication_;
    SortStrategy sort_;
};

} // namespace hive
