#pragma once
// Retrieval Aggregator: one search() over many providers
//
// search(query, range, max):
//   1. Cache hit -> return it, no provider is touched
//   2. Select providers: preferred list (or every registered one), enabled
//      in config, buildable, healthy; descending priority
//   3. Run them per AggregationMode, charging quota before each call
//      (denied providers are skipped)
//   4. Merge, dedup, sort, truncate; cache non-empty answers
//
// Provider failures are logged and count as empty. Nothing here throws for
// a failed or exhausted provider; the worst answer is an empty list.
//
// The aggregator is itself a SearchProvider ("multi"), so callers that take
// one provider can be handed the whole federation.

#include "provider.hpp"
#include "cache.hpp"
#include "quota.hpp"
#include "registry.hpp"
#include "result_aggregator.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <future>
#include <iostream>
#include <mutex>
#include <set>

namespace hive {

class RetrievalAggregator : public SearchProvider {
public:
    RetrievalAggregator(ProviderRegistry& registry, SearchCache& cache, QuotaManager& quota,
                        RetrievalConfig config = {})
        : registry_(registry), cache_(cache), quota_(quota), config_(std::move(config)) {}

    RetrievalAggregator(const RetrievalAggregator&) = delete;
    RetrievalAggregator& operator=(const RetrievalAggregator&) = delete;

    std::vector<SearchResult> search(const std::string& query, TimeRange time_range,
                                     size_t max_results) override {
        return run(query, time_range, max_results, config_.preferred_providers, config_.mode);
    }

    // Search with the config defaults for range and size
    std::vector<SearchResult> search(const std::string& query) {
        return search(query, config_.time_range, config_.max_results);
    }

    // Search with the profile configured for role (falls back to defaults)
    std::vector<SearchResult> search_as(const std::string& role, const std::string& query,
                                        std::optional<TimeRange> time_range = std::nullopt) {
        TimeRange range = time_range.value_or(config_.time_range);
        auto it = config_.profiles.find(role);
        if (it == config_.profiles.end()) {
            return run(query, range, config_.max_results, config_.preferred_providers, config_.mode);
        }
        const auto& profile = it->second;
        const auto& preferred = profile.preferred_providers.empty()
            ? config_.preferred_providers : profile.preferred_providers;
        return run(query, range, profile.max_results, preferred, profile.mode.value_or(config_.mode));
    }

    // Healthy when at least one provider could be selected
    bool health_check() override {
        return !select(config_.preferred_providers).empty();
    }

    ProviderMetadata metadata() const override {
        ProviderMetadata m;
        m.name = "multi";
        m.supports_time_range = true;
        m.priority = 0;
        m.description = "Federated search over every registered provider";
        return m;
    }

    const RetrievalConfig& config() const { return config_; }
    CacheStats cache_stats() const { return cache_.stats(); }
    std::map<std::string, QuotaStatus> quota_status() { return quota_.all_status(); }
    void clear_cache() { cache_.clear(); }

private:
    struct Candidate {
        std::string name;
        std::shared_ptr<SearchProvider> provider;
        int priority = 0;
    };

    std::vector<SearchResult> run(const std::string& query, TimeRange time_range,
                                  size_t max_results,
                                  const std::vector<std::string>& preferred,
                                  AggregationMode mode) {
        if (auto cached = cache_.get(query, time_range, max_results)) {
            std::cerr << "[Retrieval] Cache hit for \"" << utf8_prefix(query, 50) << "\"\n";
            return *cached;
        }

        auto candidates = select(preferred);
        if (candidates.empty()) {
            std::cerr << "[Retrieval] No search providers available\n";
            return {};
        }

        ProviderResults gathered;
        switch (mode) {
            case AggregationMode::Priority:
                gathered = first_non_empty(candidates, query, time_range, max_results);
                break;
            case AggregationMode::Parallel:
                gathered = fan_out(candidates, config_.max_parallel_providers,
                                   query, time_range, max_results);
                break;
            case AggregationMode::All:
                gathered = fan_out(candidates, candidates.size(), query, time_range, max_results);
                break;
        }

        ResultAggregator merger(config_.deduplication, config_.sort);
        auto merged = merger.aggregate(gathered, max_results);

        if (!merged.results.empty()) {
            cache_.set(query, merged.results, time_range, max_results);
        }
        return merged.results;
    }

    // Enabled, buildable, healthy providers, highest priority first
    std::vector<Candidate> select(const std::vector<std::string>& preferred) {
        std::vector<std::string> names = preferred.empty() ? registry_.list() : preferred;

        std::vector<Candidate> out;
        for (const auto& name : names) {
            auto cfg = config_.providers.find(name);
            if (cfg != config_.providers.end() && !cfg->second.enabled) continue;

            auto provider = registry_.get(name);
            if (!provider) continue;

            bool healthy = false;
            ProviderMetadata meta;
            try {
                healthy = provider->health_check();
                if (healthy) meta = provider->metadata();
            } catch (...) {
                std::cerr << "[Retrieval] Health check failed for " << name << ": "
                          << describe(std::current_exception()) << "\n";
                healthy = false;
            }
            if (!healthy) continue;

            Candidate c;
            c.name = name;
            c.provider = provider;
            c.priority = (cfg != config_.providers.end()) ? cfg->second.priority : meta.priority;
            apply_limits(name, meta, cfg != config_.providers.end() ? &cfg->second : nullptr);
            out.push_back(std::move(c));
        }

        std::stable_sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
            return a.priority > b.priority;
        });
        return out;
    }

    // Push configured (or advertised) limits into the quota manager once
    void apply_limits(const std::string& name, const ProviderMetadata& meta,
                      const ProviderConfig* cfg) {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        if (!limits_applied_.insert(name).second) return;

        std::optional<int> daily = (cfg && cfg->daily_quota) ? cfg->daily_quota : meta.daily_quota;
        std::optional<int> rate = (cfg && cfg->rate_limit) ? cfg->rate_limit : meta.rate_limit;
        if (daily || rate) quota_.configure_provider(name, daily, rate);
    }

    // Call one provider; failures are logged and count as empty
    static std::vector<SearchResult> call(const Candidate& c, const std::string& query,
                                          TimeRange time_range, size_t max_results) {
        try {
            auto results = c.provider->search(query, time_range, max_results);
            std::cerr << "[Retrieval] " << results.size() << " results from " << c.name << "\n";
            return results;
        } catch (...) {
            std::cerr << "[Retrieval] Search with " << c.name << " failed: "
                      << describe(std::current_exception()) << "\n";
            return {};
        }
    }

    ProviderResults first_non_empty(const std::vector<Candidate>& candidates,
                                    const std::string& query, TimeRange time_range,
                                    size_t max_results) {
        ProviderResults out;
        for (const auto& c : candidates) {
            if (!quota_.check_and_consume(c.name)) {
                std::cerr << "[Retrieval] Quota exceeded for " << c.name << ", skipping\n";
                continue;
            }
            auto results = call(c, query, time_range, max_results);
            if (!results.empty()) {
                out.emplace_back(c.name, std::move(results));
                break;
            }
        }
        return out;
    }

    // Up to `limit` quota-permitting providers at once
    ProviderResults fan_out(const std::vector<Candidate>& candidates, size_t limit,
                            const std::string& query, TimeRange time_range,
                            size_t max_results) {
        std::vector<const Candidate*> chosen;
        for (const auto& c : candidates) {
            if (chosen.size() >= limit) break;
            if (!quota_.check_and_consume(c.name)) {
                std::cerr << "[Retrieval] Quota exceeded for " << c.name << ", skipping\n";
                continue;
            }
            chosen.push_back(&c);
        }

        std::vector<std::future<std::vector<SearchResult>>> pending;
        pending.reserve(chosen.size());
        for (const auto* c : chosen) {
            pending.push_back(std::async(std::launch::async, [c, &query, time_range, max_results]() {
                return call(*c, query, time_range, max_results);
            }));
        }

        ProviderResults out;
        for (size_t i = 0; i < chosen.size(); ++i) {
            auto results = pending[i].get();
            if (!results.empty()) out.emplace_back(chosen[i]->name, std::move(results));
        }
        return out;
    }

    ProviderRegistry& registry_;
    SearchCache& cache_;
    QuotaManager& quota_;
    RetrievalConfig config_;
    std::mutex limits_mutex_;
    std::set<std::string> limits_applied_;
};

} // namespace hive
