#pragma once
// Quota Manager: per-provider daily quotas and per-minute rate limits
//
// Each provider carries two counters:
//   - daily: resets when the local calendar date changes
//   - rate window: 60 seconds, resets once elapsed
// check_and_consume() denies (never throws) when either would be exceeded,
// and consumes from both otherwise.
//
// State is written to a JSON file after every decision so a restarted
// process honours what was already spent today.

#include "../types.hpp"
#include "../config.hpp"
#include "../version.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>

namespace hive {

using json = nlohmann::json;

struct QuotaStatus {
    std::string provider;
    std::optional<int> daily_limit;
    int daily_used = 0;
    std::optional<int> daily_remaining;   // None when unlimited
    std::optional<int> rate_limit;        // Requests per minute
    int rate_window_used = 0;
    std::string reset_date;               // Local date the daily counter last reset
};

class QuotaManager {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr Timestamp WINDOW_MS = 60 * MS_PER_SECOND;

    explicit QuotaManager(QuotaConfig config = {})
        : config_(std::move(config)), clock_(now) {
        if (config_.enabled && !config_.path.empty()) {
            load();
        }
    }

    QuotaManager(const QuotaManager&) = delete;
    QuotaManager& operator=(const QuotaManager&) = delete;

    void set_clock(Clock clock) {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = std::move(clock);
    }

    bool enabled() const { return config_.enabled; }

    // Set limits for a provider; nullopt means unlimited
    void configure_provider(const std::string& provider,
                            std::optional<int> daily_limit,
                            std::optional<int> rate_limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& q = providers_[provider];
        q.daily_limit = daily_limit;
        q.rate_limit = rate_limit;
    }

    // Charge cost units; false (nothing charged) when a limit would be
    // exceeded or cost is not positive
    bool check_and_consume(const std::string& provider, int cost = 1) {
        if (cost <= 0) {
            std::cerr << "[QuotaManager] Rejected non-positive cost " << cost
                      << " for " << provider << "\n";
            return false;
        }
        if (!config_.enabled) return true;

        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp t = clock_();
        check_daily_reset(t);

        auto& q = providers_[provider];
        bool allowed = true;

        if (q.daily_limit && q.daily_used + cost > *q.daily_limit) {
            std::cerr << "[QuotaManager] Daily quota exceeded for " << provider
                      << " (" << q.daily_used << "/" << *q.daily_limit << ")\n";
            allowed = false;
        }

        if (allowed && q.rate_limit) {
            if (q.window_start == 0 || t - q.window_start >= WINDOW_MS) {
                q.rate_window_used = 0;
                q.window_start = t;
            }
            if (q.rate_window_used + cost > *q.rate_limit) {
                std::cerr << "[QuotaManager] Rate limit exceeded for " << provider
                          << " (" << q.rate_window_used << "/" << *q.rate_limit << " per 60s)\n";
                allowed = false;
            }
        }

        if (allowed) {
            q.daily_used += cost;
            if (q.window_start == 0) q.window_start = t;
            q.rate_window_used += cost;
        }

        save_locked();
        return allowed;
    }

    QuotaStatus status(const std::string& provider) {
        std::lock_guard<std::mutex> lock(mutex_);
        check_daily_reset(clock_());
        return status_locked(provider);
    }

    // Status of every provider seen so far
    std::map<std::string, QuotaStatus> all_status() {
        std::lock_guard<std::mutex> lock(mutex_);
        check_daily_reset(clock_());
        std::map<std::string, QuotaStatus> result;
        for (const auto& [name, _] : providers_) {
            result[name] = status_locked(name);
        }
        return result;
    }

    // Zero daily usage for one provider, or all of them
    void reset_daily(const std::optional<std::string>& provider = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, q] : providers_) {
            if (provider && name != *provider) continue;
            q.daily_used = 0;
        }
        save_locked();
    }

    void reset_rate_window(const std::optional<std::string>& provider = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, q] : providers_) {
            if (provider && name != *provider) continue;
            q.rate_window_used = 0;
            q.window_start = 0;
        }
        save_locked();
    }

private:
    struct ProviderQuota {
        int daily_used = 0;
        std::optional<int> daily_limit;
        int rate_window_used = 0;
        std::optional<int> rate_limit;
        Timestamp window_start = 0;
    };

    // Caller holds the lock
    void check_daily_reset(Timestamp t) {
        std::string today = local_date(t);
        if (last_reset_date_ == today) return;

        for (auto& [_, q] : providers_) {
            q.daily_used = 0;
            q.rate_window_used = 0;
            q.window_start = 0;
        }
        if (!last_reset_date_.empty()) {
            std::cerr << "[QuotaManager] New day " << today << ", daily quotas reset\n";
        }
        last_reset_date_ = today;
        save_locked();
    }

    QuotaStatus status_locked(const std::string& provider) const {
        QuotaStatus s;
        s.provider = provider;
        s.reset_date = last_reset_date_;
        auto it = providers_.find(provider);
        if (it == providers_.end()) return s;

        const auto& q = it->second;
        s.daily_limit = q.daily_limit;
        s.daily_used = q.daily_used;
        if (q.daily_limit) s.daily_remaining = std::max(0, *q.daily_limit - q.daily_used);
        s.rate_limit = q.rate_limit;
        s.rate_window_used = q.rate_window_used;
        return s;
    }

    static json optional_int(const std::optional<int>& v) {
        return v ? json(*v) : json();
    }

    bool save_locked() const {
        if (config_.path.empty()) return true;

        json providers = json::object();
        for (const auto& [name, q] : providers_) {
            providers[name] = {
                {"daily_used", q.daily_used},
                {"daily_limit", optional_int(q.daily_limit)},
                {"rate_window_used", q.rate_window_used},
                {"rate_limit", optional_int(q.rate_limit)},
                {"window_start", q.window_start}
            };
        }
        json doc = {
            {"version", HIVE_QUOTA_FILE_VERSION},
            {"last_reset_date", last_reset_date_},
            {"providers", providers}
        };

        ensure_parent_dir(config_.path);
        if (!safe_save_text(config_.path, doc.dump(2))) {
            std::cerr << "[QuotaManager] Failed to save quota state to " << config_.path << "\n";
            return false;
        }
        return true;
    }

    void load() {
        auto text = read_text(config_.path);
        if (!text) return;   // First run

        try {
            json doc = json::parse(*text);
            if (doc.value("version", 0) != HIVE_QUOTA_FILE_VERSION) {
                std::cerr << "[QuotaManager] Ignoring quota file with unknown version\n";
                return;
            }
            last_reset_date_ = doc.value("last_reset_date", "");
            json providers = doc.value("providers", json::object());
            for (const auto& [name, pj] : providers.items()) {
                ProviderQuota q;
                q.daily_used = pj.value("daily_used", 0);
                q.rate_window_used = pj.value("rate_window_used", 0);
                q.window_start = pj.value("window_start", Timestamp(0));
                if (pj.contains("daily_limit") && !pj.at("daily_limit").is_null()) {
                    q.daily_limit = pj.at("daily_limit").get<int>();
                }
                if (pj.contains("rate_limit") && !pj.at("rate_limit").is_null()) {
                    q.rate_limit = pj.at("rate_limit").get<int>();
                }
                providers_[name] = q;
            }
        } catch (const json::exception& e) {
            std::cerr << "[QuotaManager] Corrupt quota file " << config_.path << ": " << e.what() << "\n";
            providers_.clear();
            last_reset_date_.clear();
        }
    }

    QuotaConfig config_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, ProviderQuota> providers_;
    std::string last_reset_date_;
};

} // namespace hive
