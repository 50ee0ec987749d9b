#pragma once
// Search Cache: TTL-bounded memo of retrieval results
//
// Key: fingerprint(query, time_range, max_results), FNV-1a-64 as hex.
// Entries live in memory and are written through to SQLite so they survive
// a restart:
//
//   search_cache(fingerprint TEXT PRIMARY KEY, results TEXT,
//                cached_at INTEGER, ttl INTEGER)
//
// cached_at is Unix millis, ttl is seconds. An empty path keeps the cache in
// memory only. A database that cannot be opened degrades to the same.

#include "provider.hpp"
#include "../config.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace hive {

using json = nlohmann::json;

struct CacheEntry {
    std::vector<SearchResult> results;
    Timestamp cached_at = 0;
    int64_t ttl_seconds = 0;

    bool expired(Timestamp t) const {
        return t - cached_at > ttl_seconds * MS_PER_SECOND;
    }
};

struct CacheStats {
    bool enabled = false;
    bool persistent = false;      // Backed by SQLite
    size_t entries = 0;
    size_t expired = 0;
    size_t cached_results = 0;
    std::string path;
};

class SearchCache {
public:
    using Clock = std::function<Timestamp()>;

    explicit SearchCache(CacheConfig config = {})
        : config_(std::move(config)), clock_(now) {
        if (config_.enabled && !config_.path.empty()) {
            open_db();
        }
    }

    ~SearchCache() {
        if (db_) sqlite3_close(db_);
    }

    SearchCache(const SearchCache&) = delete;
    SearchCache& operator=(const SearchCache&) = delete;

    // Replace the time source (tests drive expiry with a fake clock)
    void set_clock(Clock clock) {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = std::move(clock);
    }

    bool enabled() const { return config_.enabled; }
    bool persistent() const { return db_ != nullptr; }

    static std::string fingerprint(const std::string& query, TimeRange time_range,
                                   size_t max_results) {
        return to_hex(fnv1a64(query + ":" + time_range_name(time_range) + ":" +
                              std::to_string(max_results)));
    }

    // Cached results, nullopt on miss or expiry (expired entries are evicted)
    std::optional<std::vector<SearchResult>> get(const std::string& query,
                                                 TimeRange time_range,
                                                 size_t max_results) {
        if (!config_.enabled) return std::nullopt;

        std::string key = fingerprint(query, time_range, max_results);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;

        if (it->second.expired(clock_())) {
            entries_.erase(it);
            delete_row(key);
            return std::nullopt;
        }
        return it->second.results;
    }

    void set(const std::string& query, std::vector<SearchResult> results,
             TimeRange time_range, size_t max_results,
             std::optional<int64_t> ttl_seconds = std::nullopt) {
        if (!config_.enabled) return;

        std::string key = fingerprint(query, time_range, max_results);
        std::lock_guard<std::mutex> lock(mutex_);

        CacheEntry entry;
        entry.results = std::move(results);
        entry.cached_at = clock_();
        entry.ttl_seconds = ttl_seconds.value_or(config_.ttl_seconds);

        write_row(key, entry);
        entries_[key] = std::move(entry);
    }

    bool invalidate(const std::string& query, TimeRange time_range, size_t max_results) {
        if (!config_.enabled) return false;

        std::string key = fingerprint(query, time_range, max_results);
        std::lock_guard<std::mutex> lock(mutex_);
        bool found = entries_.erase(key) > 0;
        delete_row(key);
        return found;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        exec("DELETE FROM search_cache");
    }

    // Evict every expired entry; returns how many went
    size_t cleanup_expired() {
        if (!config_.enabled) return 0;

        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp t = clock_();
        size_t count = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.expired(t)) {
                delete_row(it->first);
                it = entries_.erase(it);
                count++;
            } else {
                ++it;
            }
        }
        return count;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s;
        s.enabled = config_.enabled;
        s.persistent = db_ != nullptr;
        s.path = config_.path;
        s.entries = entries_.size();
        Timestamp t = clock_();
        for (const auto& [_, e] : entries_) {
            if (e.expired(t)) s.expired++;
            s.cached_results += e.results.size();
        }
        return s;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    void open_db() {
        ensure_parent_dir(config_.path);
        if (sqlite3_open_v2(config_.path.c_str(), &db_,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                            nullptr) != SQLITE_OK) {
            std::cerr << "[SearchCache] Cannot open " << config_.path << ": "
                      << (db_ ? sqlite3_errmsg(db_) : "out of memory") << ", memory only\n";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            return;
        }

        if (!exec("CREATE TABLE IF NOT EXISTS search_cache ("
                  "fingerprint TEXT PRIMARY KEY, "
                  "results TEXT NOT NULL, "
                  "cached_at INTEGER NOT NULL, "
                  "ttl INTEGER NOT NULL)")) {
            sqlite3_close(db_);
            db_ = nullptr;
            return;
        }

        load_rows();
    }

    // Pull surviving rows into memory; drop rows that expired while we were down
    void load_rows() {
        const char* sql = "SELECT fingerprint, results, cached_at, ttl FROM search_cache";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[SearchCache] Error preparing load: " << sqlite3_errmsg(db_) << "\n";
            return;
        }

        Timestamp t = clock_();
        std::vector<std::string> stale;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* key = (const char*)sqlite3_column_text(stmt, 0);
            const char* results = (const char*)sqlite3_column_text(stmt, 1);
            if (!key || !results) continue;

            CacheEntry entry;
            entry.cached_at = sqlite3_column_int64(stmt, 2);
            entry.ttl_seconds = sqlite3_column_int64(stmt, 3);
            if (entry.expired(t)) {
                stale.emplace_back(key);
                continue;
            }

            try {
                entry.results = json::parse(results).get<std::vector<SearchResult>>();
            } catch (const json::exception& e) {
                std::cerr << "[SearchCache] Dropping corrupt entry " << key << ": " << e.what() << "\n";
                stale.emplace_back(key);
                continue;
            }
            entries_[key] = std::move(entry);
        }
        sqlite3_finalize(stmt);

        for (const auto& key : stale) delete_row(key);
    }

    void write_row(const std::string& key, const CacheEntry& entry) {
        if (!db_) return;
        const char* sql = "INSERT OR REPLACE INTO search_cache "
                          "(fingerprint, results, cached_at, ttl) VALUES (?, ?, ?, ?)";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[SearchCache] Error preparing write: " << sqlite3_errmsg(db_) << "\n";
            return;
        }

        std::string payload = json(entry.results).dump();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, entry.cached_at);
        sqlite3_bind_int64(stmt, 4, entry.ttl_seconds);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "[SearchCache] Failed to write entry: " << sqlite3_errmsg(db_) << "\n";
        }
        sqlite3_finalize(stmt);
    }

    void delete_row(const std::string& key) {
        if (!db_) return;
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM search_cache WHERE fingerprint = ?",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[SearchCache] Error preparing delete: " << sqlite3_errmsg(db_) << "\n";
            return;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "[SearchCache] Failed to delete entry: " << sqlite3_errmsg(db_) << "\n";
        }
        sqlite3_finalize(stmt);
    }

    bool exec(const char* sql) {
        if (!db_) return true;
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[SearchCache] SQL error: " << (err ? err : "unknown") << "\n";
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    CacheConfig config_;
    Clock clock_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace hive
