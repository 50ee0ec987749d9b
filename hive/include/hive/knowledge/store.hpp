#pragma once
// KnowledgeStore: the shared medium producers coordinate through
//
// Producers never talk to each other directly. They add records and cite
// the records they built on; every citation strengthens the cited record's
// pheromone trail. Readers rank by trail strength x record weight, so the
// findings several producers converged on surface first.
//
// Concurrency:
//   - records map under a shared_mutex (readers share, writers exclusive)
//   - trail counters and last-accessed stamps are atomics, touched under
//     the shared lock by readers
//   - records are shared_ptr<const>; verify() swaps in a new value

#include "record.hpp"
#include "tag_index.hpp"
#include "../version.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace hive {

using json = nlohmann::json;
using RecordPtr = std::shared_ptr<const KnowledgeRecord>;

// Reference-count-derived popularity of one record
struct PheromoneTrail {
    std::atomic<uint32_t> reference_count{0};
    std::atomic<Timestamp> last_accessed{0};
};

// Plain copy of a trail for callers
struct PheromoneState {
    uint32_t reference_count = 0;
    Timestamp last_accessed = 0;
};

// Composable query criteria; empty sets and unset minimums match everything.
// Criteria only typed records carry (type, dimension, sentiment,
// actionability, confidence, strength, verified, tags) exclude basic records;
// min_quality excludes typed records.
struct RecordFilter {
    std::vector<std::string> producer_roles;
    std::vector<SignalType> types;
    std::vector<Dimension> dimensions;
    std::vector<Sentiment> sentiments;
    std::vector<Actionability> actionabilities;
    std::optional<float> min_confidence;
    std::optional<float> min_strength;
    std::optional<float> min_quality;     // Basic records only
    bool verified_only = false;
    std::optional<double> max_age_hours;
    std::vector<std::string> tags;        // Any-of

    bool typed_only() const {
        return !types.empty() || !dimensions.empty() || !sentiments.empty() ||
               !actionabilities.empty() || min_confidence || min_strength ||
               verified_only || !tags.empty();
    }

    bool basic_only() const { return min_quality.has_value(); }
};

// A record that producers other than its author built on
struct CrossProducerInsight {
    std::string record_id;
    std::string excerpt;                       // First 100 chars of content
    std::string from_role;
    std::vector<std::string> referenced_by;    // Distinct citing roles, sorted
    uint32_t reference_count = 0;
    std::optional<Dimension> dimension;        // Typed records only
};

class KnowledgeStore {
public:
    KnowledgeStore() = default;

    KnowledgeStore(const KnowledgeStore&) = delete;
    KnowledgeStore& operator=(const KnowledgeStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // Store a record. Assigns id/timestamp when absent, clamps scores and
    // strengthens the trail of every existing record it cites. Re-adding an
    // id replaces the value; only citations it did not carry before count.
    RecordPtr add(KnowledgeRecord record) {
        auto& s = spine(record);
        if (s.id.empty()) s.id = new_id();
        if (s.timestamp == 0) s.timestamp = now();
        clamp_scores(record);

        auto stored = std::make_shared<const KnowledgeRecord>(std::move(record));
        const auto& sp = spine(*stored);

        std::unique_lock lock(mutex_);

        std::unordered_set<std::string> already;
        auto existing = entries_.find(sp.id);
        if (existing != entries_.end()) {
            const auto& old_refs = spine(*existing->second.record).references;
            already.insert(old_refs.begin(), old_refs.end());
        }

        std::unordered_set<std::string> seen;
        for (const auto& ref : sp.references) {
            if (ref == sp.id) continue;
            if (!seen.insert(ref).second) continue;
            if (already.count(ref)) continue;
            auto target = entries_.find(ref);
            if (target == entries_.end()) continue;   // Dangling, tolerated
            target->second.trail->reference_count.fetch_add(1, std::memory_order_relaxed);
        }

        if (existing != entries_.end()) {
            existing->second.record = stored;
            index_tags(existing->second.slot, *stored);
        } else {
            Entry entry;
            entry.record = stored;
            entry.trail = std::make_unique<PheromoneTrail>();
            entry.trail->last_accessed.store(sp.timestamp, std::memory_order_relaxed);
            entry.slot = static_cast<uint32_t>(slot_ids_.size());
            slot_ids_.push_back(sp.id);
            index_tags(entry.slot, *stored);
            entries_.emplace(sp.id, std::move(entry));
        }
        return stored;
    }

    // Mark a typed record verified. Null when the id is unknown or the
    // record is basic (basic records carry no verification state).
    RecordPtr verify(const std::string& id, const std::string& verifier,
                     const std::string& note = "",
                     std::optional<float> strength = std::nullopt) {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return nullptr;

        const auto* typed = std::get_if<TypedRecord>(it->second.record.get());
        if (!typed) return nullptr;

        auto updated = std::make_shared<const KnowledgeRecord>(
            verified_copy(*typed, verifier, note, strength));
        it->second.record = updated;
        return updated;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
        slot_ids_.clear();
        tags_.clear();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════════

    // Fetch a record and touch its trail
    RecordPtr get(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return nullptr;
        it->second.trail->last_accessed.store(now(), std::memory_order_relaxed);
        return it->second.record;
    }

    // Records matching filter, strongest trail first, then most recent
    std::vector<RecordPtr> query(const RecordFilter& filter, size_t limit = 10) const {
        std::shared_lock lock(mutex_);
        const Timestamp t = now();

        std::vector<const Entry*> candidates;
        if (!filter.tags.empty()) {
            for (uint32_t slot : tags_.slots_with_any(filter.tags)) {
                auto it = entries_.find(slot_ids_[slot]);
                if (it != entries_.end()) candidates.push_back(&it->second);
            }
        } else {
            candidates.reserve(entries_.size());
            for (const auto& [_, e] : entries_) candidates.push_back(&e);
        }

        std::vector<const Entry*> matched;
        for (const auto* e : candidates) {
            if (matches(*e->record, filter, t)) matched.push_back(e);
        }
        return ranked(matched, limit);
    }

    // Ranked by reference_count x weight, ties by most recent
    std::vector<RecordPtr> top_by_pheromone(size_t limit = 10) const {
        std::shared_lock lock(mutex_);
        std::vector<const Entry*> all_entries;
        all_entries.reserve(entries_.size());
        for (const auto& [_, e] : entries_) all_entries.push_back(&e);
        return ranked(all_entries, limit);
    }

    // Most cited records, raw reference count
    std::vector<RecordPtr> hot(size_t limit = 5) const {
        std::shared_lock lock(mutex_);
        std::vector<std::pair<const Entry*, uint32_t>> scored;
        for (const auto& [_, e] : entries_) {
            scored.emplace_back(&e, e.trail->reference_count.load(std::memory_order_relaxed));
        }
        std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return spine(*a.first->record).timestamp > spine(*b.first->record).timestamp;
        });
        std::vector<RecordPtr> result;
        for (size_t i = 0; i < scored.size() && i < limit; ++i) {
            result.push_back(scored[i].first->record);
        }
        return result;
    }

    // Records no older than max_age_hours, newest first
    std::vector<RecordPtr> fresh(double max_age_hours = 24, size_t limit = 50) const {
        std::shared_lock lock(mutex_);
        const Timestamp cutoff = now() - static_cast<Timestamp>(max_age_hours * MS_PER_HOUR);
        std::vector<RecordPtr> result;
        for (const auto& [_, e] : entries_) {
            if (spine(*e.record).timestamp >= cutoff) result.push_back(e.record);
        }
        std::sort(result.begin(), result.end(), [](const RecordPtr& a, const RecordPtr& b) {
            return spine(*a).timestamp > spine(*b).timestamp;
        });
        if (result.size() > limit) result.resize(limit);
        return result;
    }

    // Everything one role produced, oldest first
    std::vector<RecordPtr> by_producer(const std::string& role) const {
        std::shared_lock lock(mutex_);
        std::vector<RecordPtr> result;
        for (const auto& [_, e] : entries_) {
            if (producer_of(*e.record) == role) result.push_back(e.record);
        }
        std::sort(result.begin(), result.end(), [](const RecordPtr& a, const RecordPtr& b) {
            return spine(*a).timestamp < spine(*b).timestamp;
        });
        return result;
    }

    // Records reachable from id over outgoing references within max_hops.
    // The start record is excluded; results ranked by weight.
    std::vector<RecordPtr> related(const std::string& id, size_t max_hops = 2,
                                   size_t limit = 20) const {
        std::shared_lock lock(mutex_);
        if (entries_.find(id) == entries_.end()) return {};

        std::unordered_set<std::string> visited{id};
        std::vector<std::string> frontier{id};
        std::vector<RecordPtr> found;

        for (size_t hop = 0; hop < max_hops && !frontier.empty(); ++hop) {
            std::vector<std::string> next;
            for (const auto& current : frontier) {
                auto it = entries_.find(current);
                if (it == entries_.end()) continue;
                for (const auto& ref : spine(*it->second.record).references) {
                    if (!visited.insert(ref).second) continue;
                    auto target = entries_.find(ref);
                    if (target == entries_.end()) continue;
                    found.push_back(target->second.record);
                    next.push_back(ref);
                }
            }
            frontier = std::move(next);
        }

        std::stable_sort(found.begin(), found.end(), [](const RecordPtr& a, const RecordPtr& b) {
            return weight_of(*a) > weight_of(*b);
        });
        if (found.size() > limit) found.resize(limit);
        return found;
    }

    // Typed records grouped by dimension, strongest first
    std::map<Dimension, std::vector<RecordPtr>> aggregate_by_dimension() const {
        return group_typed([](const TypedRecord& t) { return t.dimension; });
    }

    // Typed records grouped by signal type, strongest first
    std::map<SignalType, std::vector<RecordPtr>> aggregate_by_type() const {
        return group_typed([](const TypedRecord& t) { return t.type; });
    }

    // Records cited by at least one producer other than their author,
    // most cited first
    std::vector<CrossProducerInsight> cross_producer_insights() const {
        std::shared_lock lock(mutex_);

        std::unordered_map<std::string, std::set<std::string>> citers;
        for (const auto& [_, e] : entries_) {
            const auto& role = producer_of(*e.record);
            for (const auto& ref : spine(*e.record).references) {
                auto target = entries_.find(ref);
                if (target == entries_.end()) continue;
                if (producer_of(*target->second.record) == role) continue;
                citers[ref].insert(role);
            }
        }

        std::vector<CrossProducerInsight> result;
        for (const auto& [id, roles] : citers) {
            const auto& e = entries_.at(id);
            RecordView v = view(*e.record);

            CrossProducerInsight insight;
            insight.record_id = id;
            insight.excerpt = v.content.size() > 100 ? utf8_prefix(v.content, 100) + "..." : v.content;
            insight.from_role = v.producer_role;
            insight.referenced_by.assign(roles.begin(), roles.end());
            insight.reference_count = e.trail->reference_count.load(std::memory_order_relaxed);
            if (const auto* t = std::get_if<TypedRecord>(e.record.get())) {
                insight.dimension = t->dimension;
            }
            result.push_back(std::move(insight));
        }

        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.reference_count != b.reference_count) return a.reference_count > b.reference_count;
            return a.record_id < b.record_id;
        });
        return result;
    }

    std::optional<PheromoneState> pheromone(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return PheromoneState{
            it->second.trail->reference_count.load(std::memory_order_relaxed),
            it->second.trail->last_accessed.load(std::memory_order_relaxed)
        };
    }

    std::vector<RecordPtr> all() const {
        std::shared_lock lock(mutex_);
        std::vector<RecordPtr> result;
        result.reserve(entries_.size());
        for (const auto& [_, e] : entries_) result.push_back(e.record);
        return result;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    size_t basic_count() const {
        std::shared_lock lock(mutex_);
        size_t n = 0;
        for (const auto& [_, e] : entries_) {
            if (!is_typed(*e.record)) n++;
        }
        return n;
    }

    size_t typed_count() const {
        std::shared_lock lock(mutex_);
        size_t n = 0;
        for (const auto& [_, e] : entries_) {
            if (is_typed(*e.record)) n++;
        }
        return n;
    }

    size_t tag_count() const { return tags_.tag_count(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════

    // Snapshot everything to path atomically
    bool persist(const std::string& path) const {
        json doc;
        {
            std::shared_lock lock(mutex_);
            json basic = json::array();
            json typed = json::array();
            json trails = json::object();
            for (const auto& [id, e] : entries_) {
                if (const auto* b = std::get_if<BasicRecord>(e.record.get())) {
                    basic.push_back(*b);
                } else {
                    typed.push_back(std::get<TypedRecord>(*e.record));
                }
                trails[id] = {
                    {"reference_count", e.trail->reference_count.load(std::memory_order_relaxed)},
                    {"last_accessed", e.trail->last_accessed.load(std::memory_order_relaxed)}
                };
            }
            doc["version"] = std::to_string(HIVE_SNAPSHOT_VERSION_MAJOR) + "." +
                             std::to_string(HIVE_SNAPSHOT_VERSION_MINOR);
            doc["timestamp"] = iso_time(now());
            doc["basic_records"] = std::move(basic);
            doc["typed_records"] = std::move(typed);
            doc["pheromones"] = std::move(trails);
        }

        ensure_parent_dir(path);
        if (!safe_save_text(path, doc.dump(2))) {
            std::cerr << "[KnowledgeStore] Failed to save snapshot to " << path << "\n";
            return false;
        }
        return true;
    }

    // Replace the contents with a snapshot. On any error the store is
    // left untouched and false is returned.
    bool restore(const std::string& path) {
        auto text = read_text(path);
        if (!text) {
            std::cerr << "[KnowledgeStore] No snapshot at " << path << "\n";
            return false;
        }

        std::vector<KnowledgeRecord> records;
        std::unordered_map<std::string, PheromoneState> trails;
        try {
            json doc = json::parse(*text);

            int major = 0, minor = 0;
            std::string ver = doc.at("version").get<std::string>();
            if (std::sscanf(ver.c_str(), "%d.%d", &major, &minor) != 2 ||
                !version::snapshot_compatible(major, minor)) {
                std::cerr << "[KnowledgeStore] Incompatible snapshot version " << ver << "\n";
                return false;
            }

            for (const auto& j : doc.at("basic_records")) {
                records.emplace_back(j.get<BasicRecord>());
            }
            for (const auto& j : doc.at("typed_records")) {
                records.emplace_back(j.get<TypedRecord>());
            }
            json pheromones = doc.value("pheromones", json::object());
            for (const auto& [id, pj] : pheromones.items()) {
                trails[id] = PheromoneState{
                    pj.value("reference_count", 0u),
                    pj.value("last_accessed", Timestamp(0))
                };
            }
        } catch (const json::exception& e) {
            std::cerr << "[KnowledgeStore] Corrupt snapshot " << path << ": " << e.what() << "\n";
            return false;
        }

        std::unique_lock lock(mutex_);
        entries_.clear();
        slot_ids_.clear();
        tags_.clear();
        for (auto& r : records) {
            auto stored = std::make_shared<const KnowledgeRecord>(std::move(r));
            const auto& id = spine(*stored).id;

            auto it = entries_.find(id);
            if (it == entries_.end()) {
                Entry entry;
                entry.trail = std::make_unique<PheromoneTrail>();
                entry.slot = static_cast<uint32_t>(slot_ids_.size());
                slot_ids_.push_back(id);
                it = entries_.emplace(id, std::move(entry)).first;
            }
            it->second.record = stored;
            index_tags(it->second.slot, *stored);

            auto trail = trails.find(id);
            if (trail != trails.end()) {
                it->second.trail->reference_count.store(trail->second.reference_count);
                it->second.trail->last_accessed.store(trail->second.last_accessed);
            } else {
                it->second.trail->last_accessed.store(spine(*stored).timestamp);
            }
        }
        std::cerr << "[KnowledgeStore] Restored " << entries_.size() << " records from " << path << "\n";
        return true;
    }

private:
    struct Entry {
        RecordPtr record;
        std::unique_ptr<PheromoneTrail> trail;
        uint32_t slot = 0;                      // Position in the tag index
    };

    static float pheromone_score(const Entry& e) {
        return static_cast<float>(e.trail->reference_count.load(std::memory_order_relaxed)) *
               weight_of(*e.record);
    }

    // Caller holds the unique lock
    void index_tags(uint32_t slot, const KnowledgeRecord& r) {
        if (const auto* t = std::get_if<TypedRecord>(&r)) {
            tags_.set(slot, t->tags);
        } else {
            tags_.remove_all(slot);
        }
    }

    static bool contains_role(const std::vector<std::string>& roles, const std::string& role) {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }

    template <typename E>
    static bool in_set(const std::vector<E>& set, E value) {
        return set.empty() || std::find(set.begin(), set.end(), value) != set.end();
    }

    static bool matches(const KnowledgeRecord& r, const RecordFilter& f, Timestamp t) {
        const auto& s = spine(r);
        if (!f.producer_roles.empty() && !contains_role(f.producer_roles, producer_of(r))) {
            return false;
        }
        if (f.max_age_hours &&
            t - s.timestamp > static_cast<Timestamp>(*f.max_age_hours * MS_PER_HOUR)) {
            return false;
        }

        if (const auto* b = std::get_if<BasicRecord>(&r)) {
            if (f.typed_only()) return false;
            if (f.min_quality && b->quality_score < *f.min_quality) return false;
            return true;
        }

        if (f.basic_only()) return false;
        const auto& tr = std::get<TypedRecord>(r);
        if (!in_set(f.types, tr.type)) return false;
        if (!in_set(f.dimensions, tr.dimension)) return false;
        if (!in_set(f.sentiments, tr.sentiment)) return false;
        if (!in_set(f.actionabilities, tr.actionability)) return false;
        if (f.min_confidence && tr.confidence < *f.min_confidence) return false;
        if (f.min_strength && tr.strength < *f.min_strength) return false;
        if (f.verified_only && !tr.verified) return false;
        return true;
    }

    // Sort by pheromone score then recency, truncate to limit
    static std::vector<RecordPtr> ranked(const std::vector<const Entry*>& entries, size_t limit) {
        std::vector<std::pair<const Entry*, float>> scored;
        scored.reserve(entries.size());
        for (const auto* e : entries) scored.emplace_back(e, pheromone_score(*e));

        std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return spine(*a.first->record).timestamp > spine(*b.first->record).timestamp;
        });

        std::vector<RecordPtr> result;
        for (size_t i = 0; i < scored.size() && i < limit; ++i) {
            result.push_back(scored[i].first->record);
        }
        return result;
    }

    template <typename KeyFn>
    auto group_typed(KeyFn key) const
        -> std::map<decltype(key(std::declval<const TypedRecord&>())), std::vector<RecordPtr>> {
        using Key = decltype(key(std::declval<const TypedRecord&>()));
        std::map<Key, std::vector<RecordPtr>> result;
        {
            std::shared_lock lock(mutex_);
            for (const auto& [_, e] : entries_) {
                if (const auto* t = std::get_if<TypedRecord>(e.record.get())) {
                    result[key(*t)].push_back(e.record);
                }
            }
        }
        for (auto& [_, group] : result) {
            std::sort(group.begin(), group.end(), [](const RecordPtr& a, const RecordPtr& b) {
                return weight_of(*a) > weight_of(*b);
            });
        }
        return result;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> slot_ids_;         // slot -> record id
    SlotTagIndex tags_;
};

} // namespace hive
