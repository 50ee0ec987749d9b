#pragma once
// Handoff Queue: explicit follow-up requests between roles
//
// A producer that finds something another role should dig into files a
// handoff. The scheduler drains HIGH+ handoffs as one extra wave after each
// batch; lower priorities wait for whoever asks for them.
//
// Flow: create() -> PENDING -> IN_PROGRESS -> COMPLETED | FAILED
//                          \-> CANCELLED

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hive {

using json = nlohmann::json;

// Handoff status
enum class HandoffStatus : uint8_t {
    Pending = 0,
    InProgress = 1,
    Completed = 2,
    Failed = 3,
    Cancelled = 4,
};

// Priority levels; lower value sorts first
enum class HandoffPriority : uint8_t {
    Critical = 0,
    High = 1,
    Medium = 2,
    Low = 3,
};

inline bool is_terminal(HandoffStatus s) {
    return s == HandoffStatus::Completed ||
           s == HandoffStatus::Failed ||
           s == HandoffStatus::Cancelled;
}

// True when p is as urgent as min or more
inline bool at_least(HandoffPriority p, HandoffPriority min) {
    return static_cast<uint8_t>(p) <= static_cast<uint8_t>(min);
}

inline std::string status_name(HandoffStatus s) {
    switch (s) {
        case HandoffStatus::Pending: return "pending";
        case HandoffStatus::InProgress: return "in_progress";
        case HandoffStatus::Completed: return "completed";
        case HandoffStatus::Failed: return "failed";
        case HandoffStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

inline std::string priority_name(HandoffPriority p) {
    switch (p) {
        case HandoffPriority::Critical: return "critical";
        case HandoffPriority::High: return "high";
        case HandoffPriority::Medium: return "medium";
        case HandoffPriority::Low: return "low";
    }
    return "medium";
}

// What the receiving role needs to pick the work up
struct HandoffContext {
    std::optional<std::string> source_record_id;   // KnowledgeStore record that triggered it
    std::string reasoning;
    json relevant_data = json::object();
    std::vector<std::string> suggested_actions;
};

inline void to_json(json& j, const HandoffContext& c) {
    j = json{
        {"source_record_id", c.source_record_id ? json(*c.source_record_id) : json()},
        {"reasoning", c.reasoning},
        {"relevant_data", c.relevant_data},
        {"suggested_actions", c.suggested_actions}
    };
}

struct HandoffRecord {
    std::string id;
    std::string from_role;
    std::string to_role;
    HandoffContext context;
    HandoffPriority priority = HandoffPriority::Medium;
    HandoffStatus status = HandoffStatus::Pending;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    std::optional<std::string> result;
    std::optional<std::string> error;
    uint64_t sequence = 0;        // Insertion order, breaks priority ties
};

inline void to_json(json& j, const HandoffRecord& h) {
    j = json{
        {"id", h.id},
        {"from_role", h.from_role},
        {"to_role", h.to_role},
        {"context", h.context},
        {"priority", priority_name(h.priority)},
        {"status", status_name(h.status)},
        {"created_at", h.created_at},
        {"updated_at", h.updated_at},
        {"result", h.result ? json(*h.result) : json()},
        {"error", h.error ? json(*h.error) : json()}
    };
}

// Handoff queue manager
class HandoffQueue {
public:
    HandoffQueue() = default;

    HandoffQueue(const HandoffQueue&) = delete;
    HandoffQueue& operator=(const HandoffQueue&) = delete;

    HandoffRecord create(const std::string& from_role, const std::string& to_role,
                         HandoffContext context,
                         HandoffPriority priority = HandoffPriority::Medium) {
        HandoffRecord h;
        h.id = new_id();
        h.from_role = from_role;
        h.to_role = to_role;
        h.context = std::move(context);
        h.priority = priority;
        h.status = HandoffStatus::Pending;
        h.created_at = now();
        h.updated_at = h.created_at;

        std::lock_guard<std::mutex> lock(mutex_);
        h.sequence = next_sequence_++;
        items_[h.id] = h;
        return h;
    }

    std::optional<HandoffRecord> get(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) return std::nullopt;
        return it->second;
    }

    // Pending handoffs at or above min_priority, most urgent first, then oldest
    std::vector<HandoffRecord> list_pending(
        const std::optional<std::string>& to_role = std::nullopt,
        HandoffPriority min_priority = HandoffPriority::Low) const {
        std::vector<HandoffRecord> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, h] : items_) {
                if (h.status != HandoffStatus::Pending) continue;
                if (to_role && h.to_role != *to_role) continue;
                if (!at_least(h.priority, min_priority)) continue;
                result.push_back(h);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.priority != b.priority) {
                return static_cast<uint8_t>(a.priority) < static_cast<uint8_t>(b.priority);
            }
            return a.sequence < b.sequence;
        });
        return result;
    }

    // Move a handoff along its state machine.
    // False for unknown ids, terminal handoffs and transitions the machine forbids.
    bool update_status(const std::string& id, HandoffStatus status,
                       std::optional<std::string> result = std::nullopt,
                       std::optional<std::string> error = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) return false;

        auto& h = it->second;
        if (!allowed(h.status, status)) return false;

        h.status = status;
        h.updated_at = now();
        if (result) h.result = std::move(result);
        if (error) h.error = std::move(error);
        return true;
    }

    bool cancel(const std::string& id) {
        return update_status(id, HandoffStatus::Cancelled);
    }

    // Contexts of every pending handoff addressed to role, in list order
    std::vector<HandoffContext> get_context_for(const std::string& role) const {
        std::vector<HandoffContext> result;
        for (auto& h : list_pending(role, HandoffPriority::Low)) {
            result.push_back(std::move(h.context));
        }
        return result;
    }

    // All handoffs matching the given endpoints, in insertion order
    std::vector<HandoffRecord> by_roles(const std::optional<std::string>& from_role,
                                        const std::optional<std::string>& to_role) const {
        std::vector<HandoffRecord> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [_, h] : items_) {
                if (from_role && h.from_role != *from_role) continue;
                if (to_role && h.to_role != *to_role) continue;
                result.push_back(h);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a.sequence < b.sequence;
        });
        return result;
    }

    std::vector<HandoffRecord> all() const {
        return by_roles(std::nullopt, std::nullopt);
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [_, h] : items_) {
            if (h.status == HandoffStatus::Pending) count++;
        }
        return count;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        next_sequence_ = 0;
    }

private:
    static bool allowed(HandoffStatus from, HandoffStatus to) {
        switch (from) {
            case HandoffStatus::Pending:
                return to == HandoffStatus::InProgress || to == HandoffStatus::Cancelled;
            case HandoffStatus::InProgress:
                return to == HandoffStatus::Completed || to == HandoffStatus::Failed;
            default:
                return false;  // Terminal
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, HandoffRecord> items_;
    uint64_t next_sequence_ = 0;
};

} // namespace hive
