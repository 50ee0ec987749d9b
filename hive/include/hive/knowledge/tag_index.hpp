#pragma once
// Tag Index: inverted tag lookup for typed records
//
// Architecture:
//   - String interning: each unique tag stored once, referenced by tag_id
//   - Inverted index: tag_id -> RoaringBitmap of slots
//   - Forward index: slot -> [tag_ids] (for replacement on re-add)
//
// Slots are dense integers the KnowledgeStore hands out per record id.
// The index lives in memory only; restore rebuilds it from the snapshot.

#include <roaring/roaring.h>
#include <algorithm>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hive {

class SlotTagIndex {
public:
    SlotTagIndex() = default;
    ~SlotTagIndex() { clear(); }

    SlotTagIndex(const SlotTagIndex&) = delete;
    SlotTagIndex& operator=(const SlotTagIndex&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Inverted Index Operations
    // ═══════════════════════════════════════════════════════════════════════

    // Replace the tag set of a slot
    void set(uint32_t slot, const std::vector<std::string>& tags) {
        std::unique_lock lock(mutex_);
        drop_slot(slot);
        if (slot >= forward_.size()) {
            forward_.resize(slot + 1);
        }
        for (const auto& tag : tags) {
            uint32_t tag_id = intern(tag);
            auto& fwd = forward_[slot];
            if (std::find(fwd.begin(), fwd.end(), tag_id) != fwd.end()) continue;
            roaring_bitmap_add(postings_[tag_id], slot);
            fwd.push_back(tag_id);
        }
    }

    // Remove all tags from slot
    void remove_all(uint32_t slot) {
        std::unique_lock lock(mutex_);
        drop_slot(slot);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Query Operations
    // ═══════════════════════════════════════════════════════════════════════

    // Slots carrying at least one of the tags, ascending
    std::vector<uint32_t> slots_with_any(const std::vector<std::string>& tags) const {
        std::shared_lock lock(mutex_);
        roaring_bitmap_t* acc = roaring_bitmap_create();
        for (const auto& tag : tags) {
            auto it = string_to_id_.find(tag);
            if (it == string_to_id_.end()) continue;
            roaring_bitmap_or_inplace(acc, postings_[it->second]);
        }
        auto result = bitmap_to_vector(acc);
        roaring_bitmap_free(acc);
        return result;
    }

    // Check if slot has tag
    bool slot_has_tag(uint32_t slot, const std::string& tag) const {
        std::shared_lock lock(mutex_);
        auto it = string_to_id_.find(tag);
        if (it == string_to_id_.end()) return false;
        return roaring_bitmap_contains(postings_[it->second], slot);
    }

    std::vector<std::string> tags_for_slot(uint32_t slot) const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        if (slot >= forward_.size()) return result;
        for (uint32_t tag_id : forward_[slot]) {
            result.push_back(id_to_string_[tag_id]);
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    size_t tag_count() const {
        std::shared_lock lock(mutex_);
        return id_to_string_.size();
    }

    size_t total_taggings() const {
        std::shared_lock lock(mutex_);
        size_t total = 0;
        for (const auto* bitmap : postings_) {
            total += roaring_bitmap_get_cardinality(bitmap);
        }
        return total;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        release();
    }

private:
    // Caller holds the unique lock
    uint32_t intern(const std::string& tag) {
        auto it = string_to_id_.find(tag);
        if (it != string_to_id_.end()) return it->second;

        uint32_t id = static_cast<uint32_t>(id_to_string_.size());
        string_to_id_[tag] = id;
        id_to_string_.push_back(tag);
        postings_.push_back(roaring_bitmap_create());
        return id;
    }

    // Caller holds the unique lock
    void drop_slot(uint32_t slot) {
        if (slot >= forward_.size()) return;
        for (uint32_t tag_id : forward_[slot]) {
            roaring_bitmap_remove(postings_[tag_id], slot);
        }
        forward_[slot].clear();
    }

    void release() {
        for (auto* bitmap : postings_) {
            roaring_bitmap_free(bitmap);
        }
        postings_.clear();
        string_to_id_.clear();
        id_to_string_.clear();
        forward_.clear();
    }

    static std::vector<uint32_t> bitmap_to_vector(const roaring_bitmap_t* bitmap) {
        uint64_t card = roaring_bitmap_get_cardinality(bitmap);
        std::vector<uint32_t> result(card);
        if (card > 0) roaring_bitmap_to_uint32_array(bitmap, result.data());
        return result;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;
    std::vector<roaring_bitmap_t*> postings_;       // Indexed by tag_id
    std::vector<std::vector<uint32_t>> forward_;    // Indexed by slot
};

} // namespace hive
