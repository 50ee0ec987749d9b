#pragma once
// Knowledge records: what producers leave behind in the store
//
// Two shapes share one spine (id, timestamp, references, metadata):
//   BasicRecord  - free-text finding with a quality score
//   TypedRecord  - structured signal with type, dimension, strength, tags
//
// Records are immutable once stored. KnowledgeRecord is the tagged union,
// RecordView the shape-agnostic read model.

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hive {

using json = nlohmann::json;

// Where a basic finding came from
enum class SourceKind : uint8_t {
    Website = 0,
    Documentation = 1,
    News = 2,
    Analysis = 3,
    Inference = 4,
    Debate = 5,
};

enum class SignalType : uint8_t {
    Insight = 0,
    Threat = 1,
    Opportunity = 2,
    Risk = 3,
    Need = 4,
};

// Analysis dimension, one per producer specialty
enum class Dimension : uint8_t {
    Product = 0,
    Technical = 1,
    Market = 2,
    Ux = 3,
    Business = 4,
    Team = 5,
};

enum class Sentiment : uint8_t {
    Positive = 0,
    Neutral = 1,
    Negative = 2,
};

enum class Actionability : uint8_t {
    Immediate = 0,
    ShortTerm = 1,
    LongTerm = 2,
    Informational = 3,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SourceKind, {
    {SourceKind::Website, "website"},
    {SourceKind::Documentation, "documentation"},
    {SourceKind::News, "news"},
    {SourceKind::Analysis, "analysis"},
    {SourceKind::Inference, "inference"},
    {SourceKind::Debate, "debate"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SignalType, {
    {SignalType::Insight, "insight"},
    {SignalType::Threat, "threat"},
    {SignalType::Opportunity, "opportunity"},
    {SignalType::Risk, "risk"},
    {SignalType::Need, "need"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Dimension, {
    {Dimension::Product, "product"},
    {Dimension::Technical, "technical"},
    {Dimension::Market, "market"},
    {Dimension::Ux, "ux"},
    {Dimension::Business, "business"},
    {Dimension::Team, "team"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Sentiment, {
    {Sentiment::Positive, "positive"},
    {Sentiment::Neutral, "neutral"},
    {Sentiment::Negative, "negative"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Actionability, {
    {Actionability::Immediate, "immediate"},
    {Actionability::ShortTerm, "short_term"},
    {Actionability::LongTerm, "long_term"},
    {Actionability::Informational, "informational"},
})

// Fields every record carries
struct RecordSpine {
    std::string id;                       // Assigned by the store when empty
    Timestamp timestamp = 0;              // Assigned by the store when 0
    std::vector<std::string> references;  // Ids of records this one cites
    json metadata = json::object();
};

struct BasicRecord : RecordSpine {
    std::string producer_role;
    std::string content;
    SourceKind source = SourceKind::Analysis;
    float quality_score = 0.5f;
};

struct TypedRecord : RecordSpine {
    SignalType type = SignalType::Insight;
    Dimension dimension = Dimension::Product;
    std::string evidence;
    float confidence = 0.5f;
    float strength = 0.5f;
    Sentiment sentiment = Sentiment::Neutral;
    std::vector<std::string> tags;
    std::string source;                   // Free-form origin (url, tool, ...)
    std::string producer_role;
    bool verified = false;
    std::vector<std::string> debate_points;
    Actionability actionability = Actionability::Informational;
};

using KnowledgeRecord = std::variant<BasicRecord, TypedRecord>;

inline const RecordSpine& spine(const KnowledgeRecord& r) {
    return std::visit([](const auto& v) -> const RecordSpine& { return v; }, r);
}

inline RecordSpine& spine(KnowledgeRecord& r) {
    return std::visit([](auto& v) -> RecordSpine& { return v; }, r);
}

inline bool is_typed(const KnowledgeRecord& r) {
    return std::holds_alternative<TypedRecord>(r);
}

// Shape-agnostic read model for cross-cutting consumers
struct RecordView {
    std::string id;
    std::string producer_role;
    std::string content;
    float weight = 0.0f;       // quality (basic) or strength (typed)
    Timestamp timestamp = 0;
    const json* metadata = nullptr;
    bool typed = false;
};

inline RecordView view(const KnowledgeRecord& r) {
    RecordView v;
    const auto& s = spine(r);
    v.id = s.id;
    v.timestamp = s.timestamp;
    v.metadata = &s.metadata;
    if (const auto* b = std::get_if<BasicRecord>(&r)) {
        v.producer_role = b->producer_role;
        v.content = b->content;
        v.weight = b->quality_score;
    } else {
        const auto& t = std::get<TypedRecord>(r);
        v.producer_role = t.producer_role;
        v.content = t.evidence;
        v.weight = t.strength;
        v.typed = true;
    }
    return v;
}

inline float weight_of(const KnowledgeRecord& r) {
    if (const auto* b = std::get_if<BasicRecord>(&r)) return b->quality_score;
    return std::get<TypedRecord>(r).strength;
}

inline const std::string& producer_of(const KnowledgeRecord& r) {
    if (const auto* b = std::get_if<BasicRecord>(&r)) return b->producer_role;
    return std::get<TypedRecord>(r).producer_role;
}

// Clamp every probability-like field into [0,1]
inline void clamp_scores(KnowledgeRecord& r) {
    if (auto* b = std::get_if<BasicRecord>(&r)) {
        b->quality_score = clamp01(b->quality_score);
    } else {
        auto& t = std::get<TypedRecord>(r);
        t.confidence = clamp01(t.confidence);
        t.strength = clamp01(t.strength);
    }
}

// Copy of a typed record marked verified, with the verifier's note appended
inline TypedRecord verified_copy(const TypedRecord& t, const std::string& verifier,
                                 const std::string& note,
                                 std::optional<float> strength = std::nullopt) {
    TypedRecord out = t;
    out.verified = true;
    out.debate_points.push_back(note.empty() ? "verified by " + verifier : note);
    out.metadata["verified_by"] = verifier;
    if (strength) out.strength = clamp01(*strength);
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping (snapshot format)
// ═══════════════════════════════════════════════════════════════════════════

inline void spine_to_json(json& j, const RecordSpine& s) {
    j["id"] = s.id;
    j["timestamp"] = s.timestamp;
    j["references"] = s.references;
    j["metadata"] = s.metadata;
}

inline void spine_from_json(const json& j, RecordSpine& s) {
    s.id = j.at("id").get<std::string>();
    s.timestamp = j.at("timestamp").get<Timestamp>();
    s.references = j.value("references", std::vector<std::string>{});
    s.metadata = j.value("metadata", json::object());
}

inline void to_json(json& j, const BasicRecord& b) {
    j = json::object();
    spine_to_json(j, b);
    j["producer_role"] = b.producer_role;
    j["content"] = b.content;
    j["source"] = b.source;
    j["quality_score"] = b.quality_score;
}

inline void from_json(const json& j, BasicRecord& b) {
    spine_from_json(j, b);
    b.producer_role = j.at("producer_role").get<std::string>();
    b.content = j.at("content").get<std::string>();
    b.source = j.at("source").get<SourceKind>();
    b.quality_score = clamp01(j.at("quality_score").get<float>());
}

inline void to_json(json& j, const TypedRecord& t) {
    j = json::object();
    spine_to_json(j, t);
    j["type"] = t.type;
    j["dimension"] = t.dimension;
    j["evidence"] = t.evidence;
    j["confidence"] = t.confidence;
    j["strength"] = t.strength;
    j["sentiment"] = t.sentiment;
    j["tags"] = t.tags;
    j["source"] = t.source;
    j["producer_role"] = t.producer_role;
    j["verified"] = t.verified;
    j["debate_points"] = t.debate_points;
    j["actionability"] = t.actionability;
}

inline void from_json(const json& j, TypedRecord& t) {
    spine_from_json(j, t);
    t.type = j.at("type").get<SignalType>();
    t.dimension = j.at("dimension").get<Dimension>();
    t.evidence = j.at("evidence").get<std::string>();
    t.confidence = clamp01(j.at("confidence").get<float>());
    t.strength = clamp01(j.at("strength").get<float>());
    t.sentiment = j.value("sentiment", Sentiment::Neutral);
    t.tags = j.value("tags", std::vector<std::string>{});
    t.source = j.value("source", "");
    t.producer_role = j.value("producer_role", "");
    t.verified = j.value("verified", false);
    t.debate_points = j.value("debate_points", std::vector<std::string>{});
    t.actionability = j.value("actionability", Actionability::Informational);
}

} // namespace hive
