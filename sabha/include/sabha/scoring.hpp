#pragma once
// Scoring: what is worth remembering, and what is worth recalling
//
// Admission: importance = f(event kind, agent significance, novelty).
// Recall:    relevance  = f(similarity, importance, recency, outcome).

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace sabha {

// ═══════════════════════════════════════════════════════════════════════════
// 1. Importance (memory admission)
// ═══════════════════════════════════════════════════════════════════════════

struct ImportanceConfig {
    float kind_weight = 0.4f;
    float significance_weight = 0.3f;
    float novelty_weight = 0.3f;

    float signal_base = 0.5f;
    float decision_base = 0.8f;
    float outcome_base = 1.0f;

    float threshold = 0.45f;   // Admit at or above
};

inline float kind_base(EventKind kind, const ImportanceConfig& config) {
    switch (kind) {
        case EventKind::Signal: return config.signal_base;
        case EventKind::Decision: return config.decision_base;
        case EventKind::Outcome: return config.outcome_base;
    }
    return 0.0f;
}

// Weighted blend, weights normalized so the result stays in [0,1]
inline float importance(EventKind kind, float significance, float novelty,
                        const ImportanceConfig& config = {})
{
    float total = config.kind_weight + config.significance_weight + config.novelty_weight;
    if (total <= 0.0f) return 0.0f;

    significance = std::clamp(significance, 0.0f, 1.0f);
    novelty = std::clamp(novelty, 0.0f, 1.0f);

    float score = config.kind_weight * kind_base(kind, config) +
                  config.significance_weight * significance +
                  config.novelty_weight * novelty;
    return std::clamp(score / total, 0.0f, 1.0f);
}

// Novelty from the distance to the nearest stored memory
inline float novelty_from_distance(std::optional<float> nearest_distance) {
    if (!nearest_distance) return 1.0f;
    float similarity = 1.0f - *nearest_distance;
    return std::clamp(1.0f - similarity, 0.0f, 1.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// 2. Relevance (recall ranking)
// ═══════════════════════════════════════════════════════════════════════════

struct RankingConfig {
    float recency_weight = 0.3f;         // Default recency bias (0-1)
    float importance_weight = 0.3f;      // How much stored importance matters (0-1)
    float recency_halflife_days = 30.0f;
    float success_boost = 1.1f;
    float failure_boost = 1.0f;          // Only seen when the caller opts in
};

inline float recency_decay(Timestamp created, Timestamp current, float halflife_days) {
    float days_ago = std::max(0.0f, static_cast<float>(current - created) / 86400000.0f);
    if (halflife_days <= 0.0f) return 1.0f;
    return std::exp(-days_ago * 0.693f / halflife_days);
}

inline float outcome_boost(const std::optional<OutcomeLabel>& outcome, const RankingConfig& config) {
    if (!outcome) return 1.0f;
    switch (*outcome) {
        case OutcomeLabel::Success: return config.success_boost;
        case OutcomeLabel::Failure: return config.failure_boost;
        default: return 1.0f;
    }
}

// Similarity blended with recency, scaled by importance and outcome
inline float relevance(float similarity, const MemoryRecord& record, Timestamp current,
                       float recency_bias, const RankingConfig& config = {})
{
    recency_bias = std::clamp(recency_bias, 0.0f, 1.0f);
    float recency = recency_decay(record.created, current, config.recency_halflife_days);
    float blended = (1.0f - recency_bias) * similarity + recency_bias * recency;

    float imp_factor = (1.0f - config.importance_weight) +
                       config.importance_weight * record.importance;

    return blended * imp_factor * outcome_boost(record.outcome, config);
}

} // namespace sabha
