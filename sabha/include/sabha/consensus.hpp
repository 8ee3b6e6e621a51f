#pragma once
// Consensus: many opinions, one number per candidate action
//
// For a symbol with voting signals s_i (weight w_i, confidence c_i):
//   consensus(action) = Σ_{s_i votes action} c_i·w_i / Σ_i w_i
// Dissent dilutes a candidate because every vote on the symbol counts in
// the denominator. Sums run in a canonical order, so the result does not
// depend on the order signals arrived in.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace sabha {

struct WeightedSignal {
    Signal signal;
    float weight = 1.0f;
};

struct Candidate {
    std::string symbol;
    Action action = Action::Hold;
    float consensus = 0.0f;
    float risk = 0.0f;                       // Weight-averaged risk of supporters
    std::vector<std::string> signal_ids;     // Supporters, sorted
    std::vector<std::string> agent_ids;      // Supporters, sorted
};

struct ConsensusResult {
    std::vector<Candidate> candidates;       // Best first
    std::optional<Candidate> chosen;         // Empty on an unresolvable tie
    bool tie = false;
    size_t signals_used = 0;
    size_t duplicates = 0;                   // Dropped as double counts
};

constexpr float CONSENSUS_EPSILON = 1e-6f;

// One signal per id, and one per (agent, symbol): the latest wins,
// ties broken by id. Order of the input does not matter.
inline std::vector<WeightedSignal> deduplicate(std::vector<WeightedSignal> signals,
                                               size_t* dropped = nullptr) {
    std::sort(signals.begin(), signals.end(), [](const auto& a, const auto& b) {
        const auto& x = a.signal;
        const auto& y = b.signal;
        if (x.agent_id != y.agent_id) return x.agent_id < y.agent_id;
        if (x.symbol != y.symbol) return x.symbol < y.symbol;
        if (x.timestamp != y.timestamp) return x.timestamp > y.timestamp;
        if (x.id != y.id) return x.id > y.id;
        if (x.action != y.action) return x.action < y.action;
        if (x.confidence != y.confidence) return x.confidence > y.confidence;
        return x.risk < y.risk;
    });

    std::vector<WeightedSignal> out;
    std::set<std::string> seen_ids;
    std::set<std::pair<std::string, std::string>> seen_pairs;
    for (auto& ws : signals) {
        const auto& s = ws.signal;
        bool dup_id = !s.id.empty() && seen_ids.count(s.id);
        bool dup_pair = seen_pairs.count({s.agent_id, s.symbol});
        if (dup_id || dup_pair) {
            if (dropped) ++*dropped;
            continue;
        }
        if (!s.id.empty()) seen_ids.insert(s.id);
        seen_pairs.insert({s.agent_id, s.symbol});
        out.push_back(std::move(ws));
    }
    return out;
}

inline ConsensusResult compute_consensus(std::vector<WeightedSignal> signals,
                                         float epsilon = CONSENSUS_EPSILON) {
    ConsensusResult result;
    signals = deduplicate(std::move(signals), &result.duplicates);
    result.signals_used = signals.size();

    // deduplicate() left signals sorted by (agent, symbol); regroup by symbol
    std::map<std::string, std::vector<const WeightedSignal*>> by_symbol;
    for (const auto& ws : signals) by_symbol[ws.signal.symbol].push_back(&ws);

    for (const auto& [symbol, group] : by_symbol) {
        double total_weight = 0.0;
        for (const auto* ws : group) total_weight += std::max(0.0f, ws->weight);
        if (total_weight <= 0.0) continue;

        for (Action action : {Action::Buy, Action::Sell, Action::Hold}) {
            double support = 0.0, risk_sum = 0.0, weight_sum = 0.0;
            Candidate c;
            c.symbol = symbol;
            c.action = action;
            for (const auto* ws : group) {
                if (ws->signal.action != action) continue;
                double w = std::max(0.0f, ws->weight);
                support += ws->signal.confidence * w;
                risk_sum += ws->signal.risk * w;
                weight_sum += w;
                c.signal_ids.push_back(ws->signal.id);
                c.agent_ids.push_back(ws->signal.agent_id);
            }
            if (c.signal_ids.empty() || weight_sum <= 0.0) continue;

            c.consensus = static_cast<float>(std::clamp(support / total_weight, 0.0, 1.0));
            c.risk = static_cast<float>(std::clamp(risk_sum / weight_sum, 0.0, 1.0));
            std::sort(c.signal_ids.begin(), c.signal_ids.end());
            std::sort(c.agent_ids.begin(), c.agent_ids.end());
            result.candidates.push_back(std::move(c));
        }
    }

    std::sort(result.candidates.begin(), result.candidates.end(),
              [](const Candidate& a, const Candidate& b) {
        if (a.consensus != b.consensus) return a.consensus > b.consensus;
        if (a.risk != b.risk) return a.risk < b.risk;
        if (a.symbol != b.symbol) return a.symbol < b.symbol;
        return a.action < b.action;
    });

    if (result.candidates.empty()) return result;

    const auto& best = result.candidates[0];
    if (result.candidates.size() > 1) {
        const auto& next = result.candidates[1];
        if (std::fabs(best.consensus - next.consensus) <= epsilon &&
            std::fabs(best.risk - next.risk) <= epsilon) {
            result.tie = true;
            return result;
        }
    }
    result.chosen = best;
    return result;
}

} // namespace sabha
