#pragma once
// Input Router: an agent asks, memory answers
//
// query → embedding → similarity search → re-rank → cache.
// Failed precedent stays out of results unless the caller asks for it.

#include "embedder.hpp"
#include "memory_store.hpp"
#include "scoring.hpp"
#include <atomic>
#include <map>

namespace sabha {

enum class QueryType {
    General,
    Precedent,
    Risk,
    Timing,
    Performance,
};

inline const char* query_type_name(QueryType t) {
    switch (t) {
        case QueryType::General: return "general";
        case QueryType::Precedent: return "precedent";
        case QueryType::Risk: return "risk";
        case QueryType::Timing: return "timing";
        case QueryType::Performance: return "performance";
    }
    return "general";
}

inline std::optional<QueryType> parse_query_type(const std::string& s) {
    for (QueryType t : {QueryType::General, QueryType::Precedent, QueryType::Risk,
                        QueryType::Timing, QueryType::Performance}) {
        if (s == query_type_name(t)) return t;
    }
    return std::nullopt;
}

struct RetrievalQuery {
    std::string text;
    std::set<EventKind> kinds;               // Empty: any kind
    std::string symbol;                      // Empty: any symbol
    bool include_failures = false;
    std::optional<float> recency_bias;       // Overrides the configured default

    // Query text from an agent's situation. Context keys that carry
    // meaning (symbol, signal_type, strategy, action, regime) are kept.
    static RetrievalQuery from_context(const std::string& agent_id, QueryType type,
                                       const std::map<std::string, std::string>& context) {
        RetrievalQuery q;
        std::string text = agent_id + " " + query_type_name(type);
        for (const char* key : {"symbol", "action", "signal_type", "strategy", "regime"}) {
            auto it = context.find(key);
            if (it != context.end() && !it->second.empty()) text += " " + it->second;
        }
        switch (type) {
            case QueryType::Precedent: text += " decision outcome success"; break;
            case QueryType::Risk: text += " risk loss failure exposure"; break;
            case QueryType::Timing: text += " timing entry exit"; break;
            case QueryType::Performance: text += " outcome pnl"; break;
            case QueryType::General: break;
        }
        auto sym = context.find("symbol");
        if (sym != context.end()) q.symbol = sym->second;
        if (type == QueryType::Risk) q.include_failures = true;
        q.text = text;
        return q;
    }
};

struct RankedRecord {
    MemoryRecord record;
    float similarity = 0.0f;
    float score = 0.0f;
};

struct InputRouterConfig {
    RankingConfig ranking;
    size_t cache_capacity = 128;
    size_t overfetch = 3;
    float always_relevant_importance = 0.7f;   // Passes the kind filter regardless
};

struct InputRouterStats {
    uint64_t queries = 0;
    uint64_t cache_hits = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    size_t cached = 0;
};

class InputRouter {
public:
    InputRouter(InputRouterConfig config, Embedder& embedder, const MemoryStore& store)
        : config_(std::move(config)), embedder_(embedder), store_(store),
          cache_(config_.cache_capacity) {}

    std::vector<RankedRecord> retrieve(const std::string& agent_id, const RetrievalQuery& query,
                                       size_t k) {
        ++queries_;
        std::string key = agent_id + "\x1f" + signature(query, k);
        uint64_t epoch = epoch_.load();

        if (auto cached = cache_.get(key)) {
            if (cached->first == epoch) {
                ++cache_hits_;
                ++successes_;
                return cached->second;
            }
        }

        std::vector<RankedRecord> ranked;
        try {
            ranked = search(query, k);
        } catch (const Error& e) {
            ++failures_;
            log_warn("InputRouter", "retrieve_failed", e.what(), {{"agent", agent_id}});
            throw;
        }

        cache_.put(key, {epoch, ranked});
        ++successes_;
        return ranked;
    }

    // New decision tick: earlier cache entries no longer apply
    void begin_tick(uint64_t tick_id) { epoch_ = tick_id; }

    InputRouterStats stats() const {
        InputRouterStats s;
        s.queries = queries_;
        s.cache_hits = cache_hits_;
        s.successes = successes_;
        s.failures = failures_;
        s.cached = cache_.size();
        return s;
    }

private:
    std::vector<RankedRecord> search(const RetrievalQuery& query, size_t k) {
        if (k == 0) return {};
        Embedding emb = embedder_.embed_text(query.text);

        RecordFilter filter;
        filter.symbol = query.symbol;
        if (!query.include_failures) filter.exclude_outcomes.insert(OutcomeLabel::Failure);

        size_t fetch = k * std::max<size_t>(config_.overfetch, 1);
        auto hits = store_.query_similar(emb.vector, fetch, filter);

        float bias = query.recency_bias.value_or(config_.ranking.recency_weight);
        Timestamp current = now();

        std::vector<RankedRecord> ranked;
        for (auto& hit : hits) {
            const auto& r = hit.record;
            bool kind_ok = query.kinds.empty() || query.kinds.count(r.kind) ||
                           r.importance >= config_.always_relevant_importance;
            if (!kind_ok) continue;

            RankedRecord rr;
            rr.similarity = hit.similarity;
            rr.score = relevance(hit.similarity, r, current, bias, config_.ranking);
            rr.record = std::move(hit.record);
            ranked.push_back(std::move(rr));
        }

        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.record.id < b.record.id;
        });
        if (ranked.size() > k) ranked.resize(k);
        return ranked;
    }

    static std::string signature(const RetrievalQuery& q, size_t k) {
        std::string s = q.text + "|" + q.symbol + "|" + (q.include_failures ? "f" : "-") + "|";
        for (EventKind kind : q.kinds) s += kind_name(kind);
        s += "|" + (q.recency_bias ? fixed2(*q.recency_bias) : std::string("default"));
        s += "|" + std::to_string(k);
        char buf[17];
        snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a(s)));
        return buf;
    }

    InputRouterConfig config_;
    Embedder& embedder_;
    const MemoryStore& store_;
    LruCache<std::string, std::pair<uint64_t, std::vector<RankedRecord>>> cache_;

    std::atomic<uint64_t> epoch_{0};
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace sabha
