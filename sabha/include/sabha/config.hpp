#pragma once
// Config: one JSON document, one struct
//
//   {
//     "logging":       {"level": "info", "sink": "stderr"},
//     "memory":        {"dir": "...", "dimension": 384, "retention_days": 90, ...},
//     "embedding":     {"backend": "hash", "model_path": "...", ...},
//     "input_router":  {"cache_capacity": 128, "recency_weight": 0.3, ...},
//     "output_router": {"importance_threshold": 0.45, "delivery_timeout_ms": 250, ...},
//     "coordinator":   {"mode": "balanced", "agent_timeout_ms": 250, ...},
//     "risk":          {"max_open_positions": 10, "max_daily_loss": 1000, ...},   required
//     "agents":        [{"id": "...", "role": "strategy", "weight": 1.0}, ...]    required
//   }
//
// Every problem is reported as a ConfigurationError naming the JSON path.

#include "agent.hpp"
#include "coordinator.hpp"
#include "embedder.hpp"
#include "input_router.hpp"
#include "memory_store.hpp"
#include "output_router.hpp"
#include <fstream>

namespace sabha {

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::string sink = "stderr";    // "stderr" or "none"
};

struct SabhaConfig {
    LoggingConfig logging;
    MemoryStoreConfig memory;
    EmbedderConfig embedding;
    InputRouterConfig input_router;
    OutputRouterConfig output_router;
    CoordinatorConfig coordinator;
    std::vector<AgentSpec> agents;
    size_t delivery_attempts = 2;
    size_t max_agent_backlog = 64;      // Jobs queued per agent before new ones are refused
};

namespace detail {

// Typed field reader that names the offending path
class Section {
public:
    Section(const json& j, std::string path) : j_(j), path_(std::move(path)) {
        if (!j_.is_object()) throw ConfigurationError(path_ + " must be an object");
    }

    bool has(const char* key) const { return j_.contains(key); }

    std::string at(const char* key) const { return path_ + "." + key; }

    template<typename T>
    void read(const char* key, T& out) const {
        if (!j_.contains(key)) return;
        try {
            out = j_.at(key).get<T>();
        } catch (const json::exception& e) {
            throw ConfigurationError(at(key) + ": " + e.what());
        }
    }

    void read_unit(const char* key, float& out) const {
        read(key, out);
        if (has(key) && !(out >= 0.0f && out <= 1.0f)) {
            throw ConfigurationError(at(key) + " must lie in [0,1]");
        }
    }

    void read_ms(const char* key, std::chrono::milliseconds& out) const {
        if (!has(key)) return;
        int64_t ms = 0;
        read(key, ms);
        if (ms <= 0) throw ConfigurationError(at(key) + " must be positive");
        out = std::chrono::milliseconds(ms);
    }

private:
    const json& j_;
    std::string path_;
};

inline const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    return root.contains(key) ? root.at(key) : empty;
}

inline void parse_logging(const json& j, LoggingConfig& c) {
    Section s(j, "logging");
    if (s.has("level")) {
        std::string level;
        s.read("level", level);
        auto l = parse_level(level);
        if (!l) throw ConfigurationError(s.at("level") + " must be debug, info, warn or error");
        c.level = *l;
    }
    s.read("sink", c.sink);
    if (c.sink != "stderr" && c.sink != "none") {
        throw ConfigurationError(s.at("sink") + " must be stderr or none");
    }
}

inline void parse_memory(const json& j, MemoryStoreConfig& c) {
    Section s(j, "memory");
    s.read("dir", c.dir);
    s.read("dimension", c.dimension);
    s.read("retention_days", c.retention_days);
    s.read("exact_scan_threshold", c.exact_scan_threshold);
    s.read("overfetch", c.overfetch);
    s.read("hnsw_m", c.hnsw.M);
    s.read("hnsw_ef_construction", c.hnsw.ef_construction);
    s.read("hnsw_ef_search", c.hnsw.ef_search);
    if (c.dir.empty()) throw ConfigurationError(s.at("dir") + " must not be empty");
    if (c.dimension == 0) throw ConfigurationError(s.at("dimension") + " must be positive");
    if (c.retention_days <= 0) throw ConfigurationError(s.at("retention_days") + " must be positive");
    if (c.hnsw.M < 2) throw ConfigurationError(s.at("hnsw_m") + " must be at least 2");
}

inline void parse_embedding(const json& j, EmbedderConfig& c) {
    Section s(j, "embedding");
    s.read("backend", c.backend);
    s.read("model_path", c.model_path);
    s.read("vocab_path", c.vocab_path);
    s.read("max_seq_length", c.max_seq_length);
    s.read("num_threads", c.num_threads);
    s.read("cache_size", c.cache_size);
    if (c.backend != "hash" && c.backend != "onnx") {
        throw ConfigurationError(s.at("backend") + " must be onnx or hash");
    }
    if (c.backend == "onnx" && (c.model_path.empty() || c.vocab_path.empty())) {
        throw ConfigurationError("embedding: onnx backend needs model_path and vocab_path");
    }
}

inline void parse_input_router(const json& j, InputRouterConfig& c) {
    Section s(j, "input_router");
    s.read("cache_capacity", c.cache_capacity);
    s.read("overfetch", c.overfetch);
    s.read_unit("recency_weight", c.ranking.recency_weight);
    s.read_unit("importance_weight", c.ranking.importance_weight);
    s.read_unit("always_relevant_importance", c.always_relevant_importance);
    s.read("recency_halflife_days", c.ranking.recency_halflife_days);
    if (c.ranking.recency_halflife_days <= 0.0f) {
        throw ConfigurationError(s.at("recency_halflife_days") + " must be positive");
    }
    if (c.cache_capacity == 0) throw ConfigurationError(s.at("cache_capacity") + " must be positive");
}

inline void parse_output_router(const json& j, OutputRouterConfig& c) {
    Section s(j, "output_router");
    s.read_unit("importance_threshold", c.importance.threshold);
    s.read_unit("default_significance", c.default_significance);
    s.read_ms("delivery_timeout_ms", c.delivery_timeout);
    s.read("kind_weight", c.importance.kind_weight);
    s.read("significance_weight", c.importance.significance_weight);
    s.read("novelty_weight", c.importance.novelty_weight);
    if (c.importance.kind_weight < 0 || c.importance.significance_weight < 0 || c.importance.novelty_weight < 0) {
        throw ConfigurationError("output_router: importance weights must not be negative");
    }
}

inline void parse_coordinator(const json& j, CoordinatorConfig& c, size_t& delivery_attempts,
                              size_t& max_agent_backlog) {
    Section s(j, "coordinator");
    if (s.has("mode")) {
        std::string mode;
        s.read("mode", mode);
        auto m = parse_mode(mode);
        if (!m) throw ConfigurationError(s.at("mode") + " must be conservative, balanced, aggressive or autonomous");
        c.mode = *m;
    }
    if (s.has("consensus_threshold")) {
        float t = 0.0f;
        s.read_unit("consensus_threshold", t);
        c.consensus_threshold = t;
    }
    if (s.has("max_position_risk")) {
        double r = 0.0;
        s.read("max_position_risk", r);
        c.max_position_risk = r;
    }
    s.read_ms("agent_timeout_ms", c.agent_timeout);
    s.read_ms("tick_deadline_ms", c.tick_deadline);
    s.read_unit("min_active_fraction", c.min_active_fraction);
    s.read_unit("degraded_consensus_ceiling", c.degraded_consensus_ceiling);
    s.read("weight_step", c.weight_step);
    s.read("max_decay_fraction", c.max_decay_fraction);
    if (s.has("outcome_timeout_hours")) {
        double hours = 0.0;
        s.read("outcome_timeout_hours", hours);
        if (hours <= 0.0) throw ConfigurationError(s.at("outcome_timeout_hours") + " must be positive");
        c.outcome_timeout_ms = static_cast<Timestamp>(hours * 3600.0 * 1000.0);
    }
    s.read("recent_decisions", c.recent_decisions);
    s.read("max_unlearned", c.max_unlearned);
    s.read("archive_signals", c.archive_signals);
    s.read("watchlist", c.watchlist);
    s.read("delivery_attempts", delivery_attempts);
    if (delivery_attempts == 0) throw ConfigurationError(s.at("delivery_attempts") + " must be positive");
    s.read("max_agent_backlog", max_agent_backlog);
    if (max_agent_backlog == 0) throw ConfigurationError(s.at("max_agent_backlog") + " must be positive");
}

inline void parse_risk(const json& root, RiskLimits& r) {
    if (!root.contains("risk")) throw ConfigurationError("risk: section is required");
    Section s(root.at("risk"), "risk");
    s.read("max_open_positions", r.max_open_positions);
    s.read("max_daily_loss", r.max_daily_loss);
    s.read("symbol_exposure_cap", r.symbol_exposure_cap);
}

inline AgentSpec parse_agent(const json& j, const std::string& path) {
    Section s(j, path);
    AgentSpec spec;
    if (!s.has("id")) throw ConfigurationError(path + ".id is required");
    s.read("id", spec.id);
    if (spec.id.empty()) throw ConfigurationError(path + ".id must not be empty");

    if (!s.has("role")) throw ConfigurationError(path + ".role is required");
    std::string role;
    s.read("role", role);
    auto r = parse_role(role);
    if (!r) throw ConfigurationError(s.at("role") + ": unknown role '" + role + "'");
    spec.role = *r;

    s.read("weight", spec.weight);
    if (!(spec.weight >= MIN_AGENT_WEIGHT && spec.weight <= MAX_AGENT_WEIGHT)) {
        throw ConfigurationError(s.at("weight") + " must lie in [0,2]");
    }
    s.read_unit("significance", spec.significance);

    if (s.has("interests")) {
        std::vector<std::string> names;
        s.read("interests", names);
        for (const auto& n : names) {
            auto c = parse_category(n);
            if (!c) throw ConfigurationError(s.at("interests") + ": unknown category '" + n + "'");
            spec.interests.insert(*c);
        }
    }

    // Everything else is role-specific and handed to the agent untouched
    spec.options = json::object();
    for (const auto& [key, value] : j.items()) {
        if (key == "id" || key == "role" || key == "weight" || key == "significance" ||
            key == "interests") continue;
        spec.options[key] = value;
    }
    return spec;
}

inline std::vector<AgentSpec> parse_agents(const json& root) {
    if (!root.contains("agents")) throw ConfigurationError("agents: registry is required");
    const json& arr = root.at("agents");
    if (!arr.is_array() || arr.empty()) throw ConfigurationError("agents: must be a non-empty array");

    std::vector<AgentSpec> specs;
    std::set<std::string> ids;
    for (size_t i = 0; i < arr.size(); ++i) {
        std::string path = "agents[" + std::to_string(i) + "]";
        AgentSpec spec = parse_agent(arr[i], path);
        if (!ids.insert(spec.id).second) {
            throw ConfigurationError(path + ".id: duplicate agent id '" + spec.id + "'");
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace detail

inline SabhaConfig parse_config(const json& root) {
    if (!root.is_object()) throw ConfigurationError("configuration must be a JSON object");
    SabhaConfig c;
    detail::parse_logging(detail::section(root, "logging"), c.logging);
    detail::parse_memory(detail::section(root, "memory"), c.memory);
    detail::parse_embedding(detail::section(root, "embedding"), c.embedding);
    detail::parse_input_router(detail::section(root, "input_router"), c.input_router);
    detail::parse_output_router(detail::section(root, "output_router"), c.output_router);
    detail::parse_coordinator(detail::section(root, "coordinator"), c.coordinator, c.delivery_attempts,
                                 c.max_agent_backlog);
    detail::parse_risk(root, c.coordinator.risk);
    c.agents = detail::parse_agents(root);

    c.embedding.dimension = c.memory.dimension;
    c.coordinator.validate();
    return c;
}

inline SabhaConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot read configuration file " + path);
    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return parse_config(root);
}

} // namespace sabha
