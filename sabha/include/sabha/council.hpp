#pragma once
// Council: the assembled system
//
//   agents ──signals──▶ Coordinator ──decisions──▶ OutputRouter ──▶ MemoryStore
//     ▲                                                │
//     └───────────── InputRouter ◀──── Embedder ◀──────┘
//
// Owns every component and the coordination state. Boot is the only call
// that may throw (ConfigurationError); everything after degrades instead.

#include "agents.hpp"
#include "config.hpp"
#include "version.hpp"

#ifdef SABHA_WITH_ONNX
#include "onnx_backend.hpp"
#endif

namespace sabha {

struct CouncilStats {
    CoordinationStats coordination;
    StoreStats store;
    EmbedderStatus embedder;
    OutputRouterStats output;
    InputRouterStats input;
    Phase phase = Phase::Idle;
    bool degraded = false;
    size_t pending = 0;
    size_t unlearned = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot export
// ═══════════════════════════════════════════════════════════════════════════

inline json decision_to_json(const CoordinationDecision& d) {
    json j = {
        {"id", d.id},
        {"tick", d.tick_id},
        {"created", d.created},
        {"symbol", d.symbol},
        {"action", action_name(d.action)},
        {"consensus", d.consensus},
        {"aggregate_risk", d.aggregate_risk},
        {"risk_score", d.risk_score},
        {"position_size", d.position_size},
        {"verdict", verdict_name(d.verdict)},
        {"violations", d.violations},
        {"signals", d.signal_ids},
        {"contributors", d.contributors},
        {"degraded", d.degraded},
    };
    j["memory_ref"] = d.memory_ref ? json(d.memory_ref->to_string()) : json(nullptr);
    j["outcome"] = d.outcome ? json(outcome_name(*d.outcome)) : json(nullptr);
    if (d.outcome) {
        j["pnl"] = d.pnl;
        j["resolved"] = d.resolved;
    }
    return j;
}

inline json agent_to_json(const AgentState& a) {
    json j = {
        {"id", a.id},
        {"role", role_name(a.role)},
        {"category", category_name(a.category)},
        {"weight", a.weight},
        {"liveness", liveness_name(a.liveness)},
        {"signals", a.signals},
        {"timeouts", a.timeouts},
        {"errors", a.errors},
        {"restarts", a.restarts},
    };
    if (!a.last_error.empty()) j["last_error"] = a.last_error;
    return j;
}

inline json stats_to_json(const CoordinationStats& s) {
    return json{
        {"ticks", s.ticks},
        {"abandoned", s.abandoned},
        {"decisions", s.decisions},
        {"approved", s.approved},
        {"rejected", s.rejected},
        {"deferred", s.deferred},
        {"successes", s.successes},
        {"failures", s.failures},
        {"neutrals", s.neutrals},
        {"accuracy", s.accuracy()},
        {"total_pnl", s.total_pnl},
        {"weight_updates", s.weight_updates},
        {"learning_deferred", s.learning_deferred},
    };
}

inline json snapshot_to_json(const CoordinationState& state, const CoordinatorConfig& config) {
    json agents = json::array();
    for (const auto& [id, a] : state.agents) agents.push_back(agent_to_json(a));

    json recent = json::array();
    for (const auto& d : state.recent) recent.push_back(decision_to_json(d));

    json pending = json::array();
    for (const auto& [id, p] : state.pending) pending.push_back(id);

    json exposure = json::object();
    for (const auto& [symbol, e] : state.portfolio.exposure) exposure[symbol] = e;

    return json{
        {"version", SABHA_SNAPSHOT_VERSION},
        {"mode", mode_name(config.mode)},
        {"phase", phase_name(state.phase)},
        {"degraded", state.degraded},
        {"memory_degraded", state.memory_degraded},
        {"next_tick", state.next_tick},
        {"agents", agents},
        {"recent_decisions", recent},
        {"pending", pending},
        {"unlearned", state.unlearned.size()},
        {"portfolio", {
            {"open_positions", state.portfolio.open_positions},
            {"daily_pnl", state.portfolio.daily_pnl},
            {"exposure", exposure},
        }},
        {"stats", stats_to_json(state.stats)},
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Council
// ═══════════════════════════════════════════════════════════════════════════

class Council {
public:
    explicit Council(SabhaConfig config)
        : config_(std::move(config)),
          store_(config_.memory),
          embedder_(config_.embedding, make_primary(config_.embedding)),
          output_(config_.output_router, embedder_, store_, &supervisor_),
          input_(config_.input_router, embedder_, store_),
          supervisor_(config_.delivery_attempts, config_.max_agent_backlog),
          coordinator_(config_.coordinator, supervisor_, output_, &input_)
    {
        embedder_.attach(&store_);
    }

    ~Council() { shutdown(); }

    Council(const Council&) = delete;
    Council& operator=(const Council&) = delete;

    // Open memory, register agents, start workers. A store that cannot
    // open leaves the council running read-only.
    void boot() {
        if (booted_) return;
        state_ = Coordinator::initial_state(config_.agents);

        if (!store_.open()) {
            log_warn("Council", "memory_readonly", store_.degraded_reason(),
                     {{"dir", config_.memory.dir}});
        }

        output_.set_significance(COORDINATOR_ID, 1.0f);
        AgentDeps deps;
        deps.input = &input_;
        for (const auto& spec : config_.agents) {
            output_.set_significance(spec.id, spec.significance);
            if (!spec.interests.empty()) output_.subscribe({spec.id, spec.interests});

            auto agent = make_agent(spec, deps);
            traces_[spec.id] = agent->trace();
            supervisor_.add(std::move(agent));
        }
        supervisor_.start();
        state_.memory_degraded = !store_.writable();
        booted_ = true;

        log_info("Council", "boot", SABHA_VERSION,
                 {{"agents", std::to_string(config_.agents.size())},
                  {"mode", mode_name(config_.coordinator.mode)},
                  {"records", std::to_string(store_.size())},
                  {"embedder", embedder_.degraded() ? "hash" : config_.embedding.backend}});
    }

    void shutdown() {
        if (!booted_) return;
        supervisor_.stop();
        store_.close();
        booted_ = false;
    }

    TickResult tick() {
        require_booted();
        return coordinator_.tick(state_);
    }

    std::optional<CoordinationDecision> report_outcome(const std::string& decision_id,
                                                       OutcomeLabel label, double pnl = 0.0) {
        require_booted();
        return coordinator_.report_outcome(state_, decision_id, label, pnl);
    }

    std::vector<RankedRecord> recall(const std::string& agent_id, const RetrievalQuery& query, size_t k) {
        return input_.retrieve(agent_id, query, k);
    }

    size_t sweep() { return store_.sweep_retention(); }

    json snapshot() const { return snapshot_to_json(state_, coordinator_.config()); }

    CouncilStats stats() const {
        CouncilStats s;
        s.coordination = state_.stats;
        s.store = store_.stats();
        s.embedder = embedder_.status();
        s.output = output_.stats();
        s.input = input_.stats();
        s.phase = state_.phase;
        s.degraded = state_.degraded;
        s.pending = state_.pending.size();
        s.unlearned = state_.unlearned.size();
        return s;
    }

    std::shared_ptr<AgentTrace> trace(const std::string& agent_id) const {
        auto it = traces_.find(agent_id);
        return it != traces_.end() ? it->second : nullptr;
    }

    const CoordinationState& state() const { return state_; }
    const SabhaConfig& config() const { return config_; }
    MemoryStore& store() { return store_; }
    Embedder& embedder() { return embedder_; }
    OutputRouter& output() { return output_; }
    InputRouter& input() { return input_; }

private:
    static std::unique_ptr<EmbeddingBackend> make_primary(const EmbedderConfig& config) {
        if (config.backend != "onnx") return nullptr;
#ifdef SABHA_WITH_ONNX
        auto backend = std::make_unique<OnnxBackend>(config);
        if (!backend->load()) {
            log_warn("Council", "onnx_unavailable", backend->error());
            return nullptr;
        }
        return backend;
#else
        log_warn("Council", "onnx_unavailable", "built without ONNX Runtime");
        return nullptr;
#endif
    }

    void require_booted() const {
        if (!booted_) throw ConfigurationError("council has not been booted");
    }

    SabhaConfig config_;
    MemoryStore store_;
    Embedder embedder_;
    OutputRouter output_;
    InputRouter input_;
    AgentSupervisor supervisor_;
    Coordinator coordinator_;
    CoordinationState state_;
    std::map<std::string, std::shared_ptr<AgentTrace>> traces_;
    bool booted_ = false;
};

// Parse, validate and boot in one step
inline std::unique_ptr<Council> boot_council(SabhaConfig config) {
    auto council = std::make_unique<Council>(std::move(config));
    council->boot();
    return council;
}

} // namespace sabha
