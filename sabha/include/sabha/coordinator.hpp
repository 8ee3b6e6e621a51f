#pragma once
// Coordinator: the council's chair
//
// One tick:  idle → collecting → scoring → gating → deciding → awaiting-outcome
// Overlay:   degraded, while too few agents are active
//
// All mutable coordination state lives in CoordinationState, owned by the
// caller and passed into every call. The coordinator itself only holds
// configuration and references to its collaborators.

#include "consensus.hpp"
#include "input_router.hpp"
#include "output_router.hpp"
#include "risk_gate.hpp"
#include "supervisor.hpp"
#include <deque>
#include <map>

namespace sabha {

// ═══════════════════════════════════════════════════════════════════════════
// Modes
// ═══════════════════════════════════════════════════════════════════════════

enum class Phase {
    Idle,
    Collecting,
    Scoring,
    Gating,
    Deciding,
    AwaitingOutcome,
};

inline const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Idle: return "idle";
        case Phase::Collecting: return "collecting";
        case Phase::Scoring: return "scoring";
        case Phase::Gating: return "gating";
        case Phase::Deciding: return "deciding";
        case Phase::AwaitingOutcome: return "awaiting_outcome";
    }
    return "unknown";
}

enum class Mode {
    Conservative,
    Balanced,
    Aggressive,
    Autonomous,
};

inline const char* mode_name(Mode m) {
    switch (m) {
        case Mode::Conservative: return "conservative";
        case Mode::Balanced: return "balanced";
        case Mode::Aggressive: return "aggressive";
        case Mode::Autonomous: return "autonomous";
    }
    return "unknown";
}

inline std::optional<Mode> parse_mode(const std::string& s) {
    for (Mode m : {Mode::Conservative, Mode::Balanced, Mode::Aggressive, Mode::Autonomous}) {
        if (s == mode_name(m)) return m;
    }
    return std::nullopt;
}

struct ModeProfile {
    float consensus_threshold;   // Below: deferred
    double max_position_risk;    // Position size cap, fraction of capital
    double size_multiplier;
};

inline ModeProfile mode_profile(Mode m) {
    switch (m) {
        case Mode::Conservative: return {0.75f, 0.03, 0.7};
        case Mode::Balanced: return {0.60f, 0.05, 1.0};
        case Mode::Aggressive: return {0.50f, 0.07, 1.3};
        case Mode::Autonomous: return {0.40f, 0.10, 1.0};
    }
    return {0.60f, 0.05, 1.0};
}

// ═══════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════

struct AgentState {
    std::string id;
    AgentRole role = AgentRole::Strategy;
    AgentCategory category = AgentCategory::SignalGeneration;
    float weight = 1.0f;
    Liveness liveness = Liveness::Starting;
    uint32_t restarts = 0;        // Re-admissions after degradation
    uint64_t signals = 0;
    uint64_t timeouts = 0;
    uint64_t errors = 0;
    Timestamp last_signal = 0;
    std::string last_error;
};

struct CoordinationDecision {
    std::string id;
    uint64_t tick_id = 0;
    Timestamp created = 0;
    std::vector<std::string> signal_ids;     // Every signal scored this tick
    std::vector<std::string> contributors;   // Agents backing the chosen action
    std::string symbol;
    Action action = Action::Hold;
    float consensus = 0.0f;
    float aggregate_risk = 0.0f;
    float risk_score = 0.0f;
    double position_size = 0.0;
    Verdict verdict = Verdict::Deferred;
    std::vector<std::string> violations;
    bool degraded = false;
    std::optional<RecordId> memory_ref;      // Decision record awaiting its outcome
    std::optional<OutcomeLabel> outcome;
    double pnl = 0.0;
    Timestamp resolved = 0;

    bool no_op() const { return action == Action::Hold || symbol.empty(); }
};

struct PendingDecision {
    CoordinationDecision decision;
    Timestamp deadline = 0;
};

// Outcome known but not yet durable in memory; weights wait for it
struct UnlearnedOutcome {
    CoordinationDecision decision;
    OutcomeLabel label = OutcomeLabel::Neutral;
    bool annotated = false;
    bool outcome_stored = false;
};

struct CoordinationStats {
    uint64_t ticks = 0;
    uint64_t abandoned = 0;
    uint64_t decisions = 0;
    uint64_t approved = 0;
    uint64_t rejected = 0;
    uint64_t deferred = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t neutrals = 0;
    uint64_t weight_updates = 0;
    uint64_t learning_deferred = 0;
    double total_pnl = 0.0;

    double accuracy() const {
        uint64_t decided = successes + failures;
        return decided ? static_cast<double>(successes) / decided : 0.0;
    }
};

struct CoordinationState {
    Phase phase = Phase::Idle;
    bool degraded = false;
    bool memory_degraded = false;
    uint64_t next_tick = 1;
    std::map<std::string, AgentState> agents;
    PortfolioState portfolio;
    std::map<std::string, PendingDecision> pending;
    std::deque<CoordinationDecision> recent;
    std::deque<UnlearnedOutcome> unlearned;
    CoordinationStats stats;

    float weight_of(const std::string& id) const {
        auto it = agents.find(id);
        return it != agents.end() ? it->second.weight : 0.0f;
    }

    size_t count(Liveness l) const {
        size_t n = 0;
        for (const auto& [id, a] : agents) {
            if (a.liveness == l) ++n;
        }
        return n;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct CoordinatorConfig {
    Mode mode = Mode::Balanced;
    std::optional<float> consensus_threshold;     // Overrides the mode preset
    std::optional<double> max_position_risk;      // Overrides the mode preset
    std::chrono::milliseconds agent_timeout{250};
    std::chrono::milliseconds tick_deadline{1000};
    float min_active_fraction = 0.5f;
    float degraded_consensus_ceiling = 0.75f;
    float weight_step = 0.1f;                     // Largest change per outcome
    float max_decay_fraction = 0.5f;              // Largest relative loss per outcome
    Timestamp outcome_timeout_ms = MILLIS_PER_DAY;
    size_t recent_decisions = 50;
    size_t max_unlearned = 256;
    bool archive_signals = true;
    std::vector<std::string> watchlist;
    RiskLimits risk;

    float threshold() const {
        return consensus_threshold.value_or(mode_profile(mode).consensus_threshold);
    }

    double position_cap() const {
        return max_position_risk.value_or(mode_profile(mode).max_position_risk);
    }

    void validate() const {
        auto in_unit = [](float v) { return v >= 0.0f && v <= 1.0f; };
        if (agent_timeout.count() <= 0) throw ConfigurationError("coordinator.agent_timeout_ms must be positive");
        if (tick_deadline < agent_timeout) {
            throw ConfigurationError("coordinator.tick_deadline_ms must be at least agent_timeout_ms");
        }
        if (!in_unit(min_active_fraction)) throw ConfigurationError("coordinator.min_active_fraction must lie in [0,1]");
        if (!in_unit(degraded_consensus_ceiling)) throw ConfigurationError("coordinator.degraded_consensus_ceiling must lie in [0,1]");
        if (!(weight_step > 0.0f && weight_step <= 2.0f)) throw ConfigurationError("coordinator.weight_step must lie in (0,2]");
        if (!(max_decay_fraction > 0.0f && max_decay_fraction < 1.0f)) {
            throw ConfigurationError("coordinator.max_decay_fraction must lie in (0,1)");
        }
        if (!in_unit(threshold())) throw ConfigurationError("coordinator.consensus_threshold must lie in [0,1]");
        if (!(position_cap() > 0.0 && position_cap() <= 1.0)) {
            throw ConfigurationError("coordinator.max_position_risk must lie in (0,1]");
        }
        if (outcome_timeout_ms <= 0) throw ConfigurationError("coordinator.outcome_timeout_ms must be positive");
        if (risk.max_daily_loss < 0.0) throw ConfigurationError("risk.max_daily_loss must not be negative");
        if (risk.symbol_exposure_cap < 0.0) throw ConfigurationError("risk.symbol_exposure_cap must not be negative");
    }
};

constexpr float MIN_AGENT_WEIGHT = 0.0f;
constexpr float MAX_AGENT_WEIGHT = 2.0f;
constexpr const char* COORDINATOR_ID = "coordinator";

// Bounded weight update. Success adds at most one step; failure removes
// at most one step and never more than max_decay_fraction of the weight,
// so a positive weight stays positive.
inline float adjust_weight(float weight, OutcomeLabel label, float step, float max_decay_fraction) {
    switch (label) {
        case OutcomeLabel::Success:
            return std::min(MAX_AGENT_WEIGHT, weight + step);
        case OutcomeLabel::Failure:
            return std::max(MIN_AGENT_WEIGHT, weight - std::min(step, weight * max_decay_fraction));
        default:
            return weight;
    }
}

struct TickResult {
    uint64_t tick_id = 0;
    bool abandoned = false;
    std::optional<CoordinationDecision> decision;
    size_t polled = 0;
    size_t responded = 0;
    size_t abstained = 0;
    size_t timed_out = 0;
    size_t errored = 0;
    size_t invalid = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Coordinator
// ═══════════════════════════════════════════════════════════════════════════

class Coordinator {
public:
    Coordinator(CoordinatorConfig config, AgentSupervisor& supervisor, OutputRouter& output,
                InputRouter* input = nullptr)
        : config_(std::move(config)), supervisor_(supervisor), output_(output), input_(input)
    {
        config_.validate();
    }

    // Fresh state for a registry. Throws ConfigurationError on a bad entry.
    static CoordinationState initial_state(const std::vector<AgentSpec>& specs) {
        if (specs.empty()) throw ConfigurationError("agent registry is empty");
        CoordinationState state;
        for (const auto& spec : specs) {
            if (spec.id.empty()) throw ConfigurationError("agent registry entry without id");
            if (spec.id == COORDINATOR_ID) {
                throw ConfigurationError("agent id '" + spec.id + "' is reserved");
            }
            if (!(spec.weight >= MIN_AGENT_WEIGHT && spec.weight <= MAX_AGENT_WEIGHT)) {
                throw ConfigurationError("agent '" + spec.id + "' weight must lie in [0,2]");
            }
            if (state.agents.count(spec.id)) {
                throw ConfigurationError("duplicate agent id '" + spec.id + "'");
            }
            AgentState a;
            a.id = spec.id;
            a.role = spec.role;
            a.category = spec.category();
            a.weight = spec.weight;
            state.agents.emplace(spec.id, std::move(a));
        }
        return state;
    }

    const CoordinatorConfig& config() const { return config_; }

    TickResult tick(CoordinationState& state) {
        TickResult result;
        result.tick_id = state.next_tick++;
        const uint64_t tick_id = result.tick_id;
        const std::string tick_text = std::to_string(tick_id);
        auto token = CancelToken::after(config_.tick_deadline);
        Timestamp started = now();

        ++state.stats.ticks;
        log_info("Coordinator", "tick_start", "", {{"tick", tick_text}});
        if (input_) input_->begin_tick(tick_id);

        retry_learning(state);
        expire_pending(state, started);
        readmit(state, token);
        update_overlay(state, tick_id);

        // ── collecting ──────────────────────────────────────────────────
        state.phase = Phase::Collecting;
        TickContext ctx;
        ctx.tick_id = tick_id;
        ctx.timestamp = started;
        ctx.watchlist = config_.watchlist;
        ctx.cancel = token;

        std::vector<Signal> signals = collect(state, ctx, result);
        update_overlay(state, tick_id);
        if (token->cancelled()) return abandon(state, result, "deadline passed while collecting");

        // ── scoring ─────────────────────────────────────────────────────
        state.phase = Phase::Scoring;
        std::vector<WeightedSignal> voting;
        std::vector<Signal> risk_signals;
        for (const auto& s : signals) {
            AgentCategory cat = state.agents.at(s.agent_id).category;
            if (cat == AgentCategory::Risk) risk_signals.push_back(s);
            if (votes_in_consensus(cat)) voting.push_back({s, state.weight_of(s.agent_id)});
        }
        ConsensusResult consensus = compute_consensus(voting);
        if (consensus.duplicates > 0) {
            log_warn("Coordinator", "duplicate_signals", "dropped before scoring",
                     {{"tick", tick_text}, {"count", std::to_string(consensus.duplicates)}});
        }
        if (token->cancelled()) return abandon(state, result, "deadline passed while scoring");

        if (consensus.candidates.empty()) {
            archive(signals, state, tick_id, token->deadline());
            if (token->cancelled()) return abandon(state, result, "deadline passed while archiving");
            return finish(state, result, started);
        }

        // ── gating ──────────────────────────────────────────────────────
        state.phase = Phase::Gating;
        CoordinationDecision d;
        d.tick_id = tick_id;
        d.created = now();
        d.degraded = state.degraded;
        for (const auto& ws : deduplicate(voting)) d.signal_ids.push_back(ws.signal.id);
        std::sort(d.signal_ids.begin(), d.signal_ids.end());

        if (consensus.chosen) {
            const Candidate& c = *consensus.chosen;
            d.symbol = c.symbol;
            d.action = c.action;
            d.consensus = c.consensus;
            d.aggregate_risk = c.risk;
            d.contributors = c.agent_ids;
            if (state.degraded) d.consensus = std::min(d.consensus, config_.degraded_consensus_ceiling);
        } else {
            // Unresolvable tie: inaction, reported against the best score
            const Candidate& c = consensus.candidates.front();
            d.consensus = c.consensus;
            d.aggregate_risk = c.risk;
        }

        if (!d.no_op()) d.position_size = position_size(d, signals);
        d.risk_score = risk_score(d);

        state.portfolio.roll_day(d.created);
        RiskLimits limits = tighten(config_.risk, risk_signals);
        GateResult gate = evaluate_gates(limits, state.portfolio, d.symbol, d.action, d.position_size);
        d.violations = gate.violations;

        if (token->cancelled()) return abandon(state, result, "deadline passed while gating");

        // ── deciding ────────────────────────────────────────────────────
        state.phase = Phase::Deciding;
        if (!gate.passed()) {
            d.verdict = Verdict::Rejected;
        } else if (d.no_op() || d.consensus < config_.threshold()) {
            d.verdict = Verdict::Deferred;
        } else {
            d.verdict = Verdict::Approved;
        }
        d.id = "dec-" + tick_text + "-" + RecordId::generate().to_string().substr(0, 8);

        archive(signals, state, tick_id, token->deadline());
        if (token->cancelled()) return abandon(state, result, "deadline passed while archiving");

        Event ev;
        ev.kind = EventKind::Decision;
        ev.agent_id = COORDINATOR_ID;
        ev.category = AgentCategory::Coordination;
        ev.ref_id = d.id;
        ev.symbol = d.symbol;
        ev.action = d.action;
        ev.confidence = d.consensus;
        ev.risk = d.risk_score;
        ev.verdict = d.verdict;
        ev.timestamp = d.created;
        ev.payload.tags = {std::string("verdict:") + verdict_name(d.verdict),
                           std::string("mode:") + mode_name(config_.mode)};
        ev.payload.numbers["position_size"] = d.position_size;
        ev.payload.numbers["tick"] = static_cast<double>(tick_id);
        IngestReport report = output_.ingest(COORDINATOR_ID, ev, token->deadline());
        if (report.persisted) d.memory_ref = report.record_id;

        // Nothing has been handed off yet. The stored decision record is
        // closed as neutral so no pending record outlives the tick.
        if (token->cancelled()) {
            std::string why = "deadline passed while deciding";
            if (d.memory_ref && !output_.annotate_outcome(*d.memory_ref, OutcomeLabel::Neutral)) {
                why += ", decision record " + d.memory_ref->to_string() + " left pending";
            }
            return abandon(state, result, why);
        }

        ++state.stats.decisions;
        switch (d.verdict) {
            case Verdict::Approved: ++state.stats.approved; break;
            case Verdict::Rejected: ++state.stats.rejected; break;
            case Verdict::Deferred: ++state.stats.deferred; break;
        }

        if (d.verdict == Verdict::Approved) {
            hand_off(state, d, ev);
            state.portfolio.open_positions++;
            state.portfolio.exposure[d.symbol] += d.position_size;
            state.pending[d.id] = PendingDecision{d, d.created + config_.outcome_timeout_ms};
        }

        log_info("Coordinator", "decision", d.id,
                 {{"tick", tick_text}, {"symbol", d.symbol}, {"action", action_name(d.action)},
                  {"consensus", fixed2(d.consensus)}, {"verdict", verdict_name(d.verdict)},
                  {"violations", std::to_string(d.violations.size())},
                  {"degraded", d.degraded ? "true" : "false"}});

        remember_recent(state, d);
        result.decision = std::move(d);
        return finish(state, result, started);
    }

    // Resolve a pending decision. Returns the resolved decision, or nullopt
    // when the id is not pending (unknown or already resolved).
    std::optional<CoordinationDecision> report_outcome(CoordinationState& state,
                                                       const std::string& decision_id,
                                                       OutcomeLabel label, double pnl = 0.0) {
        if (label == OutcomeLabel::Pending) {
            throw ValidationError("outcome for " + decision_id + " must be success, failure or neutral");
        }
        auto it = state.pending.find(decision_id);
        if (it == state.pending.end()) {
            log_warn("Coordinator", "outcome_ignored", "decision not pending",
                     {{"decision", decision_id}});
            return std::nullopt;
        }

        CoordinationDecision d = std::move(it->second.decision);
        state.pending.erase(it);

        d.outcome = label;
        d.pnl = pnl;
        d.resolved = now();

        auto& p = state.portfolio;
        if (p.open_positions > 0) p.open_positions--;
        double& exposure = p.exposure[d.symbol];
        exposure = std::max(0.0, exposure - d.position_size);
        if (exposure == 0.0) p.exposure.erase(d.symbol);
        p.roll_day(d.resolved);
        p.daily_pnl += pnl;

        auto& s = state.stats;
        s.total_pnl += pnl;
        if (label == OutcomeLabel::Success) ++s.successes;
        else if (label == OutcomeLabel::Failure) ++s.failures;
        else ++s.neutrals;

        for (auto& r : state.recent) {
            if (r.id == d.id) {
                r.outcome = label;
                r.pnl = pnl;
                r.resolved = d.resolved;
            }
        }

        log_info("Coordinator", "outcome", d.id,
                 {{"label", outcome_name(label)}, {"pnl", fixed2(pnl)},
                  {"record", d.memory_ref ? d.memory_ref->to_string() : ""}});

        UnlearnedOutcome u{d, label, false, false};
        if (!state.unlearned.empty() || !persist_outcome(u)) {
            defer_learning(state, std::move(u));
        } else {
            apply_weights(state, u.decision, label);
        }

        if (state.pending.empty() && state.phase == Phase::AwaitingOutcome) {
            state.phase = Phase::Idle;
        }
        return d;
    }

    // Pending decisions past their deadline resolve as neutral
    size_t expire_pending(CoordinationState& state, Timestamp current) {
        std::vector<std::string> expired;
        for (const auto& [id, p] : state.pending) {
            if (p.deadline <= current) expired.push_back(id);
        }
        for (const auto& id : expired) {
            log_warn("Coordinator", "outcome_timeout", "resolving as neutral", {{"decision", id}});
            report_outcome(state, id, OutcomeLabel::Neutral, 0.0);
        }
        return expired.size();
    }

    // Re-attempt outcomes that could not be stored. Stops at the first one
    // that still fails so weights change in outcome order.
    size_t retry_learning(CoordinationState& state) {
        size_t learned = 0;
        while (!state.unlearned.empty()) {
            UnlearnedOutcome& u = state.unlearned.front();
            if (!persist_outcome(u)) break;
            apply_weights(state, u.decision, u.label);
            state.unlearned.pop_front();
            ++learned;
        }
        state.memory_degraded = !output_.memory_writable();
        return learned;
    }

private:
    // ── collecting ──────────────────────────────────────────────────────

    std::vector<Signal> collect(CoordinationState& state, const TickContext& ctx, TickResult& result) {
        const std::string tick_text = std::to_string(ctx.tick_id);
        auto agent_deadline = std::min(Clock::now() + config_.agent_timeout, ctx.cancel->deadline());

        std::vector<std::pair<std::string, std::future<std::optional<Signal>>>> polls;
        for (auto& [id, agent] : state.agents) {
            if (agent.liveness != Liveness::Active) continue;
            if (agent.category == AgentCategory::Execution) continue;
            ++result.polled;
            try {
                polls.emplace_back(id, supervisor_.poll(id, ctx));
            } catch (const Error& e) {
                ++result.errored;
                ++agent.errors;
                set_liveness(agent, Liveness::Errored, e.what(), ctx.tick_id);
            }
        }

        std::vector<Signal> signals;
        for (auto& [id, fut] : polls) {
            AgentState& agent = state.agents.at(id);
            if (fut.wait_until(agent_deadline) != std::future_status::ready) {
                ++result.timed_out;
                ++agent.timeouts;
                TimeoutError err("agent " + id + " did not answer within " +
                                 std::to_string(config_.agent_timeout.count()) + "ms");
                set_liveness(agent, Liveness::Degraded, err.what(), ctx.tick_id);
                continue;
            }

            std::optional<Signal> signal;
            try {
                signal = fut.get();
            } catch (const std::exception& e) {
                ++result.errored;
                ++agent.errors;
                set_liveness(agent, Liveness::Errored, e.what(), ctx.tick_id);
                continue;
            }

            ++result.responded;
            if (!signal) {
                ++result.abstained;
                continue;
            }

            try {
                validate_signal(*signal, id, ctx.tick_id);
            } catch (const ValidationError& e) {
                ++result.invalid;
                log_warn("Coordinator", "signal_rejected", e.what(),
                         {{"agent", id}, {"tick", tick_text}});
                continue;
            }
            ++agent.signals;
            agent.last_signal = signal->timestamp;
            signals.push_back(std::move(*signal));
        }
        return signals;
    }

    static void validate_signal(Signal& s, const std::string& agent_id, uint64_t tick_id) {
        if (!s.agent_id.empty() && s.agent_id != agent_id) {
            throw ValidationError("signal claims agent '" + s.agent_id + "'");
        }
        s.agent_id = agent_id;
        if (s.symbol.empty()) throw ValidationError("signal has no symbol");
        if (!(s.confidence >= 0.0f && s.confidence <= 1.0f)) {
            throw ValidationError("confidence " + std::to_string(s.confidence) + " outside [0,1]");
        }
        if (!(s.risk >= 0.0f && s.risk <= 1.0f)) {
            throw ValidationError("risk " + std::to_string(s.risk) + " outside [0,1]");
        }
        if (s.id.empty()) s.id = "sig-" + std::to_string(tick_id) + "-" + agent_id;
        if (s.timestamp == 0) s.timestamp = now();
    }

    // Degraded or errored agents whose worker drained and who report
    // healthy rejoin; starting agents join on their first tick
    void readmit(CoordinationState& state, const std::shared_ptr<CancelToken>& token) {
        for (auto& [id, agent] : state.agents) {
            if (agent.liveness == Liveness::Starting) {
                set_liveness(agent, Liveness::Active, "", 0);
                continue;
            }
            if (agent.liveness != Liveness::Degraded && agent.liveness != Liveness::Errored) continue;
            if (!supervisor_.idle(id)) continue;

            try {
                auto fut = supervisor_.probe(id);
                auto deadline = std::min(Clock::now() + config_.agent_timeout, token->deadline());
                if (fut.wait_until(deadline) != std::future_status::ready) continue;
                if (fut.get()) {
                    ++agent.restarts;
                    set_liveness(agent, Liveness::Active, "health probe passed", 0);
                }
            } catch (const std::exception& e) {
                agent.last_error = e.what();
            }
        }
    }

    void set_liveness(AgentState& agent, Liveness to, const std::string& reason, uint64_t tick_id) {
        if (agent.liveness == to) return;
        Liveness from = agent.liveness;
        agent.liveness = to;
        if (!reason.empty() && to != Liveness::Active) agent.last_error = reason;

        LogFields fields = {{"agent", agent.id}, {"from", liveness_name(from)},
                            {"to", liveness_name(to)}};
        if (tick_id) fields.emplace_back("tick", std::to_string(tick_id));
        if (to == Liveness::Active) log_info("Coordinator", "liveness", reason, std::move(fields));
        else log_warn("Coordinator", "liveness", reason, std::move(fields));
    }

    void update_overlay(CoordinationState& state, uint64_t tick_id) {
        size_t total = 0, active = 0;
        for (const auto& [id, a] : state.agents) {
            if (a.category == AgentCategory::Execution) continue;
            ++total;
            if (a.liveness == Liveness::Active) ++active;
        }
        float fraction = total ? static_cast<float>(active) / total : 0.0f;
        bool degraded = fraction < config_.min_active_fraction;
        if (degraded != state.degraded) {
            state.degraded = degraded;
            auto fields = LogFields{{"tick", std::to_string(tick_id)},
                                    {"active", std::to_string(active)},
                                    {"total", std::to_string(total)}};
            if (degraded) log_warn("Coordinator", "degraded_enter", "too few active agents", fields);
            else log_info("Coordinator", "degraded_exit", "", fields);
        }
        state.memory_degraded = !output_.memory_writable();
    }

    // ── gating helpers ─────────────────────────────────────────────────

    // Base 2% plus up to 3% with consensus, shrunk when the leading
    // supporter's stop is wide, scaled by mode, capped by position risk
    double position_size(const CoordinationDecision& d, const std::vector<Signal>& signals) const {
        const ModeProfile profile = mode_profile(config_.mode);
        double size = 0.02 + 0.03 * d.consensus;

        const Signal* lead = nullptr;
        for (const auto& s : signals) {
            if (s.symbol != d.symbol || s.action != d.action) continue;
            if (!lead || s.confidence > lead->confidence ||
                (s.confidence == lead->confidence && s.id < lead->id)) lead = &s;
        }
        if (lead) {
            auto entry = lead->payload.number("entry_price");
            auto stop = lead->payload.number("stop_loss");
            if (entry && stop && *entry > 0.0) {
                double stop_distance = std::fabs(*entry - *stop) / *entry;
                if (stop_distance > 0.0) size *= std::min(1.0, 0.02 / stop_distance);
            }
        }

        size *= profile.size_multiplier;
        if (config_.mode == Mode::Autonomous && d.aggregate_risk > 0.7f) size *= 0.8;
        return std::min(size, config_.position_cap());
    }

    float risk_score(const CoordinationDecision& d) const {
        double size_term = config_.position_cap() > 0.0 ? d.position_size / config_.position_cap() : 0.0;
        double score = 0.5 * d.aggregate_risk + 0.3 * (1.0 - d.consensus) + 0.2 * std::min(1.0, size_term);
        return static_cast<float>(std::clamp(score, 0.0, 1.0));
    }

    // ── deciding helpers ───────────────────────────────────────────────

    void hand_off(CoordinationState& state, const CoordinationDecision& d, const Event& ev) {
        for (const auto& [id, agent] : state.agents) {
            if (agent.category != AgentCategory::Execution) continue;
            if (agent.liveness == Liveness::Stopped) continue;
            try {
                supervisor_.deliver(id, ev);
            } catch (const Error& e) {
                log_warn("Coordinator", "handoff_failed", e.what(),
                         {{"agent", id}, {"decision", d.id}});
            }
        }
        state.phase = Phase::AwaitingOutcome;
    }

    void archive(const std::vector<Signal>& signals, const CoordinationState& state, uint64_t tick_id,
                 Clock::time_point deadline) {
        if (!config_.archive_signals) return;
        for (const auto& s : signals) {
            Event ev;
            ev.kind = EventKind::Signal;
            ev.agent_id = s.agent_id;
            ev.category = state.agents.at(s.agent_id).category;
            ev.ref_id = s.id;
            ev.symbol = s.symbol;
            ev.action = s.action;
            ev.confidence = s.confidence;
            ev.risk = s.risk;
            ev.payload = s.payload;
            ev.payload.tags.push_back(std::string("source:") + source_name(s.source));
            ev.payload.numbers["tick"] = static_cast<double>(tick_id);
            ev.timestamp = s.timestamp;
            output_.ingest(s.agent_id, ev, deadline);
        }
    }

    void remember_recent(CoordinationState& state, const CoordinationDecision& d) {
        state.recent.push_back(d);
        while (state.recent.size() > config_.recent_decisions) state.recent.pop_front();
    }

    TickResult finish(CoordinationState& state, TickResult& result, Timestamp started) {
        state.phase = state.pending.empty() ? Phase::Idle : Phase::AwaitingOutcome;
        log_info("Coordinator", "tick_end", "",
                 {{"tick", std::to_string(result.tick_id)},
                  {"responded", std::to_string(result.responded)},
                  {"timed_out", std::to_string(result.timed_out)},
                  {"errored", std::to_string(result.errored)},
                  {"decision", result.decision ? result.decision->id : ""},
                  {"ms", std::to_string(now() - started)}});
        return std::move(result);
    }

    TickResult abandon(CoordinationState& state, TickResult& result, const std::string& why) {
        state.phase = Phase::Idle;
        ++state.stats.abandoned;
        result.abandoned = true;
        result.decision.reset();
        log_warn("Coordinator", "tick_abandoned", why, {{"tick", std::to_string(result.tick_id)}});
        return std::move(result);
    }

    // ── learning ───────────────────────────────────────────────────────

    // Make the outcome durable: annotate the decision record and store an
    // outcome record. Each part is done once; true when both are done.
    bool persist_outcome(UnlearnedOutcome& u) {
        const CoordinationDecision& d = u.decision;
        if (!u.annotated) {
            u.annotated = !d.memory_ref || output_.annotate_outcome(*d.memory_ref, u.label);
        }
        if (!u.outcome_stored) {
            Event ev;
            ev.kind = EventKind::Outcome;
            ev.agent_id = COORDINATOR_ID;
            ev.category = AgentCategory::Coordination;
            ev.ref_id = d.id;
            ev.symbol = d.symbol;
            ev.action = d.action;
            ev.confidence = d.consensus;
            ev.risk = d.risk_score;
            ev.outcome = u.label;
            ev.pnl = d.pnl;
            ev.timestamp = d.resolved ? d.resolved : now();
            ev.payload.numbers["pnl"] = d.pnl;
            ev.payload.numbers["position_size"] = d.position_size;
            ev.payload.tags.push_back(std::string("action:") + action_name(d.action));
            for (const auto& a : d.contributors) ev.payload.tags.push_back("contributor:" + a);
            IngestReport report = output_.ingest(COORDINATOR_ID, ev);
            u.outcome_stored = !report.persist_pending();
        }
        return u.annotated && u.outcome_stored;
    }

    void defer_learning(CoordinationState& state, UnlearnedOutcome u) {
        ++state.stats.learning_deferred;
        log_warn("Coordinator", "learning_deferred", "memory unavailable, weights wait",
                 {{"decision", u.decision.id}, {"queued", std::to_string(state.unlearned.size() + 1)}});
        state.unlearned.push_back(std::move(u));
        while (state.unlearned.size() > config_.max_unlearned) {
            UnlearnedOutcome oldest = std::move(state.unlearned.front());
            state.unlearned.pop_front();
            log_warn("Coordinator", "learning_forced", "queue full, applying without memory",
                     {{"decision", oldest.decision.id}});
            apply_weights(state, oldest.decision, oldest.label);
        }
    }

    void apply_weights(CoordinationState& state, const CoordinationDecision& d, OutcomeLabel label) {
        if (label != OutcomeLabel::Success && label != OutcomeLabel::Failure) return;
        for (const auto& id : d.contributors) {
            auto it = state.agents.find(id);
            if (it == state.agents.end()) continue;
            float before = it->second.weight;
            float after = adjust_weight(before, label, config_.weight_step, config_.max_decay_fraction);
            if (after == before) continue;
            it->second.weight = after;
            ++state.stats.weight_updates;
            log_info("Coordinator", "weight_change", "",
                     {{"agent", id}, {"decision", d.id}, {"label", outcome_name(label)},
                      {"from", fixed2(before)}, {"to", fixed2(after)}});
        }
    }

    CoordinatorConfig config_;
    AgentSupervisor& supervisor_;
    OutputRouter& output_;
    InputRouter* input_;
};

} // namespace sabha
