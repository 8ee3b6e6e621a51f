#pragma once
// Reference agents: stand-ins for the fifteen roles
//
// Real market-facing logic lives outside this library. These agents
// replay a configured script, publish risk limits, record execution
// hand-offs, or consult memory for precedent. Enough to drive the
// coordinator end to end and to exercise every failure path.
//
// Every reference agent shares an AgentTrace with whoever created it, so
// a host or test can watch what the agent saw after the supervisor has
// taken ownership of it.

#include "agent.hpp"
#include "errors.hpp"
#include "input_router.hpp"
#include "log.hpp"
#include <mutex>
#include <thread>

namespace sabha {

// ═══════════════════════════════════════════════════════════════════════════
// Trace
// ═══════════════════════════════════════════════════════════════════════════

class AgentTrace {
public:
    void record_poll() { ++polls_; }
    uint64_t polls() const { return polls_; }

    void record_event(const Event& e) {
        std::lock_guard lock(mutex_);
        consumed_.push_back(e);
    }

    void record_handoff(const Event& e) {
        std::lock_guard lock(mutex_);
        handoffs_.push_back(e);
    }

    std::vector<Event> consumed() const {
        std::lock_guard lock(mutex_);
        return consumed_;
    }

    std::vector<Event> handoffs() const {
        std::lock_guard lock(mutex_);
        return handoffs_;
    }

    // Health reported to re-admission probes
    void set_healthy(bool h) { healthy_ = h; }
    bool healthy() const { return healthy_; }

    // Next n deliveries throw before being recorded
    void fail_deliveries(uint32_t n) { failing_deliveries_ = n; }

    // Each delivery takes this long before it is recorded
    void delay_deliveries(uint32_t ms) { delivery_delay_ms_ = ms; }
    uint32_t delivery_delay_ms() const { return delivery_delay_ms_; }

    bool take_delivery_failure() {
        uint32_t n = failing_deliveries_.load();
        while (n > 0) {
            if (failing_deliveries_.compare_exchange_weak(n, n - 1)) return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> consumed_;
    std::vector<Event> handoffs_;
    std::atomic<uint64_t> polls_{0};
    std::atomic<bool> healthy_{true};
    std::atomic<uint32_t> failing_deliveries_{0};
    std::atomic<uint32_t> delivery_delay_ms_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Script
// ═══════════════════════════════════════════════════════════════════════════

// One entry of a scripted feed. Tick n plays step (n-1) mod size.
struct ScriptStep {
    std::string id;                  // Empty: assigned by the coordinator
    std::string symbol;              // Empty: first watchlist symbol
    Action action = Action::Hold;
    float confidence = 0.5f;
    float risk = 0.5f;
    uint32_t delay_ms = 0;           // Simulated work before answering
    bool fail = false;               // Throw instead of answering
    bool abstain = false;            // Answer with no signal
    SourceKind source = SourceKind::Simulated;
    Payload payload;
};

inline ScriptStep parse_script_step(const json& j, const std::string& path) {
    if (!j.is_object()) throw ConfigurationError(path + " must be an object");
    ScriptStep step;
    try {
        step.id = j.value("id", std::string());
        step.symbol = j.value("symbol", std::string());
        if (j.contains("action")) {
            auto a = parse_action(j.at("action").get<std::string>());
            if (!a) throw ConfigurationError(path + ".action is not hold, buy or sell");
            step.action = *a;
        }
        step.confidence = j.value("confidence", step.confidence);
        step.risk = j.value("risk", step.risk);
        step.delay_ms = j.value("delay_ms", step.delay_ms);
        step.fail = j.value("fail", false);
        step.abstain = j.value("abstain", false);
        if (j.contains("source")) {
            auto s = parse_source(j.at("source").get<std::string>());
            if (!s) throw ConfigurationError(path + ".source is not live, derived or simulated");
            step.source = *s;
        }
        if (j.contains("tags")) step.payload.tags = j.at("tags").get<std::vector<std::string>>();
        if (j.contains("numbers")) {
            for (const auto& [k, v] : j.at("numbers").items()) step.payload.numbers[k] = v.get<double>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return step;
}

inline std::vector<ScriptStep> parse_script(const json& options, const std::string& path) {
    std::vector<ScriptStep> script;
    if (!options.is_object() || !options.contains("script")) return script;
    const json& arr = options.at("script");
    if (!arr.is_array()) throw ConfigurationError(path + ".script must be an array");
    for (size_t i = 0; i < arr.size(); ++i) {
        script.push_back(parse_script_step(arr[i], path + ".script[" + std::to_string(i) + "]"));
    }
    return script;
}

// ═══════════════════════════════════════════════════════════════════════════
// Agents
// ═══════════════════════════════════════════════════════════════════════════

class ReferenceAgent : public Agent {
public:
    ReferenceAgent(AgentSpec spec, std::shared_ptr<AgentTrace> trace)
        : Agent(std::move(spec)),
          trace_(trace ? std::move(trace) : std::make_shared<AgentTrace>()) {}

    void consume_event(const Event& event) override {
        if (uint32_t ms = trace_->delivery_delay_ms()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        if (trace_->take_delivery_failure()) {
            throw std::runtime_error("agent " + id() + " refused " + event.ref_id);
        }
        trace_->record_event(event);
        on_event(event);
    }

    bool healthy() override { return trace_->healthy(); }

    std::shared_ptr<AgentTrace> trace() const { return trace_; }

protected:
    virtual void on_event(const Event&) {}

    // Sleep in small slices; false when the tick was cancelled first
    static bool work_for(uint32_t ms, const TickContext& ctx) {
        auto until = Clock::now() + std::chrono::milliseconds(ms);
        while (Clock::now() < until) {
            if (ctx.cancelled()) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return true;
    }

    static std::string default_symbol(const TickContext& ctx, const std::string& configured) {
        if (!configured.empty()) return configured;
        return ctx.watchlist.empty() ? std::string() : ctx.watchlist.front();
    }

    std::shared_ptr<AgentTrace> trace_;
};

// Signal generation, timing, rule validation, services and coordination
// roles: replay a script
class ScriptedAgent : public ReferenceAgent {
public:
    ScriptedAgent(AgentSpec spec, std::shared_ptr<AgentTrace> trace = nullptr)
        : ReferenceAgent(std::move(spec), std::move(trace)),
          script_(parse_script(spec_.options, "agents." + spec_.id)) {}

    std::optional<Signal> produce_signal(const TickContext& ctx) override {
        trace_->record_poll();
        if (script_.empty()) return std::nullopt;

        const ScriptStep& step = script_[(ctx.tick_id == 0 ? 0 : ctx.tick_id - 1) % script_.size()];
        if (step.delay_ms > 0 && !work_for(step.delay_ms, ctx)) return std::nullopt;
        if (step.fail) throw std::runtime_error("agent " + id() + " failed on tick " + std::to_string(ctx.tick_id));
        if (step.abstain) return std::nullopt;

        Signal s;
        s.id = step.id;
        s.agent_id = id();
        s.timestamp = ctx.timestamp;
        s.symbol = default_symbol(ctx, step.symbol);
        s.action = step.action;
        s.confidence = step.confidence;
        s.risk = step.risk;
        s.payload = step.payload;
        s.payload.tags.push_back(std::string("role:") + role_name(role()));
        s.source = step.source;
        return s;
    }

    size_t script_size() const { return script_.size(); }

private:
    std::vector<ScriptStep> script_;
};

// Risk roles: publish limits every tick. Options max_open_positions,
// max_daily_loss and symbol_exposure_cap become payload numbers that
// tighten the gate. A script, when present, takes precedence.
class RiskLimitAgent : public ScriptedAgent {
public:
    RiskLimitAgent(AgentSpec spec, std::shared_ptr<AgentTrace> trace = nullptr)
        : ScriptedAgent(std::move(spec), std::move(trace))
    {
        const json& o = spec_.options;
        if (!o.is_object()) return;
        for (const char* key : {"max_open_positions", "max_daily_loss", "symbol_exposure_cap"}) {
            if (!o.contains(key)) continue;
            if (!o.at(key).is_number()) {
                throw ConfigurationError("agents." + spec_.id + "." + key + " must be a number");
            }
            limits_.numbers[key] = o.at(key).get<double>();
        }
        symbol_ = o.value("symbol", std::string());
        risk_ = o.value("risk", 0.5f);
    }

    std::optional<Signal> produce_signal(const TickContext& ctx) override {
        if (script_size() > 0) return ScriptedAgent::produce_signal(ctx);
        trace_->record_poll();
        if (limits_.numbers.empty()) return std::nullopt;

        Signal s;
        s.agent_id = id();
        s.timestamp = ctx.timestamp;
        s.symbol = default_symbol(ctx, symbol_);
        s.action = Action::Hold;
        s.confidence = 1.0f;
        s.risk = risk_;
        s.payload = limits_;
        s.payload.tags.push_back(std::string("role:") + role_name(role()));
        s.source = SourceKind::Derived;
        return s;
    }

private:
    Payload limits_;
    std::string symbol_;
    float risk_ = 0.5f;
};

// Execution roles: never vote; keep every approved decision handed to
// them, once per decision even when it also arrives by subscription
class ExecutionAgent : public ReferenceAgent {
public:
    using ReferenceAgent::ReferenceAgent;

    std::optional<Signal> produce_signal(const TickContext&) override {
        trace_->record_poll();
        return std::nullopt;
    }

protected:
    void on_event(const Event& e) override {
        if (e.kind != EventKind::Decision || e.verdict != Verdict::Approved) return;
        if (!executed_.insert(e.ref_id).second) return;
        trace_->record_handoff(e);
        log_info("Execution", "handoff", e.ref_id,
                 {{"agent", id()}, {"symbol", e.symbol}, {"action", action_name(e.action)}});
    }

private:
    std::set<std::string> executed_;   // Decision ids; worker thread only
};

// Memory role: back the action with the best record of past outcomes
// for the symbol. Confidence is that action's success ratio.
class PrecedentAgent : public ScriptedAgent {
public:
    PrecedentAgent(AgentSpec spec, InputRouter* input, std::shared_ptr<AgentTrace> trace = nullptr)
        : ScriptedAgent(std::move(spec), std::move(trace)), input_(input)
    {
        const json& o = spec_.options;
        if (o.is_object()) {
            symbol_ = o.value("symbol", std::string());
            depth_ = o.value("depth", depth_);
            min_outcomes_ = o.value("min_outcomes", min_outcomes_);
        }
    }

    std::optional<Signal> produce_signal(const TickContext& ctx) override {
        if (script_size() > 0) return ScriptedAgent::produce_signal(ctx);
        trace_->record_poll();
        if (!input_) return std::nullopt;

        std::string symbol = default_symbol(ctx, symbol_);
        if (symbol.empty()) return std::nullopt;

        auto query = RetrievalQuery::from_context(id(), QueryType::Precedent, {{"symbol", symbol}});
        query.kinds = {EventKind::Outcome};
        query.include_failures = true;

        std::vector<RankedRecord> precedent;
        try {
            precedent = input_->retrieve(id(), query, depth_);
        } catch (const Error& e) {
            log_warn("Precedent", "recall_failed", e.what(),
                     {{"agent", id()}, {"tick", std::to_string(ctx.tick_id)}});
            return std::nullopt;
        }

        std::map<Action, std::pair<size_t, size_t>> tally;   // successes, decided
        for (const auto& rr : precedent) {
            const auto& r = rr.record;
            if (r.kind != EventKind::Outcome || !r.outcome || r.symbol != symbol) continue;
            if (*r.outcome != OutcomeLabel::Success && *r.outcome != OutcomeLabel::Failure) continue;
            for (const auto& tag : r.payload.tags) {
                if (tag.rfind("action:", 0) != 0) continue;
                if (auto a = parse_action(tag.substr(7))) {
                    auto& [won, decided] = tally[*a];
                    if (*r.outcome == OutcomeLabel::Success) ++won;
                    ++decided;
                }
            }
        }

        std::optional<Action> best;
        float best_ratio = 0.0f;
        size_t best_decided = 0;
        for (const auto& [action, counts] : tally) {
            if (action == Action::Hold || counts.second < min_outcomes_) continue;
            float ratio = static_cast<float>(counts.first) / counts.second;
            if (!best || ratio > best_ratio) {
                best = action;
                best_ratio = ratio;
                best_decided = counts.second;
            }
        }
        if (!best) return std::nullopt;

        Signal s;
        s.agent_id = id();
        s.timestamp = ctx.timestamp;
        s.symbol = symbol;
        s.action = *best;
        s.confidence = best_ratio;
        s.risk = 1.0f - best_ratio;
        s.payload.numbers["precedents"] = static_cast<double>(best_decided);
        s.payload.tags.push_back(std::string("role:") + role_name(role()));
        s.source = SourceKind::Derived;
        return s;
    }

private:
    InputRouter* input_;
    std::string symbol_;
    size_t depth_ = 20;
    size_t min_outcomes_ = 1;
};

// ═══════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════

struct AgentDeps {
    InputRouter* input = nullptr;
    std::shared_ptr<AgentTrace> trace;     // Empty: a fresh trace
};

inline std::unique_ptr<ReferenceAgent> make_agent(AgentSpec spec, const AgentDeps& deps = {}) {
    switch (spec.role) {
        case AgentRole::Strategy:
        case AgentRole::SignalGenerator:
        case AgentRole::PennyScanner:
        case AgentRole::MarketTiming:
        case AgentRole::RuleSet:
        case AgentRole::MarketData:
        case AgentRole::ToolControl:
        case AgentRole::RuntimeMonitor:
        case AgentRole::StrategyManager:
            return std::make_unique<ScriptedAgent>(std::move(spec), deps.trace);
        case AgentRole::RiskManager:
        case AgentRole::PortfolioTracker:
        case AgentRole::TaxEstimator:
            return std::make_unique<RiskLimitAgent>(std::move(spec), deps.trace);
        case AgentRole::IbkrTrader:
        case AgentRole::KalshiTrader:
            return std::make_unique<ExecutionAgent>(std::move(spec), deps.trace);
        case AgentRole::MemoryAgent:
            return std::make_unique<PrecedentAgent>(std::move(spec), deps.input, deps.trace);
    }
    throw ConfigurationError("agent '" + spec.id + "' has an unsupported role");
}

} // namespace sabha
