#pragma once
// Agent: the capability contract
//
// Every participant, whatever its role, answers two calls:
//   produce_signal(ctx)  - its opinion for this tick (or none)
//   consume_event(event) - something another participant emitted
// Both run on the agent's own worker; an agent never sees two calls at once.

#include "codec.hpp"
#include "roles.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sabha {

using Clock = std::chrono::steady_clock;

// Tick deadline shared by every call made on behalf of one tick.
// Agents poll it; the coordinator stops waiting when it expires.
class CancelToken {
public:
    explicit CancelToken(Clock::time_point deadline) : deadline_(deadline) {}

    static std::shared_ptr<CancelToken> after(std::chrono::milliseconds budget) {
        return std::make_shared<CancelToken>(Clock::now() + budget);
    }

    void cancel() { cancelled_ = true; }

    bool cancelled() const { return cancelled_ || Clock::now() >= deadline_; }

    Clock::time_point deadline() const { return deadline_; }

    std::chrono::milliseconds remaining() const {
        if (cancelled_) return std::chrono::milliseconds(0);
        auto left = deadline_ - Clock::now();
        if (left <= Clock::duration::zero()) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(left);
    }

private:
    Clock::time_point deadline_;
    std::atomic<bool> cancelled_{false};
};

struct TickContext {
    uint64_t tick_id = 0;
    Timestamp timestamp = 0;
    std::vector<std::string> watchlist;
    std::shared_ptr<const CancelToken> cancel;

    bool cancelled() const { return cancel && cancel->cancelled(); }
};

// Static registry entry, fixed at boot
struct AgentSpec {
    std::string id;
    AgentRole role = AgentRole::Strategy;
    float weight = 1.0f;                 // Initial performance weight, [0,2]
    float significance = 0.5f;           // Weight of this agent's events in memory admission
    std::set<AgentCategory> interests;   // Categories of events delivered to this agent
    json options;                        // Role-specific settings

    AgentCategory category() const { return role_category(role); }
};

class Agent {
public:
    explicit Agent(AgentSpec spec) : spec_(std::move(spec)) {}
    virtual ~Agent() = default;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& id() const { return spec_.id; }
    AgentRole role() const { return spec_.role; }
    AgentCategory category() const { return spec_.category(); }
    const AgentSpec& spec() const { return spec_; }

    // Latest opinion for this tick; nullopt when the agent abstains
    virtual std::optional<Signal> produce_signal(const TickContext& ctx) = 0;

    // Event routed to this agent by category interest
    virtual void consume_event(const Event& event) = 0;

    // Consulted before a degraded agent is re-admitted
    virtual bool healthy() { return true; }

protected:
    AgentSpec spec_;
};

} // namespace sabha
