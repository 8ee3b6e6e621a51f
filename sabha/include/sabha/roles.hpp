#pragma once
// Roles: the closed registry of agent kinds
//
// Fifteen roles, each belonging to exactly one category. The category
// drives consensus participation, risk gating and fan-out interest.

#include "types.hpp"
#include <array>

namespace sabha {

enum class AgentRole : uint8_t {
    Strategy = 0,
    SignalGenerator,
    PennyScanner,
    MarketTiming,
    RuleSet,
    RiskManager,
    PortfolioTracker,
    TaxEstimator,
    IbkrTrader,
    KalshiTrader,
    MemoryAgent,
    MarketData,
    ToolControl,
    RuntimeMonitor,
    StrategyManager,
};

constexpr size_t ROLE_COUNT = 15;

inline const std::array<AgentRole, ROLE_COUNT>& all_roles() {
    static const std::array<AgentRole, ROLE_COUNT> roles = {
        AgentRole::Strategy, AgentRole::SignalGenerator, AgentRole::PennyScanner,
        AgentRole::MarketTiming, AgentRole::RuleSet, AgentRole::RiskManager,
        AgentRole::PortfolioTracker, AgentRole::TaxEstimator, AgentRole::IbkrTrader,
        AgentRole::KalshiTrader, AgentRole::MemoryAgent, AgentRole::MarketData,
        AgentRole::ToolControl, AgentRole::RuntimeMonitor, AgentRole::StrategyManager,
    };
    return roles;
}

inline const char* role_name(AgentRole r) {
    switch (r) {
        case AgentRole::Strategy: return "strategy";
        case AgentRole::SignalGenerator: return "signal_generator";
        case AgentRole::PennyScanner: return "penny_scanner";
        case AgentRole::MarketTiming: return "market_timing";
        case AgentRole::RuleSet: return "rule_set";
        case AgentRole::RiskManager: return "risk_manager";
        case AgentRole::PortfolioTracker: return "portfolio_tracker";
        case AgentRole::TaxEstimator: return "tax_estimator";
        case AgentRole::IbkrTrader: return "ibkr_trader";
        case AgentRole::KalshiTrader: return "kalshi_trader";
        case AgentRole::MemoryAgent: return "memory_agent";
        case AgentRole::MarketData: return "market_data";
        case AgentRole::ToolControl: return "tool_control";
        case AgentRole::RuntimeMonitor: return "runtime_monitor";
        case AgentRole::StrategyManager: return "strategy_manager";
    }
    return "unknown";
}

inline std::optional<AgentRole> parse_role(const std::string& s) {
    for (AgentRole r : all_roles()) {
        if (s == role_name(r)) return r;
    }
    return std::nullopt;
}

inline AgentCategory role_category(AgentRole r) {
    switch (r) {
        case AgentRole::Strategy:
        case AgentRole::SignalGenerator:
        case AgentRole::PennyScanner:
            return AgentCategory::SignalGeneration;
        case AgentRole::MarketTiming:
            return AgentCategory::Timing;
        case AgentRole::RuleSet:
            return AgentCategory::RuleValidation;
        case AgentRole::RiskManager:
        case AgentRole::PortfolioTracker:
        case AgentRole::TaxEstimator:
            return AgentCategory::Risk;
        case AgentRole::IbkrTrader:
        case AgentRole::KalshiTrader:
            return AgentCategory::Execution;
        case AgentRole::MemoryAgent:
            return AgentCategory::Memory;
        case AgentRole::MarketData:
        case AgentRole::ToolControl:
            return AgentCategory::Service;
        case AgentRole::RuntimeMonitor:
        case AgentRole::StrategyManager:
            return AgentCategory::Coordination;
    }
    return AgentCategory::Service;
}

// Categories whose signals vote in consensus. Risk signals feed the
// gate, execution agents only receive hand-offs.
inline bool votes_in_consensus(AgentCategory c) {
    return c != AgentCategory::Risk && c != AgentCategory::Execution;
}

} // namespace sabha
