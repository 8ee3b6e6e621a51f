#pragma once
// Risk Gate: hard limits, never traded against confidence
//
// Limits come from configuration and may only be tightened by the
// numeric payload of risk-role signals for the current tick.

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace sabha {

struct RiskLimits {
    size_t max_open_positions = 10;
    double max_daily_loss = 1000.0;        // Currency units; 0 halts on the first loss
    double symbol_exposure_cap = 0.10;     // Fraction of capital per symbol
};

struct PortfolioState {
    size_t open_positions = 0;
    double daily_pnl = 0.0;
    int64_t pnl_day = 0;                   // UTC day daily_pnl belongs to
    std::map<std::string, double> exposure;

    double exposure_of(const std::string& symbol) const {
        auto it = exposure.find(symbol);
        return it != exposure.end() ? it->second : 0.0;
    }

    // Daily P&L restarts at each UTC midnight
    void roll_day(Timestamp ts) {
        int64_t day = ts / MILLIS_PER_DAY;
        if (day != pnl_day) {
            pnl_day = day;
            daily_pnl = 0.0;
        }
    }
};

struct GateResult {
    std::vector<std::string> violations;
    RiskLimits limits;                     // Effective limits after tightening

    bool passed() const { return violations.empty(); }
};

// Values at or above the current limit (including infinity) leave it as is
inline RiskLimits tighten(RiskLimits base, const std::vector<Signal>& risk_signals) {
    for (const auto& s : risk_signals) {
        if (auto v = s.payload.number("max_open_positions");
            v && *v >= 0.0 && *v < static_cast<double>(base.max_open_positions)) {
            base.max_open_positions = static_cast<size_t>(*v);
        }
        if (auto v = s.payload.number("max_daily_loss"); v && *v >= 0.0) {
            base.max_daily_loss = std::min(base.max_daily_loss, *v);
        }
        if (auto v = s.payload.number("symbol_exposure_cap"); v && *v >= 0.0) {
            base.symbol_exposure_cap = std::min(base.symbol_exposure_cap, *v);
        }
    }
    return base;
}

// Every limit is checked; all violations are reported
inline GateResult evaluate_gates(const RiskLimits& limits, const PortfolioState& portfolio,
                                 const std::string& symbol, Action action, double position_size) {
    GateResult g;
    g.limits = limits;

    bool opens = action != Action::Hold;
    if (opens && portfolio.open_positions >= limits.max_open_positions) {
        g.violations.push_back("max_open_positions: " + std::to_string(portfolio.open_positions) +
                               " open, limit " + std::to_string(limits.max_open_positions));
    }
    // Breached by a realised loss reaching the limit; a flat or winning day never is
    double lost = -portfolio.daily_pnl;
    if (lost > 0.0 && lost >= limits.max_daily_loss) {
        g.violations.push_back("max_daily_loss: lost " + std::to_string(lost) +
                               ", limit " + std::to_string(limits.max_daily_loss));
    }
    if (opens && portfolio.exposure_of(symbol) + position_size > limits.symbol_exposure_cap) {
        g.violations.push_back("symbol_exposure_cap: " + symbol + " would reach " +
                               std::to_string(portfolio.exposure_of(symbol) + position_size) +
                               ", cap " + std::to_string(limits.symbol_exposure_cap));
    }
    return g;
}

} // namespace sabha
