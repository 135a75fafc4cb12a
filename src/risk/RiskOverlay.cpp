#include "risk/RiskOverlay.h"

#include <algorithm>

namespace regimetrader {
namespace risk {

std::string toString(RiskGate gate) {
    switch (gate) {
        case RiskGate::NONE: return "none";
        case RiskGate::VOLATILITY: return "volatility";
        case RiskGate::CIRCUIT_BREAKER: return "circuit-breaker";
        case RiskGate::WHIPSAW: return "whipsaw";
        case RiskGate::DRAWDOWN: return "drawdown";
    }
    return "none";
}

bool RiskOverlay::checkVolatility(const analytics::RegimeSignal& regime, double max_volatility) {
    return regime.indicators.volatility > max_volatility;
}

std::optional<double> RiskOverlay::recentWinRate(const core::SessionState& state, int lookback) {
    const auto& outcomes = state.trade_outcomes;
    if (outcomes.empty() || lookback <= 0) {
        return std::nullopt;
    }

    const std::size_t window = std::min(outcomes.size(), static_cast<std::size_t>(lookback));
    const auto begin = outcomes.end() - static_cast<std::ptrdiff_t>(window);
    const auto wins = std::count(begin, outcomes.end(), true);
    return static_cast<double>(wins) / static_cast<double>(window);
}

bool RiskOverlay::checkCircuitBreaker(const core::SessionState& state, double min_win_rate,
                                      int lookback, int min_trades) {
    if (state.trade_outcomes.size() < static_cast<std::size_t>(std::max(1, min_trades))) {
        return false;
    }
    auto win_rate = recentWinRate(state, lookback);
    return win_rate.has_value() && *win_rate < min_win_rate;
}

int RiskOverlay::countRegimeChanges(const core::SessionState& state, int periods) {
    const auto& history = state.regime_history;
    if (history.size() < 2 || periods < 2) {
        return 0;
    }

    const std::size_t window = std::min(history.size(), static_cast<std::size_t>(periods));
    int changes = 0;
    for (std::size_t i = history.size() - window + 1; i < history.size(); ++i) {
        if (history[i] != history[i - 1]) {
            changes++;
        }
    }
    return changes;
}

bool RiskOverlay::checkWhipsaw(const core::SessionState& state, int periods, int max_changes) {
    return countRegimeChanges(state, periods) >= max_changes;
}

bool RiskOverlay::isRegimePersistent(const core::SessionState& state, analytics::MarketRegime regime,
                                     int periods) {
    if (periods <= 1) {
        return true;
    }
    const auto& history = state.regime_history;
    if (history.size() < static_cast<std::size_t>(periods)) {
        return false;
    }
    return std::all_of(history.end() - periods, history.end(),
                       [regime](analytics::MarketRegime r) { return r == regime; });
}

bool RiskOverlay::checkDrawdown(core::SessionState& state, double current_value, double threshold) {
    if (current_value > state.peak_portfolio_value) {
        state.peak_portfolio_value = current_value;
    }
    if (state.peak_portfolio_value <= 0.0) {
        return false;
    }
    const double drawdown = (state.peak_portfolio_value - current_value) / state.peak_portfolio_value;
    return drawdown >= threshold;
}

} // namespace risk
} // namespace regimetrader
