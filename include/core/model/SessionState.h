#pragma once

#include <cstddef>
#include <deque>

#include "analytics/RegimeDetector.h"

namespace regimetrader {
namespace core {

// Per session-key memory of the adaptive selector. Never persisted.
struct SessionState {
    std::deque<analytics::MarketRegime> regime_history;  // oldest first
    std::deque<bool> trade_outcomes;                     // true = win, oldest first
    double peak_portfolio_value = 0.0;

    void pushRegime(analytics::MarketRegime regime, std::size_t capacity) {
        regime_history.push_back(regime);
        while (regime_history.size() > capacity) {
            regime_history.pop_front();
        }
    }

    void recordOutcome(bool is_win, std::size_t capacity) {
        trade_outcomes.push_back(is_win);
        while (trade_outcomes.size() > capacity) {
            trade_outcomes.pop_front();
        }
    }
};

} // namespace core
} // namespace regimetrader
