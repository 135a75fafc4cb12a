#pragma once

#include <map>
#include <string>

#include "common/Types.h"
#include "analytics/RegimeDetector.h"
#include "risk/RiskOverlay.h"
#include "strategy/StrategyConfig.h"

namespace regimetrader {
namespace strategy {

// One decision per bar per session
struct TradingSignal {
    long long timestamp = 0;
    double signal = 0.0;                   // -1 .. +1
    double confidence = 0.0;               // 0 .. 1
    SignalAction action = SignalAction::HOLD;
    StrategyConfig active_strategy;
    double position_size_multiplier = 1.0; // 0 .. 2
    bool momentum_confirmed = false;

    // Audit trail
    analytics::RegimeSignal regime;
    risk::RiskGate blocked_by = risk::RiskGate::NONE;
    std::map<std::string, double> indicator_scores;  // "<type>_<position>" -> score
};

} // namespace strategy
} // namespace regimetrader
