#pragma once

#include <string>

#include "common/Types.h"
#include "analytics/RegimeDetector.h"
#include "core/contracts/ISessionStore.h"
#include "strategy/StrategyConfig.h"
#include "strategy/TradingSignal.h"

namespace regimetrader {
namespace strategy {

// Regime-aware choice between the bullish and bearish strategy, behind the risk overlay.
// Detector and session store are owned by the caller and must outlive the selector.
class AdaptiveStrategySelector {
public:
    AdaptiveStrategySelector(analytics::RegimeDetector& detector, core::ISessionStore& sessions);

    // Bars of one session must be fed in increasing index order.
    // Throws std::out_of_range if index is past the end of the series.
    TradingSignal generateSignal(const PriceSeries& series, const AdaptiveConfig& config,
                                 size_t index, const std::string& session_key);

    void recordTradeResult(const std::string& session_key, bool is_win, const AdaptiveConfig& config);

    // Drops the session's regime history, trade outcomes and drawdown peak
    void clearRegimeHistory(const std::string& session_key);
    // Drops every session and the detector cache
    void clearRegimeHistory();

    // Bullish position fraction scaled by regime confidence, relative to the bullish base
    static double dynamicPositionMultiplier(const AdaptiveConfig& config, double regime_confidence);

private:
    TradingSignal holdSignal(const PriceSeries& series, const AdaptiveConfig& config, size_t index,
                             const analytics::RegimeSignal& regime, risk::RiskGate gate) const;

    analytics::RegimeDetector& detector_;
    core::ISessionStore& sessions_;
};

} // namespace strategy
} // namespace regimetrader
