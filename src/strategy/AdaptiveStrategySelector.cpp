#include "strategy/AdaptiveStrategySelector.h"
#include "strategy/SignalScorer.h"
#include "analytics/TechnicalIndicators.h"
#include "risk/RiskOverlay.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimetrader {
namespace strategy {

namespace {
constexpr double kMinBullishFactor = 0.7;
constexpr double kMaxMultiplier = 2.0;
}

AdaptiveStrategySelector::AdaptiveStrategySelector(analytics::RegimeDetector& detector,
                                                   core::ISessionStore& sessions)
    : detector_(detector), sessions_(sessions) {}

TradingSignal AdaptiveStrategySelector::generateSignal(const PriceSeries& series,
                                                       const AdaptiveConfig& config,
                                                       size_t index,
                                                       const std::string& session_key) {
    if (index >= series.size()) {
        throw std::out_of_range("adaptive signal index " + std::to_string(index) +
                                " out of range for series '" + series.id + "'");
    }

    // 1. Regime, recorded every bar so persistence/whipsaw see the full sequence
    const analytics::RegimeSignal regime = detector_.detect(series, index);

    core::SessionState state = sessions_.get(session_key).value_or(core::SessionState{});
    state.pushRegime(regime.regime, config.regimeHistoryCapacity());
    sessions_.put(session_key, state);

    // 2-4. Risk gates
    risk::RiskGate gate = risk::RiskGate::NONE;
    if (risk::RiskOverlay::checkVolatility(regime, config.max_volatility)) {
        gate = risk::RiskGate::VOLATILITY;
    } else if (risk::RiskOverlay::checkCircuitBreaker(state, config.circuit_breaker_win_rate,
                                                      config.circuit_breaker_lookback,
                                                      config.circuit_breaker_min_trades)) {
        gate = risk::RiskGate::CIRCUIT_BREAKER;
    } else if (risk::RiskOverlay::checkWhipsaw(state, config.whipsaw_detection_periods,
                                               config.whipsaw_max_changes)) {
        gate = risk::RiskGate::WHIPSAW;
    }

    if (gate != risk::RiskGate::NONE) {
        LOG_WARN("[{}] bar {} forced hold by {} gate (regime={}, volatility={:.3f})",
                 session_key, index, risk::toString(gate),
                 analytics::toString(regime.regime), regime.indicators.volatility);
        return holdSignal(series, config, index, regime, gate);
    }

    // 5-8. Strategy selection
    const bool persistent = risk::RiskOverlay::isRegimePersistent(
        state, regime.regime, config.regime_persistence_periods);
    const bool confident = regime.confidence >= config.regime_confidence_threshold;
    const StrategyConfig& conservative = config.neutral_strategy ? *config.neutral_strategy
                                                                 : config.bearish_strategy;

    const StrategyConfig* active = &conservative;
    bool momentum_confirmed = false;
    if (persistent && confident && regime.regime == analytics::MarketRegime::BULLISH) {
        if (regime.indicators.momentum >= config.momentum_confirmation_threshold) {
            active = &config.bullish_strategy;
            momentum_confirmed = true;
        } else {
            active = &config.bearish_strategy;
        }
    } else if (persistent && confident && regime.regime == analytics::MarketRegime::BEARISH) {
        active = &config.bearish_strategy;
    }

    // 9. Blended signal of the selected strategy
    TradingSignal out;
    out.timestamp = series.candles[index].timestamp;
    out.regime = regime;
    out.momentum_confirmed = momentum_confirmed;
    out.active_strategy = *active;

    const auto closes = analytics::TechnicalIndicators::extractClosePrices(series.candles);
    const double raw_signal = SignalScorer::blendedSignal(*active, closes, index, &out.indicator_scores);
    out.signal = raw_signal;
    out.confidence = std::abs(raw_signal);
    out.action = active->indicators.empty() ? SignalAction::HOLD
                                            : SignalScorer::actionFor(raw_signal, *active);

    // 10. Position multiplier
    if (config.dynamic_position_sizing && momentum_confirmed) {
        out.position_size_multiplier = dynamicPositionMultiplier(config, regime.confidence);
        out.signal = std::max(-1.0, std::min(1.0, raw_signal * out.position_size_multiplier));
    }

    return out;
}

double AdaptiveStrategySelector::dynamicPositionMultiplier(const AdaptiveConfig& config,
                                                           double regime_confidence) {
    const double base = config.bullish_strategy.max_position_pct;
    if (base <= 0.0) {
        return 1.0;
    }
    const double min_position = base * kMinBullishFactor;
    const double max_position = config.max_bullish_position;
    const double confidence = std::max(0.0, std::min(1.0, regime_confidence));
    const double position = std::min(max_position, min_position + confidence * (max_position - min_position));
    return std::max(0.0, std::min(kMaxMultiplier, position / base));
}

void AdaptiveStrategySelector::recordTradeResult(const std::string& session_key, bool is_win,
                                                 const AdaptiveConfig& config) {
    sessions_.recordOutcome(session_key, is_win, config.outcomeHistoryCapacity());
}

void AdaptiveStrategySelector::clearRegimeHistory(const std::string& session_key) {
    sessions_.clear(session_key);
}

void AdaptiveStrategySelector::clearRegimeHistory() {
    sessions_.clearAll();
    detector_.invalidate();
}

TradingSignal AdaptiveStrategySelector::holdSignal(const PriceSeries& series, const AdaptiveConfig& config,
                                                   size_t index, const analytics::RegimeSignal& regime,
                                                   risk::RiskGate gate) const {
    TradingSignal out;
    out.timestamp = series.candles[index].timestamp;
    out.action = SignalAction::HOLD;
    out.active_strategy = config.bearish_strategy;
    out.regime = regime;
    out.blocked_by = gate;
    return out;
}

} // namespace strategy
} // namespace regimetrader
