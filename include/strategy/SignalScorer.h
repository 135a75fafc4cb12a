#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include "strategy/TradingSignal.h"

namespace regimetrader {
namespace strategy {

// Indicator -> normalized score in [-1, +1], and the blended strategy signal.
// Insufficient history for an indicator scores 0.
class SignalScorer {
public:
    static double scoreIndicator(const IndicatorConfig& indicator,
                                 const std::vector<double>& closes, size_t index);

    // Weighted average over the strategy's indicators, normalized by total weight.
    // Per-indicator scores go to `scores` when given.
    static double blendedSignal(const StrategyConfig& config, const std::vector<double>& closes,
                                size_t index, std::map<std::string, double>* scores = nullptr);

    // Throws std::out_of_range if index is past the end of candles.
    static TradingSignal generateSignal(const std::vector<Candle>& candles,
                                        const StrategyConfig& config, size_t index);

    static SignalAction actionFor(double signal, const StrategyConfig& config);

    // ===== Value mappers =====
    // clamp((price - ma) / ma * 10)
    static double scoreMovingAverage(double price, double moving_average);
    // >70 -> [-1, 0), <30 -> (0, 1], otherwise 0
    static double scoreRsi(double rsi);
    // >= upper -> -1, <= lower -> +1, else band position centered and doubled
    static double scoreBollinger(double price, double upper, double lower);
    // histogram / (range / 100), range = 20-bar high - low
    static double scoreMacdHistogram(double histogram, double price_range);
};

} // namespace strategy
} // namespace regimetrader
