#pragma once

#include <vector>

#include "common/Types.h"
#include "strategy/TradingSignal.h"

namespace regimetrader {
namespace strategy {

// Execution confidence in [0, 1] from signal strength, indicator agreement,
// recent volatility, distance from SMA20 and relative volume.
class ConfidenceCalculator {
public:
    static double calculateConfidence(const TradingSignal& signal,
                                      const std::vector<Candle>& candles, size_t index);
};

} // namespace strategy
} // namespace regimetrader
