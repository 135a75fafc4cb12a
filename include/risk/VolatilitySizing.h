#pragma once

#include "common/Types.h"
#include <vector>

namespace regimetrader {
namespace risk {

struct VolatilitySizingConfig {
    bool enabled = false;
    int atr_period = 14;
    int lookback = 30;
    double high_volatility_threshold = 2.0;  // current ATR% / average ATR%
    double max_position_reduction = 0.5;
    bool use_ema = true;
};

class VolatilitySizing {
public:
    // 1.0 in normal conditions, down to (1 - max_position_reduction) when ATR% spikes
    static double calculateMultiplier(const std::vector<Candle>& candles, size_t index,
                                      const VolatilitySizingConfig& config);
};

} // namespace risk
} // namespace regimetrader
