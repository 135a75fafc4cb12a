#include "risk/VolatilitySizing.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace regimetrader {
namespace risk {

double VolatilitySizing::calculateMultiplier(const std::vector<Candle>& candles, size_t index,
                                             const VolatilitySizingConfig& config) {
    if (!config.enabled || index >= candles.size() || index < static_cast<size_t>(config.atr_period)) {
        return 1.0;
    }

    std::vector<Candle> history(candles.begin(), candles.begin() + static_cast<std::ptrdiff_t>(index) + 1);
    const auto atr_series = analytics::TechnicalIndicators::calculateATRSeries(
        history, config.atr_period, config.use_ema);

    auto current_atr = analytics::TechnicalIndicators::valueAt(atr_series, index);
    const double current_price = candles[index].close;
    if (!current_atr || current_price <= 0.0) {
        return 1.0;
    }
    const double atr_pct = (*current_atr / current_price) * 100.0;

    const size_t lookback = std::min<size_t>(static_cast<size_t>(std::max(1, config.lookback)), index);
    double sum = 0.0;
    int count = 0;
    for (size_t i = index - lookback + 1; i <= index; ++i) {
        auto atr = analytics::TechnicalIndicators::valueAt(atr_series, i);
        if (atr && candles[i].close > 0.0) {
            sum += (*atr / candles[i].close) * 100.0;
            count++;
        }
    }
    if (count == 0) {
        return 1.0;
    }

    const double avg_atr_pct = sum / count;
    const double ratio = avg_atr_pct > 0.0 ? atr_pct / avg_atr_pct : 1.0;
    if (ratio <= config.high_volatility_threshold) {
        return 1.0;
    }

    // Linear reduction, full reduction at 2x threshold
    const double excess = ratio - config.high_volatility_threshold;
    const double reduction = std::min(1.0, excess / config.high_volatility_threshold);
    const double multiplier = 1.0 - reduction * config.max_position_reduction;
    return std::max(1.0 - config.max_position_reduction, multiplier);
}

} // namespace risk
} // namespace regimetrader
