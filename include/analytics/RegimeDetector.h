#pragma once

#include "common/Types.h"
#include "analytics/TechnicalIndicators.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace regimetrader {
namespace analytics {

enum class MarketRegime {
    BULLISH,
    BEARISH,
    NEUTRAL
};

struct RegimeIndicators {
    double trend = 0.0;       // -1 (down) .. +1 (up)
    double momentum = 0.0;    // -1 .. +1
    double volatility = 0.0;  // 0 .. 1
};

struct RegimeSignal {
    MarketRegime regime = MarketRegime::NEUTRAL;
    double confidence = 0.0;
    RegimeIndicators indicators;
};

std::string toString(MarketRegime regime);

// Regime classification with an explicit, caller-owned cache.
// Results are memoized by (series id, bar index); indicator arrays by series id.
// Not thread-safe: use one detector per concurrently running series.
class RegimeDetector {
public:
    static constexpr size_t kMinHistory = 50;

    RegimeDetector() = default;

    // index < kMinHistory -> neutral / 0 confidence.
    // Throws std::out_of_range if index is past the end of the series.
    RegimeSignal detect(const PriceSeries& series, size_t index);

    void invalidate();
    void invalidate(const std::string& series_id);

    size_t cachedSignalCount() const { return signal_cache_.size(); }

    // Trend/momentum sub-scores with their average strength
    struct Component {
        double score = 0.0;
        double strength = 0.0;
    };

    // Label + confidence from the sub-indicators.
    // cross is (SMA50 - SMA200) / SMA200, or 0 when SMA200 is not available.
    static RegimeSignal classify(const Component& trend, const Component& momentum,
                                 double volatility, double cross, bool has_cross);

private:
    struct SeriesIndicators {
        size_t length = 0;
        std::vector<double> closes;
        std::vector<double> sma20;
        std::vector<double> sma50;
        std::vector<double> sma200;
        std::vector<double> ema12;
        std::vector<double> ema26;
        std::vector<double> rsi14;
        TechnicalIndicators::MACDSeries macd;
    };

    const SeriesIndicators& indicatorsFor(const PriceSeries& series);

    static Component trendComponent(const SeriesIndicators& ind, size_t index);
    static Component momentumComponent(const SeriesIndicators& ind, size_t index);
    static double volatilityComponent(const std::vector<double>& closes, size_t index);

    std::map<std::string, SeriesIndicators> indicator_cache_;
    std::map<std::pair<std::string, size_t>, RegimeSignal> signal_cache_;
};

} // namespace analytics
} // namespace regimetrader
