#include "strategy/ConfidenceCalculator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace regimetrader {
namespace strategy {

namespace {
constexpr double kWeightStrength = 0.3;
constexpr double kWeightAgreement = 0.25;
constexpr double kWeightVolatility = 0.2;
constexpr double kWeightTrend = 0.15;
constexpr double kWeightVolume = 0.1;
constexpr double kFullScaleVolatility = 0.1;  // 10% per bar
}

double ConfidenceCalculator::calculateConfidence(const TradingSignal& signal,
                                                 const std::vector<Candle>& candles, size_t index) {
    if (candles.empty() || index >= candles.size()) return 0.0;
    if (signal.indicator_scores.empty()) return 0.0;

    const double strength = std::abs(signal.signal);

    // Indicator agreement with the blended direction
    int positive = 0;
    int negative = 0;
    for (const auto& entry : signal.indicator_scores) {
        if (entry.second > 0) positive++;
        else if (entry.second < 0) negative++;
    }
    const double total = static_cast<double>(signal.indicator_scores.size());
    const double agreement = signal.signal > 0 ? positive / total : negative / total;

    const size_t lookback = std::min<size_t>(20, index);
    if (lookback < 2) return strength * 0.5;

    std::vector<double> returns;
    for (size_t i = index - lookback + 1; i <= index; ++i) {
        const double prev = candles[i - 1].close;
        if (prev > 0) {
            returns.push_back((candles[i].close - prev) / prev);
        }
    }
    if (returns.empty()) return strength * 0.5;

    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double volatility = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean);
    const double volatility_confidence = 1.0 - std::min(1.0, volatility / kFullScaleVolatility);

    const size_t sma_period = std::min<size_t>(20, index + 1);
    if (sma_period < 5) return strength * 0.5;

    double sma = 0.0;
    for (size_t i = index + 1 - sma_period; i <= index; ++i) sma += candles[i].close;
    sma /= static_cast<double>(sma_period);
    if (sma <= 0) return strength * 0.5;

    const double trend_strength = std::min(1.0, std::abs((candles[index].close - sma) / sma) * 10.0);

    double volume_confidence = 0.5;
    if (candles[index].volume > 0) {
        const size_t start = index >= 20 ? index - 20 : 0;
        double volume_sum = 0.0;
        for (size_t i = start; i <= index; ++i) volume_sum += candles[i].volume;
        const double avg_volume = volume_sum / static_cast<double>(index - start + 1);
        if (avg_volume > 0) {
            volume_confidence = std::min(1.0, (candles[index].volume / avg_volume) / 2.0);
        }
    }

    const double confidence = strength * kWeightStrength +
                              agreement * kWeightAgreement +
                              volatility_confidence * kWeightVolatility +
                              trend_strength * kWeightTrend +
                              volume_confidence * kWeightVolume;

    return std::max(0.0, std::min(1.0, confidence));
}

} // namespace strategy
} // namespace regimetrader
