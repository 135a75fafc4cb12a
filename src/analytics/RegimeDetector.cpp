#include "analytics/RegimeDetector.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimetrader {
namespace analytics {

namespace {
constexpr double kBullishThreshold = 0.05;
constexpr double kBearishThreshold = -0.05;
constexpr double kMinStrength = 0.1;
constexpr double kCrossBoostThreshold = 0.02;

double clampUnit(double v) {
    return std::max(-1.0, std::min(1.0, v));
}

// Adds one clamped vote to an accumulating component
struct Accumulator {
    double score = 0.0;
    double strength = 0.0;
    int count = 0;

    void add(double signal, double weight = 1.0) {
        score += signal * weight;
        strength += std::abs(signal) * weight;
        count++;
    }

    RegimeDetector::Component result() const {
        RegimeDetector::Component c;
        if (count > 0) {
            c.score = clampUnit(score / count);
            c.strength = strength / count;
        }
        return c;
    }
};
}

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULLISH: return "bullish";
        case MarketRegime::BEARISH: return "bearish";
        case MarketRegime::NEUTRAL: return "neutral";
    }
    return "neutral";
}

RegimeSignal RegimeDetector::detect(const PriceSeries& series, size_t index) {
    if (index < kMinHistory) {
        return RegimeSignal{};
    }
    if (index >= series.size()) {
        throw std::out_of_range("regime index " + std::to_string(index) +
                                " out of range for series '" + series.id + "' of size " +
                                std::to_string(series.size()));
    }

    const auto key = std::make_pair(series.id, index);
    auto cached = signal_cache_.find(key);
    if (cached != signal_cache_.end()) {
        return cached->second;
    }

    const auto& ind = indicatorsFor(series);

    const Component trend = trendComponent(ind, index);
    const Component momentum = momentumComponent(ind, index);
    const double volatility = volatilityComponent(ind.closes, index);

    auto sma50 = TechnicalIndicators::valueAt(ind.sma50, index);
    auto sma200 = TechnicalIndicators::valueAt(ind.sma200, index);
    const bool has_cross = sma50 && sma200 && *sma200 != 0.0;
    const double cross = has_cross ? (*sma50 - *sma200) / *sma200 : 0.0;

    RegimeSignal signal = classify(trend, momentum, volatility, cross, has_cross);
    signal_cache_.emplace(key, signal);
    return signal;
}

RegimeSignal RegimeDetector::classify(const Component& trend, const Component& momentum,
                                      double volatility, double cross, bool has_cross) {
    RegimeSignal out;
    out.indicators.trend = trend.score;
    out.indicators.momentum = momentum.score;
    out.indicators.volatility = volatility;

    const double combined = trend.score * 0.5 + momentum.score * 0.5;
    const double strength = (trend.strength + momentum.strength) / 2.0;

    if (combined > kBullishThreshold && strength > kMinStrength) {
        out.regime = MarketRegime::BULLISH;
        out.confidence = std::min(1.0, std::abs(combined) * 0.7 + strength * 0.3);
    } else if (combined < kBearishThreshold && strength > kMinStrength) {
        out.regime = MarketRegime::BEARISH;
        out.confidence = std::min(1.0, std::abs(combined) * 0.7 + strength * 0.3);
    } else {
        out.regime = MarketRegime::NEUTRAL;
        out.confidence = std::max(0.0, 1.0 - std::abs(combined) - strength);
    }

    // Trend and momentum agree
    if ((trend.score > 0 && momentum.score > 0) || (trend.score < 0 && momentum.score < 0)) {
        const double agreement = std::min(std::abs(trend.score), std::abs(momentum.score));
        out.confidence = std::min(1.0, out.confidence * (1.0 + agreement * 0.5));
    }

    // Golden / death cross
    if (has_cross && std::abs(cross) > kCrossBoostThreshold) {
        out.confidence = std::min(1.0, out.confidence * 1.3);
    }

    return out;
}

void RegimeDetector::invalidate() {
    indicator_cache_.clear();
    signal_cache_.clear();
}

void RegimeDetector::invalidate(const std::string& series_id) {
    indicator_cache_.erase(series_id);
    for (auto it = signal_cache_.begin(); it != signal_cache_.end();) {
        if (it->first.first == series_id) {
            it = signal_cache_.erase(it);
        } else {
            ++it;
        }
    }
}

const RegimeDetector::SeriesIndicators& RegimeDetector::indicatorsFor(const PriceSeries& series) {
    auto& ind = indicator_cache_[series.id];
    // A series may grow between calls (live feed); earlier bars stay valid.
    if (ind.length == series.size() && !ind.closes.empty()) {
        return ind;
    }

    ind.length = series.size();
    ind.closes = TechnicalIndicators::extractClosePrices(series.candles);
    ind.sma20 = TechnicalIndicators::calculateSMASeries(ind.closes, 20);
    ind.sma50 = TechnicalIndicators::calculateSMASeries(ind.closes, 50);
    ind.sma200 = TechnicalIndicators::calculateSMASeries(ind.closes, 200);
    ind.ema12 = TechnicalIndicators::calculateEMASeries(ind.closes, 12);
    ind.ema26 = TechnicalIndicators::calculateEMASeries(ind.closes, 26);
    ind.rsi14 = TechnicalIndicators::calculateRSISeries(ind.closes, 14);
    ind.macd = TechnicalIndicators::calculateMACDSeries(ind.closes, 12, 26, 9);
    return ind;
}

RegimeDetector::Component RegimeDetector::trendComponent(const SeriesIndicators& ind, size_t index) {
    Accumulator acc;
    const double price = ind.closes[index];

    auto sma20 = TechnicalIndicators::valueAt(ind.sma20, index);
    auto sma50 = TechnicalIndicators::valueAt(ind.sma50, index);
    auto sma200 = TechnicalIndicators::valueAt(ind.sma200, index);
    auto ema12 = TechnicalIndicators::valueAt(ind.ema12, index);
    auto ema26 = TechnicalIndicators::valueAt(ind.ema26, index);

    if (sma20 && *sma20 != 0.0) {
        acc.add(clampUnit((price - *sma20) / *sma20 * 10.0));
    }
    if (sma50 && *sma50 != 0.0) {
        acc.add(clampUnit((price - *sma50) / *sma50 * 10.0));
    }
    if (sma200 && *sma200 != 0.0) {
        acc.add(clampUnit((price - *sma200) / *sma200 * 8.0), 1.5);
    }
    if (sma50 && sma200 && *sma200 != 0.0) {
        acc.add(clampUnit((*sma50 - *sma200) / *sma200 * 30.0), 2.0);
    }
    if (sma20 && sma50 && *sma50 != 0.0) {
        acc.add(clampUnit((*sma20 - *sma50) / *sma50 * 20.0));
    }
    if (ema12 && ema26 && *ema26 != 0.0) {
        acc.add(clampUnit((*ema12 - *ema26) / *ema26 * 20.0));
    }

    // Full MA alignment
    if (sma20 && sma50 && sma200) {
        const bool aligned_up = price > *sma20 && *sma20 > *sma50 && *sma50 > *sma200;
        const bool aligned_down = price < *sma20 && *sma20 < *sma50 && *sma50 < *sma200;
        if (aligned_up) {
            acc.add(0.5);
        } else if (aligned_down) {
            acc.add(-0.5);
        }
    }

    return acc.result();
}

RegimeDetector::Component RegimeDetector::momentumComponent(const SeriesIndicators& ind, size_t index) {
    Accumulator acc;
    const double price = ind.closes[index];

    auto histogram = TechnicalIndicators::valueAt(ind.macd.histogram, index);
    if (histogram) {
        const size_t start = (index >= 49) ? index - 49 : 0;
        const auto begin = ind.closes.begin() + static_cast<std::ptrdiff_t>(start);
        const auto end = ind.closes.begin() + static_cast<std::ptrdiff_t>(index) + 1;
        const double range = *std::max_element(begin, end) - *std::min_element(begin, end);
        const double scale = range > 0 ? range / 100.0 : 1.0;
        acc.add(clampUnit(*histogram / scale), 1.5);
    }

    auto macd = TechnicalIndicators::valueAt(ind.macd.macd, index);
    auto signal = TechnicalIndicators::valueAt(ind.macd.signal, index);
    if (macd && signal) {
        const double direction = (*macd > *signal) ? 1.0 : -1.0;
        const double denom = (*signal != 0.0) ? std::abs(*signal) : 1.0;
        const double magnitude = std::min(1.0, std::abs(*macd - *signal) / denom * 10.0);
        acc.add(direction * magnitude);
        acc.add(*macd > 0 ? 0.3 : -0.3);
    }

    auto rsi = TechnicalIndicators::valueAt(ind.rsi14, index);
    if (rsi) {
        double rsi_signal = 0.0;
        if (*rsi > 70.0) {
            rsi_signal = -((*rsi - 70.0) / 30.0);
        } else if (*rsi < 30.0) {
            rsi_signal = (30.0 - *rsi) / 30.0;
        } else if (*rsi > 50.0) {
            rsi_signal = (*rsi - 50.0) / 20.0;
        } else {
            rsi_signal = -(50.0 - *rsi) / 20.0;
        }
        acc.add(rsi_signal);
    }

    if (index >= 20 && ind.closes[index - 20] != 0.0) {
        const double roc20 = (price - ind.closes[index - 20]) / ind.closes[index - 20];
        acc.add(clampUnit(roc20 * 5.0));
    }
    if (index >= 50 && ind.closes[index - 50] != 0.0) {
        const double roc50 = (price - ind.closes[index - 50]) / ind.closes[index - 50];
        acc.add(clampUnit(roc50 * 3.0), 1.2);
    }

    return acc.result();
}

double RegimeDetector::volatilityComponent(const std::vector<double>& closes, size_t index) {
    const size_t lookback = std::min<size_t>(20, index);
    double sum = 0.0;
    int count = 0;
    for (size_t i = index - lookback + 1; i <= index && i > 0; ++i) {
        if (closes[i - 1] > 0) {
            sum += std::abs((closes[i] - closes[i - 1]) / closes[i - 1]);
            count++;
        }
    }
    const double avg = count > 0 ? sum / count : 0.0;
    return std::min(1.0, avg * 20.0);
}

} // namespace analytics
} // namespace regimetrader
