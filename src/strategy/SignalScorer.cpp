#include "strategy/SignalScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimetrader {
namespace strategy {

using analytics::TechnicalIndicators;

namespace {
constexpr size_t kMacdScaleWindow = 20;

double clampUnit(double v) {
    return std::max(-1.0, std::min(1.0, v));
}

int intParam(const IndicatorConfig& indicator, const std::string& key, int fallback) {
    const double value = indicator.param(key, fallback);
    return value >= 1.0 ? static_cast<int>(value) : fallback;
}
}

double SignalScorer::scoreMovingAverage(double price, double moving_average) {
    if (moving_average == 0.0) return 0.0;
    return clampUnit((price - moving_average) / moving_average * 10.0);
}

double SignalScorer::scoreRsi(double rsi) {
    if (rsi > 70.0) {
        return clampUnit(-((rsi - 70.0) / 30.0));
    }
    if (rsi < 30.0) {
        return clampUnit((30.0 - rsi) / 30.0);
    }
    return 0.0;
}

double SignalScorer::scoreBollinger(double price, double upper, double lower) {
    const double width = upper - lower;
    if (width <= 0.0) return 0.0;
    if (price >= upper) return -1.0;
    if (price <= lower) return 1.0;

    const double position = (price - lower) / width;
    return (position - 0.5) * 2.0;
}

double SignalScorer::scoreMacdHistogram(double histogram, double price_range) {
    const double scale = price_range > 0.0 ? price_range / 100.0 : 1.0;
    return clampUnit(histogram / scale);
}

double SignalScorer::scoreIndicator(const IndicatorConfig& indicator,
                                    const std::vector<double>& closes, size_t index) {
    if (index >= closes.size()) return 0.0;
    const double price = closes[index];

    switch (indicator.type) {
        case IndicatorType::SMA: {
            const int period = intParam(indicator, "period", 20);
            auto sma = TechnicalIndicators::valueAt(
                TechnicalIndicators::calculateSMASeries(closes, period), index);
            return sma ? scoreMovingAverage(price, *sma) : 0.0;
        }
        case IndicatorType::EMA: {
            const int period = intParam(indicator, "period", 20);
            auto ema = TechnicalIndicators::valueAt(
                TechnicalIndicators::calculateEMASeries(closes, period), index);
            return ema ? scoreMovingAverage(price, *ema) : 0.0;
        }
        case IndicatorType::MACD: {
            const int fast = intParam(indicator, "fastPeriod", 12);
            const int slow = intParam(indicator, "slowPeriod", 26);
            const int signal_period = intParam(indicator, "signalPeriod", 9);
            auto macd = TechnicalIndicators::calculateMACDSeries(closes, fast, slow, signal_period);
            auto histogram = TechnicalIndicators::valueAt(macd.histogram, index);
            if (!histogram) return 0.0;

            const size_t start = index + 1 >= kMacdScaleWindow ? index + 1 - kMacdScaleWindow : 0;
            const auto begin = closes.begin() + static_cast<std::ptrdiff_t>(start);
            const auto end = closes.begin() + static_cast<std::ptrdiff_t>(index) + 1;
            const double range = *std::max_element(begin, end) - *std::min_element(begin, end);
            return scoreMacdHistogram(*histogram, range);
        }
        case IndicatorType::RSI: {
            const int period = intParam(indicator, "period", 14);
            auto rsi = TechnicalIndicators::valueAt(
                TechnicalIndicators::calculateRSISeries(closes, period), index);
            return rsi ? scoreRsi(*rsi) : 0.0;
        }
        case IndicatorType::BOLLINGER: {
            const int period = intParam(indicator, "period", 20);
            const double std_dev = indicator.param("stdDev", 2.0);
            auto bands = TechnicalIndicators::calculateBollingerSeries(closes, period, std_dev);
            auto upper = TechnicalIndicators::valueAt(bands.upper, index);
            auto lower = TechnicalIndicators::valueAt(bands.lower, index);
            if (!upper || !lower) return 0.0;
            return scoreBollinger(price, *upper, *lower);
        }
    }
    return 0.0;
}

double SignalScorer::blendedSignal(const StrategyConfig& config, const std::vector<double>& closes,
                                   size_t index, std::map<std::string, double>* scores) {
    double weighted = 0.0;
    double total_weight = 0.0;

    for (size_t i = 0; i < config.indicators.size(); ++i) {
        const auto& indicator = config.indicators[i];
        const double score = scoreIndicator(indicator, closes, index);
        if (scores) {
            (*scores)[toString(indicator.type) + "_" + std::to_string(i)] = score;
        }
        weighted += score * indicator.weight;
        total_weight += indicator.weight;
    }

    return total_weight > 0.0 ? clampUnit(weighted / total_weight) : 0.0;
}

SignalAction SignalScorer::actionFor(double signal, const StrategyConfig& config) {
    if (signal > config.buy_threshold) return SignalAction::BUY;
    if (signal < config.sell_threshold) return SignalAction::SELL;
    return SignalAction::HOLD;
}

TradingSignal SignalScorer::generateSignal(const std::vector<Candle>& candles,
                                           const StrategyConfig& config, size_t index) {
    if (index >= candles.size()) {
        throw std::out_of_range("signal index " + std::to_string(index) +
                                " out of range for " + std::to_string(candles.size()) + " candles");
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);

    TradingSignal out;
    out.timestamp = candles[index].timestamp;
    out.signal = blendedSignal(config, closes, index, &out.indicator_scores);
    out.confidence = std::abs(out.signal);
    out.action = config.indicators.empty() ? SignalAction::HOLD : actionFor(out.signal, config);
    out.active_strategy = config;
    return out;
}

} // namespace strategy
} // namespace regimetrader
