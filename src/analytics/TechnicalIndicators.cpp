#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace regimetrader {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double trueRange(const Candle& current, const Candle& prev) {
    double tr1 = current.high - current.low;
    double tr2 = std::abs(current.high - prev.close);
    double tr3 = std::abs(current.low - prev.close);
    return std::max({tr1, tr2, tr3});
}

double typicalPrice(const Candle& c) {
    return (c.high + c.low + c.close) / 3.0;
}
}

std::vector<double> TechnicalIndicators::calculateSMASeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return out;

    double sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = sum / period;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateEMASeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return out;

    const double multiplier = 2.0 / (period + 1.0);

    // 초기 SMA
    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;
    out[period - 1] = ema;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

// EMA over the defined (non-NaN) tail of an aligned series, result stays aligned.
std::vector<double> TechnicalIndicators::emaOverDefined(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    size_t first = 0;
    while (first < values.size() && std::isnan(values[first])) ++first;
    if (first >= values.size()) return out;

    std::vector<double> tail(values.begin() + static_cast<std::ptrdiff_t>(first), values.end());
    auto ema = calculateEMASeries(tail, period);
    std::copy(ema.begin(), ema.end(), out.begin() + static_cast<std::ptrdiff_t>(first));
    return out;
}

std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) return out;

    auto toRsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) return 100.0;
        double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = toRsi(avg_gain, avg_loss);

    // Wilder's smoothing
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        out[i] = toRsi(avg_gain, avg_loss);
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::calculateMACDSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    result.macd.assign(prices.size(), kNaN);
    result.signal.assign(prices.size(), kNaN);
    result.histogram.assign(prices.size(), kNaN);

    if (prices.size() < static_cast<size_t>(std::max(fast, slow))) {
        return result;
    }

    auto fast_ema = calculateEMASeries(prices, fast);
    auto slow_ema = calculateEMASeries(prices, slow);
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!std::isnan(fast_ema[i]) && !std::isnan(slow_ema[i])) {
            result.macd[i] = fast_ema[i] - slow_ema[i];
        }
    }

    result.signal = emaOverDefined(result.macd, signal_period);
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!std::isnan(result.signal[i])) {
            result.histogram[i] = result.macd[i] - result.signal[i];
        }
    }
    return result;
}

TechnicalIndicators::BollingerSeries TechnicalIndicators::calculateBollingerSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.middle = calculateSMASeries(prices, period);
    result.upper.assign(prices.size(), kNaN);
    result.lower.assign(prices.size(), kNaN);

    for (size_t i = 0; i < prices.size(); ++i) {
        if (std::isnan(result.middle[i])) continue;

        const double mean = result.middle[i];
        double sum_sq_diff = 0.0;
        for (size_t k = i + 1 - period; k <= i; ++k) {
            sum_sq_diff += (prices[k] - mean) * (prices[k] - mean);
        }
        const double std_dev = std::sqrt(sum_sq_diff / period);
        result.upper[i] = mean + std_dev * std_dev_mult;
        result.lower[i] = mean - std_dev * std_dev_mult;
    }
    return result;
}

std::vector<double> TechnicalIndicators::calculateATRSeries(
    const std::vector<Candle>& candles,
    int period,
    bool use_wilder
) {
    std::vector<double> out(candles.size(), kNaN);
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) return out;

    // tr[i] belongs to candle i (i >= 1)
    std::vector<double> tr(candles.size(), 0.0);
    for (size_t i = 1; i < candles.size(); ++i) {
        tr[i] = trueRange(candles[i], candles[i - 1]);
    }

    double window_sum = 0.0;
    for (int i = 1; i <= period; ++i) window_sum += tr[i];
    double atr = window_sum / period;
    out[period] = atr;

    for (size_t i = period + 1; i < candles.size(); ++i) {
        if (use_wilder) {
            atr = ((atr * (period - 1)) + tr[i]) / period;
        } else {
            window_sum += tr[i] - tr[i - period];
            atr = window_sum / period;
        }
        out[i] = atr;
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateVWAPSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), kNaN);
    if (period <= 0) return out;

    for (size_t i = 0; i < candles.size(); ++i) {
        if (i + 1 < static_cast<size_t>(period)) continue;

        double cumulative_tpv = 0.0;
        double cumulative_volume = 0.0;
        for (size_t k = i + 1 - period; k <= i; ++k) {
            cumulative_tpv += typicalPrice(candles[k]) * candles[k].volume;
            cumulative_volume += candles[k].volume;
        }
        out[i] = (cumulative_volume > 0.0) ? cumulative_tpv / cumulative_volume : candles[i].close;
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateOBV(const std::vector<Candle>& candles) {
    std::vector<double> out(candles.size(), kNaN);
    if (candles.empty()) return out;

    double obv = 0.0;
    out[0] = obv;
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].close > candles[i - 1].close) obv += candles[i].volume;
        else if (candles[i].close < candles[i - 1].close) obv -= candles[i].volume;
        out[i] = obv;
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateVolumeROC(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), kNaN);
    if (period <= 0) return out;

    for (size_t i = period; i < candles.size(); ++i) {
        const double past = candles[i - period].volume;
        out[i] = (past > 0.0) ? ((candles[i].volume - past) / past) * 100.0 : 0.0;
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateVolumeMA(const std::vector<Candle>& candles, int period) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& c : candles) volumes.push_back(c.volume);
    return calculateSMASeries(volumes, period);
}

std::vector<double> TechnicalIndicators::calculateVolumePriceTrend(const std::vector<Candle>& candles) {
    std::vector<double> out(candles.size(), kNaN);
    if (candles.empty()) return out;

    double vpt = 0.0;
    out[0] = vpt;
    for (size_t i = 1; i < candles.size(); ++i) {
        const double prev_close = candles[i - 1].close;
        if (prev_close > 0.0) {
            vpt += candles[i].volume * ((candles[i].close - prev_close) / prev_close);
        }
        out[i] = vpt;
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::calculateVolumeWeightedMACD(
    const std::vector<Candle>& candles,
    int fast,
    int slow,
    int signal_period
) {
    auto volume_ma = calculateVolumeMA(candles, 20);

    std::vector<double> weighted;
    weighted.reserve(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        double tp = typicalPrice(candles[i]);
        if (!std::isnan(volume_ma[i]) && volume_ma[i] > 0.0) {
            double volume_ratio = candles[i].volume / volume_ma[i];
            tp *= 1.0 + (volume_ratio - 1.0) * 0.1;
        }
        weighted.push_back(tp);
    }
    return calculateMACDSeries(weighted, fast, slow, signal_period);
}

double TechnicalIndicators::calculateVWAP(const std::vector<Candle>& candles) {
    if (candles.empty()) return 0.0;

    double cumulative_tpv = 0.0;
    double cumulative_volume = 0.0;
    for (const auto& candle : candles) {
        cumulative_tpv += typicalPrice(candle) * candle.volume;
        cumulative_volume += candle.volume;
    }

    if (cumulative_volume < 0.0001) return 0.0;
    return cumulative_tpv / cumulative_volume;
}

std::optional<double> TechnicalIndicators::getATRValue(
    const std::vector<Candle>& candles,
    size_t index,
    int period,
    bool use_wilder
) {
    if (index >= candles.size()) return std::nullopt;

    std::vector<Candle> history(candles.begin(), candles.begin() + static_cast<std::ptrdiff_t>(index) + 1);
    return valueAt(calculateATRSeries(history, period, use_wilder), index);
}

std::optional<double> TechnicalIndicators::valueAt(const std::vector<double>& series, size_t index) {
    if (index >= series.size() || std::isnan(series[index])) {
        return std::nullopt;
    }
    return series[index];
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

} // namespace analytics
} // namespace regimetrader
