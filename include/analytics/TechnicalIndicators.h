#pragma once

#include <vector>
#include <string>
#include <optional>
#include "common/Types.h"

namespace regimetrader {
namespace analytics {

// Series functions return vectors aligned to price indices.
// Entries before the warm-up window is filled are NaN; use valueAt() to read them.
class TechnicalIndicators {
public:
    // ===== Series (index aligned) =====
    static std::vector<double> calculateSMASeries(const std::vector<double>& prices, int period);

    // SMA-seeded EMA; first value at index period-1
    static std::vector<double> calculateEMASeries(const std::vector<double>& prices, int period);

    // Wilder RSI; first value at index period. avg_loss == 0 -> 100
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    struct MACDSeries {
        std::vector<double> macd;
        std::vector<double> signal;
        std::vector<double> histogram;
    };
    static MACDSeries calculateMACDSeries(const std::vector<double>& prices,
                                          int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerSeries {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };
    // Population standard deviation
    static BollingerSeries calculateBollingerSeries(const std::vector<double>& prices,
                                                    int period = 20, double std_dev_mult = 2.0);

    // use_wilder == true: Wilder smoothing, else rolling SMA of true range.
    // First value at index period (needs a previous close).
    static std::vector<double> calculateATRSeries(const std::vector<Candle>& candles,
                                                  int period = 14, bool use_wilder = true);

    // ===== Volume =====
    // Rolling VWAP over the last `period` bars ending at index (typical price weighted)
    static std::vector<double> calculateVWAPSeries(const std::vector<Candle>& candles, int period = 20);
    static std::vector<double> calculateOBV(const std::vector<Candle>& candles);
    // % change of volume vs `period` bars ago
    static std::vector<double> calculateVolumeROC(const std::vector<Candle>& candles, int period = 14);
    static std::vector<double> calculateVolumeMA(const std::vector<Candle>& candles, int period = 20);
    static std::vector<double> calculateVolumePriceTrend(const std::vector<Candle>& candles);
    // MACD over typical price scaled by 1 + (volume / 20-bar avg volume - 1) * 0.1
    static MACDSeries calculateVolumeWeightedMACD(const std::vector<Candle>& candles,
                                                  int fast = 12, int slow = 26, int signal_period = 9);

    // ===== Latest value helpers =====
    // Whole-vector VWAP, 0 when there is no volume
    static double calculateVWAP(const std::vector<Candle>& candles);

    // ATR at a bar index, nullopt during warm-up
    static std::optional<double> getATRValue(const std::vector<Candle>& candles, size_t index,
                                             int period = 14, bool use_wilder = true);

    // NaN or out of range -> nullopt
    static std::optional<double> valueAt(const std::vector<double>& series, size_t index);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    static double calculateMean(const std::vector<double>& values);
    // Population standard deviation
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

private:
    static std::vector<double> emaOverDefined(const std::vector<double>& values, int period);
};

} // namespace analytics
} // namespace regimetrader
