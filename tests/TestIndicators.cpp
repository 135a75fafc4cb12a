#include "analytics/TechnicalIndicators.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace regimetrader;
using analytics::TechnicalIndicators;
using testing::near;

static void testSmaAlignment() {
    const std::vector<double> prices{1, 2, 3, 4, 5};
    const auto sma = TechnicalIndicators::calculateSMASeries(prices, 3);
    assert(sma.size() == prices.size());
    assert(std::isnan(sma[0]) && std::isnan(sma[1]));
    assert(near(sma[2], 2.0));
    assert(near(sma[3], 3.0));
    assert(near(sma[4], 4.0));

    assert(!TechnicalIndicators::valueAt(sma, 1).has_value());
    assert(!TechnicalIndicators::valueAt(sma, 99).has_value());
    assert(near(*TechnicalIndicators::valueAt(sma, 4), 4.0));

    // Too short for the period: all undefined
    const auto short_sma = TechnicalIndicators::calculateSMASeries(prices, 10);
    for (double v : short_sma) assert(std::isnan(v));
}

static void testEmaSeededBySma() {
    const std::vector<double> prices{1, 2, 3, 4, 5};
    const auto ema = TechnicalIndicators::calculateEMASeries(prices, 3);
    assert(std::isnan(ema[1]));
    assert(near(ema[2], 2.0));
    assert(near(ema[3], 3.0));   // (4 - 2) * 0.5 + 2
    assert(near(ema[4], 4.0));
}

static void testRsi() {
    std::vector<double> rising;
    for (int i = 0; i < 30; ++i) rising.push_back(100.0 + i);
    const auto rsi = TechnicalIndicators::calculateRSISeries(rising, 14);
    assert(std::isnan(rsi[13]));
    assert(near(rsi[14], 100.0));
    assert(near(rsi.back(), 100.0));

    std::vector<double> falling;
    for (int i = 0; i < 30; ++i) falling.push_back(200.0 - i);
    const auto rsi_down = TechnicalIndicators::calculateRSISeries(falling, 14);
    assert(rsi_down.back() < 1e-9);

    for (size_t i = 14; i < rsi.size(); ++i) {
        assert(rsi[i] >= 0.0 && rsi[i] <= 100.0);
    }
}

static void testMacdWarmup() {
    const auto series = testing::makeSeries("macd", 80, 100.0, 0.01);
    const auto closes = TechnicalIndicators::extractClosePrices(series.candles);
    const auto macd = TechnicalIndicators::calculateMACDSeries(closes, 12, 26, 9);
    assert(macd.macd.size() == closes.size());
    assert(std::isnan(macd.macd[24]));
    assert(!std::isnan(macd.macd[25]));
    // Signal needs 9 MACD values
    assert(std::isnan(macd.signal[32]));
    assert(!std::isnan(macd.signal[33]));
    assert(near(macd.histogram[40], macd.macd[40] - macd.signal[40]));
}

static void testBollingerOnFlatPrices() {
    const std::vector<double> prices(25, 50.0);
    const auto bands = TechnicalIndicators::calculateBollingerSeries(prices, 20, 2.0);
    assert(near(bands.upper[24], 50.0));
    assert(near(bands.middle[24], 50.0));
    assert(near(bands.lower[24], 50.0));
    assert(std::isnan(bands.middle[18]));
}

static void testAtr() {
    const auto candles = testing::makeFlatCandles(30, 1000.0, 50.0);
    const auto atr = TechnicalIndicators::calculateATRSeries(candles, 14, true);
    assert(std::isnan(atr[13]));
    assert(near(atr[14], 50.0));
    assert(near(atr.back(), 50.0));

    const auto sma_atr = TechnicalIndicators::calculateATRSeries(candles, 14, false);
    assert(near(sma_atr.back(), 50.0));

    assert(!TechnicalIndicators::getATRValue(candles, 10, 14).has_value());
    assert(near(*TechnicalIndicators::getATRValue(candles, 20, 14), 50.0));
    assert(!TechnicalIndicators::getATRValue(candles, 100, 14).has_value());
}

static void testVolumeIndicators() {
    std::vector<Candle> candles{
        Candle(10, 11, 9, 10, 100, 1),
        Candle(10, 12, 9, 11, 200, 2),
        Candle(11, 12, 9, 10, 50, 3),
        Candle(10, 10, 10, 10, 70, 4),
    };
    const auto obv = TechnicalIndicators::calculateOBV(candles);
    assert(near(obv[0], 0.0));
    assert(near(obv[1], 200.0));
    assert(near(obv[2], 150.0));
    assert(near(obv[3], 150.0));

    const double vwap = TechnicalIndicators::calculateVWAP(candles);
    assert(vwap > 9.0 && vwap < 12.0);

    // Typical prices 10, 32/3, 31/3, 10
    const auto rolling = TechnicalIndicators::calculateVWAPSeries(candles, 2);
    assert(std::isnan(rolling[0]));
    assert(near(rolling[1], (10.0 * 100 + 32.0 / 3.0 * 200) / 300.0));
    assert(near(rolling[2], (32.0 / 3.0 * 200 + 31.0 / 3.0 * 50) / 250.0));
    assert(near(rolling[3], (31.0 / 3.0 * 50 + 10.0 * 70) / 120.0));

    const auto roc = TechnicalIndicators::calculateVolumeROC(candles, 2);
    assert(std::isnan(roc[1]));
    assert(near(roc[2], -50.0));
    assert(near(roc[3], -65.0));

    const auto vpt = TechnicalIndicators::calculateVolumePriceTrend(candles);
    assert(near(vpt[0], 0.0));
    assert(near(vpt[1], 20.0));
    assert(near(vpt[2], 20.0 - 50.0 / 11.0));
    assert(near(vpt[3], vpt[2]));
}

static void testVolumeWeightedMacd() {
    // Typical price 100 on every bar, volume spike on the last one
    auto candles = testing::makeFlatCandles(40, 100.0, 2.0);
    candles[39].volume = 3000.0;

    const auto vw = TechnicalIndicators::calculateVolumeWeightedMACD(candles, 12, 26, 9);
    assert(std::isnan(vw.macd[24]));
    assert(near(vw.macd[38], 0.0));

    // 20-bar volume MA at the spike: (19 * 1000 + 3000) / 20
    const double ratio = 3000.0 / 1100.0;
    const double weighted = 100.0 * (1.0 + (ratio - 1.0) * 0.1);
    const double expected = (weighted - 100.0) * (2.0 / 13.0 - 2.0 / 27.0);
    assert(near(vw.macd[39], expected, 1e-9));
    assert(vw.macd[39] > 0.0);

    // Constant volume leaves the typical-price MACD unchanged
    const auto flat = testing::makeFlatCandles(40, 100.0, 2.0);
    const auto plain = TechnicalIndicators::calculateVolumeWeightedMACD(flat, 12, 26, 9);
    assert(near(plain.macd[39], 0.0));
}

static void testStatistics() {
    const std::vector<double> values{2, 4, 4, 4, 5, 5, 7, 9};
    const double mean = TechnicalIndicators::calculateMean(values);
    assert(near(mean, 5.0));
    assert(near(TechnicalIndicators::calculateStandardDeviation(values, mean), 2.0));
    assert(near(TechnicalIndicators::calculateMean({}), 0.0));
}

int main() {
    std::cout << "[TEST] Starting Indicators Test..." << std::endl;

    testSmaAlignment();
    testEmaSeededBySma();
    testRsi();
    testMacdWarmup();
    testBollingerOnFlatPrices();
    testAtr();
    testVolumeIndicators();
    testVolumeWeightedMacd();
    testStatistics();

    std::cout << "[TEST] Indicators PASSED" << std::endl;
    return 0;
}
