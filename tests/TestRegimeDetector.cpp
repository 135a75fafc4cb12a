#include "analytics/RegimeDetector.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace regimetrader;
using namespace regimetrader::analytics;
using testing::near;

static void testShortHistoryIsNeutral() {
    RegimeDetector detector;
    const auto series = testing::makeSeries("short", 60, 100.0, 0.02);
    for (size_t i = 0; i < RegimeDetector::kMinHistory; ++i) {
        const auto signal = detector.detect(series, i);
        assert(signal.regime == MarketRegime::NEUTRAL);
        assert(near(signal.confidence, 0.0));
    }
    assert(detector.cachedSignalCount() == 0);
}

static void testOutputRanges() {
    RegimeDetector detector;
    for (double drift : {0.02, -0.02, 0.0}) {
        const auto series = testing::makeSeries("range" + std::to_string(drift), 260, 100.0, drift, 0.03);
        for (size_t i = RegimeDetector::kMinHistory; i < series.size(); ++i) {
            const auto s = detector.detect(series, i);
            assert(s.confidence >= 0.0 && s.confidence <= 1.0);
            assert(s.indicators.trend >= -1.0 && s.indicators.trend <= 1.0);
            assert(s.indicators.momentum >= -1.0 && s.indicators.momentum <= 1.0);
            assert(s.indicators.volatility >= 0.0 && s.indicators.volatility <= 1.0);
        }
    }
}

static void testTrendDirection() {
    RegimeDetector detector;
    const auto up = testing::makeSeries("up", 120, 100.0, 0.02, 0.005);
    const auto down = testing::makeSeries("down", 120, 100.0, -0.02, 0.005);
    assert(detector.detect(up, 110).indicators.trend > 0.0);
    assert(detector.detect(down, 110).indicators.trend < 0.0);
}

static void testCachedAndIdempotent() {
    RegimeDetector detector;
    const auto series = testing::makeSeries("cache", 100, 100.0, 0.01);

    const auto first = detector.detect(series, 80);
    assert(detector.cachedSignalCount() == 1);
    const auto second = detector.detect(series, 80);
    assert(detector.cachedSignalCount() == 1);
    assert(first.regime == second.regime);
    assert(first.confidence == second.confidence);
    assert(first.indicators.trend == second.indicators.trend);

    // A fresh detector computes the same result
    RegimeDetector other;
    const auto third = other.detect(series, 80);
    assert(third.regime == first.regime);
    assert(near(third.confidence, first.confidence));
}

static void testNoLookAhead() {
    RegimeDetector full_detector;
    RegimeDetector prefix_detector;
    const auto full = testing::makeSeries("full", 150, 100.0, 0.015, 0.02);
    PriceSeries prefix("prefix", std::vector<Candle>(full.candles.begin(), full.candles.begin() + 91));

    const auto a = full_detector.detect(full, 90);
    const auto b = prefix_detector.detect(prefix, 90);
    assert(a.regime == b.regime);
    assert(near(a.confidence, b.confidence));
    assert(near(a.indicators.momentum, b.indicators.momentum));
}

static void testInvalidate() {
    RegimeDetector detector;
    const auto a = testing::makeSeries("a", 80, 100.0, 0.01);
    const auto b = testing::makeSeries("b", 80, 100.0, -0.01);
    detector.detect(a, 60);
    detector.detect(a, 61);
    detector.detect(b, 60);
    assert(detector.cachedSignalCount() == 3);

    detector.invalidate("a");
    assert(detector.cachedSignalCount() == 1);

    detector.invalidate();
    assert(detector.cachedSignalCount() == 0);
}

static void testOutOfRangeThrows() {
    RegimeDetector detector;
    const auto series = testing::makeSeries("oob", 70, 100.0, 0.01);
    bool threw = false;
    try {
        detector.detect(series, 70);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
}

static void testClassify() {
    RegimeDetector::Component trend{0.5, 0.5};
    RegimeDetector::Component momentum{0.5, 0.5};

    const auto bull = RegimeDetector::classify(trend, momentum, 0.1, 0.0, false);
    assert(bull.regime == MarketRegime::BULLISH);
    // (0.5 * 0.7 + 0.5 * 0.3) boosted by agreement 0.5
    assert(near(bull.confidence, 0.625));

    const auto bear = RegimeDetector::classify({-0.5, 0.5}, {-0.5, 0.5}, 0.1, 0.0, false);
    assert(bear.regime == MarketRegime::BEARISH);
    assert(near(bear.confidence, 0.625));

    const auto flat = RegimeDetector::classify({0.02, 0.05}, {0.02, 0.05}, 0.1, 0.0, false);
    assert(flat.regime == MarketRegime::NEUTRAL);

    // Weak strength stays neutral even with a positive score
    const auto weak = RegimeDetector::classify({0.3, 0.05}, {0.3, 0.05}, 0.1, 0.0, false);
    assert(weak.regime == MarketRegime::NEUTRAL);

    const auto crossed = RegimeDetector::classify(trend, momentum, 0.1, 0.05, true);
    assert(near(crossed.confidence, 0.625 * 1.3));
}

int main() {
    std::cout << "[TEST] Starting RegimeDetector Test..." << std::endl;

    testShortHistoryIsNeutral();
    testOutputRanges();
    testTrendDirection();
    testCachedAndIdempotent();
    testNoLookAhead();
    testInvalidate();
    testOutOfRangeThrows();
    testClassify();

    std::cout << "[TEST] RegimeDetector PASSED" << std::endl;
    return 0;
}
