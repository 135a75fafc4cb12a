#include "risk/RiskOverlay.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace regimetrader;
using namespace regimetrader::risk;
using analytics::MarketRegime;
using testing::near;

static core::SessionState withOutcomes(int wins, int losses) {
    core::SessionState state;
    for (int i = 0; i < losses; ++i) state.recordOutcome(false, 20);
    for (int i = 0; i < wins; ++i) state.recordOutcome(true, 20);
    return state;
}

static core::SessionState withRegimes(std::initializer_list<MarketRegime> regimes) {
    core::SessionState state;
    for (auto r : regimes) state.pushRegime(r, 10);
    return state;
}

static void testVolatilityGate() {
    analytics::RegimeSignal calm;
    calm.indicators.volatility = 0.3;
    analytics::RegimeSignal wild;
    wild.indicators.volatility = 0.9;
    assert(!RiskOverlay::checkVolatility(calm, 0.8));
    assert(RiskOverlay::checkVolatility(wild, 0.8));
}

static void testCircuitBreaker() {
    // Inactive below the minimum sample
    assert(!RiskOverlay::checkCircuitBreaker(withOutcomes(0, 4), 0.2, 10, 5));
    assert(RiskOverlay::checkCircuitBreaker(withOutcomes(0, 5), 0.2, 10, 5));
    // 1 of 5 is exactly the floor, not below it
    assert(!RiskOverlay::checkCircuitBreaker(withOutcomes(1, 4), 0.2, 10, 5));

    // Only the last `lookback` outcomes count
    auto state = withOutcomes(0, 10);
    for (int i = 0; i < 5; ++i) state.recordOutcome(true, 20);
    assert(near(*RiskOverlay::recentWinRate(state, 5), 1.0));
    assert(!RiskOverlay::checkCircuitBreaker(state, 0.2, 5, 5));
    assert(RiskOverlay::checkCircuitBreaker(state, 0.5, 15, 5));

    assert(!RiskOverlay::recentWinRate(core::SessionState{}, 10).has_value());
}

static void testOutcomeWindowIsBounded() {
    core::SessionState state;
    for (int i = 0; i < 50; ++i) state.recordOutcome(i % 2 == 0, 20);
    assert(state.trade_outcomes.size() == 20);
}

static void testWhipsaw() {
    const auto choppy = withRegimes({MarketRegime::BULLISH, MarketRegime::NEUTRAL, MarketRegime::BULLISH,
                                     MarketRegime::NEUTRAL, MarketRegime::BULLISH});
    assert(RiskOverlay::countRegimeChanges(choppy, 5) == 4);
    assert(RiskOverlay::checkWhipsaw(choppy, 5, 3));

    const auto steady = withRegimes({MarketRegime::BULLISH, MarketRegime::BULLISH, MarketRegime::BULLISH,
                                     MarketRegime::NEUTRAL, MarketRegime::NEUTRAL});
    assert(RiskOverlay::countRegimeChanges(steady, 5) == 1);
    assert(!RiskOverlay::checkWhipsaw(steady, 5, 3));

    // Exactly max_changes blocks
    const auto three = withRegimes({MarketRegime::BULLISH, MarketRegime::BEARISH, MarketRegime::BULLISH,
                                    MarketRegime::BEARISH, MarketRegime::BEARISH});
    assert(RiskOverlay::countRegimeChanges(three, 5) == 3);
    assert(RiskOverlay::checkWhipsaw(three, 5, 3));

    assert(RiskOverlay::countRegimeChanges(withRegimes({MarketRegime::BULLISH}), 5) == 0);
}

static void testPersistence() {
    const auto state = withRegimes({MarketRegime::BEARISH, MarketRegime::BULLISH, MarketRegime::BULLISH});
    assert(RiskOverlay::isRegimePersistent(state, MarketRegime::BULLISH, 2));
    assert(!RiskOverlay::isRegimePersistent(state, MarketRegime::BULLISH, 3));
    assert(!RiskOverlay::isRegimePersistent(state, MarketRegime::BEARISH, 2));
    assert(RiskOverlay::isRegimePersistent(state, MarketRegime::BEARISH, 1));
    assert(!RiskOverlay::isRegimePersistent(withRegimes({MarketRegime::BULLISH}), MarketRegime::BULLISH, 2));
}

static void testDrawdown() {
    core::SessionState state;
    assert(!RiskOverlay::checkDrawdown(state, 1000.0, 0.2));
    assert(near(state.peak_portfolio_value, 1000.0));
    assert(!RiskOverlay::checkDrawdown(state, 850.0, 0.2));
    assert(RiskOverlay::checkDrawdown(state, 790.0, 0.2));
    assert(RiskOverlay::checkDrawdown(state, 800.0, 0.2));
    // New peak resets the reference
    assert(!RiskOverlay::checkDrawdown(state, 1200.0, 0.2));
    assert(near(state.peak_portfolio_value, 1200.0));
}

int main() {
    std::cout << "[TEST] Starting RiskOverlay Test..." << std::endl;

    testVolatilityGate();
    testCircuitBreaker();
    testOutcomeWindowIsBounded();
    testWhipsaw();
    testPersistence();
    testDrawdown();

    std::cout << "[TEST] RiskOverlay PASSED" << std::endl;
    return 0;
}
