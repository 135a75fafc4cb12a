#include "analytics/RiskMetrics.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace regimetrader;
using namespace regimetrader::analytics;
using testing::near;

static std::vector<PortfolioSnapshot> curve(const std::vector<double>& values) {
    std::vector<PortfolioSnapshot> out;
    for (size_t i = 0; i < values.size(); ++i) {
        PortfolioSnapshot s;
        s.timestamp = testing::kStartMs + static_cast<long long>(i) * testing::kDayMs;
        s.total_value = values[i];
        s.quote_balance = values[i];
        s.price = 100.0;
        out.push_back(s);
    }
    return out;
}

static void assertFinite(const RiskMetrics& m) {
    for (double v : {m.sharpe_ratio, m.sortino_ratio, m.max_drawdown, m.max_drawdown_duration, m.volatility,
                     m.calmar_ratio, m.omega_ratio, m.ulcer_index, m.win_loss_ratio, m.expectancy}) {
        assert(std::isfinite(v));
        assert(std::abs(v) <= kMetricCap);
    }
}

static void testEmptyInputs() {
    const auto m = RiskMetricsCalculator::calculateRiskMetrics({}, {}, 1000.0);
    assert(near(m.sharpe_ratio, 0.0));
    assert(near(m.sortino_ratio, 0.0));
    assert(near(m.max_drawdown, 0.0));
    assert(near(m.ulcer_index, 0.0));
    assert(near(m.expectancy, 0.0));
    assertFinite(m);

    const auto single = RiskMetricsCalculator::calculateRiskMetrics({}, curve({1000.0}), 1000.0);
    assert(near(single.sharpe_ratio, 0.0));
    assertFinite(single);
}

static void testFlatCurve() {
    const auto m = RiskMetricsCalculator::calculateRiskMetrics({}, curve(std::vector<double>(30, 1000.0)), 1000.0);
    assert(near(m.sharpe_ratio, 0.0));
    assert(near(m.max_drawdown, 0.0));
    assert(near(m.max_drawdown_duration, 0.0));
    assert(near(m.ulcer_index, 0.0));
    assert(near(m.volatility, 0.0));
    assertFinite(m);
}

static void testDrawdown() {
    const auto equity = curve({100.0, 120.0, 90.0, 110.0, 130.0});
    assert(near(RiskMetricsCalculator::maxDrawdown(equity), 25.0));
    // Peak on day 1, trough on day 2
    assert(near(RiskMetricsCalculator::maxDrawdownDuration(equity, 25.0), 1.0));
    assert(RiskMetricsCalculator::ulcerIndex(equity) > 0.0);
}

static void testCapsWithoutDownside() {
    const auto rising = curve({100.0, 101.0, 103.0, 104.0, 110.0});
    const auto returns = RiskMetricsCalculator::periodReturns(rising);
    assert(returns.size() == 4);
    assert(near(RiskMetricsCalculator::sortinoRatio(returns), kMetricCap));
    assert(near(RiskMetricsCalculator::omegaRatio(returns), kMetricCap));
    assert(RiskMetricsCalculator::sharpeRatio(returns) > 0.0);

    const auto m = RiskMetricsCalculator::calculateRiskMetrics({}, rising, 100.0);
    assertFinite(m);
    // No drawdown: Calmar undefined -> 0
    assert(near(m.calmar_ratio, 0.0));
}

static void testStrategyResults() {
    Trade buy;
    buy.side = TradeSide::BUY;
    buy.portfolio_value = 1000.0;

    Trade win;
    win.side = TradeSide::SELL;
    win.pnl = 10.0;
    win.portfolio_value = 1010.0;

    Trade loss;
    loss.side = TradeSide::SELL;
    loss.pnl = -5.0;
    loss.portfolio_value = 1005.0;

    const auto r = RiskMetricsCalculator::calculateStrategyResults({buy, win, buy, loss}, 1000.0, 1005.0);
    assert(r.trade_count == 4);
    assert(r.win_count == 1);
    assert(r.loss_count == 1);
    assert(near(r.win_rate, 50.0));
    assert(near(r.profit_factor, 2.0));
    assert(near(r.largest_win, 10.0));
    assert(near(r.largest_loss, 5.0));
    assert(near(r.total_return, 0.5));
    assert(near(r.total_return_quote, 5.0));

    const auto only_wins = RiskMetricsCalculator::calculateStrategyResults({buy, win}, 1000.0, 1010.0);
    assert(near(only_wins.profit_factor, kMetricCap));

    const auto none = RiskMetricsCalculator::calculateStrategyResults({}, 1000.0, 1000.0);
    assert(none.trade_count == 0);
    assert(near(none.win_rate, 0.0));
    assert(near(none.profit_factor, 0.0));
}

int main() {
    std::cout << "[TEST] Starting RiskMetrics Test..." << std::endl;

    testEmptyInputs();
    testFlatCurve();
    testDrawdown();
    testCapsWithoutDownside();
    testStrategyResults();

    std::cout << "[TEST] RiskMetrics PASSED" << std::endl;
    return 0;
}
