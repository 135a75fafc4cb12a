#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "core/state/TradeJournalJsonl.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace regimetrader;
using testing::near;

// Up-leg, sell-off, recovery: exercises both strategies
static PriceSeries cycleSeries(const std::string& id) {
    auto up = testing::makeSeries(id, 120, 100.0, 0.012, 0.015);
    auto down = testing::makeSeries(id, 80, up.candles.back().close, -0.015, 0.015);
    auto again = testing::makeSeries(id, 80, down.candles.back().close, 0.01, 0.015);

    std::vector<Candle> candles = up.candles;
    long long ts = candles.back().timestamp;
    for (const auto* leg : {&down, &again}) {
        for (auto c : leg->candles) {
            ts += testing::kDayMs;
            c.timestamp = ts;
            candles.push_back(c);
        }
    }
    return PriceSeries(id, std::move(candles));
}

static strategy::AdaptiveConfig fullConfig() {
    auto config = Config::defaultAdaptiveConfig();
    config.dynamic_position_sizing = true;
    config.drawdown_circuit_breaker = true;
    config.kelly = risk::KellyConfig{};
    config.stop_loss = risk::StopLossConfig{};
    risk::VolatilitySizingConfig vol;
    vol.enabled = true;
    config.volatility_sizing = vol;
    return config;
}

static void testEndToEnd() {
    EngineSettings settings;
    settings.initial_capital = 1000.0;
    backtest::BacktestEngine engine(settings);

    const auto series = cycleSeries("cycle");
    const auto result = engine.run(series, fullConfig(), execution::TransactionCostConfig{});

    const int expected_bars = static_cast<int>(series.size()) - settings.warmup_bars;
    assert(result.bars_evaluated == expected_bars);
    assert(result.equity_curve.size() == static_cast<size_t>(expected_bars));
    assert(result.equity_curve.front().timestamp == series.candles[50].timestamp);

    double usage = 0.0;
    for (const auto& entry : result.strategy_usage) usage += entry.second;
    assert(near(usage, 1.0, 1e-9));
    double regimes = 0.0;
    for (const auto& entry : result.regime_distribution) regimes += entry.second;
    assert(near(regimes, 1.0, 1e-9));

    const auto& final_portfolio = result.final_portfolio;
    assert(final_portfolio.quote_balance >= 0.0);
    assert(final_portfolio.base_balance >= 0.0);
    final_portfolio.checkInvariant(series.candles.back().close);
    assert(near(result.results.final_value, final_portfolio.total_value));
    assert(result.results.trade_count == static_cast<int>(result.trades.size()));

    for (const auto& trade : result.trades) {
        assert(trade.amount > 0.0);
        if (trade.side == TradeSide::BUY) {
            assert(!trade.pnl.has_value());
        } else {
            assert(trade.pnl.has_value());
        }
    }
    assert(final_portfolio.trade_count == static_cast<int>(result.trades.size()));

    for (double v : {result.risk_metrics.sharpe_ratio, result.risk_metrics.sortino_ratio,
                     result.risk_metrics.max_drawdown, result.risk_metrics.calmar_ratio,
                     result.risk_metrics.omega_ratio, result.risk_metrics.ulcer_index}) {
        assert(std::isfinite(v));
    }
}

static void testRepeatableRuns() {
    backtest::BacktestEngine engine;
    const auto series = cycleSeries("repeat");
    const auto config = fullConfig();

    const auto first = engine.run(series, config, execution::TransactionCostConfig{});
    const auto second = engine.run(series, config, execution::TransactionCostConfig{});
    assert(first.trades.size() == second.trades.size());
    assert(near(first.final_portfolio.total_value, second.final_portfolio.total_value, 1e-9));
    assert(first.gate_activations == second.gate_activations);
}

static void testTooShortThrows() {
    backtest::BacktestEngine engine;
    const auto series = testing::makeSeries("short", 50, 100.0, 0.01);
    bool threw = false;
    try {
        engine.run(series, Config::defaultAdaptiveConfig(), execution::TransactionCostConfig{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void testJournalMatchesTrades() {
    const auto dir = std::filesystem::temp_directory_path() / "regimetrader_bt_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    core::TradeJournalJsonl journal(dir / "trades.jsonl");
    backtest::BacktestEngine engine;
    engine.setJournal(&journal);
    const auto result = engine.run(cycleSeries("journal"), fullConfig(), execution::TransactionCostConfig{});

    assert(journal.lastSeq() == result.trades.size());
    const auto rows = journal.readFrom(1);
    assert(rows.size() == result.trades.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        assert(rows[i].trade_id == result.trades[i].id);
    }
    std::filesystem::remove_all(dir, ec);
}

static void testDataHistoryRoundTripCsv() {
    const auto dir = std::filesystem::temp_directory_path() / "regimetrader_data_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "ETH-1d.csv";
    {
        std::ofstream out(path);
        out << "timestamp,open,high,low,close,volume\n";
        out << "3000,12,13,11,12.5,30\n";
        out << "1000,10,11,9,10.5,10\n";
        out << "bad,row\n";
        out << "2000,11,12,10,abc,20\n";
        out << "4000,12,11,13,12,5\n";   // high < low
        out << "\"5000\",\"13\",\"14\",\"12\",\"13.5\",\"50\"\n";
    }

    const auto series = backtest::DataHistory::loadSeries(path.string());
    assert(series.id == "ETH-1d");
    assert(series.size() == 3);
    assert(series.candles[0].timestamp == 1000);
    assert(series.candles[1].timestamp == 3000);
    assert(near(series.candles[2].close, 13.5));

    const auto filtered = backtest::DataHistory::filterByTime(series.candles, 2000, 4000);
    assert(filtered.size() == 1 && filtered[0].timestamp == 3000);

    const auto json_path = dir / "bars.json";
    {
        std::ofstream out(json_path);
        out << R"([{"t": 2, "o": 1, "h": 2, "l": 0.5, "c": 1.5, "v": 100},
                  {"timestamp": 1, "open": 1, "high": 1.2, "low": 0.9, "close": 1.1, "volume": 10},
                  {"t": 3, "o": 1}])";
    }
    const auto json_series = backtest::DataHistory::loadSeries(json_path.string());
    assert(json_series.size() == 2);
    assert(json_series.candles[0].timestamp == 1);
    assert(near(json_series.candles[1].close, 1.5));

    assert(backtest::DataHistory::loadCSV((dir / "missing.csv").string()).empty());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

int main() {
    std::cout << "[TEST] Starting BacktestEngine Test..." << std::endl;

    testEndToEnd();
    testRepeatableRuns();
    testTooShortThrows();
    testJournalMatchesTrades();
    testDataHistoryRoundTripCsv();

    std::cout << "[TEST] BacktestEngine PASSED" << std::endl;
    return 0;
}
