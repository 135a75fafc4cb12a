#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "common/Config.h"
#include "analytics/RegimeDetector.h"
#include "analytics/RiskMetrics.h"
#include "core/contracts/ITradeJournal.h"
#include "core/state/SessionStoreMemory.h"
#include "execution/TradeExecutor.h"
#include "strategy/AdaptiveStrategySelector.h"

namespace regimetrader {
namespace backtest {

struct BacktestResult {
    std::string series_id;
    std::vector<Trade> trades;
    std::vector<PortfolioSnapshot> equity_curve;   // one per evaluated bar, before execution
    analytics::StrategyResults results;
    analytics::RiskMetrics risk_metrics;
    Portfolio final_portfolio;

    int bars_evaluated = 0;
    // "bullish" / "bearish" / "neutral" -> fraction of evaluated bars
    std::map<std::string, double> strategy_usage;
    std::map<std::string, double> regime_distribution;
    // Gate name -> bars on which it forced a hold
    std::map<std::string, int> gate_activations;
};

// Replays a bar series through the adaptive selector and the executor.
class BacktestEngine {
public:
    explicit BacktestEngine(EngineSettings settings = EngineSettings());

    // Not owned; nullptr disables journaling
    void setJournal(core::ITradeJournal* journal) { journal_ = journal; }

    // Throws std::invalid_argument if the series is not longer than warmup_bars.
    BacktestResult run(const PriceSeries& series,
                       const strategy::AdaptiveConfig& config,
                       const execution::TransactionCostConfig& costs);

    const core::SessionStoreMemory& sessions() const { return sessions_; }
    const analytics::RegimeDetector& detector() const { return detector_; }
    const Portfolio& portfolio() const { return portfolio_; }

private:
    void journalTrades(const std::vector<Trade>& trades, size_t from);
    static std::string usageBucket(const strategy::TradingSignal& signal,
                                   const strategy::AdaptiveConfig& config);

    EngineSettings settings_;
    analytics::RegimeDetector detector_;
    core::SessionStoreMemory sessions_;
    strategy::AdaptiveStrategySelector selector_;
    Portfolio portfolio_;
    core::ITradeJournal* journal_ = nullptr;
};

} // namespace backtest
} // namespace regimetrader
