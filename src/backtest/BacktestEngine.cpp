#include "backtest/BacktestEngine.h"

#include <algorithm>
#include <stdexcept>

#include "common/Logger.h"
#include "strategy/ConfidenceCalculator.h"

namespace regimetrader {
namespace backtest {

BacktestEngine::BacktestEngine(EngineSettings settings)
    : settings_(std::move(settings))
    , selector_(detector_, sessions_)
    , portfolio_(Portfolio::create(settings_.initial_capital)) {
}

std::string BacktestEngine::usageBucket(const strategy::TradingSignal& signal,
                                        const strategy::AdaptiveConfig& config) {
    const auto& name = signal.active_strategy.name;
    if (name == config.bullish_strategy.name) {
        return "bullish";
    }
    if (name == config.bearish_strategy.name) {
        return "bearish";
    }
    return "neutral";
}

void BacktestEngine::journalTrades(const std::vector<Trade>& trades, size_t from) {
    if (!journal_) {
        return;
    }
    for (size_t i = from; i < trades.size(); ++i) {
        const auto& trade = trades[i];
        if (!journal_->append(core::JournalEntry::fromTrade(trade, settings_.symbol))) {
            LOG_WARN("Journal append failed for {}", trade.id);
        }
    }
}

BacktestResult BacktestEngine::run(const PriceSeries& series,
                                   const strategy::AdaptiveConfig& config,
                                   const execution::TransactionCostConfig& costs) {
    const size_t warmup = static_cast<size_t>(std::max(0, settings_.warmup_bars));
    if (series.size() <= warmup) {
        throw std::invalid_argument("Backtest needs more than " + std::to_string(warmup) +
                                    " bars, got " + std::to_string(series.size()));
    }

    // Fresh run: no cached indicators, no regime/outcome memory
    detector_.invalidate();
    sessions_.clear(series.id);
    portfolio_ = Portfolio::create(settings_.initial_capital);

    execution::ExecutionContext context;
    context.symbol = settings_.symbol;
    context.candles = &series.candles;
    context.transaction_costs = costs;
    context.max_bullish_position = config.max_bullish_position;
    context.stop_loss = config.stop_loss;
    context.kelly = config.kelly;
    context.volatility_sizing = config.volatility_sizing;
    context.session_store = &sessions_;
    context.session_key = series.id;
    context.outcome_capacity = config.outcomeHistoryCapacity();

    BacktestResult result;
    result.series_id = series.id;
    std::map<std::string, int> usage_counts;
    std::map<std::string, int> regime_counts;

    LOG_INFO("Backtest start: series={}, bars={}, warmup={}, capital={:.2f}",
             series.id, series.size(), warmup, settings_.initial_capital);

    for (size_t i = warmup; i < series.size(); ++i) {
        const Candle& candle = series.candles[i];
        const double price = candle.close;

        portfolio_.revalue(price);
        PortfolioSnapshot snapshot;
        snapshot.timestamp = candle.timestamp;
        snapshot.quote_balance = portfolio_.quote_balance;
        snapshot.base_balance = portfolio_.base_balance;
        snapshot.total_value = portfolio_.total_value;
        snapshot.price = price;
        result.equity_curve.push_back(snapshot);

        auto signal = selector_.generateSignal(series, config, i, series.id);

        if (config.drawdown_circuit_breaker) {
            auto state = sessions_.get(series.id).value_or(core::SessionState{});
            const bool blocked = risk::RiskOverlay::checkDrawdown(state, portfolio_.total_value,
                                                                  config.max_drawdown_threshold);
            sessions_.put(series.id, state);
            if (blocked && signal.blocked_by == risk::RiskGate::NONE) {
                LOG_WARN("Drawdown guard: value {:.2f} vs peak {:.2f}, holding",
                         portfolio_.total_value, state.peak_portfolio_value);
                signal.signal = 0.0;
                signal.action = SignalAction::HOLD;
                signal.blocked_by = risk::RiskGate::DRAWDOWN;
            }
        }

        ++usage_counts[usageBucket(signal, config)];
        ++regime_counts[analytics::toString(signal.regime.regime)];
        if (signal.blocked_by != risk::RiskGate::NONE) {
            ++result.gate_activations[risk::toString(signal.blocked_by)];
        }

        const double confidence = strategy::ConfidenceCalculator::calculateConfidence(
            signal, series.candles, i);

        context.index = i;
        const size_t before = context.trades.size();
        execution::TradeExecutor::executeTrade(signal, confidence, price, portfolio_, context);
        journalTrades(context.trades, before);
        ++result.bars_evaluated;
    }

    const double last_price = series.candles.back().close;
    portfolio_.revalue(last_price);
    portfolio_.checkInvariant(last_price);

    result.trades = context.trades;
    result.final_portfolio = portfolio_;
    result.results = analytics::RiskMetricsCalculator::calculateStrategyResults(
        result.trades, settings_.initial_capital, portfolio_.total_value);
    result.risk_metrics = analytics::RiskMetricsCalculator::calculateRiskMetrics(
        result.trades, result.equity_curve, settings_.initial_capital);

    const double periods = static_cast<double>(result.bars_evaluated);
    for (const char* bucket : {"bullish", "bearish", "neutral"}) {
        result.strategy_usage[bucket] = usage_counts[bucket] / periods;
    }
    for (const char* regime : {"bullish", "bearish", "neutral"}) {
        result.regime_distribution[regime] = regime_counts[regime] / periods;
    }

    LOG_INFO("Backtest done: series={}, trades={}, final={:.2f}, return={:.2f}%, maxDD={:.2f}%",
             series.id, result.trades.size(), portfolio_.total_value,
             result.results.total_return, result.risk_metrics.max_drawdown);
    return result;
}

} // namespace backtest
} // namespace regimetrader
