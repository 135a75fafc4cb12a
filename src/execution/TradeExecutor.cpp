#include "execution/TradeExecutor.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace regimetrader {
namespace execution {

namespace {
constexpr double kMinTradeAmount = 1e-12;
}

std::optional<Trade> TradeExecutor::executeTrade(const strategy::TradingSignal& signal, double confidence,
                                                 double price, Portfolio& portfolio, ExecutionContext& context) {
    if (price <= 0.0 || !std::isfinite(price)) {
        LOG_WARN("Ignoring signal at invalid price {}", price);
        return std::nullopt;
    }

    if (context.stop_loss && context.stop_loss->enabled && !context.open_positions.empty()) {
        auto stop_exit = processStopLosses(signal, price, portfolio, context);
        if (stop_exit) {
            return stop_exit;
        }
    }

    switch (signal.action) {
        case SignalAction::BUY:
            return executeBuy(signal, confidence, price, portfolio, context);
        case SignalAction::SELL:
            return executeSell(signal, confidence, price, portfolio, context);
        case SignalAction::HOLD:
            break;
    }
    return std::nullopt;
}

double TradeExecutor::costRate(const ExecutionContext& context, double price) {
    const auto& costs = context.transaction_costs;
    if (!costs.enabled) {
        return 0.0;
    }

    double rate_pct = costs.fee_percent + costs.slippage_percent;
    if (costs.dynamic_slippage && price > 0.0) {
        auto atr = currentAtr(context, 14, true);
        if (atr) {
            rate_pct += (*atr / price) * 100.0 * costs.dynamic_slippage_factor;
        }
    }
    return std::max(0.0, rate_pct) / 100.0;
}

std::optional<Trade> TradeExecutor::executeBuy(const strategy::TradingSignal& signal, double confidence,
                                               double price, Portfolio& portfolio, ExecutionContext& context) {
    if (portfolio.quote_balance <= 0.0) {
        return std::nullopt;
    }

    const double base_pct = signal.active_strategy.max_position_pct;

    double kelly_multiplier = 1.0;
    if (context.kelly && context.kelly->enabled) {
        auto kelly = risk::KellyCriterion::calculate(context.trades, *context.kelly);
        kelly_multiplier = risk::KellyCriterion::getKellyMultiplier(kelly, base_pct);
    }

    double volatility_multiplier = 1.0;
    if (context.volatility_sizing && context.candles) {
        volatility_multiplier = risk::VolatilitySizing::calculateMultiplier(
            *context.candles, context.index, *context.volatility_sizing);
    }

    const double position_pct = std::min(
        base_pct * signal.position_size_multiplier * kelly_multiplier * volatility_multiplier,
        context.max_bullish_position);

    const double position_size = portfolio.quote_balance * confidence * position_pct;
    if (position_size <= 0.0) {
        return std::nullopt;
    }

    const double costs = position_size * costRate(context, price);
    const double net_cost = position_size + costs;
    if (net_cost > portfolio.quote_balance) {
        LOG_DEBUG("Buy rejected: cost {:.2f} exceeds balance {:.2f}", net_cost, portfolio.quote_balance);
        return std::nullopt;
    }

    const double amount = position_size / price;
    if (amount < kMinTradeAmount) {
        return std::nullopt;
    }

    portfolio.quote_balance -= net_cost;
    portfolio.base_balance += amount;
    portfolio.revalue(price);
    portfolio.trade_count++;

    Trade trade;
    trade.id = nextTradeId(context);
    trade.timestamp = signal.timestamp;
    trade.side = TradeSide::BUY;
    trade.price = price;
    trade.amount = amount;
    trade.quote_amount = position_size;
    trade.fees = costs;
    trade.signal = signal.signal;
    trade.confidence = confidence;
    trade.portfolio_value = portfolio.total_value;
    trade.cost_basis = net_cost;
    trade.strategy_name = signal.active_strategy.name;

    const std::size_t lot_index = context.lots.open(trade.id, amount, net_cost);

    if (context.stop_loss && context.stop_loss->enabled) {
        const double atr = currentAtr(context, context.stop_loss->atr_period, context.stop_loss->use_ema)
                               .value_or(0.0);
        auto position = risk::StopLossManager::createOpenPosition(trade, price, atr, *context.stop_loss);
        if (position) {
            position->lot_index = lot_index;
            context.open_positions.push_back(*position);
        }
    }

    context.trades.push_back(trade);
    LOG_INFO("BUY {} {:.8f} @ {:.2f} ({}), cost {:.2f}", context.symbol, amount, price,
             trade.strategy_name, net_cost);
    Logger::getInstance().logTrade(context.symbol, "buy", price, amount, 0.0);
    return trade;
}

std::optional<Trade> TradeExecutor::executeSell(const strategy::TradingSignal& signal, double confidence,
                                                double price, Portfolio& portfolio, ExecutionContext& context) {
    if (portfolio.base_balance <= 0.0) {
        return std::nullopt;
    }

    const double amount = std::min(
        portfolio.base_balance * confidence * signal.active_strategy.max_position_pct,
        portfolio.base_balance);
    if (amount < kMinTradeAmount) {
        return std::nullopt;
    }

    const double sale_value = amount * price;
    const double costs = sale_value * costRate(context, price);
    const double net_proceeds = sale_value - costs;
    const double cost_basis = context.lots.consume(amount);
    const double pnl = net_proceeds - cost_basis;

    portfolio.base_balance -= amount;
    portfolio.quote_balance += net_proceeds;
    portfolio.revalue(price);
    portfolio.trade_count++;
    if (pnl > 0.0) {
        portfolio.win_count++;
    }

    Trade trade;
    trade.id = nextTradeId(context);
    trade.timestamp = signal.timestamp;
    trade.side = TradeSide::SELL;
    trade.price = price;
    trade.amount = amount;
    trade.quote_amount = sale_value;
    trade.fees = costs;
    trade.signal = signal.signal;
    trade.confidence = confidence;
    trade.portfolio_value = portfolio.total_value;
    trade.cost_basis = cost_basis;
    trade.pnl = pnl;
    trade.strategy_name = signal.active_strategy.name;

    context.trades.push_back(trade);
    recordOutcome(context, pnl);
    dropClosedPositions(context);

    LOG_INFO("SELL {} {:.8f} @ {:.2f} ({}), pnl {:.2f}", context.symbol, amount, price,
             trade.strategy_name, pnl);
    Logger::getInstance().logTrade(context.symbol, "sell", price, amount, pnl);
    return trade;
}

std::optional<Trade> TradeExecutor::processStopLosses(const strategy::TradingSignal& signal, double price,
                                                      Portfolio& portfolio, ExecutionContext& context) {
    const auto& config = *context.stop_loss;
    const double atr = currentAtr(context, config.atr_period, config.use_ema).value_or(0.0);

    const auto updates = risk::StopLossManager::checkStopLosses(context.open_positions, price, atr, config);

    std::optional<Trade> last_exit;
    for (std::size_t i = 0; i < updates.size(); ++i) {
        if (!updates[i].should_exit) {
            continue;
        }
        auto stop_trade = exitPosition(context.open_positions[i], updates[i].reason, signal, price, portfolio, context);
        if (stop_trade) {
            last_exit = stop_trade;
        }
    }

    dropClosedPositions(context);
    return last_exit;
}

std::optional<Trade> TradeExecutor::exitPosition(const risk::OpenPosition& position, const std::string& reason,
                                                 const strategy::TradingSignal& signal, double price,
                                                 Portfolio& portfolio, ExecutionContext& context) {
    const double amount = std::min(context.lots.remaining(position.lot_index), portfolio.base_balance);
    if (amount < kMinTradeAmount) {
        return std::nullopt;
    }

    const double sale_value = amount * price;
    const double costs = sale_value * costRate(context, price);
    const double net_proceeds = sale_value - costs;
    const double cost_basis = context.lots.consumeLot(position.lot_index, amount);
    const double pnl = net_proceeds - cost_basis;

    portfolio.base_balance -= amount;
    portfolio.quote_balance += net_proceeds;
    portfolio.revalue(price);
    portfolio.trade_count++;
    if (pnl > 0.0) {
        portfolio.win_count++;
    }

    Trade trade;
    trade.id = nextTradeId(context);
    trade.timestamp = signal.timestamp;
    trade.side = TradeSide::SELL;
    trade.price = price;
    trade.amount = amount;
    trade.quote_amount = sale_value;
    trade.fees = costs;
    trade.signal = signal.signal;
    trade.confidence = 1.0;
    trade.portfolio_value = portfolio.total_value;
    trade.cost_basis = cost_basis;
    trade.pnl = pnl;
    trade.strategy_name = position.buy_trade.strategy_name;
    trade.reason = reason;

    context.trades.push_back(trade);
    recordOutcome(context, pnl);

    LOG_INFO("{} exit {} {:.8f} @ {:.2f} (stop {:.2f}, entry {:.2f}), pnl {:.2f}", reason, context.symbol,
             amount, price, position.stop_loss_price, position.entry_price, pnl);
    Logger::getInstance().logTrade(context.symbol, reason, price, amount, pnl);
    return trade;
}

std::optional<double> TradeExecutor::currentAtr(const ExecutionContext& context, int period, bool use_ema) {
    if (!context.candles) {
        return std::nullopt;
    }
    return analytics::TechnicalIndicators::getATRValue(*context.candles, context.index, period, use_ema);
}

void TradeExecutor::recordOutcome(ExecutionContext& context, double pnl) {
    if (context.session_store) {
        context.session_store->recordOutcome(context.session_key, pnl > 0.0, context.outcome_capacity);
    }
}

void TradeExecutor::dropClosedPositions(ExecutionContext& context) {
    auto& positions = context.open_positions;
    positions.erase(std::remove_if(positions.begin(), positions.end(),
                                   [&context](const risk::OpenPosition& p) {
                                       return context.lots.isClosed(p.lot_index);
                                   }),
                    positions.end());
}

std::string TradeExecutor::nextTradeId(ExecutionContext& context) {
    return "trade-" + std::to_string(context.next_trade_seq++);
}

} // namespace execution
} // namespace regimetrader
