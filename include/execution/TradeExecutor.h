#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ISessionStore.h"
#include "execution/LotBook.h"
#include "risk/KellyCriterion.h"
#include "risk/StopLossManager.h"
#include "risk/VolatilitySizing.h"
#include "strategy/TradingSignal.h"

namespace regimetrader {
namespace execution {

struct TransactionCostConfig {
    bool enabled = true;
    double fee_percent = 0.1;        // %
    double slippage_percent = 0.05;  // %
    bool dynamic_slippage = false;   // add ATR% * dynamic_slippage_factor
    double dynamic_slippage_factor = 0.1;
};

// Per-run execution state. Owned by the driver, one per portfolio.
struct ExecutionContext {
    std::string symbol = "ETH-USDC";
    std::vector<Trade> trades;
    LotBook lots;
    std::vector<risk::OpenPosition> open_positions;

    // Bars up to the current one, for ATR-based stops and sizing
    const std::vector<Candle>* candles = nullptr;
    std::size_t index = 0;

    TransactionCostConfig transaction_costs;
    double max_bullish_position = 0.95;
    std::optional<risk::StopLossConfig> stop_loss;
    std::optional<risk::KellyConfig> kelly;
    std::optional<risk::VolatilitySizingConfig> volatility_sizing;

    // When set, every realized sell records its outcome in this session's window
    core::ISessionStore* session_store = nullptr;
    std::string session_key;
    std::size_t outcome_capacity = 20;

    std::uint64_t next_trade_seq = 1;
};

// Applies signals to a portfolio ledger.
class TradeExecutor {
public:
    // Stop exits first, then the signal. Mutates portfolio, appends to context.trades.
    // nullopt: hold, zero size, or cost above the available balance.
    static std::optional<Trade> executeTrade(const strategy::TradingSignal& signal, double confidence,
                                             double price, Portfolio& portfolio, ExecutionContext& context);

    // fee + slippage as a fraction of notional
    static double costRate(const ExecutionContext& context, double price);

private:
    static std::optional<Trade> executeBuy(const strategy::TradingSignal& signal, double confidence,
                                           double price, Portfolio& portfolio, ExecutionContext& context);
    static std::optional<Trade> executeSell(const strategy::TradingSignal& signal, double confidence,
                                            double price, Portfolio& portfolio, ExecutionContext& context);
    static std::optional<Trade> exitPosition(const risk::OpenPosition& position, const std::string& reason,
                                             const strategy::TradingSignal& signal, double price,
                                             Portfolio& portfolio, ExecutionContext& context);
    // Exits every triggered position; returns the last exit
    static std::optional<Trade> processStopLosses(const strategy::TradingSignal& signal, double price,
                                                  Portfolio& portfolio, ExecutionContext& context);

    static std::optional<double> currentAtr(const ExecutionContext& context, int period, bool use_ema);
    static void recordOutcome(ExecutionContext& context, double pnl);
    static void dropClosedPositions(ExecutionContext& context);
    static std::string nextTradeId(ExecutionContext& context);
};

} // namespace execution
} // namespace regimetrader
