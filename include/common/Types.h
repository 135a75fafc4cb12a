#pragma once

#include <string>
#include <vector>
#include <optional>

namespace regimetrader {

enum class TradeSide { BUY, SELL };
enum class SignalAction { BUY, SELL, HOLD };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;  // epoch ms

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Ordered bars of one symbol/timeframe.
// id must stay stable for the lifetime of the data (regime cache key).
struct PriceSeries {
    std::string id;
    std::vector<Candle> candles;

    PriceSeries() = default;
    PriceSeries(std::string series_id, std::vector<Candle> bars)
        : id(std::move(series_id)), candles(std::move(bars)) {}

    size_t size() const { return candles.size(); }
    bool empty() const { return candles.empty(); }
};

struct Trade {
    std::string id;
    long long timestamp = 0;
    TradeSide side = TradeSide::BUY;
    double price = 0.0;
    double amount = 0.0;          // base units
    double quote_amount = 0.0;    // gross quote value before costs
    double fees = 0.0;            // fee + slippage paid in quote
    double signal = 0.0;
    double confidence = 0.0;
    double portfolio_value = 0.0; // total value right after the trade
    std::optional<double> cost_basis;
    std::optional<double> pnl;    // realized, sells only
    std::string strategy_name;
    std::string reason = "signal";
};

// Exclusively owned by one caller; TradeExecutor mutates it in place.
struct Portfolio {
    double quote_balance = 0.0;
    double base_balance = 0.0;
    double total_value = 0.0;
    double initial_capital = 0.0;
    double total_return = 0.0;    // %
    int trade_count = 0;
    int win_count = 0;

    static Portfolio create(double initial_capital);

    // Recompute total_value/total_return from balances. Throws std::logic_error on negative balances.
    void revalue(double price);

    // Throws std::logic_error if total_value drifted from quote + base * price.
    void checkInvariant(double price) const;
};

struct PortfolioSnapshot {
    long long timestamp = 0;
    double quote_balance = 0.0;
    double base_balance = 0.0;
    double total_value = 0.0;
    double price = 0.0;
};

std::string toString(TradeSide side);
std::string toString(SignalAction action);

} // namespace regimetrader
