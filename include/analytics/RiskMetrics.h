#pragma once

#include <vector>

#include "common/Types.h"

namespace regimetrader {
namespace analytics {

// Cap for unbounded ratios (no losses / no downside)
constexpr double kMetricCap = 999.0;

struct RiskMetrics {
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;           // %
    double max_drawdown_duration = 0.0;  // days
    double volatility = 0.0;             // stddev of % returns
    double calmar_ratio = 0.0;
    double omega_ratio = 0.0;
    double ulcer_index = 0.0;
    double win_loss_ratio = 0.0;
    double expectancy = 0.0;             // quote per trade
};

struct StrategyResults {
    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;      // %
    double total_return_quote = 0.0;
    int trade_count = 0;
    int win_count = 0;
    int loss_count = 0;
    double win_rate = 0.0;          // %
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
};

// Pure functions over a trade list and an equity curve.
// Empty or single-point input yields zeros, never NaN/Infinity.
class RiskMetricsCalculator {
public:
    static RiskMetrics calculateRiskMetrics(const std::vector<Trade>& trades,
                                            const std::vector<PortfolioSnapshot>& equity_curve,
                                            double initial_capital);

    // Realized pnl where present, otherwise portfolio value delta between trades
    static StrategyResults calculateStrategyResults(const std::vector<Trade>& trades,
                                                    double initial_capital, double final_value);

    // % change between consecutive snapshots
    static std::vector<double> periodReturns(const std::vector<PortfolioSnapshot>& equity_curve);
    // Same, with the first step measured from initial capital
    static std::vector<double> returnsFromCapital(const std::vector<PortfolioSnapshot>& equity_curve,
                                                  double initial_capital);

    static double sharpeRatio(const std::vector<double>& returns);
    static double sortinoRatio(const std::vector<double>& returns);
    static double maxDrawdown(const std::vector<PortfolioSnapshot>& equity_curve);
    static double maxDrawdownDuration(const std::vector<PortfolioSnapshot>& equity_curve, double max_drawdown);
    static double volatility(const std::vector<double>& returns);
    static double calmarRatio(const std::vector<double>& returns, double max_drawdown);
    static double omegaRatio(const std::vector<double>& returns, double threshold = 0.0);
    static double ulcerIndex(const std::vector<PortfolioSnapshot>& equity_curve);
    static double winLossRatio(const std::vector<Trade>& trades, double initial_capital);
    static double expectancy(const std::vector<Trade>& trades, double initial_capital);

private:
    struct TradeDeltas {
        std::vector<double> wins;
        std::vector<double> losses;  // magnitudes
    };
    static TradeDeltas portfolioDeltas(const std::vector<Trade>& trades, double initial_capital);
};

} // namespace analytics
} // namespace regimetrader
