#include "analytics/RiskMetrics.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace regimetrader {
namespace analytics {

namespace {
constexpr double kMsPerDay = 1000.0 * 60.0 * 60.0 * 24.0;

double average(const std::vector<double>& values) {
    return TechnicalIndicators::calculateMean(values);
}

double drawdownPct(double peak, double value) {
    return peak > 0.0 ? ((peak - value) / peak) * 100.0 : 0.0;
}
}

RiskMetrics RiskMetricsCalculator::calculateRiskMetrics(const std::vector<Trade>& trades,
                                                        const std::vector<PortfolioSnapshot>& equity_curve,
                                                        double initial_capital) {
    const auto returns = returnsFromCapital(equity_curve, initial_capital);
    const auto period_returns = periodReturns(equity_curve);

    RiskMetrics m;
    m.sharpe_ratio = sharpeRatio(period_returns);
    m.sortino_ratio = sortinoRatio(period_returns);
    m.max_drawdown = maxDrawdown(equity_curve);
    m.max_drawdown_duration = maxDrawdownDuration(equity_curve, m.max_drawdown);
    m.volatility = volatility(period_returns);
    m.calmar_ratio = calmarRatio(returns, m.max_drawdown);
    m.omega_ratio = omegaRatio(period_returns);
    m.ulcer_index = ulcerIndex(equity_curve);
    m.win_loss_ratio = winLossRatio(trades, initial_capital);
    m.expectancy = expectancy(trades, initial_capital);
    return m;
}

StrategyResults RiskMetricsCalculator::calculateStrategyResults(const std::vector<Trade>& trades,
                                                                double initial_capital, double final_value) {
    std::vector<double> wins;
    std::vector<double> losses;

    double prev_value = initial_capital;
    for (const auto& trade : trades) {
        const double pnl = trade.pnl.has_value() ? *trade.pnl : trade.portfolio_value - prev_value;
        prev_value = trade.portfolio_value;
        // Buys carry no realized result
        if (!trade.pnl.has_value() && trade.side == TradeSide::BUY) {
            continue;
        }
        if (pnl > 0) {
            wins.push_back(pnl);
        } else if (pnl < 0) {
            losses.push_back(std::abs(pnl));
        }
    }

    const double total_wins = std::accumulate(wins.begin(), wins.end(), 0.0);
    const double total_losses = std::accumulate(losses.begin(), losses.end(), 0.0);

    StrategyResults r;
    r.initial_capital = initial_capital;
    r.final_value = final_value;
    r.total_return = initial_capital > 0 ? ((final_value - initial_capital) / initial_capital) * 100.0 : 0.0;
    r.total_return_quote = final_value - initial_capital;
    r.trade_count = static_cast<int>(trades.size());
    r.win_count = static_cast<int>(wins.size());
    r.loss_count = static_cast<int>(losses.size());
    const int closed = r.win_count + r.loss_count;
    r.win_rate = closed > 0 ? (static_cast<double>(r.win_count) / closed) * 100.0 : 0.0;
    r.avg_win = wins.empty() ? 0.0 : total_wins / wins.size();
    r.avg_loss = losses.empty() ? 0.0 : total_losses / losses.size();
    if (total_losses > 0) {
        r.profit_factor = std::min(kMetricCap, total_wins / total_losses);
    } else {
        r.profit_factor = total_wins > 0 ? kMetricCap : 0.0;
    }
    r.largest_win = wins.empty() ? 0.0 : *std::max_element(wins.begin(), wins.end());
    r.largest_loss = losses.empty() ? 0.0 : *std::max_element(losses.begin(), losses.end());
    return r;
}

std::vector<double> RiskMetricsCalculator::periodReturns(const std::vector<PortfolioSnapshot>& equity_curve) {
    std::vector<double> returns;
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].total_value;
        if (prev > 0) {
            returns.push_back(((equity_curve[i].total_value - prev) / prev) * 100.0);
        }
    }
    return returns;
}

std::vector<double> RiskMetricsCalculator::returnsFromCapital(const std::vector<PortfolioSnapshot>& equity_curve,
                                                              double initial_capital) {
    std::vector<double> returns;
    double prev = initial_capital;
    for (const auto& snapshot : equity_curve) {
        if (prev > 0) {
            returns.push_back(((snapshot.total_value - prev) / prev) * 100.0);
        }
        prev = snapshot.total_value;
    }
    return returns;
}

double RiskMetricsCalculator::sharpeRatio(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;

    const double mean = average(returns);
    const double std_dev = TechnicalIndicators::calculateStandardDeviation(returns, mean);
    if (std_dev == 0.0) return 0.0;
    return mean / std_dev;
}

double RiskMetricsCalculator::sortinoRatio(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;

    const double mean = average(returns);
    double downside_sq = 0.0;
    int downside_count = 0;
    for (double r : returns) {
        if (r < 0) {
            downside_sq += r * r;
            downside_count++;
        }
    }

    if (downside_count == 0) {
        return mean > 0 ? kMetricCap : 0.0;
    }
    const double downside_dev = std::sqrt(downside_sq / downside_count);
    if (downside_dev == 0.0) {
        return mean > 0 ? kMetricCap : 0.0;
    }
    return std::max(-kMetricCap, std::min(kMetricCap, mean / downside_dev));
}

double RiskMetricsCalculator::maxDrawdown(const std::vector<PortfolioSnapshot>& equity_curve) {
    if (equity_curve.empty()) return 0.0;

    double peak = equity_curve.front().total_value;
    double max_dd = 0.0;
    for (const auto& snapshot : equity_curve) {
        peak = std::max(peak, snapshot.total_value);
        max_dd = std::max(max_dd, drawdownPct(peak, snapshot.total_value));
    }
    return max_dd;
}

double RiskMetricsCalculator::maxDrawdownDuration(const std::vector<PortfolioSnapshot>& equity_curve,
                                                  double max_drawdown) {
    if (equity_curve.empty() || max_drawdown == 0.0) return 0.0;

    double peak = equity_curve.front().total_value;
    long long peak_ts = equity_curve.front().timestamp;
    bool in_stretch = false;
    long long stretch_start = 0;
    double max_duration = 0.0;

    for (const auto& snapshot : equity_curve) {
        if (snapshot.total_value > peak) {
            peak = snapshot.total_value;
            peak_ts = snapshot.timestamp;
            in_stretch = false;
        }

        // Within 1% of the deepest drawdown
        if (drawdownPct(peak, snapshot.total_value) >= max_drawdown * 0.99) {
            if (!in_stretch) {
                in_stretch = true;
                stretch_start = peak_ts;
            }
            const double days = static_cast<double>(snapshot.timestamp - stretch_start) / kMsPerDay;
            max_duration = std::max(max_duration, days);
        } else {
            in_stretch = false;
        }
    }
    return std::round(max_duration);
}

double RiskMetricsCalculator::volatility(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;
    return TechnicalIndicators::calculateStandardDeviation(returns, average(returns));
}

double RiskMetricsCalculator::calmarRatio(const std::vector<double>& returns, double max_drawdown) {
    if (returns.empty() || max_drawdown == 0.0) return 0.0;
    const double annual_return = average(returns) * 365.0;
    return std::max(-kMetricCap, std::min(kMetricCap, annual_return / max_drawdown));
}

double RiskMetricsCalculator::omegaRatio(const std::vector<double>& returns, double threshold) {
    if (returns.empty()) return 0.0;

    double gains = 0.0;
    double losses = 0.0;
    for (double r : returns) {
        const double excess = r - threshold;
        if (excess > 0) gains += excess;
        else losses += std::abs(excess);
    }

    if (losses == 0.0) {
        return gains > 0 ? kMetricCap : 1.0;
    }
    return std::min(kMetricCap, gains / losses);
}

double RiskMetricsCalculator::ulcerIndex(const std::vector<PortfolioSnapshot>& equity_curve) {
    if (equity_curve.empty()) return 0.0;

    double peak = equity_curve.front().total_value;
    double sum_sq = 0.0;
    for (const auto& snapshot : equity_curve) {
        peak = std::max(peak, snapshot.total_value);
        const double dd = drawdownPct(peak, snapshot.total_value);
        sum_sq += dd * dd;
    }
    return std::sqrt(sum_sq / equity_curve.size());
}

RiskMetricsCalculator::TradeDeltas RiskMetricsCalculator::portfolioDeltas(const std::vector<Trade>& trades,
                                                                          double initial_capital) {
    TradeDeltas deltas;
    double prev = initial_capital;
    for (const auto& trade : trades) {
        const double pnl = trade.portfolio_value - prev;
        if (pnl > 0) {
            deltas.wins.push_back(pnl);
        } else if (pnl < 0) {
            deltas.losses.push_back(std::abs(pnl));
        }
        prev = trade.portfolio_value;
    }
    return deltas;
}

double RiskMetricsCalculator::winLossRatio(const std::vector<Trade>& trades, double initial_capital) {
    const auto deltas = portfolioDeltas(trades, initial_capital);
    const double avg_win = average(deltas.wins);
    const double avg_loss = average(deltas.losses);

    if (avg_loss == 0.0) {
        return avg_win > 0 ? kMetricCap : 0.0;
    }
    return std::min(kMetricCap, avg_win / avg_loss);
}

double RiskMetricsCalculator::expectancy(const std::vector<Trade>& trades, double initial_capital) {
    if (trades.empty()) return 0.0;

    const auto deltas = portfolioDeltas(trades, initial_capital);
    const double n = static_cast<double>(trades.size());
    const double win_rate = deltas.wins.size() / n;
    const double loss_rate = deltas.losses.size() / n;
    return win_rate * average(deltas.wins) - loss_rate * average(deltas.losses);
}

} // namespace analytics
} // namespace regimetrader
