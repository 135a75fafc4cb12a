#include "risk/KellyCriterion.h"

#include <algorithm>
#include <cmath>

namespace regimetrader {
namespace risk {

std::optional<KellyResult> KellyCriterion::calculate(const std::vector<Trade>& trades,
                                                     const KellyConfig& config) {
    std::vector<double> pnls;
    for (const auto& trade : trades) {
        if (trade.side == TradeSide::SELL && trade.pnl.has_value()) {
            pnls.push_back(*trade.pnl);
        }
    }

    if (config.lookback_period > 0 && pnls.size() > static_cast<size_t>(config.lookback_period)) {
        pnls.erase(pnls.begin(), pnls.end() - config.lookback_period);
    }

    if (pnls.size() < static_cast<size_t>(std::max(0, config.min_trades)) || pnls.empty()) {
        return std::nullopt;
    }

    double gross_win = 0.0;
    double gross_loss = 0.0;
    int wins = 0;
    int losses = 0;
    for (double pnl : pnls) {
        if (pnl > 0) {
            gross_win += pnl;
            wins++;
        } else if (pnl < 0) {
            gross_loss += std::abs(pnl);
            losses++;
        }
        // break-even trades carry no edge information
    }

    const int decided = wins + losses;
    if (decided == 0) {
        return std::nullopt;
    }

    KellyResult result;
    result.trade_count = static_cast<int>(pnls.size());
    result.win_rate = static_cast<double>(wins) / decided;
    result.average_win = wins > 0 ? gross_win / wins : 0.0;
    result.average_loss = losses > 0 ? gross_loss / losses : 0.0;
    result.win_loss_ratio = result.average_loss > 0 ? result.average_win / result.average_loss : 0.0;

    const double p = result.win_rate;
    double kelly = 0.0;
    if (result.average_loss > 0 && result.win_loss_ratio > 0) {
        // f* = (p*R - q) / R
        kelly = (p * result.win_loss_ratio - (1.0 - p)) / result.win_loss_ratio;
    } else if (result.average_loss == 0 && p > 0.5) {
        kelly = p;
    }

    result.kelly_percentage = std::max(0.0, std::min(1.0, kelly));
    result.fractional_kelly = result.kelly_percentage * config.fractional_multiplier;
    return result;
}

double KellyCriterion::getKellyMultiplier(const std::optional<KellyResult>& result,
                                          double base_position_pct,
                                          double cap) {
    if (!result || base_position_pct <= 0) {
        return 1.0;
    }
    const double multiplier = result->fractional_kelly / base_position_pct;
    return std::max(0.1, std::min(cap, multiplier));
}

double KellyCriterion::calculateOptimalPositionSize(double available_capital,
                                                    const std::optional<KellyResult>& result,
                                                    double max_position_pct) {
    if (!result) {
        return available_capital * max_position_pct;
    }
    return available_capital * std::min(result->fractional_kelly, max_position_pct);
}

} // namespace risk
} // namespace regimetrader
