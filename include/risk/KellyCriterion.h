#pragma once

#include "common/Types.h"
#include <optional>
#include <vector>

namespace regimetrader {
namespace risk {

struct KellyConfig {
    bool enabled = true;
    double fractional_multiplier = 0.25;  // quarter Kelly
    int min_trades = 10;
    int lookback_period = 50;             // most recent closed trades considered
};

struct KellyResult {
    double kelly_percentage = 0.0;   // full Kelly, clamped to [0, 1]
    double fractional_kelly = 0.0;
    double win_rate = 0.0;
    double win_loss_ratio = 0.0;
    double average_win = 0.0;
    double average_loss = 0.0;       // positive magnitude
    int trade_count = 0;
};

class KellyCriterion {
public:
    // Closed (sell) trades with realized pnl only. nullopt below min_trades.
    static std::optional<KellyResult> calculate(const std::vector<Trade>& trades,
                                                const KellyConfig& config = KellyConfig());

    // nullopt -> 1.0, otherwise clamp(fractional / base_position_pct, 0.1, cap)
    static double getKellyMultiplier(const std::optional<KellyResult>& result,
                                     double base_position_pct = 0.9,
                                     double cap = 1.5);

    // Capital to deploy: fractional Kelly capped at max_position_pct
    static double calculateOptimalPositionSize(double available_capital,
                                               const std::optional<KellyResult>& result,
                                               double max_position_pct = 0.9);
};

} // namespace risk
} // namespace regimetrader
