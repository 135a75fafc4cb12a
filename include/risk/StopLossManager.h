#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace regimetrader {
namespace risk {

struct StopLossConfig {
    bool enabled = true;
    double atr_multiplier = 2.0;
    bool trailing = true;
    bool use_ema = true;   // Wilder-smoothed ATR
    int atr_period = 14;
};

// Long position guarded by an ATR stop
struct OpenPosition {
    Trade buy_trade;
    double entry_price = 0.0;
    double stop_loss_price = 0.0;
    double highest_price = 0.0;
    double atr_at_entry = 0.0;
    bool trailed = false;       // stop moved up at least once
    size_t lot_index = 0;       // lot in the executor's LotBook
};

struct StopLossUpdate {
    bool should_exit = false;
    double stop_loss_price = 0.0;
    double distance_to_stop_pct = 0.0;
    std::string reason;         // "stop-loss" / "trailing-stop", empty when holding
};

class StopLossManager {
public:
    // entry - atr * multiplier, or 0 (inactive) when disabled / atr <= 0
    static double calculateStopLossPrice(double entry_price, double atr, const StopLossConfig& config);

    static std::optional<OpenPosition> createOpenPosition(const Trade& buy_trade, double entry_price,
                                                          double atr, const StopLossConfig& config);

    // Stop price is monotonic non-decreasing across calls.
    static StopLossUpdate updateStopLoss(OpenPosition& position, double current_price,
                                         double atr, const StopLossConfig& config);

    // Same order as positions
    static std::vector<StopLossUpdate> checkStopLosses(std::vector<OpenPosition>& positions,
                                                       double current_price, double atr,
                                                       const StopLossConfig& config);
};

} // namespace risk
} // namespace regimetrader
