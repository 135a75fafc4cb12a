#include "risk/StopLossManager.h"

#include <algorithm>

namespace regimetrader {
namespace risk {

double StopLossManager::calculateStopLossPrice(double entry_price, double atr, const StopLossConfig& config) {
    if (!config.enabled || atr <= 0.0) {
        return 0.0;
    }
    return entry_price - atr * config.atr_multiplier;
}

std::optional<OpenPosition> StopLossManager::createOpenPosition(const Trade& buy_trade, double entry_price,
                                                                double atr, const StopLossConfig& config) {
    if (!config.enabled) {
        return std::nullopt;
    }

    OpenPosition position;
    position.buy_trade = buy_trade;
    position.entry_price = entry_price;
    position.stop_loss_price = calculateStopLossPrice(entry_price, atr, config);
    position.highest_price = entry_price;
    position.atr_at_entry = atr;
    return position;
}

StopLossUpdate StopLossManager::updateStopLoss(OpenPosition& position, double current_price,
                                               double atr, const StopLossConfig& config) {
    StopLossUpdate update;
    update.stop_loss_price = position.stop_loss_price;
    if (!config.enabled) {
        return update;
    }

    position.highest_price = std::max(position.highest_price, current_price);

    if (config.trailing && atr > 0.0) {
        const double candidate = position.highest_price - atr * config.atr_multiplier;
        if (candidate > position.stop_loss_price) {
            // Only a raise of an already active stop counts as a trail
            if (position.stop_loss_price > 0.0) {
                position.trailed = true;
            }
            position.stop_loss_price = candidate;
        }
    }

    update.stop_loss_price = position.stop_loss_price;
    if (current_price > 0.0) {
        update.distance_to_stop_pct = ((current_price - position.stop_loss_price) / current_price) * 100.0;
    }

    if (position.stop_loss_price > 0.0 && current_price <= position.stop_loss_price) {
        update.should_exit = true;
        update.reason = position.trailed ? "trailing-stop" : "stop-loss";
    }
    return update;
}

std::vector<StopLossUpdate> StopLossManager::checkStopLosses(std::vector<OpenPosition>& positions,
                                                             double current_price, double atr,
                                                             const StopLossConfig& config) {
    std::vector<StopLossUpdate> updates;
    updates.reserve(positions.size());
    for (auto& position : positions) {
        updates.push_back(updateStopLoss(position, current_price, atr, config));
    }
    return updates;
}

} // namespace risk
} // namespace regimetrader
