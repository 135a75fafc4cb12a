#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "risk/KellyCriterion.h"
#include "risk/StopLossManager.h"
#include "risk/VolatilitySizing.h"

namespace regimetrader {
namespace strategy {

enum class IndicatorType {
    SMA,
    EMA,
    MACD,
    RSI,
    BOLLINGER
};

std::string toString(IndicatorType type);
std::optional<IndicatorType> parseIndicatorType(const std::string& name);

struct IndicatorConfig {
    IndicatorType type = IndicatorType::SMA;
    double weight = 1.0;                   // need not sum to 1 across a strategy
    std::map<std::string, double> params;  // period, fastPeriod, slowPeriod, signalPeriod, stdDev

    IndicatorConfig() = default;
    IndicatorConfig(IndicatorType t, double w, std::map<std::string, double> p = {})
        : type(t), weight(w), params(std::move(p)) {}

    double param(const std::string& key, double fallback) const;
};

struct StrategyConfig {
    std::string name = "Strategy";
    std::string timeframe = "1d";
    std::vector<IndicatorConfig> indicators;
    double buy_threshold = 0.5;
    double sell_threshold = -0.5;
    double max_position_pct = 0.75;
    double initial_capital = 1000.0;
};

struct AdaptiveConfig {
    StrategyConfig bullish_strategy;
    StrategyConfig bearish_strategy;
    std::optional<StrategyConfig> neutral_strategy;

    // Regime gating
    double regime_confidence_threshold = 0.2;
    double momentum_confirmation_threshold = 0.25;
    int regime_persistence_periods = 2;

    // Risk overlay
    double max_volatility = 0.8;        // regime volatility indicator scale [0, 1]
    double circuit_breaker_win_rate = 0.2;
    int circuit_breaker_lookback = 10;
    int circuit_breaker_min_trades = 5;
    int whipsaw_detection_periods = 5;
    int whipsaw_max_changes = 3;

    // Sizing
    bool dynamic_position_sizing = false;
    double max_bullish_position = 0.95;

    // Portfolio drawdown guard (per session peak)
    bool drawdown_circuit_breaker = false;
    double max_drawdown_threshold = 0.20;

    std::optional<risk::KellyConfig> kelly;
    std::optional<risk::StopLossConfig> stop_loss;
    std::optional<risk::VolatilitySizingConfig> volatility_sizing;

    // Bounded windows kept per session
    std::size_t regimeHistoryCapacity() const;
    std::size_t outcomeHistoryCapacity() const;
};

} // namespace strategy
} // namespace regimetrader
