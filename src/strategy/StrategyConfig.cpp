#include "strategy/StrategyConfig.h"

#include <algorithm>
#include <cctype>

namespace regimetrader {
namespace strategy {

std::string toString(IndicatorType type) {
    switch (type) {
        case IndicatorType::SMA: return "sma";
        case IndicatorType::EMA: return "ema";
        case IndicatorType::MACD: return "macd";
        case IndicatorType::RSI: return "rsi";
        case IndicatorType::BOLLINGER: return "bollinger";
    }
    return "sma";
}

std::optional<IndicatorType> parseIndicatorType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sma") return IndicatorType::SMA;
    if (lower == "ema") return IndicatorType::EMA;
    if (lower == "macd") return IndicatorType::MACD;
    if (lower == "rsi") return IndicatorType::RSI;
    if (lower == "bollinger" || lower == "bb") return IndicatorType::BOLLINGER;
    return std::nullopt;
}

double IndicatorConfig::param(const std::string& key, double fallback) const {
    auto it = params.find(key);
    return it != params.end() ? it->second : fallback;
}

std::size_t AdaptiveConfig::regimeHistoryCapacity() const {
    const int widest = std::max({10, regime_persistence_periods, whipsaw_detection_periods});
    return static_cast<std::size_t>(widest);
}

std::size_t AdaptiveConfig::outcomeHistoryCapacity() const {
    return static_cast<std::size_t>(std::max(20, circuit_breaker_lookback));
}

} // namespace strategy
} // namespace regimetrader
