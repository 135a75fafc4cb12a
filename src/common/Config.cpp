#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>

namespace regimetrader {

namespace {
using strategy::IndicatorConfig;
using strategy::IndicatorType;
using strategy::StrategyConfig;

bool inRange(double v, double lo, double hi) {
    return v >= lo && v <= hi;
}

void validateStrategy(const StrategyConfig& s, const std::string& label, ValidationResult& out) {
    if (s.name.empty()) {
        out.errors.push_back(label + " strategy name is required");
    }
    if (s.timeframe.empty()) {
        out.errors.push_back(label + " strategy timeframe is required");
    }
    if (!inRange(s.buy_threshold, -1.0, 1.0)) {
        out.errors.push_back(label + " buy threshold must be between -1 and 1");
    }
    if (!inRange(s.sell_threshold, -1.0, 1.0)) {
        out.errors.push_back(label + " sell threshold must be between -1 and 1");
    }
    if (!inRange(s.max_position_pct, 0.0, 1.0)) {
        out.errors.push_back(label + " max position % must be between 0 and 1");
    }
    if (s.initial_capital <= 0.0) {
        out.errors.push_back(label + " initial capital must be > 0");
    }
    for (const auto& indicator : s.indicators) {
        if (indicator.weight < 0.0) {
            out.errors.push_back(label + " indicator " + strategy::toString(indicator.type) +
                                 " weight must be >= 0");
        }
    }
    if (s.indicators.empty()) {
        out.warnings.push_back(label + " strategy has no indicators and will always hold");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

void Config::reset() {
    engine_ = EngineSettings{};
    transaction_costs_ = execution::TransactionCostConfig{};
    adaptive_ = defaultAdaptiveConfig();
}

void Config::setInitialCapital(double v) {
    engine_.initial_capital = v;
    adaptive_.bullish_strategy.initial_capital = v;
    adaptive_.bearish_strategy.initial_capital = v;
    if (adaptive_.neutral_strategy) {
        adaptive_.neutral_strategy->initial_capital = v;
    }
}

bool Config::load(const std::string& path) {
    const auto config_path = utils::PathUtils::resolveExistingPath(path);
    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {} (using defaults)", config_path.string());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        return loadFromJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Config parse failed: {} - {}", config_path.string(), e.what());
        return false;
    }
}

bool Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        LOG_WARN("Config root is not an object (using defaults)");
        return false;
    }

    try {
        EngineSettings engine = engine_;
        if (j.contains("engine")) {
            const auto& e = j["engine"];
            engine.initial_capital = e.value("initial_capital", engine.initial_capital);
            engine.log_level = e.value("log_level", engine.log_level);
            engine.log_dir = e.value("log_dir", engine.log_dir);
            engine.journal_path = e.value("journal_path", engine.journal_path);
            engine.symbol = e.value("symbol", engine.symbol);
            engine.warmup_bars = e.value("warmup_bars", engine.warmup_bars);
        }

        execution::TransactionCostConfig costs = transaction_costs_;
        if (j.contains("transaction_costs")) {
            costs = parseTransactionCosts(j["transaction_costs"]);
        }

        strategy::AdaptiveConfig adaptive = adaptive_;
        if (j.contains("adaptive")) {
            adaptive = parseAdaptiveConfig(j["adaptive"]);
        }

        const auto validation = validate(engine, adaptive);
        for (const auto& warning : validation.warnings) {
            LOG_WARN("Config warning: {}", warning);
        }
        if (!validation.is_valid) {
            for (const auto& error : validation.errors) {
                LOG_ERROR("Config error: {}", error);
            }
            return false;
        }

        engine_ = engine;
        transaction_costs_ = costs;
        adaptive_ = adaptive;
        LOG_INFO("Config loaded: capital={}, bullish='{}', bearish='{}'",
                 engine_.initial_capital, adaptive_.bullish_strategy.name, adaptive_.bearish_strategy.name);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config section invalid: {}", e.what());
        return false;
    }
}

StrategyConfig Config::parseStrategyConfig(const nlohmann::json& j, const StrategyConfig& defaults) {
    StrategyConfig s = defaults;
    s.name = j.value("name", s.name);
    s.timeframe = j.value("timeframe", s.timeframe);
    s.buy_threshold = j.value("buy_threshold", s.buy_threshold);
    s.sell_threshold = j.value("sell_threshold", s.sell_threshold);
    s.max_position_pct = j.value("max_position_pct", s.max_position_pct);
    s.initial_capital = j.value("initial_capital", s.initial_capital);

    if (j.contains("indicators") && j["indicators"].is_array()) {
        s.indicators.clear();
        for (const auto& item : j["indicators"]) {
            const std::string type_name = item.value("type", std::string());
            auto type = strategy::parseIndicatorType(type_name);
            if (!type) {
                LOG_WARN("Unknown indicator type '{}' in strategy '{}' (skipped)", type_name, s.name);
                continue;
            }

            IndicatorConfig indicator;
            indicator.type = *type;
            indicator.weight = item.value("weight", 1.0);
            if (item.contains("params") && item["params"].is_object()) {
                for (auto it = item["params"].begin(); it != item["params"].end(); ++it) {
                    if (it.value().is_number()) {
                        indicator.params[it.key()] = it.value().get<double>();
                    }
                }
            }
            s.indicators.push_back(indicator);
        }
    }
    return s;
}

execution::TransactionCostConfig Config::parseTransactionCosts(const nlohmann::json& j) {
    execution::TransactionCostConfig c;
    c.enabled = j.value("enabled", c.enabled);
    c.fee_percent = j.value("fee_percent", c.fee_percent);
    c.slippage_percent = j.value("slippage_percent", c.slippage_percent);
    c.dynamic_slippage = j.value("dynamic_slippage", c.dynamic_slippage);
    c.dynamic_slippage_factor = j.value("dynamic_slippage_factor", c.dynamic_slippage_factor);
    return c;
}

strategy::AdaptiveConfig Config::parseAdaptiveConfig(const nlohmann::json& j) {
    strategy::AdaptiveConfig a = defaultAdaptiveConfig();

    if (j.contains("bullish_strategy")) {
        a.bullish_strategy = parseStrategyConfig(j["bullish_strategy"], a.bullish_strategy);
    }
    if (j.contains("bearish_strategy")) {
        a.bearish_strategy = parseStrategyConfig(j["bearish_strategy"], a.bearish_strategy);
    }
    if (j.contains("neutral_strategy") && j["neutral_strategy"].is_object()) {
        a.neutral_strategy = parseStrategyConfig(j["neutral_strategy"], StrategyConfig{});
    }

    a.regime_confidence_threshold = j.value("regime_confidence_threshold", a.regime_confidence_threshold);
    a.momentum_confirmation_threshold = j.value("momentum_confirmation_threshold", a.momentum_confirmation_threshold);
    a.regime_persistence_periods = j.value("regime_persistence_periods", a.regime_persistence_periods);
    a.max_volatility = j.value("max_volatility", a.max_volatility);
    a.circuit_breaker_win_rate = j.value("circuit_breaker_win_rate", a.circuit_breaker_win_rate);
    a.circuit_breaker_lookback = j.value("circuit_breaker_lookback", a.circuit_breaker_lookback);
    a.circuit_breaker_min_trades = j.value("circuit_breaker_min_trades", a.circuit_breaker_min_trades);
    a.whipsaw_detection_periods = j.value("whipsaw_detection_periods", a.whipsaw_detection_periods);
    a.whipsaw_max_changes = j.value("whipsaw_max_changes", a.whipsaw_max_changes);
    a.dynamic_position_sizing = j.value("dynamic_position_sizing", a.dynamic_position_sizing);
    a.max_bullish_position = j.value("max_bullish_position", a.max_bullish_position);
    a.drawdown_circuit_breaker = j.value("drawdown_circuit_breaker", a.drawdown_circuit_breaker);
    a.max_drawdown_threshold = j.value("max_drawdown_threshold", a.max_drawdown_threshold);

    // Absent section = feature disabled
    if (j.contains("kelly") && j["kelly"].is_object()) {
        const auto& k = j["kelly"];
        risk::KellyConfig kelly;
        kelly.enabled = k.value("enabled", kelly.enabled);
        kelly.fractional_multiplier = k.value("fractional_multiplier", kelly.fractional_multiplier);
        kelly.min_trades = k.value("min_trades", kelly.min_trades);
        kelly.lookback_period = k.value("lookback_period", kelly.lookback_period);
        a.kelly = kelly;
    }
    if (j.contains("stop_loss") && j["stop_loss"].is_object()) {
        const auto& s = j["stop_loss"];
        risk::StopLossConfig stop;
        stop.enabled = s.value("enabled", stop.enabled);
        stop.atr_multiplier = s.value("atr_multiplier", stop.atr_multiplier);
        stop.trailing = s.value("trailing", stop.trailing);
        stop.use_ema = s.value("use_ema", stop.use_ema);
        stop.atr_period = s.value("atr_period", stop.atr_period);
        a.stop_loss = stop;
    }
    if (j.contains("volatility_sizing") && j["volatility_sizing"].is_object()) {
        const auto& v = j["volatility_sizing"];
        risk::VolatilitySizingConfig vol;
        vol.enabled = v.value("enabled", true);
        vol.atr_period = v.value("atr_period", vol.atr_period);
        vol.lookback = v.value("lookback", vol.lookback);
        vol.high_volatility_threshold = v.value("high_volatility_threshold", vol.high_volatility_threshold);
        vol.max_position_reduction = v.value("max_position_reduction", vol.max_position_reduction);
        vol.use_ema = v.value("use_ema", vol.use_ema);
        a.volatility_sizing = vol;
    }
    return a;
}

StrategyConfig Config::defaultBullishStrategy() {
    StrategyConfig s;
    s.name = "Bullish-Trend";
    s.timeframe = "1d";
    s.buy_threshold = 0.35;
    s.sell_threshold = -0.3;
    s.max_position_pct = 0.75;
    s.indicators = {
        IndicatorConfig(IndicatorType::EMA, 0.35, {{"period", 20}}),
        IndicatorConfig(IndicatorType::MACD, 0.35, {{"fastPeriod", 12}, {"slowPeriod", 26}, {"signalPeriod", 9}}),
        IndicatorConfig(IndicatorType::RSI, 0.2, {{"period", 14}}),
        IndicatorConfig(IndicatorType::SMA, 0.1, {{"period", 50}}),
    };
    return s;
}

StrategyConfig Config::defaultBearishStrategy() {
    StrategyConfig s;
    s.name = "Bearish-Defensive";
    s.timeframe = "1d";
    s.buy_threshold = 0.8;
    s.sell_threshold = -0.3;
    s.max_position_pct = 0.5;
    s.indicators = {
        IndicatorConfig(IndicatorType::SMA, 0.4, {{"period", 20}}),
        IndicatorConfig(IndicatorType::RSI, 0.3, {{"period", 14}}),
        IndicatorConfig(IndicatorType::BOLLINGER, 0.3, {{"period", 20}, {"stdDev", 2}}),
    };
    return s;
}

strategy::AdaptiveConfig Config::defaultAdaptiveConfig() {
    strategy::AdaptiveConfig a;
    a.bullish_strategy = defaultBullishStrategy();
    a.bearish_strategy = defaultBearishStrategy();
    return a;
}

ValidationResult Config::validate(const strategy::AdaptiveConfig& c) {
    ValidationResult out;

    validateStrategy(c.bullish_strategy, "bullish", out);
    validateStrategy(c.bearish_strategy, "bearish", out);
    if (c.neutral_strategy) {
        validateStrategy(*c.neutral_strategy, "neutral", out);
    }

    if (!inRange(c.regime_confidence_threshold, 0.0, 1.0)) {
        out.errors.push_back("Regime confidence threshold must be between 0 and 1");
    }
    if (!inRange(c.momentum_confirmation_threshold, -1.0, 1.0)) {
        out.errors.push_back("Momentum confirmation threshold must be between -1 and 1");
    }
    if (c.regime_persistence_periods < 1) {
        out.errors.push_back("Regime persistence periods must be >= 1");
    }
    if (!inRange(c.max_bullish_position, 0.0, 1.0)) {
        out.errors.push_back("Max bullish position must be between 0 and 1");
    } else if (c.max_bullish_position > 0.95) {
        out.warnings.push_back("Max bullish position > 95% is very aggressive");
    }
    if (!inRange(c.max_volatility, 0.0, 1.0)) {
        out.errors.push_back("Max volatility must be between 0 and 1");
    }
    if (!inRange(c.circuit_breaker_win_rate, 0.0, 1.0)) {
        out.errors.push_back("Circuit breaker win rate must be between 0 and 1");
    }
    if (c.circuit_breaker_lookback < 1) {
        out.errors.push_back("Circuit breaker lookback must be >= 1");
    }
    if (c.whipsaw_detection_periods < 2 || c.whipsaw_max_changes < 1) {
        out.errors.push_back("Whipsaw detection needs periods >= 2 and max changes >= 1");
    }
    if (!inRange(c.max_drawdown_threshold, 0.0, 1.0)) {
        out.errors.push_back("Max drawdown threshold must be between 0 and 1");
    } else if (c.max_drawdown_threshold > 0.5) {
        out.warnings.push_back("Max drawdown threshold > 50% is very high");
    }

    if (c.kelly) {
        if (!inRange(c.kelly->fractional_multiplier, 0.0, 1.0)) {
            out.errors.push_back("Kelly fractional multiplier must be between 0 and 1");
        } else if (c.kelly->fractional_multiplier > 0.5) {
            out.warnings.push_back("Kelly fractional multiplier > 50% is aggressive");
        }
        if (c.kelly->min_trades < 0) {
            out.errors.push_back("Kelly min trades must be >= 0");
        }
        if (c.kelly->lookback_period < 0) {
            out.errors.push_back("Kelly lookback period must be >= 0");
        }
    }

    if (c.stop_loss) {
        if (c.stop_loss->atr_multiplier < 0.0) {
            out.errors.push_back("Stop loss ATR multiplier must be >= 0");
        } else if (c.stop_loss->atr_multiplier > 5.0) {
            out.warnings.push_back("Stop loss ATR multiplier > 5 is very wide");
        }
        if (c.stop_loss->atr_period < 1) {
            out.errors.push_back("Stop loss ATR period must be >= 1");
        }
    }

    if (c.volatility_sizing) {
        if (!inRange(c.volatility_sizing->max_position_reduction, 0.0, 1.0)) {
            out.errors.push_back("Volatility max position reduction must be between 0 and 1");
        }
        if (!(c.volatility_sizing->high_volatility_threshold > 0.0)) {
            out.errors.push_back("Volatility threshold must be > 0");
        }
    }

    out.is_valid = out.errors.empty();
    return out;
}

ValidationResult Config::validate(const EngineSettings& engine, const strategy::AdaptiveConfig& c) {
    ValidationResult out;
    if (!(engine.initial_capital > 0.0)) {
        out.errors.push_back("Initial capital must be > 0");
    }
    if (engine.warmup_bars < 0) {
        out.errors.push_back("Warmup bars must be >= 0");
    }

    const auto adaptive = validate(c);
    out.errors.insert(out.errors.end(), adaptive.errors.begin(), adaptive.errors.end());
    out.warnings = adaptive.warnings;
    out.is_valid = out.errors.empty();
    return out;
}

} // namespace regimetrader
