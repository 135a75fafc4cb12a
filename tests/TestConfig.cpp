#include "common/Config.h"
#include "TestSupport.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace regimetrader;
using testing::near;

static nlohmann::json sampleJson() {
    return nlohmann::json::parse(R"({
        "engine": { "initial_capital": 5000, "log_level": "debug", "symbol": "BTC-USDC", "warmup_bars": 60 },
        "transaction_costs": { "enabled": true, "fee_percent": 0.2, "slippage_percent": 0.1 },
        "adaptive": {
            "bullish_strategy": {
                "name": "Bull",
                "buy_threshold": 0.4,
                "sell_threshold": -0.2,
                "max_position_pct": 0.8,
                "indicators": [
                    { "type": "EMA", "weight": 0.6, "params": { "period": 12 } },
                    { "type": "macd", "weight": 0.4, "params": { "fastPeriod": 8, "slowPeriod": 21, "signalPeriod": 5 } },
                    { "type": "stochastic", "weight": 1.0 }
                ]
            },
            "bearish_strategy": {
                "name": "Bear",
                "indicators": [ { "type": "bb", "weight": 1.0, "params": { "period": 20, "stdDev": 2.5 } } ]
            },
            "regime_persistence_periods": 3,
            "circuit_breaker_min_trades": 7,
            "kelly": { "fractional_multiplier": 0.3 },
            "stop_loss": { "atr_multiplier": 3.0, "trailing": false }
        }
    })");
}

static void testDefaultsAreValid() {
    const auto defaults = Config::defaultAdaptiveConfig();
    const auto result = Config::validate(defaults);
    assert(result.is_valid);
    assert(result.errors.empty());
    assert(!defaults.kelly.has_value());
    assert(!defaults.stop_loss.has_value());
    assert(!defaults.neutral_strategy.has_value());
}

static void testParseAdaptive() {
    const auto j = sampleJson();
    const auto adaptive = Config::parseAdaptiveConfig(j["adaptive"]);

    assert(adaptive.bullish_strategy.name == "Bull");
    assert(near(adaptive.bullish_strategy.buy_threshold, 0.4));
    assert(near(adaptive.bullish_strategy.max_position_pct, 0.8));
    // Unknown indicator type is skipped
    assert(adaptive.bullish_strategy.indicators.size() == 2);
    assert(adaptive.bullish_strategy.indicators[0].type == strategy::IndicatorType::EMA);
    assert(near(adaptive.bullish_strategy.indicators[0].param("period", 0), 12.0));
    assert(near(adaptive.bullish_strategy.indicators[1].param("slowPeriod", 0), 21.0));

    assert(adaptive.bearish_strategy.name == "Bear");
    assert(adaptive.bearish_strategy.indicators.size() == 1);
    assert(adaptive.bearish_strategy.indicators[0].type == strategy::IndicatorType::BOLLINGER);
    // Missing fields keep the built-in bearish defaults
    assert(near(adaptive.bearish_strategy.buy_threshold, Config::defaultBearishStrategy().buy_threshold));

    assert(adaptive.regime_persistence_periods == 3);
    assert(adaptive.circuit_breaker_min_trades == 7);
    assert(near(adaptive.max_volatility, 0.8));
    assert(adaptive.kelly.has_value());
    assert(near(adaptive.kelly->fractional_multiplier, 0.3));
    assert(adaptive.kelly->min_trades == 10);
    assert(adaptive.stop_loss.has_value());
    assert(near(adaptive.stop_loss->atr_multiplier, 3.0));
    assert(!adaptive.stop_loss->trailing);
    assert(!adaptive.volatility_sizing.has_value());
}

static void testValidateRejectsBadRanges() {
    auto config = Config::defaultAdaptiveConfig();
    config.regime_confidence_threshold = 1.5;
    config.max_bullish_position = 0.98;
    config.bullish_strategy.indicators[0].weight = -1.0;
    risk::KellyConfig kelly;
    kelly.fractional_multiplier = 0.75;
    config.kelly = kelly;

    const auto result = Config::validate(config);
    assert(!result.is_valid);
    assert(result.errors.size() == 2);
    // Aggressive but legal settings only warn
    assert(result.warnings.size() >= 2);

    auto drawdown = Config::defaultAdaptiveConfig();
    drawdown.max_drawdown_threshold = 1.5;
    assert(!Config::validate(drawdown).is_valid);
}

static void testValidateEngineAndSizing() {
    const auto adaptive = Config::defaultAdaptiveConfig();
    EngineSettings engine;
    assert(Config::validate(engine, adaptive).is_valid);

    engine.initial_capital = 0.0;
    engine.warmup_bars = -1;
    const auto result = Config::validate(engine, adaptive);
    assert(!result.is_valid);
    assert(result.errors.size() == 2);

    auto sizing = Config::defaultAdaptiveConfig();
    risk::VolatilitySizingConfig volatility;
    volatility.high_volatility_threshold = 0.0;
    sizing.volatility_sizing = volatility;
    assert(!Config::validate(sizing).is_valid);

    // Rejected documents keep the previous settings
    auto& config = Config::getInstance();
    config.reset();
    auto negative = sampleJson();
    negative["engine"]["initial_capital"] = -100;
    assert(!config.loadFromJson(negative));
    assert(near(config.getInitialCapital(), 1000.0));

    auto threshold = sampleJson();
    threshold["adaptive"]["volatility_sizing"] = { {"high_volatility_threshold", 0.0} };
    assert(!config.loadFromJson(threshold));
    assert(!config.getAdaptiveConfig().volatility_sizing.has_value());
    config.reset();
}

static void testLoadFromJson() {
    auto& config = Config::getInstance();
    config.reset();

    assert(config.loadFromJson(sampleJson()));
    assert(near(config.getInitialCapital(), 5000.0));
    assert(config.getLogLevel() == "debug");
    assert(config.getEngineSettings().symbol == "BTC-USDC");
    assert(config.getEngineSettings().warmup_bars == 60);
    assert(near(config.getTransactionCosts().fee_percent, 0.2));
    assert(config.getAdaptiveConfig().bullish_strategy.name == "Bull");

    config.setInitialCapital(2500.0);
    assert(near(config.getAdaptiveConfig().bullish_strategy.initial_capital, 2500.0));

    // Invalid file content leaves the previous configuration in place
    auto bad = sampleJson();
    bad["adaptive"]["regime_confidence_threshold"] = 3.0;
    assert(!config.loadFromJson(bad));
    assert(config.getAdaptiveConfig().bullish_strategy.name == "Bull");

    config.reset();
    assert(near(config.getInitialCapital(), 1000.0));
}

static void testLoadFromFile() {
    auto& config = Config::getInstance();
    config.reset();

    const auto path = std::filesystem::temp_directory_path() / "regimetrader_test_config.json";
    {
        std::ofstream out(path);
        out << sampleJson().dump(2);
    }
    assert(config.load(path.string()));
    assert(config.getEngineSettings().symbol == "BTC-USDC");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    assert(!config.load(path.string()));

    std::error_code ec;
    std::filesystem::remove(path, ec);
    assert(!config.load(path.string()));
    config.reset();
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    testDefaultsAreValid();
    testParseAdaptive();
    testValidateRejectsBadRanges();
    testValidateEngineAndSizing();
    testLoadFromJson();
    testLoadFromFile();

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
