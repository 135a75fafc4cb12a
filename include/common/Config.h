#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "execution/TradeExecutor.h"
#include "strategy/StrategyConfig.h"

namespace regimetrader {

struct EngineSettings {
    double initial_capital = 1000.0;
    std::string log_level = "info";
    std::string log_dir = "logs";
    std::string journal_path;       // empty -> no trade journal
    std::string symbol = "ETH-USDC";
    int warmup_bars = 50;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class Config {
public:
    static Config& getInstance();

    // Missing/unreadable/malformed file keeps defaults. Returns true if the file was applied.
    bool load(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& j);

    const EngineSettings& getEngineSettings() const { return engine_; }
    const execution::TransactionCostConfig& getTransactionCosts() const { return transaction_costs_; }
    const strategy::AdaptiveConfig& getAdaptiveConfig() const { return adaptive_; }

    double getInitialCapital() const { return engine_.initial_capital; }
    void setInitialCapital(double v);
    std::string getLogLevel() const { return engine_.log_level; }

    // Restore built-in defaults
    void reset();

    static strategy::StrategyConfig parseStrategyConfig(const nlohmann::json& j,
                                                        const strategy::StrategyConfig& defaults);
    static strategy::AdaptiveConfig parseAdaptiveConfig(const nlohmann::json& j);
    static execution::TransactionCostConfig parseTransactionCosts(const nlohmann::json& j);

    static strategy::StrategyConfig defaultBullishStrategy();
    static strategy::StrategyConfig defaultBearishStrategy();
    static strategy::AdaptiveConfig defaultAdaptiveConfig();

    static ValidationResult validate(const strategy::AdaptiveConfig& config);
    // Engine errors first, then the adaptive section
    static ValidationResult validate(const EngineSettings& engine, const strategy::AdaptiveConfig& config);

private:
    Config();

    EngineSettings engine_;
    execution::TransactionCostConfig transaction_costs_;
    strategy::AdaptiveConfig adaptive_;
};

} // namespace regimetrader
