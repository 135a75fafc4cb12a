#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "core/state/TradeJournalJsonl.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using namespace regimetrader;

namespace {

struct CliOptions {
    std::string backtest_path;
    std::string config_path = "config/config.json";
    double initial_capital = -1.0;
    bool json_mode = false;
};

void printUsage() {
    std::cerr << "Usage: regimetrader --backtest <bars.csv|bars.json> "
                 "[--config path] [--initial-capital X] [--json]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--backtest" && i + 1 < argc) {
            options.backtest_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--initial-capital" && i + 1 < argc) {
            const std::string value = argv[++i];
            try {
                options.initial_capital = std::stod(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value: " << value << "\n";
                return false;
            }
            if (options.initial_capital <= 0.0) {
                std::cerr << "--initial-capital must be > 0\n";
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !options.backtest_path.empty();
}

nlohmann::json toJson(const backtest::BacktestResult& result) {
    const auto& r = result.results;
    const auto& m = result.risk_metrics;

    nlohmann::json j;
    j["series"] = result.series_id;
    j["bars_evaluated"] = result.bars_evaluated;
    j["results"] = {
        {"initial_capital", r.initial_capital},
        {"final_value", r.final_value},
        {"total_return", r.total_return},
        {"total_return_quote", r.total_return_quote},
        {"trade_count", r.trade_count},
        {"win_count", r.win_count},
        {"loss_count", r.loss_count},
        {"win_rate", r.win_rate},
        {"avg_win", r.avg_win},
        {"avg_loss", r.avg_loss},
        {"profit_factor", r.profit_factor},
        {"largest_win", r.largest_win},
        {"largest_loss", r.largest_loss}
    };
    j["risk_metrics"] = {
        {"sharpe_ratio", m.sharpe_ratio},
        {"sortino_ratio", m.sortino_ratio},
        {"max_drawdown", m.max_drawdown},
        {"max_drawdown_duration", m.max_drawdown_duration},
        {"volatility", m.volatility},
        {"calmar_ratio", m.calmar_ratio},
        {"omega_ratio", m.omega_ratio},
        {"ulcer_index", m.ulcer_index},
        {"win_loss_ratio", m.win_loss_ratio},
        {"expectancy", m.expectancy}
    };
    j["strategy_usage"] = result.strategy_usage;
    j["regime_distribution"] = result.regime_distribution;
    j["gate_activations"] = result.gate_activations;

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        nlohmann::json row = {
            {"id", t.id},
            {"timestamp", t.timestamp},
            {"side", toString(t.side)},
            {"price", t.price},
            {"amount", t.amount},
            {"quote_amount", t.quote_amount},
            {"fees", t.fees},
            {"signal", t.signal},
            {"confidence", t.confidence},
            {"portfolio_value", t.portfolio_value},
            {"strategy", t.strategy_name},
            {"reason", t.reason}
        };
        row["pnl"] = t.pnl ? nlohmann::json(*t.pnl) : nlohmann::json(nullptr);
        j["trades"].push_back(row);
    }
    return j;
}

void printSummary(const backtest::BacktestResult& result) {
    const auto& r = result.results;
    const auto& m = result.risk_metrics;

    std::cout << "\nBacktest result (" << result.series_id << ", "
              << result.bars_evaluated << " bars)\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final value:    " << r.final_value << "\n";
    std::cout << "Total return:   " << r.total_return << "% (" << r.total_return_quote << ")\n";
    std::cout << "Trades:         " << r.trade_count << " (win " << r.win_count
              << " / loss " << r.loss_count << ")\n";
    std::cout << "Win rate:       " << r.win_rate << "%\n";
    std::cout << "Avg win/loss:   " << r.avg_win << " / " << r.avg_loss << "\n";
    std::cout << "Profit factor:  " << std::setprecision(3) << r.profit_factor << "\n";
    std::cout << "Sharpe:         " << m.sharpe_ratio << "\n";
    std::cout << "Sortino:        " << m.sortino_ratio << "\n";
    std::cout << "Max drawdown:   " << std::setprecision(2) << m.max_drawdown << "% ("
              << m.max_drawdown_duration << " days)\n";
    std::cout << "Calmar:         " << std::setprecision(3) << m.calmar_ratio << "\n";
    std::cout << "Ulcer index:    " << m.ulcer_index << "\n";
    std::cout << "Expectancy:     " << std::setprecision(2) << m.expectancy << " /trade\n";

    std::cout << "Strategy usage:";
    for (const auto& [bucket, fraction] : result.strategy_usage) {
        std::cout << " " << bucket << "=" << std::setprecision(1) << (fraction * 100.0) << "%";
    }
    std::cout << "\n";
    if (!result.gate_activations.empty()) {
        std::cout << "Risk gates:";
        for (const auto& [gate, count] : result.gate_activations) {
            std::cout << " " << gate << "=" << count;
        }
        std::cout << "\n";
    }
    std::cout << "---------------------------------------------\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        const bool config_applied = config.load(options.config_path);
        if (options.initial_capital > 0.0) {
            config.setInitialCapital(options.initial_capital);
        }

        const auto& settings = config.getEngineSettings();
        Logger::getInstance().initialize(settings.log_dir);
        Logger::getInstance().setLevel(settings.log_level);
        if (!config_applied) {
            LOG_WARN("Config not applied from {}, running with defaults", options.config_path);
        }

        if (!std::filesystem::exists(options.backtest_path)) {
            std::cerr << "Backtest file not found: " << options.backtest_path << "\n";
            return 1;
        }
        LOG_INFO("Starting backtest with file: {}", options.backtest_path);

        const PriceSeries series = backtest::DataHistory::loadSeries(options.backtest_path);

        std::unique_ptr<core::TradeJournalJsonl> journal;
        backtest::BacktestEngine engine(settings);
        if (!settings.journal_path.empty()) {
            journal = std::make_unique<core::TradeJournalJsonl>(settings.journal_path);
            engine.setJournal(journal.get());
        }

        const auto result = engine.run(series, config.getAdaptiveConfig(), config.getTransactionCosts());

        if (options.json_mode) {
            std::cout << toJson(result).dump() << "\n";
        } else {
            printSummary(result);
        }
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
