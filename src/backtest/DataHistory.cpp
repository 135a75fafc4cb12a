#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include "common/Logger.h"

namespace regimetrader {
namespace backtest {

namespace {
void sortByTime(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

double numberField(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    throw std::invalid_argument(std::string("missing field ") + long_key);
}
}

bool DataHistory::isValidCandle(const Candle& c) {
    if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
        !std::isfinite(c.close) || !std::isfinite(c.volume)) {
        return false;
    }
    return c.close > 0.0 && c.high >= c.low && c.volume >= 0.0;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // UTF-8 BOM on the first cell
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // 헤더 행
            continue;
        }

        try {
            Candle candle(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                          std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
            if (!isValidCandle(candle)) {
                ++skipped;
                LOG_WARN("Skipping invalid bar: {}", line);
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {} ({} skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return candles;
    }

    if (!j.is_array()) {
        LOG_ERROR("JSON bars must be an array: {}", file_path);
        return candles;
    }

    for (const auto& item : j) {
        try {
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();
            else throw std::invalid_argument("missing field timestamp");

            candle.open = numberField(item, "open", "o");
            candle.high = numberField(item, "high", "h");
            candle.low = numberField(item, "low", "l");
            candle.close = numberField(item, "close", "c");
            candle.volume = numberField(item, "volume", "v");

            if (!isValidCandle(candle)) {
                LOG_WARN("Skipping invalid bar at {}", candle.timestamp);
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing bar: {} - {}", item.dump(), e.what());
        }
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

PriceSeries DataHistory::loadSeries(const std::string& file_path) {
    const std::filesystem::path path(file_path);
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto candles = (ext == ".json") ? loadJSON(file_path) : loadCSV(file_path);
    return PriceSeries(path.stem().string(), std::move(candles));
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              long long start_ms,
                                              long long end_ms) {
    std::vector<Candle> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        if (start_ms > 0 && c.timestamp < start_ms) continue;
        if (end_ms > 0 && c.timestamp > end_ms) continue;
        out.push_back(c);
    }
    return out;
}

} // namespace backtest
} // namespace regimetrader
