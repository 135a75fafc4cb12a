#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace regimetrader {
namespace backtest {

class DataHistory {
public:
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects with long (open/high/...) or short (o/h/...) keys
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks the loader by extension (.json, anything else as CSV); id = file stem
    static PriceSeries loadSeries(const std::string& file_path);

    // Inclusive epoch-ms range; 0 leaves that side open
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            long long start_ms,
                                            long long end_ms);

    static bool isValidCandle(const Candle& candle);
};

} // namespace backtest
} // namespace regimetrader
