#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/Types.h"

namespace regimetrader {
namespace core {

enum class JournalEntryType {
    POSITION_OPENED,
    POSITION_REDUCED,
    STOP_TRIGGERED
};

struct JournalEntry {
    std::uint64_t seq = 0;          // assigned by the journal on append
    long long ts_ms = 0;
    JournalEntryType type = JournalEntryType::POSITION_OPENED;
    std::string symbol;
    std::string trade_id;
    TradeSide side = TradeSide::BUY;
    double price = 0.0;
    double amount = 0.0;
    double fees = 0.0;
    double portfolio_value = 0.0;
    std::optional<double> pnl;
    std::string strategy;
    std::string reason;

    static JournalEntry fromTrade(const Trade& trade, const std::string& symbol);
};

} // namespace core
} // namespace regimetrader
