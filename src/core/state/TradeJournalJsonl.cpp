#include "core/state/TradeJournalJsonl.h"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "common/Logger.h"

namespace regimetrader {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

JournalEntry JournalEntry::fromTrade(const Trade& trade, const std::string& symbol) {
    JournalEntry entry;
    entry.ts_ms = trade.timestamp;
    if (trade.side == TradeSide::BUY) {
        entry.type = JournalEntryType::POSITION_OPENED;
    } else if (trade.reason == "signal") {
        entry.type = JournalEntryType::POSITION_REDUCED;
    } else {
        entry.type = JournalEntryType::STOP_TRIGGERED;
    }
    entry.symbol = symbol;
    entry.trade_id = trade.id;
    entry.side = trade.side;
    entry.price = trade.price;
    entry.amount = trade.amount;
    entry.fees = trade.fees;
    entry.portfolio_value = trade.portfolio_value;
    entry.pnl = trade.pnl;
    entry.strategy = trade.strategy_name;
    entry.reason = trade.reason;
    return entry;
}

TradeJournalJsonl::TradeJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Journal line skipped ({}): {}", file_path_.string(), e.what());
        }
    }
}

bool TradeJournalJsonl::append(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory create failed: {} - {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = entry.ts_ms;
    line["type"] = toString(entry.type);
    line["symbol"] = entry.symbol;
    line["trade_id"] = entry.trade_id;
    line["side"] = regimetrader::toString(entry.side);
    line["price"] = entry.price;
    line["amount"] = entry.amount;
    line["fees"] = entry.fees;
    line["portfolio_value"] = entry.portfolio_value;
    if (entry.pnl) {
        line["pnl"] = *entry.pnl;
    } else {
        line["pnl"] = nullptr;
    }
    line["strategy"] = entry.strategy;
    line["reason"] = entry.reason;

    out << line.dump() << "\n";
    if (!out.good()) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEntry> TradeJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEntry entry;
        entry.seq = seq;
        entry.ts_ms = line.value("ts_ms", 0LL);
        entry.type = fromString(line.value("type", std::string("POSITION_OPENED")));
        entry.symbol = line.value("symbol", std::string());
        entry.trade_id = line.value("trade_id", std::string());
        entry.side = line.value("side", std::string("BUY")) == "SELL" ? TradeSide::SELL : TradeSide::BUY;
        entry.price = line.value("price", 0.0);
        entry.amount = line.value("amount", 0.0);
        entry.fees = line.value("fees", 0.0);
        entry.portfolio_value = line.value("portfolio_value", 0.0);
        if (line.contains("pnl") && line["pnl"].is_number()) {
            entry.pnl = line["pnl"].get<double>();
        }
        entry.strategy = line.value("strategy", std::string());
        entry.reason = line.value("reason", std::string());
        out.push_back(std::move(entry));
    }

    return out;
}

std::uint64_t TradeJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string TradeJournalJsonl::toString(JournalEntryType type) {
    switch (type) {
        case JournalEntryType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEntryType::POSITION_REDUCED: return "POSITION_REDUCED";
        case JournalEntryType::STOP_TRIGGERED: return "STOP_TRIGGERED";
    }
    return "POSITION_OPENED";
}

JournalEntryType TradeJournalJsonl::fromString(const std::string& value) {
    if (value == "POSITION_REDUCED") return JournalEntryType::POSITION_REDUCED;
    if (value == "STOP_TRIGGERED") return JournalEntryType::STOP_TRIGGERED;
    return JournalEntryType::POSITION_OPENED;
}

} // namespace core
} // namespace regimetrader
