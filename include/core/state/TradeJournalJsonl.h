#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/ITradeJournal.h"

namespace regimetrader {
namespace core {

// One JSON object per line; seq continues from the last line already on disk.
class TradeJournalJsonl : public ITradeJournal {
public:
    explicit TradeJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEntry& entry) override;
    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static std::string toString(JournalEntryType type);
    static JournalEntryType fromString(const std::string& value);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace regimetrader
