#pragma once

#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace regimetrader {
namespace core {

class ITradeJournal {
public:
    virtual ~ITradeJournal() = default;

    virtual bool append(const JournalEntry& entry) = 0;
    virtual std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace regimetrader
