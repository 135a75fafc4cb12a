#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace regimetrader {
namespace execution {

struct Lot {
    std::string trade_id;
    double amount = 0.0;          // base units bought
    double remaining = 0.0;       // base units not yet sold
    double cost = 0.0;            // quote paid including costs
    double remaining_cost = 0.0;
};

// Arena of buy lots in purchase order. Lots are never erased, so indices stay valid;
// head_ skips the fully consumed prefix.
class LotBook {
public:
    // Returns the lot index
    std::size_t open(const std::string& trade_id, double amount, double cost);

    // FIFO consumption across lots; returns the matched cost basis.
    // Amount beyond the open total is matched at zero cost.
    double consume(double amount);

    // Consume from one specific lot (stop exits); returns the matched cost basis
    double consumeLot(std::size_t index, double amount);

    double remaining(std::size_t index) const;
    bool isClosed(std::size_t index) const;
    double openAmount() const;
    std::size_t openLotCount() const;
    const std::vector<Lot>& lots() const { return lots_; }
    void clear();

private:
    double take(Lot& lot, double amount);
    void advanceHead();

    std::vector<Lot> lots_;
    std::size_t head_ = 0;
};

} // namespace execution
} // namespace regimetrader
