#include "execution/LotBook.h"

#include <algorithm>

namespace regimetrader {
namespace execution {

namespace {
constexpr double kDust = 1e-12;
}

std::size_t LotBook::open(const std::string& trade_id, double amount, double cost) {
    Lot lot;
    lot.trade_id = trade_id;
    lot.amount = amount;
    lot.remaining = amount;
    lot.cost = cost;
    lot.remaining_cost = cost;
    lots_.push_back(lot);
    return lots_.size() - 1;
}

double LotBook::take(Lot& lot, double amount) {
    const double taken = std::min(amount, lot.remaining);
    if (taken <= 0.0) {
        return 0.0;
    }

    double cost = lot.remaining_cost * (taken / lot.remaining);
    lot.remaining -= taken;
    lot.remaining_cost -= cost;
    if (lot.remaining <= kDust) {
        // Close out rounding residue with the lot
        cost += lot.remaining_cost;
        lot.remaining = 0.0;
        lot.remaining_cost = 0.0;
    }
    return cost;
}

double LotBook::consume(double amount) {
    double cost_basis = 0.0;
    double left = amount;

    for (std::size_t i = head_; i < lots_.size() && left > kDust; ++i) {
        Lot& lot = lots_[i];
        if (lot.remaining <= 0.0) {
            continue;
        }
        const double taken = std::min(left, lot.remaining);
        cost_basis += take(lot, taken);
        left -= taken;
    }

    advanceHead();
    return cost_basis;
}

double LotBook::consumeLot(std::size_t index, double amount) {
    if (index >= lots_.size()) {
        return 0.0;
    }
    const double cost = take(lots_[index], amount);
    advanceHead();
    return cost;
}

double LotBook::remaining(std::size_t index) const {
    return index < lots_.size() ? lots_[index].remaining : 0.0;
}

bool LotBook::isClosed(std::size_t index) const {
    return remaining(index) <= 0.0;
}

double LotBook::openAmount() const {
    double total = 0.0;
    for (std::size_t i = head_; i < lots_.size(); ++i) {
        total += lots_[i].remaining;
    }
    return total;
}

std::size_t LotBook::openLotCount() const {
    std::size_t count = 0;
    for (std::size_t i = head_; i < lots_.size(); ++i) {
        if (lots_[i].remaining > 0.0) {
            count++;
        }
    }
    return count;
}

void LotBook::clear() {
    lots_.clear();
    head_ = 0;
}

void LotBook::advanceHead() {
    while (head_ < lots_.size() && lots_[head_].remaining <= 0.0) {
        head_++;
    }
}

} // namespace execution
} // namespace regimetrader
