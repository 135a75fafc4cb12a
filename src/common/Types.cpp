#include "common/Types.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace regimetrader {

namespace {
constexpr double kBalanceEpsilon = 1e-9;
}

Portfolio Portfolio::create(double initial_capital) {
    Portfolio p;
    p.quote_balance = initial_capital;
    p.total_value = initial_capital;
    p.initial_capital = initial_capital;
    return p;
}

void Portfolio::revalue(double price) {
    if (quote_balance < -kBalanceEpsilon || base_balance < -kBalanceEpsilon) {
        throw std::logic_error("portfolio balance went negative: quote=" + std::to_string(quote_balance) +
                               " base=" + std::to_string(base_balance));
    }
    // Dust from repeated partial sells.
    if (quote_balance < 0.0) quote_balance = 0.0;
    if (base_balance < 0.0) base_balance = 0.0;

    total_value = quote_balance + base_balance * price;
    total_return = (initial_capital > 0.0)
        ? ((total_value - initial_capital) / initial_capital) * 100.0
        : 0.0;
    checkInvariant(price);
}

void Portfolio::checkInvariant(double price) const {
    const double expected = quote_balance + base_balance * price;
    const double tolerance = 1e-6 * (std::max)(1.0, std::abs(expected));
    if (!std::isfinite(total_value) || std::abs(total_value - expected) > tolerance) {
        throw std::logic_error("portfolio imbalance: total_value=" + std::to_string(total_value) +
                               " expected=" + std::to_string(expected));
    }
}

std::string toString(TradeSide side) {
    return side == TradeSide::BUY ? "buy" : "sell";
}

std::string toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "buy";
        case SignalAction::SELL: return "sell";
        case SignalAction::HOLD: return "hold";
    }
    return "hold";
}

} // namespace regimetrader
