#pragma once

#include <optional>
#include <string>

#include "analytics/RegimeDetector.h"
#include "core/model/SessionState.h"

namespace regimetrader {
namespace risk {

// Gate that forced a hold
enum class RiskGate {
    NONE,
    VOLATILITY,
    CIRCUIT_BREAKER,
    WHIPSAW,
    DRAWDOWN
};

std::string toString(RiskGate gate);

class RiskOverlay {
public:
    // true -> block trading
    static bool checkVolatility(const analytics::RegimeSignal& regime, double max_volatility);

    // Win rate over the last `lookback` outcomes; nullopt when nothing is recorded
    static std::optional<double> recentWinRate(const core::SessionState& state, int lookback);

    // true -> block. Inactive until `min_trades` outcomes exist.
    static bool checkCircuitBreaker(const core::SessionState& state, double min_win_rate,
                                    int lookback, int min_trades);

    // Label changes between consecutive entries among the last `periods` entries
    static int countRegimeChanges(const core::SessionState& state, int periods);

    // true -> block when changes >= max_changes
    static bool checkWhipsaw(const core::SessionState& state, int periods, int max_changes);

    // Last `periods` history entries all equal `regime`. periods <= 1 always confirms.
    static bool isRegimePersistent(const core::SessionState& state, analytics::MarketRegime regime,
                                   int periods);

    // Tracks the session peak; true -> block when (peak - value) / peak >= threshold
    static bool checkDrawdown(core::SessionState& state, double current_value, double threshold);
};

} // namespace risk
} // namespace regimetrader
