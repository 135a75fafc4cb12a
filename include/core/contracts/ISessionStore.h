#pragma once

#include <optional>
#include <string>

#include "core/model/SessionState.h"

namespace regimetrader {
namespace core {

class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    virtual std::optional<SessionState> get(const std::string& session_key) const = 0;
    virtual void put(const std::string& session_key, const SessionState& state) = 0;
    virtual void clear(const std::string& session_key) = 0;
    virtual void clearAll() = 0;

    void recordOutcome(const std::string& session_key, bool is_win, std::size_t capacity) {
        SessionState state = get(session_key).value_or(SessionState{});
        state.recordOutcome(is_win, capacity);
        put(session_key, state);
    }
};

} // namespace core
} // namespace regimetrader
