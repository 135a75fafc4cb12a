#pragma once

#include <map>
#include <mutex>

#include "core/contracts/ISessionStore.h"

namespace regimetrader {
namespace core {

// In-process store. Sessions are isolated by key and may be driven from different threads.
class SessionStoreMemory : public ISessionStore {
public:
    std::optional<SessionState> get(const std::string& session_key) const override;
    void put(const std::string& session_key, const SessionState& state) override;
    void clear(const std::string& session_key) override;
    void clearAll() override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SessionState> sessions_;
};

} // namespace core
} // namespace regimetrader
