#include "core/state/SessionStoreMemory.h"

namespace regimetrader {
namespace core {

std::optional<SessionState> SessionStoreMemory::get(const std::string& session_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionStoreMemory::put(const std::string& session_key, const SessionState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_key] = state;
}

void SessionStoreMemory::clear(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_key);
}

void SessionStoreMemory::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

std::size_t SessionStoreMemory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace core
} // namespace regimetrader
