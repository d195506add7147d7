#include "splitdeck/core/SessionLifecycle.hpp"

#include <iostream>

namespace sdeck {

std::optional<SessionHandle> SessionTable::instantiate(const ConnectionSpec& spec) {
    if (spec.host.empty()) {
        std::cerr << "SessionTable: Refusing connection without host" << std::endl;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SessionHandle handle;
    handle.id = next_id_++;
    handle.label = spec.protocol + "://" + spec.displayName();
    live_.emplace(handle.id, handle.label);
    return handle;
}

void SessionTable::terminate(const SessionHandle& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_.erase(session.id) == 0) {
        std::cerr << "SessionTable: Terminate of unknown session " << session.id << std::endl;
        return;
    }
    terminated_.insert(session.id);
}

SessionHandle SessionTable::adopt(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionHandle handle;
    handle.id = next_id_++;
    handle.label = label;
    live_.emplace(handle.id, label);
    return handle;
}

bool SessionTable::isLive(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.count(id) > 0;
}

bool SessionTable::wasTerminated(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_.count(id) > 0;
}

std::size_t SessionTable::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

std::size_t SessionTable::terminatedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_.size();
}

}
