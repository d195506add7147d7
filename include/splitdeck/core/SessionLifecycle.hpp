#pragma once

/**
 * @file SessionLifecycle.hpp
 * @brief Hooks into the session layer that owns live connections
 *
 * The engine calls instantiate() before placing a session created from a
 * saved connection, and terminate() before a close that discards a
 * session. Evicted or moved sessions are never terminated.
 */

#include "splitdeck/layout/LayoutTypes.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sdeck {

class ISessionLifecycle {
public:
    virtual ~ISessionLifecycle() = default;

    // nullopt when the connection could not be established
    virtual std::optional<SessionHandle> instantiate(const ConnectionSpec& spec) = 0;

    virtual void terminate(const SessionHandle& session) = 0;
};

/**
 * @brief In-process session bookkeeping used by the executable and tests
 *
 * Mints sequential session ids and remembers which ones are live. It does
 * not open any real connection.
 */
class SessionTable : public ISessionLifecycle {
public:
    SessionTable() = default;

    std::optional<SessionHandle> instantiate(const ConnectionSpec& spec) override;

    void terminate(const SessionHandle& session) override;

    // Registers a session that was created outside of instantiate()
    SessionHandle adopt(const std::string& label);

    bool isLive(SessionId id) const;
    bool wasTerminated(SessionId id) const;
    std::size_t liveCount() const;
    std::size_t terminatedCount() const;

private:
    mutable std::mutex mutex_;
    SessionId next_id_{1};
    std::unordered_map<SessionId, std::string> live_;
    std::unordered_set<SessionId> terminated_;
};

}
