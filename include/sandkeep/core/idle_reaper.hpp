/**
 * @file idle_reaper.hpp
 * @brief Background removal of sessions idle past their TTL
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/session_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace sandkeep {
namespace core {

/**
 * @class IdleReaper
 * @brief Periodically terminates idle sessions
 *
 * A session whose lock is held is executing or provisioning and is skipped
 * for this sweep. Idleness is re-checked under the lock, so a request that
 * touched the session just before the reaper got the lock keeps it alive.
 *
 * **Usage Example**:
 * @code
 * IdleReaper reaper(registry, std::chrono::hours(1), std::chrono::minutes(1));
 * reaper.Start();
 * ...
 * reaper.Stop();   // returns promptly, even mid-interval
 * @endcode
 */
class IdleReaper {
public:
    IdleReaper(SessionRegistry& registry,
               std::chrono::milliseconds ttl,
               std::chrono::milliseconds interval);
    ~IdleReaper();

    IdleReaper(const IdleReaper&) = delete;
    IdleReaper& operator=(const IdleReaper&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running_; }

    /**
     * @brief Run one sweep on the calling thread
     * @return Number of sessions terminated
     */
    std::size_t SweepOnce();

private:
    SessionRegistry& registry_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread worker_;

    void RunLoop();
};

} // namespace core
} // namespace sandkeep
