/**
 * @file stop_signals.hpp
 * @brief SIGINT/SIGTERM handling for the request loop
 *
 * Handlers are installed without SA_RESTART, so a read blocked on the input
 * stream fails with EINTR instead of resuming, and `RequestLoop::Run` gets
 * to check its stop flag.
 *
 * @date 2025
 */

#pragma once

#include <signal.h>

#include <atomic>

namespace sandkeep {
namespace server {

/**
 * @class StopSignals
 * @brief Installs SIGINT/SIGTERM handlers for its lifetime
 *
 * Only one instance may be alive at a time. The previous handlers are
 * restored on destruction.
 *
 * **Usage Example**:
 * @code
 * std::atomic<bool> stop{false};
 * StopSignals signals(stop, STDIN_FILENO);
 * loop.Run(std::cin, std::cout, &stop);
 * @endcode
 */
class StopSignals {
public:
    /**
     * @param flag Set to true when a signal arrives
     * @param close_fd Descriptor closed by the handler (-1 for none), so a
     *                 read started after the flag check fails as well
     */
    explicit StopSignals(std::atomic<bool>& flag, int close_fd = -1);
    ~StopSignals();

    StopSignals(const StopSignals&) = delete;
    StopSignals& operator=(const StopSignals&) = delete;

    /**
     * @class Blocked
     * @brief Blocks SIGINT/SIGTERM in the calling thread for its scope
     *
     * Threads started inside the scope inherit the mask, which leaves the
     * thread reading requests as the one that receives stop signals.
     */
    class Blocked {
    public:
        Blocked();
        ~Blocked();

        Blocked(const Blocked&) = delete;
        Blocked& operator=(const Blocked&) = delete;

    private:
        sigset_t previous_{};
    };

private:
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};

    static void Handle(int signal);
};

} // namespace server
} // namespace sandkeep
