/**
 * @file stop_signals.cpp
 * @brief SIGINT/SIGTERM handler installation
 *
 * @date 2025
 */

#include "sandkeep/server/stop_signals.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace sandkeep {
namespace server {

namespace {

std::atomic<std::atomic<bool>*> g_flag{nullptr};
std::atomic<int> g_close_fd{-1};

[[noreturn]] void Fail(const char* signal_name) {
    const std::string reason = std::strerror(errno);
    g_flag.store(nullptr);
    g_close_fd.store(-1);
    throw std::runtime_error(std::string("Failed to install ") + signal_name +
                             " handler: " + reason);
}

} // anonymous namespace

void StopSignals::Handle(int) {
    if (auto* flag = g_flag.load()) {
        flag->store(true);
    }
    const int fd = g_close_fd.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

StopSignals::StopSignals(std::atomic<bool>& flag, int close_fd) {
    g_flag.store(&flag);
    g_close_fd.store(close_fd);

    struct sigaction action {};
    action.sa_handler = &StopSignals::Handle;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;   // no SA_RESTART: blocked reads return EINTR

    if (::sigaction(SIGINT, &action, &previous_int_) != 0) {
        Fail("SIGINT");
    }
    if (::sigaction(SIGTERM, &action, &previous_term_) != 0) {
        ::sigaction(SIGINT, &previous_int_, nullptr);
        Fail("SIGTERM");
    }
    spdlog::debug("SIGINT/SIGTERM handlers installed");
}

StopSignals::~StopSignals() {
    ::sigaction(SIGINT, &previous_int_, nullptr);
    ::sigaction(SIGTERM, &previous_term_, nullptr);
    g_flag.store(nullptr);
    g_close_fd.store(-1);
}

// ============================================================================
// THREAD MASK
// ============================================================================

StopSignals::Blocked::Blocked() {
    sigset_t stop_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    const int rc = ::pthread_sigmask(SIG_BLOCK, &stop_set, &previous_);
    if (rc != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
}

StopSignals::Blocked::~Blocked() {
    ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

} // namespace server
} // namespace sandkeep
