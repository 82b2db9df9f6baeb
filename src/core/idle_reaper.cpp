/**
 * @file idle_reaper.cpp
 * @brief Background sweep of idle sessions
 *
 * @date 2025
 */

#include "sandkeep/core/idle_reaper.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace sandkeep {
namespace core {

IdleReaper::IdleReaper(SessionRegistry& registry,
                       std::chrono::milliseconds ttl,
                       std::chrono::milliseconds interval)
    : registry_(registry)
    , ttl_(ttl)
    , interval_(interval) {
}

IdleReaper::~IdleReaper() {
    Stop();
}

void IdleReaper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Idle reaper started (ttl {}s, every {}s)",
                 std::chrono::duration_cast<std::chrono::seconds>(ttl_).count(),
                 std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
    worker_ = std::thread([this]() { RunLoop(); });
}

void IdleReaper::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Idle reaper stopped");
}

void IdleReaper::RunLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval_, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }
        try {
            SweepOnce();
        }
        catch (const std::exception& e) {
            spdlog::error("Idle sweep failed: {}", e.what());
        }
    }
}

std::size_t IdleReaper::SweepOnce() {
    std::size_t reaped = 0;

    for (const auto& info : registry_.Snapshot()) {
        if (info.idle <= ttl_) {
            continue;
        }

        auto lease = registry_.TryAcquire(info.key);
        if (!lease) {
            spdlog::debug("Session {} busy, skipping this sweep", info.key);
            continue;
        }
        // Someone may have used it between the snapshot and the lock
        if (lease->Idle() <= ttl_) {
            continue;
        }

        spdlog::info("Reaping idle session {} (generation {})", info.key, info.generation);
        try {
            registry_.Terminate(std::move(*lease));
            ++reaped;
        }
        catch (const std::exception& e) {
            spdlog::error("Error cleaning up session {}: {}", info.key, e.what());
        }
    }

    if (reaped > 0) {
        spdlog::info("Idle sweep removed {} session(s)", reaped);
    }
    return reaped;
}

} // namespace core
} // namespace sandkeep
