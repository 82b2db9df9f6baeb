/**
 * @file orphan_recovery.cpp
 * @brief Adoption and cleanup of containers left by a previous run
 *
 * @date 2025
 */

#include "sandkeep/core/orphan_recovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace sandkeep {
namespace core {

nlohmann::json RecoveryReport::ToJson() const {
    return nlohmann::json{
        {"containers_seen", containers_seen},
        {"adopted", adopted},
        {"removed", removed},
        {"failures", failures}
    };
}

OrphanRecovery::OrphanRecovery(SessionRegistry& registry)
    : registry_(registry) {
}

RecoveryReport OrphanRecovery::Run() {
    RecoveryReport report;
    auto& controller = registry_.Controller();

    spdlog::info("Recovering sandboxes from a previous run...");
    auto handles = controller.ListTracked();
    report.containers_seen = handles.size();

    auto remove = [&](const SandboxHandle& handle, const char* reason) {
        spdlog::info("Removing {} container {} ({})", reason, handle.name,
                     handle.container_id.substr(0, 12));
        try {
            controller.Terminate(handle);
            report.removed.push_back(handle.container_id);
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to remove container {}: {}", handle.container_id, e.what());
            report.failures.push_back(handle.container_id + ": " + e.what());
        }
    };

    std::map<std::string, std::vector<SandboxHandle>> by_session;
    for (auto& handle : handles) {
        if (handle.session_key.empty()) {
            remove(handle, "unlabeled");
            continue;
        }
        by_session[handle.session_key].push_back(std::move(handle));
    }

    for (auto& [session_key, group] : by_session) {
        // Newest first
        std::sort(group.begin(), group.end(), [](const SandboxHandle& a, const SandboxHandle& b) {
            if (a.started_at != b.started_at) {
                return a.started_at > b.started_at;
            }
            return a.generation > b.generation;
        });

        for (std::size_t i = 1; i < group.size(); ++i) {
            remove(group[i], "duplicate");
        }

        const auto& survivor = group.front();
        try {
            if (registry_.Adopt(survivor)) {
                report.adopted.push_back(session_key);
            } else {
                spdlog::debug("Session {} already registered, leaving {} alone",
                              session_key, survivor.name);
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to adopt container {}: {}", survivor.container_id, e.what());
            report.failures.push_back(survivor.container_id + ": " + e.what());
        }
    }

    spdlog::info("Recovery complete: {} containers seen, {} adopted, {} removed, {} failures",
                 report.containers_seen, report.adopted.size(),
                 report.removed.size(), report.failures.size());
    return report;
}

} // namespace core
} // namespace sandkeep
