/**
 * @file orphan_recovery.hpp
 * @brief Startup reconciliation of labelled containers with an empty registry
 *
 * Container labels are the only durable state. On startup every container
 * carrying this service's label is either adopted back into the registry or
 * removed; nothing new is created.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/session_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @struct RecoveryReport
 * @brief What a recovery pass did
 */
struct RecoveryReport {
    std::vector<std::string> adopted;            ///< Session keys adopted
    std::vector<std::string> removed;            ///< Container ids removed (duplicates, unlabeled)
    std::vector<std::string> failures;           ///< Per-item error messages
    std::size_t containers_seen{0};

    nlohmann::json ToJson() const;
};

/**
 * @class OrphanRecovery
 * @brief One-shot recovery procedure
 *
 * **Algorithm**:
 * 1. List every container labelled `service=<name>` (running or not)
 * 2. Containers without a session label: remove
 * 3. Group the rest by session label; in each group keep the most recently
 *    started container (ties broken by generation) and remove the others
 * 4. Adopt each survivor as a Ready session, external id and generation
 *    taken from its labels
 *
 * A stopped survivor is adopted as well; the first request against it finds
 * it not running and replaces it with a fresh generation.
 *
 * Per-item daemon errors are logged and recorded, never fatal.
 */
class OrphanRecovery {
public:
    explicit OrphanRecovery(SessionRegistry& registry);

    /**
     * @brief Run recovery; must complete before the registry takes traffic
     * @throws std::runtime_error only if listing containers fails outright
     */
    RecoveryReport Run();

private:
    SessionRegistry& registry_;
};

} // namespace core
} // namespace sandkeep
