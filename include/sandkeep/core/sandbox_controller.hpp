/**
 * @file sandbox_controller.hpp
 * @brief Capability over a container runtime used by the session core
 *
 * The session registry, dispatcher, reaper and recovery never talk to the
 * container runtime directly. They go through SandboxController, which owns
 * every raw container handle. The production implementation drives the
 * Docker CLI (see DockerSandboxController); tests substitute an in-memory
 * controller.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/// Durable label keys written on every sandbox container
constexpr const char* kLabelService = "service";
constexpr const char* kLabelSession = "session";
constexpr const char* kLabelExternalId = "external-id";
constexpr const char* kLabelGeneration = "generation";

/**
 * @struct SandboxSpec
 * @brief Everything needed to create one sandbox
 */
struct SandboxSpec {
    std::string image;                          ///< Image reference
    std::size_t memory_limit_mb{512};           ///< Hard memory ceiling
    double cpu_quota{0.5};                      ///< CPU quota in cores
    int pids_limit{128};                        ///< Process limit inside the sandbox
    bool network_enabled{false};                ///< Bridge network instead of none
    std::filesystem::path mount_source;         ///< Session directory as the daemon sees it
    std::filesystem::path mount_target{"/mnt/data"};  ///< Where it appears in the sandbox
    std::string external_id;                    ///< Session's boundary id (label)
    std::uint64_t generation{0};                ///< Generation number (label)
};

/**
 * @struct SandboxHandle
 * @brief Reference to one container, as provisioned or as found on the daemon
 */
struct SandboxHandle {
    std::string container_id;                   ///< Runtime-assigned id
    std::string name;                           ///< Container name
    std::string session_key;                    ///< Session label (empty if unlabeled)
    std::string external_id;                    ///< External-id label
    std::uint64_t generation{0};                ///< Generation label
    std::chrono::system_clock::time_point started_at;  ///< Last start time
    bool running{false};                        ///< State when the handle was taken
};

/**
 * @struct CommandResult
 * @brief Output of one code run inside a sandbox
 */
struct CommandResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool timed_out{false};                      ///< Deadline elapsed, exit_code is 124
    std::chrono::milliseconds duration{0};
};

/**
 * @class SandboxController
 * @brief Abstract sandbox lifecycle operations
 *
 * Implementations must be safe to call from several threads at once; the
 * registry serializes calls per session but not across sessions.
 */
class SandboxController {
public:
    virtual ~SandboxController() = default;

    /**
     * @brief Create and start a sandbox for a session
     *
     * The container carries the recovery label set, mounts spec.mount_source
     * read-write at spec.mount_target, drops all capabilities and idles until
     * commands are sent.
     *
     * @throws ProvisionError on daemon or image failure
     */
    virtual SandboxHandle Provision(const std::string& session_key, const SandboxSpec& spec) = 0;

    /**
     * @brief Run Python code as a fresh process inside an existing sandbox
     *
     * The code is delivered on stdin and runs with the writable mount as its
     * working directory. A deadline hit yields exit code 124 and
     * timed_out=true; the sandbox itself is left running.
     *
     * @throws SandboxUnavailable if the container is gone or stopped
     */
    virtual CommandResult RunCommand(const SandboxHandle& handle,
                                     const std::string& code,
                                     std::chrono::seconds timeout) = 0;

    /**
     * @brief Enumerate every container (running or not) owned by this service
     */
    virtual std::vector<SandboxHandle> ListTracked() = 0;

    /**
     * @brief Stop and remove a container; an already missing one is success
     * @throws std::runtime_error if the runtime refuses
     */
    virtual void Terminate(const SandboxHandle& handle) = 0;

    virtual bool IsAlive(const SandboxHandle& handle) = 0;

    /// Whether the runtime daemon answers at all
    virtual bool IsRuntimeAvailable() = 0;
};

} // namespace core
} // namespace sandkeep
