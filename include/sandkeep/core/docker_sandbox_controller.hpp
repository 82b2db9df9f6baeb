/**
 * @file docker_sandbox_controller.hpp
 * @brief SandboxController backed by the Docker (or Podman) CLI
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/sandbox_controller.hpp"
#include "sandkeep/utils/container_utils.hpp"

#include <string>

namespace sandkeep {
namespace core {

/**
 * @class DockerSandboxController
 * @brief Production sandbox controller
 *
 * Every container gets:
 * - `--network none` unless network access was requested
 * - `--cap-drop ALL` and `no-new-privileges`
 * - memory, CPU and pids ceilings
 * - a single bind mount: the session's own directory
 * - labels `service`, `session`, `external-id` and `generation`
 *
 * Code runs through `exec -i ... timeout -s KILL <n> python3 -c <bootstrap>`
 * with the source on stdin. The bootstrap echoes the value of a trailing
 * bare expression, like an interactive prompt would.
 *
 * **Usage Example**:
 * @code
 * DockerSandboxController controller("sandkeep");
 * SandboxSpec spec;
 * spec.image = "sandkeep-python:latest";
 * spec.mount_source = "/srv/sandkeep/sessions/s1";
 *
 * auto handle = controller.Provision("s1", spec);
 * auto result = controller.RunCommand(handle, "1 + 1", std::chrono::seconds(10));
 * // result.stdout_output == "2\n"
 * controller.Terminate(handle);
 * @endcode
 */
class DockerSandboxController : public SandboxController {
public:
    /**
     * @param service_name Value of the `service` label used to find our containers
     * @param runtime Container CLI to drive
     */
    explicit DockerSandboxController(std::string service_name,
                                     utils::ContainerRuntime runtime = utils::ContainerRuntime::DOCKER);

    SandboxHandle Provision(const std::string& session_key, const SandboxSpec& spec) override;

    CommandResult RunCommand(const SandboxHandle& handle,
                             const std::string& code,
                             std::chrono::seconds timeout) override;

    std::vector<SandboxHandle> ListTracked() override;

    void Terminate(const SandboxHandle& handle) override;

    bool IsAlive(const SandboxHandle& handle) override;

    bool IsRuntimeAvailable() override;

    /// Python program that reads user code from stdin and runs it
    static const char* Bootstrap();

    /// Container configuration for a spec (exposed for inspection in tests)
    utils::ContainerConfig BuildContainerConfig(const std::string& session_key,
                                                const SandboxSpec& spec) const;

    /**
     * @brief Map a finished `docker exec` onto a CommandResult
     *
     * Exit codes 124 and 137 are reported as a timeout (exit 124) only when
     * the run lasted at least `timeout`; a host-side deadline always is.
     */
    static CommandResult ToCommandResult(utils::ContainerExecResult exec,
                                         std::chrono::seconds timeout);

    /// True when a non-zero exit means the container itself is gone or stopped
    static bool IsSandboxGone(utils::ContainerState state);

    /// Convert inspect output into a handle, reading our labels
    static SandboxHandle ToHandle(const utils::ContainerInfo& info);

private:
    std::string service_name_;          ///< `service` label value
    utils::ContainerUtils containers_;  ///< Runtime CLI wrapper
    std::chrono::seconds exec_grace_{5};  ///< Host deadline slack over the in-sandbox one
};

} // namespace core
} // namespace sandkeep
