/**
 * @file container_utils.hpp
 * @brief Container runtime CLI wrapper
 *
 * Drives the Docker (or Podman) command-line client: create/start/stop/remove
 * containers, exec commands inside them, inspect and list them by label.
 * Every call is a separate CLI invocation through ProcessRunner; nothing here
 * keeps state about containers, the runtime daemon is the source of truth.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @enum ContainerRuntime
 * @brief Supported container runtime CLIs
 */
enum class ContainerRuntime {
    DOCKER,  ///< Docker Engine
    PODMAN   ///< Podman (CLI compatible)
};

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by inspect
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    STOPPED,   ///< Container stopped or being removed
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    MISSING,   ///< Runtime does not know the container
    UNKNOWN    ///< Unknown state (daemon error, unparsable output)
};

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,    ///< No network access
    BRIDGE   ///< Default bridge network
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration for `run -d`
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                          ///< Container name
    std::string image;                         ///< Image reference
    std::string hostname{"sandbox"};           ///< Container hostname
    std::vector<std::string> command{"sleep", "infinity"};  ///< Main process

    // Resource Limits
    std::size_t memory_limit_mb{512};          ///< Hard memory ceiling
    double cpu_limit{0.5};                     ///< CPU quota in cores
    int pids_limit{128};                       ///< Process limit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};
    bool no_new_privileges{true};
    std::string user;                          ///< Empty keeps the image default

    // Filesystem Settings
    std::map<std::filesystem::path, std::filesystem::path> mounts;  ///< host -> container
    std::filesystem::path working_dir{"/mnt/data"};

    // Metadata
    std::map<std::string, std::string> labels;            ///< Durable labels
    std::map<std::string, std::string> environment_vars;
};

/**
 * @struct ContainerInfo
 * @brief Container information parsed from `inspect`
 */
struct ContainerInfo {
    std::string id;
    std::string name;
    std::string image;
    ContainerState state{ContainerState::UNKNOWN};
    std::map<std::string, std::string> labels;

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point started_at;

    int exit_code{0};
};

/**
 * @struct ContainerExecResult
 * @brief Result of a runtime CLI call or of a command run in a container
 */
struct ContainerExecResult {
    int exit_code{0};                       ///< Exit code
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool timed_out{false};                  ///< Host-side deadline hit
    bool success{false};                    ///< exit_code == 0 and not timed out
};

/**
 * @struct ExecOptions
 * @brief Options for running a command inside a container
 */
struct ExecOptions {
    std::string stdin_data;                              ///< Fed to the command's stdin
    std::filesystem::path working_dir;                   ///< In-container cwd (empty = image default)
    std::optional<std::chrono::milliseconds> timeout;    ///< Host-side deadline for the CLI call
    std::size_t max_output_bytes{4 * 1024 * 1024};       ///< Per-stream capture cap
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle management through the runtime CLI
 *
 * **Usage Example**:
 * @code
 * ContainerUtils utils(ContainerRuntime::DOCKER);
 *
 * ContainerConfig config;
 * config.name = "sandkeep_s1_1";
 * config.image = "sandkeep-python:latest";
 * config.labels = {{"service", "sandkeep"}, {"session", "s1"}};
 * config.mounts["/srv/data/s1"] = "/mnt/data";
 *
 * auto id = utils.CreateContainer(config);
 * if (id) {
 *     ExecOptions exec;
 *     exec.stdin_data = "print(2 + 2)";
 *     auto result = utils.ExecuteCommand(*id, {"python3", "-"}, exec);
 *     utils.RemoveContainer(*id, true);
 * }
 * @endcode
 */
class ContainerUtils {
public:
    explicit ContainerUtils(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /**
     * @brief Check if container runtime CLI and daemon are reachable
     * @return true if `<runtime> info` succeeds
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Create and start a detached container
     * @param config Container configuration
     * @param error Receives the runtime's error output on failure
     * @return Container ID, or nullopt on failure
     */
    std::optional<std::string> CreateContainer(const ContainerConfig& config,
                                               std::string* error = nullptr);

    /**
     * @brief Remove container
     * @param container_id Container ID
     * @param force Kill a running container first
     * @return true if removed or already gone
     */
    bool RemoveContainer(const std::string& container_id, bool force = false);

    /**
     * @brief Get container state
     * @return MISSING when the runtime reports no such container
     */
    ContainerState GetContainerState(const std::string& container_id);

    /**
     * @brief Inspect one or more containers
     * @return Info for every container the runtime still knows
     */
    std::vector<ContainerInfo> InspectContainers(const std::vector<std::string>& container_ids);

    /**
     * @brief List container IDs matching all given labels
     * @param labels label -> value filters (empty value matches any value)
     * @param all Include stopped containers
     */
    std::vector<std::string> ListContainerIds(const std::map<std::string, std::string>& labels,
                                              bool all = true);

    /**
     * @brief Execute command in a running container
     * @param container_id Container ID
     * @param command Command and arguments
     * @param options Stdin, working directory and deadline
     */
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       const ExecOptions& options = ExecOptions{});

    ContainerRuntime GetRuntime() const { return runtime_; }

    /**
     * @brief Build the `run -d ...` argument list for a configuration
     */
    static std::vector<std::string> BuildRunCommand(const ContainerConfig& config);

    /**
     * @brief Parse `inspect` JSON (an array of container objects)
     * @throws nlohmann::json::exception on malformed input
     */
    static std::vector<ContainerInfo> ParseInspectOutput(const std::string& json_str);

    static ContainerState ParseState(const std::string& state_str);
    static std::string StateToString(ContainerState state);

    /**
     * @brief Parse an RFC 3339 timestamp as printed by the runtime
     *
     * Accepts "2025-03-01T10:20:30.123456789Z" and numeric offsets. The
     * runtime's zero time ("0001-01-01T00:00:00Z") maps to the epoch.
     */
    static std::optional<std::chrono::system_clock::time_point> ParseTimestamp(
        const std::string& value);

    /**
     * @brief Whether runtime error output means the container does not exist
     */
    static bool IsMissingContainerError(const std::string& stderr_output);

private:
    ContainerRuntime runtime_;  ///< Container runtime

    ContainerExecResult ExecuteRuntimeCommand(
        const std::vector<std::string>& args,
        const ExecOptions& options = ExecOptions{}) const;
    std::string GetRuntimeBinary() const;
    bool ValidateConfig(const ContainerConfig& config) const;
    std::vector<std::string> CheckSecurityIssues(const ContainerConfig& config) const;
};

} // namespace utils
} // namespace sandkeep
