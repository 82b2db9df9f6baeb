/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI wrapper
 *
 * Every sandbox is created with the same hardening baseline:
 * - **Network Isolation**: `--network none` unless explicitly enabled
 * - **Capability Dropping**: `--cap-drop ALL`
 * - **No New Privileges**: `--security-opt no-new-privileges`
 * - **Resource Limits**: `--memory`, `--memory-swap`, `--cpus`, `--pids-limit`
 * - **Scoped Storage**: exactly one bind mount, the session's writable area
 *
 * **Container Lifecycle**:
 * ```
 * run -d → exec (repeated) → rm --force
 * ```
 *
 * Commands run inside containers go through `exec -i`, with the payload on
 * stdin rather than the command line, so user code is never interpreted by a
 * host shell and never hits argument length limits.
 *
 * @date 2025
 */

#include "sandkeep/utils/container_utils.hpp"
#include "sandkeep/utils/process_runner.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

using json = nlohmann::json;

namespace sandkeep {
namespace utils {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(ContainerRuntime runtime)
    : runtime_(runtime) {
    spdlog::debug("Container Utils initialized with runtime: {}", GetRuntimeBinary());
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    ExecOptions options;
    options.timeout = std::chrono::seconds(10);
    auto result = ExecuteRuntimeCommand({"info", "--format", "{{json .ServerVersion}}"}, options);
    return result.success;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::optional<std::string> ContainerUtils::CreateContainer(const ContainerConfig& config,
                                                           std::string* error) {
    spdlog::info("Creating container: {}", config.name);

    if (!ValidateConfig(config)) {
        if (error) {
            *error = "invalid container configuration";
        }
        return std::nullopt;
    }

    for (const auto& issue : CheckSecurityIssues(config)) {
        spdlog::warn("  - {}", issue);
    }

    ExecOptions options;
    options.timeout = std::chrono::seconds(120);
    auto result = ExecuteRuntimeCommand(BuildRunCommand(config), options);

    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        // Pull progress may precede the id; the id is the last line
        auto newline = container_id.find_last_of('\n');
        if (newline != std::string::npos) {
            container_id = container_id.substr(newline + 1);
        }
        if (!container_id.empty()) {
            spdlog::info("Container created: {}", container_id.substr(0, 12));
            return container_id;
        }
    }

    const std::string reason = result.timed_out
        ? "runtime did not answer in time"
        : StringUtils::Trim(result.stderr_output);
    spdlog::error("Failed to create container {}: {}", config.name, reason);
    if (error) {
        *error = reason;
    }
    return std::nullopt;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm", "--volumes"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    ExecOptions options;
    options.timeout = std::chrono::seconds(60);
    auto result = ExecuteRuntimeCommand(args, options);

    if (result.success) {
        return true;
    }
    if (IsMissingContainerError(result.stderr_output)) {
        spdlog::debug("Container {} already gone", container_id);
        return true;
    }

    spdlog::error("Failed to remove container: {}", StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

ContainerState ContainerUtils::GetContainerState(const std::string& container_id) {
    ExecOptions options;
    options.timeout = std::chrono::seconds(15);
    auto result = ExecuteRuntimeCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        container_id
    }, options);

    if (result.success) {
        return ParseState(StringUtils::Trim(result.stdout_output));
    }
    if (IsMissingContainerError(result.stderr_output)) {
        return ContainerState::MISSING;
    }
    return ContainerState::UNKNOWN;
}

std::vector<ContainerInfo> ContainerUtils::InspectContainers(
    const std::vector<std::string>& container_ids) {
    if (container_ids.empty()) {
        return {};
    }

    std::vector<std::string> args = {"inspect"};
    args.insert(args.end(), container_ids.begin(), container_ids.end());

    ExecOptions options;
    options.timeout = std::chrono::seconds(30);
    auto result = ExecuteRuntimeCommand(args, options);

    // inspect exits non-zero if any id is gone but still prints the others
    if (StringUtils::Trim(result.stdout_output).empty()) {
        if (!result.success) {
            spdlog::warn("inspect failed: {}", StringUtils::Trim(result.stderr_output));
        }
        return {};
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
    }
    return {};
}

std::vector<std::string> ContainerUtils::ListContainerIds(
    const std::map<std::string, std::string>& labels, bool all) {
    std::vector<std::string> args = {"ps", "--no-trunc", "--format", "{{.ID}}"};
    if (all) {
        args.push_back("--all");
    }
    for (const auto& [key, value] : labels) {
        args.push_back("--filter");
        args.push_back(value.empty() ? "label=" + key : "label=" + key + "=" + value);
    }

    ExecOptions options;
    options.timeout = std::chrono::seconds(30);
    auto result = ExecuteRuntimeCommand(args, options);

    std::vector<std::string> ids;
    if (!result.success) {
        spdlog::error("Failed to list containers: {}", StringUtils::Trim(result.stderr_output));
        return ids;
    }

    std::istringstream stream(result.stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = StringUtils::Trim(line);
        if (!line.empty()) {
            ids.push_back(line);
        }
    }
    return ids;
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteCommand(
    const std::string& container_id,
    const std::vector<std::string>& command,
    const ExecOptions& options) {

    std::vector<std::string> args = {"exec", "-i"};
    if (!options.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(options.working_dir.string());
    }
    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    return ExecuteRuntimeCommand(args, options);
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                                          const ExecOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(GetRuntimeBinary());
    argv.insert(argv.end(), args.begin(), args.end());

    // Never log the stdin payload, it is user code
    spdlog::debug("Executing: {}", StringUtils::Truncate(StringUtils::Join(argv, " "), 512));

    ProcessOptions process_options;
    process_options.stdin_data = options.stdin_data;
    process_options.timeout = options.timeout;
    process_options.max_output_bytes = options.max_output_bytes;

    ContainerExecResult exec_result;
    try {
        auto process_result = ProcessRunner::Run(argv, process_options);
        exec_result.exit_code = process_result.exit_code;
        exec_result.stdout_output = std::move(process_result.stdout_output);
        exec_result.stderr_output = std::move(process_result.stderr_output);
        exec_result.duration = process_result.duration;
        exec_result.timed_out = process_result.timed_out;
        exec_result.success = (process_result.exit_code == 0 && !process_result.timed_out);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to run {}: {}", argv.front(), e.what());
        exec_result.exit_code = -1;
        exec_result.stderr_output = e.what();
        exec_result.success = false;
    }

    return exec_result;
}

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    if (!config.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(config.hostname);
    }

    // Memory limit; swap equal to memory disables swapping past the ceiling
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    if (config.cpu_limit > 0) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.3f", config.cpu_limit);
        args.push_back("--cpus");
        args.push_back(buffer);
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("--network");
            args.push_back("bridge");
            break;
    }

    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    for (const auto& [host_path, container_path] : config.mounts) {
        args.push_back("-v");
        args.push_back(host_path.string() + ":" + container_path.string() + ":rw");
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

std::vector<ContainerInfo> ContainerUtils::ParseInspectOutput(const std::string& json_str) {
    json parsed = json::parse(json_str);
    if (!parsed.is_array()) {
        parsed = json::array({parsed});
    }

    std::vector<ContainerInfo> containers;
    for (const auto& j : parsed) {
        ContainerInfo info;
        info.id = j.value("Id", "");
        info.name = j.value("Name", "");
        if (!info.name.empty() && info.name.front() == '/') {
            info.name.erase(0, 1);
        }

        if (j.contains("Config") && j["Config"].is_object()) {
            const auto& config = j["Config"];
            info.image = config.value("Image", "");
            if (config.contains("Labels") && config["Labels"].is_object()) {
                for (const auto& [key, value] : config["Labels"].items()) {
                    if (value.is_string()) {
                        info.labels[key] = value.get<std::string>();
                    }
                }
            }
        }

        if (j.contains("State") && j["State"].is_object()) {
            const auto& state = j["State"];
            info.state = ParseState(state.value("Status", ""));
            info.exit_code = state.value("ExitCode", 0);
            if (auto started = ParseTimestamp(state.value("StartedAt", ""))) {
                info.started_at = *started;
            }
        }

        if (auto created = ParseTimestamp(j.value("Created", ""))) {
            info.created_at = *created;
        }

        containers.push_back(std::move(info));
    }
    return containers;
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::STOPPED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerUtils::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::STOPPED: return "stopped";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        case ContainerState::MISSING: return "missing";
        default: return "unknown";
    }
}

std::optional<std::chrono::system_clock::time_point> ContainerUtils::ParseTimestamp(
    const std::string& value) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    std::chrono::nanoseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        std::string digits;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (digits.size() < 9) {
                digits.push_back(value[pos]);
            }
            ++pos;
        }
        digits.resize(9, '0');
        fraction = std::chrono::nanoseconds(std::stoll(digits));
    }

    std::chrono::seconds offset{0};
    if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
        int off_hours = 0, off_minutes = 0;
        if (std::sscanf(value.c_str() + pos + 1, "%2d:%2d", &off_hours, &off_minutes) == 2) {
            offset = std::chrono::hours(off_hours) + std::chrono::minutes(off_minutes);
            if (value[pos] == '-') {
                offset = -offset;
            }
        }
    } else if (pos >= value.size() || value[pos] != 'Z') {
        return std::nullopt;
    }

    if (year <= 1) {
        return std::chrono::system_clock::time_point{};
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t seconds = ::timegm(&tm);

    auto point = std::chrono::system_clock::from_time_t(seconds) - offset;
    return point + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

bool ContainerUtils::IsMissingContainerError(const std::string& stderr_output) {
    const auto lower = StringUtils::ToLower(stderr_output);
    return StringUtils::Contains(lower, "no such container") ||
           StringUtils::Contains(lower, "no such object") ||
           StringUtils::Contains(lower, "is not running") ||
           StringUtils::Contains(lower, "no container with name or id");
}

std::string ContainerUtils::GetRuntimeBinary() const {
    switch (runtime_) {
        case ContainerRuntime::PODMAN:
            return "podman";
        case ContainerRuntime::DOCKER:
        default:
            return "docker";
    }
}

bool ContainerUtils::ValidateConfig(const ContainerConfig& config) const {
    if (config.image.empty()) {
        spdlog::error("Container image not specified");
        return false;
    }

    if (config.memory_limit_mb > 0 && config.memory_limit_mb < 64) {
        spdlog::warn("Memory limit very low: {} MB", config.memory_limit_mb);
    }

    if (config.mounts.size() > 1) {
        spdlog::error("Sandbox containers take exactly one writable mount, got {}",
                      config.mounts.size());
        return false;
    }

    return true;
}

std::vector<std::string> ContainerUtils::CheckSecurityIssues(const ContainerConfig& config) const {
    std::vector<std::string> issues;

    if (config.network_mode != NetworkMode::NONE) {
        issues.push_back("WARNING: Network access enabled for sandbox " + config.name);
    }

    if (config.memory_limit_mb == 0) {
        issues.push_back("WARNING: No memory ceiling for sandbox " + config.name);
    }

    if (config.capabilities_drop.empty()) {
        issues.push_back("WARNING: Capabilities not dropped for sandbox " + config.name);
    }

    return issues;
}

} // namespace utils
} // namespace sandkeep
