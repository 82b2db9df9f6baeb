/**
 * @file docker_sandbox_controller.cpp
 * @brief Docker CLI implementation of SandboxController
 *
 * **Execution Path**:
 * ```
 * host: docker exec -i <id> timeout -s KILL <n> python3 -c <bootstrap>
 *   stdin  → user code
 *   stdout ← program output (+ repr of a trailing expression)
 *   stderr ← tracebacks
 * ```
 *
 * Two deadlines apply. `timeout -s KILL` inside the sandbox kills the user
 * process; the host-side deadline (in-sandbox deadline + grace) kills the
 * `docker exec` client if the daemon stops answering. Neither touches the
 * container itself.
 *
 * @date 2025
 */

#include "sandkeep/core/docker_sandbox_controller.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/id_utils.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace sandkeep {
namespace core {

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr int kKilledExitCode = 137;  // 128 + SIGKILL

// Reads the program from stdin, runs it, and echoes a trailing expression
const char* const kBootstrap = R"PY(
import ast, sys
source = sys.stdin.read()
sys.stdin = open('/dev/null')
tree = ast.parse(source, '<cell>', 'exec')
tail = None
if tree.body and isinstance(tree.body[-1], ast.Expr):
    tail = ast.Expression(tree.body.pop().value)
scope = {'__name__': '__main__', '__builtins__': __builtins__}
exec(compile(tree, '<cell>', 'exec'), scope)
if tail is not None:
    value = eval(compile(tail, '<cell>', 'eval'), scope)
    if value is not None:
        print(repr(value))
)PY";

std::uint64_t ParseGeneration(const std::string& value) {
    if (value.empty()) {
        return 0;
    }
    try {
        return std::stoull(value);
    }
    catch (const std::exception&) {
        spdlog::warn("Ignoring malformed generation label: {}", value);
        return 0;
    }
}

std::string LabelOrEmpty(const std::map<std::string, std::string>& labels, const char* key) {
    auto it = labels.find(key);
    return it == labels.end() ? std::string{} : it->second;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerSandboxController::DockerSandboxController(std::string service_name,
                                                 utils::ContainerRuntime runtime)
    : service_name_(std::move(service_name))
    , containers_(runtime) {
    spdlog::debug("Docker sandbox controller ready (service label: {})", service_name_);
}

const char* DockerSandboxController::Bootstrap() {
    return kBootstrap;
}

// ============================================================================
// PROVISIONING
// ============================================================================

utils::ContainerConfig DockerSandboxController::BuildContainerConfig(
    const std::string& session_key, const SandboxSpec& spec) const {

    utils::ContainerConfig config;
    config.name = service_name_ + "_" + utils::StringUtils::Truncate(session_key, 32, "") +
                  "_g" + std::to_string(spec.generation) + "_" +
                  utils::IdUtils::GenerateId(6);
    config.image = spec.image;
    config.memory_limit_mb = spec.memory_limit_mb;
    config.cpu_limit = spec.cpu_quota;
    config.pids_limit = spec.pids_limit;
    config.network_mode = spec.network_enabled ? utils::NetworkMode::BRIDGE
                                               : utils::NetworkMode::NONE;
    config.mounts[spec.mount_source] = spec.mount_target;
    config.working_dir = spec.mount_target;
    config.labels = {
        {kLabelService, service_name_},
        {kLabelSession, session_key},
        {kLabelExternalId, spec.external_id},
        {kLabelGeneration, std::to_string(spec.generation)}
    };
    return config;
}

SandboxHandle DockerSandboxController::Provision(const std::string& session_key,
                                                 const SandboxSpec& spec) {
    auto config = BuildContainerConfig(session_key, spec);
    spdlog::info("Provisioning sandbox {} for session {} (generation {})",
                 config.name, session_key, spec.generation);

    std::string error;
    auto container_id = containers_.CreateContainer(config, &error);
    if (!container_id) {
        // `run -d` leaves a created-but-not-started container behind when start fails
        if (!containers_.RemoveContainer(config.name, true)) {
            spdlog::warn("Could not remove half-created container {}", config.name);
        }
        throw ProvisionError("Failed to start sandbox for session " + session_key + ": " + error);
    }

    SandboxHandle handle;
    handle.container_id = *container_id;
    handle.name = config.name;
    handle.session_key = session_key;
    handle.external_id = spec.external_id;
    handle.generation = spec.generation;
    handle.started_at = std::chrono::system_clock::now();
    handle.running = true;
    return handle;
}

// ============================================================================
// EXECUTION
// ============================================================================

CommandResult DockerSandboxController::RunCommand(const SandboxHandle& handle,
                                                  const std::string& code,
                                                  std::chrono::seconds timeout) {
    utils::ExecOptions options;
    options.stdin_data = code;
    // Working directory is inherited from the container's -w, the session mount
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout + exec_grace_);

    spdlog::debug("Running {} bytes of code in {} (timeout {}s)",
                  code.size(), handle.name, timeout.count());

    auto exec = containers_.ExecuteCommand(handle.container_id, {
        "timeout", "-s", "KILL", std::to_string(timeout.count()),
        "python3", "-c", kBootstrap
    }, options);

    const bool failed = exec.exit_code != 0;
    if (exec.timed_out) {
        spdlog::warn("docker exec in {} exceeded host deadline", handle.name);
    }
    auto result = ToCommandResult(std::move(exec), timeout);

    if (failed && !result.timed_out) {
        // Distinguish a failing program from a sandbox that is no longer there
        auto state = containers_.GetContainerState(handle.container_id);
        if (IsSandboxGone(state)) {
            throw SandboxUnavailable("Sandbox " + handle.name + " is " +
                                     utils::ContainerUtils::StateToString(state));
        }
    }

    return result;
}

CommandResult DockerSandboxController::ToCommandResult(utils::ContainerExecResult exec,
                                                       std::chrono::seconds timeout) {
    CommandResult result;
    result.stdout_output = std::move(exec.stdout_output);
    result.stderr_output = std::move(exec.stderr_output);
    result.exit_code = exec.exit_code;
    result.duration = exec.duration;

    // 124 and 137 count as a timeout only once the deadline has passed
    const bool deadline_passed = exec.duration >= timeout;
    if (exec.timed_out ||
        (deadline_passed &&
         (exec.exit_code == kTimeoutExitCode || exec.exit_code == kKilledExitCode))) {
        result.timed_out = true;
        result.exit_code = kTimeoutExitCode;
    }
    return result;
}

bool DockerSandboxController::IsSandboxGone(utils::ContainerState state) {
    return state != utils::ContainerState::RUNNING &&
           state != utils::ContainerState::UNKNOWN;
}

// ============================================================================
// DISCOVERY AND TEARDOWN
// ============================================================================

std::vector<SandboxHandle> DockerSandboxController::ListTracked() {
    auto ids = containers_.ListContainerIds({{kLabelService, service_name_}}, true);
    std::vector<SandboxHandle> handles;
    for (const auto& info : containers_.InspectContainers(ids)) {
        handles.push_back(ToHandle(info));
    }
    spdlog::debug("Found {} tracked containers", handles.size());
    return handles;
}

SandboxHandle DockerSandboxController::ToHandle(const utils::ContainerInfo& info) {
    SandboxHandle handle;
    handle.container_id = info.id;
    handle.name = info.name;
    handle.session_key = LabelOrEmpty(info.labels, kLabelSession);
    handle.external_id = LabelOrEmpty(info.labels, kLabelExternalId);
    handle.generation = ParseGeneration(LabelOrEmpty(info.labels, kLabelGeneration));
    handle.started_at = info.started_at;
    handle.running = (info.state == utils::ContainerState::RUNNING);
    return handle;
}

void DockerSandboxController::Terminate(const SandboxHandle& handle) {
    spdlog::info("Terminating sandbox {} ({})", handle.name, handle.container_id.substr(0, 12));
    // The idle process ignores SIGTERM as PID 1, so a graceful stop only adds latency
    if (!containers_.RemoveContainer(handle.container_id, true)) {
        throw std::runtime_error("Failed to remove container " + handle.container_id);
    }
}

bool DockerSandboxController::IsAlive(const SandboxHandle& handle) {
    return containers_.GetContainerState(handle.container_id) == utils::ContainerState::RUNNING;
}

bool DockerSandboxController::IsRuntimeAvailable() {
    return containers_.IsRuntimeAvailable();
}

} // namespace core
} // namespace sandkeep
