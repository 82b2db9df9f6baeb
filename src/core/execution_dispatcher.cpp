/**
 * @file execution_dispatcher.cpp
 * @brief Code execution against session sandboxes
 *
 * @date 2025
 */

#include "sandkeep/core/execution_dispatcher.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/mime_types.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

namespace sandkeep {
namespace core {

using utils::StringUtils;

ExecutionDispatcher::ExecutionDispatcher(SessionRegistry& registry, DispatcherOptions options)
    : registry_(registry)
    , options_(std::move(options)) {
}

bool ExecutionDispatcher::IsSupportedLanguage(const std::string& lang) {
    const auto normalized = StringUtils::ToLower(StringUtils::Trim(lang));
    return normalized == "py" || normalized == "python" || normalized == "python3";
}

std::chrono::seconds ExecutionDispatcher::ClampTimeout(
    const std::optional<std::chrono::seconds>& requested) const {
    const auto timeout = requested.value_or(options_.default_timeout);
    return std::clamp(timeout, std::chrono::seconds(1), options_.max_timeout);
}

std::string ExecutionDispatcher::TimeoutNotice(std::chrono::seconds timeout) {
    return "\nExecutionTimeout: execution exceeded " + std::to_string(timeout.count()) +
           "s and was terminated\n";
}

std::string ExecutionDispatcher::CapOutput(std::string output) const {
    if (output.size() <= options_.max_output_bytes) {
        return output;
    }
    const auto dropped = output.size() - options_.max_output_bytes;
    output.resize(options_.max_output_bytes);
    output += "\n[output truncated, " + std::to_string(dropped) + " bytes omitted]\n";
    return output;
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult ExecutionDispatcher::Execute(const ExecutionRequest& request) {
    if (!IsSupportedLanguage(request.lang)) {
        throw ValidationError("Unsupported language: '" + request.lang + "'");
    }
    if (StringUtils::Trim(request.code).empty()) {
        throw ValidationError("code must not be empty");
    }

    const auto timeout = ClampTimeout(request.timeout);

    for (int attempt = 0;; ++attempt) {
        auto lease = registry_.Resolve(request.session_key);
        try {
            return RunLocked(lease, request.code, timeout);
        }
        catch (const SandboxUnavailable& e) {
            if (attempt > 0) {
                spdlog::error("Sandbox for session {} unavailable after retry: {}",
                              request.session_key, e.what());
                throw;
            }
            spdlog::warn("Sandbox for session {} unavailable ({}), recreating",
                         request.session_key, e.what());
            try {
                registry_.Terminate(std::move(lease));
            }
            catch (const std::exception& cleanup) {
                spdlog::error("Error cleaning up session {}: {}",
                              request.session_key, cleanup.what());
            }
        }
    }
}

ExecutionResult ExecutionDispatcher::RunLocked(SessionLease& lease,
                                               const std::string& code,
                                               std::chrono::seconds timeout) {
    auto& workspace = registry_.Workspace();
    const auto before = workspace.Scan(lease.Key());

    spdlog::info("Executing in session {} (generation {}, timeout {}s)",
                 lease.Key(), lease.Generation(), timeout.count());

    lease.MarkExecuting();
    CommandResult command;
    try {
        command = registry_.Controller().RunCommand(lease.Handle(), code, timeout);
    }
    catch (...) {
        lease.MarkReady();
        throw;
    }
    lease.MarkReady();

    ExecutionResult result;
    result.session_key = lease.Key();
    result.external_id = lease.ExternalId();
    result.generation = lease.Generation();
    result.exit_code = command.exit_code;
    result.timed_out = command.timed_out;
    result.duration = command.duration;
    result.stdout_output = CapOutput(std::move(command.stdout_output));
    result.stderr_output = CapOutput(std::move(command.stderr_output));

    if (result.timed_out) {
        spdlog::warn("Execution in session {} timed out after {}s", lease.Key(), timeout.count());
        result.exit_code = 124;
        result.stderr_output += TimeoutNotice(timeout);
    }

    // Artifacts: whatever appeared or changed while the code ran
    const auto after = workspace.Scan(lease.Key());
    auto& files = lease.Files();
    std::set<std::filesystem::path> existing;
    for (const auto& [path, stamp] : after) {
        existing.insert(path);
    }
    files.Prune(existing);

    for (const auto& path : SessionWorkspace::Changed(before, after)) {
        if (!SessionWorkspace::IsVisible(path)) {
            continue;
        }
        const auto id = files.Register(path, utils::MimeTypes::Guess(path));
        result.files.push_back(files.Resolve(lease.Key(), id));
    }

    lease.Touch();
    spdlog::info("Execution in session {} finished: exit {}, {} ms, {} new files",
                 lease.Key(), result.exit_code, result.duration.count(), result.files.size());
    return result;
}

} // namespace core
} // namespace sandkeep
