/**
 * @file execution_dispatcher.hpp
 * @brief Runs code requests against a session's sandbox
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/file_identity_map.hpp"
#include "sandkeep/core/session_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One code run
 */
struct ExecutionRequest {
    std::string session_key;                      ///< Internal session key
    std::string code;                             ///< Python source
    std::string lang{"python"};                   ///< py, python or python3
    std::optional<std::chrono::seconds> timeout;  ///< Override, clamped to the configured range
};

/**
 * @struct ExecutionResult
 * @brief Output of a code run plus the artifacts it produced
 */
struct ExecutionResult {
    std::string session_key;
    std::string external_id;                ///< Session id to hand back to the client
    std::uint64_t generation{0};
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool timed_out{false};
    std::chrono::milliseconds duration{0};
    std::vector<FileRecord> files;          ///< New or modified since the run started
};

/**
 * @struct DispatcherOptions
 * @brief Deadlines and output limits
 */
struct DispatcherOptions {
    std::chrono::seconds default_timeout{30};
    std::chrono::seconds max_timeout{300};
    std::size_t max_output_bytes{1024 * 1024};  ///< Per stream, after which output is cut
};

/**
 * @class ExecutionDispatcher
 * @brief Resolve, run, collect artifacts, all under the session lock
 *
 * **Execution Flow**:
 * 1. Resolve the session (provisions on first use)
 * 2. Snapshot the writable area, mark Executing
 * 3. Run the code in the sandbox
 * 4. If the sandbox turned out to be gone: terminate the entry and retry
 *    from step 1 once
 * 5. Mark Ready, register new or modified files, touch the session
 *
 * A deadline hit is a normal result: exit code 124, a timeout notice
 * appended to stderr, the session stays usable.
 */
class ExecutionDispatcher {
public:
    ExecutionDispatcher(SessionRegistry& registry, DispatcherOptions options);

    /**
     * @brief Execute a request
     * @throws ValidationError on an unsupported language or empty code
     * @throws ResourceExhausted, ProvisionError from session resolution
     * @throws SandboxUnavailable if the sandbox vanished twice in a row
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /// Timeout to apply for an optional override
    std::chrono::seconds ClampTimeout(const std::optional<std::chrono::seconds>& requested) const;

    static bool IsSupportedLanguage(const std::string& lang);

    /// Stderr suffix appended when a run hits its deadline
    static std::string TimeoutNotice(std::chrono::seconds timeout);

private:
    SessionRegistry& registry_;
    DispatcherOptions options_;

    ExecutionResult RunLocked(SessionLease& lease,
                              const std::string& code,
                              std::chrono::seconds timeout);
    std::string CapOutput(std::string output) const;
};

} // namespace core
} // namespace sandkeep
