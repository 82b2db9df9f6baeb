/**
 * @file process_runner.hpp
 * @brief Host-side subprocess execution with separated output and deadlines
 *
 * Only used to drive the container runtime CLI. User code never runs through
 * this on the host; it always goes through `docker exec` into a sandbox.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Controls for a single subprocess run
 */
struct ProcessOptions {
    std::string stdin_data;                                ///< Bytes fed to the child's stdin
    std::optional<std::chrono::milliseconds> timeout;      ///< Wall-clock deadline (none = wait forever)
    std::chrono::milliseconds kill_grace{2000};            ///< SIGTERM to SIGKILL delay after deadline
    std::size_t max_output_bytes{4 * 1024 * 1024};         ///< Per-stream capture cap
};

/**
 * @struct ProcessResult
 * @brief Outcome of a subprocess run
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, 128+N when killed by signal N
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Deadline elapsed and the child was signalled
    bool output_truncated{false};           ///< A stream hit max_output_bytes
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime
};

/**
 * @class ProcessRunner
 * @brief fork/exec wrapper with pipe capture
 *
 * Arguments are passed as an argv vector, never through a shell, so nothing
 * needs quoting.
 *
 * @code
 * ProcessOptions options;
 * options.timeout = std::chrono::seconds(5);
 * auto result = ProcessRunner::Run({"docker", "ps", "--all"}, options);
 * @endcode
 */
class ProcessRunner {
public:
    /**
     * @brief Run a program to completion
     * @param argv Program and arguments (argv[0] is looked up on PATH)
     * @param options Stdin, deadline and capture settings
     * @return Captured result. A program that cannot be executed yields
     *         exit code 127 with the reason on stderr.
     * @throws std::runtime_error if pipes or fork cannot be created
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = ProcessOptions{});
};

} // namespace utils
} // namespace sandkeep
