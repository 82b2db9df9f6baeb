/**
 * @file config.hpp
 * @brief Service configuration: defaults, JSON file, environment, builder
 *
 * Sources are applied in increasing precedence: built-in defaults, a JSON
 * file, `RCE_*` environment variables, then command-line flags (applied by
 * main through ConfigBuilder).
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/container_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace sandkeep {
namespace core {

/**
 * @struct ServiceConfig
 * @brief Complete configuration of the session manager
 */
struct ServiceConfig {
    // Sandbox Settings
    std::string service_name{"sandkeep"};              ///< `service` label value
    std::string image{"sandkeep-python:latest"};       ///< Sandbox image
    std::size_t memory_limit_mb{512};                  ///< Per-sandbox memory ceiling
    double cpu_quota{0.5};                             ///< Per-sandbox CPU quota (cores)
    int pids_limit{128};                               ///< Per-sandbox process limit
    bool network_enabled{false};                       ///< Give sandboxes a network
    utils::ContainerRuntime runtime{utils::ContainerRuntime::DOCKER};

    // Capacity
    std::size_t max_sessions{10};                      ///< Live sandbox ceiling
    std::size_t max_concurrent_provisions{4};          ///< Parallel container creations
    std::size_t request_workers{8};                    ///< Requests served at once by `serve`

    // Lifetimes
    std::chrono::seconds session_ttl{3600};            ///< Idle time before reaping
    std::chrono::seconds reap_interval{60};            ///< Reaper sweep period
    std::chrono::seconds default_exec_timeout{30};     ///< Deadline when none requested
    std::chrono::seconds max_exec_timeout{300};        ///< Upper clamp for overrides

    // Limits
    std::size_t max_upload_bytes{50 * 1024 * 1024};    ///< Largest accepted upload
    std::size_t max_output_bytes{1024 * 1024};         ///< Per-stream output cap in responses

    // Storage
    std::filesystem::path data_dir_host{"/var/lib/sandkeep/sessions"};  ///< Bind-mount source root (daemon's view)
    std::filesystem::path data_dir_internal;           ///< Same root in this process (empty = host dir)
    std::filesystem::path sandbox_mount_path{"/mnt/data"};  ///< Mount point inside sandboxes

    // Boundary
    std::string public_base_url{"http://localhost:8000"};  ///< Prefix of download URLs
    std::string api_key;                               ///< Shared request key (empty = no check)

    /// Directory this process uses to reach session data
    std::filesystem::path InternalDataDir() const {
        return data_dir_internal.empty() ? data_dir_host : data_dir_internal;
    }
};

/**
 * @class ConfigLoader
 * @brief Reads configuration sources into a ServiceConfig
 */
class ConfigLoader {
public:
    /// Environment lookup; returns nullopt when a variable is unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Overlay a JSON file onto a configuration
     * @throws ValidationError if the file is unreadable or malformed
     */
    static void ApplyJsonFile(const std::filesystem::path& path, ServiceConfig& config);

    /**
     * @brief Overlay a parsed JSON object; unknown keys are ignored
     *
     * Durations are given in seconds (`session_ttl_seconds`, ...).
     *
     * @throws ValidationError on a value of the wrong type
     */
    static void ApplyJson(const nlohmann::json& j, ServiceConfig& config);

    /**
     * @brief Overlay `RCE_*` and `CUSTOM_RCE_API_KEY` environment variables
     * @param lookup Variable source (process environment when empty)
     * @throws ValidationError on an unparsable number or boolean
     */
    static void ApplyEnvironment(ServiceConfig& config, const EnvLookup& lookup = EnvLookup{});

    /**
     * @brief Reject inconsistent settings
     * @throws ValidationError naming the first offending setting
     */
    static void Validate(const ServiceConfig& config);

    /// Effective configuration as JSON, with the API key redacted
    static nlohmann::json ToJson(const ServiceConfig& config);
};

/**
 * @class ConfigBuilder
 * @brief Fluent construction of a ServiceConfig
 *
 * **Usage Example**:
 * @code
 * auto config = ConfigBuilder()
 *     .WithImage("sandkeep-python:3.12")
 *     .WithMemoryLimit(1024)
 *     .WithMaxSessions(20)
 *     .WithSessionTtl(std::chrono::minutes(30))
 *     .WithDataDirs("/srv/sandkeep", "/data")
 *     .Build();
 * @endcode
 */
class ConfigBuilder {
public:
    ConfigBuilder() = default;
    explicit ConfigBuilder(ServiceConfig base) : config_(std::move(base)) {}

    ConfigBuilder& WithServiceName(const std::string& name) {
        config_.service_name = name;
        return *this;
    }

    ConfigBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    /**
     * @brief Set memory limit
     * @param mb Memory limit in megabytes
     */
    ConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.memory_limit_mb = mb;
        return *this;
    }

    ConfigBuilder& WithCpuQuota(double cores) {
        config_.cpu_quota = cores;
        return *this;
    }

    ConfigBuilder& WithNetwork(bool enabled = true) {
        config_.network_enabled = enabled;
        return *this;
    }

    ConfigBuilder& WithRuntime(utils::ContainerRuntime runtime) {
        config_.runtime = runtime;
        return *this;
    }

    ConfigBuilder& WithMaxSessions(std::size_t count) {
        config_.max_sessions = count;
        return *this;
    }

    ConfigBuilder& WithMaxConcurrentProvisions(std::size_t count) {
        config_.max_concurrent_provisions = count;
        return *this;
    }

    /**
     * @brief Set idle TTL
     * @param ttl Idle time after which a session is reaped
     */
    ConfigBuilder& WithSessionTtl(std::chrono::seconds ttl) {
        config_.session_ttl = ttl;
        return *this;
    }

    ConfigBuilder& WithReapInterval(std::chrono::seconds interval) {
        config_.reap_interval = interval;
        return *this;
    }

    ConfigBuilder& WithExecTimeouts(std::chrono::seconds default_timeout,
                                    std::chrono::seconds max_timeout) {
        config_.default_exec_timeout = default_timeout;
        config_.max_exec_timeout = max_timeout;
        return *this;
    }

    ConfigBuilder& WithMaxUploadBytes(std::size_t bytes) {
        config_.max_upload_bytes = bytes;
        return *this;
    }

    /**
     * @brief Set session storage roots
     * @param host Root as the container daemon sees it (bind-mount source)
     * @param internal Same root as this process sees it (empty = host)
     */
    ConfigBuilder& WithDataDirs(const std::filesystem::path& host,
                                const std::filesystem::path& internal = {}) {
        config_.data_dir_host = host;
        config_.data_dir_internal = internal;
        return *this;
    }

    ConfigBuilder& WithPublicBaseUrl(const std::string& url) {
        config_.public_base_url = url;
        return *this;
    }

    ConfigBuilder& WithApiKey(const std::string& key) {
        config_.api_key = key;
        return *this;
    }

    ServiceConfig Build() const {
        return config_;
    }

private:
    ServiceConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace sandkeep
