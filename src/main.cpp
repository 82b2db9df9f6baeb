/**
 * @file main.cpp
 * @brief Sandkeep session manager - Command-line interface
 *
 * Entry point for the sandkeep service. `serve` answers JSON-lines requests
 * on stdin/stdout while the idle reaper runs in the background; `recover`
 * and `sessions` are operator tools for the containers a previous run left
 * behind.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sandkeep/core/config.hpp"
#include "sandkeep/core/docker_sandbox_controller.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/core/execution_dispatcher.hpp"
#include "sandkeep/core/idle_reaper.hpp"
#include "sandkeep/core/orphan_recovery.hpp"
#include "sandkeep/core/session_registry.hpp"
#include "sandkeep/core/session_service.hpp"
#include "sandkeep/core/session_workspace.hpp"
#include "sandkeep/server/request_loop.hpp"
#include "sandkeep/server/stop_signals.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace sandkeep;

namespace {

std::atomic<bool> g_stop_requested{false};


/*******************************************************************************
 * Logging
 ******************************************************************************/

// stdout carries responses, so every log line goes to stderr (and the file)
void ConfigureLogging(bool verbose, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 10 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>("sandkeep", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

/*******************************************************************************
 * Service Wiring
 ******************************************************************************/

/**
 * @struct Components
 * @brief Everything a subcommand needs, built from one configuration
 */
struct Components {
    explicit Components(const core::ServiceConfig& config)
        : controller(config.service_name, config.runtime)
        , workspace(config.data_dir_host, config.data_dir_internal, config.sandbox_mount_path)
        , registry(controller, workspace, RegistryOptionsFor(config))
        , dispatcher(registry, DispatcherOptionsFor(config))
        , service(registry, dispatcher, ServiceOptionsFor(config)) {
    }

    core::DockerSandboxController controller;
    core::SessionWorkspace workspace;
    core::SessionRegistry registry;
    core::ExecutionDispatcher dispatcher;
    core::SessionService service;

private:
    static core::RegistryOptions RegistryOptionsFor(const core::ServiceConfig& config) {
        core::RegistryOptions options;
        options.max_sessions = config.max_sessions;
        options.max_concurrent_provisions = config.max_concurrent_provisions;
        options.sandbox.image = config.image;
        options.sandbox.memory_limit_mb = config.memory_limit_mb;
        options.sandbox.cpu_quota = config.cpu_quota;
        options.sandbox.pids_limit = config.pids_limit;
        options.sandbox.network_enabled = config.network_enabled;
        options.sandbox.mount_target = config.sandbox_mount_path;
        return options;
    }

    static core::DispatcherOptions DispatcherOptionsFor(const core::ServiceConfig& config) {
        core::DispatcherOptions options;
        options.default_timeout = config.default_exec_timeout;
        options.max_timeout = config.max_exec_timeout;
        options.max_output_bytes = config.max_output_bytes;
        return options;
    }

    static core::ServiceOptions ServiceOptionsFor(const core::ServiceConfig& config) {
        core::ServiceOptions options;
        options.public_base_url = config.public_base_url;
        options.max_upload_bytes = config.max_upload_bytes;
        return options;
    }
};

std::string FormatTime(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunServe(const core::ServiceConfig& config) {
    Components components(config);

    if (!components.controller.IsRuntimeAvailable()) {
        spdlog::error("Container runtime is not available; is the daemon running?");
        return 1;
    }

    const auto report = core::OrphanRecovery(components.registry).Run();
    if (!report.failures.empty()) {
        spdlog::warn("Recovery finished with {} failure(s)", report.failures.size());
    }

    core::IdleReaper reaper(
        components.registry,
        std::chrono::duration_cast<std::chrono::milliseconds>(config.session_ttl),
        std::chrono::duration_cast<std::chrono::milliseconds>(config.reap_interval));
    {
        server::StopSignals::Blocked blocked;
        reaper.Start();
    }

    server::StopSignals signals(g_stop_requested, STDIN_FILENO);

    spdlog::info("Serving requests on stdin (max {} sessions, image {})",
                 config.max_sessions, config.image);

    server::RequestLoop loop(components.service, config.api_key, config.request_workers);
    loop.Run(std::cin, std::cout, &g_stop_requested);

    if (g_stop_requested) {
        spdlog::info("Shutdown requested");
    }
    reaper.Stop();

    const auto live = components.registry.Snapshot();
    if (!live.empty()) {
        spdlog::info("Leaving {} session(s) running for the next start to recover", live.size());
    }
    return 0;
}

int RunRecover(const core::ServiceConfig& config) {
    Components components(config);

    if (!components.controller.IsRuntimeAvailable()) {
        spdlog::error("Container runtime is not available; is the daemon running?");
        return 1;
    }

    const auto report = core::OrphanRecovery(components.registry).Run();
    std::cout << report.ToJson().dump(2) << std::endl;
    return report.failures.empty() ? 0 : 2;
}

int RunSessions(const core::ServiceConfig& config) {
    core::DockerSandboxController controller(config.service_name, config.runtime);

    if (!controller.IsRuntimeAvailable()) {
        spdlog::error("Container runtime is not available; is the daemon running?");
        return 1;
    }

    json list = json::array();
    for (const auto& handle : controller.ListTracked()) {
        list.push_back({
            {"container_id", handle.container_id.substr(0, 12)},
            {"name", handle.name},
            {"session", handle.session_key},
            {"external_id", handle.external_id},
            {"generation", handle.generation},
            {"started_at", FormatTime(handle.started_at)},
            {"running", handle.running}
        });
    }
    std::cout << list.dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Sandkeep - sandbox session manager"};
    app.require_subcommand(1);

    std::string config_path;
    std::string log_file;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--log-file", log_file, "Also write logs to this (rotating) file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // Overrides applied after the file and the environment
    std::string image;
    std::size_t memory_mb = 0;
    double cpus = 0.0;
    std::size_t max_sessions = 0;
    long long ttl_seconds = 0;
    std::string data_dir;
    std::string internal_data_dir;
    std::string public_url;
    bool network = false;

    auto* image_opt = app.add_option("--image", image, "Sandbox image");
    auto* memory_opt = app.add_option("--memory", memory_mb, "Memory limit per sandbox (MB)");
    auto* cpus_opt = app.add_option("--cpus", cpus, "CPU quota per sandbox (cores)");
    auto* sessions_opt = app.add_option("--max-sessions", max_sessions, "Maximum live sessions");
    auto* ttl_opt = app.add_option("--ttl", ttl_seconds, "Idle session TTL in seconds");
    auto* data_dir_opt = app.add_option("--data-dir", data_dir,
                                        "Session storage root as the container daemon sees it");
    auto* internal_opt = app.add_option("--internal-data-dir", internal_data_dir,
                                        "Same root as this process sees it");
    auto* url_opt = app.add_option("--public-url", public_url, "Base URL of download links");
    auto* network_opt = app.add_flag("--network", network, "Give sandboxes a bridge network");

    auto* serve = app.add_subcommand("serve", "Serve JSON-lines requests on stdin/stdout");
    auto* recover = app.add_subcommand("recover", "Reconcile containers left by a previous run");
    auto* sessions = app.add_subcommand("sessions", "List containers tracked by this service");

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging(verbose, log_file);

    try {
        core::ServiceConfig base;
        if (!config_path.empty()) {
            core::ConfigLoader::ApplyJsonFile(config_path, base);
        }
        core::ConfigLoader::ApplyEnvironment(base);

        core::ConfigBuilder builder(base);
        if (image_opt->count() > 0) builder.WithImage(image);
        if (memory_opt->count() > 0) builder.WithMemoryLimit(memory_mb);
        if (cpus_opt->count() > 0) builder.WithCpuQuota(cpus);
        if (sessions_opt->count() > 0) builder.WithMaxSessions(max_sessions);
        if (ttl_opt->count() > 0) builder.WithSessionTtl(std::chrono::seconds(ttl_seconds));
        if (data_dir_opt->count() > 0 || internal_opt->count() > 0) {
            builder.WithDataDirs(data_dir_opt->count() > 0 ? std::filesystem::path(data_dir)
                                                           : base.data_dir_host,
                                 internal_opt->count() > 0 ? std::filesystem::path(internal_data_dir)
                                                           : base.data_dir_internal);
        }
        if (url_opt->count() > 0) builder.WithPublicBaseUrl(public_url);
        if (network_opt->count() > 0) builder.WithNetwork(network);

        const auto config = builder.Build();
        core::ConfigLoader::Validate(config);
        spdlog::debug("Effective configuration: {}", core::ConfigLoader::ToJson(config).dump());

        if (serve->parsed()) {
            return RunServe(config);
        }
        if (recover->parsed()) {
            return RunRecover(config);
        }
        if (sessions->parsed()) {
            return RunSessions(config);
        }
        return 1;

    } catch (const core::ValidationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
