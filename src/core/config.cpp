/**
 * @file config.cpp
 * @brief Configuration loading and validation
 *
 * @date 2025
 */

#include "sandkeep/core/config.hpp"
#include "sandkeep/core/errors.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace sandkeep {
namespace core {

namespace {

using utils::StringUtils;

std::optional<std::string> ProcessEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::size_t ParseCount(const std::string& name, const std::string& value) {
    const auto trimmed = StringUtils::Trim(value);
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(trimmed, &consumed);
    }
    catch (const std::exception&) {
        throw ValidationError(name + " must be a non-negative integer, got '" + value + "'");
    }
    if (consumed != trimmed.size() || StringUtils::StartsWith(trimmed, "-")) {
        throw ValidationError(name + " must be a non-negative integer, got '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

double ParseDouble(const std::string& name, const std::string& value) {
    const auto trimmed = StringUtils::Trim(value);
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(trimmed, &consumed);
    }
    catch (const std::exception&) {
        throw ValidationError(name + " must be a number, got '" + value + "'");
    }
    if (consumed != trimmed.size()) {
        throw ValidationError(name + " must be a number, got '" + value + "'");
    }
    return parsed;
}

bool ParseBool(const std::string& name, const std::string& value) {
    const auto lower = StringUtils::ToLower(StringUtils::Trim(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off" || lower.empty()) {
        return false;
    }
    throw ValidationError(name + " must be a boolean, got '" + value + "'");
}

// Accepts "512", "512m", "512mb" and "2g"
std::size_t ParseMemoryMb(const std::string& name, const std::string& value) {
    auto lower = StringUtils::ToLower(StringUtils::Trim(value));
    std::size_t multiplier = 1;
    if (StringUtils::EndsWith(lower, "mb") || StringUtils::EndsWith(lower, "gb")) {
        lower.pop_back();
    }
    if (StringUtils::EndsWith(lower, "g")) {
        multiplier = 1024;
        lower.pop_back();
    } else if (StringUtils::EndsWith(lower, "m")) {
        lower.pop_back();
    }
    return ParseCount(name, lower) * multiplier;
}

utils::ContainerRuntime ParseRuntime(const std::string& value) {
    const auto lower = StringUtils::ToLower(StringUtils::Trim(value));
    if (lower == "docker") {
        return utils::ContainerRuntime::DOCKER;
    }
    if (lower == "podman") {
        return utils::ContainerRuntime::PODMAN;
    }
    throw ValidationError("runtime must be 'docker' or 'podman', got '" + value + "'");
}

template <typename T>
void ReadField(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        target = j[key].get<T>();
    }
    catch (const json::exception& e) {
        throw ValidationError(std::string("config field '") + key + "': " + e.what());
    }
}

void ReadSeconds(const json& j, const char* key, std::chrono::seconds& target) {
    long long seconds = target.count();
    ReadField(j, key, seconds);
    if (seconds < 0) {
        throw ValidationError(std::string("config field '") + key + "' must not be negative");
    }
    target = std::chrono::seconds(seconds);
}

void ReadPath(const json& j, const char* key, std::filesystem::path& target) {
    std::string value = target.string();
    ReadField(j, key, value);
    target = value;
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

void ConfigLoader::ApplyJsonFile(const std::filesystem::path& path, ServiceConfig& config) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("Cannot open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::parse_error& e) {
        throw ValidationError("Malformed config file " + path.string() + ": " + e.what());
    }

    ApplyJson(j, config);
    spdlog::info("Loaded configuration from {}", path.string());
}

void ConfigLoader::ApplyJson(const json& j, ServiceConfig& config) {
    if (!j.is_object()) {
        throw ValidationError("Configuration must be a JSON object");
    }

    ReadField(j, "service_name", config.service_name);
    ReadField(j, "image", config.image);
    ReadField(j, "memory_limit_mb", config.memory_limit_mb);
    ReadField(j, "cpu_quota", config.cpu_quota);
    ReadField(j, "pids_limit", config.pids_limit);
    ReadField(j, "network_enabled", config.network_enabled);
    if (j.contains("runtime") && j["runtime"].is_string()) {
        config.runtime = ParseRuntime(j["runtime"].get<std::string>());
    }

    ReadField(j, "max_sessions", config.max_sessions);
    ReadField(j, "max_concurrent_provisions", config.max_concurrent_provisions);
    ReadField(j, "request_workers", config.request_workers);

    ReadSeconds(j, "session_ttl_seconds", config.session_ttl);
    ReadSeconds(j, "reap_interval_seconds", config.reap_interval);
    ReadSeconds(j, "default_exec_timeout_seconds", config.default_exec_timeout);
    ReadSeconds(j, "max_exec_timeout_seconds", config.max_exec_timeout);

    ReadField(j, "max_upload_bytes", config.max_upload_bytes);
    ReadField(j, "max_output_bytes", config.max_output_bytes);

    ReadPath(j, "data_dir_host", config.data_dir_host);
    ReadPath(j, "data_dir_internal", config.data_dir_internal);
    ReadPath(j, "sandbox_mount_path", config.sandbox_mount_path);

    ReadField(j, "public_base_url", config.public_base_url);
    ReadField(j, "api_key", config.api_key);
}

json ConfigLoader::ToJson(const ServiceConfig& config) {
    return json{
        {"service_name", config.service_name},
        {"image", config.image},
        {"memory_limit_mb", config.memory_limit_mb},
        {"cpu_quota", config.cpu_quota},
        {"pids_limit", config.pids_limit},
        {"network_enabled", config.network_enabled},
        {"runtime", config.runtime == utils::ContainerRuntime::PODMAN ? "podman" : "docker"},
        {"max_sessions", config.max_sessions},
        {"max_concurrent_provisions", config.max_concurrent_provisions},
        {"request_workers", config.request_workers},
        {"session_ttl_seconds", config.session_ttl.count()},
        {"reap_interval_seconds", config.reap_interval.count()},
        {"default_exec_timeout_seconds", config.default_exec_timeout.count()},
        {"max_exec_timeout_seconds", config.max_exec_timeout.count()},
        {"max_upload_bytes", config.max_upload_bytes},
        {"max_output_bytes", config.max_output_bytes},
        {"data_dir_host", config.data_dir_host.string()},
        {"data_dir_internal", config.InternalDataDir().string()},
        {"sandbox_mount_path", config.sandbox_mount_path.string()},
        {"public_base_url", config.public_base_url},
        {"api_key", config.api_key.empty() ? "" : "***"}
    };
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

void ConfigLoader::ApplyEnvironment(ServiceConfig& config, const EnvLookup& lookup) {
    const EnvLookup get = lookup ? lookup : EnvLookup(ProcessEnvironment);

    if (auto v = get("RCE_IMAGE")) {
        config.image = StringUtils::Trim(*v);
    }
    if (auto v = get("RCE_MEM_LIMIT_MB")) {
        config.memory_limit_mb = ParseMemoryMb("RCE_MEM_LIMIT_MB", *v);
    }
    if (auto v = get("RCE_CPU_QUOTA")) {
        config.cpu_quota = ParseDouble("RCE_CPU_QUOTA", *v);
    }
    if (auto v = get("RCE_MAX_SESSIONS")) {
        config.max_sessions = ParseCount("RCE_MAX_SESSIONS", *v);
    }
    if (auto v = get("RCE_NETWORK_ENABLED")) {
        config.network_enabled = ParseBool("RCE_NETWORK_ENABLED", *v);
    }
    if (auto v = get("RCE_SESSION_TTL")) {
        config.session_ttl = std::chrono::seconds(ParseCount("RCE_SESSION_TTL", *v));
    }
    if (auto v = get("RCE_REAP_INTERVAL")) {
        config.reap_interval = std::chrono::seconds(ParseCount("RCE_REAP_INTERVAL", *v));
    }
    if (auto v = get("RCE_EXEC_TIMEOUT")) {
        config.default_exec_timeout = std::chrono::seconds(ParseCount("RCE_EXEC_TIMEOUT", *v));
        if (config.default_exec_timeout > config.max_exec_timeout) {
            config.max_exec_timeout = config.default_exec_timeout;
        }
    }
    if (auto v = get("RCE_DATA_DIR_HOST")) {
        config.data_dir_host = StringUtils::Trim(*v);
    }
    if (auto v = get("RCE_DATA_DIR_INTERNAL")) {
        config.data_dir_internal = StringUtils::Trim(*v);
    }
    if (auto v = get("RCE_PUBLIC_BASE_URL")) {
        config.public_base_url = StringUtils::Trim(*v);
    }
    if (auto v = get("CUSTOM_RCE_API_KEY")) {
        config.api_key = *v;
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ConfigLoader::Validate(const ServiceConfig& config) {
    if (StringUtils::Trim(config.image).empty()) {
        throw ValidationError("image must not be empty");
    }
    if (config.service_name.empty()) {
        throw ValidationError("service_name must not be empty");
    }
    if (config.memory_limit_mb < 16) {
        throw ValidationError("memory_limit_mb must be at least 16");
    }
    if (config.cpu_quota <= 0.0) {
        throw ValidationError("cpu_quota must be positive");
    }
    if (config.max_sessions == 0) {
        throw ValidationError("max_sessions must be at least 1");
    }
    if (config.max_concurrent_provisions == 0) {
        throw ValidationError("max_concurrent_provisions must be at least 1");
    }
    if (config.request_workers == 0) {
        throw ValidationError("request_workers must be at least 1");
    }
    if (config.session_ttl.count() <= 0) {
        throw ValidationError("session_ttl must be positive");
    }
    if (config.reap_interval.count() <= 0) {
        throw ValidationError("reap_interval must be positive");
    }
    if (config.default_exec_timeout.count() <= 0 ||
        config.default_exec_timeout > config.max_exec_timeout) {
        throw ValidationError("default_exec_timeout must be between 1s and max_exec_timeout");
    }
    if (config.data_dir_host.empty()) {
        throw ValidationError("data_dir_host must not be empty");
    }
    if (!config.sandbox_mount_path.is_absolute()) {
        throw ValidationError("sandbox_mount_path must be absolute");
    }
    if (config.sandbox_mount_path.lexically_normal() ==
        config.InternalDataDir().lexically_normal()) {
        throw ValidationError("sandbox_mount_path must differ from the internal data directory");
    }
    if (config.public_base_url.empty()) {
        throw ValidationError("public_base_url must not be empty");
    }
    if (config.api_key.empty()) {
        spdlog::warn("No API key configured, request authentication is disabled");
    }
}

} // namespace core
} // namespace sandkeep
