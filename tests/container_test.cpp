#include "sandkeep/core/docker_sandbox_controller.hpp"
#include "sandkeep/utils/container_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace sandkeep;
using utils::ContainerConfig;
using utils::ContainerState;
using utils::ContainerUtils;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Run command construction
// ============================================================================

TEST(container_utils, run_command_applies_limits_and_isolation) {
    ContainerConfig config;
    config.name = "sandkeep_s1_g1_abcdef";
    config.image = "sandkeep-python:latest";
    config.memory_limit_mb = 256;
    config.cpu_limit = 0.5;
    config.pids_limit = 64;
    config.mounts["/var/lib/sandkeep/sessions/s1"] = "/mnt/data";
    config.labels = {{"service", "sandkeep"}, {"session", "s1"}};

    auto args = ContainerUtils::BuildRunCommand(config);

    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_TRUE(HasPair(args, "--name", "sandkeep_s1_g1_abcdef"));
    EXPECT_TRUE(HasPair(args, "--memory", "256m"));
    EXPECT_TRUE(HasPair(args, "--memory-swap", "256m"));
    EXPECT_TRUE(HasPair(args, "--cpus", "0.500"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "64"));
    EXPECT_TRUE(HasPair(args, "--network", "none"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(HasPair(args, "-v", "/var/lib/sandkeep/sessions/s1:/mnt/data:rw"));
    EXPECT_TRUE(HasPair(args, "--label", "session=s1"));
    EXPECT_TRUE(HasPair(args, "-w", "/mnt/data"));

    // Image, then the idle command
    auto image = std::find(args.begin(), args.end(), "sandkeep-python:latest");
    ASSERT_NE(image, args.end());
    EXPECT_EQ(std::vector<std::string>(image + 1, args.end()),
              (std::vector<std::string>{"sleep", "infinity"}));
}

TEST(container_utils, run_command_with_network) {
    ContainerConfig config;
    config.image = "img";
    config.network_mode = utils::NetworkMode::BRIDGE;
    auto args = ContainerUtils::BuildRunCommand(config);
    EXPECT_TRUE(HasPair(args, "--network", "bridge"));
}

// ============================================================================
// Inspect parsing
// ============================================================================

TEST(container_utils, parse_inspect_output) {
    const std::string output = R"([{
        "Id": "0123456789abcdef",
        "Name": "/sandkeep_s1_g3_xyzxyz",
        "Created": "2025-01-02T03:04:05.123456789Z",
        "Config": {
            "Image": "sandkeep-python:latest",
            "Labels": {"service": "sandkeep", "session": "s1", "generation": "3"}
        },
        "State": {"Status": "exited", "ExitCode": 137, "StartedAt": "2025-01-02T03:04:06Z"}
    }])";

    auto containers = ContainerUtils::ParseInspectOutput(output);
    ASSERT_EQ(containers.size(), 1u);
    const auto& info = containers[0];
    EXPECT_EQ(info.id, "0123456789abcdef");
    EXPECT_EQ(info.name, "sandkeep_s1_g3_xyzxyz");
    EXPECT_EQ(info.image, "sandkeep-python:latest");
    EXPECT_EQ(info.state, ContainerState::EXITED);
    EXPECT_EQ(info.exit_code, 137);
    EXPECT_EQ(info.labels.at("session"), "s1");
    EXPECT_EQ(info.started_at - info.created_at,
              std::chrono::duration_cast<std::chrono::system_clock::duration>(
                  std::chrono::nanoseconds(876543211)));
}

TEST(container_utils, parse_state) {
    EXPECT_EQ(ContainerUtils::ParseState("running"), ContainerState::RUNNING);
    EXPECT_EQ(ContainerUtils::ParseState("restarting"), ContainerState::RUNNING);
    EXPECT_EQ(ContainerUtils::ParseState("created"), ContainerState::CREATED);
    EXPECT_EQ(ContainerUtils::ParseState("dead"), ContainerState::DEAD);
    EXPECT_EQ(ContainerUtils::ParseState("bogus"), ContainerState::UNKNOWN);
}

TEST(container_utils, parse_timestamp) {
    auto epoch = ContainerUtils::ParseTimestamp("1970-01-01T00:00:10Z");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(epoch->time_since_epoch(), std::chrono::seconds(10));

    auto offset = ContainerUtils::ParseTimestamp("1970-01-01T02:00:10+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(offset->time_since_epoch(), std::chrono::seconds(10));

    // Never started
    auto zero = ContainerUtils::ParseTimestamp("0001-01-01T00:00:00Z");
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(zero->time_since_epoch().count(), 0);

    EXPECT_FALSE(ContainerUtils::ParseTimestamp("").has_value());
    EXPECT_FALSE(ContainerUtils::ParseTimestamp("yesterday").has_value());
}

TEST(container_utils, missing_container_errors) {
    EXPECT_TRUE(ContainerUtils::IsMissingContainerError(
        "Error response from daemon: No such container: abc"));
    EXPECT_TRUE(ContainerUtils::IsMissingContainerError("Error: No such object: abc"));
    EXPECT_FALSE(ContainerUtils::IsMissingContainerError("permission denied"));
}

// ============================================================================
// Docker controller helpers
// ============================================================================

TEST(docker_sandbox_controller, container_config_carries_labels_and_mount) {
    core::DockerSandboxController controller("sandkeep");

    core::SandboxSpec spec;
    spec.image = "sandkeep-python:3.12";
    spec.memory_limit_mb = 1024;
    spec.mount_source = "/srv/sessions/abc";
    spec.external_id = "V1StGXR8_Z5jdHi6B-myT";
    spec.generation = 7;

    const std::string key(40, 'k');
    auto config = controller.BuildContainerConfig(key, spec);

    EXPECT_EQ(config.name.rfind("sandkeep_" + std::string(32, 'k') + "_g7_", 0), 0u);
    EXPECT_EQ(config.name.size(), std::string("sandkeep_").size() + 32 + 4 + 6);
    EXPECT_EQ(config.image, "sandkeep-python:3.12");
    EXPECT_EQ(config.memory_limit_mb, 1024u);
    EXPECT_EQ(config.network_mode, utils::NetworkMode::NONE);
    EXPECT_EQ(config.mounts.at("/srv/sessions/abc").string(), "/mnt/data");
    EXPECT_EQ(config.working_dir.string(), "/mnt/data");
    EXPECT_EQ(config.labels.at(core::kLabelService), "sandkeep");
    EXPECT_EQ(config.labels.at(core::kLabelSession), key);
    EXPECT_EQ(config.labels.at(core::kLabelExternalId), "V1StGXR8_Z5jdHi6B-myT");
    EXPECT_EQ(config.labels.at(core::kLabelGeneration), "7");
}

TEST(docker_sandbox_controller, handle_from_inspected_container) {
    utils::ContainerInfo info;
    info.id = "deadbeef";
    info.name = "sandkeep_s9_g12_qwerty";
    info.state = ContainerState::EXITED;
    info.labels = {{"session", "s9"}, {"generation", "12"}, {"external-id", "ext"}};

    auto handle = core::DockerSandboxController::ToHandle(info);
    EXPECT_EQ(handle.container_id, "deadbeef");
    EXPECT_EQ(handle.session_key, "s9");
    EXPECT_EQ(handle.external_id, "ext");
    EXPECT_EQ(handle.generation, 12u);
    EXPECT_FALSE(handle.running);

    info.labels.clear();
    info.state = ContainerState::RUNNING;
    handle = core::DockerSandboxController::ToHandle(info);
    EXPECT_TRUE(handle.session_key.empty());
    EXPECT_EQ(handle.generation, 0u);
    EXPECT_TRUE(handle.running);
}

TEST(docker_sandbox_controller, bootstrap_echoes_trailing_expression) {
    const std::string bootstrap = core::DockerSandboxController::Bootstrap();
    EXPECT_NE(bootstrap.find("ast.parse"), std::string::npos);
    EXPECT_NE(bootstrap.find("repr"), std::string::npos);
}

// ============================================================================
// Exec result classification
// ============================================================================

namespace {

utils::ContainerExecResult Exec(int exit_code, std::chrono::milliseconds duration) {
    utils::ContainerExecResult exec;
    exec.exit_code = exit_code;
    exec.duration = duration;
    exec.stdout_output = "out";
    exec.stderr_output = "err";
    return exec;
}

} // namespace

TEST(docker_sandbox_controller, program_exit_124_is_not_a_timeout) {
    auto result = core::DockerSandboxController::ToCommandResult(
        Exec(124, std::chrono::milliseconds(40)), std::chrono::seconds(10));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.stdout_output, "out");
    EXPECT_EQ(result.stderr_output, "err");

    result = core::DockerSandboxController::ToCommandResult(
        Exec(137, std::chrono::milliseconds(40)), std::chrono::seconds(10));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 137);
}

TEST(docker_sandbox_controller, deadline_kills_are_timeouts) {
    auto result = core::DockerSandboxController::ToCommandResult(
        Exec(124, std::chrono::milliseconds(10002)), std::chrono::seconds(10));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);

    result = core::DockerSandboxController::ToCommandResult(
        Exec(137, std::chrono::milliseconds(10000)), std::chrono::seconds(10));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.duration.count(), 10000);

    // Host-side deadline, whatever the exit code
    auto host = Exec(-1, std::chrono::milliseconds(15000));
    host.timed_out = true;
    result = core::DockerSandboxController::ToCommandResult(host, std::chrono::seconds(10));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
}

TEST(docker_sandbox_controller, ordinary_exits_pass_through) {
    auto result = core::DockerSandboxController::ToCommandResult(
        Exec(1, std::chrono::milliseconds(20000)), std::chrono::seconds(10));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 1);

    result = core::DockerSandboxController::ToCommandResult(
        Exec(0, std::chrono::milliseconds(5)), std::chrono::seconds(10));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(docker_sandbox_controller, failed_exit_in_stopped_container_means_sandbox_gone) {
    using core::DockerSandboxController;
    EXPECT_FALSE(DockerSandboxController::IsSandboxGone(ContainerState::RUNNING));
    EXPECT_FALSE(DockerSandboxController::IsSandboxGone(ContainerState::UNKNOWN));
    EXPECT_TRUE(DockerSandboxController::IsSandboxGone(ContainerState::EXITED));
    EXPECT_TRUE(DockerSandboxController::IsSandboxGone(ContainerState::DEAD));
    EXPECT_TRUE(DockerSandboxController::IsSandboxGone(ContainerState::MISSING));
    EXPECT_TRUE(DockerSandboxController::IsSandboxGone(ContainerState::PAUSED));
}
