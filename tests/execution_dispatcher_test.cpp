#include "sandkeep/core/errors.hpp"
#include "sandkeep/core/execution_dispatcher.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sandkeep::core;
using sandkeep::testing::RegistryHarness;
using sandkeep::testing::WriteText;

namespace {

class execution_dispatcher : public ::testing::Test {
protected:
    execution_dispatcher()
        : dispatcher_(h_.registry, Options()) {}

    static DispatcherOptions Options() {
        DispatcherOptions options;
        options.default_timeout = std::chrono::seconds(30);
        options.max_timeout = std::chrono::seconds(60);
        options.max_output_bytes = 64;
        return options;
    }

    ExecutionRequest Request(const std::string& key, const std::string& code) {
        ExecutionRequest request;
        request.session_key = key;
        request.code = code;
        return request;
    }

    RegistryHarness h_;
    ExecutionDispatcher dispatcher_;
};

} // namespace

TEST_F(execution_dispatcher, runs_code_in_the_session_sandbox) {
    auto result = dispatcher_.Execute(Request("alpha", "print(1)"));

    EXPECT_EQ(result.session_key, "alpha");
    EXPECT_EQ(result.external_id.size(), 21u);
    EXPECT_EQ(result.stdout_output, "ran: print(1)");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(h_.controller.Runs("alpha"), 1);
}

TEST_F(execution_dispatcher, validates_language_and_code) {
    auto request = Request("alpha", "print(1)");
    request.lang = "ruby";
    EXPECT_THROW(dispatcher_.Execute(request), ValidationError);

    request.lang = " Python3 ";
    EXPECT_NO_THROW(dispatcher_.Execute(request));

    EXPECT_THROW(dispatcher_.Execute(Request("alpha", "  \n ")), ValidationError);
    EXPECT_TRUE(ExecutionDispatcher::IsSupportedLanguage("py"));
}

TEST_F(execution_dispatcher, timeout_is_clamped) {
    EXPECT_EQ(dispatcher_.ClampTimeout(std::nullopt), std::chrono::seconds(30));
    EXPECT_EQ(dispatcher_.ClampTimeout(std::chrono::seconds(0)), std::chrono::seconds(1));
    EXPECT_EQ(dispatcher_.ClampTimeout(std::chrono::seconds(5)), std::chrono::seconds(5));
    EXPECT_EQ(dispatcher_.ClampTimeout(std::chrono::seconds(3600)), std::chrono::seconds(60));

    std::chrono::seconds seen{0};
    h_.controller.on_run = [&](const SandboxHandle&, const std::string&, std::chrono::seconds t) {
        seen = t;
        return CommandResult{};
    };
    auto request = Request("alpha", "x = 1");
    request.timeout = std::chrono::seconds(9999);
    dispatcher_.Execute(request);
    EXPECT_EQ(seen, std::chrono::seconds(60));
}

TEST_F(execution_dispatcher, timed_out_run_reports_exit_124_and_keeps_session) {
    h_.controller.on_run = [](const SandboxHandle&, const std::string&, std::chrono::seconds) {
        CommandResult result;
        result.stdout_output = "partial";
        result.exit_code = 137;
        result.timed_out = true;
        return result;
    };

    auto request = Request("alpha", "while True: pass");
    request.timeout = std::chrono::seconds(2);
    auto result = dispatcher_.Execute(request);

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.stdout_output, "partial");
    EXPECT_NE(result.stderr_output.find("ExecutionTimeout"), std::string::npos);
    EXPECT_EQ(result.stderr_output, ExecutionDispatcher::TimeoutNotice(std::chrono::seconds(2)));

    // The sandbox is still there for the next call
    h_.controller.on_run = nullptr;
    auto next = dispatcher_.Execute(Request("alpha", "print(2)"));
    EXPECT_EQ(next.generation, result.generation);
    EXPECT_EQ(h_.controller.provisions.load(), 1);
}

TEST_F(execution_dispatcher, exit_124_without_timeout_is_a_normal_exit) {
    h_.controller.on_run = [](const SandboxHandle&, const std::string&, std::chrono::seconds) {
        CommandResult result;
        result.exit_code = 124;
        return result;
    };
    auto result = dispatcher_.Execute(Request("alpha", "import sys; sys.exit(124)"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.stderr_output.find("ExecutionTimeout"), std::string::npos);
}

TEST_F(execution_dispatcher, long_output_is_truncated) {
    h_.controller.on_run = [](const SandboxHandle&, const std::string&, std::chrono::seconds) {
        CommandResult result;
        result.stdout_output = std::string(100, 'x');
        return result;
    };
    auto result = dispatcher_.Execute(Request("alpha", "print('x' * 100)"));
    EXPECT_EQ(result.stdout_output.substr(0, 64), std::string(64, 'x'));
    EXPECT_NE(result.stdout_output.find("[output truncated, 36 bytes omitted]"), std::string::npos);
}

TEST_F(execution_dispatcher, reports_new_and_modified_files) {
    auto& workspace = h_.workspace;
    // Seed a file before the run
    dispatcher_.Execute(Request("alpha", "pass"));
    WriteText(workspace.InternalDir("alpha") / "untouched.csv", "a,b");
    WriteText(workspace.InternalDir("alpha") / "edited.txt", "v1");

    h_.controller.on_run = [&](const SandboxHandle& handle, const std::string&, std::chrono::seconds) {
        const auto dir = workspace.InternalDir(handle.session_key);
        WriteText(dir / "plot.png", "png-bytes");
        WriteText(dir / "edited.txt", "version two");
        WriteText(dir / ".cache" / "state", "hidden");
        WriteText(dir / "__pycache__" / "mod.pyc", "bytecode");
        return CommandResult{};
    };

    auto result = dispatcher_.Execute(Request("alpha", "make_plot()"));
    ASSERT_EQ(result.files.size(), 2u);

    std::vector<std::string> names;
    for (const auto& record : result.files) {
        names.push_back(record.FileName());
        EXPECT_EQ(record.external_id.size(), 21u);
        EXPECT_EQ(record.generation, result.generation);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"edited.txt", "plot.png"}));
    EXPECT_EQ(result.files[1].content_type, "image/png");
}

TEST_F(execution_dispatcher, file_ids_are_stable_across_runs) {
    auto& workspace = h_.workspace;
    h_.controller.on_run = [&](const SandboxHandle& handle, const std::string& code, std::chrono::seconds) {
        WriteText(workspace.InternalDir(handle.session_key) / "out.txt", code);
        return CommandResult{};
    };

    auto first = dispatcher_.Execute(Request("alpha", "one"));
    auto second = dispatcher_.Execute(Request("alpha", "three"));
    ASSERT_EQ(first.files.size(), 1u);
    ASSERT_EQ(second.files.size(), 1u);
    EXPECT_EQ(first.files[0].external_id, second.files[0].external_id);
}

TEST_F(execution_dispatcher, dead_sandbox_is_replaced_once) {
    auto first = dispatcher_.Execute(Request("alpha", "x = 1"));
    auto infos = h_.registry.Snapshot();
    ASSERT_EQ(infos.size(), 1u);
    h_.controller.Kill(infos[0].container_id);

    auto second = dispatcher_.Execute(Request("alpha", "x"));
    EXPECT_GT(second.generation, first.generation);
    EXPECT_EQ(h_.controller.provisions.load(), 2);
    EXPECT_EQ(h_.controller.Terminated().size(), 1u);
}

TEST_F(execution_dispatcher, gives_up_after_one_retry) {
    h_.controller.on_run = [](const SandboxHandle& handle, const std::string&, std::chrono::seconds)
        -> CommandResult {
        throw SandboxUnavailable("container " + handle.container_id + " exited");
    };

    EXPECT_THROW(dispatcher_.Execute(Request("alpha", "x = 1")), SandboxUnavailable);
    EXPECT_EQ(h_.controller.provisions.load(), 2);
}

TEST_F(execution_dispatcher, same_session_runs_are_serialized) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    h_.controller.on_run = [&](const SandboxHandle&, const std::string&, std::chrono::seconds) {
        const int now = ++active;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --active;
        return CommandResult{};
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&]() { dispatcher_.Execute(Request("alpha", "work()")); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(peak.load(), 1);
    EXPECT_EQ(h_.controller.Runs("alpha"), 5);
    EXPECT_EQ(h_.controller.provisions.load(), 1);
}

TEST_F(execution_dispatcher, different_sessions_run_in_parallel) {
    std::mutex mutex;
    std::condition_variable both_inside;
    int inside = 0;
    bool overlapped = false;

    h_.controller.on_run = [&](const SandboxHandle&, const std::string&, std::chrono::seconds) {
        std::unique_lock<std::mutex> lock(mutex);
        ++inside;
        both_inside.notify_all();
        if (both_inside.wait_for(lock, std::chrono::seconds(5), [&] { return inside >= 2; })) {
            overlapped = true;
        }
        return CommandResult{};
    };

    std::thread a([&]() { dispatcher_.Execute(Request("alpha", "work()")); });
    std::thread b([&]() { dispatcher_.Execute(Request("beta", "work()")); });
    a.join();
    b.join();

    EXPECT_TRUE(overlapped);
}
