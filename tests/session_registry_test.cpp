#include "sandkeep/core/errors.hpp"
#include "sandkeep/core/session_registry.hpp"
#include "sandkeep/utils/id_utils.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace sandkeep::core;
using sandkeep::testing::RegistryHarness;
using sandkeep::testing::TrackedHandle;
using sandkeep::testing::WriteText;

namespace {

RegistryOptions Limits(std::size_t max_sessions, std::size_t max_provisions = 4) {
    RegistryOptions options;
    options.max_sessions = max_sessions;
    options.max_concurrent_provisions = max_provisions;
    options.sandbox.image = "sandkeep-python:test";
    return options;
}

} // namespace

TEST(session_registry, first_resolve_provisions_a_ready_sandbox) {
    RegistryHarness h(Limits(4));
    auto lease = h.registry.Resolve("alpha");

    EXPECT_TRUE(lease.Fresh());
    EXPECT_EQ(lease.Key(), "alpha");
    EXPECT_EQ(lease.ExternalId().size(), 21u);
    EXPECT_EQ(lease.Generation(), 1u);
    EXPECT_TRUE(lease.Handle().running);
    EXPECT_EQ(h.controller.provisions.load(), 1);

    // Template and per-session fields reach the controller
    auto specs = h.controller.Specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].image, "sandkeep-python:test");
    EXPECT_EQ(specs[0].mount_source.string(), h.workspace.HostDir("alpha").string());
    EXPECT_EQ(specs[0].external_id, lease.ExternalId());
    EXPECT_TRUE(std::filesystem::is_directory(h.workspace.InternalDir("alpha")));
}

TEST(session_registry, reuse_does_not_provision_again) {
    RegistryHarness h(Limits(4));
    std::string external;
    {
        auto lease = h.registry.Resolve("alpha");
        external = lease.ExternalId();
    }
    auto again = h.registry.Resolve("alpha");
    EXPECT_FALSE(again.Fresh());
    EXPECT_EQ(again.ExternalId(), external);
    EXPECT_EQ(h.controller.provisions.load(), 1);

    EXPECT_EQ(h.registry.KeyForExternalId(external).value_or(""), "alpha");
    EXPECT_EQ(h.registry.ExternalIdForKey("alpha").value_or(""), external);
}

TEST(session_registry, rejects_unsanitized_keys) {
    RegistryHarness h(Limits(4));
    EXPECT_THROW(h.registry.Resolve(""), ValidationError);
    EXPECT_THROW(h.registry.Resolve("../etc"), ValidationError);
    EXPECT_EQ(h.controller.provisions.load(), 0);
}

TEST(session_registry, key_shaped_like_an_external_id_is_its_own_id) {
    RegistryHarness h(Limits(4));
    const auto key = sandkeep::utils::IdUtils::GenerateId();
    auto lease = h.registry.Resolve(key);
    EXPECT_EQ(lease.ExternalId(), key);
}

TEST(session_registry, concurrent_first_touch_provisions_once) {
    RegistryHarness h(Limits(4));
    h.controller.provision_delay = std::chrono::milliseconds(50);

    std::vector<std::thread> threads;
    std::vector<std::uint64_t> generations(8);
    std::atomic<int> fresh{0};
    for (std::size_t i = 0; i < generations.size(); ++i) {
        threads.emplace_back([&, i]() {
            auto lease = h.registry.Resolve("shared");
            generations[i] = lease.Generation();
            if (lease.Fresh()) {
                ++fresh;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(h.controller.provisions.load(), 1);
    EXPECT_EQ(fresh.load(), 1);
    EXPECT_EQ(std::set<std::uint64_t>(generations.begin(), generations.end()).size(), 1u);
    EXPECT_EQ(h.registry.Size(), 1u);
}

TEST(session_registry, provisioning_concurrency_is_bounded) {
    RegistryHarness h(Limits(8, 1));
    h.controller.provision_delay = std::chrono::milliseconds(30);

    std::vector<std::thread> threads;
    for (const char* key : {"a", "b", "c", "d"}) {
        threads.emplace_back([&h, key]() { h.registry.Resolve(key); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(h.controller.provisions.load(), 4);
    EXPECT_EQ(h.controller.peak_provisioning.load(), 1);
    EXPECT_EQ(h.registry.Size(), 4u);
}

TEST(session_registry, provisioning_runs_in_parallel_up_to_the_limit) {
    RegistryHarness h(Limits(8, 2));
    h.controller.provision_delay = std::chrono::milliseconds(100);

    std::vector<std::thread> threads;
    for (const char* key : {"a", "b", "c", "d"}) {
        threads.emplace_back([&h, key]() { h.registry.Resolve(key); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(h.controller.provisions.load(), 4);
    EXPECT_LE(h.controller.peak_provisioning.load(), 2);
}

TEST(session_registry, capacity_limit) {
    RegistryHarness h(Limits(2));
    h.registry.Resolve("a");
    h.registry.Resolve("b");

    try {
        h.registry.Resolve("c");
        FAIL() << "expected ResourceExhausted";
    }
    catch (const ResourceExhausted& e) {
        EXPECT_STREQ(e.what(), "Server is at capacity, try again later");
    }
    EXPECT_EQ(h.registry.Size(), 2u);
    EXPECT_EQ(h.controller.provisions.load(), 2);

    // Existing sessions stay usable at capacity
    EXPECT_NO_THROW(h.registry.Resolve("a"));

    EXPECT_TRUE(h.registry.Terminate("a"));
    EXPECT_NO_THROW(h.registry.Resolve("c"));
}

TEST(session_registry, provision_failure_leaves_nothing_behind) {
    RegistryHarness h(Limits(4));
    h.controller.fail_provisions = true;

    EXPECT_THROW(h.registry.Resolve("alpha"), ProvisionError);
    EXPECT_EQ(h.registry.Size(), 0u);
    EXPECT_FALSE(h.registry.ExternalIdForKey("alpha").has_value());
    EXPECT_FALSE(std::filesystem::exists(h.workspace.InternalDir("alpha")));

    h.controller.fail_provisions = false;
    auto lease = h.registry.Resolve("alpha");
    EXPECT_TRUE(lease.Fresh());
    EXPECT_EQ(h.registry.Size(), 1u);
}

TEST(session_registry, concurrent_waiters_see_the_provision_failure) {
    RegistryHarness h(Limits(4));
    h.controller.fail_provisions = true;
    h.controller.provision_delay = std::chrono::milliseconds(30);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            try {
                h.registry.Resolve("alpha");
            }
            catch (const ProvisionError&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 4);
    EXPECT_EQ(h.registry.Size(), 0u);
}

TEST(session_registry, terminate_then_resolve_starts_a_new_generation) {
    RegistryHarness h(Limits(4));
    std::uint64_t first_generation = 0;
    std::string file_id;
    {
        auto lease = h.registry.Resolve("alpha");
        first_generation = lease.Generation();
        WriteText(h.workspace.InternalDir("alpha") / "old.txt", "old");
        file_id = lease.Files().Register("old.txt", "text/plain");
    }

    EXPECT_TRUE(h.registry.Terminate("alpha"));
    EXPECT_FALSE(h.registry.Terminate("alpha"));
    EXPECT_EQ(h.controller.Terminated().size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(h.workspace.InternalDir("alpha") / "old.txt"));

    auto lease = h.registry.Resolve("alpha");
    EXPECT_TRUE(lease.Fresh());
    EXPECT_GT(lease.Generation(), first_generation);
    EXPECT_THROW(lease.Files().Resolve("alpha", file_id), FileNotFound);
    EXPECT_TRUE(h.registry.Workspace().Scan("alpha").empty());
}

TEST(session_registry, generations_are_strictly_increasing_across_sessions) {
    RegistryHarness h(Limits(8));
    std::uint64_t previous = 0;
    for (const char* key : {"a", "b", "c"}) {
        auto lease = h.registry.Resolve(key);
        EXPECT_GT(lease.Generation(), previous);
        previous = lease.Generation();
    }
}

TEST(session_registry, terminate_failure_still_frees_the_session) {
    RegistryHarness h(Limits(4));
    std::string container;
    {
        auto lease = h.registry.Resolve("alpha");
        container = lease.Handle().container_id;
    }
    h.controller.FailTerminate(container);

    EXPECT_THROW(h.registry.Terminate("alpha"), std::runtime_error);
    EXPECT_EQ(h.registry.Size(), 0u);
}

TEST(session_registry, acquire_and_try_acquire_never_provision) {
    RegistryHarness h(Limits(4));
    EXPECT_FALSE(h.registry.Acquire("ghost").has_value());
    EXPECT_FALSE(h.registry.TryAcquire("ghost").has_value());
    EXPECT_EQ(h.controller.provisions.load(), 0);

    auto held = h.registry.Resolve("alpha");
    std::atomic<bool> got{true};
    std::thread other([&]() { got = h.registry.TryAcquire("alpha").has_value(); });
    other.join();
    EXPECT_FALSE(got.load());
}

TEST(session_registry, snapshot_reports_state) {
    RegistryHarness h(Limits(4));
    {
        auto lease = h.registry.Resolve("alpha");
        lease.MarkExecuting();
        auto infos = h.registry.Snapshot();
        ASSERT_EQ(infos.size(), 1u);
        EXPECT_EQ(infos[0].state, SessionState::EXECUTING);
        lease.MarkReady();
    }
    auto infos = h.registry.Snapshot();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].key, "alpha");
    EXPECT_EQ(infos[0].state, SessionState::READY);
    EXPECT_FALSE(infos[0].container_id.empty());
    EXPECT_STREQ(SessionStateToString(infos[0].state), "ready");
}

TEST(session_registry, adopt_registers_without_provisioning) {
    RegistryHarness h(Limits(4));
    const auto external = sandkeep::utils::IdUtils::GenerateId();
    auto handle = TrackedHandle("ctr-1", "alpha", 7, std::chrono::system_clock::now(), external);

    EXPECT_TRUE(h.registry.Adopt(handle));
    EXPECT_FALSE(h.registry.Adopt(handle));
    EXPECT_EQ(h.registry.KeyForExternalId(external).value_or(""), "alpha");

    auto lease = h.registry.Resolve("alpha");
    EXPECT_FALSE(lease.Fresh());
    EXPECT_EQ(lease.Generation(), 7u);
    EXPECT_EQ(lease.Handle().container_id, "ctr-1");
    EXPECT_EQ(h.controller.provisions.load(), 0);

    // The generation counter resumes past the adopted generation
    auto other = h.registry.Resolve("beta");
    EXPECT_GT(other.Generation(), 7u);
}

TEST(session_registry, adopted_stopped_sandbox_is_replaced_on_use) {
    RegistryHarness h(Limits(4));
    auto handle = TrackedHandle("ctr-stopped", "alpha", 3, std::chrono::system_clock::now());
    handle.running = false;
    ASSERT_TRUE(h.registry.Adopt(handle));

    auto lease = h.registry.Resolve("alpha");
    EXPECT_TRUE(lease.Fresh());
    EXPECT_GT(lease.Generation(), 3u);
    EXPECT_NE(lease.Handle().container_id, "ctr-stopped");
    EXPECT_EQ(h.controller.Terminated(), std::vector<std::string>{"ctr-stopped"});
}

TEST(session_registry, adopt_rejects_unlabeled_containers) {
    RegistryHarness h(Limits(4));
    auto handle = TrackedHandle("ctr-x", "", 1, std::chrono::system_clock::now());
    EXPECT_THROW(h.registry.Adopt(handle), ValidationError);
}
