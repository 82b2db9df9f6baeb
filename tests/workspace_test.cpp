#include "sandkeep/core/errors.hpp"
#include "sandkeep/core/file_identity_map.hpp"
#include "sandkeep/core/session_workspace.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace sandkeep::core;
using sandkeep::testing::TempDir;
using sandkeep::testing::WriteText;

// ============================================================================
// SessionWorkspace
// ============================================================================

class session_workspace : public ::testing::Test {
protected:
    TempDir dir_;
    SessionWorkspace workspace_{dir_.Path() / "host", dir_.Path() / "internal", "/mnt/data"};
};

TEST_F(session_workspace, host_and_internal_views) {
    EXPECT_EQ(workspace_.HostDir("s1").string(), (dir_.Path() / "host" / "s1").string());
    EXPECT_EQ(workspace_.InternalDir("s1").string(), (dir_.Path() / "internal" / "s1").string());
    EXPECT_EQ(workspace_.SandboxMount().string(), "/mnt/data");
    EXPECT_THROW(workspace_.InternalDir("../s1"), ValidationError);
    EXPECT_THROW(workspace_.HostDir(""), ValidationError);
}

TEST_F(session_workspace, write_read_and_wipe) {
    auto relative = workspace_.WriteFile("s1", "data.csv", "a,b\n1,2\n");
    EXPECT_EQ(relative.string(), "data.csv");
    EXPECT_TRUE(fs::exists(dir_.Path() / "internal" / "s1" / "data.csv"));
    EXPECT_EQ(workspace_.ReadFile("s1", "data.csv"), "a,b\n1,2\n");

    // No temporary files left behind
    auto snapshot = workspace_.Scan("s1");
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.begin()->second.size, 8u);

    EXPECT_TRUE(workspace_.Wipe("s1"));
    EXPECT_FALSE(fs::exists(dir_.Path() / "internal" / "s1"));
    EXPECT_THROW(workspace_.ReadFile("s1", "data.csv"), FileNotFound);
    // Wiping twice is fine
    EXPECT_TRUE(workspace_.Wipe("s1"));
}

TEST_F(session_workspace, rejects_paths_outside_the_session) {
    workspace_.Prepare("s1");
    WriteText(dir_.Path() / "internal" / "s2" / "secret.txt", "other session");
    WriteText(dir_.Path() / "outside.txt", "host file");

    EXPECT_THROW(workspace_.ReadFile("s1", "../s2/secret.txt"), FileNotFound);
    EXPECT_THROW(workspace_.ReadFile("s1", "../../outside.txt"), FileNotFound);
    EXPECT_THROW(workspace_.ReadFile("s1", "/etc/passwd"), FileNotFound);
    EXPECT_THROW(workspace_.ReadFile("s1", "."), FileNotFound);
}

TEST_F(session_workspace, symlinks_are_not_followed) {
    workspace_.Prepare("s1");
    WriteText(dir_.Path() / "outside.txt", "host file");
    fs::create_symlink(dir_.Path() / "outside.txt", dir_.Path() / "internal" / "s1" / "link.txt");

    EXPECT_THROW(workspace_.ReadFile("s1", "link.txt"), FileNotFound);
    EXPECT_TRUE(workspace_.Scan("s1").empty());

    // An upload over the link replaces the link, not its target
    workspace_.WriteFile("s1", "link.txt", "upload");
    EXPECT_EQ(workspace_.ReadFile("s1", "link.txt"), "upload");
    EXPECT_FALSE(fs::is_symlink(dir_.Path() / "internal" / "s1" / "link.txt"));
}

TEST_F(session_workspace, write_rejects_path_names) {
    EXPECT_THROW(workspace_.WriteFile("s1", "a/b.txt", "x"), ValidationError);
    EXPECT_THROW(workspace_.WriteFile("s1", "", "x"), ValidationError);
}

TEST_F(session_workspace, scan_and_change_detection) {
    const auto root = dir_.Path() / "internal" / "s1";
    WriteText(root / "keep.txt", "one");
    WriteText(root / "sub" / "nested.csv", "1,2");
    auto before = workspace_.Scan("s1");
    EXPECT_EQ(before.size(), 2u);

    WriteText(root / "new.png", "png");
    WriteText(root / "keep.txt", "changed size");
    auto after = workspace_.Scan("s1");

    std::set<std::string> changed;
    for (const auto& path : SessionWorkspace::Changed(before, after)) {
        changed.insert(path.string());
    }
    EXPECT_EQ(changed, (std::set<std::string>{"keep.txt", "new.png"}));
}

TEST(session_workspace_visibility, hidden_and_cache_files) {
    EXPECT_TRUE(SessionWorkspace::IsVisible("plot.png"));
    EXPECT_TRUE(SessionWorkspace::IsVisible("out/plot.png"));
    EXPECT_FALSE(SessionWorkspace::IsVisible(".matplotlib/cache"));
    EXPECT_FALSE(SessionWorkspace::IsVisible("__pycache__/x.pyc"));
    EXPECT_FALSE(SessionWorkspace::IsVisible(".data.csv.abc.part"));
    EXPECT_FALSE(SessionWorkspace::IsVisible(""));
}

// ============================================================================
// FileIdentityMap
// ============================================================================

TEST(file_identity_map, register_is_idempotent_per_path) {
    FileIdentityMap files("s1", 4);
    auto a = files.Register("plot.png", "image/png");
    auto b = files.Register("./plot.png", "image/png");
    auto c = files.Register("data.csv", "text/csv");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.size(), 21u);
    EXPECT_EQ(files.Size(), 2u);

    auto record = files.Resolve("s1", a);
    EXPECT_EQ(record.FileName(), "plot.png");
    EXPECT_EQ(record.generation, 4u);
    EXPECT_EQ(record.session_key, "s1");
}

TEST(file_identity_map, resolve_is_scoped_to_session) {
    FileIdentityMap files("s1", 1);
    auto id = files.Register("a.txt", "text/plain");

    EXPECT_THROW(files.Resolve("s2", id), FileNotFound);
    EXPECT_THROW(files.Resolve("s1", "V1StGXR8_Z5jdHi6B-myT"), FileNotFound);
}

TEST(file_identity_map, ids_do_not_survive_a_new_generation) {
    FileIdentityMap old_generation("s1", 1);
    auto id = old_generation.Register("a.txt", "text/plain");

    FileIdentityMap new_generation("s1", 2);
    new_generation.Register("a.txt", "text/plain");
    EXPECT_THROW(new_generation.Resolve("s1", id), FileNotFound);
}

TEST(file_identity_map, prune_and_list_order) {
    FileIdentityMap files("s1", 1);
    auto first = files.Register("first.txt", "text/plain");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto second = files.Register("second.txt", "text/plain");
    files.Register("gone.txt", "text/plain");

    EXPECT_EQ(files.Prune({"first.txt", "second.txt"}), 1u);
    auto list = files.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].external_id, first);
    EXPECT_EQ(list[1].external_id, second);
    EXPECT_FALSE(files.Find("gone.txt").has_value());

    files.Clear();
    EXPECT_EQ(files.Size(), 0u);
    EXPECT_THROW(files.Resolve("s1", first), FileNotFound);
}
