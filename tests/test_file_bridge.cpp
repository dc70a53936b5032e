#include "cloister/core/errors.hpp"
#include "cloister/core/file_bridge.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <functional>

namespace fs = std::filesystem;
using namespace cloister::core;

namespace {

ErrorKind KindOf(const std::function<void()>& fn) {
    try {
        fn();
    }
    catch (const SandboxError& e) {
        return e.Kind();
    }
    ADD_FAILURE() << "expected SandboxError";
    return ErrorKind::CONFIGURATION;
}

std::size_t CountEntries(const fs::path& dir) {
    std::size_t count = 0;
    for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace

class FileBridgeTest : public cloister::testing::TempRootTest {};

TEST_F(FileBridgeTest, SessionDirIsPrivateAndBelowRoot) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir("job-");

    EXPECT_TRUE(fs::is_directory(session));
    EXPECT_TRUE(FileBridge::IsHostPathWithin(root_, session));
    EXPECT_EQ(session.filename().string().rfind("job-", 0), 0u);
    EXPECT_EQ(fs::status(session).permissions() & fs::perms::all, fs::perms::owner_all);
    EXPECT_EQ(bridge.ActiveSessions().size(), 1u);
}

TEST_F(FileBridgeTest, EmptyPrefixDefaults) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir("");
    EXPECT_EQ(session.filename().string().rfind("sandbox-", 0), 0u);
    EXPECT_NE(bridge.CreateSessionDir(""), session);
}

TEST_F(FileBridgeTest, PrefixWithSeparatorsIsRejected) {
    FileBridge bridge(config_);
    EXPECT_EQ(KindOf([&] { bridge.CreateSessionDir("../up-"); }), ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.CreateSessionDir("a/b-"); }), ErrorKind::SECURITY_VIOLATION);
    EXPECT_TRUE(bridge.ActiveSessions().empty());
}

TEST_F(FileBridgeTest, StagesFilesAsReadOnlyMounts) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    auto mounts = bridge.PrepareFilesForMount(session, {
        {"main.py", "print('ok')\n"},
        {"pkg/util.py", "X = 1\n"},
    });

    ASSERT_EQ(mounts.size(), 2u);
    EXPECT_EQ(mounts[0].container_path, "/workspace/main.py");
    EXPECT_EQ(mounts[1].container_path, "/workspace/pkg/util.py");
    for (const auto& mount : mounts) {
        EXPECT_TRUE(mount.read_only);
        EXPECT_TRUE(fs::exists(mount.host_path));
    }

    std::ifstream in(session / "main.py");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "print('ok')\n");

    auto staged = bridge.StagedFiles(session);
    ASSERT_EQ(staged.size(), 2u);
    EXPECT_EQ(staged[0].size_bytes, 12u);
    EXPECT_EQ(staged[0].sha256.size(), 64u);
}

TEST_F(FileBridgeTest, TraversalKeyRejectsWholeBatchBeforeWriting) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    EXPECT_EQ(KindOf([&] {
        bridge.PrepareFilesForMount(session, {
            {"main.py", "print('ok')"},
            {"zz/../../escape.py", "evil"},
        });
    }), ErrorKind::SECURITY_VIOLATION);

    EXPECT_EQ(CountEntries(session), 0u);
    EXPECT_FALSE(fs::exists(root_ / "escape.py"));
}

TEST_F(FileBridgeTest, AbsoluteAndParentKeysAreRejected) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"/etc/passwd", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"../sibling.py", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"dir/", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
}

TEST_F(FileBridgeTest, SymlinkEscapingSessionIsRejected) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();
    auto outside = root_ / "outside";
    fs::create_directories(outside);
    fs::create_directory_symlink(outside, session / "link");

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"link/payload.py", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_FALSE(fs::exists(outside / "payload.py"));
}

TEST_F(FileBridgeTest, BlockedExtensionsAreRejectedCaseInsensitively) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"tool.exe", "MZ"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"lib/evil.SO", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
}

TEST_F(FileBridgeTest, AllowListAppliesToFilesWithExtensions) {
    config_.allowed_extensions = {".py"};
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"notes.txt", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_NO_THROW(bridge.PrepareFilesForMount(session, {{"main.py", "x"}, {"Makefile", "all:"}}));
}

TEST_F(FileBridgeTest, SizeAndCountQuotas) {
    config_.max_file_size_bytes = 8;
    config_.max_file_count = 2;
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(session, {{"big.py", "123456789"}}); }),
              ErrorKind::RESOURCE_LIMIT);
    EXPECT_EQ(KindOf([&] {
        bridge.PrepareFilesForMount(session, {{"a.py", ""}, {"b.py", ""}, {"c.py", ""}});
    }), ErrorKind::RESOURCE_LIMIT);
    EXPECT_EQ(CountEntries(session), 0u);
}

TEST_F(FileBridgeTest, SessionOutsideRootIsRejected) {
    FileBridge bridge(config_);
    auto elsewhere = fs::temp_directory_path();

    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(elsewhere, {{"a.py", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.PrepareFilesForMount(root_, {{"a.py", "x"}}); }),
              ErrorKind::SECURITY_VIOLATION);
}

TEST_F(FileBridgeTest, OutputDirIsTheOnlyWritableMount) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();

    auto mount = bridge.CreateOutputDir(session, "out");
    EXPECT_FALSE(mount.read_only);
    EXPECT_EQ(mount.container_path, "/workspace/out");
    EXPECT_TRUE(fs::is_directory(session / "out"));
    EXPECT_EQ(fs::status(session / "out").permissions() & fs::perms::all, fs::perms::all);

    EXPECT_EQ(KindOf([&] { bridge.CreateOutputDir(session, "../out"); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.CreateOutputDir(session, "a/b"); }),
              ErrorKind::SECURITY_VIOLATION);
}

TEST_F(FileBridgeTest, CleanupIsIdempotentAndRemovesTree) {
    FileBridge bridge(config_);
    auto session = bridge.CreateSessionDir();
    bridge.PrepareFilesForMount(session, {{"deep/nested/file.py", "x"}});

    bridge.CleanupSessionDir(session);
    EXPECT_FALSE(fs::exists(session));
    EXPECT_TRUE(bridge.ActiveSessions().empty());

    EXPECT_NO_THROW(bridge.CleanupSessionDir(session));
}

TEST_F(FileBridgeTest, CleanupRefusesPathsOutsideRoot) {
    FileBridge bridge(config_);

    EXPECT_EQ(KindOf([&] { bridge.CleanupSessionDir(root_); }), ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.CleanupSessionDir(root_ / ".." / "victim"); }),
              ErrorKind::SECURITY_VIOLATION);
    EXPECT_EQ(KindOf([&] { bridge.CleanupSessionDir("/etc"); }), ErrorKind::SECURITY_VIOLATION);
    EXPECT_TRUE(fs::exists(root_));
}

TEST(ContainerPathTest, LexicalContainment) {
    EXPECT_TRUE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repo"));
    EXPECT_FALSE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repo", false));
    EXPECT_TRUE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repo/src/a.py"));
    EXPECT_TRUE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repo/src/../b"));
    EXPECT_FALSE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repo/../secret"));
    EXPECT_FALSE(FileBridge::IsContainerPathWithin("/workspace/repo", "/workspace/repository"));
    EXPECT_FALSE(FileBridge::IsContainerPathWithin("/workspace/repo", "relative/path"));
    EXPECT_FALSE(FileBridge::IsContainerPathWithin("/workspace/repo", "/etc/passwd"));
}
