#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

using namespace baretree;
using namespace baretree::test::utils;

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    std::string bareQuery() const {
        return "config --file " + (tempDir / ".git" / "config").string() + " --bool core.bare";
    }

    fs::path tempDir;
    FakeVersionControlTool vcs;
};

// Test: Discover repository root from subdirectory
TEST_F(RepositoryTest, DiscoverRootFromSubdirectory) {
    fs::create_directories(tempDir / ".git");
    fs::path deep = tempDir / "a" / "b" / "c";
    fs::create_directories(deep);

    auto result = Repository::discoverRoot(deep);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

// Test: A .git link file also marks a root
TEST_F(RepositoryTest, DiscoverRootAcceptsLinkFile) {
    createFile(tempDir, ".git", "gitdir: /elsewhere\n");
    auto result = Repository::discoverRoot(tempDir);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

TEST_F(RepositoryTest, DiscoverFailsNotInRepository) {
    auto result = Repository::discoverRoot("/");
    if (result.has_value()) GTEST_SKIP() << "filesystem root is inside a repository";
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
}

TEST_F(RepositoryTest, LayoutNone) {
    Repository repo(vcs, tempDir);
    auto layout = repo.detectLayout();
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout.value(), RepositoryLayout::None);
    EXPECT_TRUE(vcs.calls.empty());
}

TEST_F(RepositoryTest, LayoutLinkedWorktree) {
    createFile(tempDir, ".git", "gitdir: /r/.git/worktrees/main\n");
    Repository repo(vcs, tempDir);
    auto layout = repo.detectLayout();
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout.value(), RepositoryLayout::LinkedWorktree);
}

// Test: A .git directory is split only when core.bare is set
TEST_F(RepositoryTest, LayoutEmbeddedAndSplit) {
    fs::create_directories(tempDir / ".git");
    Repository repo(vcs, tempDir);

    vcs.respond(bareQuery(), "false");
    auto embedded = repo.detectLayout();
    ASSERT_TRUE(embedded.has_value());
    EXPECT_EQ(embedded.value(), RepositoryLayout::Embedded);

    vcs.respond(bareQuery(), "true");
    auto split = repo.detectLayout();
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split.value(), RepositoryLayout::Split);
}

TEST_F(RepositoryTest, LayoutBare) {
    createFile(tempDir, "HEAD", "ref: refs/heads/main\n");
    vcs.respond("rev-parse --is-bare-repository", "true");
    Repository repo(vcs, tempDir);
    auto layout = repo.detectLayout();
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout.value(), RepositoryLayout::Bare);
}

// Test: Split config keys are written to the store config file
TEST_F(RepositoryTest, InitializeSplitConfig) {
    fs::create_directories(tempDir / ".git");
    const std::string config = (tempDir / ".git" / "config").string();
    vcs.respond("config --file " + config + " baretree.baredir .git", "");
    vcs.respond("config --file " + config + " baretree.defaultbranch main", "");

    Repository repo(vcs, tempDir);
    auto res = repo.initializeSplitConfig("main");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(vcs.calls.size(), 2u);
}

TEST_F(RepositoryTest, LayoutNames) {
    EXPECT_STREQ(layoutName(RepositoryLayout::Split), "split");
    EXPECT_STREQ(layoutName(RepositoryLayout::LinkedWorktree), "linked worktree");
}
