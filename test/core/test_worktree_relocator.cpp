#include <gtest/gtest.h>

#include <filesystem>

#include "test_utils.hpp"
#include "core/WorktreeRelocator.hpp"

namespace fs = std::filesystem;

using namespace baretree;
using namespace baretree::test::utils;

class WorktreeRelocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        root = tempDir / "repo";
        store = root / ".git";
        external = tempDir / "elsewhere" / "featx";
        fs::create_directories(store / "worktrees");
        makeArea("feature%2Fx", external, "ref: refs/heads/feature/x\n");
        createFile(external, "work.txt", "in progress");
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    /// Admin area plus the worktree link file pointing at it
    void makeArea(const std::string& name, const fs::path& worktree, const std::string& head) {
        fs::path area = store / "worktrees" / name;
        createFile(area, "HEAD", head);
        createFile(area, "commondir", "../..\n");
        createFile(area, "gitdir", (worktree / ".git").string() + "\n");
        createFile(worktree, ".git", "gitdir: " + area.string() + "\n");
    }

    ExternalWorktree featureWorktree() const {
        ExternalWorktree wt;
        wt.path = external;
        wt.branch = "feature/x";
        wt.head = "0123456789abcdef0123456789abcdef01234567";
        wt.adminAreaName = "feature%2Fx";
        return wt;
    }

    fs::path tempDir;
    fs::path root;
    fs::path store;
    fs::path external;
    FakeVersionControlTool vcs;
};

TEST_F(WorktreeRelocatorTest, DirectoryNameFromBranch) {
    ExternalWorktree wt = featureWorktree();
    EXPECT_EQ(relocatedDirName(wt), "feature/x");
    wt.detached = true;
    EXPECT_EQ(relocatedDirName(wt), "detached");
}

// Test: Admin area name is read from the worktree's link file
TEST_F(WorktreeRelocatorTest, DescribeExternalReadsLinkFile) {
    WorktreeRecord record;
    record.path = external;
    record.branch = "feature/x";
    record.head = "abc";

    auto wt = describeExternal(record);
    ASSERT_TRUE(wt.has_value()) << wt.error().message;
    EXPECT_EQ(wt.value().adminAreaName, "feature%2Fx");
    EXPECT_EQ(wt.value().branch, "feature/x");
    EXPECT_FALSE(wt.value().detached);
}

TEST_F(WorktreeRelocatorTest, DescribeExternalWithoutLinkFileFails) {
    WorktreeRecord record;
    record.path = tempDir / "gone";
    EXPECT_FALSE(describeExternal(record).has_value());
}

// Test: Numeric suffixes pick the first free name
TEST_F(WorktreeRelocatorTest, UniqueAdminName) {
    EXPECT_EQ(uniqueAdminName(store, "main"), "main");
    fs::create_directories(store / "worktrees" / "main");
    fs::create_directories(store / "worktrees" / "main1");
    EXPECT_EQ(uniqueAdminName(store, "main"), "main2");
}

// Test: Parking renames the area and repoints the worktree
TEST_F(WorktreeRelocatorTest, ParkAdminAreaRewritesLinkFile) {
    ExternalWorktree wt = featureWorktree();
    CompensationStack journal;
    auto res = parkAdminArea(wt, store, true, journal);
    ASSERT_TRUE(res.has_value()) << res.error().message;

    EXPECT_EQ(wt.adminAreaName, "feature%2Fx1");
    EXPECT_TRUE(fs::is_directory(store / "worktrees" / "feature%2Fx1"));
    EXPECT_FALSE(fs::exists(store / "worktrees" / "feature%2Fx"));
    EXPECT_TRUE(fileHasContent(external / ".git",
                               "gitdir: " + (store / "worktrees" / "feature%2Fx1").string() + "\n"));

    ASSERT_TRUE(journal.unwind().has_value());
    EXPECT_TRUE(fs::is_directory(store / "worktrees" / "feature%2Fx"));
    EXPECT_TRUE(fileHasContent(external / ".git",
                               "gitdir: " + (store / "worktrees" / "feature%2Fx").string() + "\n"));
}

// Test: Move mode relocates into <root>/<branch> and repairs the registration
TEST_F(WorktreeRelocatorTest, MoveRelocatesAndRepairs) {
    const fs::path target = root / "feature" / "x";
    vcs.respond("worktree repair " + target.string(), "");
    std::vector<std::string> warnings;

    auto moved = relocateWorktree(vcs, featureWorktree(), root, RelocationMode::Move, warnings);
    ASSERT_TRUE(moved.has_value()) << moved.error().message;
    EXPECT_EQ(moved.value(), target);
    EXPECT_FALSE(fs::exists(external));
    EXPECT_TRUE(fileHasContent(target / "work.txt", "in progress"));
    EXPECT_TRUE(fileHasContent(target / ".git",
                               "gitdir: " + (store / "worktrees" / "feature%2Fx").string() + "\n"));
    EXPECT_TRUE(fileHasContent(store / "worktrees" / "feature%2Fx" / "gitdir", (target / ".git").string() + "\n"));
    EXPECT_TRUE(fileHasContent(store / "worktrees" / "feature%2Fx" / "HEAD", "ref: refs/heads/feature/x\n"));
    EXPECT_TRUE(vcs.called("worktree repair " + target.string()));
}

// Test: A failed repair puts everything back where it was
TEST_F(WorktreeRelocatorTest, FailedRepairRollsBack) {
    std::vector<std::string> warnings;
    auto moved = relocateWorktree(vcs, featureWorktree(), root, RelocationMode::Move, warnings);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, ErrorCode::VcsFailed);

    EXPECT_TRUE(fileHasContent(external / "work.txt", "in progress"));
    EXPECT_TRUE(fileHasContent(external / ".git",
                               "gitdir: " + (store / "worktrees" / "feature%2Fx").string() + "\n"));
    EXPECT_TRUE(fileHasContent(store / "worktrees" / "feature%2Fx" / "gitdir", (external / ".git").string() + "\n"));
    EXPECT_FALSE(fs::exists(root / "feature"));
}

// Test: Copy mode leaves the original untouched and writes a fresh link file
TEST_F(WorktreeRelocatorTest, CopyKeepsOriginal) {
    std::vector<std::string> warnings;
    auto copied = relocateWorktree(vcs, featureWorktree(), root, RelocationMode::Copy, warnings);
    ASSERT_TRUE(copied.has_value()) << copied.error().message;

    const fs::path target = root / "feature" / "x";
    EXPECT_TRUE(fileHasContent(external / "work.txt", "in progress"));
    EXPECT_TRUE(fileHasContent(target / "work.txt", "in progress"));
    EXPECT_TRUE(fileHasContent(target / ".git",
                               "gitdir: " + (store / "worktrees" / "feature%2Fx").string() + "\n"));
    EXPECT_TRUE(vcs.calls.empty());
}

// Test: An area under another name is renamed to the escaped directory name
TEST_F(WorktreeRelocatorTest, AreaRenamedToDirectoryName) {
    fs::path other = tempDir / "elsewhere" / "hotfix";
    makeArea("hotfix-wt", other, "ref: refs/heads/hotfix\n");
    ExternalWorktree wt;
    wt.path = other;
    wt.branch = "hotfix";
    wt.adminAreaName = "hotfix-wt";

    std::vector<std::string> warnings;
    auto copied = relocateWorktree(vcs, wt, root, RelocationMode::Copy, warnings);
    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_TRUE(fs::is_directory(store / "worktrees" / "hotfix"));
    EXPECT_FALSE(fs::exists(store / "worktrees" / "hotfix-wt"));
}

TEST_F(WorktreeRelocatorTest, ExistingTargetIsRejected) {
    fs::create_directories(root / "feature" / "x");
    std::vector<std::string> warnings;
    auto moved = relocateWorktree(vcs, featureWorktree(), root, RelocationMode::Move, warnings);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, ErrorCode::DestinationExists);
    EXPECT_TRUE(fs::exists(external / "work.txt"));
}

// Test: One failure does not stop the remaining worktrees
TEST_F(WorktreeRelocatorTest, BatchContinuesPastFailures) {
    fs::create_directories(root / "feature" / "x");
    fs::path other = tempDir / "elsewhere" / "hotfix";
    makeArea("hotfix", other, "ref: refs/heads/hotfix\n");
    ExternalWorktree hotfix;
    hotfix.path = other;
    hotfix.branch = "hotfix";
    hotfix.adminAreaName = "hotfix";

    auto report = relocateExternalWorktrees(vcs, {featureWorktree(), hotfix}, root, RelocationMode::Copy);
    EXPECT_EQ(report.failures.size(), 1u);
    ASSERT_EQ(report.relocated.size(), 1u);
    EXPECT_EQ(report.relocated[0], root / "hotfix");
}
