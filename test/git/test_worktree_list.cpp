#include <gtest/gtest.h>

#include "git/WorktreeList.hpp"

using namespace baretree;

TEST(WorktreeListTest, ParsesPorcelainRecords) {
    const std::string porcelain =
        "worktree /home/dev/project\n"
        "HEAD 1111111111111111111111111111111111111111\n"
        "branch refs/heads/main\n"
        "\n"
        "worktree /home/dev/project-feature\n"
        "HEAD 2222222222222222222222222222222222222222\n"
        "branch refs/heads/feature/x\n"
        "locked reason here\n"
        "\n"
        "worktree /tmp/review\n"
        "HEAD 3333333333333333333333333333333333333333\n"
        "detached\n"
        "prunable gitdir file points to non-existent location\n";

    auto records = parseWorktreeList(porcelain);
    ASSERT_EQ(records.size(), 3u);

    EXPECT_TRUE(records[0].isMain);
    EXPECT_EQ(records[0].path, "/home/dev/project");
    EXPECT_EQ(records[0].branch, "main");

    EXPECT_FALSE(records[1].isMain);
    EXPECT_EQ(records[1].branch, "feature/x");
    EXPECT_TRUE(records[1].locked);
    EXPECT_FALSE(records[1].detached);

    EXPECT_TRUE(records[2].detached);
    EXPECT_TRUE(records[2].branch.empty());
    EXPECT_TRUE(records[2].prunable);
    EXPECT_EQ(records[2].head, "3333333333333333333333333333333333333333");
}

TEST(WorktreeListTest, BareEntryAndCrLf) {
    auto records = parseWorktreeList("worktree /srv/repo.git\r\nbare\r\n\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].bare);
    EXPECT_EQ(records[0].path, "/srv/repo.git");
}

TEST(WorktreeListTest, EmptyOutput) {
    EXPECT_TRUE(parseWorktreeList("").empty());
    EXPECT_TRUE(parseWorktreeList("\n\n").empty());
}
