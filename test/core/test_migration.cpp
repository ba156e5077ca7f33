#include <gtest/gtest.h>

#include <filesystem>

#include "test_utils.hpp"
#include "core/Migration.hpp"

namespace fs = std::filesystem;

using namespace baretree;
using namespace baretree::test::utils;

/**
 * @brief Validation paths of the migrator, driven by a scripted git
 *
 * None of these may touch the filesystem; full migrations run against real
 * git in the integration tests.
 */
class MigrationValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        repo = tempDir / "project";
        fs::create_directories(repo / ".git");
        createFile(repo, "README.md", "hello");
        settings.roots = {tempDir / "managed"};
        settings.user = "octo";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    void scriptEmbedded(const std::string& branch) {
        vcs.respond("config --file " + (repo / ".git" / "config").string() + " --bool core.bare", "false");
        vcs.respond("rev-parse --abbrev-ref HEAD", branch);
        vcs.respond("worktree list --porcelain", "worktree " + repo.string() + "\nHEAD abc\nbranch refs/heads/" +
                    branch + "\n");
    }

    /// Every call so far was a read-only query
    void expectNoMutatingCalls() const {
        for (const auto& call : vcs.calls) {
            const std::string joined = joinArgs(call.args);
            EXPECT_EQ(joined.find("core.bare true"), std::string::npos) << joined;
            EXPECT_EQ(joined.find("worktree add"), std::string::npos) << joined;
        }
    }

    fs::path tempDir;
    fs::path repo;
    Settings settings;
    FakeVersionControlTool vcs;
};

TEST_F(MigrationValidationTest, StageNames) {
    EXPECT_STREQ(stageName(MigrationStage::Validating), "validating");
    EXPECT_STREQ(stageName(MigrationStage::SynthesizingLinks), "synthesizing-links");
    EXPECT_STREQ(stageName(MigrationStage::RelocatingExternalWorktrees), "relocating-external-worktrees");
    EXPECT_STREQ(stageName(MigrationStage::Failed), "failed");
}

TEST_F(MigrationValidationTest, NotARepository) {
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(tempDir / "nothing-here");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
    EXPECT_EQ(res.error().message.rfind("validating: ", 0), 0u);
    EXPECT_EQ(migrator.stage(), MigrationStage::Failed);
}

// Test: A subdirectory is rejected, naming the repository root to use instead
TEST_F(MigrationValidationTest, SubdirectoryNamesEnclosingRoot) {
    fs::create_directories(repo / "src");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(repo / "src");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
    EXPECT_NE(res.error().message.find("inside " + repo.string()), std::string::npos) << res.error().message;
    expectNoMutatingCalls();
}

TEST_F(MigrationValidationTest, AlreadySplit) {
    vcs.respond("config --file " + (repo / ".git" / "config").string() + " --bool core.bare", "true");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(repo);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::AlreadySplit);
}

TEST_F(MigrationValidationTest, LinkedWorktreeIsRejected) {
    fs::path linked = tempDir / "linked";
    createFile(linked, ".git", "gitdir: " + (repo / ".git" / "worktrees" / "linked").string() + "\n");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(linked);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
}

TEST_F(MigrationValidationTest, DetachedHeadIsRejected) {
    scriptEmbedded("HEAD");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(repo);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::DetachedHead);
    expectNoMutatingCalls();
    EXPECT_TRUE(fileHasContent(repo / "README.md", "hello"));
}

// Test: A branch named after an existing top-level directory stops before any change
TEST_F(MigrationValidationTest, BranchCollidingWithDirectory) {
    createFile(repo, "docs/index.md", "docs");
    scriptEmbedded("docs");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateInPlace(repo);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::LayoutConflict);
    expectNoMutatingCalls();
    EXPECT_TRUE(fileHasContent(repo / "docs" / "index.md", "docs"));
}

TEST_F(MigrationValidationTest, DestinationExists) {
    scriptEmbedded("main");
    fs::path dest = tempDir / "taken";
    createFile(dest, "keep.txt", "mine");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateToDestination(repo, dest);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::DestinationExists);
    EXPECT_TRUE(fileHasContent(dest / "keep.txt", "mine"));
    expectNoMutatingCalls();
}

TEST_F(MigrationValidationTest, DestinationInsideSource) {
    scriptEmbedded("main");
    Migrator migrator(vcs, settings);
    auto res = migrator.migrateToDestination(repo, repo / "split");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::PathOverlap);
    EXPECT_FALSE(fs::exists(repo / "split"));
}

// Test: Managed destination from an explicit path and from the remote URL
TEST_F(MigrationValidationTest, ManagedDestination) {
    Migrator migrator(vcs, settings);
    auto fromOverride = migrator.managedDestination(repo, "team/tool");
    ASSERT_TRUE(fromOverride.has_value()) << fromOverride.error().message;
    EXPECT_EQ(fromOverride.value(), tempDir / "managed" / "github.com" / "team" / "tool");

    auto shortest = migrator.managedDestination(repo, "tool");
    ASSERT_TRUE(shortest.has_value()) << shortest.error().message;
    EXPECT_EQ(shortest.value(), tempDir / "managed" / "github.com" / "octo" / "tool");

    vcs.respond("config --get remote.origin.url", "git@gitlab.com:group/project.git");
    auto fromRemote = migrator.managedDestination(repo, "");
    ASSERT_TRUE(fromRemote.has_value()) << fromRemote.error().message;
    EXPECT_EQ(fromRemote.value(), tempDir / "managed" / "gitlab.com" / "group" / "project");
}

// Test: A migrator built from default settings resolves under the home default root
TEST_F(MigrationValidationTest, ManagedDestinationWithDefaultSettings) {
    Migrator migrator(vcs, Settings{});
    auto dest = migrator.managedDestination(repo, "github.com/team/tool");
    ASSERT_TRUE(dest.has_value()) << dest.error().message;
    EXPECT_EQ(dest.value().parent_path().parent_path().parent_path().filename(), fs::path("baretree"));
    EXPECT_EQ(dest.value().filename(), fs::path("tool"));
}

TEST_F(MigrationValidationTest, ManagedDestinationWithoutRemote) {
    Migrator migrator(vcs, settings);
    auto res = migrator.managedDestination(repo, "");
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().message.find("--path"), std::string::npos);
}
