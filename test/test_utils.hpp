#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "git/VersionControlTool.hpp"

namespace baretree::test {

/**
 * @brief Test utilities for baretree tests
 *
 * Provides helper functions for creating temporary directories, test files
 * and real git repositories, plus a scripted VersionControlTool.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Canonical path to the temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 *
 * Read-only directories inside it are made writable first.
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name, may contain subdirectories
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Create multiple files in a directory
 * @param baseDir Base directory
 * @param files Vector of filename-content pairs
 */
void createFiles(
    const std::filesystem::path& baseDir,
    const std::vector<std::pair<std::string, std::string>>& files
);

/**
 * @brief Read file content
 * @param filePath Path to file
 * @return File content as string
 */
std::string readFile(const std::filesystem::path& filePath);

/**
 * @brief Check if a file exists and has given content
 * @param filePath Path to file
 * @param expectedContent Expected content
 * @return True if file exists and content matches
 */
bool fileHasContent(const std::filesystem::path& filePath, const std::string& expectedContent);

/// One node of a tree as seen through symlink_status
struct TreeEntry {
    std::string type;            // "file", "dir", "symlink" or "other"
    std::filesystem::perms permissions{std::filesystem::perms::none};
    std::string content;         // Regular files only
    std::string linkTarget;      // Symlinks only
};

/// Relative generic path -> entry, for every node below root (root itself excluded)
using TreeSnapshot = std::map<std::string, TreeEntry>;

/// Link-aware snapshot of a directory tree; symlinks are never followed
TreeSnapshot snapshotTree(const std::filesystem::path& root);

/**
 * @brief Compare a tree node by node against an earlier snapshot
 *
 * Type, permission bits, file content and symlink target must all match,
 * and neither side may have extra entries.
 */
::testing::AssertionResult sameTree(const TreeSnapshot& expected, const std::filesystem::path& root);

/// True when a git binary can be run
bool gitAvailable();

/**
 * @brief Run git with a fixed identity in dir
 *
 * Records a gtest failure when git exits non-zero.
 * @return Trimmed standard output
 */
std::string git(const std::filesystem::path& dir, const std::vector<std::string>& args);

/**
 * @brief Initialize a git repository on branch "main" with one commit
 * @param repoPath Path where repository should be initialized
 * @return Path to repository root
 */
std::filesystem::path initGitRepo(const std::filesystem::path& repoPath);

/// Stage everything and commit
void commitAll(const std::filesystem::path& repoPath, const std::string& message);

/**
 * @brief Scripted VersionControlTool
 *
 * Responses are keyed by the space-joined argument list. Unscripted calls
 * fail with ErrorCode::VcsFailed. Every call is recorded.
 */
class FakeVersionControlTool : public VersionControlTool {
public:
    struct Call {
        std::filesystem::path workDir;
        std::vector<std::string> args;
    };

    void respond(const std::string& joinedArgs, const std::string& output);
    void fail(const std::string& joinedArgs, const std::string& message);

    Expected<void> clone(const std::vector<std::string>& args) override;
    Expected<std::string> execute(const std::filesystem::path& workDir,
                                  const std::vector<std::string>& args) override;

    /// True when a call with exactly these joined arguments was made
    bool called(const std::string& joinedArgs) const;

    std::vector<Call> calls;

private:
    std::map<std::string, Expected<std::string>> responses;
};

std::string joinArgs(const std::vector<std::string>& args);

} // namespace utils

} // namespace baretree::test
