#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "git/VersionControlTool.hpp"
#include "git/WorktreeList.hpp"
#include "util/Expected.hpp"

namespace baretree {

/**
 * @brief Typed wrappers around the fixed set of git calls the engine makes
 *
 * Each function maps to a single porcelain/plumbing invocation (or a short
 * fallback chain) and converts its text output into a value.
 */
namespace GitQueries {

/// `rev-parse --is-bare-repository` in dir
Expected<bool> isBareRepository(VersionControlTool& vcs, const std::filesystem::path& dir);

/// `rev-parse --abbrev-ref HEAD`; returns "HEAD" when detached
Expected<std::string> currentBranch(VersionControlTool& vcs, const std::filesystem::path& dir);

/// `worktree list --porcelain`, parsed
Expected<std::vector<WorktreeRecord>> listWorktrees(VersionControlTool& vcs, const std::filesystem::path& dir);

/**
 * @brief Detect the default branch of a store
 *
 * Uses `symbolic-ref refs/remotes/origin/HEAD`; without a remote HEAD falls
 * back to the first of "main", "master" that exists as a local branch.
 */
Expected<std::string> defaultBranch(VersionControlTool& vcs, const std::filesystem::path& storeDir);

/// `config --bool core.bare <value>` in storeDir
Expected<void> setBare(VersionControlTool& vcs, const std::filesystem::path& storeDir, bool bare);

/// `config --bool core.bare` in storeDir; false when unset
Expected<bool> isBareConfigured(VersionControlTool& vcs, const std::filesystem::path& storeDir);

/// URL of remote "origin", else of the first configured remote
Expected<std::string> remoteUrl(VersionControlTool& vcs, const std::filesystem::path& dir);

/**
 * @brief `config --file <configFile> <key> <value>` run in workDir
 *
 * workDir must not be a git directory with a stale core.worktree (a
 * submodule's own module directory, for instance): git chdirs there first.
 */
Expected<void> setConfigInFile(VersionControlTool& vcs, const std::filesystem::path& workDir,
                               const std::filesystem::path& configFile,
                               const std::string& key, const std::string& value);

/// `config --global --get-all <key>`; empty when the key is unset
std::vector<std::string> globalConfigValues(VersionControlTool& vcs, const std::string& key);

/// `worktree add <path> <branch>` run in storeDir
Expected<void> addWorktree(VersionControlTool& vcs, const std::filesystem::path& storeDir,
                           const std::filesystem::path& path, const std::string& branch);

/// `worktree repair <path>` run in storeDir
Expected<void> repairWorktree(VersionControlTool& vcs, const std::filesystem::path& storeDir,
                              const std::filesystem::path& path);

}

}
