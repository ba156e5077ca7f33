#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "git/VersionControlTool.hpp"

namespace baretree {

struct SubmoduleRewriteReport {
    std::vector<std::filesystem::path> rewritten;   // Gitlink files updated
    std::vector<std::string> warnings;
};

/// Module id from a gitlink pointer: "../../.git/modules/libs/mylib" -> "libs/mylib"; empty when none
std::string moduleIdFromPointer(const std::string& pointer);

/**
 * @brief Relative gitlink pointer for a submodule checked out at submoduleDir
 *
 * One ".." per directory level from submoduleDir up to the worktree root,
 * plus one per level from the worktree root up to the repository root.
 */
std::string submodulePointer(const std::filesystem::path& worktree, const std::filesystem::path& repoRoot,
                             const std::filesystem::path& submoduleDir, const std::string& moduleId);

/**
 * @brief Recompute every submodule gitlink below a relocated worktree
 *
 * Does nothing when the worktree has no .gitmodules. Each gitlink pointing
 * into <store>/modules/ is rewritten, then the module's core.worktree is set
 * relative to its new location with `git config --file`. Problems become
 * warnings; the walk always completes.
 *
 * @param repoRoot Directory holding the store (<repoRoot>/.git)
 */
SubmoduleRewriteReport rewriteSubmodules(VersionControlTool& vcs, const std::filesystem::path& worktree,
                                         const std::filesystem::path& repoRoot);

}
