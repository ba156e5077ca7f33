#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/CompensationStack.hpp"
#include "git/VersionControlTool.hpp"
#include "git/WorktreeList.hpp"
#include "util/Expected.hpp"

namespace baretree {

/// Worktree registered with the store but living outside the repository root
struct ExternalWorktree {
    std::filesystem::path path;
    std::string head;
    std::string branch;
    bool detached{false};
    std::string adminAreaName;   // Current area under <store>/worktrees, from the link file
};

enum class RelocationMode {
    Move,   // In-place flow: the directory moves, git worktree repair validates
    Copy    // Cross-location flow: the directory is copied, the source survives
};

struct RelocationReport {
    std::vector<std::filesystem::path> relocated;
    std::vector<std::string> failures;   // "<path>: <reason>"
    std::vector<std::string> warnings;
};

/// Directory name under the new root: the branch, or "detached"
std::string relocatedDirName(const ExternalWorktree& wt);

/**
 * @brief Build an ExternalWorktree from a porcelain record
 *
 * Reads the worktree's link file to learn which admin area it uses.
 * Detached state comes from the record's detached marker only.
 */
Expected<ExternalWorktree> describeExternal(const WorktreeRecord& record);

/// First of base, base1, base2, ... with no entry under <store>/worktrees
std::string uniqueAdminName(const std::filesystem::path& store, const std::string& base);

/**
 * @brief Move an external worktree's admin area out of the way of another name
 *
 * Renames <store>/worktrees/<wt.adminAreaName> to a unique name and updates
 * wt.adminAreaName. With rewriteLinkFile the worktree's own link file is
 * repointed too (only when the store is the one the worktree uses).
 */
Expected<void> parkAdminArea(ExternalWorktree& wt, const std::filesystem::path& store, bool rewriteLinkFile,
                             CompensationStack& journal);

/**
 * @brief Relocate one external worktree to <root>/<dir name>
 *
 * Fails fast when the target exists. Any failure unwinds this worktree's own
 * compensation stack once; a double failure returns ErrorCode::RollbackFailed.
 *
 * @return The new worktree path
 */
Expected<std::filesystem::path> relocateWorktree(VersionControlTool& vcs, const ExternalWorktree& wt,
                                                 const std::filesystem::path& root, RelocationMode mode,
                                                 std::vector<std::string>& warnings);

/// Relocate every worktree in order; a failure is recorded and the rest still run
RelocationReport relocateExternalWorktrees(VersionControlTool& vcs, const std::vector<ExternalWorktree>& worktrees,
                                           const std::filesystem::path& root, RelocationMode mode);

}
