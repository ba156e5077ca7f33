#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace baretree {

/**
 * @brief One record of `git worktree list --porcelain`
 *
 * Records are blank-line separated:
 *   worktree /abs/path
 *   HEAD <hash>
 *   branch refs/heads/<name>   | detached | bare
 *   [locked [reason]] [prunable [reason]]
 *
 * The first record of an unfiltered listing is the main entry.
 */
struct WorktreeRecord {
    std::filesystem::path path;
    std::string head;          // Commit hash, empty for a bare entry
    std::string branch;        // Short branch name, empty when detached or bare
    bool detached{false};
    bool bare{false};
    bool isMain{false};
    bool locked{false};
    bool prunable{false};
};

/// Parse porcelain worktree listing output
std::vector<WorktreeRecord> parseWorktreeList(const std::string& porcelain);

}
