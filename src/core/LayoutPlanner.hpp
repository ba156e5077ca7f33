#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "util/Expected.hpp"
#include "util/NodeInfo.hpp"

namespace baretree {

/// Top-level entry of the source content directory, captured before any mutation
struct EntrySnapshot {
    std::string name;
    bool isDirectory{false};   // Real directory (symlinks to directories are not)
};

enum class PlacementKind {
    Rename,          // Disjoint: the entry moves/copies as a whole
    MergeInto,       // Destination directory already exists: children are merged
    ExcludeTarget    // Entry contains the target: transplanted around the target subtree
};

struct Placement {
    std::filesystem::path source;
    std::filesystem::path destination;
    PlacementKind kind{PlacementKind::Rename};
};

/**
 * @brief Result of planning a worktree layout
 *
 * createdDirectories lists, outermost first, every directory between the
 * root and the target (target included) that does not exist yet. The first
 * of them is the subtree an ExcludeTarget placement must leave alone.
 */
struct LayoutPlan {
    std::filesystem::path target;
    std::vector<std::filesystem::path> createdDirectories;
    std::vector<Placement> placements;

    const std::filesystem::path& excludedSubtree() const { return createdDirectories.front(); }
};

/// Reports the node type found at a path; injectable for tests
using PathProbe = std::function<NodeType(const std::filesystem::path&)>;

/// Probe backed by a link-aware stat of the real filesystem
PathProbe filesystemProbe();

/**
 * @brief Validate a branch name and map it to root/<branch>
 *
 * Rejects (ErrorCode::LayoutConflict) empty and absolute names, "." and ".."
 * components, and names whose first component is the store directory.
 */
Expected<std::filesystem::path> worktreeTarget(const std::filesystem::path& root, const std::string& branch);

/**
 * @brief Plan where every source entry goes for the worktree of branch
 *
 * @param root Repository root that will hold the store and the worktree
 * @param branch Branch name, may contain '/'
 * @param contentDir Directory whose entries are transplanted (== root for in-place)
 * @param entries Snapshot of contentDir's top-level entries
 * @param probe Node type lookup for paths below root
 * @return Plan, or ErrorCode::LayoutConflict when the target already exists or
 *         one of its intermediate components is not a directory
 */
Expected<LayoutPlan> planLayout(const std::filesystem::path& root, const std::string& branch,
                                const std::filesystem::path& contentDir,
                                const std::vector<EntrySnapshot>& entries, const PathProbe& probe);

/// Read the top-level entries of dir, sorted by name
Expected<std::vector<EntrySnapshot>> snapshotEntries(const std::filesystem::path& dir);

const char* placementKindName(PlacementKind kind);

}
