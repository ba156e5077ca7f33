#pragma once

#include <filesystem>
#include <string>

#include "git/VersionControlTool.hpp"
#include "util/Expected.hpp"

namespace baretree {

enum class RepositoryLayout {
    None,             // No repository at the root
    Embedded,         // <root>/.git is an ordinary (non-bare) repository
    Split,            // <root>/.git is a bare store shared by worktrees
    Bare,             // The root itself is a bare repository
    LinkedWorktree    // <root>/.git is a link file into another store
};

const char* layoutName(RepositoryLayout layout);

/**
 * @brief A repository root and the layout questions asked before migrating it
 *
 * Split layout:
 *   <root>/
 *     .git/                 - Bare store (core.bare = true)
 *       worktrees/<id>/     - One administrative area per worktree
 *       modules/<module>/   - Submodule stores
 *     <branch>/             - Worktree, with a .git link file
 *
 * The embedded layout is the ordinary clone: <root>/.git holds the store and
 * <root> is the working tree.
 */
class Repository {
public:
    Repository(VersionControlTool& vcs, std::filesystem::path root);

    /**
     * @brief Find the repository root by searching upwards for a .git entry
     *
     * Migration never searches upwards on its own; this only names the
     * enclosing root when a subdirectory is given by mistake.
     * @param start Starting directory
     * @return Absolute root path, or ErrorCode::NotARepository
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    const std::filesystem::path& root() const { return rootPath; }

    /// <root>/.git
    std::filesystem::path storeDir() const;

    /**
     * @brief Classify the root
     *
     * A .git directory is Split when its config has core.bare = true,
     * Embedded otherwise. Without a .git entry the root is asked whether it
     * is a bare repository itself.
     */
    Expected<RepositoryLayout> detectLayout();

    /// Branch checked out in the root; "HEAD" when detached
    Expected<std::string> currentBranch();

    /// Record baretree.baredir and baretree.defaultbranch in the store config
    Expected<void> initializeSplitConfig(const std::string& defaultBranch);

private:
    VersionControlTool& vcs;
    std::filesystem::path rootPath;
};

}
