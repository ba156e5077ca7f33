#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/CompensationStack.hpp"
#include "core/LayoutPlanner.hpp"
#include "core/Settings.hpp"
#include "core/WorktreeRelocator.hpp"
#include "git/VersionControlTool.hpp"
#include "util/Expected.hpp"

namespace baretree {

enum class MigrationStage {
    Validating,
    Transplanting,
    SynthesizingLinks,
    RelocatingExternalWorktrees,
    RewritingSubmodules,
    Done,
    Failed
};

const char* stageName(MigrationStage stage);

/// Everything a successful migration created, for the final summary
struct MigrationReport {
    std::filesystem::path root;
    std::filesystem::path store;
    std::string branch;
    std::filesystem::path primaryWorktree;         // Empty when a split repository was copied as is
    std::filesystem::path defaultBranchWorktree;   // Empty when none was added
    std::vector<std::filesystem::path> relocated;
    std::vector<std::string> warnings;
    bool sourceRemoved{false};
};

/**
 * @brief Runs a repository through the split-layout migration
 *
 * Stages: validating -> transplanting -> synthesizing-links ->
 * relocating-external-worktrees -> rewriting-submodules -> done, with
 * failed reachable from any of them. Validation never mutates anything.
 * Every mutation up to and including the primary worktree's link synthesis
 * is journaled on a CompensationStack and unwound once on failure; the
 * returned error is prefixed with the stage it happened in.
 *
 * After the primary worktree is linked, external worktree and submodule
 * problems only add warnings to the report.
 *
 * One Migrator runs one migration at a time; it is not thread-safe.
 */
class Migrator {
public:
    Migrator(VersionControlTool& vcs, Settings settings);

    /// Convert <source> itself: the store stays at <source>/.git, files move to <source>/<branch>
    Expected<MigrationReport> migrateInPlace(const std::filesystem::path& source);

    /**
     * @brief Build the split layout at destination from copies
     * @param removeSource Delete the source only after success (failure is a warning)
     */
    Expected<MigrationReport> migrateToDestination(const std::filesystem::path& source,
                                                   const std::filesystem::path& destination,
                                                   bool removeSource = false);

    /**
     * @brief Migrate or copy into <managed root>/<host>/<user>/<repo>
     *
     * The location comes from pathOverride (host/user/repo, user/repo or repo)
     * or from the remote URL. A source already in split layout is copied and
     * relinked; any other source goes through migrateToDestination.
     */
    Expected<MigrationReport> migrateToManagedRoot(const std::filesystem::path& source,
                                                   const std::string& pathOverride = "",
                                                   bool removeSource = false);

    /// Destination migrateToManagedRoot would use for source
    Expected<std::filesystem::path> managedDestination(const std::filesystem::path& source,
                                                       const std::string& pathOverride);

    MigrationStage stage() const { return current; }

private:
    /// Facts gathered before the first mutation
    struct SourceState {
        std::filesystem::path root;
        std::string branch;
        std::vector<ExternalWorktree> externals;
        std::vector<std::string> warnings;
    };

    Expected<SourceState> inspectSource(const std::filesystem::path& source);
    Expected<void> checkDestination(const std::filesystem::path& source, const std::filesystem::path& destination,
                                    const std::vector<ExternalWorktree>& externals) const;
    Expected<void> parkCollidingAreas(SourceState& src, const std::filesystem::path& store, bool rewriteLinkFiles,
                                      CompensationStack& journal);
    Expected<void> linkPrimary(const std::filesystem::path& worktree, const std::filesystem::path& store,
                               const std::string& branch, CompensationStack& journal);
    void completeSplitLayout(const std::filesystem::path& root, const std::string& branch,
                             const std::vector<ExternalWorktree>& externals, MigrationReport& report);
    void finishWorktrees(const SourceState& src, const std::filesystem::path& root, RelocationMode mode,
                         MigrationReport& report);
    Expected<MigrationReport> copySplitRepository(const std::filesystem::path& source,
                                                  const std::filesystem::path& destination, bool removeSource);
    Expected<void> relinkCopiedAreas(const std::filesystem::path& oldRoot, const std::filesystem::path& newRoot,
                                     MigrationReport& report, CompensationStack& journal);
    void removeSourceTree(const std::filesystem::path& source, const std::vector<ExternalWorktree>& externals,
                          MigrationReport& report);

    void enter(MigrationStage stage);
    Error fail(const Error& err);

    VersionControlTool& vcs;
    Settings settings;
    MigrationStage current{MigrationStage::Validating};
};

}
