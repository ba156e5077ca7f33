#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/CompensationStack.hpp"
#include "util/Expected.hpp"

namespace baretree {

enum class TransplantMode { Move, Copy };

/**
 * @brief Options shared by the transplant operations
 *
 * excludeNames only applies to the direct children of the transplanted
 * directory (the store directory, a worktree's link file). excludeSubtree is
 * an absolute path that is never moved or copied; directories above it are
 * descended into instead of being renamed, which is how a target nested
 * inside its own source is handled.
 */
struct TransplantOptions {
    std::vector<std::string> excludeNames;
    std::filesystem::path excludeSubtree;
    CompensationStack* journal{nullptr};   // Receives the inverse of every mutation
};

/**
 * @brief Move or copy a single node (file, directory or symlink)
 *
 * Move renames the node. When the destination is an existing directory and
 * the source is a directory, the children are merge-moved and the emptied
 * source removed. A cross-device rename falls back to copy + remove.
 *
 * Copy reads the node with a link-aware stat first: symlinks are recreated
 * with the same target, directories get the source permission bits, regular
 * files are copied with their permission bits.
 *
 * A failure part-way leaves dst partially populated; nothing is retried.
 */
Expected<void> transplantNode(const std::filesystem::path& src, const std::filesystem::path& dst,
                              TransplantMode mode, const TransplantOptions& options = {});

/**
 * @brief Transplant every child of srcDir into dstDir
 *
 * dstDir is created (with srcDir's permission bits) when missing. In Move
 * mode srcDir itself is left in place, possibly empty.
 */
Expected<void> transplantContents(const std::filesystem::path& srcDir, const std::filesystem::path& dstDir,
                                  TransplantMode mode, const TransplantOptions& options = {});

/**
 * @brief Create dir and its missing ancestors, outermost first
 *
 * Each created directory is journaled for a non-recursive removal, so an
 * unwind only succeeds once everything placed inside was unwound too.
 */
Expected<void> createDirectoryChain(const std::filesystem::path& dir, CompensationStack* journal);

/// Recursive link-aware copy of one node; dst directories may already exist
Expected<void> copyNode(const std::filesystem::path& src, const std::filesystem::path& dst);

/**
 * @brief Remove a node and everything below it
 *
 * Unlike std::filesystem::remove_all, read-only directories are made
 * writable first so their entries can be unlinked. Symlinks are removed,
 * never followed. A missing node is not an error.
 */
void removeTree(const std::filesystem::path& p, std::error_code& ec);

/**
 * @brief Move a node that rename() cannot move (EXDEV): copy, then remove src
 *
 * Read-only directories in src are made writable just before they are
 * removed. The journal entry copies dst back and removes it.
 */
Expected<void> moveByCopy(const std::filesystem::path& src, const std::filesystem::path& dst,
                          CompensationStack* journal);

}
