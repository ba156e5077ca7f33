#pragma once

#include <cstddef>

/**
 * @brief Layout constants shared by the planner, synthesizer and rewriters
 *
 * Centralizes fixed names of the split layout so every module agrees on them.
 */
namespace baretree {

namespace Constants {
    // Shared store directory at the repository root; fixed to ".git" so that
    // relative submodule gitlinks keep resolving
    constexpr const char* STORE_DIR_NAME = ".git";

    // Link file at the top of every worktree ("gitdir: <admin area>")
    constexpr const char* LINK_FILE_NAME = ".git";

    // Store subdirectories
    constexpr const char* ADMIN_AREAS_DIR = "worktrees";
    constexpr const char* MODULES_DIR = "modules";

    // Administrative area files
    constexpr const char* ADMIN_COMMONDIR = "commondir";
    constexpr const char* ADMIN_GITDIR = "gitdir";
    constexpr const char* ADMIN_HEAD = "HEAD";
    constexpr const char* INDEX_FILE = "index";

    constexpr const char* GITMODULES_FILE = ".gitmodules";

    // Text prefixes of the pointer files
    constexpr const char* GITDIR_PREFIX = "gitdir: ";
    constexpr const char* SYMREF_PREFIX = "ref: ";
    constexpr const char* BRANCH_REF_PREFIX = "refs/heads/";

    // Directory name given to a relocated worktree with a detached HEAD
    constexpr const char* DETACHED_DIR_NAME = "detached";

    // Managed root resolution
    constexpr const char* ENV_ROOT = "BARETREE_ROOT";
    constexpr const char* DEFAULT_MANAGED_ROOT = "~/baretree";
    constexpr const char* DEFAULT_HOST = "github.com";

    // git-config keys
    constexpr const char* CONFIG_ROOT = "baretree.root";
    constexpr const char* CONFIG_USER = "baretree.user";
    constexpr const char* CONFIG_BAREDIR = "baretree.baredir";
    constexpr const char* CONFIG_DEFAULT_BRANCH = "baretree.defaultbranch";
}
}
