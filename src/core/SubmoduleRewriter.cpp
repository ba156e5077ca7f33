#include "core/SubmoduleRewriter.hpp"

#include "core/Constants.hpp"
#include "core/WorktreeLink.hpp"
#include "git/GitQueries.hpp"
#include "util/Logger.hpp"
#include "util/NodeInfo.hpp"
#include "util/Paths.hpp"
#include "util/TextFile.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace {

std::string modulesMarker() {
    return std::string(Constants::STORE_DIR_NAME) + "/" + Constants::MODULES_DIR + "/";
}

/// Gitlink files below worktree, excluding the worktree's own link file
std::vector<fs::path> findGitlinks(const fs::path& worktree, std::vector<std::string>& warnings) {
    std::vector<fs::path> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(worktree, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        warnings.push_back("cannot walk " + worktree.string() + ": " + ec.message());
        return found;
    }
    const fs::path ownLink = worktree / Constants::LINK_FILE_NAME;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            warnings.push_back("walk stopped in " + worktree.string() + ": " + ec.message());
            break;
        }
        const fs::path& p = it->path();
        if (p.filename() != Constants::LINK_FILE_NAME) continue;

        std::error_code statEc;
        NodeInfo info = getNodeInfo(p, statEc);
        if (info.type == NodeType::Directory) {
            // Embedded repository of its own, nothing of ours inside
            it.disable_recursion_pending();
            continue;
        }
        if (statEc || info.type != NodeType::RegularFile || p == ownLink) continue;
        found.push_back(p);
    }
    return found;
}

}

std::string moduleIdFromPointer(const std::string& pointer) {
    const std::string marker = modulesMarker();
    auto pos = pointer.find(marker);
    if (pos == std::string::npos) return std::string();
    return trimTrailing(pointer.substr(pos + marker.size()));
}

std::string submodulePointer(const fs::path& worktree, const fs::path& repoRoot,
                             const fs::path& submoduleDir, const std::string& moduleId) {
    const fs::path wt = Paths::normalizeAbsolute(worktree);
    std::size_t depth = Paths::componentCount(Paths::normalizeAbsolute(submoduleDir).lexically_relative(wt)) +
                        Paths::componentCount(wt.lexically_relative(Paths::normalizeAbsolute(repoRoot)));
    std::string rel;
    for (std::size_t i = 0; i < depth; ++i) rel += "../";
    return rel + modulesMarker() + moduleId;
}

SubmoduleRewriteReport rewriteSubmodules(VersionControlTool& vcs, const fs::path& worktree, const fs::path& repoRoot) {
    SubmoduleRewriteReport report;
    const fs::path wt = Paths::normalizeAbsolute(worktree);
    const fs::path store = Paths::normalizeAbsolute(repoRoot) / Constants::STORE_DIR_NAME;

    std::error_code ec;
    if (getNodeInfo(wt / Constants::GITMODULES_FILE, ec).type == NodeType::Missing) return report;

    for (const auto& gitlink : findGitlinks(wt, report.warnings)) {
        auto text = readTextFile(gitlink);
        if (!text) {
            report.warnings.push_back(text.error().message);
            continue;
        }
        auto pointer = AdminFiles::decodeLinkFile(text.value());
        if (!pointer) continue;
        const std::string moduleId = moduleIdFromPointer(pointer.value().generic_string());
        if (moduleId.empty()) continue;

        const fs::path submoduleDir = gitlink.parent_path();
        const fs::path moduleDir = store / Constants::MODULES_DIR / moduleId;
        if (getNodeInfo(moduleDir, ec).type != NodeType::Directory) {
            report.warnings.push_back("submodule " + moduleId + ": no module directory at " + moduleDir.string());
            continue;
        }

        const std::string newPointer = submodulePointer(wt, repoRoot, submoduleDir, moduleId);
        auto written = writeTextFile(gitlink, std::string(Constants::GITDIR_PREFIX) + newPointer + "\n");
        if (!written) {
            report.warnings.push_back("submodule " + moduleId + ": " + written.error().message);
            continue;
        }
        report.rewritten.push_back(gitlink);
        Logger::instance().debug("gitlink " + gitlink.string() + " -> " + newPointer);

        const fs::path relWorktree = submoduleDir.lexically_relative(moduleDir);
        // Run from the store: inside moduleDir git would chdir to the stale core.worktree
        auto configured = GitQueries::setConfigInFile(vcs, store, moduleDir / "config", "core.worktree",
                                                      relWorktree.generic_string());
        if (!configured) {
            report.warnings.push_back("submodule " + moduleId + ": " + configured.error().message);
        }
    }
    return report;
}

}
