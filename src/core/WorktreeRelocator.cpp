#include "core/WorktreeRelocator.hpp"

#include "core/Constants.hpp"
#include "core/SubmoduleRewriter.hpp"
#include "core/Transplant.hpp"
#include "core/WorktreeLink.hpp"
#include "git/GitQueries.hpp"
#include "util/Logger.hpp"
#include "util/NodeInfo.hpp"
#include "util/Paths.hpp"
#include "util/TextFile.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace {

NodeType typeOf(const fs::path& p) {
    std::error_code ec;
    NodeInfo info = getNodeInfo(p, ec);
    if (ec) return NodeType::Other;
    return info.type;
}

Expected<void> renameJournaled(const fs::path& from, const fs::path& to, CompensationStack& journal) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) return Error{ErrorCode::LinkFailed, "failed to rename " + from.string() + " to " + to.string() + ": " + ec.message()};
    journal.push("rename " + to.string() + " back to " + from.string(), [from, to]() -> Expected<void> {
        std::error_code undoEc;
        fs::rename(to, from, undoEc);
        if (undoEc) return Error{ErrorCode::LinkFailed, "failed to rename " + to.string() + " back: " + undoEc.message()};
        return {};
    });
    return {};
}

/**
 * Single admin-area derivation for both flows: reuse the area the worktree
 * already has (renamed to the escaped directory name), or create a fresh one,
 * then rewrite the link files for the new location.
 */
Expected<fs::path> relinkAdminArea(const ExternalWorktree& wt, const fs::path& target, const fs::path& store,
                                   CompensationStack& journal) {
    const fs::path areas = store / Constants::ADMIN_AREAS_DIR;
    const std::string base = AdminFiles::escapeName(relocatedDirName(wt));
    const bool haveCurrent = !wt.adminAreaName.empty() && typeOf(areas / wt.adminAreaName) == NodeType::Directory;

    std::string name = base;
    if (!(haveCurrent && wt.adminAreaName == base)) {
        if (typeOf(areas / base) != NodeType::Missing) name = uniqueAdminName(store, base);
        if (haveCurrent) {
            auto res = renameJournaled(areas / wt.adminAreaName, areas / name, journal);
            if (!res) return res.error();
        }
    }

    LinkRequest req;
    req.worktreePath = target;
    req.storePath = store;
    req.branch = wt.branch;
    req.detached = wt.detached;
    req.detachedHead = wt.head;
    return synthesizeLink(req, name, &journal);
}

}

std::string relocatedDirName(const ExternalWorktree& wt) {
    if (wt.detached || wt.branch.empty()) return Constants::DETACHED_DIR_NAME;
    return wt.branch;
}

Expected<ExternalWorktree> describeExternal(const WorktreeRecord& record) {
    ExternalWorktree wt;
    wt.path = Paths::normalizeAbsolute(record.path);
    wt.head = record.head;
    wt.branch = record.branch;
    wt.detached = record.detached;

    auto text = readTextFile(wt.path / Constants::LINK_FILE_NAME);
    if (!text) return withContext("worktree " + wt.path.string(), Error{ErrorCode::LinkFailed, text.error().message});
    auto admin = AdminFiles::decodeLinkFile(text.value());
    if (!admin) return withContext("worktree " + wt.path.string(), admin.error());
    wt.adminAreaName = Paths::normalizeAbsolute(admin.value()).filename().string();
    return wt;
}

std::string uniqueAdminName(const fs::path& store, const std::string& base) {
    const fs::path areas = store / Constants::ADMIN_AREAS_DIR;
    if (typeOf(areas / base) == NodeType::Missing) return base;
    for (int n = 1;; ++n) {
        std::string candidate = base + std::to_string(n);
        if (typeOf(areas / candidate) == NodeType::Missing) return candidate;
    }
}

Expected<void> parkAdminArea(ExternalWorktree& wt, const fs::path& store, bool rewriteLinkFile,
                             CompensationStack& journal) {
    const fs::path areas = store / Constants::ADMIN_AREAS_DIR;
    const std::string parked = uniqueAdminName(store, wt.adminAreaName);
    auto res = renameJournaled(areas / wt.adminAreaName, areas / parked, journal);
    if (!res) return res;
    Logger::instance().debug("parked admin area " + wt.adminAreaName + " as " + parked);

    if (rewriteLinkFile) {
        const fs::path link = wt.path / Constants::LINK_FILE_NAME;
        auto previous = readTextFile(link);
        if (!previous) return Error{ErrorCode::LinkFailed, previous.error().message};
        auto written = writeTextFile(link, AdminFiles::encodeLinkFile(areas / parked));
        if (!written) return Error{ErrorCode::LinkFailed, written.error().message};
        std::string old = previous.value();
        journal.push("restore " + link.string(), [link, old]() { return writeTextFile(link, old); });
    }
    wt.adminAreaName = parked;
    return {};
}

Expected<fs::path> relocateWorktree(VersionControlTool& vcs, const ExternalWorktree& wt, const fs::path& root,
                                    RelocationMode mode, std::vector<std::string>& warnings) {
    auto& log = Logger::instance();
    const fs::path newRoot = Paths::normalizeAbsolute(root);
    const fs::path store = newRoot / Constants::STORE_DIR_NAME;
    const fs::path target = Paths::normalizeAbsolute(newRoot / relocatedDirName(wt));

    if (typeOf(target) != NodeType::Missing) {
        return Error{ErrorCode::DestinationExists, "target already exists: " + target.string()};
    }
    if (Paths::isWithin(wt.path, target)) {
        return Error{ErrorCode::PathOverlap, "target " + target.string() + " lies inside the worktree"};
    }

    log.info(std::string(mode == RelocationMode::Move ? "Moving" : "Copying") + " worktree " +
             wt.path.string() + " -> " + target.string());

    CompensationStack journal;
    auto res = createDirectoryChain(target.parent_path(), &journal);
    if (!res) return rollBack(journal, res.error());

    TransplantOptions options;
    options.journal = &journal;
    if (mode == RelocationMode::Move) {
        res = transplantNode(wt.path, target, TransplantMode::Move, options);
    } else {
        options.excludeNames.push_back(Constants::LINK_FILE_NAME);
        res = transplantContents(wt.path, target, TransplantMode::Copy, options);
    }
    if (!res) return rollBack(journal, res.error());

    auto area = relinkAdminArea(wt, target, store, journal);
    if (!area) return rollBack(journal, area.error());

    if (mode == RelocationMode::Move) {
        res = GitQueries::repairWorktree(vcs, store, target);
        if (!res) return rollBack(journal, withContext("worktree repair", res.error()));
    }
    journal.commit();

    auto submodules = rewriteSubmodules(vcs, target, newRoot);
    for (const auto& w : submodules.warnings) warnings.push_back(target.string() + ": " + w);
    return target;
}

RelocationReport relocateExternalWorktrees(VersionControlTool& vcs, const std::vector<ExternalWorktree>& worktrees,
                                           const fs::path& root, RelocationMode mode) {
    RelocationReport report;
    for (const auto& wt : worktrees) {
        auto moved = relocateWorktree(vcs, wt, root, mode, report.warnings);
        if (moved) {
            report.relocated.push_back(moved.value());
        } else {
            Logger::instance().warn("could not relocate " + wt.path.string() + ": " + moved.error().message);
            report.failures.push_back(wt.path.string() + ": " + moved.error().message);
        }
    }
    return report;
}

}
