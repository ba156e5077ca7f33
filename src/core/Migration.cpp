#include "core/Migration.hpp"

#include "core/Constants.hpp"
#include "core/RemotePath.hpp"
#include "core/Repository.hpp"
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

bool occupied(const fs::path& p) {
    std::error_code ec;
    return getNodeInfo(p, ec).type != NodeType::Missing || ec;
}

bool overlaps(const fs::path& a, const fs::path& b) {
    const fs::path ca = Paths::canonicalOrNormal(a);
    const fs::path cb = Paths::canonicalOrNormal(b);
    return Paths::isWithin(ca, cb) || Paths::isWithin(cb, ca);
}

Expected<void> executePlan(const LayoutPlan& plan, TransplantMode mode, CompensationStack& journal) {
    for (const auto& placement : plan.placements) {
        TransplantOptions options;
        options.journal = &journal;
        if (placement.kind == PlacementKind::ExcludeTarget) {
            options.excludeSubtree = plan.excludedSubtree();
        }
        Logger::instance().debug(std::string(placementKindName(placement.kind)) + " " +
                                 placement.source.string() + " -> " + placement.destination.string());
        auto res = transplantNode(placement.source, placement.destination, mode, options);
        if (!res) return res;
    }
    return {};
}

}

const char* stageName(MigrationStage stage) {
    switch (stage) {
        case MigrationStage::Validating: return "validating";
        case MigrationStage::Transplanting: return "transplanting";
        case MigrationStage::SynthesizingLinks: return "synthesizing-links";
        case MigrationStage::RelocatingExternalWorktrees: return "relocating-external-worktrees";
        case MigrationStage::RewritingSubmodules: return "rewriting-submodules";
        case MigrationStage::Done: return "done";
        case MigrationStage::Failed: return "failed";
    }
    return "unknown";
}

Migrator::Migrator(VersionControlTool& vcs, Settings settings) : vcs(vcs), settings(std::move(settings)) {}

void Migrator::enter(MigrationStage stage) {
    current = stage;
    Logger::instance().debug(std::string("stage: ") + stageName(stage));
}

Error Migrator::fail(const Error& err) {
    MigrationStage failedAt = current;
    current = MigrationStage::Failed;
    return withContext(stageName(failedAt), err);
}

Expected<Migrator::SourceState> Migrator::inspectSource(const fs::path& source) {
    enter(MigrationStage::Validating);
    SourceState src;
    src.root = Paths::normalizeAbsolute(source);

    Repository repo(vcs, src.root);
    auto layout = repo.detectLayout();
    if (!layout) return layout.error();
    Logger::instance().debug("source " + src.root.string() + " has " + layoutName(layout.value()) + " layout");
    switch (layout.value()) {
        case RepositoryLayout::None: {
            std::string message = "not a git repository: " + src.root.string();
            if (src.root.has_parent_path() && src.root != src.root.parent_path()) {
                auto enclosing = Repository::discoverRoot(src.root.parent_path());
                if (enclosing) message += " (it is inside " + enclosing.value().string() + "; pass that path)";
            }
            return Error{ErrorCode::NotARepository, message};
        }
        case RepositoryLayout::LinkedWorktree:
            return Error{ErrorCode::NotARepository, src.root.string() +
                         " is a linked worktree; migrate the repository that owns it"};
        case RepositoryLayout::Bare:
            return Error{ErrorCode::AlreadyBare, "repository is already bare: " + src.root.string()};
        case RepositoryLayout::Split:
            return Error{ErrorCode::AlreadySplit, "already a split-layout repository: " + src.root.string()};
        case RepositoryLayout::Embedded:
            break;
    }

    auto branch = repo.currentBranch();
    if (!branch) return branch.error();
    if (branch.value() == "HEAD") {
        return Error{ErrorCode::DetachedHead, "HEAD is detached in " + src.root.string() +
                     "; check out a branch before migrating"};
    }
    src.branch = branch.value();
    auto primaryTarget = worktreeTarget(src.root, src.branch);
    if (!primaryTarget) return primaryTarget.error();

    auto records = GitQueries::listWorktrees(vcs, src.root);
    if (!records) return records.error();
    const fs::path canonicalRoot = Paths::canonicalOrNormal(src.root);
    for (const auto& record : records.value()) {
        if (record.bare) continue;
        const fs::path where = Paths::canonicalOrNormal(record.path);
        if (Paths::isWithin(canonicalRoot, where)) {
            if (where != canonicalRoot) {
                src.warnings.push_back("linked worktree inside the repository is moved as plain content: " +
                                       record.path.string());
            }
            continue;
        }
        if (record.prunable) {
            src.warnings.push_back("skipping prunable worktree " + record.path.string());
            continue;
        }
        auto ext = describeExternal(record);
        if (!ext) {
            src.warnings.push_back("skipping worktree: " + ext.error().message);
            continue;
        }
        const fs::path extTarget = src.root / relocatedDirName(ext.value());
        if (overlaps(extTarget, primaryTarget.value())) {
            src.warnings.push_back("skipping worktree " + record.path.string() + ": " + extTarget.string() +
                                   " overlaps the primary worktree");
            continue;
        }
        src.externals.push_back(ext.value());
    }
    return src;
}

Expected<void> Migrator::checkDestination(const fs::path& source, const fs::path& destination,
                                          const std::vector<ExternalWorktree>& externals) const {
    if (occupied(destination)) {
        return Error{ErrorCode::DestinationExists, "destination already exists: " + destination.string()};
    }
    if (overlaps(source, destination)) {
        return Error{ErrorCode::PathOverlap, "source " + source.string() + " and destination " +
                     destination.string() + " overlap"};
    }
    for (const auto& ext : externals) {
        if (overlaps(ext.path, destination)) {
            return Error{ErrorCode::PathOverlap, "destination " + destination.string() +
                         " overlaps worktree " + ext.path.string()};
        }
    }
    return {};
}

Expected<void> Migrator::parkCollidingAreas(SourceState& src, const fs::path& store, bool rewriteLinkFiles,
                                            CompensationStack& journal) {
    const std::string primaryArea = AdminFiles::escapeName(src.branch);
    for (auto& ext : src.externals) {
        if (ext.adminAreaName != primaryArea) continue;
        auto res = parkAdminArea(ext, store, rewriteLinkFiles, journal);
        if (!res) return res;
    }
    return {};
}

Expected<void> Migrator::linkPrimary(const fs::path& worktree, const fs::path& store, const std::string& branch,
                                     CompensationStack& journal) {
    Logger::instance().info("Linking worktree " + worktree.string());
    LinkRequest req;
    req.worktreePath = worktree;
    req.storePath = store;
    req.branch = branch;
    req.adoptStoreIndex = true;
    auto area = synthesizeLink(req, AdminFiles::escapeName(branch), &journal);
    if (!area) return area.error();
    auto verified = verifyLink(worktree);
    if (!verified) return verified.error();
    return {};
}

void Migrator::completeSplitLayout(const fs::path& root, const std::string& branch,
                                   const std::vector<ExternalWorktree>& externals, MigrationReport& report) {
    auto& log = Logger::instance();
    const fs::path store = root / Constants::STORE_DIR_NAME;

    std::string defaultBranch = branch;
    auto detected = GitQueries::defaultBranch(vcs, store);
    if (detected) {
        defaultBranch = detected.value();
    } else {
        log.debug("default branch not detected, using " + branch);
    }

    Repository repo(vcs, root);
    auto configured = repo.initializeSplitConfig(defaultBranch);
    if (!configured) report.warnings.push_back(configured.error().message);

    if (defaultBranch == branch) return;
    for (const auto& ext : externals) {
        if (!ext.detached && ext.branch == defaultBranch) {
            log.info("Default branch " + defaultBranch + " already has a worktree at " + ext.path.string());
            return;
        }
    }

    auto target = worktreeTarget(root, defaultBranch);
    if (!target) {
        report.warnings.push_back("default branch worktree: " + target.error().message);
        return;
    }
    if (overlaps(target.value(), root / branch) || occupied(target.value())) {
        report.warnings.push_back("default branch worktree not created, " + target.value().string() + " is taken");
        return;
    }
    log.info("Default branch: " + defaultBranch + ", adding worktree " + target.value().string());
    auto added = GitQueries::addWorktree(vcs, store, target.value(), defaultBranch);
    if (!added) {
        report.warnings.push_back(added.error().message);
        return;
    }
    report.defaultBranchWorktree = target.value();
}

void Migrator::finishWorktrees(const SourceState& src, const fs::path& root, RelocationMode mode,
                               MigrationReport& report) {
    auto& log = Logger::instance();

    enter(MigrationStage::RelocatingExternalWorktrees);
    if (!src.externals.empty()) {
        log.info("Relocating " + std::to_string(src.externals.size()) + " external worktree(s)");
        auto relocation = relocateExternalWorktrees(vcs, src.externals, root, mode);
        report.relocated = relocation.relocated;
        for (const auto& f : relocation.failures) report.warnings.push_back("not relocated: " + f);
        for (const auto& w : relocation.warnings) report.warnings.push_back(w);
    }

    enter(MigrationStage::RewritingSubmodules);
    auto submodules = rewriteSubmodules(vcs, report.primaryWorktree, root);
    if (!submodules.rewritten.empty()) {
        log.info("Updated " + std::to_string(submodules.rewritten.size()) + " submodule link(s)");
    }
    for (const auto& w : submodules.warnings) {
        report.warnings.push_back(report.primaryWorktree.string() + ": " + w);
    }
}

Expected<MigrationReport> Migrator::migrateInPlace(const fs::path& source) {
    auto& log = Logger::instance();
    auto inspected = inspectSource(source);
    if (!inspected) return fail(inspected.error());
    SourceState src = inspected.value();
    const fs::path store = src.root / Constants::STORE_DIR_NAME;

    auto entries = snapshotEntries(src.root);
    if (!entries) return fail(entries.error());
    auto planned = planLayout(src.root, src.branch, src.root, entries.value(), filesystemProbe());
    if (!planned) return fail(planned.error());
    const LayoutPlan& plan = planned.value();

    log.info("Migrating " + src.root.string() + " in place (branch " + src.branch + ")");
    MigrationReport report;
    report.root = src.root;
    report.store = store;
    report.branch = src.branch;
    report.warnings = src.warnings;

    enter(MigrationStage::Transplanting);
    CompensationStack journal;
    log.info("Converting " + store.string() + " to a bare store");
    auto res = GitQueries::setBare(vcs, store, true);
    if (!res) return fail(res.error());
    journal.push("unset core.bare in " + store.string(), [this, store]() {
        return GitQueries::setBare(vcs, store, false);
    });

    res = parkCollidingAreas(src, store, true, journal);
    if (!res) return fail(rollBack(journal, res.error()));
    res = createDirectoryChain(plan.target, &journal);
    if (!res) return fail(rollBack(journal, res.error()));

    log.info("Moving working tree into " + plan.target.string());
    res = executePlan(plan, TransplantMode::Move, journal);
    if (!res) return fail(rollBack(journal, res.error()));

    enter(MigrationStage::SynthesizingLinks);
    res = linkPrimary(plan.target, store, src.branch, journal);
    if (!res) return fail(rollBack(journal, res.error()));
    journal.commit();
    report.primaryWorktree = plan.target;

    completeSplitLayout(src.root, src.branch, src.externals, report);
    finishWorktrees(src, src.root, RelocationMode::Move, report);
    enter(MigrationStage::Done);
    return report;
}

Expected<MigrationReport> Migrator::migrateToDestination(const fs::path& source, const fs::path& destination,
                                                         bool removeSource) {
    auto& log = Logger::instance();
    auto inspected = inspectSource(source);
    if (!inspected) return fail(inspected.error());
    SourceState src = inspected.value();

    const fs::path dest = Paths::normalizeAbsolute(destination);
    auto checked = checkDestination(src.root, dest, src.externals);
    if (!checked) return fail(checked.error());
    const fs::path store = dest / Constants::STORE_DIR_NAME;

    auto entries = snapshotEntries(src.root);
    if (!entries) return fail(entries.error());
    auto planned = planLayout(dest, src.branch, src.root, entries.value(), filesystemProbe());
    if (!planned) return fail(planned.error());
    const LayoutPlan& plan = planned.value();

    log.info("Migrating " + src.root.string() + " to " + dest.string() + " (branch " + src.branch + ")");
    MigrationReport report;
    report.root = dest;
    report.store = store;
    report.branch = src.branch;
    report.warnings = src.warnings;

    enter(MigrationStage::Transplanting);
    CompensationStack journal;
    auto res = createDirectoryChain(dest, &journal);
    if (!res) return fail(rollBack(journal, res.error()));
    journal.push("remove " + dest.string(), [dest]() -> Expected<void> {
        std::error_code ec;
        removeTree(dest, ec);
        if (ec) return Error{ErrorCode::IoError, "failed to remove " + dest.string() + ": " + ec.message()};
        return {};
    });

    log.info("Copying store to " + store.string());
    res = copyNode(src.root / Constants::STORE_DIR_NAME, store);
    if (!res) return fail(rollBack(journal, res.error()));
    res = GitQueries::setBare(vcs, store, true);
    if (!res) return fail(rollBack(journal, res.error()));
    res = parkCollidingAreas(src, store, false, journal);
    if (!res) return fail(rollBack(journal, res.error()));

    res = createDirectoryChain(plan.target, &journal);
    if (!res) return fail(rollBack(journal, res.error()));
    log.info("Copying working tree to " + plan.target.string());
    res = executePlan(plan, TransplantMode::Copy, journal);
    if (!res) return fail(rollBack(journal, res.error()));

    enter(MigrationStage::SynthesizingLinks);
    res = linkPrimary(plan.target, store, src.branch, journal);
    if (!res) return fail(rollBack(journal, res.error()));
    journal.commit();
    report.primaryWorktree = plan.target;

    completeSplitLayout(dest, src.branch, src.externals, report);
    finishWorktrees(src, dest, RelocationMode::Copy, report);
    enter(MigrationStage::Done);

    if (removeSource) removeSourceTree(src.root, src.externals, report);
    return report;
}

Expected<fs::path> Migrator::managedDestination(const fs::path& source, const std::string& pathOverride) {
    Expected<RemotePath> remote = Error{ErrorCode::InternalError, "unresolved"};
    if (!pathOverride.empty()) {
        remote = parseRemotePath(pathOverride, Constants::DEFAULT_HOST, settings.user);
        if (!remote) return withContext("invalid --path", remote.error());
    } else {
        auto url = GitQueries::remoteUrl(vcs, Paths::normalizeAbsolute(source));
        if (!url) {
            return Error{url.error().code, "failed to detect repository path from remote: " + url.error().message +
                         " (use --path host/user/repo)"};
        }
        remote = parseRemotePath(url.value());
        if (!remote) return withContext("failed to parse remote URL", remote.error());
    }
    return Paths::normalizeAbsolute(settings.primaryRoot() / remote.value().relative());
}

Expected<MigrationReport> Migrator::migrateToManagedRoot(const fs::path& source, const std::string& pathOverride,
                                                         bool removeSource) {
    enter(MigrationStage::Validating);
    const fs::path root = Paths::normalizeAbsolute(source);
    Repository repo(vcs, root);
    auto layout = repo.detectLayout();
    if (!layout) return fail(layout.error());
    if (layout.value() == RepositoryLayout::None) {
        return fail(Error{ErrorCode::NotARepository, "not a git repository: " + root.string()});
    }

    auto dest = managedDestination(root, pathOverride);
    if (!dest) return fail(dest.error());
    Logger::instance().info("Managed destination: " + dest.value().string());

    if (layout.value() == RepositoryLayout::Split) {
        return copySplitRepository(root, dest.value(), removeSource);
    }
    return migrateToDestination(root, dest.value(), removeSource);
}

Expected<MigrationReport> Migrator::copySplitRepository(const fs::path& source, const fs::path& destination,
                                                        bool removeSource) {
    auto& log = Logger::instance();
    enter(MigrationStage::Validating);
    const fs::path dest = Paths::normalizeAbsolute(destination);
    auto checked = checkDestination(source, dest, {});
    if (!checked) return fail(checked.error());

    MigrationReport report;
    report.root = dest;
    report.store = dest / Constants::STORE_DIR_NAME;

    enter(MigrationStage::Transplanting);
    CompensationStack journal;
    auto res = createDirectoryChain(dest.parent_path(), &journal);
    if (!res) return fail(rollBack(journal, res.error()));
    log.info("Copying split-layout repository to " + dest.string());
    TransplantOptions options;
    options.journal = &journal;
    res = transplantNode(source, dest, TransplantMode::Copy, options);
    if (!res) return fail(rollBack(journal, res.error()));

    enter(MigrationStage::SynthesizingLinks);
    res = relinkCopiedAreas(source, dest, report, journal);
    if (!res) return fail(rollBack(journal, res.error()));
    journal.commit();

    enter(MigrationStage::Done);
    if (removeSource) removeSourceTree(source, {}, report);
    return report;
}

Expected<void> Migrator::relinkCopiedAreas(const fs::path& oldRoot, const fs::path& newRoot,
                                           MigrationReport& report, CompensationStack& journal) {
    const fs::path store = newRoot / Constants::STORE_DIR_NAME;
    const fs::path areas = store / Constants::ADMIN_AREAS_DIR;
    std::error_code ec;
    if (getNodeInfo(areas, ec).type != NodeType::Directory) return {};

    auto entries = snapshotEntries(areas);
    if (!entries) return entries.error();
    for (const auto& entry : entries.value()) {
        if (!entry.isDirectory) continue;
        const fs::path area = areas / entry.name;
        const fs::path oldArea = oldRoot / Constants::STORE_DIR_NAME / Constants::ADMIN_AREAS_DIR / entry.name;

        auto gitdirText = readTextFile(area / Constants::ADMIN_GITDIR);
        auto headText = readTextFile(area / Constants::ADMIN_HEAD);
        if (!gitdirText || !headText) {
            report.warnings.push_back("skipping admin area " + entry.name + ": unreadable gitdir or HEAD");
            continue;
        }
        auto oldLink = AdminFiles::decodeGitdir(gitdirText.value());
        auto head = AdminFiles::decodeHead(headText.value());
        if (!oldLink || !head) {
            report.warnings.push_back("skipping admin area " + entry.name + ": " +
                                      (!oldLink ? oldLink.error().message : head.error().message));
            continue;
        }

        fs::path oldWorktree = oldLink.value();
        if (oldWorktree.is_relative()) oldWorktree = oldArea / oldWorktree;
        oldWorktree = Paths::normalizeAbsolute(oldWorktree).parent_path();
        if (!Paths::isWithin(oldRoot, oldWorktree)) {
            report.warnings.push_back("worktree " + oldWorktree.string() +
                                      " lies outside the repository and keeps using the original store");
            continue;
        }
        const fs::path newWorktree = newRoot / oldWorktree.lexically_relative(oldRoot);
        if (getNodeInfo(newWorktree / Constants::LINK_FILE_NAME, ec).type != NodeType::RegularFile) {
            report.warnings.push_back("skipping admin area " + entry.name + ": no worktree at " + newWorktree.string());
            continue;
        }

        LinkRequest req;
        req.worktreePath = newWorktree;
        req.storePath = store;
        req.branch = head.value().branch;
        req.detached = head.value().detached;
        req.detachedHead = head.value().commit;
        auto linked = synthesizeLink(req, entry.name, &journal);
        if (!linked) return linked.error();
        report.relocated.push_back(newWorktree);
    }
    return {};
}

void Migrator::removeSourceTree(const fs::path& source, const std::vector<ExternalWorktree>& externals,
                                MigrationReport& report) {
    Logger::instance().info("Removing original repository " + source.string());
    std::error_code ec;
    removeTree(source, ec);
    if (ec) {
        report.warnings.push_back("failed to remove original repository " + source.string() + ": " + ec.message());
        return;
    }
    report.sourceRemoved = true;
    for (const auto& ext : externals) {
        report.warnings.push_back("worktree " + ext.path.string() + " still refers to the removed repository");
    }
}

}
