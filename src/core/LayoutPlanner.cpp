#include "core/LayoutPlanner.hpp"

#include <algorithm>

#include "core/Constants.hpp"
#include "util/Paths.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace {

Error conflict(const std::string& msg) {
    return Error{ErrorCode::LayoutConflict, msg};
}

}

PathProbe filesystemProbe() {
    return [](const fs::path& p) {
        std::error_code ec;
        NodeInfo info = getNodeInfo(p, ec);
        // An unreadable node still occupies the path
        if (ec) return NodeType::Other;
        return info.type;
    };
}

Expected<fs::path> worktreeTarget(const fs::path& root, const std::string& branch) {
    if (branch.empty()) return conflict("empty branch name");
    fs::path rel(branch);
    if (rel.is_absolute() || branch.front() == '/') {
        return conflict("branch name is an absolute path: " + branch);
    }
    for (const auto& part : rel) {
        if (part == "." || part == "..") {
            return conflict("branch name contains a '" + part.string() + "' component: " + branch);
        }
    }
    if (*rel.begin() == Constants::STORE_DIR_NAME) {
        return conflict("branch name collides with the store directory: " + branch);
    }
    return Paths::normalizeAbsolute(root / rel);
}

Expected<LayoutPlan> planLayout(const fs::path& root, const std::string& branch, const fs::path& contentDir,
                                const std::vector<EntrySnapshot>& entries, const PathProbe& probe) {
    auto targetRes = worktreeTarget(root, branch);
    if (!targetRes) return targetRes.error();

    LayoutPlan plan;
    plan.target = targetRes.value();
    const fs::path base = Paths::normalizeAbsolute(root);

    fs::path current = base;
    for (const auto& part : fs::path(branch).lexically_normal()) {
        if (part.empty()) continue;
        current /= part;
        NodeType type = probe(current);
        if (current == plan.target && type != NodeType::Missing) {
            return conflict("worktree target already exists: " + current.string());
        }
        if (type == NodeType::Missing) {
            plan.createdDirectories.push_back(current);
        } else if (type != NodeType::Directory) {
            return conflict(std::string("path component is a ") + nodeTypeName(type) +
                            ", not a directory: " + current.string());
        } else if (!plan.createdDirectories.empty()) {
            // Cannot happen on a consistent probe: a directory below a missing one
            return conflict("inconsistent layout below " + plan.createdDirectories.front().string());
        }
    }

    const fs::path content = Paths::normalizeAbsolute(contentDir);
    for (const auto& entry : entries) {
        if (entry.name == Constants::STORE_DIR_NAME) continue;
        Placement p;
        p.source = content / entry.name;
        p.destination = plan.target / entry.name;
        if (Paths::isStrictAncestor(p.source, plan.target)) {
            p.kind = PlacementKind::ExcludeTarget;
        } else if (entry.isDirectory && probe(p.destination) == NodeType::Directory) {
            p.kind = PlacementKind::MergeInto;
        }
        plan.placements.push_back(std::move(p));
    }
    return plan;
}

Expected<std::vector<EntrySnapshot>> snapshotEntries(const fs::path& dir) {
    std::vector<EntrySnapshot> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return Error{ErrorCode::IoError, "failed to read directory " + dir.string() + ": " + ec.message()};
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code statEc;
        NodeInfo info = getNodeInfo(it->path(), statEc);
        if (statEc) {
            return Error{ErrorCode::IoError, "failed to stat " + it->path().string() + ": " + statEc.message()};
        }
        out.push_back(EntrySnapshot{it->path().filename().string(), info.type == NodeType::Directory});
    }
    if (ec) return Error{ErrorCode::IoError, "failed to read directory " + dir.string() + ": " + ec.message()};
    std::sort(out.begin(), out.end(), [](const EntrySnapshot& a, const EntrySnapshot& b) { return a.name < b.name; });
    return out;
}

const char* placementKindName(PlacementKind kind) {
    switch (kind) {
        case PlacementKind::Rename: return "rename";
        case PlacementKind::MergeInto: return "merge";
        case PlacementKind::ExcludeTarget: return "exclude-target";
    }
    return "unknown";
}

}
