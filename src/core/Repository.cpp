#include "core/Repository.hpp"

#include "core/Constants.hpp"
#include "git/GitQueries.hpp"
#include "util/NodeInfo.hpp"
#include "util/Paths.hpp"

namespace fs = std::filesystem;

namespace baretree {

const char* layoutName(RepositoryLayout layout) {
    switch (layout) {
        case RepositoryLayout::None: return "none";
        case RepositoryLayout::Embedded: return "embedded";
        case RepositoryLayout::Split: return "split";
        case RepositoryLayout::Bare: return "bare";
        case RepositoryLayout::LinkedWorktree: return "linked worktree";
    }
    return "unknown";
}

Repository::Repository(VersionControlTool& vcs, fs::path root)
    : vcs(vcs), rootPath(Paths::normalizeAbsolute(root)) {}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) {
    fs::path cur = Paths::normalizeAbsolute(start);
    std::error_code ec;
    while (true) {
        if (getNodeInfo(cur / Constants::STORE_DIR_NAME, ec).type != NodeType::Missing) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "not inside a git repository: " + start.string()};
        }
        cur = cur.parent_path();
    }
}

fs::path Repository::storeDir() const {
    return rootPath / Constants::STORE_DIR_NAME;
}

Expected<RepositoryLayout> Repository::detectLayout() {
    std::error_code ec;
    NodeInfo store = getNodeInfo(storeDir(), ec);
    if (ec) return Error{ErrorCode::IoError, "failed to stat " + storeDir().string() + ": " + ec.message()};

    switch (store.type) {
        case NodeType::RegularFile:
            return RepositoryLayout::LinkedWorktree;
        case NodeType::Directory: {
            auto bare = GitQueries::isBareConfigured(vcs, storeDir());
            if (!bare) return bare.error();
            return bare.value() ? RepositoryLayout::Split : RepositoryLayout::Embedded;
        }
        case NodeType::Missing: {
            std::error_code headEc;
            if (getNodeInfo(rootPath / Constants::ADMIN_HEAD, headEc).type != NodeType::RegularFile) {
                return RepositoryLayout::None;
            }
            auto bare = GitQueries::isBareRepository(vcs, rootPath);
            if (bare && bare.value()) return RepositoryLayout::Bare;
            return RepositoryLayout::None;
        }
        default:
            return RepositoryLayout::None;
    }
}

Expected<std::string> Repository::currentBranch() {
    return GitQueries::currentBranch(vcs, rootPath);
}

Expected<void> Repository::initializeSplitConfig(const std::string& defaultBranch) {
    const fs::path config = storeDir() / "config";
    auto res = GitQueries::setConfigInFile(vcs, storeDir(), config, Constants::CONFIG_BAREDIR,
                                           Constants::STORE_DIR_NAME);
    if (!res) return res;
    return GitQueries::setConfigInFile(vcs, storeDir(), config, Constants::CONFIG_DEFAULT_BRANCH, defaultBranch);
}

}
