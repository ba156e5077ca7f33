#include "git/GitQueries.hpp"

#include <sstream>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace GitQueries {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

}

Expected<bool> isBareRepository(VersionControlTool& vcs, const fs::path& dir) {
    auto out = vcs.execute(dir, {"rev-parse", "--is-bare-repository"});
    if (!out) return out.error();
    return out.value() == "true";
}

Expected<std::string> currentBranch(VersionControlTool& vcs, const fs::path& dir) {
    auto out = vcs.execute(dir, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (!out) return withContext("failed to get current branch", out.error());
    return out.value();
}

Expected<std::vector<WorktreeRecord>> listWorktrees(VersionControlTool& vcs, const fs::path& dir) {
    auto out = vcs.execute(dir, {"worktree", "list", "--porcelain"});
    if (!out) return withContext("failed to list worktrees", out.error());
    return parseWorktreeList(out.value());
}

Expected<std::string> defaultBranch(VersionControlTool& vcs, const fs::path& storeDir) {
    auto out = vcs.execute(storeDir, {"symbolic-ref", "refs/remotes/origin/HEAD"});
    if (out) {
        const std::string prefix = "refs/remotes/origin/";
        const std::string& ref = out.value();
        return ref.rfind(prefix, 0) == 0 ? ref.substr(prefix.size()) : ref;
    }
    for (const char* candidate : {"main", "master"}) {
        auto exists = vcs.execute(storeDir, {"show-ref", "--verify", "--quiet",
                                             std::string(Constants::BRANCH_REF_PREFIX) + candidate});
        if (exists) return std::string(candidate);
    }
    return withContext("failed to detect default branch", out.error());
}

Expected<void> setBare(VersionControlTool& vcs, const fs::path& storeDir, bool bare) {
    auto out = vcs.execute(storeDir, {"config", "--bool", "core.bare", bare ? "true" : "false"});
    if (!out) return withContext("failed to set core.bare", out.error());
    return {};
}

Expected<bool> isBareConfigured(VersionControlTool& vcs, const fs::path& storeDir) {
    auto out = vcs.execute(storeDir, {"config", "--file", (storeDir / "config").string(), "--bool", "core.bare"});
    if (!out) return false;
    return out.value() == "true";
}

Expected<std::string> remoteUrl(VersionControlTool& vcs, const fs::path& dir) {
    auto origin = vcs.execute(dir, {"config", "--get", "remote.origin.url"});
    if (origin && !origin.value().empty()) return origin.value();

    auto remotes = vcs.execute(dir, {"remote"});
    if (!remotes || remotes.value().empty()) {
        return Error{ErrorCode::ConfigError, "no git remotes configured"};
    }
    const std::string first = splitLines(remotes.value()).front();
    auto url = vcs.execute(dir, {"config", "--get", "remote." + first + ".url"});
    if (!url || url.value().empty()) {
        return Error{ErrorCode::ConfigError, "failed to get URL of remote '" + first + "'"};
    }
    return url.value();
}

Expected<void> setConfigInFile(VersionControlTool& vcs, const fs::path& workDir, const fs::path& configFile,
                               const std::string& key, const std::string& value) {
    auto out = vcs.execute(workDir, {"config", "--file", configFile.string(), key, value});
    if (!out) return withContext("failed to set " + key, out.error());
    return {};
}

std::vector<std::string> globalConfigValues(VersionControlTool& vcs, const std::string& key) {
    // Exit status 1 only means "unset"; either way there is nothing to use
    auto out = vcs.execute(fs::path(), {"config", "--global", "--get-all", key});
    if (!out) return {};
    return splitLines(out.value());
}

Expected<void> addWorktree(VersionControlTool& vcs, const fs::path& storeDir,
                           const fs::path& path, const std::string& branch) {
    auto out = vcs.execute(storeDir, {"worktree", "add", path.string(), branch});
    if (!out) return withContext("failed to add worktree for " + branch, out.error());
    return {};
}

Expected<void> repairWorktree(VersionControlTool& vcs, const fs::path& storeDir, const fs::path& path) {
    auto out = vcs.execute(storeDir, {"worktree", "repair", path.string()});
    if (!out) return withContext("failed to repair worktree " + path.string(), out.error());
    return {};
}

}

}
