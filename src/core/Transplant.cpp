#include "core/Transplant.hpp"

#include <algorithm>

#include "util/Logger.hpp"
#include "util/NodeInfo.hpp"
#include "util/Paths.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace {

Error transplantError(const std::string& what, const fs::path& p, const std::error_code& ec) {
    return Error{ErrorCode::TransplantFailed, what + " " + p.string() + ": " + ec.message()};
}

Expected<std::vector<fs::path>> listChildren(const fs::path& dir) {
    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return transplantError("failed to read directory", dir, ec);
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        children.push_back(it->path());
    }
    if (ec) return transplantError("failed to read directory", dir, ec);
    std::sort(children.begin(), children.end());
    return children;
}

Expected<NodeInfo> inspect(const fs::path& p) {
    std::error_code ec;
    NodeInfo info = getNodeInfo(p, ec);
    if (ec) return transplantError("failed to stat", p, ec);
    return info;
}

bool sameNode(const fs::path& a, const fs::path& b) {
    return Paths::normalizeAbsolute(a) == Paths::normalizeAbsolute(b);
}

bool excludedName(const fs::path& child, const std::vector<std::string>& names) {
    const std::string name = child.filename().string();
    return std::find(names.begin(), names.end(), name) != names.end();
}

/// Creates dst as a directory when missing; reports whether it was created
Expected<bool> ensureDirectory(const fs::path& dst) {
    auto dstInfo = inspect(dst);
    if (!dstInfo) return dstInfo.error();
    if (dstInfo.value().type == NodeType::Directory) return false;
    if (dstInfo.value().type != NodeType::Missing) {
        return Error{ErrorCode::TransplantFailed, "destination exists and is a " +
                     std::string(nodeTypeName(dstInfo.value().type)) + ": " + dst.string()};
    }
    std::error_code ec;
    fs::create_directory(dst, ec);
    if (ec) return transplantError("failed to create directory", dst, ec);
    return true;
}

Expected<void> copyTree(const fs::path& src, const fs::path& dst, const fs::path& exclude) {
    if (!exclude.empty() && sameNode(src, exclude)) return {};

    auto infoRes = inspect(src);
    if (!infoRes) return infoRes.error();
    const NodeInfo& info = infoRes.value();
    std::error_code ec;

    switch (info.type) {
        case NodeType::Missing:
            return Error{ErrorCode::TransplantFailed, "missing entry: " + src.string()};

        case NodeType::Symlink:
            // Recreated as a link, never dereferenced
            fs::create_symlink(info.symlinkTarget, dst, ec);
            if (ec) return transplantError("failed to create symlink", dst, ec);
            return {};

        case NodeType::RegularFile:
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
            if (ec) return transplantError("failed to copy file", src, ec);
            fs::permissions(dst, info.permissions, fs::perm_options::replace, ec);
            if (ec) return transplantError("failed to set permissions on", dst, ec);
            return {};

        case NodeType::Directory: {
            auto created = ensureDirectory(dst);
            if (!created) return created.error();
            auto children = listChildren(src);
            if (!children) return children.error();
            for (const auto& child : children.value()) {
                auto res = copyTree(child, dst / child.filename(), exclude);
                if (!res) return res;
            }
            // Applied last so read-only directories can still be populated
            fs::permissions(dst, info.permissions, fs::perm_options::replace, ec);
            if (ec) return transplantError("failed to set permissions on", dst, ec);
            return {};
        }

        case NodeType::Other:
            break;
    }
    return Error{ErrorCode::TransplantFailed, "unsupported node type: " + src.string()};
}

/// rename() of a directory to a new parent needs write access to the directory itself (its ".." changes)
void renameReadOnlyDirectory(const fs::path& src, const fs::path& dst, std::error_code& ec) {
    std::error_code statEc;
    NodeInfo info = getNodeInfo(src, statEc);
    if (statEc || info.type != NodeType::Directory || (info.permissions & fs::perms::owner_write) != fs::perms::none) {
        return;
    }
    std::error_code permEc;
    fs::permissions(src, fs::perms::owner_write, fs::perm_options::add, permEc);
    if (permEc) return;
    ec.clear();
    fs::rename(src, dst, ec);
    const fs::path& now = ec ? src : dst;
    fs::permissions(now, info.permissions, fs::perm_options::replace, permEc);
    if (permEc) Logger::instance().warn("could not make " + now.string() + " read-only again: " + permEc.message());
}

Expected<void> renameNode(const fs::path& src, const fs::path& dst, CompensationStack* journal) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (ec == std::errc::permission_denied) renameReadOnlyDirectory(src, dst, ec);
    if (!ec) {
        if (journal) {
            journal->push("move " + dst.string() + " back to " + src.string(), [src, dst]() -> Expected<void> {
                std::error_code undoEc;
                fs::rename(dst, src, undoEc);
                if (undoEc == std::errc::permission_denied) renameReadOnlyDirectory(dst, src, undoEc);
                if (undoEc) return transplantError("failed to move back", dst, undoEc);
                return {};
            });
        }
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return transplantError("failed to move", src, ec);
    }
    Logger::instance().debug("cross-device move, copying " + src.string());
    return moveByCopy(src, dst, journal);
}

Expected<void> moveNode(const fs::path& src, const fs::path& dst, const TransplantOptions& options);

/// Children of dir move into dst, dir itself stays (it still holds the excluded subtree)
Expected<void> moveAroundExcluded(const fs::path& src, const fs::path& dst, const TransplantOptions& options) {
    auto created = ensureDirectory(dst);
    if (!created) return created.error();
    if (created.value() && options.journal) {
        options.journal->push("remove directory " + dst.string(), [dst]() -> Expected<void> {
            std::error_code ec;
            fs::remove(dst, ec);
            if (ec) return transplantError("failed to remove directory", dst, ec);
            return {};
        });
    }
    auto children = listChildren(src);
    if (!children) return children.error();
    for (const auto& child : children.value()) {
        auto res = moveNode(child, dst / child.filename(), options);
        if (!res) return res;
    }
    return {};
}

Expected<void> mergeMove(const fs::path& src, const fs::path& dst, const NodeInfo& srcInfo,
                         const TransplantOptions& options) {
    auto children = listChildren(src);
    if (!children) return children.error();
    for (const auto& child : children.value()) {
        auto res = moveNode(child, dst / child.filename(), options);
        if (!res) return res;
    }
    std::error_code ec;
    fs::remove(src, ec);
    if (ec) return transplantError("failed to remove emptied directory", src, ec);
    if (options.journal) {
        fs::perms perms = srcInfo.permissions;
        options.journal->push("recreate directory " + src.string(), [src, perms]() -> Expected<void> {
            std::error_code undoEc;
            fs::create_directory(src, undoEc);
            if (!undoEc) fs::permissions(src, perms, fs::perm_options::replace, undoEc);
            if (undoEc) return transplantError("failed to recreate directory", src, undoEc);
            return {};
        });
    }
    return {};
}

Expected<void> moveNode(const fs::path& src, const fs::path& dst, const TransplantOptions& options) {
    const fs::path& exclude = options.excludeSubtree;
    if (!exclude.empty()) {
        if (sameNode(src, exclude)) return {};
        if (Paths::isStrictAncestor(src, exclude)) return moveAroundExcluded(src, dst, options);
    }

    auto srcInfo = inspect(src);
    if (!srcInfo) return srcInfo.error();
    if (srcInfo.value().type == NodeType::Missing) {
        return Error{ErrorCode::TransplantFailed, "missing entry: " + src.string()};
    }
    auto dstInfo = inspect(dst);
    if (!dstInfo) return dstInfo.error();

    if (dstInfo.value().type == NodeType::Directory && srcInfo.value().type == NodeType::Directory) {
        return mergeMove(src, dst, srcInfo.value(), options);
    }
    if (dstInfo.value().type != NodeType::Missing) {
        return Error{ErrorCode::TransplantFailed, "destination already exists: " + dst.string()};
    }
    return renameNode(src, dst, options.journal);
}

}

Expected<void> createDirectoryChain(const fs::path& dir, CompensationStack* journal) {
    std::vector<fs::path> missing;
    for (fs::path p = Paths::normalizeAbsolute(dir); !p.empty(); p = p.parent_path()) {
        auto info = inspect(p);
        if (!info) return info.error();
        if (info.value().type == NodeType::Directory) break;
        if (info.value().type != NodeType::Missing) {
            return Error{ErrorCode::TransplantFailed, std::string("cannot create directory, a ") +
                         nodeTypeName(info.value().type) + " is in the way: " + p.string()};
        }
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        const fs::path created = *it;
        std::error_code ec;
        fs::create_directory(created, ec);
        if (ec) return transplantError("failed to create directory", created, ec);
        if (journal) {
            journal->push("remove directory " + created.string(), [created]() -> Expected<void> {
                std::error_code undoEc;
                fs::remove(created, undoEc);
                if (undoEc) return transplantError("failed to remove directory", created, undoEc);
                return {};
            });
        }
    }
    return {};
}

Expected<void> copyNode(const fs::path& src, const fs::path& dst) {
    return copyTree(src, dst, fs::path());
}

void removeTree(const fs::path& p, std::error_code& ec) {
    NodeInfo info = getNodeInfo(p, ec);
    if (ec || info.type == NodeType::Missing) return;
    if (info.type == NodeType::Directory) {
        fs::permissions(p, fs::perms::owner_all, fs::perm_options::add, ec);
        if (ec) return;
        std::vector<fs::path> children;
        fs::directory_iterator it(p, ec);
        for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            children.push_back(it->path());
        }
        for (const auto& child : children) {
            if (!ec) removeTree(child, ec);
        }
        if (ec) return;
    }
    fs::remove(p, ec);
}

Expected<void> moveByCopy(const fs::path& src, const fs::path& dst, CompensationStack* journal) {
    auto copied = copyTree(src, dst, fs::path());
    if (!copied) return copied;
    std::error_code ec;
    removeTree(src, ec);
    if (ec) return transplantError("failed to remove moved source", src, ec);
    if (journal) {
        journal->push("copy " + dst.string() + " back to " + src.string(), [src, dst]() -> Expected<void> {
            auto back = copyTree(dst, src, fs::path());
            if (!back) return back;
            std::error_code undoEc;
            removeTree(dst, undoEc);
            if (undoEc) return transplantError("failed to remove", dst, undoEc);
            return {};
        });
    }
    return {};
}

Expected<void> transplantNode(const fs::path& src, const fs::path& dst, TransplantMode mode,
                              const TransplantOptions& options) {
    TransplantOptions nested = options;
    nested.excludeNames.clear();

    if (mode == TransplantMode::Move) {
        return moveNode(src, dst, nested);
    }

    auto dstInfo = inspect(dst);
    if (!dstInfo) return dstInfo.error();
    if (dstInfo.value().type == NodeType::Missing && options.journal) {
        options.journal->push("remove copy " + dst.string(), [dst]() -> Expected<void> {
            std::error_code ec;
            removeTree(dst, ec);
            if (ec) return transplantError("failed to remove", dst, ec);
            return {};
        });
    }
    return copyTree(src, dst, options.excludeSubtree);
}

Expected<void> transplantContents(const fs::path& srcDir, const fs::path& dstDir, TransplantMode mode,
                                  const TransplantOptions& options) {
    auto srcInfo = inspect(srcDir);
    if (!srcInfo) return srcInfo.error();
    if (srcInfo.value().type != NodeType::Directory) {
        return Error{ErrorCode::TransplantFailed, "not a directory: " + srcDir.string()};
    }

    auto created = ensureDirectory(dstDir);
    if (!created) return created.error();
    if (created.value() && options.journal) {
        options.journal->push("remove directory " + dstDir.string(), [dstDir]() -> Expected<void> {
            std::error_code ec;
            removeTree(dstDir, ec);
            if (ec) return transplantError("failed to remove", dstDir, ec);
            return {};
        });
    }

    auto children = listChildren(srcDir);
    if (!children) return children.error();
    for (const auto& child : children.value()) {
        if (excludedName(child, options.excludeNames)) continue;
        auto res = transplantNode(child, dstDir / child.filename(), mode, options);
        if (!res) return res;
    }

    if (created.value()) {
        std::error_code ec;
        fs::permissions(dstDir, srcInfo.value().permissions, fs::perm_options::replace, ec);
        if (ec) return transplantError("failed to set permissions on", dstDir, ec);
    }
    return {};
}

}
