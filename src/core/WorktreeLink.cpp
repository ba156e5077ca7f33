#include "core/WorktreeLink.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/NodeInfo.hpp"
#include "util/Paths.hpp"
#include "util/TextFile.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace AdminFiles {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

Error malformed(const std::string& file, const std::string& text) {
    return Error{ErrorCode::LinkFailed, "malformed " + file + ": '" + trimTrailing(text) + "'"};
}

}

std::string escapeName(const std::string& branch) {
    std::string out;
    out.reserve(branch.size());
    for (char c : branch) {
        if (c == '%') out += "%25";
        else if (c == '/') out += "%2F";
        else out += c;
    }
    return out;
}

std::string unescapeName(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (std::size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] == '%' && i + 2 < escaped.size()) {
            std::string code = escaped.substr(i + 1, 2);
            if (code == "25") { out += '%'; i += 2; continue; }
            if (code == "2F" || code == "2f") { out += '/'; i += 2; continue; }
        }
        out += escaped[i];
    }
    return out;
}

std::string encodeLinkFile(const fs::path& adminArea) {
    return std::string(Constants::GITDIR_PREFIX) + Paths::normalizeAbsolute(adminArea).string() + "\n";
}

Expected<fs::path> decodeLinkFile(const std::string& text) {
    std::string line = trimTrailing(text);
    if (!startsWith(line, Constants::GITDIR_PREFIX)) return malformed("link file", text);
    std::string target = line.substr(std::string(Constants::GITDIR_PREFIX).size());
    if (target.empty()) return malformed("link file", text);
    return fs::path(target);
}

std::string encodeCommondir(const fs::path& adminArea, const fs::path& store) {
    fs::path rel = Paths::normalizeAbsolute(store).lexically_relative(Paths::normalizeAbsolute(adminArea));
    return rel.generic_string() + "\n";
}

Expected<fs::path> decodeCommondir(const std::string& text, const fs::path& adminArea) {
    std::string line = trimTrailing(text);
    if (line.empty()) return malformed("commondir", text);
    fs::path p(line);
    if (p.is_relative()) p = adminArea / p;
    return Paths::normalizeAbsolute(p);
}

std::string encodeGitdir(const fs::path& worktree) {
    return (Paths::normalizeAbsolute(worktree) / Constants::LINK_FILE_NAME).string() + "\n";
}

Expected<fs::path> decodeGitdir(const std::string& text) {
    std::string line = trimTrailing(text);
    if (line.empty()) return malformed("gitdir", text);
    return fs::path(line);
}

std::string encodeHead(const HeadValue& head) {
    if (head.detached) return head.commit + "\n";
    return std::string(Constants::SYMREF_PREFIX) + Constants::BRANCH_REF_PREFIX + head.branch + "\n";
}

Expected<HeadValue> decodeHead(const std::string& text) {
    std::string line = trimTrailing(text);
    HeadValue head;
    if (startsWith(line, Constants::SYMREF_PREFIX)) {
        std::string ref = line.substr(std::string(Constants::SYMREF_PREFIX).size());
        if (!startsWith(ref, Constants::BRANCH_REF_PREFIX)) return malformed("HEAD", text);
        head.branch = ref.substr(std::string(Constants::BRANCH_REF_PREFIX).size());
        if (head.branch.empty()) return malformed("HEAD", text);
        return head;
    }
    if (line.empty() || line.find_first_of(" \t") != std::string::npos) return malformed("HEAD", text);
    head.detached = true;
    head.commit = line;
    return head;
}

}

namespace {

Error linkError(const std::string& what, const fs::path& p, const std::string& reason) {
    return Error{ErrorCode::LinkFailed, what + " " + p.string() + ": " + reason};
}

/// Write one admin file, journaling the previous content (or the file's absence)
Expected<void> writeAdminFile(const fs::path& path, const std::string& content, CompensationStack* journal) {
    std::error_code ec;
    NodeInfo info = getNodeInfo(path, ec);
    if (ec) return linkError("failed to stat", path, ec.message());
    if (info.type != NodeType::Missing && info.type != NodeType::RegularFile) {
        return linkError("cannot write", path, std::string("it is a ") + nodeTypeName(info.type));
    }

    bool existed = info.type == NodeType::RegularFile;
    std::string previous;
    if (existed) {
        auto old = readTextFile(path);
        if (!old) return linkError("failed to read", path, old.error().message);
        previous = old.value();
    }

    auto res = writeTextFile(path, content);
    if (!res) return Error{ErrorCode::LinkFailed, res.error().message};
    Logger::instance().debug("wrote " + path.string());

    if (journal) {
        journal->push("restore " + path.string(), [path, existed, previous]() -> Expected<void> {
            if (existed) return writeTextFile(path, previous);
            std::error_code undoEc;
            fs::remove(path, undoEc);
            if (undoEc) return linkError("failed to remove", path, undoEc.message());
            return {};
        });
    }
    return {};
}

Expected<void> ensureDir(const fs::path& dir, CompensationStack* journal) {
    std::error_code ec;
    NodeInfo info = getNodeInfo(dir, ec);
    if (ec) return linkError("failed to stat", dir, ec.message());
    if (info.type == NodeType::Directory) return {};
    if (info.type != NodeType::Missing) {
        return linkError("cannot create directory", dir, std::string("a ") + nodeTypeName(info.type) + " is in the way");
    }
    fs::create_directory(dir, ec);
    if (ec) return linkError("failed to create", dir, ec.message());
    if (journal) {
        journal->push("remove " + dir.string(), [dir]() -> Expected<void> {
            std::error_code undoEc;
            fs::remove_all(dir, undoEc);
            if (undoEc) return linkError("failed to remove", dir, undoEc.message());
            return {};
        });
    }
    return {};
}

Expected<void> adoptIndex(const fs::path& storeIndex, const fs::path& adminIndex, CompensationStack* journal) {
    std::error_code ec;
    NodeInfo info = getNodeInfo(storeIndex, ec);
    if (ec) return linkError("failed to stat", storeIndex, ec.message());
    if (info.type != NodeType::RegularFile) return {};

    fs::copy_file(storeIndex, adminIndex, fs::copy_options::overwrite_existing, ec);
    if (ec) return linkError("failed to copy index to", adminIndex, ec.message());
    fs::remove(storeIndex, ec);
    if (ec) return linkError("failed to remove", storeIndex, ec.message());
    Logger::instance().debug("moved index into " + adminIndex.parent_path().string());

    if (journal) {
        journal->push("return index to " + storeIndex.string(), [storeIndex, adminIndex]() -> Expected<void> {
            std::error_code undoEc;
            fs::copy_file(adminIndex, storeIndex, fs::copy_options::overwrite_existing, undoEc);
            if (!undoEc) fs::remove(adminIndex, undoEc);
            if (undoEc) return linkError("failed to restore", storeIndex, undoEc.message());
            return {};
        });
    }
    return {};
}

}

AdminFileSet deriveAdminFiles(const LinkRequest& req, const std::string& adminName) {
    AdminFileSet files;
    files.adminArea = Paths::normalizeAbsolute(req.storePath) / Constants::ADMIN_AREAS_DIR / adminName;
    files.linkFile = AdminFiles::encodeLinkFile(files.adminArea);
    files.commondir = AdminFiles::encodeCommondir(files.adminArea, req.storePath);
    files.gitdir = AdminFiles::encodeGitdir(req.worktreePath);

    AdminFiles::HeadValue head;
    head.detached = req.detached;
    head.branch = req.branch;
    head.commit = req.detachedHead;
    files.head = AdminFiles::encodeHead(head);
    return files;
}

Expected<fs::path> synthesizeLink(const LinkRequest& req, const std::string& adminName, CompensationStack* journal) {
    if (adminName.empty() || adminName.find('/') != std::string::npos) {
        return Error{ErrorCode::LinkFailed, "invalid admin area name '" + adminName + "'"};
    }
    if (!req.detached && req.branch.empty()) {
        return Error{ErrorCode::LinkFailed, "no branch given for " + req.worktreePath.string()};
    }

    const AdminFileSet files = deriveAdminFiles(req, adminName);
    const fs::path store = Paths::normalizeAbsolute(req.storePath);
    const fs::path worktree = Paths::normalizeAbsolute(req.worktreePath);

    auto res = ensureDir(store / Constants::ADMIN_AREAS_DIR, journal);
    if (!res) return res.error();
    res = ensureDir(files.adminArea, journal);
    if (!res) return res.error();

    res = writeAdminFile(worktree / Constants::LINK_FILE_NAME, files.linkFile, journal);
    if (!res) return res.error();
    res = writeAdminFile(files.adminArea / Constants::ADMIN_COMMONDIR, files.commondir, journal);
    if (!res) return res.error();
    res = writeAdminFile(files.adminArea / Constants::ADMIN_GITDIR, files.gitdir, journal);
    if (!res) return res.error();

    const fs::path headPath = files.adminArea / Constants::ADMIN_HEAD;
    std::error_code ec;
    bool haveHead = getNodeInfo(headPath, ec).type == NodeType::RegularFile;
    if (req.detached && haveHead) {
        Logger::instance().debug("keeping detached HEAD in " + files.adminArea.string());
    } else if (req.detached && req.detachedHead.empty()) {
        return linkError("no HEAD to keep for detached worktree", worktree, "commit unknown");
    } else {
        res = writeAdminFile(headPath, files.head, journal);
        if (!res) return res.error();
    }

    if (req.adoptStoreIndex) {
        res = adoptIndex(store / Constants::INDEX_FILE, files.adminArea / Constants::INDEX_FILE, journal);
        if (!res) return res.error();
    }
    return files.adminArea;
}

Expected<fs::path> verifyLink(const fs::path& worktreePath) {
    const fs::path worktree = Paths::normalizeAbsolute(worktreePath);
    const fs::path linkPath = worktree / Constants::LINK_FILE_NAME;

    auto linkText = readTextFile(linkPath);
    if (!linkText) return Error{ErrorCode::LinkFailed, linkText.error().message};
    auto admin = AdminFiles::decodeLinkFile(linkText.value());
    if (!admin) return admin.error();

    auto gitdirText = readTextFile(admin.value() / Constants::ADMIN_GITDIR);
    if (!gitdirText) return Error{ErrorCode::LinkFailed, gitdirText.error().message};
    auto back = AdminFiles::decodeGitdir(gitdirText.value());
    if (!back) return back.error();

    if (Paths::canonicalOrNormal(back.value()) != Paths::canonicalOrNormal(linkPath)) {
        return linkError("admin area does not point back at", linkPath, "gitdir is " + back.value().string());
    }
    return admin.value();
}

}
