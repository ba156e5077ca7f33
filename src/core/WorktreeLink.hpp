#pragma once

#include <filesystem>
#include <string>

#include "core/CompensationStack.hpp"
#include "util/Expected.hpp"

namespace baretree {

/**
 * @brief Codecs for the single-field administrative files
 *
 * Each file holds exactly one value followed by a newline:
 *   <worktree>/.git             gitdir: <absolute admin area>
 *   <admin>/commondir           <store relative to the admin area>
 *   <admin>/gitdir              <absolute worktree>/.git
 *   <admin>/HEAD                ref: refs/heads/<branch>   |   <commit>
 *
 * Encoders are pure: the same inputs always produce the same bytes.
 * Decoders accept a missing trailing newline and CRLF endings.
 */
namespace AdminFiles {

/// "%" -> "%25" first, then "/" -> "%2F"
std::string escapeName(const std::string& branch);

/// Inverse of escapeName; unknown %XX sequences are kept literally
std::string unescapeName(const std::string& escaped);

std::string encodeLinkFile(const std::filesystem::path& adminArea);
Expected<std::filesystem::path> decodeLinkFile(const std::string& text);

std::string encodeCommondir(const std::filesystem::path& adminArea, const std::filesystem::path& store);
/// Resolved against adminArea when relative
Expected<std::filesystem::path> decodeCommondir(const std::string& text, const std::filesystem::path& adminArea);

std::string encodeGitdir(const std::filesystem::path& worktree);
Expected<std::filesystem::path> decodeGitdir(const std::string& text);

struct HeadValue {
    bool detached{false};
    std::string branch;   // Set when !detached
    std::string commit;   // Set when detached
};

std::string encodeHead(const HeadValue& head);
Expected<HeadValue> decodeHead(const std::string& text);

}

/// What a worktree has to be linked as
struct LinkRequest {
    std::filesystem::path worktreePath;
    std::filesystem::path storePath;
    std::string branch;               // Ignored when detached
    bool detached{false};
    std::string detachedHead;         // Commit written only when the area has no HEAD yet
    bool adoptStoreIndex{false};      // Primary worktree: take over <store>/index
};

/// Full content of one administrative file set, derived without touching disk
struct AdminFileSet {
    std::filesystem::path adminArea;
    std::string linkFile;
    std::string commondir;
    std::string gitdir;
    std::string head;
};

AdminFileSet deriveAdminFiles(const LinkRequest& req, const std::string& adminName);

/**
 * @brief Write the administrative files binding a worktree to the store
 *
 * Creates <store>/worktrees/<adminName>, then writes the worktree link file,
 * commondir, gitdir and HEAD in that order. A detached worktree keeps an
 * existing HEAD verbatim. With adoptStoreIndex the store's top-level index is
 * copied into the area and removed from the store.
 *
 * @param journal When set, receives an inverse for every file written
 * @return Absolute admin area path, or ErrorCode::LinkFailed. On failure some
 *         files may already be written; the worktree must be treated as unusable.
 */
Expected<std::filesystem::path> synthesizeLink(const LinkRequest& req, const std::string& adminName,
                                               CompensationStack* journal = nullptr);

/**
 * @brief Check that link file and admin gitdir point at each other
 * @return The admin area, or ErrorCode::LinkFailed describing the mismatch
 */
Expected<std::filesystem::path> verifyLink(const std::filesystem::path& worktreePath);

}
