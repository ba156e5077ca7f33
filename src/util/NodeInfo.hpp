#pragma once

#include <filesystem>
#include <string>

namespace baretree {

enum class NodeType { Missing, RegularFile, Directory, Symlink, Other };

/**
 * @brief Link-aware description of a single filesystem node
 *
 * Obtained with symlink_status, so a symbolic link is reported as Symlink
 * together with its stored target and never as the node it points at.
 */
struct NodeInfo {
    NodeType type{NodeType::Missing};
    std::filesystem::perms permissions{std::filesystem::perms::none};
    std::filesystem::path symlinkTarget;   // Only set for Symlink
};

/**
 * @brief Read node type, permission bits and symlink target
 *
 * @param p Path to inspect (not followed if it is a symlink)
 * @param ec Set when the node exists but cannot be inspected
 * @return NodeInfo; type is Missing when nothing exists at p
 */
NodeInfo getNodeInfo(const std::filesystem::path& p, std::error_code& ec);

/// Human-readable node type, used in error messages
const char* nodeTypeName(NodeType type);

}
