#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace baretree {

/**
 * @brief Lexical path helpers shared by the planner and the rewriters
 *
 * None of these touch the filesystem except normalizeAbsolute, which may
 * consult the current directory to absolutize a relative path.
 */
namespace Paths {

/// Absolute, lexically normal, without a trailing separator
std::filesystem::path normalizeAbsolute(const std::filesystem::path& p);

/// True when child equals parent or lies below it (lexical comparison)
bool isWithin(const std::filesystem::path& parent, const std::filesystem::path& child);

/// True when ancestor lies strictly above descendant
bool isStrictAncestor(const std::filesystem::path& ancestor, const std::filesystem::path& descendant);

/// Number of non-empty components of a relative path ("a/b" -> 2, "." -> 0)
std::size_t componentCount(const std::filesystem::path& relative);

/// Resolve symlinks in the existing prefix (falls back to normalizeAbsolute)
std::filesystem::path canonicalOrNormal(const std::filesystem::path& p);

}

}
