#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace baretree {

/// Whole-file read in binary mode; ErrorCode::IoError when unreadable
Expected<std::string> readTextFile(const std::filesystem::path& path);

/// Truncate-and-write in binary mode; ErrorCode::IoError on any stream failure
Expected<void> writeTextFile(const std::filesystem::path& path, const std::string& content);

/// Strip trailing whitespace and line endings
std::string trimTrailing(std::string text);

}
