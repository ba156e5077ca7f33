#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace baretree {

/// host/user/repo location of a repository below a managed root
struct RemotePath {
    std::string host;
    std::string user;
    std::string repo;   // May contain '/' for nested groups

    std::filesystem::path relative() const { return std::filesystem::path(host) / user / repo; }
    std::string toString() const { return relative().generic_string(); }
};

/**
 * @brief Parse a remote URL or short repository path
 *
 * Accepted forms:
 *   https://github.com/user/repo(.git)   http:// likewise, userinfo and port kept out of / in host
 *   git@github.com:user/repo(.git)       scp-like ssh
 *   ssh://git@github.com/user/repo.git
 *   github.com/user/repo                 host/user/repo, deeper paths go into repo
 *   user/repo                            needs defaultHost
 *   repo                                 needs defaultHost and defaultUser
 *
 * @return RemotePath, or ErrorCode::InvalidArgs
 */
Expected<RemotePath> parseRemotePath(const std::string& input, const std::string& defaultHost = "",
                                     const std::string& defaultUser = "");

}
