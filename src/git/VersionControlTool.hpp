#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace baretree {

/**
 * @brief Porcelain/plumbing access to the version-control tool
 *
 * The migration engine never reimplements version-control semantics; every
 * question about refs, configuration or worktree registration goes through
 * this interface. GitExecutor is the production implementation, tests
 * substitute a scripted fake.
 */
class VersionControlTool {
public:
    virtual ~VersionControlTool() = default;

    /// Run a clone with the given arguments (URL, target, options)
    virtual Expected<void> clone(const std::vector<std::string>& args) = 0;

    /**
     * @brief Run a command in a working directory
     * @param workDir Directory the tool runs in (empty = inherit)
     * @param args Arguments after the tool name, e.g. {"rev-parse", "HEAD"}
     * @return Standard output with surrounding whitespace trimmed, or
     *         ErrorCode::VcsFailed carrying the tool's stderr
     */
    virtual Expected<std::string> execute(const std::filesystem::path& workDir,
                                          const std::vector<std::string>& args) = 0;
};

}
