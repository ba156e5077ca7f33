#pragma once

#include <string>

#include "git/VersionControlTool.hpp"

namespace baretree {

/**
 * @brief Runs the git binary as a child process
 *
 * Arguments are passed to execvp directly (no shell), stdout and stderr are
 * captured separately. A non-zero exit status becomes ErrorCode::VcsFailed
 * whose message contains the command line and the captured stderr.
 */
class GitExecutor : public VersionControlTool {
public:
    explicit GitExecutor(std::string program = "git");

    Expected<void> clone(const std::vector<std::string>& args) override;
    Expected<std::string> execute(const std::filesystem::path& workDir,
                                  const std::vector<std::string>& args) override;

    /// True when the program can be started at all (used to skip integration tests)
    bool available();

private:
    struct ProcessResult {
        int exitCode{-1};
        std::string out;
        std::string err;
    };

    Expected<ProcessResult> run(const std::filesystem::path& workDir,
                                const std::vector<std::string>& args) const;

    std::string program;
};

}
