#pragma once

#include <string>

#include "cli/ICommand.hpp"

namespace baretree {

/// Parsed `bt migrate` arguments
struct MigrateOptions {
    std::string source;
    bool inPlace{false};
    std::string destination;
    bool toManaged{false};
    std::string repoPath;
    bool removeSource{false};
};

class MigrateCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "migrate"; }
    const char* description() const override { return "Convert an existing repository to the split worktree layout"; }
    const char* helpNameLine() const override { return "migrate -  Convert an existing repository to the split worktree layout"; }
    const char* helpSynopsis() const override { return "bt migrate <path> (-i | -d <dest> | -m [-p <host/user/repo>]) [-r]"; }
    const char* helpDescription() const override {
        return "Move the repository's .git directory into a shared bare store and its working tree into\n"
               "<root>/<branch>, keeping staged, unstaged, untracked and ignored files. Worktrees that\n"
               "live outside the repository are relocated to <root>/<branch> as well, and submodule\n"
               "links are recomputed. Exactly one of -i, -d or -m selects where the result goes.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-i, --in-place", "Convert the repository where it is."},
            {"-d, --destination <dir>", "Build the new layout in <dir> from copies; the original is kept."},
            {"-m, --to-managed", "Copy into <managed root>/<host>/<user>/<repo>, derived from the remote URL."},
            {"-p, --path <host/user/repo>", "Managed location to use instead of the remote URL (only with -m)."},
            {"-r, --remove-source", "Remove the original after a successful migration (not with -i)."}
        };
    }

    /// Parse and cross-check the flags; ErrorCode::InvalidArgs on misuse
    static Expected<MigrateOptions> parseOptions(const std::vector<std::string>& args);
};

}
