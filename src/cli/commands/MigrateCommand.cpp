#include "cli/commands/MigrateCommand.hpp"

#include <iostream>

#include "core/Migration.hpp"
#include "core/Settings.hpp"

namespace baretree {

namespace {

Error usage(const std::string& msg) {
    return Error{ErrorCode::InvalidArgs, msg};
}

/// Accepts "--flag value" and "--flag=value"; advances i past a separate value
Expected<std::string> takeValue(const std::vector<std::string>& args, size_t& i, const std::string& flag) {
    const std::string& arg = args[i];
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) return arg.substr(eq + 1);
    if (i + 1 >= args.size()) return usage("option " + flag + " requires a value");
    return args[++i];
}

bool isFlag(const std::string& arg, const char* shortName, const char* longName) {
    if (arg == shortName || arg == longName) return true;
    std::string withValue = std::string(longName) + "=";
    return arg.rfind(withValue, 0) == 0;
}

void printSummary(const MigrateOptions& opts, const MigrationReport& report) {
    std::cout << "\nMigration successful\n";
    std::cout << "  Repository root: " << report.root.string() << "\n";
    std::cout << "  Store:           " << report.store.string() << "\n";
    if (!report.primaryWorktree.empty()) {
        std::cout << "  Worktree:        " << report.primaryWorktree.string() << " (" << report.branch << ")\n";
    }
    if (!report.defaultBranchWorktree.empty()) {
        std::cout << "  Worktree:        " << report.defaultBranchWorktree.string() << " (default branch)\n";
    }
    for (const auto& wt : report.relocated) {
        std::cout << "  Worktree:        " << wt.string() << "\n";
    }
    if (!report.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto& w : report.warnings) std::cout << "  - " << w << "\n";
    }
    if (report.sourceRemoved) {
        std::cout << "\nOriginal removed: " << opts.source << "\n";
    } else if (!opts.inPlace) {
        std::cout << "\nOriginal repository preserved at: " << opts.source << "\n";
    }
    if (!report.primaryWorktree.empty()) {
        std::cout << "\nNext steps:\n  cd " << report.primaryWorktree.string() << "\n";
    }
}

}

Expected<MigrateOptions> MigrateCommand::parseOptions(const std::vector<std::string>& args) {
    MigrateOptions opts;
    bool haveSource = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-i" || arg == "--in-place") {
            opts.inPlace = true;
        } else if (arg == "-m" || arg == "--to-managed") {
            opts.toManaged = true;
        } else if (arg == "-r" || arg == "--remove-source") {
            opts.removeSource = true;
        } else if (isFlag(arg, "-d", "--destination")) {
            auto v = takeValue(args, i, "--destination");
            if (!v) return v.error();
            if (v.value().empty()) return usage("--destination needs a directory");
            opts.destination = v.value();
        } else if (isFlag(arg, "-p", "--path")) {
            auto v = takeValue(args, i, "--path");
            if (!v) return v.error();
            opts.repoPath = v.value();
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage("unknown option: " + arg);
        } else if (haveSource) {
            return usage("expected exactly one repository path, got '" + opts.source + "' and '" + arg + "'");
        } else {
            opts.source = arg;
            haveSource = true;
        }
    }

    if (!haveSource) return usage("missing repository path (see 'bt help migrate')");

    int modes = (opts.inPlace ? 1 : 0) + (opts.destination.empty() ? 0 : 1) + (opts.toManaged ? 1 : 0);
    if (modes == 0) {
        return usage("you must specify one of --in-place (-i), --destination (-d), or --to-managed (-m)");
    }
    if (modes > 1) return usage("cannot use multiple mode flags together");
    if (!opts.repoPath.empty() && !opts.toManaged) return usage("--path can only be used with --to-managed");
    if (opts.removeSource && opts.inPlace) return usage("--remove-source cannot be used with --in-place");
    return opts;
}

Expected<void> MigrateCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseOptions(args);
    if (!parsed) return parsed.error();
    const MigrateOptions& opts = parsed.value();

    SettingsResolver resolver(processEnvironment(), gitConfigLookup(*ctx.vcs));
    Migrator migrator(*ctx.vcs, resolver.resolve());

    Expected<MigrationReport> report = Error{ErrorCode::InternalError, "no migration mode"};
    if (opts.inPlace) {
        report = migrator.migrateInPlace(opts.source);
    } else if (opts.toManaged) {
        report = migrator.migrateToManagedRoot(opts.source, opts.repoPath, opts.removeSource);
    } else {
        report = migrator.migrateToDestination(opts.source, opts.destination, opts.removeSource);
    }
    if (!report) return report.error();

    printSummary(opts, report.value());
    return {};
}

}
