#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace baretree {

namespace {

// "help repo migrate" asks about the alias "repo migrate"
std::string topicFrom(const std::vector<std::string>& args) {
    std::string topic;
    for (const auto& a : args) {
        if (!topic.empty()) topic += ' ';
        topic += a;
    }
    return topic;
}

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME:\n  " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n  " << cmd.helpSynopsis() << "\n";
    for (const auto& alias : CommandFactory::instance().aliasesOf(cmd.name())) {
        std::cout << "  (also available as 'bt " << alias << "')\n";
    }
    std::cout << "\nDESCRIPTION:\n" << cmd.helpDescription() << "\n\n";

    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "  " << opt << "\n      " << desc << "\n\n";
        }
    }
    std::cout << "EXIT STATUS:\n"
                 "  0  success\n"
                 "  1  the migration failed; anything it had changed was rolled back\n"
                 "  2  invalid arguments or a repository that cannot be migrated; nothing was changed\n"
                 "  3  rolling back failed as well; the repository needs manual attention\n";
}

void printOverview() {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: bt [--verbose] <command> [<args>]\n\n"
                 "bt keeps a repository as one bare store with a directory per worktree:\n\n"
                 "  <root>/.git            shared store (core.bare = true)\n"
                 "  <root>/<branch>        worktree of <branch>, nested for names like feature/x\n\n"
                 "Commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
        for (const auto& alias : CommandFactory::instance().aliasesOf(c->name())) {
            std::cout << "  " << alias << "\tsame as '" << c->name() << "'\n";
        }
    }
    std::cout << "\nSee 'bt help <command>' for details. Log level: BARETREE_LOG=debug|info|warn|error\n";
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string topic = topicFrom(args);
        if (auto cmd = CommandFactory::instance().create(topic)) {
            printCommandDetail(*cmd);
            return {};
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }
    printOverview();
    return {};
}

}
