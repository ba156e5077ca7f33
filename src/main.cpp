// Modular CLI entry using Command Pattern.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/MigrateCommand.hpp"
#include "git/GitExecutor.hpp"
#include "util/Logger.hpp"

using namespace baretree;

namespace {

void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("migrate", [] { return std::make_unique<MigrateCommand>(); });
    f.registerAlias("repo migrate", "migrate");
}

}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (args.empty() && (arg == "--verbose" || arg == "-v")) {
            Logger::instance().setLevel(LogLevel::Debug);
            continue;
        }
        args.push_back(arg);
    }

    GitExecutor git;
    AppContext ctx{&git};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    // Grouped form: "bt repo migrate ..."
    if (cmdName == "repo" && !args.empty()) {
        cmdName += " " + args.front();
        args.erase(args.begin());
    }
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 2;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : exitStatusFor(res.error().code);
}
