#pragma once

#include "cli/ICommand.hpp"

namespace baretree {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "List commands, or explain one command"; }
    const char* helpNameLine() const override { return "help -  Show the layout bt manages and how each command is used"; }
    const char* helpSynopsis() const override { return "bt help [<command> | repo <command>]"; }
    const char* helpDescription() const override {
        return "Without arguments, list the commands and their aliases. With a command name or alias,\n"
               "print its synopsis, options and exit statuses.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
