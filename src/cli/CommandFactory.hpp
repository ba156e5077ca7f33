#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace baretree {

/**
 * @brief Registry of command creators and their multi-word aliases
 *
 * main.cpp joins "repo <sub>" into one name before lookup, so an alias is
 * just another key that resolves to a registered command.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);

    /// Make alias ("repo migrate") create the same command as target ("migrate")
    void registerAlias(const std::string& alias, const std::string& target);

    /// Registered command name for name or one of its aliases
    std::optional<std::string> canonicalName(const std::string& name) const;

    /// Aliases registered for a command, sorted
    std::vector<std::string> aliasesOf(const std::string& name) const;

    /// Resolves aliases; nullptr for unknown names
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One instance per registered command (aliases excluded), sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
    std::map<std::string, std::string> aliases;   // alias -> command name
};

}
