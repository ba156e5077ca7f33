#include "cli/CommandFactory.hpp"

namespace baretree {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

void CommandFactory::registerAlias(const std::string& alias, const std::string& target) {
    aliases[alias] = target;
}

std::optional<std::string> CommandFactory::canonicalName(const std::string& name) const {
    if (creators.count(name) != 0) return name;
    auto alias = aliases.find(name);
    if (alias == aliases.end() || creators.count(alias->second) == 0) return std::nullopt;
    return alias->second;
}

std::vector<std::string> CommandFactory::aliasesOf(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& [alias, target] : aliases) {
        if (target == name) out.push_back(alias);
    }
    return out;
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto canonical = canonicalName(name);
    if (!canonical) return nullptr;
    return creators.at(*canonical)();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    // std::map keeps creators ordered by name
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
}

}
