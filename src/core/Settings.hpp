#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "git/VersionControlTool.hpp"

namespace baretree {

enum class SettingSource { Environment, GitConfig, Default };

const char* settingSourceName(SettingSource source);

/// Resolved managed-root settings for one invocation
struct Settings {
    std::vector<std::filesystem::path> roots;   // Last entry is the primary root
    SettingSource rootSource{SettingSource::Default};
    std::string user;                           // Empty when nothing is configured
    SettingSource userSource{SettingSource::Default};

    /// Last configured root; the expanded ~/baretree default when roots is empty
    std::filesystem::path primaryRoot() const;
};

/// Environment variable lookup; std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Multi-valued config lookup in file order; empty when unset
using ConfigLookup = std::function<std::vector<std::string>(const std::string&)>;

EnvLookup processEnvironment();

/// `git config --global --get-all` through the given tool
ConfigLookup gitConfigLookup(VersionControlTool& vcs);

/**
 * @brief Resolves managed roots and the default user
 *
 * Roots: BARETREE_ROOT, else every baretree.root value, else ~/baretree.
 * User: the last baretree.user value, else $USER.
 * A leading "~/" is expanded from $HOME. Lookups are injected so a resolver
 * never reads process-wide state on its own.
 */
class SettingsResolver {
public:
    SettingsResolver(EnvLookup env, ConfigLookup config);

    Settings resolve() const;

    /// "~/x" -> "$HOME/x"; other paths unchanged
    std::filesystem::path expandHome(const std::string& path) const;

private:
    EnvLookup env;
    ConfigLookup config;
};

}
