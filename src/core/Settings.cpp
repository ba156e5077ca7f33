#include "core/Settings.hpp"

#include <cstdlib>

#include "core/Constants.hpp"
#include "git/GitQueries.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace baretree {

const char* settingSourceName(SettingSource source) {
    switch (source) {
        case SettingSource::Environment: return "env";
        case SettingSource::GitConfig: return "git-config";
        case SettingSource::Default: return "default";
    }
    return "unknown";
}

fs::path Settings::primaryRoot() const {
    if (!roots.empty()) return roots.back();
    SettingsResolver defaults(processEnvironment(), [](const std::string&) { return std::vector<std::string>{}; });
    return defaults.expandHome(Constants::DEFAULT_MANAGED_ROOT);
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

ConfigLookup gitConfigLookup(VersionControlTool& vcs) {
    return [&vcs](const std::string& key) { return GitQueries::globalConfigValues(vcs, key); };
}

SettingsResolver::SettingsResolver(EnvLookup env, ConfigLookup config)
    : env(std::move(env)), config(std::move(config)) {}

fs::path SettingsResolver::expandHome(const std::string& path) const {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        auto home = env("HOME");
        if (home && path.size() == 1) return fs::path(*home);
        if (home) return fs::path(*home) / path.substr(2);
    }
    return fs::path(path);
}

Settings SettingsResolver::resolve() const {
    Settings s;

    if (auto root = env(Constants::ENV_ROOT)) {
        s.roots.push_back(expandHome(*root));
        s.rootSource = SettingSource::Environment;
    } else {
        for (const auto& value : config(Constants::CONFIG_ROOT)) {
            s.roots.push_back(expandHome(value));
        }
        if (!s.roots.empty()) s.rootSource = SettingSource::GitConfig;
    }
    if (s.roots.empty()) {
        s.roots.push_back(expandHome(Constants::DEFAULT_MANAGED_ROOT));
        s.rootSource = SettingSource::Default;
    }

    auto users = config(Constants::CONFIG_USER);
    if (!users.empty()) {
        s.user = users.back();
        s.userSource = SettingSource::GitConfig;
    } else if (auto user = env("USER")) {
        s.user = *user;
        s.userSource = SettingSource::Environment;
    }

    Logger::instance().debug("managed root " + s.primaryRoot().string() + " (from " +
                             settingSourceName(s.rootSource) + ")");
    return s;
}

}
