#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace baretree {

namespace {

struct LevelInfo {
    const char* name;
    const char* tag;
    bool toStderr;
};

// Indexed by LogLevel
constexpr LevelInfo LEVELS[] = {
    {"error", "[error] ", true},
    {"warn", "[warn ] ", true},
    {"info", "[info ] ", false},
    {"debug", "[debug] ", false},
};

const LevelInfo& infoFor(LogLevel level) {
    return LEVELS[static_cast<int>(level)];
}

LogLevel envLogLevel() {
    const char* env = std::getenv("BARETREE_LOG");
    if (!env) return LogLevel::Info;
    return Logger::parseLevel(env).value_or(LogLevel::Info);
}

}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    for (int i = 0; i <= static_cast<int>(LogLevel::Debug); ++i) {
        if (text == LEVELS[i].name || text == std::to_string(i)) return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(envLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

bool Logger::enabled(LogLevel level) const {
    return currentLevel >= level;
}

void Logger::log(LogLevel level, const std::string& msg) const {
    if (!enabled(level)) return;
    const LevelInfo& info = infoFor(level);
    (info.toStderr ? std::cerr : std::cout) << info.tag << msg << "\n";
}

}
