#include "core/RemotePath.hpp"

#include <regex>
#include <vector>

namespace baretree {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string stripGitSuffix(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    const std::string suffix = ".git";
    if (s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        s.erase(s.size() - suffix.size());
    }
    return s;
}

std::vector<std::string> splitPath(const std::string& s) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

std::string joinFrom(const std::vector<std::string>& parts, std::size_t first) {
    std::string out;
    for (std::size_t i = first; i < parts.size(); ++i) {
        if (!out.empty()) out += '/';
        out += parts[i];
    }
    return out;
}

/// host plus "user/repo..." path into a RemotePath; at least two path components
Expected<RemotePath> fromHostAndPath(const std::string& host, const std::string& path, const std::string& input) {
    auto parts = splitPath(stripGitSuffix(path));
    if (host.empty() || parts.size() < 2) {
        return Error{ErrorCode::InvalidArgs, "invalid repository URL: " + input};
    }
    return RemotePath{host, parts[0], joinFrom(parts, 1)};
}

}

Expected<RemotePath> parseRemotePath(const std::string& rawInput, const std::string& defaultHost,
                                     const std::string& defaultUser) {
    const std::string input = trim(rawInput);
    if (input.empty()) return Error{ErrorCode::InvalidArgs, "empty repository path"};

    static const std::regex urlForm(R"(^(?:https?|ssh|git)://(?:[^@/]+@)?([^/:]+)(?::\d+)?/(.+)$)");
    static const std::regex scpForm(R"(^(?:[\w.-]+@)?([\w.-]+):(.+)$)");

    std::smatch m;
    if (std::regex_match(input, m, urlForm)) {
        return fromHostAndPath(m[1].str(), m[2].str(), input);
    }
    if (input.find("://") == std::string::npos && std::regex_match(input, m, scpForm)) {
        return fromHostAndPath(m[1].str(), m[2].str(), input);
    }
    if (input.find("://") != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, "unsupported repository URL: " + input};
    }

    auto parts = splitPath(stripGitSuffix(input));
    switch (parts.size()) {
        case 0:
            return Error{ErrorCode::InvalidArgs, "empty repository path"};
        case 1:
            if (defaultHost.empty() || defaultUser.empty()) {
                return Error{ErrorCode::InvalidArgs, "cannot determine host and user for: " + input};
            }
            return RemotePath{defaultHost, defaultUser, parts[0]};
        case 2:
            if (defaultHost.empty()) {
                return Error{ErrorCode::InvalidArgs, "cannot determine host for: " + input};
            }
            return RemotePath{defaultHost, parts[0], parts[1]};
        default:
            return RemotePath{parts[0], parts[1], joinFrom(parts, 2)};
    }
}

}
