#include "git/WorktreeList.hpp"

#include <sstream>

#include "core/Constants.hpp"

namespace baretree {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

}

std::vector<WorktreeRecord> parseWorktreeList(const std::string& porcelain) {
    std::vector<WorktreeRecord> records;
    WorktreeRecord current;
    bool inRecord = false;

    auto flush = [&]() {
        if (inRecord && !current.path.empty()) {
            current.isMain = records.empty();
            records.push_back(current);
        }
        current = WorktreeRecord{};
        inRecord = false;
    };

    std::istringstream in(porcelain);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            flush();
            continue;
        }
        inRecord = true;
        if (startsWith(line, "worktree ")) {
            current.path = line.substr(9);
        } else if (startsWith(line, "HEAD ")) {
            current.head = line.substr(5);
        } else if (startsWith(line, "branch ")) {
            std::string ref = line.substr(7);
            const std::string heads = Constants::BRANCH_REF_PREFIX;
            current.branch = startsWith(ref, heads) ? ref.substr(heads.size()) : ref;
        } else if (line == "detached") {
            current.detached = true;
        } else if (line == "bare") {
            current.bare = true;
        } else if (line == "locked" || startsWith(line, "locked ")) {
            current.locked = true;
        } else if (line == "prunable" || startsWith(line, "prunable ")) {
            current.prunable = true;
        }
    }
    flush();
    return records;
}

}
