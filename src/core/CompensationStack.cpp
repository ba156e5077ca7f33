#include "core/CompensationStack.hpp"

#include "util/Logger.hpp"

namespace baretree {

void CompensationStack::push(std::string description, Action undo) {
    entries.push_back(Entry{std::move(description), std::move(undo)});
}

Expected<void> CompensationStack::unwind() {
    std::vector<std::string> failures;
    while (!entries.empty()) {
        Entry entry = std::move(entries.back());
        entries.pop_back();
        Logger::instance().debug("rollback: " + entry.description);
        auto res = entry.undo();
        if (!res) {
            failures.push_back(entry.description + ": " + res.error().message);
        }
    }
    if (failures.empty()) return {};

    std::string message;
    for (const auto& f : failures) {
        if (!message.empty()) message += "; ";
        message += f;
    }
    return Error{ErrorCode::RollbackFailed, message};
}

void CompensationStack::commit() {
    entries.clear();
}

std::vector<std::string> CompensationStack::pending() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(e.description);
    return out;
}

Error rollBack(CompensationStack& stack, const Error& forward) {
    if (stack.empty()) return forward;
    Logger::instance().warn("rolling back " + std::to_string(stack.size()) + " step(s) after: " + forward.message);
    auto res = stack.unwind();
    if (res) {
        return Error{forward.code, forward.message + " (changes rolled back)"};
    }
    return Error{ErrorCode::RollbackFailed,
                 forward.message + "; rollback also failed: " + res.error().message};
}

}
