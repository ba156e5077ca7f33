#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace baretree {

/**
 * @brief Stack of compensating actions for a multi-step mutation
 *
 * Every mutating step pushes its inverse before (or right after) it runs.
 * On failure unwind() pops and runs the inverses in reverse order exactly
 * once; secondary failures are collected into a single error. After the
 * protected section succeeds, commit() drops the recorded inverses.
 *
 * The stack never unwinds on its own; the owner decides when a failure is
 * fatal.
 */
class CompensationStack {
public:
    using Action = std::function<Expected<void>()>;

    /// Record the inverse of a step that has just been (or is about to be) applied
    void push(std::string description, Action undo);

    /**
     * @brief Run all recorded inverses in reverse order
     * @return Success, or ErrorCode::RollbackFailed listing every inverse
     *         that failed (later inverses still run after a failure)
     */
    Expected<void> unwind();

    /// Forget the recorded inverses; the protected steps are now permanent
    void commit();

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    /// Descriptions of pending inverses, oldest first
    std::vector<std::string> pending() const;

private:
    struct Entry {
        std::string description;
        Action undo;
    };
    std::vector<Entry> entries;
};

/**
 * @brief Unwind the stack after a forward failure and build the final error
 *
 * When the rollback succeeds the forward error is returned with a note that
 * changes were rolled back. When it fails the result is
 * ErrorCode::RollbackFailed carrying both messages.
 */
Error rollBack(CompensationStack& stack, const Error& forward);

}
