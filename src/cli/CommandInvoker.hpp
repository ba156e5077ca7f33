#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace baretree {

class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

/**
 * @brief Process exit status for a failed command
 *
 * 2 for usage and validation errors (nothing was changed), 3 when a rollback
 * failed and manual recovery may be needed, 1 for everything else.
 */
int exitStatusFor(ErrorCode code);

}
