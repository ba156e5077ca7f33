#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace baretree {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    if (ctx.vcs == nullptr) {
        return Error{ErrorCode::InternalError, "no version control tool configured"};
    }
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

int exitStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return 0;
        case ErrorCode::InvalidArgs:
        case ErrorCode::NotARepository:
        case ErrorCode::AlreadySplit:
        case ErrorCode::AlreadyBare:
        case ErrorCode::DetachedHead:
        case ErrorCode::DestinationExists:
        case ErrorCode::PathOverlap:
        case ErrorCode::LayoutConflict:
            return 2;
        case ErrorCode::RollbackFailed:
            return 3;
        default:
            return 1;
    }
}

}
