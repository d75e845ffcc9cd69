#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace promptline {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    log.debug(std::string("Executing command: ") + cmd.name() + " (" + std::to_string(args.size()) + " args)");
    auto res = cmd.execute(ctx, args);
    if (!res) {
        log.debug(std::string(cmd.name()) + " failed with " + errorCodeName(res.error().code));
        log.error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

}
