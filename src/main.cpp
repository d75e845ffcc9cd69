// Modular CLI entry using Command Pattern: promptline <git|pwd|help> [args]

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace promptline;

static bool wantsHelp(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        if (a == "--") break;
        if (a == "-h" || a == "--help") return true;
    }
    return false;
}

int main(int argc, char** argv) {
    registerBuiltinCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    if (cmdName != "help" && wantsHelp(args)) {
        auto help = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*help, ctx, {cmdName});
        return res ? 0 : 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
