#pragma once

#include <optional>

#include "cli/ICommand.hpp"
#include "core/Constants.hpp"

namespace promptline {

struct PwdOptions {
    std::optional<std::string> path;
    int fullSegments{Constants::DEFAULT_FULL_SEGMENTS};
    bool homeTilde{true};
    bool debug{false};
};

class PwdCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "pwd"; }
    const char* description() const override { return "Print a shortened working directory"; }
    const char* helpNameLine() const override { return "pwd -  Abbreviate a directory path for a prompt"; }
    const char* helpSynopsis() const override { return "promptline pwd [--debug] [--no-tilde] [-n FULL_PATHS] [PATH]"; }
    const char* helpDescription() const override {
        return "Print PATH (default: the current directory) with $HOME collapsed to '~' and every directory "
               "but the last FULL_PATHS cut to its first character. No trailing newline.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-n FULL_PATHS", "Number of directories to keep full width [default: 1]; 0 keeps all."},
                 {"--no-tilde", "Do not compress $HOME to '~'."},
                 {"--debug", "Print the raw PATH to stderr, followed by a newline."} };
    }

    /// Parse pwd arguments; InvalidArgs on unknown flags or a bad -n value
    static Expected<PwdOptions> parseArgs(const std::vector<std::string>& args);
};

}
