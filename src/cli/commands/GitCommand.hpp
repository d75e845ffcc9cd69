#pragma once

#include "cli/ICommand.hpp"

namespace promptline {

class GitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "git"; }
    const char* description() const override { return "Print the Git status decoration"; }
    const char* helpNameLine() const override { return "git -  Summarize the working tree status for a prompt"; }
    const char* helpSynopsis() const override { return "promptline git"; }
    const char* helpDescription() const override {
        return "Print \" (<branch><ahead><behind>|<status>)\" for the current directory, without a trailing newline. "
               "Prints nothing outside a Git work tree. Styling is chosen with PROMPTLINE_THEME (zsh, ansi, plain).";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
