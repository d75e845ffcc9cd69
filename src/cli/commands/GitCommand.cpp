#include "cli/commands/GitCommand.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include "core/Constants.hpp"
#include "core/DecorationRenderer.hpp"
#include "core/StatusParser.hpp"
#include "core/Theme.hpp"
#include "util/Logger.hpp"

namespace promptline {

namespace {

Theme themeFromEnvironment() {
    const char* env = std::getenv(Constants::ENV_THEME);
    if (!env || !*env) return Theme::zsh();
    auto theme = Theme::byName(env);
    if (!theme) {
        Logger::instance().warn(theme.error().message + ", using zsh");
        return Theme::zsh();
    }
    Logger::instance().debug(std::string("Using theme: ") + env);
    return theme.value();
}

}

/**
 * @brief Execute 'promptline git'
 *
 * Queries porcelain v2 status and prints the decoration. Git failing
 * (missing binary, not a work tree) is not an error: the prompt just omits
 * the segment. Output without a branch header is reported as MissingData.
 */
Expected<void> GitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args.front() + "'"};
    }

    auto query = ctx.git.queryStatus();
    if (!query) {
        ErrorCode code = query.error().code;
        if (code == ErrorCode::GitUnavailable || code == ErrorCode::NotARepository) {
            Logger::instance().debug(query.error().message);
            return {};
        }
        return query.error();
    }

    auto summary = StatusParser::parse(query.value());
    if (!summary) return summary.error();

    DecorationRenderer renderer(themeFromEnvironment());
    std::cout << renderer.render(summary.value()) << std::flush;
    return {};
}

}
