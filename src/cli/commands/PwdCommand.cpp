#include "cli/commands/PwdCommand.hpp"

#include <cctype>
#include <iostream>
#include <limits>
#include <string>

#include "core/PathTruncator.hpp"
#include "util/Logger.hpp"

namespace promptline {

namespace {

// Decimal digits only, 0 up to INT_MAX
bool parseCount(const std::string& text, int& out) {
    if (text.empty()) return false;
    const int limit = std::numeric_limits<int>::max();
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        int digit = c - '0';
        if (value > (limit - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

}

/**
 * @brief Parse 'promptline pwd' arguments
 *
 * Accepts -n N, -nN, --no-tilde, --debug and at most one PATH. A bare "--"
 * ends option parsing so paths starting with '-' can be passed.
 */
Expected<PwdOptions> PwdCommand::parseArgs(const std::vector<std::string>& args) {
    PwdOptions opts;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        std::string countText;
        bool isCount = false;

        if (!optionsDone && a == "--") {
            optionsDone = true;
            continue;
        } else if (!optionsDone && a == "--debug") {
            opts.debug = true;
            continue;
        } else if (!optionsDone && a == "--no-tilde") {
            opts.homeTilde = false;
            continue;
        } else if (!optionsDone && a == "-n") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "-n requires a value"};
            }
            countText = args[++i];
            isCount = true;
        } else if (!optionsDone && a.rfind("-n", 0) == 0) {
            countText = a.substr(2);
            isCount = true;
        } else if (!optionsDone && a.size() > 1 && a[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + a + "'"};
        }

        if (isCount) {
            if (!parseCount(countText, opts.fullSegments)) {
                return Error{ErrorCode::InvalidArgs,
                             "-n expects an integer from 0 to " + std::to_string(std::numeric_limits<int>::max()) +
                             ", got '" + countText + "'"};
            }
            continue;
        }

        if (opts.path) {
            return Error{ErrorCode::InvalidArgs, "unexpected extra path '" + a + "'"};
        }
        opts.path = a;
    }
    return opts;
}

Expected<void> PwdCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    auto parsed = parseArgs(args);
    if (!parsed) return parsed.error();
    const PwdOptions& opts = parsed.value();

    auto raw = PathTruncator::resolveInput(opts.path);
    if (!raw) return raw.error();

    if (opts.debug) {
        std::cerr << raw.value() << "\n";
    }

    auto shortened = PathTruncator::truncate(raw.value(), opts.homeTilde, opts.fullSegments);
    if (!shortened) return shortened.error();

    Logger::instance().debug("Truncated to " + shortened.value());
    std::cout << shortened.value() << std::flush;
    return {};
}

}
