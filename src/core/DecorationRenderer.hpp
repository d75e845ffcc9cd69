#pragma once

#include <string>

#include "core/StatusParser.hpp"
#include "core/Theme.hpp"

namespace promptline {

/**
 * @brief Formats a StatusSummary as " (<branch><ahead><behind>|<status>)"
 *
 * Pure: all terminal styling comes from the Theme.
 */
class DecorationRenderer {
public:
    explicit DecorationRenderer(Theme theme = Theme::zsh());

    std::string render(const StatusSummary& summary) const;

    std::string aheadMarker(int ahead) const;
    std::string behindMarker(int behind) const;
    std::string statusMarker(const StatusSummary& summary) const;

private:
    Theme theme;
};

}
