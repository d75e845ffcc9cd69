#pragma once

#include <string>
#include <unordered_map>

#include "util/Expected.hpp"

namespace promptline {

/**
 * @brief Glyphs and style templates used by the decoration renderer
 *
 * styles maps a marker name (branch, ahead, behind, clean, staged,
 * modified, untracked) to a template; "{}" in the template is replaced by
 * the marker text. Markers without a template render unstyled.
 */
struct Theme {
    std::string aheadGlyph = "↑";
    std::string behindGlyph = "↓";
    std::string cleanGlyph = "✓";
    std::string stagedGlyph = "•";
    std::string modifiedGlyph = "+";
    std::string untrackedToken = "...";
    std::unordered_map<std::string, std::string> styles;

    /// Wrap text in the template registered for marker
    std::string apply(const std::string& marker, const std::string& text) const;

    /// zsh prompt color variables ($fg_bold[...], $reset_color); needs `autoload colors`
    static Theme zsh();
    /// Raw ANSI SGR escapes
    static Theme ansi();
    /// Glyphs only, no styling
    static Theme plain();

    /**
     * @brief Look up a built-in theme by name (zsh, ansi, plain)
     * @return Theme, or ConfigurationError for an unknown name
     */
    static Expected<Theme> byName(const std::string& name);
};

}
