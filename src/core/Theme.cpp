#include "core/Theme.hpp"

namespace promptline {

std::string Theme::apply(const std::string& marker, const std::string& text) const {
    auto it = styles.find(marker);
    if (it == styles.end()) return text;
    std::string out = it->second;
    size_t pos = out.find("{}");
    if (pos == std::string::npos) return out;
    out.replace(pos, 2, text);
    return out;
}

Theme Theme::zsh() {
    Theme t;
    t.styles = {
        {"branch", "${fg_bold[magenta]}{}${reset_color}"},
        {"clean", "${fg_bold[green]}{}${reset_color}"},
        {"staged", "${fg_bold[magenta]}{}${reset_color}"},
        {"modified", "${fg_bold[blue]}{}${reset_color}"},
    };
    return t;
}

Theme Theme::ansi() {
    Theme t;
    t.styles = {
        {"branch", "\033[1;35m{}\033[0m"},
        {"clean", "\033[1;32m{}\033[0m"},
        {"staged", "\033[1;35m{}\033[0m"},
        {"modified", "\033[1;34m{}\033[0m"},
    };
    return t;
}

Theme Theme::plain() {
    return Theme{};
}

Expected<Theme> Theme::byName(const std::string& name) {
    if (name == "zsh") return zsh();
    if (name == "ansi") return ansi();
    if (name == "plain") return plain();
    return Error{ErrorCode::ConfigurationError, "unknown theme '" + name + "'"};
}

}
