#include "core/PathTruncator.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace promptline {

namespace PathTruncator {

std::string collapseHome(const std::string& path, const std::string& home) {
    if (home.empty()) return path;
    size_t pos = path.find(home);
    if (pos == std::string::npos) return path;
    std::string out = path;
    out.replace(pos, home.size(), "~");
    return out;
}

size_t firstCharLength(const std::string& text) {
    if (text.empty()) return 0;
    unsigned char lead = static_cast<unsigned char>(text[0]);
    size_t len = 1;
    if (lead >= 0xC0 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
    } else if (lead >= 0xF0 && lead <= 0xF7) {
        len = 4;
    }
    return len < text.size() ? len : text.size();
}

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            pieces.push_back(path.substr(start));
            break;
        }
        pieces.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return pieces;
}

std::string abbreviate(const std::string& path, int nFull) {
    if (nFull <= 0) return path;

    std::vector<std::string> pieces = splitSegments(path);
    const size_t keep = static_cast<size_t>(nFull);
    for (size_t i = 0; i < pieces.size(); ++i) {
        size_t j = pieces.size() - i - 1;
        if (i >= keep && !pieces[j].empty()) {
            pieces[j] = pieces[j].substr(0, firstCharLength(pieces[j]));
        }
    }

    std::string out;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) out += '/';
        out += pieces[i];
    }
    return out;
}

Expected<std::string> resolveInput(const std::optional<std::string>& path) {
    if (path) return *path;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot determine current directory: " + ec.message()};
    }
    return cwd.string();
}

Expected<std::string> truncate(const std::optional<std::string>& path, bool homeTilde, int nFull) {
    auto input = resolveInput(path);
    if (!input) return input;
    std::string result = input.value();

    if (homeTilde) {
        const char* home = std::getenv(Constants::ENV_HOME);
        if (!home || !*home) {
            return Error{ErrorCode::ConfigurationError,
                         "HOME is not set; set it or pass --no-tilde"};
        }
        result = collapseHome(result, home);
    }

    return abbreviate(result, nFull);
}

}  // namespace PathTruncator

}  // namespace promptline
