#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace promptline {

/**
 * @brief Shortens a directory path for display in a prompt
 *
 * Example with HOME=/home/ada and two full segments:
 *   /home/ada/work/promptline/src  ->  ~/w/promptline/src
 */
namespace PathTruncator {

/**
 * @brief Replace the first occurrence of home with '~'
 *
 * Plain substring match: home is not required to be a prefix of path.
 */
std::string collapseHome(const std::string& path, const std::string& home);

/**
 * @brief Cut every segment but the last nFull down to its first character
 *
 * A character is a whole UTF-8 code point, never a lone lead byte.
 * Empty segments (leading '/', doubled slashes) stay empty. nFull <= 0
 * returns path unchanged.
 */
std::string abbreviate(const std::string& path, int nFull);

/**
 * @brief Byte length of the first UTF-8 character of text
 *
 * Taken from the lead byte and clamped to text.size(); an invalid lead
 * byte counts as a single byte.
 */
size_t firstCharLength(const std::string& text);

/// Split on '/', keeping empty pieces
std::vector<std::string> splitSegments(const std::string& path);

/**
 * @brief Full truncation as shown by `promptline pwd`
 *
 * @param path Path to shorten; std::nullopt uses the current directory
 * @param homeTilde Collapse $HOME to '~' (HOME must then be set)
 * @param nFull Trailing segments kept at full width
 * @return Display string, ConfigurationError if HOME is needed but unset,
 *         IoError if the current directory cannot be read
 */
Expected<std::string> truncate(const std::optional<std::string>& path,
                               bool homeTilde = true,
                               int nFull = Constants::DEFAULT_FULL_SEGMENTS);

/// Path that truncate() starts from: path itself or the current directory
Expected<std::string> resolveInput(const std::optional<std::string>& path);

}  // namespace PathTruncator

}  // namespace promptline
