#pragma once

#include <cstddef>

/**
 * @brief Defaults and fixed strings used throughout promptline
 *
 * Centralizes magic numbers and names to improve maintainability.
 */
namespace promptline {

namespace Constants {
    // Branch name resolution
    constexpr size_t DETACHED_HASH_CHARS = 7;        // Short hash shown for a detached HEAD
    constexpr const char* DETACHED_PREFIX = ":";     // Marks a hash so it reads apart from a branch

    // Porcelain v2 line tags
    constexpr char TAG_HEADER = '#';
    constexpr char TAG_UNTRACKED = '?';

    // Branch header keys
    constexpr const char* KEY_HEAD = "branch.head";
    constexpr const char* KEY_OID = "branch.oid";
    constexpr const char* KEY_AB = "branch.ab";

    // Path truncation
    constexpr int DEFAULT_FULL_SEGMENTS = 1;         // Trailing segments left unabbreviated

    // Exit status a child reports when exec fails (shell convention)
    constexpr int EXEC_FAILED_STATUS = 127;

    // Environment
    constexpr const char* ENV_HOME = "HOME";
    constexpr const char* ENV_THEME = "PROMPTLINE_THEME";
    constexpr const char* ENV_LOG_LEVEL = "PROMPTLINE_LOG";
}
}
