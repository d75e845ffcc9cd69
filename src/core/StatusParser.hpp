#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace promptline {

/// Porcelain v2 lines bucketed by their first character
using GroupedLines = std::unordered_map<char, std::vector<std::string>>;

/// "# branch.<key> <value>" headers, keyed by "branch.<key>"
using BranchInfo = std::unordered_map<std::string, std::string>;

struct AheadBehind {
    int ahead{0};
    int behind{0};
};

struct ChangeCounts {
    int staged{0};
    int modified{0};
};

struct StatusSummary {
    std::string branch;
    int untracked{0};
    int staged{0};
    int modified{0};
    int ahead{0};
    int behind{0};
};

/**
 * @brief Parser for `git status --porcelain=2 --branch` output
 *
 * Line tags:
 *   #  branch header      (# branch.head main)
 *   1  ordinary change    (1 .M N... 100644 100644 100644 <hH> <hI> path)
 *   2  rename or copy     (2 R. N... ... R100 path<TAB>orig)
 *   u  unmerged           (u UU N... ... path)
 *   ?  untracked          (? path)
 */
namespace StatusParser {

/**
 * @brief Split raw output into lines and bucket them by tag
 *
 * Empty lines are dropped. Order within a bucket follows the input.
 */
GroupedLines group(const std::string& text);

/**
 * @brief Parse "# key value..." header lines into a key/value map
 *
 * The value is everything after the first run of whitespace, kept verbatim
 * (branch.ab values contain a space).
 */
BranchInfo parseBranchInfo(const std::vector<std::string>& branchLines);

/**
 * @brief Name shown for the current branch
 *
 * A detached HEAD (branch.head starting with '(') shows as detachedPrefix
 * followed by the first hashChars characters of branch.oid.
 *
 * @return Branch name, or MissingData when branch.head is absent
 */
Expected<std::string> resolveBranchName(const BranchInfo& info,
                                        size_t hashChars = Constants::DETACHED_HASH_CHARS,
                                        const std::string& detachedPrefix = Constants::DETACHED_PREFIX);

/**
 * @brief Parse branch.ab ("+N -M") into ahead/behind counts
 *
 * Signs are discarded: the first token is ahead, the second behind.
 * Absent branch.ab gives {0, 0}; a value of any other shape is MalformedLine.
 */
Expected<AheadBehind> parseAheadBehind(const BranchInfo& info);

/**
 * @brief Count staged and worktree-modified entries
 *
 * Each line's XY field contributes to exactly one count: staged when X is
 * not '.', otherwise modified. Malformed lines are logged and skipped.
 */
ChangeCounts parseChangeCounts(const GroupedLines& grouped,
                               const std::set<char>& ignoredTags = {Constants::TAG_HEADER, Constants::TAG_UNTRACKED});

int countUntracked(const GroupedLines& grouped);

/**
 * @brief Full parse of porcelain v2 output into a StatusSummary
 *
 * @return Summary, or MissingData if the output carries no branch header
 */
Expected<StatusSummary> parse(const std::string& rawText);

}  // namespace StatusParser

}  // namespace promptline
