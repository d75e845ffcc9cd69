#include "core/StatusParser.hpp"

#include <cctype>
#include <sstream>

#include "util/Logger.hpp"

namespace promptline {

namespace StatusParser {

namespace {

bool isBlank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "+12" / "-3" -> 12 / 3; false if not a sign followed by digits
bool parseSignedCount(const std::string& token, int& out) {
    if (token.size() < 2 || token.size() > 10 || (token[0] != '+' && token[0] != '-')) return false;
    int value = 0;
    for (size_t i = 1; i < token.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) return false;
        value = value * 10 + (token[i] - '0');
    }
    out = value;
    return true;
}

}

GroupedLines group(const std::string& text) {
    GroupedLines grouped;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) continue;
        grouped[line[0]].push_back(line);
    }
    return grouped;
}

BranchInfo parseBranchInfo(const std::vector<std::string>& branchLines) {
    BranchInfo info;
    for (const auto& line : branchLines) {
        std::string body = line.size() > 2 ? line.substr(2) : std::string();

        size_t keyEnd = 0;
        while (keyEnd < body.size() && !isBlank(body[keyEnd])) ++keyEnd;
        size_t valueStart = keyEnd;
        while (valueStart < body.size() && isBlank(body[valueStart])) ++valueStart;

        std::string key = body.substr(0, keyEnd);
        if (key.empty()) {
            Logger::instance().warn("Ignoring header line without a key: " + line);
            continue;
        }
        info[key] = body.substr(valueStart);
    }
    return info;
}

Expected<std::string> resolveBranchName(const BranchInfo& info, size_t hashChars, const std::string& detachedPrefix) {
    auto head = info.find(Constants::KEY_HEAD);
    if (head == info.end()) {
        return Error{ErrorCode::MissingData, "git did not report branch.head"};
    }
    if (!head->second.empty() && head->second[0] == '(') {
        std::string oid;
        auto it = info.find(Constants::KEY_OID);
        if (it != info.end()) oid = it->second.substr(0, hashChars);
        return detachedPrefix + oid;
    }
    return head->second;
}

Expected<AheadBehind> parseAheadBehind(const BranchInfo& info) {
    auto it = info.find(Constants::KEY_AB);
    if (it == info.end()) return AheadBehind{};

    std::istringstream tokens(it->second);
    std::vector<std::string> parts;
    std::string tok;
    while (tokens >> tok) parts.push_back(tok);

    AheadBehind ab;
    if (parts.size() != 2 || !parseSignedCount(parts[0], ab.ahead) || !parseSignedCount(parts[1], ab.behind)) {
        return Error{ErrorCode::MalformedLine, "unexpected branch.ab value: '" + it->second + "'"};
    }
    return ab;
}

ChangeCounts parseChangeCounts(const GroupedLines& grouped, const std::set<char>& ignoredTags) {
    ChangeCounts counts;
    for (const auto& [tag, lines] : grouped) {
        if (ignoredTags.count(tag)) continue;
        for (const auto& line : lines) {
            std::istringstream fields(line);
            std::string kind, xy;
            if (!(fields >> kind >> xy) || xy.size() != 2) {
                Logger::instance().warn("Skipping malformed status line: " + line);
                continue;
            }
            if (xy[0] != '.') {
                ++counts.staged;
            } else if (xy[1] != '.') {
                ++counts.modified;
            } else {
                Logger::instance().warn("Skipping status line without changes: " + line);
            }
        }
    }
    return counts;
}

int countUntracked(const GroupedLines& grouped) {
    auto it = grouped.find(Constants::TAG_UNTRACKED);
    return it == grouped.end() ? 0 : static_cast<int>(it->second.size());
}

Expected<StatusSummary> parse(const std::string& rawText) {
    GroupedLines grouped = group(rawText);

    auto headers = grouped.find(Constants::TAG_HEADER);
    if (headers == grouped.end()) {
        return Error{ErrorCode::MissingData, "git did not return branch information"};
    }
    BranchInfo info = parseBranchInfo(headers->second);

    auto branch = resolveBranchName(info);
    if (!branch) return branch.error();

    StatusSummary summary;
    summary.branch = branch.value();

    auto ab = parseAheadBehind(info);
    if (ab) {
        summary.ahead = ab.value().ahead;
        summary.behind = ab.value().behind;
    } else {
        Logger::instance().warn(ab.error().message);
    }

    ChangeCounts counts = parseChangeCounts(grouped);
    summary.staged = counts.staged;
    summary.modified = counts.modified;
    summary.untracked = countUntracked(grouped);
    return summary;
}

}  // namespace StatusParser

}  // namespace promptline
