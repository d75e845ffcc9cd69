#include "core/DecorationRenderer.hpp"

#include <utility>

namespace promptline {

DecorationRenderer::DecorationRenderer(Theme t) : theme(std::move(t)) {}

std::string DecorationRenderer::aheadMarker(int ahead) const {
    if (ahead <= 0) return {};
    return theme.apply("ahead", theme.aheadGlyph + std::to_string(ahead));
}

std::string DecorationRenderer::behindMarker(int behind) const {
    if (behind <= 0) return {};
    return theme.apply("behind", theme.behindGlyph + std::to_string(behind));
}

std::string DecorationRenderer::statusMarker(const StatusSummary& s) const {
    if (s.untracked + s.staged + s.modified == 0) {
        return theme.apply("clean", theme.cleanGlyph);
    }
    std::string out;
    if (s.staged > 0) out += theme.apply("staged", theme.stagedGlyph + std::to_string(s.staged));
    if (s.modified > 0) out += theme.apply("modified", theme.modifiedGlyph + std::to_string(s.modified));
    if (s.untracked > 0) out += theme.apply("untracked", theme.untrackedToken);
    return out;
}

std::string DecorationRenderer::render(const StatusSummary& summary) const {
    return " (" + theme.apply("branch", summary.branch)
        + aheadMarker(summary.ahead)
        + behindMarker(summary.behind)
        + "|" + statusMarker(summary) + ")";
}

}
