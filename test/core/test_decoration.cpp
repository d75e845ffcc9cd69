#include <gtest/gtest.h>

#include <string>

#include "core/DecorationRenderer.hpp"
#include "core/Theme.hpp"

using namespace promptline;

namespace {

StatusSummary summaryFor(const std::string& branch, int untracked, int staged, int modified, int ahead, int behind) {
    StatusSummary s;
    s.branch = branch;
    s.untracked = untracked;
    s.staged = staged;
    s.modified = modified;
    s.ahead = ahead;
    s.behind = behind;
    return s;
}

}

TEST(DecorationRendererTest, CleanBranchPlain) {
    DecorationRenderer renderer(Theme::plain());
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 0, 0)), " (main|✓)");
}

TEST(DecorationRendererTest, CleanBranchZsh) {
    DecorationRenderer renderer(Theme::zsh());
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 0, 0)),
              " (${fg_bold[magenta]}main${reset_color}|${fg_bold[green]}✓${reset_color})");
}

TEST(DecorationRendererTest, DefaultThemeIsZsh) {
    DecorationRenderer renderer;
    EXPECT_EQ(renderer.render(summaryFor("dev", 0, 0, 0, 0, 0)),
              DecorationRenderer(Theme::zsh()).render(summaryFor("dev", 0, 0, 0, 0, 0)));
}

TEST(DecorationRendererTest, AheadBehindMarkers) {
    DecorationRenderer renderer(Theme::plain());
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 2, 3)), " (main↑2↓3|✓)");
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 4, 0)), " (main↑4|✓)");
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 0, 1)), " (main↓1|✓)");
}

// Test: staged, modified, untracked in that order with no separators
TEST(DecorationRendererTest, StatusMarkerOrdering) {
    DecorationRenderer renderer(Theme::plain());
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 3, 2, 1, 0, 0)), "•2+1...");
    EXPECT_EQ(renderer.render(summaryFor("main", 3, 2, 1, 0, 0)), " (main|•2+1...)");
}

TEST(DecorationRendererTest, StatusMarkerAbsentPartsContributeNothing) {
    DecorationRenderer renderer(Theme::plain());
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 0, 2, 0, 0, 0)), "•2");
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 0, 0, 5, 0, 0)), "+5");
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 7, 0, 0, 0, 0)), "...");
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 1, 0, 1, 0, 0)), "+1...");
}

TEST(DecorationRendererTest, StatusMarkerZshStyles) {
    DecorationRenderer renderer(Theme::zsh());
    EXPECT_EQ(renderer.statusMarker(summaryFor("main", 1, 2, 1, 0, 0)),
              "${fg_bold[magenta]}•2${reset_color}${fg_bold[blue]}+1${reset_color}...");
}

TEST(DecorationRendererTest, AnsiTheme) {
    DecorationRenderer renderer(Theme::ansi());
    EXPECT_EQ(renderer.render(summaryFor("main", 0, 0, 0, 0, 0)),
              " (\033[1;35mmain\033[0m|\033[1;32m✓\033[0m)");
}

TEST(DecorationRendererTest, CustomGlyphsAndStyles) {
    Theme theme = Theme::plain();
    theme.aheadGlyph = "^";
    theme.behindGlyph = "v";
    theme.untrackedToken = "?";
    theme.styles["branch"] = "<{}>";
    theme.styles["ahead"] = "[{}]";
    DecorationRenderer renderer(theme);
    EXPECT_EQ(renderer.render(summaryFor("topic", 2, 0, 0, 1, 1)), " (<topic>[^1]v1|?)");
}

TEST(ThemeTest, ApplyWithoutTemplateReturnsText) {
    Theme theme = Theme::plain();
    EXPECT_EQ(theme.apply("branch", "main"), "main");
}

TEST(ThemeTest, ApplyTemplateWithoutPlaceholder) {
    Theme theme = Theme::plain();
    theme.styles["clean"] = "OK";
    EXPECT_EQ(theme.apply("clean", "✓"), "OK");
}

TEST(ThemeTest, ByName) {
    EXPECT_TRUE(Theme::byName("zsh").has_value());
    EXPECT_TRUE(Theme::byName("ansi").has_value());
    EXPECT_TRUE(Theme::byName("plain").has_value());

    auto unknown = Theme::byName("solarized");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::ConfigurationError);
}
