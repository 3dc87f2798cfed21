#include <gtest/gtest.h>

#include "math_passthrough.hpp"



TEST(MathPassthroughTest, InlineSpan) {
    std::string_view text = "where $x=5y$ holds";
    auto span = mdsite::match_inline_math(text, 6);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->source, "x=5y");
    EXPECT_EQ(span->end, 12u);
}

TEST(MathPassthroughTest, DollarAmountsStayText) {
    std::string_view prices = "costs $5 and $6 total";
    EXPECT_FALSE(mdsite::match_inline_math(prices, 6).has_value());

    std::string_view spaced = "a $ b $ c";
    EXPECT_FALSE(mdsite::match_inline_math(spaced, 2).has_value());

    std::string_view unterminated = "just $x";
    EXPECT_FALSE(mdsite::match_inline_math(unterminated, 5).has_value());
}

TEST(MathPassthroughTest, EscapedDollarInsideMath) {
    std::string_view text = "$a\\$b$";
    auto span = mdsite::match_inline_math(text, 0);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->source, "a\\$b");
}

TEST(MathPassthroughTest, Fence) {
    EXPECT_TRUE(mdsite::is_math_fence("$$"));
    EXPECT_TRUE(mdsite::is_math_fence("  $$  "));
    EXPECT_FALSE(mdsite::is_math_fence("$$x$$"));
    EXPECT_FALSE(mdsite::is_math_fence("$"));
}

TEST(MathPassthroughTest, RenderEscapesSource) {
    EXPECT_EQ(mdsite::render_math("a<b", mdsite::MathMode::inline_math), "<span class=\"math math-inline\">a&lt;b</span>");
    EXPECT_EQ(mdsite::render_math("\\sum_i x_i", mdsite::MathMode::display_math), "<div class=\"math math-display\">\\sum_i x_i</div>");
}
