#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "footnotes.hpp"
#include "markdown.hpp"
#include "test_util.hpp"

using ::testing::HasSubstr;
using ::testing::Not;
using mdsite::ErrorKind;



TEST(FootnoteSyntaxTest, Definition) {
    auto def = mdsite::match_footnote_definition("[^note]: Some text ");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->label, "note");
    EXPECT_EQ(def->text, "Some text");

    EXPECT_TRUE(mdsite::match_footnote_definition("   [^1]: indented").has_value());
    EXPECT_FALSE(mdsite::match_footnote_definition("    [^1]: code block").has_value());
    EXPECT_FALSE(mdsite::match_footnote_definition("[^1] no colon").has_value());
    EXPECT_FALSE(mdsite::match_footnote_definition("[^]: empty label").has_value());
}

TEST(FootnoteSyntaxTest, Reference) {
    std::string_view text = "see[^a] and [^b](link)";

    auto ref = mdsite::match_footnote_reference(text, 3);
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->label, "a");
    EXPECT_EQ(ref->end, 7u);

    EXPECT_FALSE(mdsite::match_footnote_reference(text, 12).has_value());
    EXPECT_FALSE(mdsite::match_footnote_reference("[^a b]", 0).has_value());
}


TEST(FootnoteTableTest, OrdinalsFollowFirstReference) {
    mdsite::FootnoteTable table;
    table.define("a", "A");
    table.define("b", "B");

    table.reference("b");
    table.reference("a");
    table.reference("b");

    EXPECT_EQ(table.ordinal("b"), 1u);
    EXPECT_EQ(table.ordinal("a"), 2u);
    EXPECT_NO_THROW(table.check_definitions());
}

TEST(FootnoteTableTest, RepeatedReferencesGetDistinctIds) {
    mdsite::FootnoteTable table;
    table.define("x", "X");

    EXPECT_EQ(table.reference("x"), "<sup class=\"footnote-ref\"><a href=\"#fn-1\" id=\"fnref-1\">1</a></sup>");
    EXPECT_EQ(table.reference("x"), "<sup class=\"footnote-ref\"><a href=\"#fn-1\" id=\"fnref-1-2\">1</a></sup>");
}

TEST(FootnoteTableTest, FirstDefinitionWins) {
    mdsite::FootnoteTable table;
    table.define("a", "first");
    table.define("a", "second");
    table.reference("a");

    std::string section = table.render_section([](std::string_view text) { return std::string(text); });
    EXPECT_THAT(section, HasSubstr("<li id=\"fn-1\">first <a href=\"#fnref-1\" class=\"footnote-backref\">&#8617;</a></li>"));
    EXPECT_THAT(section, Not(HasSubstr("second")));
}

TEST(FootnoteTableTest, UndefinedReference) {
    mdsite::FootnoteTable table;
    table.reference("ghost");

    EXPECT_EQ(mdsite::test::thrown_kind([&] { table.check_definitions(); }), ErrorKind::undefined_footnote);
}


class FootnoteRenderTest : public ::testing::Test {
protected:
    mdsite::LanguageTable languages = mdsite::default_language_table();
};

TEST_F(FootnoteRenderTest, OrderInDocument) {
    auto out = mdsite::render_markdown(
        "Second[^b] then first[^a].\n"
        "\n"
        "[^a]: Alpha note.\n"
        "[^b]: Beta note.\n", languages);

    EXPECT_THAT(out.html, HasSubstr("Second<sup class=\"footnote-ref\"><a href=\"#fn-1\" id=\"fnref-1\">1</a></sup>"));
    EXPECT_THAT(out.html, HasSubstr("first<sup class=\"footnote-ref\"><a href=\"#fn-2\" id=\"fnref-2\">2</a></sup>"));
    EXPECT_THAT(out.html, HasSubstr("<li id=\"fn-1\">Beta note."));
    EXPECT_THAT(out.html, HasSubstr("<li id=\"fn-2\">Alpha note."));
    EXPECT_LT(out.html.find("id=\"fn-1\""), out.html.find("id=\"fn-2\""));
}

TEST_F(FootnoteRenderTest, UndefinedFails) {
    EXPECT_EQ(mdsite::test::thrown_kind([&] { mdsite::render_markdown("Text[^missing]\n", languages); }), ErrorKind::undefined_footnote);
}

TEST_F(FootnoteRenderTest, UnreferencedDefinitionIsDropped) {
    auto out = mdsite::render_markdown("Plain text.\n\n[^unused]: Never shown.\n", languages);

    EXPECT_THAT(out.html, Not(HasSubstr("Never shown")));
    EXPECT_THAT(out.html, Not(HasSubstr("footnotes")));
}

TEST_F(FootnoteRenderTest, ReferenceInsideCodeIsText) {
    auto out = mdsite::render_markdown("Use `arr[^1]` here.\n", languages);
    EXPECT_THAT(out.html, Not(HasSubstr("footnote-ref")));
}
