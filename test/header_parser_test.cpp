#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "header_parser.hpp"
#include "test_util.hpp"

using namespace std::chrono;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using mdsite::ErrorKind;
using mdsite::test::thrown_kind;



TEST(HeaderParserTest, DecodesAllFields) {
    auto parsed = mdsite::parse_header(
        "---\n"
        "title: Hello, world\n"
        "subtitle: A first post\n"
        "description: Short summary\n"
        "tags:\n"
        "  - rust\n"
        "  - math\n"
        "  - notes\n"
        "ctime: 2024-01-02\n"
        "mtime: 2024-03-04\n"
        "stylesheet: css/post.css\n"
        "---\n"
        "Body text\n");

    auto& meta = parsed.metadata;
    EXPECT_EQ(meta.title, "Hello, world");
    EXPECT_EQ(meta.subtitle, "A first post");
    EXPECT_EQ(meta.description, "Short summary");
    EXPECT_THAT(meta.tags, ElementsAre("rust", "math", "notes"));
    EXPECT_EQ(meta.ctime, mdsite::Date(year{2024}, January, day{2}));
    EXPECT_EQ(meta.mtime, mdsite::Date(year{2024}, March, day{4}));
    ASSERT_TRUE(meta.stylesheet.has_value());
    EXPECT_EQ(meta.stylesheet->generic_string(), "css/post.css");
    EXPECT_EQ(parsed.body, "Body text\n");
}

TEST(HeaderParserTest, OptionalFieldsDefault) {
    auto parsed = mdsite::parse_header("---\ntitle: Only a title\n---\n");

    mdsite::Metadata expected;
    expected.title = "Only a title";

    EXPECT_TRUE(parsed.metadata == expected);
    EXPECT_THAT(parsed.body, IsEmpty());
}

TEST(HeaderParserTest, TagOrderIsKept) {
    auto parsed = mdsite::parse_header("---\ntitle: t\ntags: [zeta, alpha, mid]\n---\n");
    EXPECT_THAT(parsed.metadata.tags, ElementsAre("zeta", "alpha", "mid"));
}

TEST(HeaderParserTest, AcceptsCrlfBomAndDotsTerminator) {
    auto parsed = mdsite::parse_header("\xEF\xBB\xBF---\r\ntitle: Windows\r\n...\r\nLine\r\n");
    EXPECT_EQ(parsed.metadata.title, "Windows");
    EXPECT_EQ(parsed.body, "Line\r\n");
}

TEST(HeaderParserTest, MissingTitle) {
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\nsubtitle: no title here\n---\nBody\n"); }), ErrorKind::missing_title);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: \"  \"\n---\n"); }), ErrorKind::missing_title);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("# Just markdown\n"); }), ErrorKind::missing_title);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header(""); }), ErrorKind::missing_title);
}

TEST(HeaderParserTest, MalformedHeader) {
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: never closed\n"); }), ErrorKind::malformed_header);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: t\nctime: yesterday\n---\n"); }), ErrorKind::malformed_header);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: t\nctime: 2024-02-30\n---\n"); }), ErrorKind::malformed_header);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: t\ntags: single\n---\n"); }), ErrorKind::malformed_header);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: t\nstylesheet: /etc/style.css\n---\n"); }), ErrorKind::malformed_header);
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\n- a\n- b\n---\n"); }), ErrorKind::malformed_header);
}

TEST(HeaderParserTest, YamlSyntaxErrorIsMalformed) {
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: [unclosed\n---\nBody\n"); }), ErrorKind::malformed_header);

    try {
        mdsite::parse_header("---\ntitle: {a: b\n---\n");
        FAIL() << "expected a BuildError";
    }
    catch (const mdsite::BuildError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::malformed_header);
        EXPECT_FALSE(e.detail().empty());
    }
}

TEST(HeaderParserTest, QuotedNullWordsAreStrings) {
    auto parsed = mdsite::parse_header("---\ntitle: \"Null\"\nsubtitle: 'null'\ndescription: \"~\"\n---\n");
    EXPECT_EQ(parsed.metadata.title, "Null");
    EXPECT_EQ(parsed.metadata.subtitle, "null");
    EXPECT_EQ(parsed.metadata.description, "~");

    // Plain scalars still read as absent
    auto plain = mdsite::parse_header("---\ntitle: t\nsubtitle: ~\ndescription: null\n---\n");
    EXPECT_FALSE(plain.metadata.subtitle.has_value());
    EXPECT_FALSE(plain.metadata.description.has_value());
    EXPECT_EQ(thrown_kind([] { mdsite::parse_header("---\ntitle: null\n---\n"); }), ErrorKind::missing_title);
}

TEST(HeaderParserTest, BodyKeepsLaterRules) {
    auto parsed = mdsite::parse_header("---\ntitle: t\n---\nabove\n\n---\n\nbelow\n");
    EXPECT_EQ(parsed.body, "above\n\n---\n\nbelow\n");
}
