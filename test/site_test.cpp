#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "site.hpp"
#include "test_util.hpp"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using mdsite::ErrorKind;
using mdsite::test::read_file;
using mdsite::test::thrown_kind;



class SiteTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = mdsite::SiteConfig::defaults(dir.path());
        config.max_jobs = 2;

        dir.write("style.css", "body { margin: 0; }\n");
    }

    void write_page(const std::filesystem::path& relative, std::string_view header, std::string_view body = "Text\n") {
        dir.write("contents" / relative, "---\n" + std::string(header) + "---\n" + std::string(body));
    }

    mdsite::test::TempDir dir;
    mdsite::SiteConfig config;
};


TEST_F(SiteTest, TreeIsSortedAndSkipsHidden) {
    write_page("b.md", "title: B\n");
    write_page("a.md", "title: A\n");
    write_page("sub/c.md", "title: C\n");
    write_page(".draft.md", "title: Draft\n");
    dir.write("contents/.git/config", "x");
    dir.write("contents/img/logo.png", "PNG");

    auto tree = mdsite::create_site_tree(config);

    std::vector<std::string> relative;
    for (auto& file : tree.files) {
        relative.push_back(file.relative.generic_string());
    }

    EXPECT_THAT(relative, ElementsAre("a.md", "b.md", "img/logo.png", "sub/c.md"));
    EXPECT_EQ(tree.count(mdsite::ConversionType::from_markdown), 3u);
    EXPECT_EQ(tree.count(mdsite::ConversionType::copy), 1u);
    ASSERT_NE(tree.find_target("sub/c.html"), nullptr);
    EXPECT_EQ(tree.find_target("sub/c.html")->relative.generic_string(), "sub/c.md");
}

TEST_F(SiteTest, SymlinkCycleIsVisitedOnce) {
    write_page("posts/one.md", "title: One\n");
    std::filesystem::create_directory_symlink(dir.path() / "contents", dir.path() / "contents/posts/loop");

    auto tree = mdsite::create_site_tree(config);

    ASSERT_EQ(tree.files.size(), 1u);
    EXPECT_EQ(tree.files.front().relative.generic_string(), "posts/one.md");
}

TEST_F(SiteTest, OutputInsideContentIsSkipped) {
    write_page("a.md", "title: A\n");
    dir.write("contents/public/old.html", "stale");
    config.output_dir = dir.path() / "contents/public";

    auto tree = mdsite::create_site_tree(config);
    ASSERT_EQ(tree.files.size(), 1u);
}

TEST_F(SiteTest, ConflictingTargets) {
    write_page("a.md", "title: A\n");
    dir.write("contents/a.html", "<p>hand written</p>");

    EXPECT_EQ(thrown_kind([&] { mdsite::create_site_tree(config); }), ErrorKind::write_failure);
}

TEST_F(SiteTest, MissingContentDirectory) {
    EXPECT_EQ(thrown_kind([&] { mdsite::build_site(config); }), ErrorKind::content_directory_missing);
}

TEST_F(SiteTest, MissingStylesheet) {
    write_page("a.md", "title: A\n");
    std::filesystem::remove(dir.path() / "style.css");

    EXPECT_EQ(thrown_kind([&] { mdsite::build_site(config); }), ErrorKind::stylesheet_missing);
}

TEST_F(SiteTest, ErrorNamesTheFile) {
    write_page("good.md", "title: Good\n");
    write_page("sub/bad.md", "subtitle: no title\n");

    try {
        mdsite::build_site(config);
        FAIL() << "expected a BuildError";
    }
    catch (const mdsite::BuildError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_title);
        EXPECT_EQ(e.path().filename().string(), "bad.md");
        EXPECT_THAT(e.what(), HasSubstr("MissingTitle"));
    }
}

TEST_F(SiteTest, FirstFailureInPathOrderIsReported) {
    write_page("a.md", "title: A\n", "Uses[^x]\n");
    write_page("b.md", "title: B\nctime: nope\n");
    write_page("c.md", "no: title\n");

    for (int run = 0; run < 3; run++) {
        try {
            mdsite::build_site(config);
            FAIL() << "expected a BuildError";
        }
        catch (const mdsite::BuildError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::undefined_footnote);
            EXPECT_EQ(e.path().filename().string(), "a.md");
        }
    }
}

TEST_F(SiteTest, BlockedOutputDirectoryIsWriteFailure) {
    write_page("posts/a.md", "title: A\n");
    dir.write("public/posts", "not a directory");

    try {
        mdsite::build_site(config);
        FAIL() << "expected a BuildError";
    }
    catch (const mdsite::BuildError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::write_failure);
        EXPECT_EQ(e.path().generic_string(), (dir.path() / "public/posts").generic_string());
        EXPECT_THAT(e.what(), HasSubstr("WriteFailure"));
    }
}

TEST_F(SiteTest, OutputRootIsAFile) {
    write_page("a.md", "title: A\n");
    dir.write("public", "not a directory");

    try {
        mdsite::build_site(config);
        FAIL() << "expected a BuildError";
    }
    catch (const mdsite::BuildError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::write_failure);
        EXPECT_EQ(e.path().filename().string(), "public");
    }
}

TEST_F(SiteTest, BuildsPagesAssetsAndFeed) {
    write_page("index-notes.md", "title: Top\ndescription: Top level\nctime: 2024-05-01\ntags: [rust]\n", "Hello $x$\n");
    write_page("posts/deep.md", "title: Deep <Post>\nctime: 2023-01-01\nmtime: 2023-02-01\n");
    dir.write("contents/img/logo.png", std::string("\x89PNG\r\n\0data", 11));
    dir.write("footer.html", "<p>footer</p>");

    auto summary = mdsite::build_site(config);

    EXPECT_EQ(summary.pages, 2u);
    EXPECT_EQ(summary.assets, 1u);
    ASSERT_EQ(summary.entries.size(), 2u);
    EXPECT_EQ(summary.entries[0].title, "Top");

    auto out = dir.path() / "public";
    EXPECT_EQ(read_file(out / "img/logo.png"), std::string("\x89PNG\r\n\0data", 11));
    EXPECT_EQ(read_file(out / "style.css"), "body { margin: 0; }\n");

    std::string top = read_file(out / "index-notes.html");
    EXPECT_THAT(top, HasSubstr("<title>Top</title>"));
    EXPECT_THAT(top, HasSubstr("<meta name=\"description\" content=\"Top level\">"));
    EXPECT_THAT(top, HasSubstr("<link rel=\"stylesheet\" href=\"style.css\">"));
    EXPECT_THAT(top, HasSubstr("katex"));
    EXPECT_THAT(top, HasSubstr("<a class=\"tag\" href=\"tags/rust.html\">rust</a>"));
    EXPECT_THAT(top, HasSubstr("<footer>\n<p>footer</p>\n</footer>"));

    std::string deep = read_file(out / "posts/deep.html");
    EXPECT_THAT(deep, HasSubstr("<h1>Deep &lt;Post&gt;</h1>"));
    EXPECT_THAT(deep, HasSubstr("<link rel=\"stylesheet\" href=\"../style.css\">"));
    EXPECT_THAT(deep, HasSubstr("Updated <time datetime=\"2023-02-01\">2023-02-01</time>"));
    EXPECT_THAT(deep, HasSubstr("<a href=\"../index.html\">Index</a>"));
    EXPECT_THAT(deep, Not(HasSubstr("katex")));

    std::string index = read_file(out / "index.html");
    EXPECT_THAT(index, HasSubstr("<h2 id=\"y2024\">2024</h2>"));
    EXPECT_THAT(index, HasSubstr("<a href=\"posts/deep.html\">Deep &lt;Post&gt;</a>"));
    EXPECT_LT(index.find("2024"), index.find("2023"));

    std::string tag = read_file(out / "tags/rust.html");
    EXPECT_THAT(tag, HasSubstr("<a href=\"../index-notes.html\">Top</a>"));
    EXPECT_THAT(tag, Not(HasSubstr("deep.html")));

    std::string feed = read_file(out / "rss.xml");
    EXPECT_THAT(feed, HasSubstr("<link>https://dysthesis.com/posts/deep.html</link>"));

    std::string atom = read_file(out / "atom.xml");
    EXPECT_THAT(atom, HasSubstr("<link href=\"https://dysthesis.com/posts/deep.html\"/>"));
    EXPECT_THAT(atom, HasSubstr("<updated>2024-05-01T00:00:00+00:00</updated>"));
    EXPECT_THAT(top, HasSubstr("<link rel=\"alternate\" type=\"application/atom+xml\""));
}

TEST_F(SiteTest, ContentIndexWins) {
    write_page("index.md", "title: Home\n");
    write_page("post.md", "title: Post\nctime: 2024-01-01\n");

    mdsite::build_site(config);

    EXPECT_THAT(read_file(dir.path() / "public/index.html"), HasSubstr("<h1>Home</h1>"));
}

TEST_F(SiteTest, RebuildIsByteIdentical) {
    write_page("a.md", "title: A\ntags: [x, y]\n", "# Head\n\nMath $a$ and note[^1].\n\n[^1]: Note.\n");
    write_page("b/b.md", "title: B\nctime: 2020-02-02\n", "```rust\nlet x = 1;\n```\n");
    write_page("b/c/c.md", "title: C\n");
    dir.write("contents/data.bin", "binary");

    mdsite::build_site(config);
    auto first = mdsite::test::snapshot_tree(dir.path() / "public");

    config.max_jobs = 1;
    mdsite::build_site(config);
    auto second = mdsite::test::snapshot_tree(dir.path() / "public");

    EXPECT_EQ(first.size(), second.size());
    EXPECT_TRUE(first == second);
}
