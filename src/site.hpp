#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

#include "document.hpp"
#include "highlight.hpp"
#include "site_file.hpp"



namespace mdsite {
    struct SiteConfig {
        std::filesystem::path content_dir, output_dir;
        std::filesystem::path stylesheet;                   // Copied into the output root under its file name
        std::filesystem::path footer;                       // Optional html fragment appended to every page

        std::string title = "Untitled";
        std::string description;
        std::string base_url;                               // Absolute, feed links are resolved against it
        std::string author;

        std::string feed_file = "rss.xml";
        std::string atom_file = "atom.xml";
        std::size_t feed_item_limit = 50;
        bool require_feed_entries = false;

        bool generate_listings = true;                      // index.html and tags/*.html

        // Included in <head> of pages containing math, client side renderer for .math elements.
        std::string math_head;

        std::uint32_t max_jobs = 0;

        LanguageTable languages = default_language_table();

        // Conventional layout under root: contents/, public/, style.css, footer.html
        static SiteConfig defaults(const std::filesystem::path& root);
    };

    // Every file found under the content directory, sorted by relative path.
    struct SiteTree {
        std::deque<SiteFile> files;

        const SiteFile* find_target(const std::filesystem::path& target) const;
        size_t count(ConversionType converter) const;
    };

    struct BuildSummary {
        size_t pages = 0;
        size_t assets = 0;
        std::vector<FeedEntry> entries;                     // Newest first
    };


    // Full build: traverse, render, copy, listings and feed.
    // Throws BuildError, every kind is fatal.
    BuildSummary build_site(const SiteConfig &config);

    // Walks the content directory, symlinked directories are visited once.
    // Throws content_directory_missing, read_failure, write_failure (two sources with the same output path).
    SiteTree create_site_tree(const SiteConfig &config);

    // Read a markdown file and decode its header. Errors are attributed to the file.
    Document load_document(const SiteFile &file);

    // Render markdown files and copy everything else into the output directory, on a worker pool.
    // Returns one entry per page in tree order. The first failing file in tree order is rethrown.
    std::vector<FeedEntry> convert_site_files(const SiteConfig &config, const SiteTree &tree);

    // Complete html document for one page.
    std::string render_page_html(const SiteConfig &config, const std::filesystem::path &target, const RenderedPage &page, const std::string &footer);
    std::string render_listing_html(const SiteConfig &config, const std::filesystem::path &target, const std::string &title, const std::string &body);

    // index.html and tags/<tag>.html, skipped when the content tree already has a page there.
    void create_listing_pages(const SiteConfig &config, const SiteTree &tree, const std::vector<FeedEntry> &entries);
    std::filesystem::path tag_page_path(const std::string &tag);


    FeedEntry make_feed_entry(const SiteConfig &config, const std::filesystem::path &target, const Document &document);
    // Newest first, then by title and link so the order never depends on worker timing.
    void sort_feed_entries(std::vector<FeedEntry> &entries);
    // base_url joined with a relative href, through curl's url parser.
    std::string absolute_link(const std::string &base_url, const std::string &href);

    // RSS 2.0 document. Throws empty_feed if require_feed_entries is set and there is nothing to list.
    std::string build_feed(const SiteConfig &config, std::vector<FeedEntry> entries);
    // Atom 1.0 document with the same entries as the RSS feed.
    std::string build_atom_feed(const SiteConfig &config, std::vector<FeedEntry> entries);
    // Writes feed_file and atom_file.
    void write_feed(const SiteConfig &config, const std::vector<FeedEntry> &entries);
}
