#include <cstdio>
#include <format>
#include <map>

#include "site.hpp"
#include "helpers.hpp"



namespace {
    std::string entry_list_item(const mdsite::FeedEntry& entry, const std::string& prefix) {
        std::string date = mdsite::to_iso_string(entry.published);
        return std::format("<li><time datetime=\"{0}\">{0}</time> <a href=\"{1}{2}\">{3}</a></li>\n",
            date, prefix, mdsite::escape_html(entry.href), mdsite::escape_html(entry.title));
    }

    struct TagListing {
        std::string name;                                   // First spelling seen
        std::vector<const mdsite::FeedEntry*> entries;
    };
}



std::filesystem::path mdsite::tag_page_path(const std::string &tag) {
    return std::filesystem::path("tags") / (slugify(tag) + ".html");
}



// Entries are expected newest first.
void mdsite::create_listing_pages(const SiteConfig &config, const SiteTree &tree, const std::vector<FeedEntry> &entries) {
    std::filesystem::path index_target = "index.html";

    if(tree.find_target(index_target)) {
        std::printf("index.html is provided by the content directory, not generated.\n");
    }
    else {
        std::string body;
        int current_year = 0;
        bool open_list = false;

        for (auto& entry : entries) {
            int year = static_cast<int>(entry.published.year());
            if(!open_list || year != current_year) {
                if(open_list) {
                    body += "</ul>\n";
                }
                body += std::format("<h2 id=\"y{0}\">{0}</h2>\n<ul class=\"posts\">\n", year);
                current_year = year;
                open_list = true;
            }
            body += entry_list_item(entry, "");
        }
        if(open_list) {
            body += "</ul>\n";
        }

        write_text_file(config.output_dir / index_target, render_listing_html(config, index_target, config.title, body));
    }


    // Tags differing only in case or punctuation share a page
    std::map<std::string, TagListing> tags;
    for (auto& entry : entries) {
        for (auto& tag : entry.tags) {
            auto& listing = tags[to_href(tag_page_path(tag))];
            if(listing.name.empty()) {
                listing.name = tag;
            }
            if(listing.entries.empty() || listing.entries.back() != &entry) {
                listing.entries.push_back(&entry);
            }
        }
    }

    for (auto& [href, listing] : tags) {
        std::filesystem::path target = href;
        if(tree.find_target(target)) {
            std::printf("%s is provided by the content directory, not generated.\n", href.c_str());
            continue;
        }

        std::string prefix = prefix_to_root(target);
        std::string body = "<ul class=\"posts\">\n";
        for (auto* entry : listing.entries) {
            body += entry_list_item(*entry, prefix);
        }
        body += "</ul>\n";

        write_text_file(config.output_dir / target, render_listing_html(config, target, "Tagged: " + listing.name, body));
    }
}
