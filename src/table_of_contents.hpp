#pragma once

#include <list>
#include <string>



namespace mdsite {
    struct TableOfContentsItem {
        std::string name;                                   // Heading text, html entities kept
        std::string fragment;                               // Heading id, as written in the id attribute
        int level = 0;                                      // Heading level, 0 for the root
        std::list<TableOfContentsItem> children;

        // Margin navigation for a page. Toc item is treated as root, empty string when it has no children.
        std::string to_html() const;
        std::string to_html_entry(const std::string& number) const;
    };

    // Root item built from the h2 and h3 tags of demoted body html, h3 nests under the preceding h2.
    TableOfContentsItem create_table_of_contents(const std::string& html);
}
