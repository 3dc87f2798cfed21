#pragma once

#include <string>
#include <string_view>

#include "highlight.hpp"



namespace mdsite {
    struct RenderedMarkdown {
        std::string html;
        bool has_math = false;
    };

    // Document body (header already removed) to an html fragment.
    // Code blocks, math and footnotes are handled here, everything else by maddy.
    // Throws BuildError(undefined_footnote).
    RenderedMarkdown render_markdown(std::string_view body, const LanguageTable& languages);

    // Plain maddy conversion, no extensions.
    std::string convert_markdown_to_html(std::string_view markdown);

    // h1 -> h2 ... h6 stays h6, and an id slug on every heading. Duplicate ids get -2, -3... suffixes.
    void update_html_headings(std::string& html);

    // Blockquotes whose last text is "-- Name" (or an en/em dash) get <footer>Name</footer>.
    void update_html_epigraphs(std::string& html);

    // <img> to <figure class="image-container"> with an alt text caption.
    void update_html_images(std::string& html);

    // Drops the placeholders render_markdown puts in place of math, code blocks and footnote references.
    std::string remove_fragment_placeholders(std::string_view html);
}
