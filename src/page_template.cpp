#include <format>
#include <optional>

#include "site.hpp"
#include "helpers.hpp"



namespace {
    void append_head(std::string& out, const mdsite::SiteConfig& config, const std::string& prefix, const std::string& title, const std::optional<std::string>& description, const std::string& stylesheet, bool has_math) {
        out += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
        out += "<meta charset=\"UTF-8\">\n";
        out += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n";
        out += std::format("<title>{}</title>\n", mdsite::escape_html(title));

        if(description) {
            out += std::format("<meta name=\"description\" content=\"{}\">\n", mdsite::escape_html(*description));
        }

        if(!config.author.empty()) {
            out += std::format("<meta name=\"author\" content=\"{}\">\n", mdsite::escape_html(config.author));
        }

        out += std::format("<link rel=\"stylesheet\" href=\"{}{}\">\n", prefix, mdsite::escape_html(stylesheet));
        out += std::format("<link rel=\"alternate\" type=\"application/rss+xml\" title=\"{}\" href=\"{}{}\">\n",
            mdsite::escape_html(config.title), prefix, mdsite::escape_html(config.feed_file));
        out += std::format("<link rel=\"alternate\" type=\"application/atom+xml\" title=\"{}\" href=\"{}{}\">\n",
            mdsite::escape_html(config.title), prefix, mdsite::escape_html(config.atom_file));

        if(has_math && !config.math_head.empty()) {
            out += config.math_head;
            out += '\n';
        }

        out += "</head>\n<body>\n";
    }

    void append_tail(std::string& out, bool link_index, const std::string& prefix, const std::string& footer) {
        if(link_index) {
            out += std::format("<nav class=\"back\"><a href=\"{}index.html\">Index</a></nav>\n", prefix);
        }

        if(!footer.empty()) {
            out += "<footer>\n";
            out += footer;
            if(footer.back() != '\n') {
                out += '\n';
            }
            out += "</footer>\n";
        }

        out += "</body>\n</html>\n";
    }
}



std::string mdsite::render_page_html(const SiteConfig &config, const std::filesystem::path &target, const RenderedPage &page, const std::string &footer) {
    const Metadata& meta = page.metadata;
    std::string prefix = prefix_to_root(target);

    std::string stylesheet = meta.stylesheet ? to_href(*meta.stylesheet) : config.stylesheet.filename().string();

    std::string out;
    out.reserve(page.html.size() + 2048);

    append_head(out, config, prefix, meta.title, meta.description, stylesheet, page.has_math);

    out += "<article>\n<header>\n";
    out += std::format("<h1>{}</h1>\n", escape_html(meta.title));
    if(meta.subtitle) {
        out += std::format("<p class=\"subtitle\">{}</p>\n", escape_html(*meta.subtitle));
    }

    if(meta.ctime || meta.mtime || !meta.tags.empty()) {
        out += "<p class=\"meta\">";

        bool separate = false;
        if(meta.ctime) {
            out += std::format("Created <time datetime=\"{0}\">{0}</time>", to_iso_string(*meta.ctime));
            separate = true;
        }
        if(meta.mtime) {
            out += std::format("{0}Updated <time datetime=\"{1}\">{1}</time>", separate ? " &middot; " : "", to_iso_string(*meta.mtime));
            separate = true;
        }

        if(!meta.tags.empty()) {
            out += separate ? " &middot; " : "";
            out += "<span class=\"tags\">";
            for (size_t i = 0; i < meta.tags.size(); i++) {
                if(i > 0) {
                    out += ' ';
                }

                if(config.generate_listings) {
                    out += std::format("<a class=\"tag\" href=\"{}{}\">{}</a>", prefix, escape_html(to_href(tag_page_path(meta.tags[i]))), escape_html(meta.tags[i]));
                }
                else {
                    out += std::format("<span class=\"tag\">{}</span>", escape_html(meta.tags[i]));
                }
            }
            out += "</span>";
        }

        out += "</p>\n";
    }
    out += "</header>\n";

    out += page.html;
    if(!page.html.empty() && page.html.back() != '\n') {
        out += '\n';
    }
    out += "</article>\n";

    append_tail(out, config.generate_listings, prefix, footer);

    return out;
}



// Shared shell for generated listing pages
std::string mdsite::render_listing_html(const SiteConfig &config, const std::filesystem::path &target, const std::string &title, const std::string &body) {
    std::string prefix = prefix_to_root(target);
    std::optional<std::string> description;
    if(!config.description.empty()) {
        description = config.description;
    }

    std::string out;
    append_head(out, config, prefix, title, description, config.stylesheet.filename().string(), false);

    out += "<main>\n";
    out += std::format("<h1>{}</h1>\n", escape_html(title));
    out += body;
    out += "</main>\n";

    append_tail(out, target != "index.html", prefix, std::string());

    return out;
}
