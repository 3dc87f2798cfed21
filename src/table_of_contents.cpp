#include <format>
#include <regex>

#include "table_of_contents.hpp"
#include "markdown.hpp"
#include "helpers.hpp"



std::string mdsite::TableOfContentsItem::to_html() const {
    if(children.empty()) {
        return {};
    }

    std::string ret = "<div class=\"toc-anchor\"><nav class=\"toc marginnote\" aria-label=\"Contents\">"
        "<p class=\"toc-title\">Contents</p>"
        "<ol class=\"toc-list\">";

    int section = 0;
    for (auto &&i : children) {
        ret += i.to_html_entry(std::format("{:02}", ++section));
    }

    ret += "</ol></nav></div>\n";
    return ret;
}

// Recursive, subsection numbers are "NN.M".
std::string mdsite::TableOfContentsItem::to_html_entry(const std::string& number) const {
    std::string ret = std::format("<li class=\"toc-l{}\">", number.find('.') == std::string::npos ? 1 : 2);
    ret += std::format("<a href=\"#{}\"><span class=\"toc-num\">{}</span><span class=\"toc-text\">{}</span>", fragment, number, name);
    ret += "<span class=\"toc-leader\" aria-hidden=\"true\"></span></a>";

    if(!children.empty()) {
        ret += "<ol class=\"toc-sub\">";

        int subsection = 0;
        for (auto &&i : children) {
            ret += i.to_html_entry(std::format("{}.{}", number, ++subsection));
        }

        ret += "</ol>";
    }

    ret += "</li>";
    return ret;
}



mdsite::TableOfContentsItem mdsite::create_table_of_contents(const std::string& html) {
    static const std::regex heading_tag_test("<h([23])\\s[^>]*?id=\"([^\"]*)\"[^>]*>([\\s\\S]*?)</h\\1>");

    TableOfContentsItem root;

    for (auto it = std::sregex_iterator(html.begin(), html.end(), heading_tag_test); it != std::sregex_iterator(); ++it) {
        auto& match = *it;

        TableOfContentsItem item;
        item.level = std::stoi(match[1].str());
        item.fragment = match[2].str();
        item.name = std::string(trim_whitespace(remove_html_tags(remove_fragment_placeholders(match[3].str()))));

        // An h3 before any h2 becomes a section of its own
        if(item.level == 3 && !root.children.empty() && root.children.back().level == 2) {
            root.children.back().children.push_back(std::move(item));
        }
        else {
            root.children.push_back(std::move(item));
        }
    }

    return root;
}
