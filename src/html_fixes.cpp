#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <optional>
#include <regex>
#include <string_view>

#include "markdown.hpp"
#include "helpers.hpp"



// The page title is the only h1, so body headings move one level down. Each heading gets an id,
// a heading that already has attributes keeps them and is only demoted.
void mdsite::update_html_headings(std::string &html) {
    static const std::regex heading_tag_test("<h([1-6])(\\s[^>]*)?>([\\s\\S]*?)</h[1-6]>");

    std::map<std::string, int> used_ids;
    std::string out;
    out.reserve(html.size() + 64);

    auto last = html.cbegin();
    for (auto it = std::sregex_iterator(html.begin(), html.end(), heading_tag_test); it != std::sregex_iterator(); ++it) {
        auto& match = *it;
        out.append(last, match[0].first);
        last = match[0].second;

        int level = std::min(std::stoi(match[1].str()) + 1, 6);
        std::string attributes = match[2].str();
        std::string content = match[3].str();

        if(attributes.find("id=") == std::string::npos) {
            // Math and footnote references are left out of the slug
            std::string id = slugify(trim_whitespace(remove_html_tags(remove_fragment_placeholders(content))));

            int& count = used_ids[id];
            count++;
            if(count > 1) {
                id += std::format("-{}", count);
            }

            attributes += std::format(" id=\"{}\"", escape_html(id));
        }

        out += std::format("<h{0}{1}>{2}</h{0}>", level, attributes, content);
    }
    out.append(last, html.cend());

    html = std::move(out);
}



namespace {
    struct Attribution {
        size_t dash;            // Start of the dash
        size_t text;            // First byte after the dash
        size_t end;             // End of the attribution text
    };

    // The last "--", en dash or em dash of a blockquote, when it is followed only by closing tags.
    std::optional<Attribution> find_attribution(std::string_view inner) {
        static constexpr std::string_view dashes[] = {"--", "\xE2\x80\x93", "\xE2\x80\x94"};

        Attribution found = {std::string_view::npos, 0, 0};
        for (auto dash : dashes) {
            size_t pos = inner.rfind(dash);
            if(pos != std::string_view::npos && (found.dash == std::string_view::npos || pos > found.dash)) {
                found.dash = pos;
                found.text = pos + dash.size();
            }
        }
        if(found.dash == std::string_view::npos) {
            return std::nullopt;
        }

        // Inside a tag or a code span
        size_t tag = inner.rfind('<', found.dash);
        if(tag != std::string_view::npos) {
            size_t tag_end = inner.find('>', tag);
            if(tag_end == std::string_view::npos || tag_end > found.dash || inner.substr(tag).starts_with("<code")) {
                return std::nullopt;
            }
        }

        found.end = std::min(inner.find('<', found.text), inner.size());
        if(!mdsite::trim_whitespace(mdsite::remove_html_tags(inner.substr(found.end))).empty()) {
            return std::nullopt;
        }
        if(mdsite::trim_whitespace(inner.substr(found.text, found.end - found.text)).empty()) {
            return std::nullopt;
        }

        return found;
    }
}



// A blockquote ending in "-- Name" becomes an epigraph, the name moves to a footer.
// Nested blockquotes are left alone.
void mdsite::update_html_epigraphs(std::string &html) {
    static const std::regex blockquote_tag_test("<blockquote>([\\s\\S]*?)</blockquote>");
    static const std::regex empty_paragraph("<p>\\s*</p>");

    std::string out;
    out.reserve(html.size() + 64);

    auto last = html.cbegin();
    for (auto it = std::sregex_iterator(html.begin(), html.end(), blockquote_tag_test); it != std::sregex_iterator(); ++it) {
        auto& match = *it;
        out.append(last, match[0].first);
        last = match[0].second;

        std::string inner = match[1].str();
        auto attribution = inner.find("<blockquote") == std::string::npos ? find_attribution(inner) : std::nullopt;
        if(!attribution) {
            out += match[0].str();
            continue;
        }

        std::string_view quote = std::string_view(inner).substr(0, attribution->dash);
        while (!quote.empty() && std::isspace(static_cast<unsigned char>(quote.back()))) {
            quote.remove_suffix(1);
        }

        std::string body = std::string(quote) + inner.substr(attribution->end);
        body = std::regex_replace(body, empty_paragraph, "");

        out += "<blockquote>";
        out += body;
        out += "<footer>";
        out += trim_whitespace(std::string_view(inner).substr(attribution->text, attribution->end - attribution->text));
        out += "</footer></blockquote>";
    }
    out.append(last, html.cend());

    html = std::move(out);
}



// Images become figures captioned with their alt text. The first one loads eagerly, the rest lazily.
void mdsite::update_html_images(std::string &html) {
    static const std::regex image_tag_test("(<p>\\s*)?<img\\s+src=\"([^\"]*)\"\\s+alt=\"([^\"]*)\"(?:\\s+title=\"([^\"]*)\")?\\s*/?>(\\s*</p>)?");

    std::string out;
    out.reserve(html.size() + 128);

    bool first = true;
    auto last = html.cbegin();
    for (auto it = std::sregex_iterator(html.begin(), html.end(), image_tag_test); it != std::sregex_iterator(); ++it) {
        auto& match = *it;
        out.append(last, match[0].first);
        last = match[0].second;

        // A figure can't sit inside a paragraph with other text, keep the paragraph tags around it
        bool alone = match[1].matched && match[5].matched;
        if(!alone) {
            out += match[1].str();
        }

        std::string alt = match[3].str();

        out += std::format("<figure class=\"image-container\"><img src=\"{}\" alt=\"{}\"", match[2].str(), alt);
        if(match[4].matched) {
            out += std::format(" title=\"{}\"", match[4].str());
        }
        out += first ? " loading=\"eager\" decoding=\"async\" fetchpriority=\"high\" />" : " loading=\"lazy\" decoding=\"async\" />";
        if(!alt.empty()) {
            out += std::format("<figcaption>{}</figcaption>", alt);
        }
        out += "</figure>";

        if(!alone) {
            out += match[5].str();
        }
        first = false;
    }
    out.append(last, html.cend());

    html = std::move(out);
}
