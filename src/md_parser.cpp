#include <cctype>
#include <optional>
#include <regex>
#include <sstream>
#include <vector>

#include <maddy/parser.h>

#include "markdown.hpp"
#include "math_passthrough.hpp"
#include "footnotes.hpp"
#include "helpers.hpp"
#include "table_of_contents.hpp"



namespace {
    // Html produced by our own renderers is swapped for placeholders before the text goes through maddy,
    // and put back afterwards. \x02 and \x03 never appear in markdown and maddy leaves them alone.
    class FragmentStore {
    public:
        std::string add_block(std::string html) {
            fragments.push_back(std::move(html));
            return "\x02" "B" + std::to_string(fragments.size() - 1) + "\x03";
        }

        std::string add_inline(std::string html) {
            fragments.push_back(std::move(html));
            return "\x02" "I" + std::to_string(fragments.size() - 1) + "\x03";
        }

        std::string restore(const std::string& html) const {
            // Block fragments get wrapped in a paragraph by maddy, drop it.
            static const std::regex block_paragraph("<p>\\s*\x02" "B(\\d+)\x03\\s*</p>");
            static const std::regex placeholder("\x02" "[BI](\\d+)\x03");

            std::string out = replace_all(html, block_paragraph);
            return replace_all(out, placeholder);
        }

    private:
        std::string replace_all(const std::string& html, const std::regex& pattern) const {
            std::string out;
            out.reserve(html.size());

            auto last = html.cbegin();
            for (auto it = std::sregex_iterator(html.begin(), html.end(), pattern); it != std::sregex_iterator(); ++it) {
                auto& match = *it;
                out.append(last, match[0].first);

                size_t index = std::stoul(match[1].str());
                if(index < fragments.size()) {
                    out += fragments[index];
                }
                last = match[0].second;
            }
            out.append(last, html.cend());

            return out;
        }

        std::vector<std::string> fragments;
    };


    const std::regex placeholder_test("\x02" "[BI]\\d+\x03");


    struct Fence {
        char marker;
        size_t length;
        size_t indent;
        std::string language;
    };

    std::optional<Fence> match_opening_fence(std::string_view line) {
        size_t indent = 0;
        while (indent < line.size() && indent < 3 && line[indent] == ' ') {
            indent++;
        }

        line.remove_prefix(indent);
        if(line.empty() || (line[0] != '`' && line[0] != '~')) {
            return std::nullopt;
        }

        char marker = line[0];
        size_t length = 0;
        while (length < line.size() && line[length] == marker) {
            length++;
        }
        if(length < 3) {
            return std::nullopt;
        }

        std::string_view info = mdsite::trim_whitespace(line.substr(length));
        if(marker == '`' && info.find('`') != std::string_view::npos) {
            return std::nullopt;
        }

        // Only the first word names the language, "rs ignore" -> "rs"
        size_t word_end = 0;
        while (word_end < info.size() && !std::isspace(static_cast<unsigned char>(info[word_end]))) {
            word_end++;
        }

        return Fence{marker, length, indent, std::string(info.substr(0, word_end))};
    }

    bool is_closing_fence(std::string_view line, const Fence& fence) {
        size_t indent = 0;
        while (indent < line.size() && indent < 3 && line[indent] == ' ') {
            indent++;
        }

        std::string_view rest = line.substr(indent);
        size_t length = 0;
        while (length < rest.size() && rest[length] == fence.marker) {
            length++;
        }

        return length >= fence.length && mdsite::trim_whitespace(rest.substr(length)).empty();
    }

    std::string_view remove_indent(std::string_view line, size_t indent) {
        size_t i = 0;
        while (i < line.size() && i < indent && line[i] == ' ') {
            i++;
        }
        return line.substr(i);
    }

    std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;

        size_t pos = 0;
        while (pos < text.size()) {
            size_t end = text.find('\n', pos);
            if(end == std::string_view::npos) {
                end = text.size();
            }

            std::string_view line = text.substr(pos, end - pos);
            if(!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            pos = end + 1;
        }

        return lines;
    }


    // Replaces inline math and footnote references in one line of text.
    // Code spans are copied untouched. footnotes == nullptr leaves references as text.
    class InlineScanner {
    public:
        InlineScanner(FragmentStore& store, mdsite::FootnoteTable* footnotes) : store(store), footnotes(footnotes) {}

        std::string scan(std::string_view text) {
            std::string out;
            out.reserve(text.size());

            size_t i = 0;
            while (i < text.size()) {
                char c = text[i];

                if(c == '\\' && i + 1 < text.size() && text[i + 1] == '$') {
                    out += '$';
                    i += 2;
                    continue;
                }

                if(c == '\\' && i + 1 < text.size()) {
                    out += text.substr(i, 2);
                    i += 2;
                    continue;
                }

                if(c == '`') {
                    size_t run = 0;
                    while (i + run < text.size() && text[i + run] == '`') {
                        run++;
                    }

                    std::string_view ticks = text.substr(i, run);
                    size_t close = text.find(ticks, i + run);
                    // A longer run doesn't close the span
                    while (close != std::string_view::npos && close + run < text.size() && text[close + run] == '`') {
                        close = text.find(ticks, close + run + 1);
                    }

                    if(close == std::string_view::npos) {
                        out += ticks;
                        i += run;
                        continue;
                    }

                    out += text.substr(i, close + run - i);
                    i = close + run;
                    continue;
                }

                // Link destination, "[x](http://a/$b$)" holds no math
                if(c == ']' && i + 1 < text.size() && text[i + 1] == '(') {
                    size_t end = find_destination_end(text, i + 2);
                    if(end != std::string_view::npos) {
                        out += text.substr(i, end + 1 - i);
                        i = end + 1;
                        continue;
                    }
                }

                if(c == '$') {
                    if(auto math = mdsite::match_inline_math(text, i)) {
                        out += store.add_inline(mdsite::render_math(math->source, mdsite::MathMode::inline_math));
                        has_math = true;
                        i = math->end;
                        continue;
                    }
                }

                if(c == '[' && footnotes) {
                    if(auto ref = mdsite::match_footnote_reference(text, i)) {
                        out += store.add_inline(footnotes->reference(ref->label));
                        i = ref->end;
                        continue;
                    }
                }

                out += c;
                i++;
            }

            return out;
        }

        bool has_math = false;

    private:
        // Position of the ")" closing a destination that starts at begin, nested parentheses are balanced.
        static size_t find_destination_end(std::string_view text, size_t begin) {
            int depth = 0;
            for (size_t i = begin; i < text.size(); i++) {
                if(text[i] == '\\' && i + 1 < text.size()) {
                    i++;
                }
                else if(text[i] == '(') {
                    depth++;
                }
                else if(text[i] == ')') {
                    if(depth == 0) {
                        return i;
                    }
                    depth--;
                }
            }
            return std::string_view::npos;
        }

        FragmentStore& store;
        mdsite::FootnoteTable* footnotes;
    };


    std::string strip_single_paragraph(std::string html) {
        std::string_view trimmed = mdsite::trim_whitespace(html);
        if(trimmed.starts_with("<p>") && trimmed.ends_with("</p>") && trimmed.find("<p>", 3) == std::string_view::npos) {
            return std::string(mdsite::trim_whitespace(trimmed.substr(3, trimmed.size() - 7)));
        }
        return std::string(trimmed);
    }
}



std::string mdsite::convert_markdown_to_html(std::string_view markdown) {
    maddy::Parser parser;
    std::istringstream md_stream{std::string(markdown)};
    return parser.Parse(md_stream);
}

std::string mdsite::remove_fragment_placeholders(std::string_view html) {
    return std::regex_replace(std::string(html), placeholder_test, "");
}


mdsite::RenderedMarkdown mdsite::render_markdown(std::string_view body, const LanguageTable& languages) {
    FragmentStore store;
    FootnoteTable footnotes;
    InlineScanner scanner(store, &footnotes);

    auto lines = split_lines(body);
    std::string markdown;
    markdown.reserve(body.size());

    auto push_block = [&](std::string html) {
        markdown += "\n";
        markdown += store.add_block(std::move(html));
        markdown += "\n\n";
    };

    bool has_math = false;

    // First pass, divert code, math and footnote definitions, collect references
    for (size_t i = 0; i < lines.size(); i++) {
        std::string_view line = lines[i];

        if(auto fence = match_opening_fence(line)) {
            CodeBlock block;
            if(!fence->language.empty()) {
                block.language = fence->language;
            }

            // Unterminated fences run to the end of the document
            size_t j = i + 1;
            for (; j < lines.size() && !is_closing_fence(lines[j], *fence); j++) {
                block.text += remove_indent(lines[j], fence->indent);
                block.text += '\n';
            }

            push_block(highlight_code_block(block, languages));
            i = j;
            continue;
        }

        if(is_math_fence(line)) {
            size_t j = i + 1;
            while (j < lines.size() && !is_math_fence(lines[j])) {
                j++;
            }

            // Unterminated block math is plain text
            if(j < lines.size()) {
                std::string source;
                for (size_t k = i + 1; k < j; k++) {
                    if(k > i + 1) {
                        source += '\n';
                    }
                    source += lines[k];
                }

                push_block(render_math(source, MathMode::display_math));
                has_math = true;
                i = j;
                continue;
            }
        }

        if(auto definition = match_footnote_definition(line)) {
            std::string text(definition->text);

            // Continuation lines, blank lines only count if more indented text follows
            size_t j = i + 1;
            while (j < lines.size()) {
                if(is_footnote_continuation(lines[j])) {
                    text += '\n';
                    text += trim_whitespace(lines[j]);
                    j++;
                    continue;
                }

                size_t k = j;
                while (k < lines.size() && trim_whitespace(lines[k]).empty()) {
                    k++;
                }
                if(k > j && k < lines.size() && is_footnote_continuation(lines[k])) {
                    text += "\n\n";
                    j = k;
                    continue;
                }
                break;
            }

            footnotes.define(definition->label, std::move(text));
            markdown += "\n";
            i = j - 1;
            continue;
        }

        markdown += scanner.scan(line);
        markdown += '\n';
    }

    footnotes.check_definitions();

    std::string html = convert_markdown_to_html(markdown);
    update_html_headings(html);
    update_html_epigraphs(html);
    update_html_images(html);

    RenderedMarkdown out;
    out.html = create_table_of_contents(html).to_html();
    out.html += store.restore(html);

    // Definitions are rendered separately, references inside them stay text
    out.html += footnotes.render_section([&](std::string_view text) {
        FragmentStore definition_store;
        InlineScanner definition_scanner(definition_store, nullptr);

        std::string definition_markdown;
        for (auto line : split_lines(text)) {
            definition_markdown += definition_scanner.scan(line);
            definition_markdown += '\n';
        }

        has_math = has_math || definition_scanner.has_math;
        return definition_store.restore(strip_single_paragraph(convert_markdown_to_html(definition_markdown)));
    });

    out.has_math = has_math || scanner.has_math;
    return out;
}
