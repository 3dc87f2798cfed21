#include <cctype>
#include <format>

#include "footnotes.hpp"
#include "helpers.hpp"
#include "errors.hpp"



namespace {
    // Labels can't be empty or contain whitespace or ']'.
    size_t match_label(std::string_view text, size_t begin) {
        size_t i = begin;
        while (i < text.size() && text[i] != ']') {
            if(std::isspace(static_cast<unsigned char>(text[i])) || text[i] == '[') {
                return std::string_view::npos;
            }
            i++;
        }

        if(i == begin || i >= text.size()) {
            return std::string_view::npos;
        }

        return i;
    }
}



std::optional<mdsite::FootnoteDefinitionStart> mdsite::match_footnote_definition(std::string_view line) {
    // Up to 3 spaces of indentation like any other block
    size_t indent = 0;
    while (indent < line.size() && indent < 3 && line[indent] == ' ') {
        indent++;
    }

    line.remove_prefix(indent);
    if(!line.starts_with("[^")) {
        return std::nullopt;
    }

    size_t close = match_label(line, 2);
    if(close == std::string_view::npos || close + 1 >= line.size() || line[close + 1] != ':') {
        return std::nullopt;
    }

    return FootnoteDefinitionStart{
        .label = line.substr(2, close - 2),
        .text = trim_whitespace(line.substr(close + 2)),
    };
}


std::optional<mdsite::FootnoteReferenceSpan> mdsite::match_footnote_reference(std::string_view text, size_t pos) {
    if(!text.substr(pos).starts_with("[^")) {
        return std::nullopt;
    }

    size_t close = match_label(text, pos + 2);
    if(close == std::string_view::npos) {
        return std::nullopt;
    }

    // "[^a](...)" is a link, not a footnote
    if(close + 1 < text.size() && text[close + 1] == '(') {
        return std::nullopt;
    }

    return FootnoteReferenceSpan{
        .label = text.substr(pos + 2, close - pos - 2),
        .end = close + 1,
    };
}


bool mdsite::is_footnote_continuation(std::string_view line) {
    return line.starts_with('\t') || line.starts_with("    ");
}



void mdsite::FootnoteTable::define(std::string_view label, std::string text) {
    auto it = entries.find(label);
    if(it == entries.end()) {
        it = entries.emplace(std::string(label), Entry{}).first;
    }

    if(!it->second.definition) {
        it->second.definition = std::move(text);
    }
}


std::string mdsite::FootnoteTable::reference(std::string_view label) {
    auto it = entries.find(label);
    if(it == entries.end()) {
        it = entries.emplace(std::string(label), Entry{}).first;
    }

    Entry& entry = it->second;
    if(entry.ordinal == 0) {
        referenced.push_back(it->first);
        entry.ordinal = referenced.size();
    }
    entry.reference_count++;

    std::string id = std::format("fnref-{}", entry.ordinal);
    if(entry.reference_count > 1) {
        id += std::format("-{}", entry.reference_count);
    }

    return std::format("<sup class=\"footnote-ref\"><a href=\"#fn-{0}\" id=\"{1}\">{0}</a></sup>", entry.ordinal, id);
}


void mdsite::FootnoteTable::check_definitions() const {
    for (auto& label : referenced) {
        auto it = entries.find(label);
        if(it == entries.end() || !it->second.definition) {
            throw BuildError(ErrorKind::undefined_footnote, std::format("Footnote \"[^{}]\" is referenced but never defined.", label));
        }
    }
}


std::optional<size_t> mdsite::FootnoteTable::ordinal(std::string_view label) const {
    auto it = entries.find(label);
    if(it == entries.end() || it->second.ordinal == 0) {
        return std::nullopt;
    }
    return it->second.ordinal;
}


std::string mdsite::FootnoteTable::render_section(const std::function<std::string(std::string_view)>& render_text) const {
    if(referenced.empty()) {
        return {};
    }

    std::string out = "<section class=\"footnotes\">\n<hr>\n<ol>\n";

    for (auto& label : referenced) {
        auto& entry = entries.find(label)->second;

        out += std::format("<li id=\"fn-{}\">", entry.ordinal);
        out += render_text(entry.definition.value_or(""));
        out += std::format(" <a href=\"#fnref-{}\" class=\"footnote-backref\">&#8617;</a></li>\n", entry.ordinal);
    }

    out += "</ol>\n</section>\n";
    return out;
}
