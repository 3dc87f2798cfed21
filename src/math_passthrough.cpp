#include <cctype>

#include <RUtils/Error.hpp>

#include "math_passthrough.hpp"
#include "helpers.hpp"



bool mdsite::is_math_fence(std::string_view line) {
    return trim_whitespace(line) == "$$";
}


// Same rules as pandoc's tex_math_dollars: no whitespace right inside the delimiters
// and the closing '$' can't be followed by a digit, so "$5 and $6" stays text.
std::optional<mdsite::InlineMathSpan> mdsite::match_inline_math(std::string_view text, size_t pos) {
    if(pos + 1 >= text.size() || text[pos] != '$') {
        return std::nullopt;
    }

    char first = text[pos + 1];
    if(first == '$' || std::isspace(static_cast<unsigned char>(first))) {
        return std::nullopt;
    }

    for (size_t i = pos + 1; i < text.size(); i++) {
        if(text[i] == '\\') {
            i++;
            continue;
        }

        if(text[i] != '$') {
            continue;
        }

        if(std::isspace(static_cast<unsigned char>(text[i - 1]))) {
            continue;
        }

        if(i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
            continue;
        }

        return InlineMathSpan{
            .source = text.substr(pos + 1, i - pos - 1),
            .end = i + 1,
        };
    }

    return std::nullopt;
}


std::string mdsite::render_math(std::string_view source, MathMode mode) {
    switch (mode) {
    case MathMode::inline_math:
        return "<span class=\"math math-inline\">" + escape_html(source) + "</span>";

    case MathMode::display_math:
        return "<div class=\"math math-display\">" + escape_html(source) + "</div>";
    }

    RUtils::Error::unreachable();
    return {};
}
