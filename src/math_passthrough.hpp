#pragma once

#include <optional>
#include <string>
#include <string_view>



namespace mdsite {
    enum class MathMode {
        inline_math,
        display_math,
    };

    struct InlineMathSpan {
        std::string_view source;    // Without delimiters
        size_t end;                 // Position after the closing '$'
    };

    // Block math fence, a line containing only "$$".
    bool is_math_fence(std::string_view line);

    // Tries to match "$...$" starting at text[pos] == '$'. nullopt means the '$' is literal.
    std::optional<InlineMathSpan> match_inline_math(std::string_view text, size_t pos);

    // Wraps the escaped source in an element picked up by the client side renderer.
    std::string render_math(std::string_view source, MathMode mode);
}
