#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>



namespace mdsite {
    struct FootnoteDefinitionStart {
        std::string_view label;
        std::string_view text;      // Rest of the "[^label]: ..." line
    };

    struct FootnoteReferenceSpan {
        std::string_view label;
        size_t end;                 // Position after ']'
    };

    // "[^label]: text" at the start of a line.
    std::optional<FootnoteDefinitionStart> match_footnote_definition(std::string_view line);
    // "[^label]" starting at text[pos] == '['.
    std::optional<FootnoteReferenceSpan> match_footnote_reference(std::string_view text, size_t pos);
    // Definition continuation lines are indented by a tab or at least four spaces.
    bool is_footnote_continuation(std::string_view line);


    // Per document footnote bookkeeping, owned by a single render call.
    // Ordinals follow the order in which labels are first referenced.
    class FootnoteTable {
    public:
        // First definition of a label wins.
        void define(std::string_view label, std::string text);

        // Records a reference site and returns its html.
        std::string reference(std::string_view label);

        // Throws BuildError(undefined_footnote) for the first referenced label that has no definition.
        void check_definitions() const;

        std::optional<size_t> ordinal(std::string_view label) const;

        // Trailing list of referenced definitions, empty string if nothing was referenced.
        // Definitions never referenced are dropped.
        std::string render_section(const std::function<std::string(std::string_view)>& render_text) const;

    private:
        struct Entry {
            std::optional<std::string> definition;
            size_t ordinal = 0;             // 0 until referenced
            size_t reference_count = 0;
        };

        std::map<std::string, Entry, std::less<>> entries;
        std::vector<std::string> referenced;    // Labels in ordinal order
    };
}
