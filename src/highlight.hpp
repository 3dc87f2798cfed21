#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>



namespace mdsite {
    enum class TokenClass : std::uint32_t {
        text,           // Whitespace and anything unrecognised, emitted without a span
        keyword,
        type,
        literal,        // true, false, null, None...
        string,
        comment,
        number,
        function,       // identifier directly followed by '('
        punctuation,
        identifier,
    };

    const char* to_css_class(TokenClass token_class);

    struct Token {
        TokenClass token_class;
        std::string_view text;
    };

    // Pattern rules of one language. Everything a tokenizer knows about a language lives here,
    // so new languages are added as data.
    struct LanguageDefinition {
        std::string name;
        std::vector<std::string> aliases;                   // Lookup keys besides the name, eg "rs"
        std::unordered_set<std::string> keywords;
        std::unordered_set<std::string> types;
        std::unordered_set<std::string> literals;
        std::vector<std::string> line_comments;             // eg "//", "#"
        std::string block_comment_begin, block_comment_end; // empty if none
        std::string string_delimiters;                      // eg "\"'`"
        bool char_literals = false;                         // 'x' is a literal but a lone ' is not a string ('a lifetimes)
    };

    class LanguageTable {
    public:
        void add(LanguageDefinition language);

        // Case insensitive lookup by name or alias, nullptr if unknown.
        const LanguageDefinition* find(std::string_view tag) const;

        size_t size() const { return languages.size(); }

    private:
        std::deque<LanguageDefinition> languages;
        std::unordered_map<std::string, size_t> by_tag;     // Index into languages
    };

    // Rust, C, C++, Python, Shell, JavaScript, Nix, JSON.
    LanguageTable default_language_table();

    struct CodeBlock {
        std::optional<std::string> language;
        std::string text;
    };

    std::vector<Token> tokenize(std::string_view text, const LanguageDefinition& language);

    // <pre class="code"><code class="language-xx">...</code></pre>
    // Unknown or missing language emits escaped text without token spans.
    std::string highlight_code_block(const CodeBlock& block, const LanguageTable& languages);
}
