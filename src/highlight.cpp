#include <algorithm>
#include <cctype>

#include <RUtils/Error.hpp>

#include "highlight.hpp"
#include "helpers.hpp"



namespace {
    std::string to_lower(std::string_view in) {
        std::string out(in);
        for (auto& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    bool is_identifier_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool is_identifier_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }
}



const char* mdsite::to_css_class(TokenClass token_class) {
    switch (token_class) {
    case TokenClass::text:          return "";
    case TokenClass::keyword:       return "tok-keyword";
    case TokenClass::type:          return "tok-type";
    case TokenClass::literal:       return "tok-literal";
    case TokenClass::string:        return "tok-string";
    case TokenClass::comment:       return "tok-comment";
    case TokenClass::number:        return "tok-number";
    case TokenClass::function:      return "tok-function";
    case TokenClass::punctuation:   return "tok-punctuation";
    case TokenClass::identifier:    return "tok-identifier";
    }

    RUtils::Error::unreachable();
    return "";
}



void mdsite::LanguageTable::add(LanguageDefinition language) {
    size_t index = languages.size();
    auto& added = languages.emplace_back(std::move(language));

    by_tag[to_lower(added.name)] = index;
    for (auto& alias : added.aliases) {
        by_tag[to_lower(alias)] = index;
    }
}

const mdsite::LanguageDefinition* mdsite::LanguageTable::find(std::string_view tag) const {
    auto it = by_tag.find(to_lower(trim_whitespace(tag)));
    if(it == by_tag.end()) {
        return nullptr;
    }
    return &languages[it->second];
}



mdsite::LanguageTable mdsite::default_language_table() {
    LanguageTable table;

    table.add({
        .name = "rust",
        .aliases = {"rs"},
        .keywords = {
            "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else", "enum", "extern",
            "fn", "for", "if", "impl", "in", "let", "loop", "match", "mod", "move", "mut", "pub", "ref",
            "return", "self", "Self", "static", "struct", "super", "trait", "type", "unsafe", "use", "where", "while",
        },
        .types = {
            "bool", "char", "str", "u8", "u16", "u32", "u64", "u128", "usize", "i8", "i16", "i32", "i64", "i128",
            "isize", "f32", "f64", "String", "Vec", "Option", "Result", "Box",
        },
        .literals = {"true", "false", "None", "Some", "Ok", "Err"},
        .line_comments = {"//"},
        .block_comment_begin = "/*",
        .block_comment_end = "*/",
        .string_delimiters = "\"",
        .char_literals = true,
    });

    table.add({
        .name = "c",
        .aliases = {"h"},
        .keywords = {
            "break", "case", "const", "continue", "default", "do", "else", "enum", "extern", "for", "goto", "if",
            "inline", "register", "restrict", "return", "sizeof", "static", "struct", "switch", "typedef", "union",
            "volatile", "while", "#include", "#define", "#if", "#ifdef", "#ifndef", "#endif", "#else", "#pragma",
        },
        .types = {
            "char", "double", "float", "int", "long", "short", "signed", "unsigned", "void", "size_t", "bool",
            "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t", "uint64_t",
        },
        .literals = {"NULL", "true", "false"},
        .line_comments = {"//"},
        .block_comment_begin = "/*",
        .block_comment_end = "*/",
        .string_delimiters = "\"",
        .char_literals = true,
    });

    table.add({
        .name = "cpp",
        .aliases = {"c++", "cc", "cxx", "hpp"},
        .keywords = {
            "alignas", "auto", "break", "case", "catch", "class", "co_await", "co_return", "co_yield", "concept",
            "const", "consteval", "constexpr", "continue", "decltype", "default", "delete", "do", "else", "enum",
            "explicit", "export", "extern", "for", "friend", "if", "inline", "mutable", "namespace", "new",
            "noexcept", "operator", "private", "protected", "public", "requires", "return", "sizeof", "static",
            "static_assert", "struct", "switch", "template", "this", "throw", "try", "typedef", "typename",
            "union", "using", "virtual", "volatile", "while", "#include", "#define", "#if", "#ifdef", "#ifndef",
            "#endif", "#else", "#pragma",
        },
        .types = {
            "bool", "char", "double", "float", "int", "long", "short", "signed", "unsigned", "void", "size_t",
            "std", "string", "vector", "int32_t", "int64_t", "uint32_t", "uint64_t",
        },
        .literals = {"true", "false", "nullptr", "NULL"},
        .line_comments = {"//"},
        .block_comment_begin = "/*",
        .block_comment_end = "*/",
        .string_delimiters = "\"",
        .char_literals = true,
    });

    table.add({
        .name = "python",
        .aliases = {"py", "python3"},
        .keywords = {
            "and", "as", "assert", "async", "await", "break", "class", "continue", "def", "del", "elif", "else",
            "except", "finally", "for", "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
            "or", "pass", "raise", "return", "try", "while", "with", "yield",
        },
        .types = {"int", "float", "str", "bool", "list", "dict", "set", "tuple", "bytes", "object"},
        .literals = {"True", "False", "None"},
        .line_comments = {"#"},
        .string_delimiters = "\"'",
    });

    table.add({
        .name = "shell",
        .aliases = {"sh", "bash", "zsh", "console"},
        .keywords = {
            "if", "then", "else", "elif", "fi", "case", "esac", "for", "while", "until", "do", "done", "in",
            "function", "return", "export", "local", "readonly", "set", "unset", "source", "echo", "cd", "exit",
        },
        .literals = {"true", "false"},
        .line_comments = {"#"},
        .string_delimiters = "\"'",
    });

    table.add({
        .name = "javascript",
        .aliases = {"js", "ts", "typescript", "mjs"},
        .keywords = {
            "async", "await", "break", "case", "catch", "class", "const", "continue", "debugger", "default",
            "delete", "do", "else", "export", "extends", "finally", "for", "from", "function", "if", "import",
            "in", "instanceof", "interface", "let", "new", "of", "return", "static", "super", "switch", "this",
            "throw", "try", "type", "typeof", "var", "void", "while", "yield",
        },
        .types = {"number", "string", "boolean", "any", "unknown", "never", "object", "Array", "Promise"},
        .literals = {"true", "false", "null", "undefined", "NaN", "Infinity"},
        .line_comments = {"//"},
        .block_comment_begin = "/*",
        .block_comment_end = "*/",
        .string_delimiters = "\"'`",
    });

    table.add({
        .name = "nix",
        .keywords = {"assert", "else", "if", "in", "inherit", "let", "or", "rec", "then", "with", "import"},
        .literals = {"true", "false", "null"},
        .line_comments = {"#"},
        .block_comment_begin = "/*",
        .block_comment_end = "*/",
        .string_delimiters = "\"",
    });

    table.add({
        .name = "json",
        .aliases = {"jsonc"},
        .literals = {"true", "false", "null"},
        .string_delimiters = "\"",
    });

    return table;
}



// Longest-match-first rules in a fixed order: comments, strings, numbers, words, punctuation.
std::vector<mdsite::Token> mdsite::tokenize(std::string_view text, const LanguageDefinition& language) {
    std::vector<Token> tokens;

    auto push = [&](TokenClass token_class, size_t begin, size_t end) {
        // Merge runs of plain text
        if(token_class == TokenClass::text && !tokens.empty() && tokens.back().token_class == TokenClass::text) {
            auto& last = tokens.back();
            last.text = text.substr(last.text.data() - text.data(), end - (last.text.data() - text.data()));
            return;
        }
        tokens.push_back({token_class, text.substr(begin, end - begin)});
    };

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        std::string_view rest = text.substr(i);

        if(std::isspace(static_cast<unsigned char>(c))) {
            push(TokenClass::text, i, i + 1);
            i++;
            continue;
        }

        // Line comments
        bool matched = false;
        for (auto& marker : language.line_comments) {
            if(rest.starts_with(marker)) {
                size_t end = text.find('\n', i);
                if(end == std::string_view::npos) {
                    end = text.size();
                }
                push(TokenClass::comment, i, end);
                i = end;
                matched = true;
                break;
            }
        }
        if(matched) {
            continue;
        }

        // Block comments, unterminated ones run to the end
        if(!language.block_comment_begin.empty() && rest.starts_with(language.block_comment_begin)) {
            size_t end = text.find(language.block_comment_end, i + language.block_comment_begin.size());
            end = end == std::string_view::npos ? text.size() : end + language.block_comment_end.size();
            push(TokenClass::comment, i, end);
            i = end;
            continue;
        }

        // Strings, may span lines but an unterminated one stops at the end of its line
        if(language.string_delimiters.find(c) != std::string::npos) {
            size_t end = std::string_view::npos;
            for (size_t j = i + 1; j < text.size(); j++) {
                if(text[j] == '\\') {
                    j++;
                    continue;
                }
                if(text[j] == c) {
                    end = j + 1;
                    break;
                }
            }
            if(end == std::string_view::npos) {
                end = text.find('\n', i);
                end = end == std::string_view::npos ? text.size() : end;
            }
            push(TokenClass::string, i, end);
            i = end;
            continue;
        }

        // Char literals: 'x' or '\n'
        if(language.char_literals && c == '\'') {
            size_t close = std::string_view::npos;
            if(i + 2 < text.size() && text[i + 1] != '\\' && text[i + 2] == '\'') {
                close = i + 2;
            }
            else if(i + 3 < text.size() && text[i + 1] == '\\' && text[i + 3] == '\'') {
                close = i + 3;
            }

            if(close != std::string_view::npos) {
                push(TokenClass::string, i, close + 1);
                i = close + 1;
                continue;
            }
        }

        if(std::isdigit(static_cast<unsigned char>(c))) {
            size_t end = i + 1;
            while (end < text.size() && (is_identifier_char(text[end]) || text[end] == '.')) {
                end++;
            }
            push(TokenClass::number, i, end);
            i = end;
            continue;
        }

        // Words, preprocessor directives count as one word
        if(is_identifier_start(c) || (c == '#' && i + 1 < text.size() && is_identifier_start(text[i + 1]))) {
            size_t end = i + 1;
            while (end < text.size() && is_identifier_char(text[end])) {
                end++;
            }

            std::string word(text.substr(i, end - i));
            if(c == '#' && !language.keywords.contains(word)) {
                // Not a directive, only the '#' is punctuation
                push(TokenClass::punctuation, i, i + 1);
                i++;
                continue;
            }

            TokenClass token_class = TokenClass::identifier;
            if(language.keywords.contains(word)) {
                token_class = TokenClass::keyword;
            }
            else if(language.types.contains(word)) {
                token_class = TokenClass::type;
            }
            else if(language.literals.contains(word)) {
                token_class = TokenClass::literal;
            }
            else if(end < text.size() && text[end] == '(') {
                token_class = TokenClass::function;
            }

            push(token_class, i, end);
            i = end;
            continue;
        }

        if(std::ispunct(static_cast<unsigned char>(c))) {
            push(TokenClass::punctuation, i, i + 1);
            i++;
            continue;
        }

        push(TokenClass::text, i, i + 1);
        i++;
    }

    return tokens;
}



std::string mdsite::highlight_code_block(const CodeBlock& block, const LanguageTable& languages) {
    std::string out = "<pre class=\"code\"><code";

    if(block.language && !block.language->empty()) {
        out += " class=\"language-";
        out += escape_html(*block.language);
        out += "\"";
    }
    out += ">";

    const LanguageDefinition* language = block.language ? languages.find(*block.language) : nullptr;

    if(!language) {
        out += escape_html(block.text);
        out += "</code></pre>";
        return out;
    }

    for (auto& token : tokenize(block.text, *language)) {
        if(token.token_class == TokenClass::text) {
            out += escape_html(token.text);
            continue;
        }

        out += "<span class=\"";
        out += to_css_class(token.token_class);
        out += "\">";
        out += escape_html(token.text);
        out += "</span>";
    }

    out += "</code></pre>";
    return out;
}
