#include <format>
#include <mutex>
#include <stdexcept>

#include <ryml.hpp>

#include "header_parser.hpp"
#include "helpers.hpp"
#include "errors.hpp"



namespace {
    // rapidyaml aborts on errors by default, make it throw instead.
    class YamlError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    void throw_yaml_error(const char* msg, size_t msg_len, ryml::Location location, void*) {
        throw YamlError(std::format("line {}: {}", location.line + 1, std::string_view(msg, msg_len)));
    }

    void install_yaml_error_handler() {
        static std::once_flag installed;
        std::call_once(installed, []() {
            ryml::Callbacks callbacks = ryml::get_callbacks();
            callbacks.m_error = &throw_yaml_error;
            ryml::set_callbacks(callbacks);
        });
    }


    std::string_view next_line(std::string_view text, size_t& pos) {
        size_t end = text.find('\n', pos);
        if(end == std::string_view::npos) {
            end = text.size();
        }

        std::string_view line = text.substr(pos, end - pos);
        pos = end < text.size() ? end + 1 : end;

        if(!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    }


    std::string to_std_string(ryml::csubstr str) {
        return std::string(str.str, str.len);
    }

    // Only plain scalars can be null, "~" and "" are strings.
    bool is_null_value(const ryml::Tree& tree, size_t node) {
        if(!tree.has_val(node)) {
            return true;
        }
        if(tree.is_val_quoted(node)) {
            return false;
        }
        ryml::csubstr val = tree.val(node);
        return val.len == 0 || val == "~" || val == "null" || val == "Null" || val == "NULL";
    }

    // Scalar field, absent or null decodes to nullopt.
    std::optional<std::string> get_scalar(const ryml::Tree& tree, size_t root, const char* key) {
        size_t node = tree.find_child(root, ryml::to_csubstr(key));
        if(node == ryml::NONE) {
            return std::nullopt;
        }

        if(!tree.is_keyval(node)) {
            throw mdsite::BuildError(mdsite::ErrorKind::malformed_header, std::format("Field \"{}\" must be a single value.", key));
        }

        if(is_null_value(tree, node)) {
            return std::nullopt;
        }

        return to_std_string(tree.val(node));
    }

    std::vector<std::string> get_sequence(const ryml::Tree& tree, size_t root, const char* key) {
        std::vector<std::string> out;

        size_t node = tree.find_child(root, ryml::to_csubstr(key));
        if(node == ryml::NONE) {
            return out;
        }

        if(tree.is_keyval(node) && is_null_value(tree, node)) {
            return out;
        }

        if(!tree.is_seq(node)) {
            throw mdsite::BuildError(mdsite::ErrorKind::malformed_header, std::format("Field \"{}\" must be a list.", key));
        }

        for (size_t child = tree.first_child(node); child != ryml::NONE; child = tree.next_sibling(child)) {
            if(!tree.is_val(child)) {
                throw mdsite::BuildError(mdsite::ErrorKind::malformed_header, std::format("Items of \"{}\" must be single values.", key));
            }
            out.push_back(to_std_string(tree.val(child)));
        }

        return out;
    }

    std::optional<mdsite::Date> get_date(const ryml::Tree& tree, size_t root, const char* key) {
        auto str = get_scalar(tree, root, key);
        if(!str) {
            return std::nullopt;
        }

        auto date = mdsite::parse_iso_date(mdsite::trim_whitespace(*str));
        if(!date) {
            throw mdsite::BuildError(mdsite::ErrorKind::malformed_header, std::format("Field \"{}\" must be a date in YYYY-MM-DD format, got: \"{}\".", key, *str));
        }
        return date;
    }
}



mdsite::ParsedHeader mdsite::parse_header(std::string_view text) {
    // utf-8 bom
    if(text.starts_with("\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }

    size_t pos = 0;
    if(next_line(text, pos) != "---") {
        throw BuildError(ErrorKind::missing_title, "Document has no metadata header, a title is required.");
    }

    size_t yaml_begin = pos;
    size_t yaml_end = std::string_view::npos;

    while (pos < text.size()) {
        size_t line_begin = pos;
        auto line = next_line(text, pos);

        if(line == "---" || line == "...") {
            yaml_end = line_begin;
            break;
        }
    }

    if(yaml_end == std::string_view::npos) {
        throw BuildError(ErrorKind::malformed_header, "Metadata header is not closed, expected a \"---\" line.");
    }

    std::string yaml;
    yaml.reserve(yaml_end - yaml_begin);
    for (char c : text.substr(yaml_begin, yaml_end - yaml_begin)) {
        if(c != '\r') {
            yaml += c;
        }
    }

    ParsedHeader out;
    out.body = std::string(text.substr(pos));

    if(trim_whitespace(yaml).empty()) {
        throw BuildError(ErrorKind::missing_title, "Metadata header is empty, a title is required.");
    }

    install_yaml_error_handler();

    ryml::Tree tree;
    try {
        tree = ryml::parse_in_arena(ryml::csubstr(yaml.data(), yaml.size()));
    }
    catch (const YamlError& e) {
        throw BuildError(ErrorKind::malformed_header, std::format("Invalid YAML: {}", e.what()));
    }

    size_t root = tree.root_id();
    if(!tree.is_map(root)) {
        throw BuildError(ErrorKind::malformed_header, "Metadata header must be a list of \"key: value\" pairs.");
    }

    auto title = get_scalar(tree, root, "title");
    if(!title || trim_whitespace(*title).empty()) {
        throw BuildError(ErrorKind::missing_title, "Metadata header has no \"title\".");
    }

    out.metadata.title = *title;
    out.metadata.subtitle = get_scalar(tree, root, "subtitle");
    out.metadata.description = get_scalar(tree, root, "description");
    out.metadata.tags = get_sequence(tree, root, "tags");
    out.metadata.ctime = get_date(tree, root, "ctime");
    out.metadata.mtime = get_date(tree, root, "mtime");

    if(auto stylesheet = get_scalar(tree, root, "stylesheet")) {
        std::filesystem::path path = *stylesheet;
        if(path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
            throw BuildError(ErrorKind::malformed_header, std::format("Field \"stylesheet\" must be a relative path, got: \"{}\".", *stylesheet));
        }
        out.metadata.stylesheet = path;
    }

    return out;
}
