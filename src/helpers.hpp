#pragma once

#include <string>
#include <string_view>
#include <filesystem>



namespace mdsite {
    std::string remove_html_tags(std::string_view in);
    std::string_view trim_whitespace(std::string_view in);

    // Escapes & < > " ' so the result is safe both as text and inside attribute values.
    std::string escape_html(std::string_view in);
    std::string slugify(std::string_view in);

    // "../" repeated once per directory in the relative output path.
    std::string prefix_to_root(const std::filesystem::path& relative_target);
    // Relative path with '/' separators on every platform.
    std::string to_href(const std::filesystem::path& relative_target);

    // Throw BuildError(read_failure / write_failure) naming the path.
    std::string read_text_file(const std::filesystem::path& file);
    void write_text_file(const std::filesystem::path& file, std::string_view content);
    void copy_file_to(const std::filesystem::path& from, const std::filesystem::path& to);
}
