#include <cctype>
#include <fstream>
#include <sstream>

#include "helpers.hpp"
#include "errors.hpp"



std::string mdsite::remove_html_tags(std::string_view in) {
    bool tag = false;

    std::string out;

    out.reserve(in.size());

    for (auto& c : in) {
        if (c == '<') {
            tag = true;
            continue;
        }
        if (c == '>' && tag) {
            tag = false;
            continue;
        }
        if (!tag) {
            out += c;
        }
    }

    return out;
}

std::string_view mdsite::trim_whitespace(std::string_view in) {
    size_t start = in.size(), end = in.size();

    for (size_t i = 0; i < in.size(); i++) {
        auto c = in[i];

        if (!std::isspace(static_cast<unsigned char>(c))) {
            start = i;
            break;
        }
    }

    for (size_t i = in.size(); i > start; i--) {
        auto c = in[i - 1];

        if (!std::isspace(static_cast<unsigned char>(c))) {
            end = i;
            break;
        }
    }

    return in.substr(start, end - start);
}

std::string mdsite::escape_html(std::string_view in) {
    std::string out;

    out.reserve(in.size());

    for (auto c : in) {
        switch (c) {
        case '&':   out += "&amp;";     break;
        case '<':   out += "&lt;";      break;
        case '>':   out += "&gt;";      break;
        case '"':   out += "&quot;";    break;
        case '\'':  out += "&#x27;";    break;
        default:    out += c;           break;
        }
    }

    return out;
}

// Lower case ascii alphanumerics, everything else collapses into single dashes.
// Non ascii bytes are kept so utf-8 headings still get readable ids.
std::string mdsite::slugify(std::string_view in) {
    std::string out;
    bool prev_dash = false;

    for (auto c : in) {
        auto uc = static_cast<unsigned char>(c);

        if (std::isalnum(uc) || uc >= 0x80) {
            out += static_cast<char>(std::tolower(uc));
            prev_dash = false;
        }
        else if (!out.empty() && !prev_dash) {
            out += '-';
            prev_dash = true;
        }
    }

    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }

    if (out.empty()) {
        return "section";
    }

    return out;
}

std::string mdsite::prefix_to_root(const std::filesystem::path& relative_target) {
    std::string out;

    auto parent = relative_target.parent_path();
    for (auto& part : parent) {
        if (part.empty() || part == ".") {
            continue;
        }
        out += "../";
    }

    return out;
}

std::string mdsite::to_href(const std::filesystem::path& relative_target) {
    return relative_target.generic_string();
}



std::string mdsite::read_text_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw BuildError(ErrorKind::read_failure, "Failed to open file for reading.", file);
    }

    std::ostringstream content;
    content << in.rdbuf();

    if (in.bad()) {
        throw BuildError(ErrorKind::read_failure, "Failed to read file.", file);
    }

    return content.str();
}

void mdsite::write_text_file(const std::filesystem::path& file, std::string_view content) {
    std::error_code err;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), err);
        if (err) {
            throw BuildError(ErrorKind::write_failure, "Failed to create directory: " + err.message(), file.parent_path());
        }
    }

    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw BuildError(ErrorKind::write_failure, "Failed to open file for writing.", file);
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();

    if (!out) {
        throw BuildError(ErrorKind::write_failure, "Failed to write file.", file);
    }
}

void mdsite::copy_file_to(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code err;
    if (to.has_parent_path()) {
        std::filesystem::create_directories(to.parent_path(), err);
        if (err) {
            throw BuildError(ErrorKind::write_failure, "Failed to create directory: " + err.message(), to.parent_path());
        }
    }

    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, err);
    if (err) {
        throw BuildError(ErrorKind::write_failure, "Failed to copy \"" + from.string() + "\": " + err.message(), to);
    }
}
