#include <algorithm>
#include <format>
#include <iterator>
#include <set>

#include "site.hpp"
#include "header_parser.hpp"
#include "helpers.hpp"
#include "errors.hpp"



const mdsite::SiteFile* mdsite::SiteTree::find_target(const std::filesystem::path& target) const {
    for (auto& file : files) {
        if(file.target == target) {
            return &file;
        }
    }
    return nullptr;
}

size_t mdsite::SiteTree::count(ConversionType converter) const {
    return std::count_if(files.begin(), files.end(), [&](const SiteFile& file) {
        return file.converter == converter;
    });
}



// Visit(dir) pushes subdirectories and records files, Done when nothing is pending.
// Directories are identified by canonical path so symlink loops end.
mdsite::SiteTree mdsite::create_site_tree(const SiteConfig &config) {
    std::error_code err;
    if(!std::filesystem::is_directory(config.content_dir, err)) {
        throw BuildError(ErrorKind::content_directory_missing, "Content directory doesn't exist.", config.content_dir);
    }

    SiteTree tree;

    struct PendingDirectory {
        std::filesystem::path directory;
        std::filesystem::path relative;
    };

    try {
        // Output may live inside the content directory, never read it back.
        std::filesystem::path output_root = std::filesystem::weakly_canonical(config.output_dir);

        std::set<std::filesystem::path> visited;
        std::vector<PendingDirectory> pending = {{config.content_dir, {}}};

        while (!pending.empty()) {
            PendingDirectory current = std::move(pending.back());
            pending.pop_back();

            std::filesystem::path canonical = std::filesystem::canonical(current.directory);
            if(canonical == output_root || !visited.insert(canonical).second) {
                continue;
            }

            std::vector<std::filesystem::directory_entry> entries;
            for (auto &&dir_entry : std::filesystem::directory_iterator(current.directory)) {
                entries.push_back(dir_entry);
            }

            std::sort(entries.begin(), entries.end(), [](auto& a, auto& b) {
                return a.path().filename() < b.path().filename();
            });

            std::vector<PendingDirectory> subdirectories;

            for (auto& dir_entry : entries) {
                auto name = dir_entry.path().filename();

                // Skip hidden files and directories
                if(name.string().starts_with('.')) {
                    continue;
                }

                if(dir_entry.is_directory()) {
                    subdirectories.push_back({dir_entry.path(), current.relative / name});
                    continue;
                }

                // Skip sockets, fifos and broken symlinks
                if(!dir_entry.is_regular_file()) {
                    continue;
                }

                SiteFile file;
                file.original = dir_entry.path();
                file.relative = current.relative / name;

                if(file.original.extension() == ".md") {
                    file.converter = ConversionType::from_markdown;
                    file.target = std::filesystem::path(file.relative).replace_extension(".html");
                }
                else {
                    file.converter = ConversionType::copy;
                    file.target = file.relative;
                }

                tree.files.push_back(std::move(file));
            }

            // Reversed so the first subdirectory is visited next
            pending.insert(pending.end(), std::make_move_iterator(subdirectories.rbegin()), std::make_move_iterator(subdirectories.rend()));
        }
    }
    catch (const std::filesystem::filesystem_error& e) {
        throw BuildError(ErrorKind::read_failure, e.code().message(), e.path1());
    }

    std::sort(tree.files.begin(), tree.files.end(), [](const SiteFile& a, const SiteFile& b) {
        return a.relative.generic_string() < b.relative.generic_string();
    });

    // "a.md" and an "a.html" asset would both write a.html
    std::set<std::string> targets;
    for (auto& file : tree.files) {
        if(!targets.insert(file.target.generic_string()).second) {
            throw BuildError(ErrorKind::write_failure, std::format("More than one source file writes to \"{}\".", file.target.generic_string()), file.original);
        }
    }

    return tree;
}



mdsite::Document mdsite::load_document(const SiteFile &file) {
    Document document;
    document.source = file.original;
    document.relative = file.relative;

    std::string text = read_text_file(file.original);

    try {
        auto header = parse_header(text);
        document.metadata = std::move(header.metadata);
        document.body = std::move(header.body);
    }
    catch (const BuildError& e) {
        throw e.with_path(file.original);
    }

    std::error_code err;
    auto write_time = std::filesystem::last_write_time(file.original, err);
    if(err) {
        throw BuildError(ErrorKind::read_failure, "Failed to read modification time: " + err.message(), file.original);
    }

    auto sys_time = std::chrono::file_clock::to_sys(write_time);
    document.modified = Date{std::chrono::floor<std::chrono::days>(sys_time)};

    return document;
}
