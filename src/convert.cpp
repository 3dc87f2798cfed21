#include <cstdio>
#include <exception>
#include <optional>
#include <vector>

#include <RUtils/Error.hpp>
#include <RUtils/ForEach.hpp>

#include "site.hpp"
#include "markdown.hpp"
#include "helpers.hpp"
#include "errors.hpp"



namespace {
    struct ConversionJob {
        const mdsite::SiteFile* file;
        std::optional<mdsite::FeedEntry> entry;
        std::exception_ptr error;
    };
}



std::vector<mdsite::FeedEntry> mdsite::convert_site_files(const SiteConfig &config, const SiteTree &tree) {
    std::string footer;
    std::error_code err;
    if(!config.footer.empty() && std::filesystem::is_regular_file(config.footer, err)) {
        footer = read_text_file(config.footer);
    }

    std::vector<ConversionJob> jobs;
    jobs.reserve(tree.files.size());
    for (auto& file : tree.files) {
        jobs.push_back({.file = &file});
    }

    // Copy or convert files
    RUtils::for_each_threaded(jobs.begin(), jobs.end(), [&](ConversionJob& job) {
        auto& file = *job.file;
        std::printf("%s\n", file.relative.generic_string().c_str());

        try {
            switch (file.converter) {
            case ConversionType::copy:
                copy_file_to(file.original, config.output_dir / file.target);
                return;

            case ConversionType::from_markdown: {
                Document document = load_document(file);

                RenderedMarkdown markdown;
                try {
                    markdown = render_markdown(document.body, config.languages);
                }
                catch (const BuildError& e) {
                    throw e.with_path(file.original);
                }

                RenderedPage page = {
                    .metadata = document.metadata,
                    .html = std::move(markdown.html),
                    .has_math = markdown.has_math,
                };

                write_text_file(config.output_dir / file.target, render_page_html(config, file.target, page, footer));
                job.entry = make_feed_entry(config, file.target, document);
                return; }

            default:
                RUtils::Error::unreachable();
            }
        }
        catch (...) {
            job.error = std::current_exception();
        }
    }, config.max_jobs);

    // Report the first failure in tree order, not the first one a worker hit
    for (auto& job : jobs) {
        if(job.error) {
            std::rethrow_exception(job.error);
        }
    }

    std::vector<FeedEntry> entries;
    for (auto& job : jobs) {
        if(job.entry) {
            entries.push_back(std::move(*job.entry));
        }
    }

    return entries;
}
