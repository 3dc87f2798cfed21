#include <cstdio>

#include "site.hpp"
#include "helpers.hpp"
#include "errors.hpp"



mdsite::SiteConfig mdsite::SiteConfig::defaults(const std::filesystem::path& root) {
    SiteConfig config;

    config.content_dir = root / "contents";
    config.output_dir = root / "public";
    config.stylesheet = root / "style.css";
    config.footer = root / "footer.html";

    config.title = "Dysthesis";
    config.description = "Dysthesis' blog";
    config.base_url = "https://dysthesis.com/";
    config.author = "Dysthesis";

    config.math_head =
        "<link rel=\"stylesheet\" href=\"https://cdn.jsdelivr.net/npm/katex@0.16.27/dist/katex.min.css\" crossorigin=\"anonymous\">\n"
        "<script defer src=\"https://cdn.jsdelivr.net/npm/katex@0.16.27/dist/katex.min.js\" crossorigin=\"anonymous\"></script>\n"
        "<script defer src=\"https://cdn.jsdelivr.net/npm/katex@0.16.27/dist/contrib/auto-render.min.js\" crossorigin=\"anonymous\"\n"
        "    onload=\"document.querySelectorAll('.math').forEach(function(e){katex.render(e.textContent,e,{displayMode:e.classList.contains('math-display'),throwOnError:false});});\"></script>";

    return config;
}



mdsite::BuildSummary mdsite::build_site(const SiteConfig &config) {
    SiteTree tree = create_site_tree(config);

    std::error_code err;
    if(!std::filesystem::is_regular_file(config.stylesheet, err)) {
        throw BuildError(ErrorKind::stylesheet_missing, "Site stylesheet doesn't exist.", config.stylesheet);
    }

    std::filesystem::create_directories(config.output_dir, err);
    if(err) {
        throw BuildError(ErrorKind::write_failure, "Failed to create output directory: " + err.message(), config.output_dir);
    }

    std::printf("Converting %zu files...\n", tree.files.size());

    BuildSummary summary;
    summary.entries = convert_site_files(config, tree);
    summary.pages = tree.count(ConversionType::from_markdown);
    summary.assets = tree.count(ConversionType::copy);

    auto stylesheet_target = config.stylesheet.filename();
    if(tree.find_target(stylesheet_target)) {
        std::printf("%s is provided by the content directory, site stylesheet not copied.\n", stylesheet_target.string().c_str());
    }
    else {
        copy_file_to(config.stylesheet, config.output_dir / stylesheet_target);
    }

    sort_feed_entries(summary.entries);

    if(config.generate_listings) {
        create_listing_pages(config, tree, summary.entries);
    }

    write_feed(config, summary.entries);

    std::printf("Built %zu pages and %zu assets, feeds written to %s and %s.\n", summary.pages, summary.assets,
        (config.output_dir / config.feed_file).string().c_str(), (config.output_dir / config.atom_file).string().c_str());

    return summary;
}
