#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include "RUtils/CommandLine.hpp"
#include "RUtils/Error.hpp"

#include "site.hpp"
#include "errors.hpp"



int main(int argc, const char *argv[]) {
    // Disable stdout and stderr buffering.
    std::setbuf(stdout, nullptr);
    std::setbuf(stderr, nullptr);

    RUtils::CommandLine cmd = {
        .program_name = "mdsite",
        .arg_definitions = {
            {
                'h',
                "help",
                [&]() {
                    cmd.display_help_string();
                    exit(0);
                },
                nullptr,
                "Display this help message.",
            },
            {
                'v',
                "version",
                [&]() {
                    std::printf("mdsite v" MDSITE_VERSION "\n\n");
                    exit(0);
                },
                nullptr,
                "Display version information.",
            },
        },
    };

    if(!cmd.parse(argc, argv)) {
        cmd.display_help_string();
        return 0;
    }

    // Conventional layout in the working directory, nothing else is configurable.
    mdsite::SiteConfig config = mdsite::SiteConfig::defaults(std::filesystem::current_path());

    try {
        mdsite::build_site(config);
    }
    catch (const mdsite::BuildError& e) {
        RUtils::Error(e.what()).print();
        std::printf("Build failed.\n");
        return 1;
    }

    return 0;
}
