#pragma once

#include <cstdint>
#include <filesystem>



namespace mdsite {
    enum class ConversionType : std::uint32_t {
        none,
        copy,
        from_markdown,
    };

    struct SiteFile {
        std::filesystem::path original;                     // Source file
        std::filesystem::path relative;                     // Source path relative to the content root
        std::filesystem::path target;                       // Output path relative to the output root, .md becomes .html
        ConversionType converter = ConversionType::none;    // What converter should be used.
    };
}
