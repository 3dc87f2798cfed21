#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>



namespace mdsite {
    using Date = std::chrono::year_month_day;

    // Decoded document header. Only title is required.
    struct Metadata {
        std::string title;
        std::optional<std::string> subtitle;
        std::optional<std::string> description;
        std::optional<std::filesystem::path> stylesheet;    // Relative to the output root, site stylesheet if empty
        std::vector<std::string> tags;
        std::optional<Date> ctime;                          // Publication date
        std::optional<Date> mtime;                          // Last update

        bool operator==(const Metadata&) const = default;
    };

    struct Document {
        std::filesystem::path source;                       // Absolute source path
        std::filesystem::path relative;                     // Relative to the content root
        Metadata metadata;
        std::string body;
        Date modified;                                      // File last write time, UTC
    };

    struct RenderedPage {
        Metadata metadata;
        std::string html;                                   // Body fragment, footnotes included
        bool has_math = false;
    };

    struct FeedEntry {
        std::string title;
        std::string link;                                   // Absolute url
        std::string href;                                   // Relative to the output root, '/' separated
        std::optional<std::string> description;
        std::vector<std::string> tags;
        Date published;
        Date updated;                                       // mtime, published when absent
    };

    // Parses "YYYY-MM-DD".
    std::optional<Date> parse_iso_date(std::string_view str);
    std::string to_iso_string(Date date);
    // "Mon, 02 Jan 2006 00:00:00 +0000"
    std::string to_rfc2822(Date date);
    // "2006-01-02T00:00:00+00:00"
    std::string to_rfc3339(Date date);
}
