#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>



namespace mdsite {
    enum class ErrorKind : std::uint32_t {
        content_directory_missing,
        stylesheet_missing,
        missing_title,
        malformed_header,
        undefined_footnote,
        read_failure,
        write_failure,
        empty_feed,
    };

    const char* to_string(ErrorKind kind);

    // Every error is fatal to the build. Thrown by the pipeline, reported once in main().
    class BuildError : public std::runtime_error {
    public:
        BuildError(ErrorKind kind, std::string detail, std::filesystem::path path = {});

        ErrorKind kind() const { return kind_; }
        const std::filesystem::path& path() const { return path_; }
        const std::string& detail() const { return detail_; }

        // Same error, attributed to a file. Keeps an already set path.
        BuildError with_path(const std::filesystem::path& path) const;

    private:
        static std::string format_message(ErrorKind kind, const std::string& detail, const std::filesystem::path& path);

        ErrorKind kind_;
        std::string detail_;
        std::filesystem::path path_;
    };
}
