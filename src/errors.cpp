#include <format>

#include <RUtils/Error.hpp>

#include "errors.hpp"



const char* mdsite::to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::content_directory_missing:  return "ContentDirectoryMissing";
    case ErrorKind::stylesheet_missing:         return "StylesheetMissing";
    case ErrorKind::missing_title:              return "MissingTitle";
    case ErrorKind::malformed_header:           return "MalformedHeader";
    case ErrorKind::undefined_footnote:         return "UndefinedFootnote";
    case ErrorKind::read_failure:               return "ReadFailure";
    case ErrorKind::write_failure:              return "WriteFailure";
    case ErrorKind::empty_feed:                 return "EmptyFeed";
    }

    RUtils::Error::unreachable();
    return "";
}



mdsite::BuildError::BuildError(ErrorKind kind, std::string detail, std::filesystem::path path)
    : std::runtime_error(format_message(kind, detail, path)), kind_(kind), detail_(std::move(detail)), path_(std::move(path)) {}


mdsite::BuildError mdsite::BuildError::with_path(const std::filesystem::path& path) const {
    if(!path_.empty()) {
        return *this;
    }
    return BuildError(kind_, detail_, path);
}


std::string mdsite::BuildError::format_message(ErrorKind kind, const std::string& detail, const std::filesystem::path& path) {
    if(path.empty()) {
        return std::format("{}: {}", to_string(kind), detail);
    }
    return std::format("\"{}\": {}: {}", path.string(), to_string(kind), detail);
}
