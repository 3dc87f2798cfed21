#pragma once

#include <string>
#include <string_view>

#include "document.hpp"



namespace mdsite {
    struct ParsedHeader {
        Metadata metadata;
        std::string body;
    };

    // Splits the "---" delimited YAML header from the document body and decodes it.
    // Throws BuildError: missing_title, malformed_header.
    ParsedHeader parse_header(std::string_view text);
}
