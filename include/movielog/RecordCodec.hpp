#pragma once

#include <string>
#include <string_view>
#include "movielog/MovieRecord.hpp"

namespace movielog {

// Front-matter document codec. A document is a "---" delimited key/value
// header followed by the free-text notes, verbatim.
class RecordCodec {
public:
    static std::string encode(const MovieRecord& record);

    // Throws ParseError (with `path` attached when given).
    static MovieRecord decode(std::string_view text, const std::string& path = "");

    // Double-quoted scalar with \\ \" \n \r \t escapes.
    static std::string quote(std::string_view value);

    // Inverse of quote(); the input must include the surrounding quotes.
    static std::string unquote(std::string_view quoted);
};

} // namespace movielog
