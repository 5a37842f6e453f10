#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace movielog {

// Text analyzer shared by identity keys, filenames and search.
// Words split on non-alnum ASCII; bytes >= 0x80 count as word characters
// so UTF-8 titles keep their letters.
class Analyzer {
public:
    static std::vector<std::string> tokenize(std::string_view text);

    // Same split as tokenize() but keeps the original case.
    static std::vector<std::string> words(std::string_view text);

    // Identity key: lower-cased words joined by single spaces.
    static std::string normalizeTitle(std::string_view title);

    // Filesystem-safe stem: original-case words joined by '-'.
    static std::string slug(std::string_view title);

    static std::string toLower(std::string_view text);
    static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);
    static bool equalsIgnoreCase(std::string_view a, std::string_view b);
    static std::string trim(std::string_view text);
};

} // namespace movielog
