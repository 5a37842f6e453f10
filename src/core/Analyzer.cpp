#include "movielog/Analyzer.hpp"

#include <cctype>

namespace movielog {

namespace {

bool isWordByte(unsigned char ch) {
    return ch >= 0x80 || std::isalnum(ch);
}

std::vector<std::string> split(std::string_view text, bool lower) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (isWordByte(ch)) {
            current.push_back(lower && ch < 0x80 ? static_cast<char>(std::tolower(ch)) : static_cast<char>(ch));
        } else {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out.push_back(sep);
        out += p;
    }
    return out;
}

} // namespace

std::vector<std::string> Analyzer::tokenize(std::string_view text) {
    return split(text, true);
}

std::vector<std::string> Analyzer::words(std::string_view text) {
    return split(text, false);
}

std::string Analyzer::normalizeTitle(std::string_view title) {
    return join(tokenize(title), ' ');
}

std::string Analyzer::slug(std::string_view title) {
    return join(words(title), '-');
}

std::string Analyzer::toLower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool Analyzer::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool Analyzer::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return toLower(a) == toLower(b);
}

std::string Analyzer::trim(std::string_view text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(start, end - start));
}

} // namespace movielog
