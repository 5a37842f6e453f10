#include "movielog/algorithms/SearchAlgorithms.hpp"
#include "movielog/Analyzer.hpp"

#include <algorithm>
#include <iterator>

namespace movielog::algo {

namespace {

bool anyContains(const std::vector<std::string>& values, const std::string& needle) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& v) {
        return Analyzer::containsIgnoreCase(v, needle);
    });
}

bool anyEquals(const std::vector<std::string>& values, const std::string& needle) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& v) {
        return Analyzer::equalsIgnoreCase(v, needle);
    });
}

} // namespace

bool matches(const MovieRecord& record, const SearchFilters& filters) {
    if (filters.status && record.status != *filters.status) return false;
    if (filters.title && !Analyzer::containsIgnoreCase(record.title, *filters.title)) return false;
    if (filters.director && !Analyzer::containsIgnoreCase(record.director, *filters.director)) return false;
    if (filters.actor && !anyContains(record.cast, *filters.actor)) return false;
    if (filters.genre && !anyEquals(record.genres, Analyzer::trim(*filters.genre))) return false;
    if (filters.keyword) {
        const std::string& k = *filters.keyword;
        bool hit = Analyzer::containsIgnoreCase(record.title, k) ||
                   Analyzer::containsIgnoreCase(record.director, k) ||
                   anyContains(record.genres, k) ||
                   anyContains(record.cast, k);
        if (!hit) return false;
    }
    return true;
}

std::vector<MovieRecord> filterRecords(const std::vector<MovieRecord>& records, const SearchFilters& filters) {
    if (filters.empty()) return records;
    std::vector<MovieRecord> out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out), [&](const MovieRecord& r) {
        return matches(r, filters);
    });
    return out;
}

} // namespace movielog::algo
