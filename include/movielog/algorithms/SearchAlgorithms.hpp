#pragma once

#include <optional>
#include <string>
#include <vector>
#include "movielog/MovieRecord.hpp"

namespace movielog::algo {

// Every supplied predicate must hold (AND). All text comparisons ignore case.
struct SearchFilters {
    std::optional<std::string> title;    // substring of title
    std::optional<std::string> director; // substring of director
    std::optional<std::string> actor;    // substring of any cast member
    std::optional<std::string> genre;    // equal to any genre
    std::optional<Status> status;
    std::optional<std::string> keyword;  // substring of title, director, any genre or cast member

    bool empty() const {
        return !title && !director && !actor && !genre && !status && !keyword;
    }
};

bool matches(const MovieRecord& record, const SearchFilters& filters);

// Keeps input order.
std::vector<MovieRecord> filterRecords(const std::vector<MovieRecord>& records, const SearchFilters& filters);

} // namespace movielog::algo
