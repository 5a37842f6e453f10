#pragma once

#include <vector>
#include "movielog/RecordStore.hpp"
#include "movielog/algorithms/SearchAlgorithms.hpp"

namespace movielog {

using SearchFilters = algo::SearchFilters;

// Filtered search over the store's current snapshot. Nothing is cached, so a
// search after a mutation always sees it.
class SearchIndex {
public:
    explicit SearchIndex(const RecordStore& store) : store_(store) {}

    std::vector<MovieRecord> search(const SearchFilters& filters) const {
        return algo::filterRecords(store_.list(), filters);
    }

private:
    const RecordStore& store_;
};

} // namespace movielog
