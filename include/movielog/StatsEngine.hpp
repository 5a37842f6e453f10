#pragma once

#include <vector>
#include "movielog/RecordStore.hpp"
#include "movielog/algorithms/StatsAlgorithms.hpp"

namespace movielog {

// Read-only aggregate views, recomputed from the store on every call.
class StatsEngine {
public:
    explicit StatsEngine(const RecordStore& store) : store_(store) {}

    std::vector<algo::CountEntry> topDirectors(std::size_t n) const;
    std::vector<algo::CountEntry> genreDistribution() const;
    std::vector<algo::HistogramBucket> ratingHistogram(double bucketWidth) const;
    std::vector<MovieRecord> recentlyWatched(std::size_t n) const;
    std::vector<MovieRecord> toWatchList() const;
    algo::WatchSummary summary() const;
    std::vector<algo::DecadeCount> byDecade() const;

private:
    const RecordStore& store_;
};

} // namespace movielog
