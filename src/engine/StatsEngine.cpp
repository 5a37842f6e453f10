#include "movielog/StatsEngine.hpp"

namespace movielog {

std::vector<algo::CountEntry> StatsEngine::topDirectors(std::size_t n) const {
    return algo::topDirectors(store_.list(), n);
}

std::vector<algo::CountEntry> StatsEngine::genreDistribution() const {
    return algo::genreDistribution(store_.list());
}

std::vector<algo::HistogramBucket> StatsEngine::ratingHistogram(double bucketWidth) const {
    return algo::ratingHistogram(store_.list(), bucketWidth);
}

std::vector<MovieRecord> StatsEngine::recentlyWatched(std::size_t n) const {
    return algo::recentlyWatched(store_.list(), n);
}

std::vector<MovieRecord> StatsEngine::toWatchList() const {
    return algo::toWatchList(store_.list());
}

algo::WatchSummary StatsEngine::summary() const {
    return algo::summarize(store_.list());
}

std::vector<algo::DecadeCount> StatsEngine::byDecade() const {
    return algo::byDecade(store_.list());
}

} // namespace movielog
