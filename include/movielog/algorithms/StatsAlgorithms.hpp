#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "movielog/MovieRecord.hpp"

namespace movielog::algo {

struct CountEntry {
    std::string key;
    std::size_t count = 0;

    bool operator==(const CountEntry& other) const { return key == other.key && count == other.count; }
};

// Half-open [lower, upper).
struct HistogramBucket {
    double lower = 0.0;
    double upper = 0.0;
    std::size_t count = 0;
};

struct DecadeCount {
    int decade = 0;
    std::size_t count = 0;
};

struct WatchSummary {
    std::size_t watched = 0;
    std::size_t rated = 0;
    double totalHours = 0.0;
    double averageRating = 0.0; // 0 when nothing is rated
};

inline constexpr std::size_t kMaxHistogramBuckets = 1000;

// Positive, finite and yielding at most kMaxHistogramBuckets buckets.
bool isValidBucketWidth(double bucketWidth);

// Watched only, "Unknown" excluded; count desc then name asc; at most n.
std::vector<CountEntry> topDirectors(const std::vector<MovieRecord>& records, std::size_t n);

// Watched only; a record adds one to each of its genres. Count desc then name asc.
std::vector<CountEntry> genreDistribution(const std::vector<MovieRecord>& records);

// Watched, rated records; buckets from 0 through the one holding 10.
// Throws std::invalid_argument unless isValidBucketWidth(bucketWidth).
std::vector<HistogramBucket> ratingHistogram(const std::vector<MovieRecord>& records, double bucketWidth);

// Watched with a date; date desc then title asc; at most n.
std::vector<MovieRecord> recentlyWatched(const std::vector<MovieRecord>& records, std::size_t n);

// To-watch; year asc then title asc.
std::vector<MovieRecord> toWatchList(const std::vector<MovieRecord>& records);

WatchSummary summarize(const std::vector<MovieRecord>& records);

// Watched per decade, most recent decade first.
std::vector<DecadeCount> byDecade(const std::vector<MovieRecord>& records);

} // namespace movielog::algo
