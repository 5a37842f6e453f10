#include "movielog/algorithms/StatsAlgorithms.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <stdexcept>

namespace movielog::algo {

namespace {

constexpr double kMaxRating = 10.0;

bool isWatched(const MovieRecord& r) {
    return r.status == Status::Watched;
}

std::vector<CountEntry> rankCounts(const std::map<std::string, std::size_t>& counts) {
    std::vector<CountEntry> out;
    out.reserve(counts.size());
    for (const auto& [key, count] : counts) {
        out.push_back(CountEntry{key, count});
    }
    // std::map already yields ascending keys; stable_sort keeps them for ties.
    std::stable_sort(out.begin(), out.end(), [](const CountEntry& a, const CountEntry& b) {
        return a.count > b.count;
    });
    return out;
}

} // namespace

bool isValidBucketWidth(double bucketWidth) {
    return std::isfinite(bucketWidth) && bucketWidth > 0.0 &&
           kMaxRating / bucketWidth <= static_cast<double>(kMaxHistogramBuckets);
}

std::vector<CountEntry> topDirectors(const std::vector<MovieRecord>& records, std::size_t n) {
    std::map<std::string, std::size_t> counts;
    for (const auto& r : records) {
        if (!isWatched(r)) continue;
        if (r.director.empty() || r.director == kUnknownDirector) continue;
        ++counts[r.director];
    }
    auto ranked = rankCounts(counts);
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

std::vector<CountEntry> genreDistribution(const std::vector<MovieRecord>& records) {
    std::map<std::string, std::size_t> counts;
    for (const auto& r : records) {
        if (!isWatched(r)) continue;
        for (const auto& g : r.genres) {
            ++counts[g];
        }
    }
    return rankCounts(counts);
}

std::vector<HistogramBucket> ratingHistogram(const std::vector<MovieRecord>& records, double bucketWidth) {
    if (!isValidBucketWidth(bucketWidth)) {
        throw std::invalid_argument("rating histogram bucket width must be positive and at least " +
                                    std::to_string(kMaxRating / static_cast<double>(kMaxHistogramBuckets)));
    }

    const auto bucketCount = static_cast<std::size_t>(std::floor(kMaxRating / bucketWidth)) + 1;
    std::vector<HistogramBucket> buckets(bucketCount);
    for (std::size_t i = 0; i < bucketCount; ++i) {
        buckets[i].lower = static_cast<double>(i) * bucketWidth;
        buckets[i].upper = static_cast<double>(i + 1) * bucketWidth;
    }

    for (const auto& r : records) {
        if (!isWatched(r) || !r.rating) continue;
        auto idx = static_cast<std::size_t>(std::floor(*r.rating / bucketWidth));
        if (idx >= bucketCount) idx = bucketCount - 1;
        ++buckets[idx].count;
    }
    return buckets;
}

std::vector<MovieRecord> recentlyWatched(const std::vector<MovieRecord>& records, std::size_t n) {
    std::vector<MovieRecord> out;
    for (const auto& r : records) {
        if (isWatched(r) && r.dateWatched) out.push_back(r);
    }
    std::sort(out.begin(), out.end(), [](const MovieRecord& a, const MovieRecord& b) {
        if (*a.dateWatched != *b.dateWatched) return *b.dateWatched < *a.dateWatched;
        return a.title < b.title;
    });
    if (out.size() > n) out.resize(n);
    return out;
}

std::vector<MovieRecord> toWatchList(const std::vector<MovieRecord>& records) {
    std::vector<MovieRecord> out;
    for (const auto& r : records) {
        if (r.status == Status::ToWatch) out.push_back(r);
    }
    std::sort(out.begin(), out.end(), [](const MovieRecord& a, const MovieRecord& b) {
        if (a.year != b.year) return a.year < b.year;
        return a.title < b.title;
    });
    return out;
}

WatchSummary summarize(const std::vector<MovieRecord>& records) {
    WatchSummary s;
    double ratingSum = 0.0;
    long totalMinutes = 0;
    for (const auto& r : records) {
        if (!isWatched(r)) continue;
        ++s.watched;
        totalMinutes += r.runtime;
        if (r.rating) {
            ++s.rated;
            ratingSum += *r.rating;
        }
    }
    s.totalHours = static_cast<double>(totalMinutes) / 60.0;
    s.averageRating = s.rated == 0 ? 0.0 : ratingSum / static_cast<double>(s.rated);
    return s;
}

std::vector<DecadeCount> byDecade(const std::vector<MovieRecord>& records) {
    std::map<int, std::size_t, std::greater<int>> counts;
    for (const auto& r : records) {
        if (isWatched(r)) ++counts[(r.year / 10) * 10];
    }
    std::vector<DecadeCount> out;
    for (const auto& [decade, count] : counts) {
        out.push_back(DecadeCount{decade, count});
    }
    return out;
}

} // namespace movielog::algo
