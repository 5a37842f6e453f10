#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace movielog {

enum class Status { ToWatch, Watched };

std::string_view statusName(Status status);
std::optional<Status> parseStatus(std::string_view text);

struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    // Strict YYYY-MM-DD; nullopt on anything else or an impossible day.
    static std::optional<Date> parse(std::string_view text);
    static Date today();

    std::string toString() const;

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

struct RecordIdentity {
    std::string title; // normalized
    int year = 0;

    bool operator==(const RecordIdentity& other) const {
        return year == other.year && title == other.title;
    }
    bool operator!=(const RecordIdentity& other) const { return !(*this == other); }
};

inline constexpr std::string_view kUnknownDirector = "Unknown";
inline constexpr int kFirstFilmYear = 1888;

struct MovieRecord {
    std::string title;
    int year = 0;
    std::string director{kUnknownDirector};
    std::vector<std::string> genres;
    int runtime = 0;
    std::vector<std::string> cast;
    Status status = Status::ToWatch;
    std::optional<double> rating;
    std::optional<Date> dateWatched;
    std::string notes;

    // Enrichment carried over from the metadata source.
    std::optional<int64_t> tmdbId;
    std::vector<std::string> countries;
    std::string originalLanguage;
    std::string releaseDate;
    std::string posterPath;

    // Creation sequence; 0 means not yet assigned by a store.
    uint64_t added = 0;

    RecordIdentity identity() const;

    bool operator==(const MovieRecord& other) const;
    bool operator!=(const MovieRecord& other) const { return !(*this == other); }
};

RecordIdentity makeIdentity(std::string_view title, int year);

// Describes the first schema invariant the record breaks, or nullopt.
std::optional<std::string> findInvariantViolation(const MovieRecord& record);

// Throws SchemaInvariantViolation when findInvariantViolation() reports one.
void validateRecord(const MovieRecord& record);

int latestAllowedYear();

} // namespace movielog
