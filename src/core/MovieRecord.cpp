#include "movielog/MovieRecord.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/Errors.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <unordered_set>

namespace movielog {

namespace {

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return kDays[m - 1];
}

// Empty entries would be dropped on the next read.
std::optional<std::string> findEmptyEntry(const std::vector<std::string>& values, const char* field) {
    for (const auto& v : values) {
        if (v.empty()) return std::string(field) + " must not contain an empty entry";
    }
    return std::nullopt;
}

bool parseFixed(std::string_view text, int& out) {
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc() && res.ptr == text.data() + text.size();
}

std::tm localNow() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return tm;
}

} // namespace

std::string_view statusName(Status status) {
    return status == Status::Watched ? "watched" : "to-watch";
}

std::optional<Status> parseStatus(std::string_view text) {
    if (text == "watched") return Status::Watched;
    if (text == "to-watch") return Status::ToWatch;
    return std::nullopt;
}

std::optional<Date> Date::parse(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    Date d;
    if (!parseFixed(text.substr(0, 4), d.year)) return std::nullopt;
    if (!parseFixed(text.substr(5, 2), d.month)) return std::nullopt;
    if (!parseFixed(text.substr(8, 2), d.day)) return std::nullopt;
    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > daysInMonth(d.year, d.month)) return std::nullopt;
    return d;
}

Date Date::today() {
    std::tm tm = localNow();
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

int latestAllowedYear() {
    return localNow().tm_year + 1900 + 5;
}

RecordIdentity makeIdentity(std::string_view title, int year) {
    return RecordIdentity{Analyzer::normalizeTitle(title), year};
}

RecordIdentity MovieRecord::identity() const {
    return makeIdentity(title, year);
}

bool MovieRecord::operator==(const MovieRecord& other) const {
    return title == other.title &&
           year == other.year &&
           director == other.director &&
           genres == other.genres &&
           runtime == other.runtime &&
           cast == other.cast &&
           status == other.status &&
           rating == other.rating &&
           dateWatched == other.dateWatched &&
           notes == other.notes &&
           tmdbId == other.tmdbId &&
           countries == other.countries &&
           originalLanguage == other.originalLanguage &&
           releaseDate == other.releaseDate &&
           posterPath == other.posterPath &&
           added == other.added;
}

std::optional<std::string> findInvariantViolation(const MovieRecord& record) {
    if (Analyzer::normalizeTitle(record.title).empty()) {
        return std::string("title must contain at least one letter or digit");
    }
    if (record.year < kFirstFilmYear || record.year > latestAllowedYear()) {
        return "year " + std::to_string(record.year) + " outside " +
               std::to_string(kFirstFilmYear) + ".." + std::to_string(latestAllowedYear());
    }
    if (record.runtime < 0) {
        return std::string("runtime must not be negative");
    }
    if (record.director.empty()) {
        return std::string("director must not be empty");
    }
    if (record.rating && (!std::isfinite(*record.rating) || *record.rating < 0.0 || *record.rating > 10.0)) {
        return std::string("rating must be within 0..10");
    }

    if (auto empty = findEmptyEntry(record.genres, "genres")) return empty;
    if (auto empty = findEmptyEntry(record.cast, "actors")) return empty;
    if (auto empty = findEmptyEntry(record.countries, "countries")) return empty;

    std::unordered_set<std::string> seen;
    for (const auto& g : record.genres) {
        if (!seen.insert(g).second) {
            return "duplicate genre '" + g + "'";
        }
    }

    if (record.status == Status::ToWatch) {
        if (record.rating) return std::string("to-watch record must not carry a rating");
        if (record.dateWatched) return std::string("to-watch record must not carry date_watched");
    } else if (!record.rating && !record.dateWatched) {
        return std::string("watched record needs a rating or date_watched");
    }
    return std::nullopt;
}

void validateRecord(const MovieRecord& record) {
    if (auto violation = findInvariantViolation(record)) {
        throw SchemaInvariantViolation(record.title + " (" + std::to_string(record.year) + "): " + *violation);
    }
}

} // namespace movielog
