#include "MovieLogMenu.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>

using movielog::Analyzer;
using movielog::MovieRecord;
using movielog::Status;

namespace {

constexpr std::size_t kMaxCandidates = 10;
constexpr int kBarWidth = 25;

std::string label(const MovieRecord& r) {
    return r.title + " (" + std::to_string(r.year) + ")";
}

} // namespace

MovieLogMenu::MovieLogMenu(movielog::MovieLog& app, std::istream& in, std::ostream& out)
    : app_(app), in_(in), out_(out) {}

void MovieLogMenu::run() {
    while (!eof_) {
        out_ << "\n======= MOVIELOG =======\n"
             << "Your personal movie logger. (" << app_.store().size() << " movies loaded)\n\n"
             << "  1. Log a new movie\n"
             << "  2. Browse 'to-watch' list\n"
             << "  3. Stats dashboard\n"
             << "  4. Search your collection\n"
             << "  5. Mark a movie as watched\n"
             << "  6. Refresh metadata\n"
             << "  7. Delete a movie\n"
             << "  8. Import from CSV\n"
             << "  q. Quit\n";
        auto choice = prompt("\nWhat would you like to do? ");
        if (!choice) break;

        try {
            if (*choice == "1") logMovie();
            else if (*choice == "2") browseToWatch();
            else if (*choice == "3") showStats();
            else if (*choice == "4") searchMenu();
            else if (*choice == "5") markWatched();
            else if (*choice == "6") refreshMetadata();
            else if (*choice == "7") deleteMovie();
            else if (*choice == "8") importFile();
            else if (*choice == "q") break;
        } catch (const std::exception& e) {
            printError(e);
        }
    }
    out_ << "Happy movie watching!\n";
}

// -----------------------------------------------------------
// Actions
// -----------------------------------------------------------
void MovieLogMenu::logMovie() {
    auto query = prompt("Enter movie title: ");
    if (!query || query->empty()) return;

    auto [title, yearHint] = movielog::Importer::splitYearHint(*query);
    auto candidates = app_.matcher().candidates(title, yearHint);
    if (candidates.empty()) {
        out_ << "No movies found.\n";
        return;
    }
    if (candidates.size() > kMaxCandidates) candidates.resize(kMaxCandidates);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        out_ << "  " << (i + 1) << ": " << c.title << " ("
             << (c.year ? std::to_string(*c.year) : std::string("N/A")) << ")\n";
    }

    auto pick = prompt("\nEnter number: ");
    if (!pick) return;
    std::size_t index = 0;
    try {
        index = std::stoul(*pick);
    } catch (const std::exception&) {
        out_ << "Not a number.\n";
        return;
    }
    if (index < 1 || index > candidates.size()) {
        out_ << "No such entry.\n";
        return;
    }

    auto statusText = prompt("Status (w/watched or tw/to-watch): ");
    if (!statusText) return;
    Status status = (*statusText == "w" || *statusText == "watched") ? Status::Watched : Status::ToWatch;

    std::optional<double> rating;
    std::optional<movielog::Date> watchedOn;
    if (status == Status::Watched) {
        rating = promptRating();
        watchedOn = movielog::Date::today();
    }

    std::string notes;
    auto addNotes = prompt("Add notes? (y/n): ");
    if (addNotes && (*addNotes == "y" || *addNotes == "yes")) {
        out_ << "Enter notes. Press Enter on an empty line to finish.\n";
        std::string line;
        while (std::getline(in_, line) && !line.empty()) {
            notes += line + "\n";
        }
    }

    auto result = app_.logMovie(candidates[index - 1], status, rating, watchedOn, notes);
    out_ << (result.created ? "Created " : "Updated ") << result.path.filename().string() << "\n";
}

void MovieLogMenu::browseToWatch() {
    showRecords("Your 'to-watch' list", app_.stats().toWatchList());
}

void MovieLogMenu::showStats() {
    const auto summary = app_.stats().summary();
    if (summary.watched == 0) {
        out_ << "No 'watched' movies found to generate stats.\n";
        return;
    }

    while (!eof_) {
        out_ << "\n--- Your movie stats ---\n"
             << std::fixed
             << "  Movies watched:   " << summary.watched << "\n"
             << "  Total watch time: " << std::setprecision(1) << summary.totalHours << " hours\n"
             << "  Average rating:   " << std::setprecision(2) << summary.averageRating << " / 10\n"
             << std::defaultfloat;

        out_ << "\n  Rating distribution\n";
        auto histogram = app_.stats().ratingHistogram(app_.config().histogramBucket);
        std::size_t maxCount = 0;
        for (const auto& b : histogram) maxCount = std::max(maxCount, b.count);
        for (const auto& b : histogram) {
            int bar = maxCount == 0 ? 0 : static_cast<int>(b.count * kBarWidth / maxCount);
            out_ << "  [" << std::setw(4) << b.lower << ", " << std::setw(4) << b.upper << ") | "
                 << std::string(static_cast<std::size_t>(bar), '#') << " (" << b.count << ")\n";
        }

        out_ << "\n  1. Top genres\n  2. Top directors\n  3. Movies by decade\n  4. Recently watched\n  b. Back\n";
        auto choice = prompt("\nSelect an option: ");
        if (!choice || *choice == "b") return;

        std::vector<std::pair<std::string, std::size_t>> rows;
        if (*choice == "1") {
            for (const auto& e : app_.stats().genreDistribution()) rows.emplace_back(e.key, e.count);
            showCounts("Top genres", rows);
        } else if (*choice == "2") {
            for (const auto& e : app_.stats().topDirectors(app_.store().size())) rows.emplace_back(e.key, e.count);
            showCounts("Top directors", rows);
        } else if (*choice == "3") {
            for (const auto& d : app_.stats().byDecade()) rows.emplace_back(std::to_string(d.decade) + "s", d.count);
            showCounts("Movies by decade", rows);
        } else if (*choice == "4") {
            showRecords("Recently watched", app_.stats().recentlyWatched(app_.store().size()));
        }
    }
}

void MovieLogMenu::searchMenu() {
    while (!eof_) {
        out_ << "\n======= MOVIE SEARCH =======\n"
             << "  1. Search by title\n"
             << "  2. Search by director\n"
             << "  3. Search by actor\n"
             << "  4. Search by genre\n"
             << "  5. Keyword search\n"
             << "  6. Filter by status\n"
             << "  b. Back\n";
        auto choice = prompt("\nSelect a search method: ");
        if (!choice || *choice == "b") return;

        movielog::SearchFilters filters;
        std::string query;
        if (*choice == "6") {
            auto s = prompt("Status (watched/to-watch): ");
            if (!s) return;
            auto status = movielog::parseStatus(*s);
            if (!status) {
                out_ << "Unknown status.\n";
                continue;
            }
            filters.status = status;
            query = *s;
        } else {
            static const char* const kLabels[] = {"title", "director", "actor", "genre", "keyword"};
            int idx = (*choice)[0] - '1';
            if (choice->size() != 1 || idx < 0 || idx > 4) continue;
            auto q = prompt(std::string("Enter ") + kLabels[idx] + ": ");
            if (!q || q->empty()) continue;
            query = *q;
            switch (idx) {
            case 0: filters.title = query; break;
            case 1: filters.director = query; break;
            case 2: filters.actor = query; break;
            case 3: filters.genre = query; break;
            default: filters.keyword = query; break;
            }
        }
        showRecords("Search results for '" + query + "'", app_.search().search(filters));
    }
}

void MovieLogMenu::markWatched() {
    auto id = promptIdentity();
    if (!id) return;
    auto rating = promptRating();
    auto result = app_.markWatched(id->first, id->second, rating, movielog::Date::today());
    out_ << "Marked " << label(result.record) << " as watched.\n";
}

void MovieLogMenu::refreshMetadata() {
    auto id = promptIdentity();
    if (!id) return;
    auto result = app_.refreshMetadata(id->first, id->second);
    out_ << "Refreshed " << label(result.record) << ".\n";
}

void MovieLogMenu::deleteMovie() {
    auto id = promptIdentity();
    if (!id) return;
    auto confirm = prompt("Delete '" + id->first + "' (" + std::to_string(id->second) + ")? (y/n): ");
    if (!confirm || *confirm != "y") return;
    app_.remove(id->first, id->second);
    out_ << "Deleted.\n";
}

void MovieLogMenu::importFile() {
    auto path = prompt("CSV file (title,status,rating,date_watched): ");
    if (!path || path->empty()) return;
    auto report = app_.importCsv(*path);
    out_ << "Created " << report.created << ", skipped " << report.skipped
         << ", failed " << report.failures.size() << "\n";
    for (const auto& f : report.failures) {
        out_ << "  line " << f.line << " '" << f.title << "': " << f.message << "\n";
    }
}

// -----------------------------------------------------------
// Listing helpers
// -----------------------------------------------------------
void MovieLogMenu::showRecords(const std::string& title, const std::vector<MovieRecord>& records) {
    if (records.empty()) {
        out_ << "No data available for '" << title << "'\n";
        return;
    }
    const std::size_t pageSize = app_.config().pageSize;
    const std::size_t pages = (records.size() + pageSize - 1) / pageSize;
    std::size_t page = 0;

    while (!eof_) {
        out_ << "\n--- " << title << " ---\nPage " << (page + 1) << " of " << pages << "\n\n";
        const std::size_t start = page * pageSize;
        const std::size_t end = std::min(records.size(), start + pageSize);
        for (std::size_t i = start; i < end; ++i) {
            out_ << "  " << std::setw(3) << (i + 1) << ". " << label(records[i]) << "\n";
        }

        auto choice = prompt("\n[n]ext, [p]rev, [q]uit, or # to view details: ");
        if (!choice || *choice == "q") return;
        if (*choice == "n" && page + 1 < pages) {
            ++page;
        } else if (*choice == "p" && page > 0) {
            --page;
        } else {
            std::size_t n = 0;
            try {
                n = std::stoul(*choice);
            } catch (const std::exception&) {
                continue;
            }
            if (n <= start || n > end) continue;
            const auto& r = records[n - 1];
            std::ifstream doc(app_.store().pathOf(r.title, r.year));
            out_ << "\n--- Details for: " << r.title << " ---\n"
                 << std::string(std::istreambuf_iterator<char>(doc), std::istreambuf_iterator<char>()) << "\n";
            prompt("Press Enter to return to the list...");
        }
    }
}

void MovieLogMenu::showCounts(const std::string& title, const std::vector<std::pair<std::string, std::size_t>>& rows) {
    if (rows.empty()) {
        out_ << "No data available for '" << title << "'\n";
        return;
    }
    out_ << "\n--- " << title << " ---\n";
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out_ << "  " << std::setw(3) << (i + 1) << ". " << std::left << std::setw(30) << rows[i].first
             << std::right << " (" << rows[i].second << ")\n";
    }
    prompt("\nPress Enter to continue...");
}

// -----------------------------------------------------------
// Input helpers
// -----------------------------------------------------------
std::optional<std::string> MovieLogMenu::prompt(const std::string& text) {
    out_ << text << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        eof_ = true;
        return std::nullopt;
    }
    return Analyzer::trim(line);
}

std::optional<std::pair<std::string, int>> MovieLogMenu::promptIdentity() {
    auto title = prompt("Title: ");
    if (!title || title->empty()) return std::nullopt;
    auto year = prompt("Year: ");
    if (!year) return std::nullopt;
    try {
        return std::make_pair(*title, std::stoi(*year));
    } catch (const std::exception&) {
        out_ << "Year must be a number.\n";
        return std::nullopt;
    }
}

std::optional<double> MovieLogMenu::promptRating() {
    auto text = prompt("Rating (0-10, blank for none): ");
    if (!text || text->empty()) return std::nullopt;
    try {
        return std::stod(*text);
    } catch (const std::exception&) {
        out_ << "Not a number; leaving the rating empty.\n";
        return std::nullopt;
    }
}

void MovieLogMenu::printError(const std::exception& e) {
    out_ << "Error: " << e.what() << "\n";
}
