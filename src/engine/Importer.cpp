#include "movielog/Importer.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/Errors.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <iostream>
#include <tuple>

namespace movielog {

namespace {

std::optional<double> parseRating(const std::string& text) {
    double value = 0.0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::pair<std::string, std::optional<int>> Importer::splitYearHint(const std::string& text) {
    std::string trimmed = Analyzer::trim(text);
    // Shortest form is "X (1999)".
    if (trimmed.size() >= 7 && trimmed.back() == ')') {
        size_t open = trimmed.size() - 6;
        bool digits = trimmed[open] == '(';
        for (size_t i = open + 1; digits && i < trimmed.size() - 1; ++i) {
            digits = std::isdigit(static_cast<unsigned char>(trimmed[i])) != 0;
        }
        if (digits) {
            std::string title = Analyzer::trim(std::string_view(trimmed).substr(0, open));
            if (!title.empty()) {
                return {title, std::stoi(trimmed.substr(open + 1, 4))};
            }
        }
    }
    return {trimmed, std::nullopt};
}

std::vector<std::string> Importer::splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(Analyzer::trim(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    cells.push_back(Analyzer::trim(current));
    return cells;
}

std::vector<ImportEntry> Importer::parseCsv(std::istream& in, std::vector<ImportFailure>& failures) {
    std::vector<ImportEntry> entries;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        auto cells = splitCsvLine(line);
        if (cells.empty() || cells[0].empty()) continue;
        if (lineNo == 1 && Analyzer::equalsIgnoreCase(cells[0], "title")) continue;

        ImportEntry entry;
        entry.line = lineNo;
        std::tie(entry.title, entry.yearHint) = splitYearHint(cells[0]);

        auto fail = [&](const std::string& msg) {
            failures.push_back(ImportFailure{lineNo, entry.title, msg});
        };

        if (cells.size() > 1 && !cells[1].empty()) {
            auto status = parseStatus(Analyzer::toLower(cells[1]));
            if (!status) {
                fail("unknown status '" + cells[1] + "'");
                continue;
            }
            entry.status = *status;
        }
        if (cells.size() > 2 && !cells[2].empty()) {
            entry.rating = parseRating(cells[2]);
            if (!entry.rating) {
                fail("rating '" + cells[2] + "' is not a number");
                continue;
            }
        }
        if (cells.size() > 3 && !cells[3].empty()) {
            entry.dateWatched = Date::parse(cells[3]);
            if (!entry.dateWatched) {
                fail("date_watched '" + cells[3] + "' is not a YYYY-MM-DD date");
                continue;
            }
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

ImportReport Importer::importCsv(std::istream& in) {
    std::vector<ImportFailure> failures;
    auto entries = parseCsv(in, failures);
    ImportReport report = importEntries(entries);
    report.failures.insert(report.failures.begin(), failures.begin(), failures.end());
    return report;
}

ImportReport Importer::importEntries(const std::vector<ImportEntry>& entries) {
    ImportReport report;
    for (const auto& entry : entries) {
        try {
            importOne(entry, report);
        } catch (const MovieLogError& e) {
            std::cerr << "Importer: line " << entry.line << " '" << entry.title << "': " << e.what() << "\n";
            report.failures.push_back(ImportFailure{entry.line, entry.title, e.what()});
        }
    }
    std::cerr << "Importer: created " << report.created << ", skipped " << report.skipped
              << ", failed " << report.failures.size() << "\n";
    return report;
}

void Importer::importOne(const ImportEntry& entry, ImportReport& report) {
    if (entry.yearHint && store_.contains(entry.title, *entry.yearHint)) {
        ++report.skipped;
        return;
    }

    CandidateMetadata candidate = matcher_.match(entry.title, entry.yearHint);
    if (store_.findByExternalId(candidate.externalId)) {
        ++report.skipped;
        return;
    }

    MovieRecord record = matcher_.toRecord(candidate, entry.status, entry.rating, entry.dateWatched,
                                           candidate.overview, entry.yearHint);
    if (store_.contains(record.title, record.year)) {
        ++report.skipped;
        return;
    }
    store_.upsert(std::move(record));
    ++report.created;
}

} // namespace movielog
