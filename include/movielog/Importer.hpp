#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "movielog/MetadataMatcher.hpp"
#include "movielog/RecordStore.hpp"

namespace movielog {

struct ImportEntry {
    std::size_t line = 0;
    std::string title;
    std::optional<int> yearHint;
    Status status = Status::ToWatch;
    std::optional<double> rating;
    std::optional<Date> dateWatched;
};

struct ImportFailure {
    std::size_t line = 0;
    std::string title;
    std::string message;
};

struct ImportReport {
    std::size_t created = 0;
    std::size_t skipped = 0;
    std::vector<ImportFailure> failures;
};

// One-shot bulk import: title,status,rating,date_watched rows are matched
// against the metadata service and written through the store. Entries that
// already exist are skipped, never overwritten.
class Importer {
public:
    Importer(RecordStore& store, MetadataMatcher& matcher) : store_(store), matcher_(matcher) {}

    ImportReport importCsv(std::istream& in);
    ImportReport importEntries(const std::vector<ImportEntry>& entries);

    // Malformed rows land in `failures`.
    static std::vector<ImportEntry> parseCsv(std::istream& in, std::vector<ImportFailure>& failures);

    // "Parasite (2019)" -> {"Parasite", 2019}; no trailing "(YYYY)" -> no hint.
    static std::pair<std::string, std::optional<int>> splitYearHint(const std::string& text);

    static std::vector<std::string> splitCsvLine(const std::string& line);

private:
    RecordStore& store_;
    MetadataMatcher& matcher_;

    void importOne(const ImportEntry& entry, ImportReport& report);
};

} // namespace movielog
