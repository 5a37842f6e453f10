//MovieLog.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "movielog/Config.hpp"
#include "movielog/Importer.hpp"
#include "movielog/MetadataMatcher.hpp"
#include "movielog/MetadataService.hpp"
#include "movielog/RecordStore.hpp"
#include "movielog/SearchIndex.hpp"
#include "movielog/StatsEngine.hpp"

namespace movielog {

// Wires the store, the metadata matcher and the read-only views together
// for the drivers. Owns the metadata service.
class MovieLog {
public:
    // Uses a TmdbClient built from the config.
    explicit MovieLog(Config config);
    MovieLog(Config config, std::unique_ptr<MetadataService> service);

    MovieLog(const MovieLog&) = delete;
    MovieLog& operator=(const MovieLog&) = delete;

    LoadReport reload();

    // --- Workflows ---

    // Completes the selected candidate and writes it (replacing an entry with
    // the same identity).
    UpsertResult logMovie(const CandidateMetadata& selected,
                          Status status,
                          std::optional<double> rating,
                          std::optional<Date> dateWatched,
                          const std::string& notes);

    // to-watch -> watched. Throws NotFound.
    UpsertResult markWatched(const std::string& title, int year, std::optional<double> rating, Date watchedOn);

    // Re-fetches metadata, honouring preserve_local_edits. Throws NotFound / NoMatch.
    UpsertResult refreshMetadata(const std::string& title, int year);

    void remove(const std::string& title, int year);

    ImportReport importCsv(const std::string& path);

    // --- Components ---
    const Config& config() const { return config_; }
    RecordStore& store() { return store_; }
    const RecordStore& store() const { return store_; }
    MetadataMatcher& matcher() { return matcher_; }
    const SearchIndex& search() const { return search_; }
    const StatsEngine& stats() const { return stats_; }

private:
    Config config_;
    std::unique_ptr<MetadataService> service_;
    RecordStore store_;
    MetadataMatcher matcher_;
    SearchIndex search_;
    StatsEngine stats_;
};

} // namespace movielog
