//MovieLog.cpp
#include "MovieLog.hpp"
#include "movielog/Errors.hpp"
#include "movielog/TmdbClient.hpp"

#include <fstream>
#include <iostream>

namespace movielog {

namespace {

std::unique_ptr<MetadataService> makeTmdbClient(const Config& config) {
    TmdbOptions options;
    options.baseUrl = config.tmdbBaseUrl;
    options.apiKey = config.tmdbApiKey;
    options.timeoutSeconds = config.requestTimeoutSec;
    options.actorCount = config.actorCount;
    return std::make_unique<TmdbClient>(std::move(options));
}

} // namespace

// -----------------------------------------------------------
// CTOR
// -----------------------------------------------------------
MovieLog::MovieLog(Config config)
    : MovieLog(config, makeTmdbClient(config)) {}

MovieLog::MovieLog(Config config, std::unique_ptr<MetadataService> service)
    : config_(std::move(config)),
      service_(std::move(service)),
      store_(config_.moviesDir),
      matcher_(*service_, config_.actorCount),
      search_(store_),
      stats_(store_) {
    std::cerr << "MovieLog: config=" << config_.toJson().dump() << "\n";
}

LoadReport MovieLog::reload() {
    return store_.load();
}

// -----------------------------------------------------------
// Workflows
// -----------------------------------------------------------
UpsertResult MovieLog::logMovie(const CandidateMetadata& selected,
                                Status status,
                                std::optional<double> rating,
                                std::optional<Date> dateWatched,
                                const std::string& notes) {
    CandidateMetadata details = matcher_.complete(selected);
    MovieRecord record = matcher_.toRecord(details, status, rating, dateWatched, notes);
    return store_.upsert(std::move(record));
}

UpsertResult MovieLog::markWatched(const std::string& title, int year, std::optional<double> rating, Date watchedOn) {
    MovieRecord record = store_.findByIdentity(title, year);
    record.status = Status::Watched;
    record.rating = rating;
    record.dateWatched = watchedOn;
    return store_.upsert(std::move(record));
}

UpsertResult MovieLog::refreshMetadata(const std::string& title, int year) {
    MovieRecord existing = store_.findByIdentity(title, year);

    CandidateMetadata candidate;
    if (existing.tmdbId) {
        CandidateMetadata known;
        known.externalId = *existing.tmdbId;
        known.title = existing.title;
        known.year = existing.year;
        candidate = matcher_.complete(known);
    } else {
        candidate = matcher_.match(existing.title, existing.year);
    }
    return store_.upsert(matcher_.refresh(existing, candidate, config_.preserveLocalEdits));
}

void MovieLog::remove(const std::string& title, int year) {
    store_.remove(title, year);
}

ImportReport MovieLog::importCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw MovieLogError("cannot open import file " + path);
    }
    Importer importer(store_, matcher_);
    return importer.importCsv(in);
}

} // namespace movielog
