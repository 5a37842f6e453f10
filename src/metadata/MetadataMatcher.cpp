#include "movielog/MetadataMatcher.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/Errors.hpp"

#include <algorithm>
#include <unordered_set>

namespace movielog {

namespace {

std::vector<std::string> uniqueInOrder(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& v : values) {
        std::string t = Analyzer::trim(v);
        if (t.empty()) continue;
        if (seen.insert(t).second) out.push_back(std::move(t));
    }
    return out;
}

std::string describeQuery(const std::string& query, std::optional<int> yearHint) {
    std::string out = "'" + query + "'";
    if (yearHint) out += " (" + std::to_string(*yearHint) + ")";
    return out;
}

} // namespace

MetadataMatcher::MetadataMatcher(MetadataService& service, std::size_t actorCount)
    : service_(service), actorCount_(actorCount) {}

std::vector<CandidateMetadata> MetadataMatcher::candidates(const std::string& query, std::optional<int> yearHint) {
    return service_.searchTitles(query, yearHint);
}

std::optional<CandidateMetadata> MetadataMatcher::select(const std::vector<CandidateMetadata>& candidates,
                                                         const std::string& query,
                                                         std::optional<int> yearHint) {
    if (candidates.empty()) return std::nullopt;

    auto chosen = candidates.begin();
    bool yearMatched = false;
    if (yearHint) {
        // First in service order wins among equal years.
        auto it = std::find_if(candidates.begin(), candidates.end(), [&](const CandidateMetadata& c) {
            return c.year && *c.year == *yearHint;
        });
        if (it != candidates.end()) {
            chosen = it;
            yearMatched = true;
        }
    }

    CandidateMetadata result = *chosen;
    const bool titleMatched = Analyzer::normalizeTitle(result.title) == Analyzer::normalizeTitle(query);
    result.confidence = titleMatched && (!yearHint || yearMatched) ? MatchConfidence::Exact
                                                                    : MatchConfidence::BestFuzzy;
    return result;
}

CandidateMetadata MetadataMatcher::match(const std::string& query, std::optional<int> yearHint) {
    auto chosen = select(service_.searchTitles(query, yearHint), query, yearHint);
    if (!chosen) {
        throw NoMatch("no metadata found for " + describeQuery(query, yearHint));
    }
    return complete(*chosen);
}

CandidateMetadata MetadataMatcher::complete(const CandidateMetadata& candidate) {
    CandidateMetadata details = service_.fetchDetails(candidate);
    details.confidence = candidate.confidence;
    return details;
}

MovieRecord MetadataMatcher::toRecord(const CandidateMetadata& candidate,
                                      Status status,
                                      std::optional<double> rating,
                                      std::optional<Date> dateWatched,
                                      std::string notes,
                                      std::optional<int> yearHint) const {
    std::optional<int> year = candidate.year ? candidate.year : yearHint;
    if (!year) {
        throw NoMatch("candidate '" + candidate.title + "' has no release year");
    }

    MovieRecord r;
    r.title = Analyzer::trim(candidate.title);
    r.year = *year;
    std::string director = Analyzer::trim(candidate.director);
    r.director = director.empty() ? std::string(kUnknownDirector) : director;
    r.genres = uniqueInOrder(candidate.genres);
    r.runtime = std::max(0, candidate.runtime);
    r.cast = uniqueInOrder(candidate.cast);
    if (r.cast.size() > actorCount_) r.cast.resize(actorCount_);
    r.status = status;
    r.rating = rating;
    r.dateWatched = dateWatched;
    r.notes = std::move(notes);
    if (candidate.externalId != 0) r.tmdbId = candidate.externalId;
    r.countries = uniqueInOrder(candidate.countries);
    r.originalLanguage = candidate.originalLanguage;
    r.releaseDate = candidate.releaseDate;
    r.posterPath = candidate.posterPath;
    return r;
}

MovieRecord MetadataMatcher::refresh(const MovieRecord& existing,
                                     const CandidateMetadata& candidate,
                                     bool preserveLocalEdits) const {
    MovieRecord fresh = toRecord(candidate, existing.status, existing.rating, existing.dateWatched,
                                 preserveLocalEdits ? existing.notes : candidate.overview,
                                 existing.year);
    fresh.title = existing.title;
    fresh.year = existing.year;
    fresh.added = existing.added;
    return fresh;
}

} // namespace movielog
