#pragma once

#include <optional>
#include <string>
#include <vector>
#include "movielog/MetadataService.hpp"
#include "movielog/MovieRecord.hpp"

namespace movielog {

// Picks one external candidate for a title query and maps it onto the
// record schema. One search per match; no retries, no re-ranking.
class MetadataMatcher {
public:
    explicit MetadataMatcher(MetadataService& service, std::size_t actorCount = 5);

    // Throws NoMatch when the service returns no candidates.
    CandidateMetadata match(const std::string& query, std::optional<int> yearHint);

    // Raw candidates, service order, for interactive selection.
    std::vector<CandidateMetadata> candidates(const std::string& query, std::optional<int> yearHint);

    // Fetches credits and details for an already selected candidate.
    CandidateMetadata complete(const CandidateMetadata& candidate);

    // Year-hint preference over an already fetched list; nullopt when empty.
    static std::optional<CandidateMetadata> select(const std::vector<CandidateMetadata>& candidates,
                                                   const std::string& query,
                                                   std::optional<int> yearHint);

    MovieRecord toRecord(const CandidateMetadata& candidate,
                         Status status,
                         std::optional<double> rating,
                         std::optional<Date> dateWatched,
                         std::string notes,
                         std::optional<int> yearHint = std::nullopt) const;

    // Fresh metadata over an existing record; identity and viewing state are kept.
    MovieRecord refresh(const MovieRecord& existing,
                        const CandidateMetadata& candidate,
                        bool preserveLocalEdits) const;

private:
    MetadataService& service_;
    std::size_t actorCount_;
};

} // namespace movielog
