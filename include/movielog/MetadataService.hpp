#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace movielog {

enum class MatchConfidence { Exact, BestFuzzy };

// One external lookup result. Transient: converted into a MovieRecord before
// anything is persisted.
struct CandidateMetadata {
    int64_t externalId = 0;
    std::string title;
    std::optional<int> year;
    std::string director;
    std::vector<std::string> genres;
    int runtime = 0;
    std::vector<std::string> cast;
    std::vector<std::string> countries;
    std::string originalLanguage;
    std::string releaseDate;
    std::string posterPath;
    std::string overview;
    MatchConfidence confidence = MatchConfidence::BestFuzzy;
};

// External movie database, consumed as an opaque lookup-by-title service.
// Implementations raise ExternalServiceError on transport or auth failure.
class MetadataService {
public:
    virtual ~MetadataService() = default;

    // Candidates in the service's own relevance order.
    virtual std::vector<CandidateMetadata> searchTitles(const std::string& query, std::optional<int> year) = 0;

    // Completes one candidate (credits, runtime, genres, countries).
    virtual CandidateMetadata fetchDetails(const CandidateMetadata& candidate) = 0;
};

} // namespace movielog
