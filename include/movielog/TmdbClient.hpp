#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "movielog/MetadataService.hpp"

namespace movielog {

struct TmdbOptions {
    std::string baseUrl = "https://api.themoviedb.org";
    std::string apiKey;
    int timeoutSeconds = 10;
    std::size_t actorCount = 5;
};

// TMDB v3 over cpp-httplib.
class TmdbClient : public MetadataService {
public:
    explicit TmdbClient(TmdbOptions options);

    std::vector<CandidateMetadata> searchTitles(const std::string& query, std::optional<int> year) override;
    CandidateMetadata fetchDetails(const CandidateMetadata& candidate) override;

    // Response mapping, kept separate from transport.
    static std::vector<CandidateMetadata> parseSearchResults(const nlohmann::json& body);
    static CandidateMetadata parseMovieDetails(const nlohmann::json& body, std::size_t actorCount);

private:
    TmdbOptions options_;

    nlohmann::json get(const std::string& path, const std::multimap<std::string, std::string>& params) const;
};

} // namespace movielog
