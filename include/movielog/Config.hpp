#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace movielog {

struct Config {
    std::string moviesDir = "movies";
    std::string tmdbApiKey;
    std::string tmdbBaseUrl = "https://api.themoviedb.org";
    std::size_t actorCount = 5;
    int requestTimeoutSec = 10;
    bool preserveLocalEdits = true;
    double histogramBucket = 1.0;
    std::size_t pageSize = 15;

    // Defaults, then the JSON file named by MOVIELOG_CONFIG (or movielog.json
    // when present), then MOVIELOG_* / TMDB_API_KEY environment variables.
    static Config load();

    // Overlays the keys present in `j`; throws MovieLogError on a wrong type.
    void applyJson(const nlohmann::json& j);
    void applyFile(const std::string& path);
    void applyEnvironment();

    // Effective configuration; the API key is masked.
    nlohmann::json toJson() const;
};

} // namespace movielog
