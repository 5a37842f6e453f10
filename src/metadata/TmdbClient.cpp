#include "movielog/TmdbClient.hpp"
#include "movielog/Errors.hpp"

#include <charconv>
#include <iostream>
#include "httplib.h"

using json = nlohmann::json;

namespace movielog {

namespace {

constexpr const char* kApiPrefix = "/3";

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<int> yearOf(const std::string& releaseDate) {
    if (releaseDate.size() < 4) return std::nullopt;
    int year = 0;
    auto res = std::from_chars(releaseDate.data(), releaseDate.data() + 4, year);
    if (res.ec != std::errc() || res.ptr != releaseDate.data() + 4) return std::nullopt;
    return year;
}

std::vector<std::string> names(const json& j, const char* key, const char* nameKey) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (!item.is_object()) continue;
        std::string name = stringField(item, nameKey);
        if (!name.empty()) out.push_back(std::move(name));
    }
    return out;
}

} // namespace

TmdbClient::TmdbClient(TmdbOptions options) : options_(std::move(options)) {}

std::vector<CandidateMetadata> TmdbClient::searchTitles(const std::string& query, std::optional<int> year) {
    std::multimap<std::string, std::string> params{{"query", query}};
    if (year) {
        params.emplace("year", std::to_string(*year));
    }
    return parseSearchResults(get(std::string(kApiPrefix) + "/search/movie", params));
}

CandidateMetadata TmdbClient::fetchDetails(const CandidateMetadata& candidate) {
    json body = get(std::string(kApiPrefix) + "/movie/" + std::to_string(candidate.externalId),
                    {{"append_to_response", "credits"}});
    CandidateMetadata details = parseMovieDetails(body, options_.actorCount);
    details.confidence = candidate.confidence;
    if (details.title.empty()) details.title = candidate.title;
    if (!details.year) details.year = candidate.year;
    if (details.overview.empty()) details.overview = candidate.overview;
    return details;
}

json TmdbClient::get(const std::string& path, const std::multimap<std::string, std::string>& params) const {
    if (options_.apiKey.empty()) {
        throw ExternalServiceError("TMDB API key is not configured (set TMDB_API_KEY)");
    }

    httplib::Client cli(options_.baseUrl);
    if (!cli.is_valid()) {
        throw ExternalServiceError("TMDB base URL is not usable: " + options_.baseUrl);
    }
    cli.set_connection_timeout(options_.timeoutSeconds, 0);
    cli.set_read_timeout(options_.timeoutSeconds, 0);
    cli.set_follow_location(true);

    httplib::Params query(params.begin(), params.end());
    query.emplace("api_key", options_.apiKey);
    httplib::Headers headers{{"Accept", "application/json"}};

    auto res = cli.Get(path, query, headers);
    if (!res) {
        throw ExternalServiceError("TMDB request " + path + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 401) {
        throw ExternalServiceError("TMDB rejected the API key (HTTP 401)");
    }
    if (res->status != 200) {
        throw ExternalServiceError("TMDB request " + path + " returned HTTP " + std::to_string(res->status));
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw ExternalServiceError("TMDB returned a malformed response for " + path);
    }
    return body;
}

std::vector<CandidateMetadata> TmdbClient::parseSearchResults(const json& body) {
    std::vector<CandidateMetadata> out;
    auto results = body.find("results");
    if (results == body.end() || !results->is_array()) return out;

    for (const auto& item : *results) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_integer()) {
            std::cerr << "TmdbClient: skipping search result without id\n";
            continue;
        }
        CandidateMetadata c;
        c.externalId = item["id"].get<int64_t>();
        c.title = stringField(item, "title");
        c.releaseDate = stringField(item, "release_date");
        c.year = yearOf(c.releaseDate);
        c.overview = stringField(item, "overview");
        c.originalLanguage = stringField(item, "original_language");
        c.posterPath = stringField(item, "poster_path");
        out.push_back(std::move(c));
    }
    return out;
}

CandidateMetadata TmdbClient::parseMovieDetails(const json& body, std::size_t actorCount) {
    CandidateMetadata c;
    if (body.contains("id") && body["id"].is_number_integer()) {
        c.externalId = body["id"].get<int64_t>();
    }
    c.title = stringField(body, "title");
    c.releaseDate = stringField(body, "release_date");
    c.year = yearOf(c.releaseDate);
    c.overview = stringField(body, "overview");
    c.originalLanguage = stringField(body, "original_language");
    c.posterPath = stringField(body, "poster_path");
    if (body.contains("runtime") && body["runtime"].is_number_integer()) {
        c.runtime = body["runtime"].get<int>();
    }
    c.genres = names(body, "genres", "name");
    c.countries = names(body, "production_countries", "name");

    auto credits = body.find("credits");
    if (credits != body.end() && credits->is_object()) {
        auto crew = credits->find("crew");
        if (crew != credits->end() && crew->is_array()) {
            for (const auto& member : *crew) {
                if (member.is_object() && stringField(member, "job") == "Director") {
                    c.director = stringField(member, "name");
                    break;
                }
            }
        }
        c.cast = names(*credits, "cast", "name");
        if (c.cast.size() > actorCount) c.cast.resize(actorCount);
    }
    return c;
}

} // namespace movielog
