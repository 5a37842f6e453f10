#include "movielog/Config.hpp"
#include "movielog/Errors.hpp"
#include "movielog/algorithms/StatsAlgorithms.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace movielog {

namespace {

constexpr const char* kDefaultConfigFile = "movielog.json";

template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw MovieLogError(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

bool parseBool(const std::string& v) {
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

template <typename Parse>
void readEnv(const char* name, Parse parse) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return;
    try {
        parse(std::string(raw));
    } catch (const std::exception&) {
        std::cerr << "Config: ignoring unparseable " << name << "=" << raw << "\n";
    }
}

} // namespace

Config Config::load() {
    Config cfg;
    const char* explicitPath = std::getenv("MOVIELOG_CONFIG");
    if (explicitPath && *explicitPath) {
        cfg.applyFile(explicitPath);
    } else if (std::filesystem::exists(kDefaultConfigFile)) {
        cfg.applyFile(kDefaultConfigFile);
    }
    cfg.applyEnvironment();
    return cfg;
}

void Config::applyJson(const json& j) {
    if (!j.is_object()) {
        throw MovieLogError("config: top level must be a JSON object");
    }
    readKey(j, "movies_dir", moviesDir);
    readKey(j, "tmdb_api_key", tmdbApiKey);
    readKey(j, "tmdb_base_url", tmdbBaseUrl);
    readKey(j, "actor_count", actorCount);
    readKey(j, "request_timeout_sec", requestTimeoutSec);
    readKey(j, "preserve_local_edits", preserveLocalEdits);
    readKey(j, "histogram_bucket", histogramBucket);
    readKey(j, "page_size", pageSize);
    if (!algo::isValidBucketWidth(histogramBucket)) {
        throw MovieLogError("config: histogram_bucket must be positive and give at most " +
                            std::to_string(algo::kMaxHistogramBuckets) + " buckets");
    }
    if (pageSize == 0) {
        throw MovieLogError("config: page_size must be positive");
    }
}

void Config::applyFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw MovieLogError("config: cannot open " + path);
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw MovieLogError("config: " + path + " is not valid JSON");
    }
    applyJson(j);
}

void Config::applyEnvironment() {
    readEnv("MOVIELOG_DIR", [&](const std::string& v) { moviesDir = v; });
    readEnv("TMDB_API_KEY", [&](const std::string& v) { tmdbApiKey = v; });
    readEnv("MOVIELOG_TMDB_URL", [&](const std::string& v) { tmdbBaseUrl = v; });
    readEnv("MOVIELOG_ACTOR_COUNT", [&](const std::string& v) {
        actorCount = static_cast<std::size_t>(std::stoull(v));
    });
    readEnv("MOVIELOG_TIMEOUT", [&](const std::string& v) {
        requestTimeoutSec = std::max(1, std::stoi(v));
    });
    readEnv("MOVIELOG_PRESERVE_LOCAL_EDITS", [&](const std::string& v) { preserveLocalEdits = parseBool(v); });
    readEnv("MOVIELOG_HISTOGRAM_BUCKET", [&](const std::string& v) {
        double width = std::stod(v);
        if (!algo::isValidBucketWidth(width)) {
            throw std::invalid_argument("bucket width out of range");
        }
        histogramBucket = width;
    });
    readEnv("MOVIELOG_PAGE_SIZE", [&](const std::string& v) {
        pageSize = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(v)));
    });
}

json Config::toJson() const {
    return json{
        {"movies_dir", moviesDir},
        {"tmdb_api_key", tmdbApiKey.empty() ? "" : "***"},
        {"tmdb_base_url", tmdbBaseUrl},
        {"actor_count", actorCount},
        {"request_timeout_sec", requestTimeoutSec},
        {"preserve_local_edits", preserveLocalEdits},
        {"histogram_bucket", histogramBucket},
        {"page_size", pageSize}
    };
}

} // namespace movielog
