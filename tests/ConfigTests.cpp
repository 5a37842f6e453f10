#include <cstdlib>
#include <fstream>
#include "movielog/Config.hpp"
#include "movielog/Errors.hpp"
#include "TestSupport.hpp"

using json = nlohmann::json;
using movielog::Config;
using testsupport::expect;

static bool rejects(const json& j) {
    Config cfg;
    try {
        cfg.applyJson(j);
    } catch (const movielog::MovieLogError&) {
        return true;
    }
    return false;
}

int main() {
    Config defaults;
    expect(defaults.moviesDir == "movies" && defaults.actorCount == 5, "defaults");
    expect(defaults.preserveLocalEdits && defaults.histogramBucket == 1.0, "default flags");

    Config cfg;
    cfg.applyJson(json{{"movies_dir", "/tmp/films"}, {"actor_count", 3}, {"histogram_bucket", 0.5},
                       {"unknown_key", true}});
    expect(cfg.moviesDir == "/tmp/films" && cfg.actorCount == 3, "keys overlaid");
    expect(cfg.histogramBucket == 0.5, "bucket width overlaid");
    expect(cfg.pageSize == 15, "absent keys keep defaults");

    expect(rejects(json{{"actor_count", "five"}}), "wrong type rejected");
    expect(rejects(json{{"histogram_bucket", 0}}), "zero bucket rejected");
    expect(rejects(json{{"histogram_bucket", 1e-300}}), "bucket width giving too many buckets rejected");
    expect(rejects(json{{"page_size", 0}}), "zero page size rejected");
    expect(rejects(json::array()), "non-object rejected");

    auto dir = testsupport::freshDir("config");
    auto path = (dir / "movielog.json").string();
    {
        std::ofstream out(path);
        out << R"({"tmdb_base_url": "http://localhost:9999", "preserve_local_edits": false})";
    }
    Config fromFile;
    fromFile.applyFile(path);
    expect(fromFile.tmdbBaseUrl == "http://localhost:9999" && !fromFile.preserveLocalEdits, "file applied");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool threw = false;
    try {
        fromFile.applyFile(path);
    } catch (const movielog::MovieLogError&) {
        threw = true;
    }
    expect(threw, "malformed file rejected");

    setenv("MOVIELOG_ACTOR_COUNT", "3", 1);
    setenv("MOVIELOG_TIMEOUT", "abc", 1);
    setenv("TMDB_API_KEY", "secret", 1);
    setenv("MOVIELOG_PRESERVE_LOCAL_EDITS", "off", 1);
    setenv("MOVIELOG_HISTOGRAM_BUCKET", "1e-300", 1);
    Config env;
    env.applyEnvironment();
    expect(env.actorCount == 3, "numeric env applied");
    expect(env.requestTimeoutSec == 10, "unparseable env ignored");
    expect(env.histogramBucket == 1.0, "out-of-range bucket width from env ignored");
    expect(env.tmdbApiKey == "secret" && !env.preserveLocalEdits, "string and bool env applied");

    json shown = env.toJson();
    expect(shown["tmdb_api_key"] == "***", "API key masked");
    expect(shown["actor_count"] == 3, "effective values reported");
    expect(Config{}.toJson()["tmdb_api_key"] == "", "empty key stays empty");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
