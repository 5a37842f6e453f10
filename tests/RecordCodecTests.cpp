#include "movielog/Errors.hpp"
#include "movielog/RecordCodec.hpp"
#include "TestSupport.hpp"

#include <cmath>
#include <string>

using movielog::Date;
using movielog::MovieRecord;
using movielog::ParseError;
using movielog::RecordCodec;
using movielog::Status;
using testsupport::expect;

static bool decodeFails(const std::string& text) {
    try {
        RecordCodec::decode(text);
    } catch (const ParseError&) {
        return true;
    }
    return false;
}

static std::string header(const std::string& body) {
    return "---\n" + body + "---\n";
}

int main() {
    // Round trip: a fully populated watched record with characters that need escaping.
    MovieRecord full = testsupport::watched("He said \"hi\" \\ bye", 2019, "Bong Joon Ho", {"Comedy", "Thriller"}, 8.5,
                                            Date{2024, 3, 1});
    full.runtime = 132;
    full.cast = {"Song Kang-ho", "Choi \"Woo-shik\""};
    full.notes = "First line\n---\nA line that looks like a delimiter.\n";
    full.tmdbId = 496243;
    full.countries = {"South Korea"};
    full.originalLanguage = "KO";
    full.releaseDate = "2019-05-30";
    full.posterPath = "https://image.tmdb.org/t/p/w500/x.jpg";
    full.added = 7;
    std::string doc = RecordCodec::encode(full);
    expect(RecordCodec::decode(doc) == full, "full record should survive encode/decode");
    expect(RecordCodec::encode(RecordCodec::decode(doc)) == doc, "encoding is deterministic");

    // Dashboard fields use the expected names.
    expect(doc.find("\ndirector: \"Bong Joon Ho\"\n") != std::string::npos, "director key");
    expect(doc.find("\nyear: 2019\n") != std::string::npos, "year key");
    expect(doc.find("\ngenres:\n  - \"Comedy\"\n  - \"Thriller\"\n") != std::string::npos, "genres as list");
    expect(doc.find("\nstatus: \"watched\"\n") != std::string::npos, "status key");
    expect(doc.find("\nrating: 8.5\n") != std::string::npos, "rating key");
    expect(doc.find("\ndate_watched: 2024-03-01\n") != std::string::npos, "date_watched key");

    // Round trip: minimal to-watch record, empty lists and notes.
    MovieRecord minimal = testsupport::toWatch("Alien", 1979);
    expect(RecordCodec::decode(RecordCodec::encode(minimal)) == minimal, "minimal record round trip");

    // Round trip: awkward ratings and a watched record with only a date.
    MovieRecord odd = testsupport::watched("Heat", 1995, "Michael Mann", {}, 0.1);
    expect(RecordCodec::decode(RecordCodec::encode(odd)) == odd, "rating 0.1 round trip");
    odd.rating = 7.0;
    expect(RecordCodec::decode(RecordCodec::encode(odd)) == odd, "integral rating round trip");
    odd.rating.reset();
    expect(RecordCodec::decode(RecordCodec::encode(odd)) == odd, "watched without rating round trip");

    // Required fields.
    expect(decodeFails(header("year: 2000\nstatus: \"to-watch\"\n")), "missing title");
    expect(decodeFails(header("title: \"X\"\nstatus: \"to-watch\"\n")), "missing year");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\n")), "missing status");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"seen\"\n")), "unknown status");
    expect(decodeFails(header("title: \"X\"\nyear: two\nstatus: \"to-watch\"\n")), "non-numeric year");
    expect(decodeFails(header("title: \"X\"\nyear: 1700\nstatus: \"to-watch\"\n")), "year before cinema");

    // Schema invariants.
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"to-watch\"\nrating: 5\n")),
           "rating on a to-watch record");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"to-watch\"\ndate_watched: 2024-01-01\n")),
           "date_watched on a to-watch record");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"watched\"\n")),
           "watched record with neither rating nor date");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"watched\"\nrating: 11\n")), "rating above 10");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"watched\"\ndate_watched: 2024-02-30\n")),
           "impossible date");
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nstatus: \"to-watch\"\ngenres:\n  - \"Drama\"\n  - \"Drama\"\n")),
           "duplicate genres");

    // Escapes and structure.
    expect(decodeFails(header("title: \"bad \\q escape\"\nyear: 2000\nstatus: \"to-watch\"\n")), "unknown escape");
    expect(decodeFails(header("title: \"dangling \\\"\nyear: 2000\nstatus: \"to-watch\"\n")), "dangling backslash");
    expect(decodeFails(header("title: \"open\nyear: 2000\nstatus: \"to-watch\"\n")), "unterminated quote");
    expect(decodeFails("title: \"X\"\nyear: 2000\nstatus: \"to-watch\"\n"), "no opening delimiter");
    expect(decodeFails("---\ntitle: \"X\"\nyear: 2000\nstatus: \"to-watch\"\n"), "no closing delimiter");
    expect(decodeFails(header("title: \"X\"\ntitle: \"Y\"\nyear: 2000\nstatus: \"to-watch\"\n")), "duplicate key");
    expect(decodeFails(header("  - orphan\ntitle: \"X\"\nyear: 2000\nstatus: \"to-watch\"\n")), "list item without key");

    expect(RecordCodec::unquote("\"a\\tb\\nc\"") == "a\tb\nc", "unquote escapes");
    expect(RecordCodec::quote("a\"b") == "\"a\\\"b\"", "quote escapes quotes");
    bool threw = false;
    try {
        RecordCodec::unquote("\"x\\z\"");
    } catch (const ParseError&) {
        threw = true;
    }
    expect(threw, "unquote rejects unknown escape");

    // Path travels with the error.
    try {
        RecordCodec::decode("not a document", "movies/Broken-2000.md");
        expect(false, "decode should have thrown");
    } catch (const ParseError& e) {
        expect(e.path() == "movies/Broken-2000.md", "ParseError carries the path");
    }

    // Documents written by hand or by older tooling: bare scalars, CRLF, blank optional values.
    const std::string legacy =
        "---\r\n"
        "title: \"Parasite\"\r\n"
        "year: 2019\r\n"
        "director: \"Bong Joon Ho\"\r\n"
        "runtime: 132\r\n"
        "genres:\r\n"
        "  - Comedy\r\n"
        "  - Thriller\r\n"
        "rating: 9.0\r\n"
        "status: \"watched\"\r\n"
        "date_watched: 2024-01-05\r\n"
        "actors:\r\n"
        "  - Song Kang-ho\r\n"
        "  - \r\n"
        "countries:\r\n"
        "  - South Korea\r\n"
        "original_language: \"KO\"\r\n"
        "spoken_languages:\r\n"
        "  - Korean\r\n"
        "poster_path: 'https://image.tmdb.org/t/p/w500/it''s.jpg'\r\n"
        "---\r\n"
        "## Synopsis\r\n";
    MovieRecord parsed = RecordCodec::decode(legacy);
    expect(parsed.title == "Parasite" && parsed.year == 2019, "legacy identity");
    expect(parsed.genres == std::vector<std::string>{"Comedy", "Thriller"}, "legacy bare list items");
    expect(parsed.cast == std::vector<std::string>{"Song Kang-ho"}, "empty list items are skipped");
    expect(parsed.rating && *parsed.rating == 9.0, "legacy rating");
    expect(parsed.dateWatched && *parsed.dateWatched == (Date{2024, 1, 5}), "legacy date");
    expect(parsed.posterPath == "https://image.tmdb.org/t/p/w500/it's.jpg", "single-quoted scalar");
    expect(parsed.notes == "## Synopsis\r\n", "body kept verbatim");
    expect(parsed.status == Status::Watched, "legacy status");

    // Older to-watch documents carried a placeholder rating; that breaks the schema.
    expect(decodeFails(header("title: \"X\"\nyear: 2000\nrating: 0.0\nstatus: \"to-watch\"\ndate_watched:\n")),
           "placeholder rating on to-watch is rejected");
    MovieRecord blankDate = RecordCodec::decode(header("title: \"X\"\nyear: 2000\nstatus: \"to-watch\"\ndate_watched:\n"));
    expect(!blankDate.dateWatched, "blank date_watched is absent");
    expect(blankDate.director == "Unknown", "missing director defaults to Unknown");

    // Values a document cannot carry are invalid; what remains survives the trip.
    MovieRecord noDirector = testsupport::toWatch("Heat", 1995);
    noDirector.director = "";
    expect(movielog::findInvariantViolation(noDirector).has_value(), "empty director is invalid");
    MovieRecord emptyGenre = testsupport::toWatch("Heat", 1995);
    emptyGenre.genres = {""};
    expect(movielog::findInvariantViolation(emptyGenre).has_value(), "empty genre entry is invalid");
    MovieRecord emptyActor = testsupport::toWatch("Heat", 1995);
    emptyActor.cast = {"Al Pacino", ""};
    expect(movielog::findInvariantViolation(emptyActor).has_value(), "empty actor entry is invalid");
    MovieRecord emptyCountry = testsupport::toWatch("Heat", 1995);
    emptyCountry.countries = {""};
    expect(movielog::findInvariantViolation(emptyCountry).has_value(), "empty country entry is invalid");

    MovieRecord spaces = testsupport::toWatch("Heat", 1995, " ");
    spaces.genres = {" "};
    spaces.cast = {"  Al Pacino "};
    expect(!movielog::findInvariantViolation(spaces), "whitespace values are valid");
    expect(RecordCodec::decode(RecordCodec::encode(spaces)) == spaces, "whitespace values round-trip");

    MovieRecord nanRating = testsupport::watched("Heat", 1995, "Michael Mann", {}, 0.0);
    nanRating.rating = std::nan("");
    expect(movielog::findInvariantViolation(nanRating).has_value(), "NaN rating is invalid");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
