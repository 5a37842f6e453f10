#include "movielog/RecordCodec.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/Errors.hpp"

#include <charconv>
#include <cmath>
#include <map>
#include <sstream>
#include <vector>

namespace movielog {

namespace {

constexpr std::string_view kDelimiter = "---";

struct HeaderValue {
    bool isList = false;
    std::string scalar;
    std::vector<std::string> items;
    size_t line = 0;
};

using Header = std::map<std::string, HeaderValue>;

// Escape problems surface as this and get the line number attached later.
struct EscapeError {
    std::string message;
};

std::string formatDouble(double value) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, res.ptr);
}

std::string_view stripCr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

void writeList(std::ostringstream& out, std::string_view key, const std::vector<std::string>& items) {
    out << key << ":";
    if (items.empty()) {
        out << " []\n";
        return;
    }
    out << "\n";
    for (const auto& item : items) {
        out << "  - " << RecordCodec::quote(item) << "\n";
    }
}

std::string unquoteOrThrow(std::string_view quoted) {
    if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
        throw EscapeError{"unterminated quoted string"};
    }
    std::string out;
    out.reserve(quoted.size());
    for (size_t i = 1; i + 1 < quoted.size(); ++i) {
        char c = quoted[i];
        if (c == '"') {
            throw EscapeError{"unescaped quote inside string"};
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= quoted.size()) {
            throw EscapeError{"dangling backslash at end of string"};
        }
        char e = quoted[++i];
        switch (e) {
        case '\\': out.push_back('\\'); break;
        case '"':  out.push_back('"'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        default:
            throw EscapeError{std::string("unknown escape sequence \\") + e};
        }
    }
    return out;
}

// Scalars may be double-quoted, single-quoted or bare.
std::string parseScalar(std::string_view raw) {
    if (raw.empty()) return {};
    if (raw.front() == '"') {
        return unquoteOrThrow(raw);
    }
    if (raw.front() == '\'') {
        if (raw.size() < 2 || raw.back() != '\'') {
            throw EscapeError{"unterminated quoted string"};
        }
        std::string out;
        for (size_t i = 1; i + 1 < raw.size(); ++i) {
            out.push_back(raw[i]);
            if (raw[i] == '\'' && i + 2 < raw.size() && raw[i + 1] == '\'') ++i;
        }
        return out;
    }
    return std::string(raw);
}

Header parseHeader(const std::vector<std::string_view>& lines, size_t firstLine, const std::string& path) {
    Header header;
    std::string listKey;

    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t lineNo = firstLine + i;
        std::string_view line = lines[i];
        std::string trimmed = Analyzer::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        auto fail = [&](const std::string& msg) -> ParseError {
            return ParseError("line " + std::to_string(lineNo) + ": " + msg, path);
        };

        try {
            if (trimmed.front() == '-') {
                if (listKey.empty()) {
                    throw fail("list item outside of a list");
                }
                std::string item = parseScalar(Analyzer::trim(std::string_view(trimmed).substr(1)));
                if (!item.empty()) {
                    header[listKey].items.push_back(std::move(item));
                }
                continue;
            }

            auto colon = trimmed.find(':');
            if (colon == std::string::npos) {
                throw fail("expected 'key: value'");
            }
            std::string key = Analyzer::trim(std::string_view(trimmed).substr(0, colon));
            std::string value = Analyzer::trim(std::string_view(trimmed).substr(colon + 1));
            if (key.empty()) {
                throw fail("empty key");
            }
            if (header.count(key)) {
                throw fail("duplicate key '" + key + "'");
            }

            HeaderValue hv;
            hv.line = lineNo;
            listKey.clear();
            if (value.empty()) {
                // Either a blank scalar or the start of a block list.
                hv.isList = true;
                listKey = key;
            } else if (value == "[]") {
                hv.isList = true;
            } else {
                hv.scalar = parseScalar(value);
            }
            header.emplace(std::move(key), std::move(hv));
        } catch (const EscapeError& e) {
            throw fail(e.message);
        }
    }
    return header;
}

class FieldReader {
public:
    FieldReader(const Header& header, const std::string& path) : header_(header), path_(path) {}

    const HeaderValue* find(const std::string& key) const {
        auto it = header_.find(key);
        return it == header_.end() ? nullptr : &it->second;
    }

    // Blank scalars and empty block lists count as absent.
    std::optional<std::string> scalar(const std::string& key) const {
        const HeaderValue* v = find(key);
        if (!v) return std::nullopt;
        if (v->isList) {
            if (!v->items.empty()) throw error(key, "expected a single value, found a list");
            return std::nullopt;
        }
        if (v->scalar.empty()) return std::nullopt;
        return v->scalar;
    }

    std::string required(const std::string& key) const {
        auto v = scalar(key);
        if (!v) throw ParseError("missing required field '" + key + "'", path_);
        return *v;
    }

    std::vector<std::string> list(const std::string& key) const {
        const HeaderValue* v = find(key);
        if (!v) return {};
        if (!v->isList) {
            if (v->scalar.empty()) return {};
            throw error(key, "expected a list");
        }
        return v->items;
    }

    template <typename T>
    T integer(const std::string& key, const std::string& text) const {
        T out{};
        auto res = std::from_chars(text.data(), text.data() + text.size(), out);
        if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
            throw error(key, "'" + text + "' is not an integer");
        }
        return out;
    }

    double real(const std::string& key, const std::string& text) const {
        double out = 0.0;
        auto res = std::from_chars(text.data(), text.data() + text.size(), out);
        if (res.ec != std::errc() || res.ptr != text.data() + text.size() || !std::isfinite(out)) {
            throw error(key, "'" + text + "' is not a number");
        }
        return out;
    }

    ParseError error(const std::string& key, const std::string& msg) const {
        const HeaderValue* v = find(key);
        std::string where = v ? "line " + std::to_string(v->line) + ": " : "";
        return ParseError(where + key + ": " + msg, path_);
    }

private:
    const Header& header_;
    const std::string& path_;
};

} // namespace

std::string RecordCodec::quote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"':  out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::string RecordCodec::unquote(std::string_view quoted) {
    try {
        return unquoteOrThrow(quoted);
    } catch (const EscapeError& e) {
        throw ParseError(e.message);
    }
}

std::string RecordCodec::encode(const MovieRecord& record) {
    std::ostringstream out;
    out << kDelimiter << "\n";
    out << "title: " << quote(record.title) << "\n";
    out << "year: " << record.year << "\n";
    out << "director: " << quote(record.director) << "\n";
    out << "runtime: " << record.runtime << "\n";
    writeList(out, "genres", record.genres);
    writeList(out, "actors", record.cast);
    out << "status: " << quote(statusName(record.status)) << "\n";
    if (record.rating) {
        out << "rating: " << formatDouble(*record.rating) << "\n";
    }
    if (record.dateWatched) {
        out << "date_watched: " << record.dateWatched->toString() << "\n";
    }
    if (record.tmdbId) {
        out << "tmdb_id: " << *record.tmdbId << "\n";
    }
    if (!record.countries.empty()) {
        writeList(out, "countries", record.countries);
    }
    if (!record.originalLanguage.empty()) {
        out << "original_language: " << quote(record.originalLanguage) << "\n";
    }
    if (!record.releaseDate.empty()) {
        out << "release_date: " << quote(record.releaseDate) << "\n";
    }
    if (!record.posterPath.empty()) {
        out << "poster_path: " << quote(record.posterPath) << "\n";
    }
    if (record.added != 0) {
        out << "added: " << record.added << "\n";
    }
    out << kDelimiter << "\n";
    out << record.notes;
    return out.str();
}

MovieRecord RecordCodec::decode(std::string_view text, const std::string& path) {
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    // Split off the header block.
    std::vector<std::string_view> headerLines;
    size_t pos = 0;
    size_t lineNo = 0;
    bool opened = false;
    bool closed = false;
    std::string_view body;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = nl == std::string_view::npos ? text.size() : nl;
        std::string_view line = stripCr(text.substr(pos, end - pos));
        pos = nl == std::string_view::npos ? text.size() : nl + 1;
        ++lineNo;

        if (!opened) {
            if (Analyzer::trim(line).empty()) continue;
            if (line != kDelimiter) {
                throw ParseError("document does not start with '---'", path);
            }
            opened = true;
            continue;
        }
        if (line == kDelimiter) {
            closed = true;
            body = text.substr(pos);
            break;
        }
        headerLines.push_back(line);
    }
    if (!opened) throw ParseError("empty document", path);
    if (!closed) throw ParseError("front matter is not closed with '---'", path);

    const size_t firstHeaderLine = lineNo - headerLines.size();
    Header header = parseHeader(headerLines, firstHeaderLine, path);
    FieldReader fields(header, path);

    MovieRecord r;
    r.title = fields.required("title");
    r.year = fields.integer<int>("year", fields.required("year"));

    std::string statusText = fields.required("status");
    auto status = parseStatus(statusText);
    if (!status) {
        throw fields.error("status", "'" + statusText + "' is not 'watched' or 'to-watch'");
    }
    r.status = *status;

    if (auto director = fields.scalar("director")) r.director = *director;
    if (auto runtime = fields.scalar("runtime")) r.runtime = fields.integer<int>("runtime", *runtime);
    r.genres = fields.list("genres");
    r.cast = fields.list("actors");
    if (auto rating = fields.scalar("rating")) r.rating = fields.real("rating", *rating);
    if (auto watched = fields.scalar("date_watched")) {
        r.dateWatched = Date::parse(*watched);
        if (!r.dateWatched) throw fields.error("date_watched", "'" + *watched + "' is not a YYYY-MM-DD date");
    }
    if (auto id = fields.scalar("tmdb_id")) r.tmdbId = fields.integer<int64_t>("tmdb_id", *id);
    r.countries = fields.list("countries");
    if (auto lang = fields.scalar("original_language")) r.originalLanguage = *lang;
    if (auto release = fields.scalar("release_date")) r.releaseDate = *release;
    if (auto poster = fields.scalar("poster_path")) r.posterPath = *poster;
    if (auto added = fields.scalar("added")) r.added = fields.integer<uint64_t>("added", *added);

    r.notes = std::string(body);

    if (auto violation = findInvariantViolation(r)) {
        throw ParseError("schema invariant violated: " + *violation, path);
    }
    return r;
}

} // namespace movielog
