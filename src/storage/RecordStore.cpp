#include "movielog/RecordStore.hpp"
#include "movielog/Analyzer.hpp"
#include "movielog/RecordCodec.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace movielog {

namespace {

constexpr const char* kExtension = ".md";

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ParseError("cannot open document", path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string describe(const std::string& title, int year) {
    return "'" + title + "' (" + std::to_string(year) + ")";
}

} // namespace

RecordStore::RecordStore(fs::path directory) : directory_(std::move(directory)) {}

LoadReport RecordStore::load() {
    LoadReport report;
    entries_.clear();
    nextSequence_ = 1;

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StorageError("RecordStore: cannot create " + directory_.string() + ": " + ec.message());
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && it->path().extension() == kExtension) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageError("RecordStore: cannot list " + directory_.string() + ": " + ec.message());
    }
    // Filename order only decides among legacy documents without a sequence.
    std::sort(files.begin(), files.end());

    std::vector<Entry> unsequenced;
    for (const auto& file : files) {
        try {
            MovieRecord record = RecordCodec::decode(readFile(file), file.string());
            RecordIdentity id = record.identity();
            const bool duplicate =
                findEntry(id) != nullptr ||
                std::any_of(unsequenced.begin(), unsequenced.end(), [&](const Entry& e) { return e.identity == id; });
            if (duplicate) {
                throw ParseError("duplicate identity " + describe(record.title, record.year), file.string());
            }
            Entry e{std::move(record), std::move(id), file};
            if (e.record.added == 0) {
                unsequenced.push_back(std::move(e));
            } else {
                nextSequence_ = std::max(nextSequence_, e.record.added + 1);
                entries_.push_back(std::move(e));
            }
        } catch (const ParseError& err) {
            std::cerr << "RecordStore: skipping " << err.what() << "\n";
            report.errors.push_back(err);
        }
    }

    std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        return a.record.added < b.record.added;
    });
    // Sequence numbers must be unique; a hand-copied document may repeat one.
    // Assigned numbers are written back so the order holds on the next run.
    std::unordered_set<uint64_t> seen;
    for (auto& e : entries_) {
        if (!seen.insert(e.record.added).second) {
            e.record.added = nextSequence_++;
            persistSequence(e);
        }
    }
    std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        return a.record.added < b.record.added;
    });
    for (auto& e : unsequenced) {
        e.record.added = nextSequence_++;
        persistSequence(e);
        entries_.push_back(std::move(e));
    }

    report.records = list();
    std::cerr << "RecordStore: loaded " << report.records.size() << " records, "
              << report.errors.size() << " errors from " << directory_.string() << "\n";
    return report;
}

UpsertResult RecordStore::upsert(MovieRecord record) {
    validateRecord(record);
    RecordIdentity id = record.identity();

    if (Entry* existing = findEntry(id)) {
        record.added = existing->record.added;
        writeDocument(existing->path, record);
        existing->record = record;
        return UpsertResult{std::move(record), existing->path, false};
    }

    fs::path path = choosePath(record);
    record.added = nextSequence_;
    writeDocument(path, record);
    ++nextSequence_;
    entries_.push_back(Entry{record, std::move(id), path});
    return UpsertResult{std::move(record), std::move(path), true};
}

void RecordStore::remove(const std::string& title, int year) {
    RecordIdentity id = makeIdentity(title, year);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.identity == id; });
    if (it == entries_.end()) {
        throw NotFound("no record for " + describe(title, year));
    }
    std::error_code ec;
    fs::remove(it->path, ec);
    if (ec) {
        throw StorageError("RecordStore: cannot remove " + it->path.string() + ": " + ec.message());
    }
    entries_.erase(it);
}

std::vector<MovieRecord> RecordStore::list() const {
    std::vector<MovieRecord> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.record);
    }
    return out;
}

MovieRecord RecordStore::findByIdentity(const std::string& title, int year) const {
    const Entry* e = findEntry(makeIdentity(title, year));
    if (!e) {
        throw NotFound("no record for " + describe(title, year));
    }
    return e->record;
}

bool RecordStore::contains(const std::string& title, int year) const {
    return findEntry(makeIdentity(title, year)) != nullptr;
}

std::optional<MovieRecord> RecordStore::findByExternalId(int64_t tmdbId) const {
    for (const auto& e : entries_) {
        if (e.record.tmdbId && *e.record.tmdbId == tmdbId) return e.record;
    }
    return std::nullopt;
}

fs::path RecordStore::pathOf(const std::string& title, int year) const {
    const Entry* e = findEntry(makeIdentity(title, year));
    if (!e) {
        throw NotFound("no record for " + describe(title, year));
    }
    return e->path;
}

const RecordStore::Entry* RecordStore::findEntry(const RecordIdentity& identity) const {
    for (const auto& e : entries_) {
        if (e.identity == identity) return &e;
    }
    return nullptr;
}

RecordStore::Entry* RecordStore::findEntry(const RecordIdentity& identity) {
    return const_cast<Entry*>(static_cast<const RecordStore*>(this)->findEntry(identity));
}

void RecordStore::persistSequence(const Entry& entry) const {
    std::cerr << "RecordStore: assigning sequence " << entry.record.added << " to " << entry.path.string() << "\n";
    writeDocument(entry.path, entry.record);
}

fs::path RecordStore::choosePath(const MovieRecord& record) const {
    const std::string stem = Analyzer::slug(record.title) + "-" + std::to_string(record.year);
    fs::path candidate = directory_ / (stem + kExtension);
    for (int n = 2;; ++n) {
        std::error_code ec;
        const bool taken = fs::exists(candidate, ec);
        if (ec) {
            throw StorageError("RecordStore: cannot check " + candidate.string() + ": " + ec.message());
        }
        if (!taken) return candidate;
        candidate = directory_ / (stem + "-" + std::to_string(n) + kExtension);
    }
}

void RecordStore::writeDocument(const fs::path& path, const MovieRecord& record) const {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("RecordStore: cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    // Whole-document overwrite: write temp then rename over the target.
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("RecordStore: cannot open " + tmp.string() + " for writing");
        }
        out << RecordCodec::encode(record);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw StorageError("RecordStore: write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError("RecordStore: cannot move document into place at " + path.string() + ": " + ec.message());
    }
}

} // namespace movielog
