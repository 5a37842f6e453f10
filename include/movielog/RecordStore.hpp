#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "movielog/Errors.hpp"
#include "movielog/MovieRecord.hpp"

namespace movielog {

struct LoadReport {
    std::vector<MovieRecord> records;
    std::vector<ParseError> errors;
};

struct UpsertResult {
    MovieRecord record;
    std::filesystem::path path;
    bool created = false;
};

// Directory of one-document-per-record files. Sole writer of that directory;
// every mutation is written through before it returns.
class RecordStore {
public:
    explicit RecordStore(std::filesystem::path directory);

    // (Re)read every *.md document. Malformed documents are reported, not fatal.
    LoadReport load();

    // Replace the record with the same identity in place, or create a new document.
    UpsertResult upsert(MovieRecord record);

    // Throws NotFound when no record has this identity.
    void remove(const std::string& title, int year);

    // Records in creation order.
    std::vector<MovieRecord> list() const;

    MovieRecord findByIdentity(const std::string& title, int year) const;
    bool contains(const std::string& title, int year) const;
    std::optional<MovieRecord> findByExternalId(int64_t tmdbId) const;
    std::filesystem::path pathOf(const std::string& title, int year) const;

    std::size_t size() const { return entries_.size(); }
    const std::filesystem::path& directory() const { return directory_; }

private:
    struct Entry {
        MovieRecord record;
        RecordIdentity identity;
        std::filesystem::path path;
    };

    std::filesystem::path directory_;
    std::vector<Entry> entries_; // kept sorted by record.added
    uint64_t nextSequence_ = 1;

    const Entry* findEntry(const RecordIdentity& identity) const;
    Entry* findEntry(const RecordIdentity& identity);

    // Writes a sequence assigned during load back to the entry's document.
    void persistSequence(const Entry& entry) const;
    std::filesystem::path choosePath(const MovieRecord& record) const;
    void writeDocument(const std::filesystem::path& path, const MovieRecord& record) const;
};

} // namespace movielog
