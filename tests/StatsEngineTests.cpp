#include <cmath>
#include <stdexcept>
#include "movielog/RecordStore.hpp"
#include "movielog/StatsEngine.hpp"
#include "movielog/algorithms/StatsAlgorithms.hpp"
#include "TestSupport.hpp"

using movielog::Date;
using movielog::MovieRecord;
using namespace movielog::algo;
using testsupport::expect;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static MovieRecord rated(const std::string& title, double rating) {
    return testsupport::watched(title, 2000, "Someone", {}, rating);
}

int main() {
    // Genre distribution: ties broken by name.
    {
        std::vector<MovieRecord> records{
            testsupport::watched("One", 2001, "A", {"Drama", "Comedy"}, 7.0),
            testsupport::watched("Two", 2002, "A", {"Drama"}, 6.0),
            testsupport::watched("Three", 2003, "B", {"Comedy"}, 8.0),
            testsupport::toWatch("Four", 2004, "C"),
        };
        records[3].genres = {"Drama", "Horror"};

        auto genres = genreDistribution(records);
        expect(genres.size() == 2, "to-watch genres are not counted");
        expect(genres[0] == (CountEntry{"Comedy", 2}) && genres[1] == (CountEntry{"Drama", 2}),
               "equal counts sorted by name");

        records.push_back(testsupport::watched("Five", 2005, "Unknown", {}, 5.0));
        records.push_back(testsupport::watched("Six", 2006, "Unknown", {}, 5.0));
        records.push_back(testsupport::watched("Seven", 2006, "Unknown", {}, 5.0));
        auto top = topDirectors(records, 1);
        expect(top.size() == 1 && top[0] == (CountEntry{"A", 2}), "Unknown director excluded from ranking");
        auto all = topDirectors(records, 10);
        expect(all.size() == 2 && all[1] == (CountEntry{"B", 1}), "to-watch directors are not counted");
        expect(topDirectors(records, 0).empty(), "n = 0");
    }

    // Director ties: equal counts ranked by name, Unknown never ranked.
    {
        std::vector<MovieRecord> records;
        for (int i = 0; i < 5; ++i) {
            records.push_back(testsupport::watched("Anon " + std::to_string(i), 2000 + i, "Unknown", {}, 6.0));
        }
        records.push_back(testsupport::watched("B one", 2001, "B", {}, 7.0));
        records.push_back(testsupport::watched("B two", 2002, "B", {}, 7.0));
        records.push_back(testsupport::watched("A one", 2003, "A", {}, 7.0));
        records.push_back(testsupport::watched("A two", 2004, "A", {}, 7.0));

        auto top = topDirectors(records, 1);
        expect(top.size() == 1 && top[0] == (CountEntry{"A", 2}), "tie resolved by ascending name");
        auto both = topDirectors(records, 5);
        expect(both.size() == 2 && both[1] == (CountEntry{"B", 2}), "runner-up in the tie");
    }

    // Rating histogram boundaries.
    {
        std::vector<MovieRecord> records{rated("a", 3.0), rated("b", 3.99), rated("c", 9.5), rated("d", 10.0)};
        records.push_back(testsupport::toWatch("e", 2000));

        auto hist = ratingHistogram(records, 1.0);
        expect(hist.size() == 11, "width 1 yields eleven buckets");
        expect(hist[3].count == 2, "3.0 and 3.99 share a bucket");
        expect(hist[9].count == 1 && hist[10].count == 1, "9.5 and 10 land in separate buckets");
        expect(near(hist[10].lower, 10.0) && near(hist[10].upper, 11.0), "last bucket holds 10");
        std::size_t total = 0;
        for (const auto& b : hist) total += b.count;
        expect(total == 4, "every rated watched record counted once");

        auto wide = ratingHistogram(records, 2.5);
        expect(wide.size() == 5, "width 2.5 yields five buckets");
        expect(wide[1].count == 2 && wide[3].count == 1 && wide[4].count == 1, "wide bucket assignment");

        bool threw = false;
        try {
            ratingHistogram(records, 0.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "zero width rejected");
        threw = false;
        try {
            ratingHistogram(records, -1.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "negative width rejected");
        threw = false;
        try {
            ratingHistogram(records, 1e-300);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "width too small for a sane bucket count rejected");
        threw = false;
        try {
            ratingHistogram(records, 0.001);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "ten thousand buckets rejected");
        expect(!isValidBucketWidth(std::nan("")) && !isValidBucketWidth(0.005), "width validation");
        expect(isValidBucketWidth(0.1) && isValidBucketWidth(10.0), "usable widths accepted");
        auto fine = ratingHistogram(records, 0.1);
        expect(fine.size() >= 100 && fine.size() <= kMaxHistogramBuckets + 1, "fine buckets stay bounded");
        expect(ratingHistogram({}, 1.0).size() == 11, "empty input still yields every bucket");
    }

    // Recently watched and the to-watch list.
    {
        std::vector<MovieRecord> records{
            testsupport::watched("Zodiac", 2007, "David Fincher", {}, 8.0, Date{2024, 3, 1}),
            testsupport::watched("Alien", 1979, "Ridley Scott", {}, 9.0, Date{2024, 3, 1}),
            testsupport::watched("Heat", 1995, "Michael Mann", {}, 8.0, Date{2023, 12, 31}),
            testsupport::toWatch("Ran", 1985),
            testsupport::toWatch("Akira", 1988),
            testsupport::toWatch("Brazil", 1985),
        };
        MovieRecord undated = testsupport::watched("Undated", 2010, "X", {}, 6.0);
        undated.dateWatched.reset();
        records.push_back(undated);

        auto recent = recentlyWatched(records, 10);
        expect(recent.size() == 3, "undated records excluded");
        expect(recent[0].title == "Alien" && recent[1].title == "Zodiac" && recent[2].title == "Heat",
               "date desc, ties by title");
        expect(recentlyWatched(records, 1).size() == 1, "limit applied");

        auto queue = toWatchList(records);
        expect(queue.size() == 3 && queue[0].title == "Brazil" && queue[1].title == "Ran" && queue[2].title == "Akira",
               "to-watch ordered by year then title");

        auto summary = summarize(records);
        expect(summary.watched == 4 && summary.rated == 4, "summary counts");
        expect(near(summary.averageRating, (8.0 + 9.0 + 8.0 + 6.0) / 4.0), "average rating");
        expect(near(summarize({}).averageRating, 0.0), "average of nothing is zero");

        auto decades = byDecade(records);
        expect(decades.size() == 4, "four decades");
        expect(decades[0].decade == 2010 && decades[3].decade == 1970, "most recent decade first");
    }

    // Runtime totals.
    {
        MovieRecord a = rated("a", 7.0);
        a.runtime = 90;
        MovieRecord b = rated("b", 7.0);
        b.runtime = 150;
        expect(near(summarize({a, b}).totalHours, 4.0), "hours from runtime minutes");
    }

    // Engine over a live store.
    {
        movielog::RecordStore store(testsupport::freshDir("stats"));
        store.load();
        movielog::StatsEngine stats(store);
        expect(stats.genreDistribution().empty(), "empty store");

        store.upsert(testsupport::watched("Heat", 1995, "Michael Mann", {"Crime"}, 8.0));
        store.upsert(testsupport::toWatch("Ran", 1985));
        expect(stats.genreDistribution().size() == 1, "engine sees new records");
        expect(stats.toWatchList().size() == 1, "engine to-watch list");
        expect(stats.summary().watched == 1, "engine summary");
        expect(stats.ratingHistogram(1.0)[8].count == 1, "engine histogram");

        store.upsert(testsupport::watched("Ran", 1985, "Akira Kurosawa", {"Drama"}, 9.0, Date{2024, 5, 5}));
        expect(stats.toWatchList().empty(), "marking watched leaves the queue");
        expect(stats.recentlyWatched(5).front().title == "Ran", "most recent watch first");
        expect(stats.byDecade().size() == 2, "engine decades");
        expect(stats.topDirectors(5).size() == 2, "engine directors");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
