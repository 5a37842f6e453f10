#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "MovieLog.hpp"

// Menu-driven terminal front end. Each action runs one synchronous core
// operation; errors are printed and the menu continues.
class MovieLogMenu {
public:
    MovieLogMenu(movielog::MovieLog& app, std::istream& in, std::ostream& out);
    void run();

private:
    void logMovie();
    void browseToWatch();
    void showStats();
    void searchMenu();
    void markWatched();
    void refreshMetadata();
    void deleteMovie();
    void importFile();

    // Paginated listing; movie lists allow opening the backing document.
    void showRecords(const std::string& title, const std::vector<movielog::MovieRecord>& records);
    void showCounts(const std::string& title, const std::vector<std::pair<std::string, std::size_t>>& rows);

    // Empty optional on end of input.
    std::optional<std::string> prompt(const std::string& label);
    std::optional<std::pair<std::string, int>> promptIdentity();
    std::optional<double> promptRating();
    void printError(const std::exception& e);

    movielog::MovieLog& app_;
    std::istream& in_;
    std::ostream& out_;
    bool eof_ = false;
};
