#include "MovieLog.hpp"
#include "MovieLogMenu.hpp"
#include <iostream>

int main() {
    try {
        movielog::MovieLog app(movielog::Config::load());
        auto report = app.reload();
        for (const auto& err : report.errors) {
            std::cerr << "Warning: " << err.what() << "\n";
        }
        MovieLogMenu menu(app, std::cin, std::cout);
        menu.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
