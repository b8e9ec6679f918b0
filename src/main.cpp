#include <stemsync/app/App.hpp>

#include <exception>
#include <utility>
#include <iostream>

int main(int argc, char** argv) {
    auto options = stemsync::app::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        stemsync::app::printUsage(std::cerr, argc > 0 ? argv[0] : "stemsync");
        return 1;
    }
    if (options->showHelp) {
        stemsync::app::printUsage(std::cout, argc > 0 ? argv[0] : "stemsync");
        return 0;
    }

    try {
        stemsync::app::App app(std::move(*options));
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}
