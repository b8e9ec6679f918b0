#pragma once

#include "stemsync/app/PlayerConfig.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stemsync::app {

struct AppOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> logFile;
    bool verbose = false;
    bool showHelp = false;
    std::vector<std::filesystem::path> stems;
};

std::expected<AppOptions, std::string> parseArgs(int argc, char** argv);
void printUsage(std::ostream& out, std::string_view programName);

/// One line typed at the player prompt.
struct Command {
    enum class Kind : uint8_t {
        Play,
        Pause,
        Toggle,
        Seek,
        Load,
        Status,
        Help,
        Quit,
    };

    Kind kind = Kind::Status;
    double seconds = 0.0;
    std::vector<std::filesystem::path> paths;
};

/// Blank lines yield std::nullopt.
std::expected<std::optional<Command>, std::string> parseCommand(std::string_view line);

/// True when `line` parses as a quit command (any case, trailing words ignored).
bool isQuitCommand(std::string_view line);

/// Console multi-stem player: loads the stems, then drives the coordinator from stdin commands.
class App {
public:
    explicit App(AppOptions options);

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    int run();

private:
    AppOptions options_;
};

}  // namespace stemsync::app
