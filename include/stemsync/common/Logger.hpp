#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace stemsync::common {

struct LoggerOptions {
    bool console = true;
    bool verbose = false;
    std::optional<std::filesystem::path> file;
};

/// Process-wide diagnostic log.
/// Lines go to stderr (when enabled) and to an optional append-mode log file.
class Logger {
public:
    static void init(const LoggerOptions& options = {});
    static void log(const std::string& message);
    static void logDebug(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace stemsync::common
