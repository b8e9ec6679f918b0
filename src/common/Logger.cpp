#include "stemsync/common/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace stemsync::common {
namespace {

std::ofstream logFile;
std::mutex logMutex;
bool consoleEnabled = true;
bool verboseEnabled = false;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void write(std::string_view level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    const std::string stamp = timestamp();
    if (consoleEnabled) {
        std::cerr << level << ' ' << stamp << " - " << message << '\n';
    }
    if (logFile.is_open()) {
        logFile << level << ' ' << stamp << " - " << message << '\n';
        logFile.flush();
    }
}

}  // namespace

void Logger::init(const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(logMutex);
    consoleEnabled = options.console;
    verboseEnabled = options.verbose;
    if (logFile.is_open()) {
        logFile.close();
    }
    if (options.file.has_value()) {
        logFile.open(*options.file, std::ios::out | std::ios::app);
        if (logFile.is_open()) {
            logFile << "\n=== stemsync startup " << timestamp() << " ===\n";
            logFile.flush();
        } else if (consoleEnabled) {
            std::cerr << "[WARN ] " << timestamp() << " - Could not open log file '" << options.file->string()
                      << "'\n";
        }
    }
}

void Logger::log(const std::string& message) {
    write("[INFO ]", message);
}

void Logger::logDebug(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(logMutex);
        if (!verboseEnabled) {
            return;
        }
    }
    write("[DEBUG]", message);
}

void Logger::logWarning(const std::string& message) {
    write("[WARN ]", message);
}

void Logger::logError(const std::string& message) {
    write("[ERROR]", message);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "=== stemsync shutdown " << timestamp() << " ===\n\n";
        logFile.close();
    }
}

}  // namespace stemsync::common
