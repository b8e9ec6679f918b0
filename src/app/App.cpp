#include "stemsync/app/App.hpp"

#include "stemsync/audio/AudioEngine.hpp"
#include "stemsync/audio/AudioSession.hpp"
#include "stemsync/common/ControlLoop.hpp"
#include "stemsync/common/Logger.hpp"
#include "stemsync/playback/TimelineCoordinator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <format>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace stemsync::app {
namespace {

constexpr auto kMaxIdleWait = std::chrono::milliseconds(100);

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string formatTime(double seconds) {
    const auto total = static_cast<int64_t>(std::max(seconds, 0.0));
    const double fraction = std::max(seconds, 0.0) - static_cast<double>(total);
    return std::format("{}:{:02}.{}", total / 60, total % 60, static_cast<int>(fraction * 10.0));
}

/// Prints a status line whenever the coordinator reports a visible change.
class ConsoleNowPlaying : public playback::NowPlayingSink {
public:
    void publish(const playback::NowPlayingInfo& info) override {
        const char* marker = info.playbackRate > 0.0 ? ">" : "||";
        std::cout << std::format("{} {} / {}", marker, formatTime(info.elapsedSeconds),
                                 formatTime(info.durationSeconds));
        if (!info.title.empty()) {
            std::cout << "  " << info.title;
            if (!info.artist.empty()) {
                std::cout << " - " << info.artist;
            }
        }
        std::cout << std::endl;
    }
};

/// Reads stdin lines on a helper thread so the control thread can keep servicing timers.
class StdinReader {
public:
    StdinReader() : thread_([this]() { readLoop(); }) {}

    ~StdinReader() {
        if (thread_.joinable()) {
            // std::getline cannot be interrupted; the thread exits on quit or EOF.
            thread_.detach();
        }
    }

    StdinReader(const StdinReader&) = delete;
    StdinReader& operator=(const StdinReader&) = delete;

    /// Wait until a line is available or `deadline` passes.
    std::optional<std::string> next(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this]() { return !lines_.empty() || closed_; });
        if (lines_.empty()) {
            return std::nullopt;
        }
        auto line = std::move(lines_.front());
        lines_.pop_front();
        return line;
    }

    bool closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && lines_.empty();
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void readLoop() {
        std::string line;
        while (std::getline(std::cin, line)) {
            const bool quitting = isQuitCommand(line);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                lines_.push_back(line);
            }
            cv_.notify_one();
            if (quitting) {
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_one();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    bool closed_ = false;
    std::thread thread_;
};

void printCommandHelp(std::ostream& out) {
    out << "Commands:\n";
    out << "  play              Start or resume all stems together\n";
    out << "  pause             Pause all stems\n";
    out << "  toggle            Play if paused, pause if playing\n";
    out << "  seek <seconds>    Move every stem to a timeline position\n";
    out << "  load <file>...    Replace the loaded stems\n";
    out << "  status            Show transport state\n";
    out << "  quit              Exit\n";
}

void printStatus(const playback::TimelineCoordinator& coordinator) {
    std::cout << std::format("state: {}{}  position: {} / {}  tracks: {}  synchronized start: {}\n",
                             playback::toString(coordinator.state()), coordinator.isAcquiring() ? " (acquiring)" : "",
                             formatTime(coordinator.currentTimeSeconds()), formatTime(coordinator.durationSeconds()),
                             coordinator.trackCount(), coordinator.lastStartWasSynchronized() ? "yes" : "no");
    for (size_t i = 0; i < coordinator.trackCount(); ++i) {
        const auto& track = coordinator.track(i);
        std::cout << std::format("  [{}] {}  {} Hz  {} frames{}\n", i, track.name(), track.sampleRate(),
                                 track.totalFrames(), i == 0 ? "  (reference)" : "");
    }
}

void reportLoad(const std::expected<playback::LoadReport, playback::LoadError>& result) {
    if (!result.has_value()) {
        std::cout << "Load failed: " << playback::toString(result.error()) << '\n';
        return;
    }
    std::cout << std::format("Loaded {} stem(s), {}\n", result->loadedCount, formatTime(result->durationSeconds));
    for (const auto& skipped : result->skipped) {
        std::cout << std::format("  skipped {}: {}\n", skipped.path.string(), skipped.reason);
    }
}

}  // namespace

std::expected<AppOptions, std::string> parseArgs(int argc, char** argv) {
    AppOptions options;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    bool endOfOptions = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (!endOfOptions && arg == "--") {
            endOfOptions = true;
            continue;
        }
        if (!endOfOptions && (arg == "--help" || arg == "-h")) {
            options.showHelp = true;
            continue;
        }
        if (!endOfOptions && (arg == "--config" || arg == "-c")) {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.configPath = std::filesystem::path(*value);
            continue;
        }
        if (!endOfOptions && arg == "--log-file") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.logFile = std::filesystem::path(*value);
            continue;
        }
        if (!endOfOptions && (arg == "--verbose" || arg == "-v")) {
            options.verbose = true;
            continue;
        }
        if (!endOfOptions && arg.size() > 1 && arg.front() == '-') {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        options.stems.emplace_back(std::string(arg));
    }

    if (!options.showHelp && options.stems.empty()) {
        return std::unexpected("At least one audio file is required");
    }
    return options;
}

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [--config <file>] [--log-file <file>] [--verbose] <stem> [<stem>...]\n";
    out << "\nPlays the given audio files as sample-aligned stems of one composition.\n";
    out << "The first file is the reference track.\n";
    out << "\nOptions:\n";
    out << "  --config, -c    Player config JSON (default: ~/.config/stemsync/player.json if present)\n";
    out << "  --log-file      Append diagnostics to this file\n";
    out << "  --verbose, -v   Log acquisition and scheduling details\n";
    out << "  --help, -h      Show this help\n\n";
    printCommandHelp(out);
}

std::expected<std::optional<Command>, std::string> parseCommand(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return std::optional<Command>{};
    }

    std::istringstream in{std::string(line)};
    std::string verb;
    in >> verb;
    std::transform(verb.begin(), verb.end(), verb.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    Command command;
    if (verb == "play") {
        command.kind = Command::Kind::Play;
    } else if (verb == "pause") {
        command.kind = Command::Kind::Pause;
    } else if (verb == "toggle" || verb == "space") {
        command.kind = Command::Kind::Toggle;
    } else if (verb == "status" || verb == "st") {
        command.kind = Command::Kind::Status;
    } else if (verb == "help" || verb == "?") {
        command.kind = Command::Kind::Help;
    } else if (verb == "quit" || verb == "exit") {
        command.kind = Command::Kind::Quit;
    } else if (verb == "seek") {
        std::string value;
        if (!(in >> value)) {
            return std::unexpected("seek needs a position in seconds");
        }
        double seconds = 0.0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
        if (ec != std::errc() || ptr != value.data() + value.size() || !std::isfinite(seconds) || seconds < 0.0) {
            return std::unexpected(std::format("Invalid seek position '{}'", value));
        }
        command.kind = Command::Kind::Seek;
        command.seconds = seconds;
    } else if (verb == "load") {
        std::string path;
        while (in >> path) {
            command.paths.emplace_back(path);
        }
        if (command.paths.empty()) {
            return std::unexpected("load needs at least one file");
        }
        command.kind = Command::Kind::Load;
    } else {
        return std::unexpected(std::format("Unknown command '{}' (try 'help')", verb));
    }
    return command;
}

bool isQuitCommand(std::string_view line) {
    const auto command = parseCommand(line);
    return command.has_value() && command->has_value() && (*command)->kind == Command::Kind::Quit;
}

App::App(AppOptions options) : options_(std::move(options)) {}

int App::run() {
    auto config = loadPlayerConfig(options_.configPath);
    if (!config.has_value()) {
        std::cerr << "Error: " << config.error() << '\n';
        return 1;
    }
    if (options_.logFile.has_value()) {
        config->logFile = options_.logFile;
    }
    config->verbose = config->verbose || options_.verbose;
    if (config->title.empty() && !options_.stems.empty()) {
        config->title = options_.stems.front().stem().string();
    }

    common::Logger::init(common::LoggerOptions{
        .console = true,
        .verbose = config->verbose,
        .file = config->logFile,
    });
    common::Logger::log("Starting stemsync...");
    common::Logger::logDebug(std::format("Acquisition: {} ms x {} attempts, partial load policy: {}",
                                         config->retryInterval.count(), config->maxAttempts,
                                         playback::toString(config->partialLoadPolicy)));

    int exitCode = 0;
    {
        audio::MiniaudioSession session;
        audio::AudioEngine engine(session);
        common::ControlLoop controlLoop;
        ConsoleNowPlaying nowPlaying;

        playback::TimelineCoordinator coordinator(session, engine, controlLoop, audio::openAudioFile,
                                                  config->toCoordinatorOptions());
        coordinator.setNowPlayingSink(&nowPlaying);

        const auto loaded = coordinator.load(options_.stems);
        reportLoad(loaded);
        if (!loaded.has_value()) {
            exitCode = 1;
        } else {
            std::cout << "Type 'help' for commands.\n";
            StdinReader reader;
            bool quit = false;
            while (!quit) {
                auto deadline = std::chrono::steady_clock::now() + kMaxIdleWait;
                if (const auto next = controlLoop.nextDeadline(); next.has_value()) {
                    deadline = std::min(deadline, *next);
                }

                if (auto line = reader.next(deadline); line.has_value()) {
                    auto command = parseCommand(*line);
                    if (!command.has_value()) {
                        std::cout << command.error() << '\n';
                    } else if (command->has_value()) {
                        const Command& cmd = **command;
                        switch (cmd.kind) {
                        case Command::Kind::Play:
                            if (auto started = coordinator.play(); !started.has_value()) {
                                std::cout << "Playback failed: " << audio::toString(started.error()) << '\n';
                            }
                            break;
                        case Command::Kind::Pause:
                            coordinator.pause();
                            break;
                        case Command::Kind::Toggle:
                            if (coordinator.state() == playback::PlaybackState::Playing) {
                                coordinator.pause();
                            } else if (auto started = coordinator.play(); !started.has_value()) {
                                std::cout << "Playback failed: " << audio::toString(started.error()) << '\n';
                            }
                            break;
                        case Command::Kind::Seek:
                            coordinator.seek(cmd.seconds);
                            printStatus(coordinator);
                            break;
                        case Command::Kind::Load:
                            reportLoad(coordinator.load(cmd.paths));
                            break;
                        case Command::Kind::Status:
                            printStatus(coordinator);
                            break;
                        case Command::Kind::Help:
                            printCommandHelp(std::cout);
                            break;
                        case Command::Kind::Quit:
                            quit = true;
                            break;
                        }
                    }
                } else if (reader.closed()) {
                    quit = true;
                }

                controlLoop.runDue();
            }
            reader.join();
        }
    }

    common::Logger::log("Shutdown complete");
    common::Logger::shutdown();
    return exitCode;
}

}  // namespace stemsync::app
