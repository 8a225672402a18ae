#include "justdl/config.hpp"
#include "justdl/console_view.hpp"
#include "justdl/detail/curl_utils.hpp"
#include "justdl/errors.hpp"
#include "justdl/logging.hpp"
#include "justdl/queue_manager.hpp"
#include "justdl/url_utils.hpp"
#include "justdl/workers.hpp"
#include "justdl/ytdlp_resolver.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void onInterrupt(int) {
    g_interrupted.store(true);
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -c <file>          Read settings from a JSON file\n"
              << "  -d <directory>     Download directory (default: ./downloads)\n"
              << "  -j <jobs>          Maximum concurrent downloads (default: 4)\n"
              << "  -t <segments>      Connections per direct download (default: 4)\n"
              << "  -q <quality>       Video quality, e.g. 1080p, 720p or best (default: 1080p)\n"
              << "  -a <quality>       Audio quality, e.g. \"High (m4a)\" or 128k\n"
              << "  --audio-only       Fetch only the audio of media URLs\n"
              << "  --log-level <lvl>  trace, debug, info, warn, error, critical or off\n"
              << "  --log-file <file>  Also write logs to a rotating file\n"
              << "  -h, --help         Show this message" << std::endl;
}

int parseCount(const std::string& option, const std::string& value) {
    std::size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw justdl::ConfigError("invalid value for " + option + ": " + value);
    }
    if (used != value.size()) {
        throw justdl::ConfigError("invalid value for " + option + ": " + value);
    }
    return parsed;
}

// Options given on the command line; they override the config file.
struct CliOptions {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> download_dir;
    std::optional<int> jobs;
    std::optional<int> segments;
    std::optional<std::string> video_quality;
    std::optional<std::string> audio_quality;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool audio_only{false};
    std::vector<std::string> urls;
};

justdl::Config buildConfig(const CliOptions& cli) {
    justdl::Config config = cli.config_file ? justdl::loadConfig(*cli.config_file) : justdl::Config{};
    if (cli.download_dir) config.download_dir = *cli.download_dir;
    if (cli.jobs) config.max_concurrency = *cli.jobs;
    if (cli.segments) config.segments = *cli.segments;
    if (cli.video_quality) config.video_quality = *cli.video_quality;
    if (cli.audio_quality) config.audio_quality = *cli.audio_quality;
    if (cli.log_level) config.log_level = *cli.log_level;
    if (cli.log_file) config.log_file = *cli.log_file;
    justdl::validateConfig(config);
    return config;
}

void submitUrl(justdl::QueueManager& manager, const std::string& url, bool audio_only) {
    const auto media_kind = audio_only ? justdl::TaskKind::MediaAudioOnly : justdl::TaskKind::MediaVideo;
    if (justdl::isYouTubePlaylistUrl(url)) {
        const auto ids = manager.submitPlaylist(url, media_kind);
        std::cout << "Queued playlist " << url << " (" << ids.size() << " videos)" << std::endl;
    } else if (justdl::isYouTubeVideoUrl(url)) {
        manager.submit(url, media_kind);
    } else {
        manager.submit(url, justdl::TaskKind::DirectFile);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        CliOptions cli;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "--audio-only") {
                cli.audio_only = true;
                ++arg_index;
                continue;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const char* value = argv[arg_index + 1];
            if (option == "-c") {
                cli.config_file = value;
            } else if (option == "-d") {
                cli.download_dir = value;
            } else if (option == "-j") {
                cli.jobs = parseCount(option, value);
            } else if (option == "-t") {
                cli.segments = parseCount(option, value);
            } else if (option == "-q") {
                cli.video_quality = value;
            } else if (option == "-a") {
                cli.audio_quality = value;
            } else if (option == "--log-level") {
                cli.log_level = value;
            } else if (option == "--log-file") {
                cli.log_file = value;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        for (; arg_index < argc; ++arg_index) {
            cli.urls.emplace_back(argv[arg_index]);
        }
        if (cli.urls.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        const auto config = buildConfig(cli);
        justdl::initLogging(config.log_level, config.log_file);
        justdl::detail::ensureCurlInitialized();

        std::error_code ec;
        std::filesystem::create_directories(config.download_dir, ec);
        if (ec) {
            throw justdl::FilesystemError("Failed to create download directory: " +
                                          config.download_dir.string() + " - " + ec.message());
        }

        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        justdl::QueueManager manager(config, justdl::makeWorkerFactory(config),
                                     std::make_shared<justdl::YtDlpResolver>(config.ytdlp_path, config.subprocess_timeout));

        // A rejected URL does not stop the others.
        std::size_t rejected = 0;
        for (const auto& url : cli.urls) {
            try {
                submitUrl(manager, url, cli.audio_only);
            } catch (const justdl::Error& ex) {
                ++rejected;
                spdlog::error("{}: {}", url, ex.what());
            }
        }

        justdl::ConsoleView view(std::cout);
        while (!manager.idle()) {
            if (g_interrupted.load()) {
                spdlog::warn("interrupted, cancelling all downloads");
                manager.shutdown();
                break;
            }
            manager.tick();
            view.addResults(manager.takeResults());
            view.render(manager.snapshot());
            std::this_thread::sleep_for(config.poll_interval);
        }
        manager.tick();
        view.addResults(manager.takeResults());
        view.render(manager.snapshot());
        view.printSummary();

        if (g_interrupted.load()) {
            return 130;
        }
        for (const auto& result : view.results()) {
            if (result.outcome != justdl::Outcome::Success) {
                return 1;
            }
        }
        return rejected == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
