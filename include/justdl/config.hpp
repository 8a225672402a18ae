#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace justdl {

struct RetryBudget {
    int direct_file{3};
    int media{3};
};

struct Config {
    int max_concurrency{4};
    std::chrono::milliseconds poll_interval{1000};
    std::filesystem::path download_dir{"downloads"};
    RetryBudget retry_budget{};
    std::chrono::milliseconds retry_delay{1000};
    int segments{4};
    std::chrono::milliseconds progress_interval{250};
    std::chrono::milliseconds heartbeat_interval{1000};
    std::chrono::milliseconds liveness_grace{10000};
    std::string video_quality{"1080p"};
    std::string audio_quality{"High (m4a)"};
    std::string ytdlp_path{"yt-dlp"};
    std::string ffmpeg_path{"ffmpeg"};
    std::chrono::milliseconds subprocess_timeout{600000};
    std::string user_agent{"justdl/1.0"};
    std::string log_level{"info"};
    std::string log_file;
};

// Reads a JSON configuration file on top of the defaults. Keys that are
// absent keep their default; unknown keys are ignored.
[[nodiscard]] Config loadConfig(const std::filesystem::path& path);
[[nodiscard]] Config parseConfig(const std::string& json_text);

// Throws ConfigError when a value is out of range.
void validateConfig(const Config& config);

} // namespace justdl
