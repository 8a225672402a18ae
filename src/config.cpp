#include "justdl/config.hpp"

#include "justdl/errors.hpp"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace justdl {

namespace {

using json = nlohmann::json;

template <typename T>
void readValue(const json& root, const char* key, T& out) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& ex) {
        throw ConfigError(fmt::format("config key '{}': {}", key, ex.what()));
    }
}

void readMillis(const json& root, const char* key, std::chrono::milliseconds& out) {
    long long value = out.count();
    readValue(root, key, value);
    out = std::chrono::milliseconds{value};
}

} // namespace

Config parseConfig(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        throw ConfigError(fmt::format("malformed config: {}", ex.what()));
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    Config config;
    readValue(root, "max_concurrency", config.max_concurrency);
    readMillis(root, "poll_interval_ms", config.poll_interval);

    std::string dir = config.download_dir.string();
    readValue(root, "download_dir", dir);
    config.download_dir = dir;

    const auto retry = root.find("retry_budget");
    if (retry != root.end()) {
        if (!retry->is_object()) {
            throw ConfigError("config key 'retry_budget' must be an object");
        }
        readValue(*retry, "direct_file", config.retry_budget.direct_file);
        readValue(*retry, "media", config.retry_budget.media);
    }

    readMillis(root, "retry_delay_ms", config.retry_delay);
    readValue(root, "segments", config.segments);
    readMillis(root, "progress_interval_ms", config.progress_interval);
    readMillis(root, "heartbeat_interval_ms", config.heartbeat_interval);
    readMillis(root, "liveness_grace_ms", config.liveness_grace);
    readValue(root, "video_quality", config.video_quality);
    readValue(root, "audio_quality", config.audio_quality);
    readValue(root, "ytdlp_path", config.ytdlp_path);
    readValue(root, "ffmpeg_path", config.ffmpeg_path);
    readMillis(root, "subprocess_timeout_ms", config.subprocess_timeout);
    readValue(root, "user_agent", config.user_agent);
    readValue(root, "log_level", config.log_level);
    readValue(root, "log_file", config.log_file);

    validateConfig(config);
    return config;
}

Config loadConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseConfig(buffer.str());
}

void validateConfig(const Config& config) {
    if (config.max_concurrency < 1) {
        throw ConfigError(fmt::format("max_concurrency must be >= 1 (got {})", config.max_concurrency));
    }
    if (config.poll_interval.count() <= 0) {
        throw ConfigError("poll_interval_ms must be positive");
    }
    if (config.retry_budget.direct_file < 1 || config.retry_budget.media < 1) {
        throw ConfigError("retry budgets must allow at least one attempt");
    }
    if (config.retry_delay.count() < 0) {
        throw ConfigError("retry_delay_ms must not be negative");
    }
    if (config.segments < 1 || config.segments > 64) {
        throw ConfigError(fmt::format("segments must be within 1..64 (got {})", config.segments));
    }
    if (config.heartbeat_interval.count() <= 0 || config.liveness_grace <= config.heartbeat_interval) {
        throw ConfigError("liveness_grace_ms must exceed a positive heartbeat_interval_ms");
    }
    if (config.subprocess_timeout.count() <= 0) {
        throw ConfigError("subprocess_timeout_ms must be positive");
    }
    if (config.download_dir.empty()) {
        throw ConfigError("download_dir must not be empty");
    }
}

} // namespace justdl
