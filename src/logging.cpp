#include "justdl/logging.hpp"

#include "justdl/errors.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {
constexpr std::size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;
} // namespace

void initLogging(const std::string& level, const std::string& log_file) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("unknown log level: " + level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxLogFileSize, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            throw ConfigError(std::string{"cannot open log file: "} + ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("justdl", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%P] %v");
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace justdl
