#include "justdl/ffmpeg_muxer.hpp"

#include "justdl/detail/subprocess.hpp"
#include "justdl/errors.hpp"

#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {
constexpr std::size_t kStderrTail = 512;
} // namespace

FfmpegMuxer::FfmpegMuxer(std::string program, std::chrono::milliseconds timeout)
    : program_(std::move(program)), timeout_(timeout) {}

void FfmpegMuxer::mux(const std::filesystem::path& video, const std::filesystem::path& audio,
                      const std::filesystem::path& output, const CancelFn& should_cancel) {
    const std::vector<std::string> args{
        "-hide_banner", "-loglevel", "error", "-y",
        "-i", video.string(),
        "-i", audio.string(),
        "-map", "0:v:0", "-map", "1:a:0",
        "-c", "copy",
        output.string(),
    };
    spdlog::debug("running {} {}", program_, fmt::join(args, " "));

    detail::ProcessResult result;
    try {
        result = detail::runProcess(program_, args, should_cancel, timeout_);
    } catch (const std::system_error& ex) {
        throw MediaProcessingError(fmt::format("cannot run {}: {}", program_, ex.what()));
    } catch (const detail::ProcessTimeoutError& ex) {
        throw MediaProcessingError(ex.what());
    }

    if (result.exit_code != 0) {
        auto tail = result.err.size() > kStderrTail ? result.err.substr(result.err.size() - kStderrTail) : result.err;
        throw MediaProcessingError(fmt::format("{} failed with code {}: {}", program_, result.exit_code, tail));
    }
    spdlog::info("muxed {}", output.filename().string());
}

} // namespace justdl
