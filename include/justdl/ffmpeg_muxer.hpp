#pragma once

#include "media.hpp"

#include <chrono>
#include <string>

namespace justdl {

// Stream-copies one video and one audio input into `output`.
class FfmpegMuxer final : public Muxer {
public:
    explicit FfmpegMuxer(std::string program = "ffmpeg",
                         std::chrono::milliseconds timeout = std::chrono::minutes{10});

    void mux(const std::filesystem::path& video, const std::filesystem::path& audio,
             const std::filesystem::path& output, const CancelFn& should_cancel) override;

private:
    std::string program_;
    std::chrono::milliseconds timeout_;
};

} // namespace justdl
