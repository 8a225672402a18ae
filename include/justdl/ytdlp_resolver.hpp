#pragma once

#include "media.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace justdl {

// Resolves media pages by running `yt-dlp -J` and reading its JSON.
// A run that outlives `timeout` is killed and reported unresolvable.
class YtDlpResolver final : public MediaResolver {
public:
    explicit YtDlpResolver(std::string program = "yt-dlp",
                           std::chrono::milliseconds timeout = std::chrono::minutes{10});

    [[nodiscard]] MediaInfo resolve(const std::string& url, const CancelFn& should_cancel) override;
    [[nodiscard]] std::vector<std::string> expandPlaylist(const std::string& url) override;

    // Exposed for tests: the yt-dlp JSON -> MediaInfo mapping.
    [[nodiscard]] static MediaInfo parseInfo(const std::string& json_text);
    [[nodiscard]] static std::vector<std::string> parsePlaylist(const std::string& json_text);

private:
    std::string program_;
    std::chrono::milliseconds timeout_;
};

} // namespace justdl
