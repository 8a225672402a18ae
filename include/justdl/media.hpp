#pragma once

#include "fetcher.hpp"
#include "task.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace justdl {

// One downloadable rendition of a media item.
struct StreamDescriptor {
    std::string url;
    std::string format_id;
    std::string quality_label;  // "720p", "128k"
    std::string container;      // "mp4", "webm", "m4a"
    int height{0};
    double bitrate{0.0};        // kbit/s
    bool has_video{false};
    bool has_audio{false};
    std::optional<std::uint64_t> size;
    HttpHeaders headers;
};

struct MediaInfo {
    std::string title;
    std::vector<StreamDescriptor> streams;
};

// Turns a page URL into concrete streams. Throws UnresolvableSourceError.
class MediaResolver {
public:
    virtual ~MediaResolver() = default;

    [[nodiscard]] virtual MediaInfo resolve(const std::string& url, const CancelFn& should_cancel) = 0;
    [[nodiscard]] virtual std::vector<std::string> expandPlaylist(const std::string& url) = 0;
};

// Combines separately fetched video and audio. Throws MediaProcessingError.
class Muxer {
public:
    virtual ~Muxer() = default;

    virtual void mux(const std::filesystem::path& video, const std::filesystem::path& audio,
                     const std::filesystem::path& output, const CancelFn& should_cancel) = 0;
};

// "1080p", "2160p (4K)" -> height; "best" or empty -> no limit.
// Throws InvalidInputError for anything else.
[[nodiscard]] std::optional<int> parseVideoQuality(const std::string& tag);

// Audio preset ("High (m4a)", ...) or "<n>k" -> kbit/s.
// Throws InvalidInputError for anything else.
[[nodiscard]] int parseAudioQuality(const std::string& tag);

// Highest height not above the request; ties go to higher bitrate, then mp4,
// then resolver order. Falls back to the lowest height above the request.
[[nodiscard]] std::optional<StreamDescriptor> selectVideoStream(const std::vector<StreamDescriptor>& streams,
                                                                const std::string& quality);

// Audio-only streams: highest bitrate not above the target, m4a on ties,
// else the lowest above it.
[[nodiscard]] std::optional<StreamDescriptor> selectAudioStream(const std::vector<StreamDescriptor>& streams,
                                                                const std::string& quality);

struct StreamSelection {
    std::optional<StreamDescriptor> video;
    std::optional<StreamDescriptor> audio;

    [[nodiscard]] bool needsMux() const noexcept { return video && audio; }
};

// Throws UnresolvableSourceError when the kind cannot be satisfied.
[[nodiscard]] StreamSelection selectStreams(const MediaInfo& info, TaskKind kind, const std::string& video_quality,
                                            const std::string& audio_quality);

} // namespace justdl
