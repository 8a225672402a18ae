#include "justdl/media.hpp"

#include "justdl/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <string_view>
#include <utility>

namespace justdl {

namespace {

constexpr std::array<std::pair<std::string_view, int>, 6> kAudioPresets{{
    {"High (opus)", 160},
    {"High (m4a)", 128},
    {"Medium (opus)", 128},
    {"Medium (m4a)", 96},
    {"Low (opus)", 96},
    {"Low (m4a)", 64},
}};

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Parses "<digits><suffix>..." and returns the number, or -1.
int leadingNumber(const std::string& tag, char suffix) {
    std::size_t pos = 0;
    while (pos < tag.size() && std::isdigit(static_cast<unsigned char>(tag[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos > 6 || pos >= tag.size() || std::tolower(static_cast<unsigned char>(tag[pos])) != suffix) {
        return -1;
    }
    return std::stoi(tag.substr(0, pos));
}

// a is "better" than b among streams of equal rank
bool preferred(const StreamDescriptor& a, const StreamDescriptor& b, const char* container) {
    if (a.bitrate != b.bitrate) {
        return a.bitrate > b.bitrate;
    }
    return a.container == container && b.container != container;
}

template <typename Rank>
std::optional<StreamDescriptor> pickClosest(const std::vector<const StreamDescriptor*>& candidates, Rank rank,
                                            double limit, const char* container) {
    const StreamDescriptor* below = nullptr;
    const StreamDescriptor* above = nullptr;
    for (const auto* stream : candidates) {
        const double value = rank(*stream);
        if (value <= limit) {
            if (!below || value > rank(*below) || (value == rank(*below) && preferred(*stream, *below, container))) {
                below = stream;
            }
        } else if (!above || value < rank(*above) ||
                   (value == rank(*above) && preferred(*stream, *above, container))) {
            above = stream;
        }
    }
    const auto* chosen = below ? below : above;
    if (!chosen) {
        return std::nullopt;
    }
    return *chosen;
}

} // namespace

std::optional<int> parseVideoQuality(const std::string& tag) {
    const auto normalized = lower(tag);
    if (normalized.empty() || normalized == "best") {
        return std::nullopt;
    }
    const int height = leadingNumber(normalized, 'p');
    if (height <= 0) {
        throw InvalidInputError("unsupported video quality: " + tag);
    }
    return height;
}

int parseAudioQuality(const std::string& tag) {
    for (const auto& [name, bitrate] : kAudioPresets) {
        if (tag == name) {
            return bitrate;
        }
    }
    const auto normalized = lower(tag);
    if (normalized.empty() || normalized == "best") {
        return std::numeric_limits<int>::max();
    }
    const int bitrate = leadingNumber(normalized, 'k');
    if (bitrate <= 0) {
        throw InvalidInputError("unsupported audio quality: " + tag);
    }
    return bitrate;
}

std::optional<StreamDescriptor> selectVideoStream(const std::vector<StreamDescriptor>& streams,
                                                  const std::string& quality) {
    const auto limit = parseVideoQuality(quality);
    std::vector<const StreamDescriptor*> candidates;
    for (const auto& stream : streams) {
        if (stream.has_video && stream.height > 0) {
            candidates.push_back(&stream);
        }
    }
    return pickClosest(candidates, [](const StreamDescriptor& s) { return static_cast<double>(s.height); },
                       limit ? static_cast<double>(*limit) : std::numeric_limits<double>::max(), "mp4");
}

std::optional<StreamDescriptor> selectAudioStream(const std::vector<StreamDescriptor>& streams,
                                                  const std::string& quality) {
    const int target = parseAudioQuality(quality);
    std::vector<const StreamDescriptor*> candidates;
    for (const auto& stream : streams) {
        if (stream.has_audio && !stream.has_video) {
            candidates.push_back(&stream);
        }
    }
    return pickClosest(candidates, [](const StreamDescriptor& s) { return s.bitrate; }, static_cast<double>(target),
                       "m4a");
}

StreamSelection selectStreams(const MediaInfo& info, TaskKind kind, const std::string& video_quality,
                              const std::string& audio_quality) {
    StreamSelection selection;
    if (kind == TaskKind::MediaAudioOnly) {
        selection.audio = selectAudioStream(info.streams, audio_quality);
        if (!selection.audio) {
            throw UnresolvableSourceError("no audio stream available for '" + info.title + "'");
        }
        return selection;
    }

    selection.video = selectVideoStream(info.streams, video_quality);
    if (!selection.video) {
        throw UnresolvableSourceError("no video stream available for '" + info.title + "'");
    }
    if (!selection.video->has_audio) {
        selection.audio = selectAudioStream(info.streams, audio_quality);
        if (!selection.audio) {
            throw UnresolvableSourceError("no audio stream to pair with video for '" + info.title + "'");
        }
    }
    return selection;
}

} // namespace justdl
