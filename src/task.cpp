#include "justdl/task.hpp"

namespace justdl {

std::string_view toString(TaskKind kind) noexcept {
    switch (kind) {
        case TaskKind::DirectFile: return "direct-file";
        case TaskKind::MediaVideo: return "media-video";
        case TaskKind::MediaAudioOnly: return "media-audio-only";
    }
    return "unknown";
}

} // namespace justdl
