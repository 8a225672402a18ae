#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace justdl {

using TaskId = std::uint64_t;

enum class TaskKind {
    DirectFile,
    MediaVideo,
    MediaAudioOnly,
};

[[nodiscard]] std::string_view toString(TaskKind kind) noexcept;
[[nodiscard]] inline bool isMediaKind(TaskKind kind) noexcept { return kind != TaskKind::DirectFile; }

// One requested download. Everything but `filename` is fixed once the task
// leaves the pending queue; the worker resolves the final name itself.
struct TaskDescriptor {
    TaskId id{0};
    std::string url;
    TaskKind kind{TaskKind::DirectFile};
    std::string quality;
    std::string destination;
    std::string filename;
};

} // namespace justdl
