#pragma once

#include "task.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace justdl {

// Last-known state of one running task, as reported by its worker.
struct Progress {
    TaskId id{0};
    std::string url;
    std::string filename;
    std::string stage;
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    double speed{0.0};  // bytes per second
    std::chrono::steady_clock::time_point started_at{};
};

} // namespace justdl
