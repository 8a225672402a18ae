#pragma once

#include "errors.hpp"
#include "task.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace justdl {

enum class Outcome {
    Success,
    Failure,
    Cancelled,
};

[[nodiscard]] std::string_view toString(Outcome outcome) noexcept;

// Terminal record of a task. Created once, never modified.
struct ResultRecord {
    TaskDescriptor task;
    Outcome outcome{Outcome::Failure};
    std::string file_path;
    std::optional<ErrorKind> error;
    std::string error_message;
    std::chrono::milliseconds duration{0};
    std::uint64_t bytes{0};
};

} // namespace justdl
