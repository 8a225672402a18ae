#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace justdl::detail {

struct ProcessResult {
    int exit_code{0};  // negative signal number if killed by a signal
    std::string out;
    std::string err;
};

// Thrown when a child outlives its deadline; the child has been reaped.
class ProcessTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs `program` (looked up on PATH) with `args`, capturing stdout and
// stderr. When `should_cancel` turns true the child is stopped and
// CancelledError is thrown. A positive `timeout` bounds the run; past it the
// child is stopped and ProcessTimeoutError is thrown. Stopping sends SIGTERM,
// then SIGKILL if the child is still alive after a short grace.
// Throws std::system_error if the spawn fails.
[[nodiscard]] ProcessResult runProcess(const std::string& program, const std::vector<std::string>& args,
                                       const std::function<bool()>& should_cancel = {},
                                       std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

} // namespace justdl::detail
