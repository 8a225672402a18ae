#pragma once

#include "channel.hpp"
#include "task.hpp"
#include "worker.hpp"

#include <chrono>

namespace justdl {

struct WorkerProcessOptions {
    std::chrono::milliseconds progress_interval{250};
    std::chrono::milliseconds heartbeat_interval{1000};
};

// Body of a forked worker. Runs the task, writes exactly one terminal message
// to `channel` and leaves through _exit: it never returns into the caller's
// stack, which belongs to the parent's copy of the program.
[[noreturn]] void runWorkerProcess(const TaskDescriptor& task, const WorkerFactory& factory, UniqueFd channel,
                                   const WorkerProcessOptions& options);

} // namespace justdl
