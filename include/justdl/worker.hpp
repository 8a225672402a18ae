#pragma once

#include "message.hpp"
#include "task.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace justdl {

// Handed to a Worker for the duration of one task: progress goes out through
// it, cancellation comes in through it.
class WorkerContext {
public:
    using Sink = std::function<void(const WorkerMessage&)>;

    WorkerContext(Sink sink, std::chrono::milliseconds progress_interval,
                  const std::atomic<bool>* cancel_flag = nullptr);

    // Stage and filename changes are always forwarded.
    void setStage(const std::string& stage);
    void setFilename(const std::string& filename);

    // Thread-safe. Forwarded at most once per progress interval, except the
    // final update where done == total.
    void reportProgress(std::uint64_t done, std::optional<std::uint64_t> total);

    [[nodiscard]] bool cancelRequested() const noexcept;
    void throwIfCancelled() const;
    [[nodiscard]] std::function<bool()> cancelCheck() const;

private:
    void emitLocked(std::chrono::steady_clock::time_point now);

    Sink sink_;
    std::chrono::milliseconds progress_interval_;
    const std::atomic<bool>* cancel_flag_;

    mutable std::mutex mutex_;
    std::string stage_;
    std::string filename_;
    std::uint64_t done_{0};
    std::optional<std::uint64_t> total_;
    double speed_{0.0};
    std::uint64_t last_sent_done_{0};
    std::chrono::steady_clock::time_point last_sent_at_{};
};

struct WorkerOutput {
    std::filesystem::path file_path;
    std::uint64_t bytes{0};
};

// One download strategy. Runs inside the worker process; reports failures by
// throwing justdl::Error subclasses.
class Worker {
public:
    virtual ~Worker() = default;

    virtual WorkerOutput run(const TaskDescriptor& task, WorkerContext& context) = 0;
};

using WorkerPtr = std::unique_ptr<Worker>;
using WorkerFactory = std::function<WorkerPtr(const TaskDescriptor&)>;

} // namespace justdl
