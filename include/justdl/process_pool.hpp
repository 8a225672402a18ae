#pragma once

#include "channel.hpp"
#include "progress.hpp"
#include "result.hpp"
#include "task.hpp"
#include "worker.hpp"
#include "worker_process.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace justdl {

struct ProcessPoolOptions {
    int max_concurrency{4};
    // How long a worker may stay silent, or linger after closing its channel,
    // or ignore SIGTERM, before it is killed.
    std::chrono::milliseconds liveness_grace{10000};
    WorkerProcessOptions worker{};
};

// Owns the running worker processes. Every call is non-blocking: the pool
// only reads pipes that are ready, reaps with WNOHANG and sends signals.
class ProcessPool {
public:
    ProcessPool(ProcessPoolOptions options, WorkerFactory factory);
    ~ProcessPool();

    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    // Sole admission gate. Returns false, doing nothing, when the pool is
    // full. Throws WorkerCrashError if the process cannot be created.
    bool startIfCapacity(const TaskDescriptor& task);

    // Results for every worker that terminated since the last call, in no
    // particular order.
    [[nodiscard]] std::vector<ResultRecord> pollCompleted();

    // SIGTERM now, SIGKILL once the grace period runs out. No-op for ids that
    // are not running.
    void terminate(TaskId id);

    // Kills everything and reaps it. Blocks until every worker is gone.
    std::vector<ResultRecord> shutdown();

    [[nodiscard]] bool isActive(TaskId id) const;
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.size(); }
    [[nodiscard]] int maxConcurrency() const noexcept { return options_.max_concurrency; }
    void setMaxConcurrency(int value);

    // Snapshot of the active records' progress, ordered by task id.
    [[nodiscard]] std::vector<Progress> activeProgress() const;

private:
    using Clock = std::chrono::steady_clock;

    struct ActiveDownload {
        TaskDescriptor task;
        pid_t pid{-1};
        ChannelReader channel;
        Progress progress;
        Clock::time_point last_message_at;
        std::optional<WorkerMessage> terminal;
        std::optional<Clock::time_point> channel_closed_at;
        std::optional<Clock::time_point> cancel_sent_at;
        bool kill_sent{false};
        std::string crash_reason;
    };

    void drainChannel(ActiveDownload& record, Clock::time_point now);
    void enforceLiveness(ActiveDownload& record, Clock::time_point now);
    void kill(ActiveDownload& record, const std::string& reason);
    [[nodiscard]] ResultRecord finish(ActiveDownload& record, std::optional<int> wait_status,
                                      Clock::time_point now) const;

    ProcessPoolOptions options_;
    WorkerFactory factory_;
    std::unordered_map<TaskId, ActiveDownload> active_;
};

} // namespace justdl
