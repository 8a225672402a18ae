#pragma once

#include "config.hpp"
#include "media.hpp"
#include "process_pool.hpp"
#include "progress.hpp"
#include "result.hpp"
#include "task.hpp"
#include "worker.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace justdl {

// Point-in-time view for the presentation layer.
struct Snapshot {
    std::size_t pending_count{0};
    std::vector<Progress> active;
    std::vector<ResultRecord> results;
};

// Single source of truth for pending, active and finished tasks. Not
// thread-safe: every call must come from the thread that drives tick().
class QueueManager {
public:
    // `resolver` is only needed for playlist expansion.
    QueueManager(Config config, WorkerFactory factory, std::shared_ptr<MediaResolver> resolver = nullptr);
    ~QueueManager();

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    // Validates, queues and admits as far as capacity allows. Empty quality
    // or destination fall back to the configured defaults. Throws
    // InvalidInputError; performs no network I/O.
    TaskId submit(const std::string& url, TaskKind kind, const std::string& quality = {},
                  const std::string& destination = {});

    // Expands a playlist into one task per entry, in playlist order. Throws
    // InvalidInputError or UnresolvableSourceError.
    std::vector<TaskId> submitPlaylist(const std::string& url, TaskKind kind, const std::string& quality = {},
                                       const std::string& destination = {});

    // Reaps finished workers, then admits pending tasks into free slots.
    void tick();

    // Pending: removed at once and recorded as cancelled. Active: asks the
    // worker to stop; the cancelled result shows up on a later tick. Returns
    // false for unknown or already finished ids.
    bool cancel(TaskId id);

    // Re-submits a failed or cancelled task under a new id.
    TaskId retry(TaskId id);

    [[nodiscard]] Snapshot snapshot() const;

    // Hands over the unconsumed results and forgets them.
    std::vector<ResultRecord> takeResults();

    void setMaxConcurrency(int value);

    // Cancels everything pending and stops every worker. Blocks until the
    // workers are reaped.
    void shutdown();

    [[nodiscard]] bool idle() const noexcept { return pending_.empty() && pool_.activeCount() == 0; }
    [[nodiscard]] std::vector<TaskId> pendingIds() const;
    [[nodiscard]] std::size_t activeCount() const noexcept { return pool_.activeCount(); }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    // retry() remembers at most this many failed or cancelled tasks.
    static constexpr std::size_t kMaxRetryable = 1024;

private:
    TaskDescriptor makeDescriptor(const std::string& url, TaskKind kind, const std::string& quality,
                                  const std::string& destination);
    void admitPending();
    void record(ResultRecord result);

    Config config_;
    ProcessPool pool_;
    std::shared_ptr<MediaResolver> resolver_;

    std::deque<TaskDescriptor> pending_;
    std::vector<ResultRecord> results_;
    // failed or cancelled tasks that retry() may still re-submit, oldest first
    std::unordered_map<TaskId, TaskDescriptor> retryable_;
    std::deque<TaskId> retryable_order_;
    TaskId next_id_{1};
};

} // namespace justdl
