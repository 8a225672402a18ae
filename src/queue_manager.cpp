#include "justdl/queue_manager.hpp"

#include "justdl/errors.hpp"
#include "justdl/url_utils.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {

ProcessPoolOptions poolOptions(const Config& config) {
    ProcessPoolOptions options;
    options.max_concurrency = config.max_concurrency;
    options.liveness_grace = config.liveness_grace;
    options.worker.progress_interval = config.progress_interval;
    options.worker.heartbeat_interval = config.heartbeat_interval;
    return options;
}

} // namespace

QueueManager::QueueManager(Config config, WorkerFactory factory, std::shared_ptr<MediaResolver> resolver)
    : config_(std::move(config)), pool_(poolOptions(config_), std::move(factory)), resolver_(std::move(resolver)) {
    validateConfig(config_);
}

QueueManager::~QueueManager() {
    shutdown();
}

TaskDescriptor QueueManager::makeDescriptor(const std::string& url, TaskKind kind, const std::string& quality,
                                            const std::string& destination) {
    if (!isValidUrl(url)) {
        throw InvalidInputError("malformed URL: '" + url + "'");
    }

    TaskDescriptor task;
    task.url = url;
    task.kind = kind;
    task.destination = destination.empty() ? config_.download_dir.string() : destination;

    switch (kind) {
        case TaskKind::DirectFile:
            task.quality = quality;
            break;
        case TaskKind::MediaVideo:
            task.quality = quality.empty() ? config_.video_quality : quality;
            static_cast<void>(parseVideoQuality(task.quality));
            break;
        case TaskKind::MediaAudioOnly:
            task.quality = quality.empty() ? config_.audio_quality : quality;
            static_cast<void>(parseAudioQuality(task.quality));
            break;
    }
    if (isMediaKind(kind) && !isYouTubeVideoUrl(url)) {
        throw InvalidInputError(fmt::format("{} is not supported for '{}'", toString(kind), url));
    }
    return task;
}

TaskId QueueManager::submit(const std::string& url, TaskKind kind, const std::string& quality,
                            const std::string& destination) {
    auto task = makeDescriptor(url, kind, quality, destination);
    task.id = next_id_++;
    spdlog::info("task {} queued: {} [{}{}{}]", task.id, task.url, toString(task.kind),
                 task.quality.empty() ? "" : " ", task.quality);
    pending_.push_back(task);
    admitPending();
    return task.id;
}

std::vector<TaskId> QueueManager::submitPlaylist(const std::string& url, TaskKind kind, const std::string& quality,
                                                 const std::string& destination) {
    if (!isValidUrl(url) || !isYouTubePlaylistUrl(url)) {
        throw InvalidInputError("not a playlist URL: '" + url + "'");
    }
    if (!isMediaKind(kind)) {
        throw InvalidInputError("playlists can only be fetched as media");
    }
    if (!resolver_) {
        throw InvalidInputError("playlist expansion is not available");
    }

    // validate everything before queueing anything
    std::vector<TaskDescriptor> tasks;
    for (const auto& entry : resolver_->expandPlaylist(url)) {
        tasks.push_back(makeDescriptor(entry, kind, quality, destination));
    }
    if (tasks.empty()) {
        throw UnresolvableSourceError("playlist has no available entries: " + url);
    }

    std::vector<TaskId> ids;
    ids.reserve(tasks.size());
    for (auto& task : tasks) {
        task.id = next_id_++;
        ids.push_back(task.id);
        pending_.push_back(std::move(task));
    }
    spdlog::info("playlist {} queued as tasks {}..{}", url, ids.front(), ids.back());
    admitPending();
    return ids;
}

void QueueManager::tick() {
    for (auto& result : pool_.pollCompleted()) {
        record(std::move(result));
    }
    admitPending();
}

void QueueManager::admitPending() {
    auto free = static_cast<long>(pool_.maxConcurrency()) - static_cast<long>(pool_.activeCount());
    while (free > 0 && !pending_.empty()) {
        const TaskDescriptor& next = pending_.front();
        try {
            if (!pool_.startIfCapacity(next)) {
                break;
            }
            --free;
        } catch (const WorkerCrashError& ex) {
            ResultRecord failed;
            failed.task = next;
            failed.outcome = Outcome::Failure;
            failed.error = ex.kind();
            failed.error_message = ex.what();
            spdlog::error("task {} could not start: {}", next.id, ex.what());
            record(std::move(failed));
        }
        pending_.pop_front();
    }
}

bool QueueManager::cancel(TaskId id) {
    const auto it = std::find_if(pending_.begin(), pending_.end(),
                                 [id](const TaskDescriptor& task) { return task.id == id; });
    if (it != pending_.end()) {
        ResultRecord cancelled;
        cancelled.task = *it;
        cancelled.outcome = Outcome::Cancelled;
        cancelled.error = ErrorKind::Cancelled;
        pending_.erase(it);
        spdlog::info("task {} removed from queue", id);
        record(std::move(cancelled));
        return true;
    }
    if (pool_.isActive(id)) {
        pool_.terminate(id);
        return true;
    }
    return false;
}

TaskId QueueManager::retry(TaskId id) {
    const auto it = retryable_.find(id);
    if (it == retryable_.end()) {
        throw InvalidInputError(fmt::format("task {} has no failed or cancelled result to retry", id));
    }
    const TaskDescriptor old = it->second;
    const auto new_id = submit(old.url, old.kind, old.quality, old.destination);
    retryable_.erase(it);
    spdlog::info("task {} retried as task {}", id, new_id);
    return new_id;
}

Snapshot QueueManager::snapshot() const {
    Snapshot snap;
    snap.pending_count = pending_.size();
    snap.active = pool_.activeProgress();
    snap.results = results_;
    return snap;
}

std::vector<ResultRecord> QueueManager::takeResults() {
    std::vector<ResultRecord> out;
    out.swap(results_);
    return out;
}

void QueueManager::setMaxConcurrency(int value) {
    pool_.setMaxConcurrency(value);
    config_.max_concurrency = pool_.maxConcurrency();
    admitPending();
}

void QueueManager::shutdown() {
    while (!pending_.empty()) {
        cancel(pending_.front().id);
    }
    for (auto& result : pool_.shutdown()) {
        record(std::move(result));
    }
}

std::vector<TaskId> QueueManager::pendingIds() const {
    std::vector<TaskId> ids;
    ids.reserve(pending_.size());
    for (const auto& task : pending_) {
        ids.push_back(task.id);
    }
    return ids;
}

void QueueManager::record(ResultRecord result) {
    spdlog::debug("task {} recorded as {} ({} pending, {} active)", result.task.id, toString(result.outcome),
                  pending_.size(), pool_.activeCount());
    if (result.outcome != Outcome::Success) {
        retryable_.emplace(result.task.id, result.task);
        retryable_order_.push_back(result.task.id);
        while (retryable_order_.size() > kMaxRetryable) {
            retryable_.erase(retryable_order_.front());
            retryable_order_.pop_front();
        }
    }
    results_.push_back(std::move(result));
}

} // namespace justdl
