#include "justdl/process_pool.hpp"

#include "justdl/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace justdl {

namespace {

std::string describeExit(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exit code {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return fmt::format("signal {} ({})", WTERMSIG(status), strsignal(WTERMSIG(status)));
    }
    return "unknown status";
}

} // namespace

ProcessPool::ProcessPool(ProcessPoolOptions options, WorkerFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    options_.max_concurrency = std::max(1, options_.max_concurrency);
    spdlog::debug("process pool ready, max_concurrency={}", options_.max_concurrency);
}

ProcessPool::~ProcessPool() {
    if (!active_.empty()) {
        shutdown();
    }
}

void ProcessPool::setMaxConcurrency(int value) {
    options_.max_concurrency = std::max(1, value);
    spdlog::info("max concurrency set to {}", options_.max_concurrency);
}

bool ProcessPool::isActive(TaskId id) const {
    return active_.find(id) != active_.end();
}

bool ProcessPool::startIfCapacity(const TaskDescriptor& task) {
    if (active_.size() >= static_cast<std::size_t>(options_.max_concurrency)) {
        return false;
    }
    if (active_.count(task.id) != 0) {
        throw InvalidInputError(fmt::format("task {} is already running", task.id));
    }

    ChannelPair channel;
    try {
        channel = makeChannel();
    } catch (const std::system_error& ex) {
        throw WorkerCrashError(fmt::format("cannot create channel for task {}: {}", task.id, ex.what()));
    }

    spdlog::default_logger()->flush();
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw WorkerCrashError(fmt::format("cannot fork worker for task {}: {}", task.id, std::strerror(errno)));
    }
    if (pid == 0) {
        // child: the other workers' pipes are close-on-exec but we never exec,
        // so drop them explicitly
        for (auto& [id, record] : active_) {
            record.channel = ChannelReader{};
        }
        channel.reader = ChannelReader{};
        runWorkerProcess(task, factory_, std::move(channel.writer_fd), options_.worker);
    }
    channel.writer_fd.reset();

    const auto now = Clock::now();
    ActiveDownload record;
    record.task = task;
    record.pid = pid;
    record.channel = std::move(channel.reader);
    record.progress.id = task.id;
    record.progress.url = task.url;
    record.progress.filename = task.filename;
    record.progress.stage = "starting";
    record.progress.started_at = now;
    record.last_message_at = now;
    active_.emplace(task.id, std::move(record));

    spdlog::info("task {} started in worker {} ({}/{} slots)", task.id, pid, active_.size(),
                 options_.max_concurrency);
    return true;
}

void ProcessPool::drainChannel(ActiveDownload& record, Clock::time_point now) {
    if (record.channel.closed()) {
        return;
    }

    std::vector<WorkerMessage> messages;
    const bool open = record.channel.drain(messages);
    if (!messages.empty()) {
        record.last_message_at = now;
    }
    for (auto& msg : messages) {
        if (record.terminal) {
            spdlog::warn("task {}: ignoring message after terminal result", record.task.id);
            continue;
        }
        switch (msg.type) {
            case WorkerMessage::Type::Progress:
                record.progress.stage = msg.stage;
                record.progress.downloaded_bytes = msg.downloaded_bytes;
                record.progress.total_bytes = msg.total_bytes;
                record.progress.speed = msg.speed;
                if (!msg.filename.empty()) {
                    record.progress.filename = msg.filename;
                }
                break;
            case WorkerMessage::Type::Heartbeat:
                break;
            case WorkerMessage::Type::Completed:
            case WorkerMessage::Type::Failed:
            case WorkerMessage::Type::Cancelled:
                record.terminal = std::move(msg);
                break;
        }
    }
    if (!open) {
        record.channel_closed_at = now;
    }
}

void ProcessPool::kill(ActiveDownload& record, const std::string& reason) {
    if (record.kill_sent) {
        return;
    }
    spdlog::warn("task {}: killing worker {}: {}", record.task.id, record.pid, reason);
    if (::kill(record.pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::error("task {}: kill({}) failed: {}", record.task.id, record.pid, std::strerror(errno));
    }
    record.kill_sent = true;
    if (record.crash_reason.empty()) {
        record.crash_reason = reason;
    }
}

void ProcessPool::enforceLiveness(ActiveDownload& record, Clock::time_point now) {
    const auto grace = options_.liveness_grace;
    if (record.cancel_sent_at && now - *record.cancel_sent_at > grace) {
        kill(record, "did not stop after SIGTERM");
    } else if (record.channel_closed_at && now - *record.channel_closed_at > grace) {
        kill(record, "channel closed but process did not exit");
    } else if (!record.channel_closed_at && now - record.last_message_at > grace) {
        kill(record, "unresponsive");
    }
}

std::vector<ResultRecord> ProcessPool::pollCompleted() {
    std::vector<ResultRecord> results;
    const auto now = Clock::now();

    for (auto it = active_.begin(); it != active_.end();) {
        auto& record = it->second;
        drainChannel(record, now);

        int status = 0;
        const pid_t reaped = ::waitpid(record.pid, &status, WNOHANG);
        if (reaped == 0) {
            enforceLiveness(record, now);
            ++it;
            continue;
        }

        std::optional<int> wait_status;
        if (reaped == record.pid) {
            wait_status = status;
            // whatever the worker wrote right before exiting
            drainChannel(record, now);
        } else {
            spdlog::error("task {}: worker {} vanished: {}", record.task.id, record.pid, std::strerror(errno));
        }

        results.push_back(finish(record, wait_status, now));
        it = active_.erase(it);
    }
    return results;
}

ResultRecord ProcessPool::finish(ActiveDownload& record, std::optional<int> wait_status,
                                 Clock::time_point now) const {
    ResultRecord result;
    result.task = record.task;
    if (!record.progress.filename.empty()) {
        result.task.filename = record.progress.filename;
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - record.progress.started_at);
    result.bytes = record.progress.downloaded_bytes;

    const bool cancel_requested = record.cancel_sent_at.has_value();
    const auto& terminal = record.terminal;

    if (terminal && terminal->type == WorkerMessage::Type::Completed) {
        result.outcome = Outcome::Success;
        result.file_path = terminal->file_path;
        result.bytes = terminal->downloaded_bytes;
        result.task.filename = std::filesystem::path(terminal->file_path).filename().string();
    } else if (cancel_requested || (terminal && terminal->type == WorkerMessage::Type::Cancelled)) {
        result.outcome = Outcome::Cancelled;
        result.error = ErrorKind::Cancelled;
    } else if (terminal && terminal->type == WorkerMessage::Type::Failed) {
        result.outcome = Outcome::Failure;
        result.error = terminal->error;
        result.error_message = terminal->error_message;
    } else {
        result.outcome = Outcome::Failure;
        result.error = ErrorKind::WorkerCrash;
        if (!record.crash_reason.empty()) {
            result.error_message = "worker " + record.crash_reason;
        } else if (wait_status) {
            result.error_message = "worker ended without reporting: " + describeExit(*wait_status);
        } else {
            result.error_message = "worker process vanished";
        }
    }

    switch (result.outcome) {
        case Outcome::Success:
            spdlog::info("task {} completed: {} ({} ms)", result.task.id, result.file_path, result.duration.count());
            break;
        case Outcome::Cancelled:
            spdlog::info("task {} cancelled", result.task.id);
            break;
        case Outcome::Failure:
            spdlog::error("task {} failed [{}]: {}", result.task.id, toString(*result.error), result.error_message);
            break;
    }
    return result;
}

void ProcessPool::terminate(TaskId id) {
    const auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }
    auto& record = it->second;
    if (record.cancel_sent_at) {
        return;
    }
    spdlog::info("task {}: sending SIGTERM to worker {}", id, record.pid);
    if (::kill(record.pid, SIGTERM) != 0 && errno != ESRCH) {
        spdlog::error("task {}: kill({}) failed: {}", id, record.pid, std::strerror(errno));
    }
    record.cancel_sent_at = Clock::now();
}

std::vector<ResultRecord> ProcessPool::shutdown() {
    if (!active_.empty()) {
        spdlog::info("stopping {} worker(s)", active_.size());
    }
    for (auto& [id, record] : active_) {
        if (!record.cancel_sent_at) {
            record.cancel_sent_at = Clock::now();
        }
        kill(record, "stopped at shutdown");
    }

    std::vector<ResultRecord> results;
    const auto now = Clock::now();
    for (auto& [id, record] : active_) {
        int status = 0;
        pid_t reaped = -1;
        do {
            reaped = ::waitpid(record.pid, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        results.push_back(finish(record, reaped == record.pid ? std::optional<int>(status) : std::nullopt, now));
    }
    active_.clear();
    return results;
}

std::vector<Progress> ProcessPool::activeProgress() const {
    std::vector<Progress> out;
    out.reserve(active_.size());
    for (const auto& [id, record] : active_) {
        out.push_back(record.progress);
    }
    std::sort(out.begin(), out.end(), [](const Progress& a, const Progress& b) { return a.id < b.id; });
    return out;
}

} // namespace justdl
