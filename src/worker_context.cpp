#include "justdl/worker.hpp"

#include "justdl/errors.hpp"

namespace justdl {

WorkerContext::WorkerContext(Sink sink, std::chrono::milliseconds progress_interval,
                             const std::atomic<bool>* cancel_flag)
    : sink_(std::move(sink)), progress_interval_(progress_interval), cancel_flag_(cancel_flag) {}

void WorkerContext::setStage(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    stage_ = stage;
    emitLocked(std::chrono::steady_clock::now());
}

void WorkerContext::setFilename(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    filename_ = filename;
    emitLocked(std::chrono::steady_clock::now());
}

void WorkerContext::reportProgress(std::uint64_t done, std::optional<std::uint64_t> total) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = done;
    total_ = total;

    const bool finished = total && done >= *total;
    if (!finished && now - last_sent_at_ < progress_interval_) {
        return;
    }

    const auto elapsed = std::chrono::duration<double>(now - last_sent_at_).count();
    if (elapsed > 0.0 && done >= last_sent_done_) {
        speed_ = static_cast<double>(done - last_sent_done_) / elapsed;
    }
    emitLocked(now);
}

void WorkerContext::emitLocked(std::chrono::steady_clock::time_point now) {
    WorkerMessage msg;
    msg.type = WorkerMessage::Type::Progress;
    msg.stage = stage_;
    msg.filename = filename_;
    msg.downloaded_bytes = done_;
    msg.total_bytes = total_;
    msg.speed = speed_;

    last_sent_done_ = done_;
    last_sent_at_ = now;
    if (sink_) {
        sink_(msg);
    }
}

bool WorkerContext::cancelRequested() const noexcept {
    return cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed);
}

void WorkerContext::throwIfCancelled() const {
    if (cancelRequested()) {
        throw CancelledError();
    }
}

std::function<bool()> WorkerContext::cancelCheck() const {
    return [this] { return cancelRequested(); };
}

} // namespace justdl
