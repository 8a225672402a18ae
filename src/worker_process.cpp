#include "justdl/worker_process.hpp"

#include "justdl/errors.hpp"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <system_error>
#include <thread>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace justdl {

namespace {

// Set from the SIGTERM handler; only ever touched inside a worker process.
std::atomic<bool> g_cancel_requested{false};

extern "C" void onTerminate(int) {
    g_cancel_requested.store(true, std::memory_order_relaxed);
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = onTerminate;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGTERM, &action, nullptr);

    // The coordinator owns interactive shutdown; a write to a vanished
    // coordinator should fail with EPIPE instead of killing us.
    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGPIPE, SIG_IGN);
}

class Heartbeat {
public:
    Heartbeat(ChannelWriter& writer, std::chrono::milliseconds interval)
        : writer_(writer), interval_(interval), thread_([this] { loop(); }) {}

    ~Heartbeat() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_one();
        thread_.join();
    }

private:
    void loop() {
        WorkerMessage beat;
        beat.type = WorkerMessage::Type::Heartbeat;
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, interval_, [this] { return stop_; })) {
            try {
                writer_.send(beat);
            } catch (const std::system_error&) {
                return;
            }
        }
    }

    ChannelWriter& writer_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::thread thread_;
};

WorkerMessage failure(ErrorKind kind, const std::string& message) {
    WorkerMessage msg;
    msg.type = WorkerMessage::Type::Failed;
    msg.error = kind;
    msg.error_message = message;
    return msg;
}

WorkerMessage execute(const TaskDescriptor& task, const WorkerFactory& factory, ChannelWriter& writer,
                      const WorkerProcessOptions& options) {
    WorkerContext context([&writer](const WorkerMessage& msg) { writer.send(msg); }, options.progress_interval,
                          &g_cancel_requested);
    try {
        context.setStage("starting");
        auto worker = factory(task);
        if (!worker) {
            return failure(ErrorKind::WorkerCrash, "no worker for task kind");
        }
        const auto output = worker->run(task, context);

        WorkerMessage done;
        done.type = WorkerMessage::Type::Completed;
        done.file_path = output.file_path.string();
        done.downloaded_bytes = output.bytes;
        spdlog::info("task {} finished: {}", task.id, done.file_path);
        return done;
    } catch (const CancelledError&) {
        spdlog::info("task {} cancelled", task.id);
    } catch (const Error& ex) {
        if (!context.cancelRequested()) {
            spdlog::error("task {} failed ({}): {}", task.id, toString(ex.kind()), ex.what());
            return failure(ex.kind(), ex.what());
        }
    } catch (const std::exception& ex) {
        if (!context.cancelRequested()) {
            spdlog::error("task {} failed unexpectedly: {}", task.id, ex.what());
            return failure(ErrorKind::WorkerCrash, ex.what());
        }
    }

    WorkerMessage cancelled;
    cancelled.type = WorkerMessage::Type::Cancelled;
    return cancelled;
}

} // namespace

void runWorkerProcess(const TaskDescriptor& task, const WorkerFactory& factory, UniqueFd channel,
                      const WorkerProcessOptions& options) {
    installSignalHandlers();

    int exit_code = 0;
    try {
        ChannelWriter writer{std::move(channel)};
        WorkerMessage terminal;
        {
            Heartbeat heartbeat{writer, options.heartbeat_interval};
            terminal = execute(task, factory, writer, options);
        }
        writer.send(terminal);
        exit_code = terminal.type == WorkerMessage::Type::Completed ? 0 : 1;
    } catch (const std::exception& ex) {
        spdlog::error("task {}: worker could not report: {}", task.id, ex.what());
        exit_code = 2;
    }

    spdlog::default_logger()->flush();
    ::_exit(exit_code);
}

} // namespace justdl
