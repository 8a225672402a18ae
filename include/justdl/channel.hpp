#pragma once

#include "message.hpp"

#include <mutex>
#include <utility>
#include <vector>

namespace justdl {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }
    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

// Worker side of a progress channel. Writes block when the pipe is full,
// which throttles a worker that outpaces the coordinator.
class ChannelWriter {
public:
    ChannelWriter() = default;
    explicit ChannelWriter(UniqueFd fd) : fd_(std::move(fd)) {}

    // Thread-safe. Throws std::system_error when the reader is gone.
    void send(const WorkerMessage& message);

private:
    UniqueFd fd_;
    std::mutex mutex_;
};

// Coordinator side. Never blocks.
class ChannelReader {
public:
    ChannelReader() = default;
    explicit ChannelReader(UniqueFd fd);

    // Reads everything currently available. Returns false once the writer
    // end is closed and all data has been consumed.
    bool drain(std::vector<WorkerMessage>& out);

    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    UniqueFd fd_;
    MessageDecoder decoder_;
    bool closed_{false};
};

struct ChannelPair {
    ChannelReader reader;
    UniqueFd writer_fd;
};

// Creates a close-on-exec pipe. Throws std::system_error.
[[nodiscard]] ChannelPair makeChannel();

} // namespace justdl
