#include "justdl/channel.hpp"

#include <array>
#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace justdl {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

void ChannelWriter::send(const WorkerMessage& message) {
    const std::string line = encodeMessage(message);

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = ::write(fd_.get(), line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "progress channel write");
        }
        written += static_cast<std::size_t>(n);
    }
}

ChannelReader::ChannelReader(UniqueFd fd) : fd_(std::move(fd)) {
    const int flags = ::fcntl(fd_.get(), F_GETFL);
    if (flags < 0 || ::fcntl(fd_.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "progress channel fcntl");
    }
}

bool ChannelReader::drain(std::vector<WorkerMessage>& out) {
    if (closed_) {
        return false;
    }

    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t n = ::read(fd_.get(), buffer.data(), buffer.size());
        if (n > 0) {
            decoder_.feed(buffer.data(), static_cast<std::size_t>(n), out);
            continue;
        }
        if (n == 0) {
            if (decoder_.hasPartial()) {
                spdlog::warn("progress channel closed mid-message");
            }
            closed_ = true;
            fd_.reset();
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::error("progress channel read failed: {}", std::generic_category().message(errno));
        closed_ = true;
        fd_.reset();
        return false;
    }
}

ChannelPair makeChannel() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return ChannelPair{ChannelReader{UniqueFd{fds[0]}}, UniqueFd{fds[1]}};
}

} // namespace justdl
