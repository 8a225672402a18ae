#include "justdl/detail/subprocess.hpp"

#include "justdl/channel.hpp"
#include "justdl/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <chrono>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace justdl::detail {

namespace {

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

std::pair<UniqueFd, UniqueFd> makePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return {UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

int exitCode(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return WIFSIGNALED(status) ? -WTERMSIG(status) : -1;
}

int waitForExit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exitCode(status);
}

// SIGTERM first; SIGKILL once the child ignores it for `grace`.
void stopChild(pid_t pid, std::chrono::milliseconds grace) {
    ::kill(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid || (reaped < 0 && errno != EINTR)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    ::kill(pid, SIGKILL);
    waitForExit(pid);
}

constexpr std::chrono::milliseconds kStopGrace{2000};

} // namespace

ProcessResult runProcess(const std::string& program, const std::vector<std::string>& args,
                         const std::function<bool()>& should_cancel, std::chrono::milliseconds timeout) {
    auto [out_read, out_write] = makePipe();
    auto [err_read, err_write] = makePipe();

    SpawnActions actions;
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), out_write.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.get(), err_write.get(), STDERR_FILENO);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, program.c_str(), actions.get(), nullptr, argv.data(), environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "spawn " + program);
    }
    out_write.reset();
    err_write.reset();

    ProcessResult result;
    std::array<pollfd, 2> fds{{{out_read.get(), POLLIN, 0}, {err_read.get(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.out, &result.err};
    std::array<char, 4096> buffer{};
    int open_streams = 2;
    const auto started = std::chrono::steady_clock::now();

    while (open_streams > 0) {
        if (should_cancel && should_cancel()) {
            stopChild(pid, kStopGrace);
            throw CancelledError();
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - started >= timeout) {
            stopChild(pid, kStopGrace);
            throw ProcessTimeoutError(fmt::format("{} did not finish within {} ms", program, timeout.count()));
        }

        const int ready = ::poll(fds.data(), fds.size(), 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(pid, SIGKILL);
            waitForExit(pid);
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    // both streams closed; the child may still linger before exiting
    while (timeout.count() > 0) {
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            result.exit_code = exitCode(status);
            return result;
        }
        if (reaped < 0 && errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
        if (std::chrono::steady_clock::now() - started >= timeout) {
            stopChild(pid, kStopGrace);
            throw ProcessTimeoutError(fmt::format("{} did not finish within {} ms", program, timeout.count()));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    result.exit_code = waitForExit(pid);
    return result;
}

} // namespace justdl::detail
