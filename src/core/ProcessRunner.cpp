#include "ProcessRunner.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace devops_mcp {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on one poll() wait while the child is still running
constexpr int kPollSliceMs = 50;

// How long output is still collected after the child has exited
constexpr std::chrono::milliseconds kDrainWindow{100};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void check_spawn_call(int rc, const char* what) {
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), what);
    }
}

// Owns the posix_spawn attribute and file-action objects
class SpawnConfig {
public:
    SpawnConfig() {
        check_spawn_call(posix_spawn_file_actions_init(&actions_), "posix_spawn_file_actions_init");
        int rc = posix_spawnattr_init(&attr_);
        if (rc != 0) {
            posix_spawn_file_actions_destroy(&actions_);
            throw std::system_error(rc, std::generic_category(), "posix_spawnattr_init");
        }
    }

    ~SpawnConfig() {
        posix_spawnattr_destroy(&attr_);
        posix_spawn_file_actions_destroy(&actions_);
    }

    SpawnConfig(const SpawnConfig&) = delete;
    SpawnConfig& operator=(const SpawnConfig&) = delete;

    posix_spawn_file_actions_t* actions() { return &actions_; }
    posix_spawnattr_t* attr() { return &attr_; }

private:
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
};

struct CaptureStream {
    UniqueFd fd;
    std::string* buffer;
    bool* truncated;
};

void append_bounded(CaptureStream& stream, const char* data, std::size_t size, std::size_t limit) {
    std::size_t room = stream.buffer->size() < limit ? limit - stream.buffer->size() : 0;
    if (size > room) {
        *stream.truncated = true;
        size = room;
    }
    stream.buffer->append(data, size);
}

int wait_blocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid, std::strerror(errno));
            break;
        }
    }
    return status;
}

void kill_and_reap(pid_t pid) {
    // The child leads its own process group, so this also reaches anything it spawned
    ::kill(-pid, SIGKILL);
    wait_blocking(pid);
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    return left > INT_MAX ? INT_MAX : static_cast<int>(left) + 1;
}

std::string describe(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg;
    }
    return text;
}

} // namespace

PosixProcessRunner::PosixProcessRunner() : PosixProcessRunner(Options{}) {}

PosixProcessRunner::PosixProcessRunner(Options options) : options_(std::move(options)) {
    if (options_.max_output_bytes == 0) {
        throw std::invalid_argument("max_output_bytes must be greater than zero");
    }
}

ExecutionResult PosixProcessRunner::execute(const std::vector<std::string>& argv,
                                            std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        throw std::invalid_argument("Command argument vector cannot be empty");
    }

    Pipe out = make_pipe();
    Pipe err = make_pipe();

    SpawnConfig spawn;
    check_spawn_call(posix_spawn_file_actions_addopen(spawn.actions(), STDIN_FILENO, "/dev/null", O_RDONLY, 0),
                     "posix_spawn_file_actions_addopen");
    check_spawn_call(posix_spawn_file_actions_adddup2(spawn.actions(), out.write_end.get(), STDOUT_FILENO),
                     "posix_spawn_file_actions_adddup2");
    check_spawn_call(posix_spawn_file_actions_adddup2(spawn.actions(), err.write_end.get(), STDERR_FILENO),
                     "posix_spawn_file_actions_adddup2");
    if (!options_.working_directory.empty()) {
        check_spawn_call(posix_spawn_file_actions_addchdir_np(spawn.actions(), options_.working_directory.c_str()),
                         "posix_spawn_file_actions_addchdir_np");
    }

    // The server blocks SIGINT/SIGTERM and ignores SIGPIPE; the child must not inherit that
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    check_spawn_call(posix_spawnattr_setsigmask(spawn.attr(), &empty_mask), "posix_spawnattr_setsigmask");
    check_spawn_call(posix_spawnattr_setsigdefault(spawn.attr(), &default_signals), "posix_spawnattr_setsigdefault");
    check_spawn_call(posix_spawnattr_setpgroup(spawn.attr(), 0), "posix_spawnattr_setpgroup");
    const auto flags = static_cast<short>(POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    check_spawn_call(posix_spawnattr_setflags(spawn.attr(), flags), "posix_spawnattr_setflags");

    std::vector<char*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        raw_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    raw_argv.push_back(nullptr);

    const auto start = Clock::now();
    const auto deadline = start + timeout;

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv.front().c_str(), spawn.actions(), spawn.attr(), raw_argv.data(), environ);
    out.write_end.reset();
    err.write_end.reset();

    if (rc != 0) {
        spdlog::error("Failed to start '{}': {}", argv.front(), std::strerror(rc));
        throw DependencyUnavailableError(
            "Command '" + argv.front() + "' could not be started: " + std::strerror(rc),
            {{"argv", argv}, {"errno", rc}});
    }

    spdlog::debug("Spawned pid {}: {}", pid, describe(argv));

    ExecutionResult result;
    std::array<CaptureStream, 2> streams{{
        {std::move(out.read_end), &result.standard_output, &result.output_truncated},
        {std::move(err.read_end), &result.standard_error, &result.error_truncated},
    }};

    bool timed_out = false;
    bool exited = false;
    int status = 0;
    Clock::time_point drain_deadline{};
    std::array<char, 8192> chunk;

    // Stops once both pipes are closed, or once the child has exited and its
    // leftover output is drained. Background processes may keep the pipes open.
    while (streams[0].fd.valid() || streams[1].fd.valid()) {
        if (!exited) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
                drain_deadline = Clock::now() + kDrainWindow;
            } else if (waited < 0 && errno != EINTR) {
                int wait_errno = errno;
                kill_and_reap(pid);
                throw std::system_error(wait_errno, std::generic_category(), "waitpid");
            }
        }

        int wait_ms = 0;
        if (exited) {
            wait_ms = remaining_ms(drain_deadline);
            if (wait_ms == 0) {
                break;
            }
        } else {
            wait_ms = remaining_ms(deadline);
            if (wait_ms == 0) {
                timed_out = true;
                break;
            }
            wait_ms = std::min(wait_ms, kPollSliceMs);
        }

        std::array<pollfd, 2> fds{};
        std::array<CaptureStream*, 2> polled{};
        nfds_t count = 0;
        for (auto& stream : streams) {
            if (stream.fd.valid()) {
                fds[count] = pollfd{stream.fd.get(), POLLIN, 0};
                polled[count] = &stream;
                ++count;
            }
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int poll_errno = errno;
            if (!exited) {
                kill_and_reap(pid);
            }
            throw std::system_error(poll_errno, std::generic_category(), "poll");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n > 0) {
                append_bounded(*polled[i], chunk.data(), static_cast<std::size_t>(n), options_.max_output_bytes);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                polled[i]->fd.reset();
            }
        }
    }

    if (!timed_out && !exited) {
        // Both pipes are closed; give the child the rest of its window to exit
        for (;;) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                break;
            }
            if (waited < 0 && errno != EINTR) {
                int wait_errno = errno;
                kill_and_reap(pid);
                throw std::system_error(wait_errno, std::generic_category(), "waitpid");
            }
            if (Clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (timed_out) {
        kill_and_reap(pid);
        result.timed_out = true;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        spdlog::warn("Command timed out after {}ms and was killed: {}", timeout.count(), describe(argv));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    spdlog::debug("pid {} exited with code {} after {}ms", pid, result.exit_code.value_or(-1),
                  result.duration.count());
    if (result.output_truncated || result.error_truncated) {
        spdlog::warn("Output of '{}' exceeded {} bytes and was truncated", argv.front(), options_.max_output_bytes);
    }
    return result;
}

} // namespace devops_mcp
