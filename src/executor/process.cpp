/**
 * @file process.cpp
 * @brief run_process() — posix_spawn + poll() loop with deadline enforcement.
 */

#include "executor/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace sandbox_harness {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds{5};

std::string errno_text(int err) {
    return std::string{std::strerror(err)};
}

/**
 * @brief Owning file descriptor; closes on destruction.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return HarnessError{ErrorKind::Launch, "pipe2 failed: " + errno_text(errno)};
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief Blocks SIGPIPE on the calling thread for the lifetime of a run.
 *
 * A write into a pipe whose reader has exited then fails with EPIPE instead
 * of killing the harness. Any SIGPIPE we caused is consumed before the old
 * mask is restored.
 */
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigset_t pending;
        sigemptyset(&pending);
        ::sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        ::pthread_sigmask(SIG_BLOCK, &block, &previous_);
    }

    ~SigpipeGuard() {
        if (raised_ && !was_pending_) {
            sigset_t pipe_only;
            sigemptyset(&pipe_only);
            sigaddset(&pipe_only, SIGPIPE);
            timespec zero{0, 0};
            while (::sigtimedwait(&pipe_only, nullptr, &zero) < 0 && errno == EINTR) {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    void note_epipe() noexcept { raised_ = true; }

private:
    sigset_t previous_{};
    bool was_pending_{false};
    bool raised_{false};
};

/// Read everything currently available. Returns false once the pipe is at EOF or broken.
bool drain(int fd, Bytes& sink) {
    std::array<char, READ_CHUNK> buffer{};
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void reap_blocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

/// start + timeout, saturating at time_point::max() instead of overflowing.
std::chrono::steady_clock::time_point deadline_after(std::chrono::steady_clock::time_point start,
                                                     std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    if (timeout <= std::chrono::milliseconds::zero()) return start;
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock::time_point::max() - start);
    if (timeout >= headroom) return clock::time_point::max();
    return start + std::chrono::duration_cast<clock::duration>(timeout);
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return static_cast<int>(std::clamp<int64_t>(left.count(), 0, INT_MAX));
}

}  // anonymous namespace

Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                  std::string_view stdin_bytes,
                                  std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return HarnessError{ErrorKind::Launch, "Empty command line"};
    }

    auto in = make_pipe();
    if (!in) return in.error();
    auto out = make_pipe();
    if (!out) return out.error();
    auto err = make_pipe();
    if (!err) return err.error();

    // ── Spawn ────────────────────────────────
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in->read_end.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out->write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err->write_end.get(), STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setpgroup(&attr, 0);  // own process group, killable as a unit
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK
                                    | POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, cargv[0], &actions, &attr, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        return HarnessError{ErrorKind::Launch,
                            "Failed to launch " + argv[0] + ": " + errno_text(rc)};
    }

    // Parent keeps only its own ends.
    in->read_end.reset();
    out->write_end.reset();
    err->write_end.reset();

    UniqueFd stdin_fd = std::move(in->write_end);
    UniqueFd stdout_fd = std::move(out->read_end);
    UniqueFd stderr_fd = std::move(err->read_end);
    set_nonblocking(stdin_fd.get());
    set_nonblocking(stdout_fd.get());
    set_nonblocking(stderr_fd.get());
    if (stdin_bytes.empty()) stdin_fd.reset();

    SigpipeGuard sigpipe;
    ProcessOutput output;
    size_t stdin_offset = 0;
    bool timed_out = false;
    int status = 0;

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = deadline_after(start, timeout);

    // ── Pump stdio until both outputs reach EOF ──
    while (stdout_fd || stderr_fd) {
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }

        std::array<pollfd, 3> fds{};
        std::array<UniqueFd*, 3> owners{};
        nfds_t count = 0;
        if (stdin_fd) {
            fds[count] = pollfd{stdin_fd.get(), POLLOUT, 0};
            owners[count++] = &stdin_fd;
        }
        if (stdout_fd) {
            fds[count] = pollfd{stdout_fd.get(), POLLIN, 0};
            owners[count++] = &stdout_fd;
        }
        if (stderr_fd) {
            fds[count] = pollfd{stderr_fd.get(), POLLIN, 0};
            owners[count++] = &stderr_fd;
        }

        int ready = ::poll(fds.data(), count, remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int poll_err = errno;
            ::killpg(pid, SIGKILL);
            reap_blocking(pid, status);
            return HarnessError{ErrorKind::Launch, "poll failed: " + errno_text(poll_err)};
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            UniqueFd& fd = *owners[i];

            if (&fd == &stdin_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    stdin_fd.reset();
                    continue;
                }
                ssize_t n = ::write(fd.get(), stdin_bytes.data() + stdin_offset,
                                    stdin_bytes.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<size_t>(n);
                    if (stdin_offset == stdin_bytes.size()) stdin_fd.reset();
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // Child stopped reading; not an error for the run.
                    if (errno == EPIPE) sigpipe.note_epipe();
                    stdin_fd.reset();
                }
                continue;
            }

            Bytes& sink = (&fd == &stdout_fd) ? output.stdout_bytes : output.stderr_bytes;
            if (!drain(fd.get(), sink)) fd.reset();
        }
    }

    // ── Reap within the same deadline ─────────
    if (!timed_out) {
        stdin_fd.reset();
        while (true) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) break;
            if (r < 0 && errno != EINTR) {
                int wait_err = errno;
                ::killpg(pid, SIGKILL);
                reap_blocking(pid, status);
                return HarnessError{ErrorKind::Launch, "waitpid failed: " + errno_text(wait_err)};
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }
    }

    if (timed_out) {
        ::killpg(pid, SIGKILL);
        reap_blocking(pid, status);
        if (stdout_fd) drain(stdout_fd.get(), output.stdout_bytes);
        if (stderr_fd) drain(stderr_fd.get(), output.stderr_bytes);
        return HarnessError{
            ErrorKind::Timeout,
            "Execution timed out after " + std::to_string(timeout.count()) + " ms",
            PartialOutput{std::move(output.stdout_bytes), std::move(output.stderr_bytes)}};
    }

    output.elapsed = std::chrono::duration_cast<WallTime>(
        std::chrono::steady_clock::now() - start);

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.signaled = true;
        output.exit_code = 128 + WTERMSIG(status);
    } else {
        output.exit_code = -1;
    }
    return output;
}

}  // namespace sandbox_harness
