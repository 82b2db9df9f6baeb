/**
 * @file process_runner.cpp
 * @brief POSIX implementation of ProcessRunner
 *
 * The parent multiplexes the child's stdin, stdout and stderr with poll().
 * When the deadline passes the child gets SIGTERM, then SIGKILL after the
 * grace period. Pipes are drained until both output streams close.
 *
 * @date 2025
 */

#include "sandkeep/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandkeep {
namespace utils {

namespace {

using SteadyClock = std::chrono::steady_clock;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void IgnoreSigpipeOnce() {
    // A child that exits before reading stdin must not kill us with SIGPIPE
    static const bool ignored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

// Read whatever is available; returns false once the stream reached EOF
bool Drain(int fd, std::string& target, std::size_t cap, bool& truncated) {
    std::array<char, 8192> buffer;
    while (true) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            const std::size_t room = target.size() < cap ? cap - target.size() : 0;
            const std::size_t take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
            target.append(buffer.data(), take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more right now; anything else: treat as closed
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // anonymous namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("ProcessRunner::Run requires a program");
    }
    IgnoreSigpipeOnce();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1],
                        &err_pipe[0], &err_pipe[1]}) {
            CloseFd(*fd);
        }
        throw std::runtime_error("Failed to create pipes: " + reason);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    const auto start = SteadyClock::now();
    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1],
                        &err_pipe[0], &err_pipe[1]}) {
            CloseFd(*fd);
        }
        throw std::runtime_error("fork failed: " + reason);
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        const char* reason = std::strerror(errno);
        const char prefix[] = "exec failed: ";
        (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        ::_exit(127);
    }

    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];
    SetNonBlocking(stdin_fd);
    SetNonBlocking(stdout_fd);
    SetNonBlocking(stderr_fd);

    ProcessResult result;
    std::size_t stdin_offset = 0;
    if (options.stdin_data.empty()) {
        CloseFd(stdin_fd);
    }

    std::optional<SteadyClock::time_point> deadline;
    if (options.timeout) {
        deadline = start + *options.timeout;
    }
    std::optional<SteadyClock::time_point> kill_at;
    bool killed = false;

    while (stdout_fd >= 0 || stderr_fd >= 0) {
        const auto now = SteadyClock::now();

        if (deadline && !result.timed_out && now >= *deadline) {
            result.timed_out = true;
            spdlog::debug("Process {} exceeded deadline, sending SIGTERM", pid);
            ::kill(pid, SIGTERM);
            kill_at = now + options.kill_grace;
        }
        if (kill_at && !killed && now >= *kill_at) {
            spdlog::debug("Process {} still alive after grace, sending SIGKILL", pid);
            ::kill(pid, SIGKILL);
            killed = true;
            // Grandchildren may keep the pipes open; give them one more grace period
            kill_at = now + options.kill_grace;
        } else if (killed && kill_at && now >= *kill_at) {
            break;
        }

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (stdin_fd >= 0) {
            fds[count++] = pollfd{stdin_fd, POLLOUT, 0};
        }
        if (stdout_fd >= 0) {
            fds[count++] = pollfd{stdout_fd, POLLIN, 0};
        }
        if (stderr_fd >= 0) {
            fds[count++] = pollfd{stderr_fd, POLLIN, 0};
        }

        const int ready = ::poll(fds.data(), count, 100);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == stdin_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    CloseFd(stdin_fd);
                    continue;
                }
                const ssize_t n = ::write(stdin_fd,
                                          options.stdin_data.data() + stdin_offset,
                                          options.stdin_data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    CloseFd(stdin_fd);
                }
                if (stdin_offset >= options.stdin_data.size()) {
                    CloseFd(stdin_fd);
                }
            } else if (fds[i].fd == stdout_fd) {
                if (!Drain(stdout_fd, result.stdout_output, options.max_output_bytes,
                           result.output_truncated)) {
                    CloseFd(stdout_fd);
                }
            } else if (fds[i].fd == stderr_fd) {
                if (!Drain(stderr_fd, result.stderr_output, options.max_output_bytes,
                           result.output_truncated)) {
                    CloseFd(stderr_fd);
                }
            }
        }
    }

    CloseFd(stdin_fd);
    CloseFd(stdout_fd);
    CloseFd(stderr_fd);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - start);
    return result;
}

} // namespace utils
} // namespace sandkeep
