/**
 * @file process_utils.cpp
 * @brief POSIX implementation of host process execution
 *
 * **Execution Model**:
 * ```
 * pipe(stdout) + pipe(stderr) → fork
 *   child:  setpgid → dup2 → execvp (exit 127 on failure)
 *   parent: poll both pipes until EOF or deadline
 *           deadline → kill(-pgid, SIGKILL) → waitpid
 * ```
 *
 * @date 2025
 */

#include "cloister/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cloister {
namespace utils {

namespace {

// ============================================================================
// PIPE HELPERS
// ============================================================================

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return fds_[0]; }
    int WriteEnd() const { return fds_[1]; }

    void CloseRead() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void CloseWrite() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

// Append up to the cap; returns false once the pipe reached EOF or failed.
bool DrainOnce(int fd, std::string& sink, std::size_t cap, bool& truncated) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) {
        return false;
    }

    std::size_t count = static_cast<std::size_t>(n);
    if (sink.size() < cap) {
        std::size_t room = cap - sink.size();
        sink.append(buffer.data(), std::min(room, count));
        if (count > room) {
            truncated = true;
        }
    } else {
        truncated = true;
    }
    return true;
}

constexpr std::chrono::milliseconds kReapPollInterval{10};

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess requires a non-empty argv");
    }

    ProcessResult result;
    const auto start_time = std::chrono::steady_clock::now();

    Pipe out_pipe;
    Pipe err_pipe;

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
        ::dup2(err_pipe.WriteEnd(), STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    out_pipe.CloseWrite();
    err_pipe.CloseWrite();

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start_time + options.timeout;

    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (out_open) {
            fds[nfds++] = pollfd{out_pipe.ReadEnd(), POLLIN, 0};
        }
        if (err_open) {
            fds[nfds++] = pollfd{err_pipe.ReadEnd(), POLLIN, 0};
        }

        int ready = ::poll(fds.data(), nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed while reading child output: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;  // deadline re-checked at loop head
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == out_pipe.ReadEnd()) {
                out_open = DrainOnce(fds[i].fd, result.stdout_output,
                                     options.max_output_bytes, result.stdout_truncated);
            } else {
                err_open = DrainOnce(fds[i].fd, result.stderr_output,
                                     options.max_output_bytes, result.stderr_truncated);
            }
        }
    }

    bool killed = false;
    if (out_open || err_open) {
        // Timed out (or poll failed): take the whole process group down
        KillGroup(pid);
        killed = true;
    }

    // A child may close its streams and keep running; the deadline still holds
    int status = 0;
    while (true) {
        pid_t waited = ::waitpid(pid, &status, (killed || !has_deadline) ? 0 : WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("waitpid failed for pid {}: {}", pid, std::strerror(errno));
            status = 0;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            KillGroup(pid);
            killed = true;
            continue;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    result.exit_code = DecodeWaitStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result.timed_out) {
        spdlog::debug("Process '{}' killed after {} ms deadline", argv[0], options.timeout.count());
    }

    return result;
}

} // namespace utils
} // namespace cloister
