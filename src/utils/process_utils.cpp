/**
 * @file process_utils.cpp
 * @brief fork/exec child processes with separate stdout/stderr capture
 *
 * **Kill Guarantees**:
 * - The child calls setpgid(0, 0) so everything it spawns shares its group
 * - Timeout and abort send SIGKILL to the whole group
 * - ChildGuard kills and reaps in its destructor, so exceptions thrown
 *   while the child is alive never leak a process or a zombie
 *
 * Exec failures are reported through a close-on-exec status pipe and
 * surface as std::runtime_error instead of a 127 exit code.
 *
 * @date 2026
 */

#include "enclave/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace enclave {
namespace utils {

namespace {

// ============================================================================
// RAII HELPERS
// ============================================================================

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { Reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    ScopedFd read_end;
    ScopedFd write_end;
};

Pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    return Pipe{ScopedFd(fds[0]), ScopedFd(fds[1])};
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/// Owns a forked child until it has been reaped
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}

    ~ChildGuard() {
        if (pid_ > 0) {
            KillGroup();
            int status = 0;
            Reap(status);
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void KillGroup() const {
        if (pid_ > 0) {
            ::kill(-pid_, SIGKILL);
            ::kill(pid_, SIGKILL);
        }
    }

    bool TryReap(int& status) {
        if (pid_ <= 0) {
            return true;
        }
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            pid_ = -1;
            return true;
        }
        return false;
    }

    void Reap(int& status) {
        if (pid_ <= 0) {
            return;
        }
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }

private:
    pid_t pid_;
};

// ============================================================================
// OUTPUT CAPTURE
// ============================================================================

void AppendCapped(std::string& buffer, const char* data, std::size_t size,
                  std::size_t cap, bool& truncated) {
    buffer.append(data, size);
    // Amortize the front erase
    if (cap > 0 && buffer.size() > cap * 2) {
        buffer.erase(0, buffer.size() - cap);
        truncated = true;
    }
}

void FinishCapped(std::string& buffer, std::size_t cap, bool& truncated) {
    if (cap > 0 && buffer.size() > cap) {
        buffer.erase(0, buffer.size() - cap);
        truncated = true;
    }
}

void DrainAvailable(ScopedFd& fd, std::string& buffer, std::size_t cap, bool& truncated) {
    if (!fd.Valid()) {
        return;
    }
    SetNonBlocking(fd.Get());
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd.Get(), chunk, sizeof(chunk));
        if (n > 0) {
            AppendCapped(buffer, chunk, static_cast<std::size_t>(n), cap, truncated);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    fd.Reset();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("ProcessRunner::Run requires a program name");
    }
    IgnoreSigpipe();

    Pipe stdin_pipe = MakePipe();
    Pipe stdout_pipe = MakePipe();
    Pipe stderr_pipe = MakePipe();
    Pipe exec_status = MakePipe();

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    ProcessResult result;
    const auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(stdin_pipe.read_end.Get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.Get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.Get(), STDERR_FILENO);
        ::execvp(args[0], args.data());
        int code = errno;
        ssize_t ignored = ::write(exec_status.write_end.Get(), &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    ChildGuard guard(pid);
    ::setpgid(pid, pid);

    stdin_pipe.read_end.Reset();
    stdout_pipe.write_end.Reset();
    stderr_pipe.write_end.Reset();
    exec_status.write_end.Reset();

    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(exec_status.read_end.Get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        throw std::runtime_error("Failed to execute '" + argv[0] + "': " + std::strerror(exec_errno));
    }

    ScopedFd& stdin_fd = stdin_pipe.write_end;
    ScopedFd& stdout_fd = stdout_pipe.read_end;
    ScopedFd& stderr_fd = stderr_pipe.read_end;

    if (options.stdin_data.empty()) {
        stdin_fd.Reset();
    } else {
        SetNonBlocking(stdin_fd.Get());
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout.count() > 0) {
        deadline = start + options.timeout;
    }

    const std::size_t cap = options.max_output_bytes;
    std::size_t written = 0;
    bool exited = false;
    std::chrono::steady_clock::time_point exited_at{};
    int status = 0;
    char chunk[4096];

    while (true) {
        std::vector<pollfd> fds;
        if (stdout_fd.Valid()) fds.push_back({stdout_fd.Get(), POLLIN, 0});
        if (stderr_fd.Valid()) fds.push_back({stderr_fd.Get(), POLLIN, 0});
        if (stdin_fd.Valid()) fds.push_back({stdin_fd.Get(), POLLOUT, 0});

        auto wait = options.poll_interval;
        if (deadline.has_value()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            wait = std::max(std::chrono::milliseconds(0), std::min(wait, remaining));
        }

        if (!fds.empty()) {
            int rc = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
            if (rc < 0 && errno != EINTR) {
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }
        } else {
            std::this_thread::sleep_for(std::min(wait, std::chrono::milliseconds(10)));
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == stdin_fd.Get()) {
                if (entry.revents & (POLLERR | POLLHUP)) {
                    stdin_fd.Reset();
                    continue;
                }
                ssize_t n = ::write(stdin_fd.Get(), options.stdin_data.data() + written,
                                    options.stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_fd.Reset();
                    continue;
                }
                if (written >= options.stdin_data.size()) {
                    stdin_fd.Reset();
                }
                continue;
            }

            bool is_stdout = entry.fd == stdout_fd.Get();
            ScopedFd& fd = is_stdout ? stdout_fd : stderr_fd;
            std::string& buffer = is_stdout ? result.stdout_output : result.stderr_output;

            ssize_t n = ::read(fd.Get(), chunk, sizeof(chunk));
            if (n > 0) {
                AppendCapped(buffer, chunk, static_cast<std::size_t>(n), cap, result.output_truncated);
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                fd.Reset();
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (!exited && guard.TryReap(status)) {
            exited = true;
            exited_at = now;
        }

        if (exited) {
            // Background grandchildren may hold the pipes open; give them a short drain window
            if ((!stdout_fd.Valid() && !stderr_fd.Valid()) ||
                now - exited_at > std::chrono::milliseconds(500)) {
                break;
            }
            continue;
        }

        if (deadline.has_value() && now >= *deadline) {
            result.timed_out = true;
        } else if (options.should_abort && options.should_abort()) {
            result.aborted = true;
        }

        if (result.timed_out || result.aborted) {
            spdlog::debug("Killing process group {} ({})", pid,
                          result.timed_out ? "timeout" : "aborted");
            guard.KillGroup();
            guard.Reap(status);
            break;
        }
    }

    DrainAvailable(stdout_fd, result.stdout_output, cap, result.output_truncated);
    DrainAvailable(stderr_fd, result.stderr_output, cap, result.output_truncated);
    FinishCapped(result.stdout_output, cap, result.output_truncated);
    FinishCapped(result.stderr_output, cap, result.output_truncated);

    result.exit_code = DecodeStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    return result;
}

bool ProcessRunner::IsExecutableAvailable(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t begin = 0;
    while (begin <= path.size()) {
        std::size_t end = path.find(':', begin);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(begin, end - begin);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            if (::access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
        begin = end + 1;
    }
    return false;
}

} // namespace utils
} // namespace enclave
