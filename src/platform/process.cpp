#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

static int decode_status(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
    reap_if_exited();
}

// Don't leave a zombie behind; a still-running child is left alone.
void ProcessHandle::reap_if_exited() {
    if (pid_ > 0 && !reaped_) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) reaped_ = true;
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        reap_if_exited();
        pid_ = other.pid_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret != pid_) return -1;
        reaped_ = true;
        exit_code_ = decode_status(status);
        return exit_code_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (elapsed <= timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return exit_code_;
        }
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
    exit_code_ = -1;
}

void ProcessHandle::close_stdout() {
    if (stdout_fd_ >= 0) { close(stdout_fd_); stdout_fd_ = -1; }
}

void ProcessHandle::close_stderr() {
    if (stderr_fd_ >= 0) { close(stderr_fd_); stderr_fd_ = -1; }
}

void ProcessHandle::close_fds() {
    close_stdout();
    close_stderr();
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool pipe_output) {
    ProcessHandle handle;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe_output) {
        if (pipe(out_pipe) != 0) return handle;
        if (pipe(err_pipe) != 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            return handle;
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        // fork failed
        if (pipe_output) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
        }
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        } else {
            close(STDIN_FILENO);
        }

        if (pipe_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (pipe_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        handle.stderr_fd_ = err_pipe[0];
    }
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms) {
    CommandResult result;

    ProcessHandle proc = spawn(program, args, true);
    if (!proc.valid()) {
        result.exit_code = 127;
        result.stderr_data = "failed to spawn " + program + ": " + std::strerror(errno);
        return result;
    }

    int64_t deadline = timeout_ms < 0 ? -1 : monotonic_ms() + timeout_ms;
    char buf[8192];

    while (proc.stdout_fd() >= 0 || proc.stderr_fd() >= 0) {
        struct pollfd fds[2];
        int nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (proc.stdout_fd() >= 0) {
            out_idx = nfds;
            fds[nfds++] = {proc.stdout_fd(), POLLIN, 0};
        }
        if (proc.stderr_fd() >= 0) {
            err_idx = nfds;
            fds[nfds++] = {proc.stderr_fd(), POLLIN, 0};
        }

        int wait_ms = 250;
        if (deadline >= 0) {
            int64_t left = deadline - monotonic_ms();
            if (left <= 0) {
                proc.terminate();
                result.exit_code = -1;
                result.stderr_data += "\n" + program + " timed out";
                return result;
            }
            if (left < wait_ms) wait_ms = static_cast<int>(left);
        }

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        auto drain = [&](int idx, std::string& sink, bool is_stdout) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t n = read(fds[idx].fd, buf, sizeof(buf));
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                if (is_stdout) proc.close_stdout(); else proc.close_stderr();
            }
        };
        drain(out_idx, result.stdout_data, true);
        drain(err_idx, result.stderr_data, false);
    }

    result.exit_code = proc.wait(timeout_ms < 0 ? -1 : CHILD_REAP_TIMEOUT_MS);
    return result;
}

} // namespace platform
