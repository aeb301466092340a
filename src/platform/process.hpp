#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child process, optionally owning the read ends of
// its stdout/stderr pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 on timeout / signal.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    int native_handle() const { return pid_; }

    // Read ends of the child's stdout / stderr (-1 if not piped or already closed).
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    void close_stdout();
    void close_stderr();

private:
    int pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void close_fds();
    void reap_if_exited();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool pipe_output);
};

// Spawn a child process (PATH lookup). With pipe_output, the child's stdout
// and stderr are connected to pipes readable via stdout_fd()/stderr_fd();
// otherwise they are inherited. stdin is always closed in the child.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool pipe_output = true);

// Run a command to completion, capturing stdout and stderr.
// Exit code 127 means the program could not be executed; -1 means it timed out
// (the child is killed) or died from a signal.
CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_ms = -1);

} // namespace platform
