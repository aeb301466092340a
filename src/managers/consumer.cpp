#include "consumer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <model/wire_codec.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <vector>

// ── LineSplitter ─────────────────────────────────────────────

void LineSplitter::feed(const char* data, size_t len, const LineFn& on_line) {
    buf_.append(data, len);
    size_t start = 0;
    size_t nl;
    while ((nl = buf_.find('\n', start)) != std::string::npos) {
        std::string line = buf_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        on_line(line);
        start = nl + 1;
    }
    buf_.erase(0, start);
}

void LineSplitter::finish(const LineFn& on_line) {
    if (buf_.empty()) return;
    std::string line;
    line.swap(buf_);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    on_line(line);
}

namespace {

std::string preview(const std::string& s) {
    if (s.size() <= static_cast<size_t>(LOG_PREVIEW_CHARS)) return s;
    return s.substr(0, LOG_PREVIEW_CHARS) + "...";
}

// Read once from fd. Returns bytes read, 0 on EOF, -1 on error (errno set).
ssize_t read_some(int fd, std::vector<char>& buf) {
    for (;;) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

} // namespace

// ── Consumer ─────────────────────────────────────────────────

Consumer::Consumer(StateDB& store) : store_(store) {}

Result<void> Consumer::handle_line(const std::string& line) {
    if (trimmed(line).empty()) return Result<void>::Ok();

    auto diff = decode_diff(line);
    if (diff.is_err()) {
        stats_.parse_errors++;
        log_warn(fmt::format("Skipping unparseable diff ({}): {}", diff.error, preview(line)));
        return Result<void>::Err(diff.error);
    }

    state_.apply(diff.value);
    stats_.applied++;
    log_info(fmt::format("Applied diff with {} entries ({} nodes, {} jobs tracked)",
                         diff.value.size(), state_.nodes.size(), state_.jobs.size()));

    auto stored = store_.apply_diff(diff.value);
    if (stored.is_err()) {
        stats_.store_errors++;
        log_error(fmt::format("Store update failed: {}", stored.error));
        return stored;
    }

    auto meta = store_.set_metadata(META_LAST_UPDATED, now_iso_utc());
    if (meta.is_err()) {
        stats_.store_errors++;
        log_error(fmt::format("Metadata update failed: {}", meta.error));
        return meta;
    }
    return Result<void>::Ok();
}

void Consumer::handle_diagnostic_line(const std::string& line) {
    stats_.diagnostics++;
    log_info(fmt::format("[producer] {}", line));
}

Result<int> Consumer::run_command(const std::string& command) {
    auto argv = split_whitespace(command);
    if (argv.empty()) return Result<int>::Err("Producer command is empty");

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto child = platform::spawn(argv[0], args, true);
    if (!child.valid()) {
        return Result<int>::Err(fmt::format("Failed to start producer: {}", command));
    }
    log_info(fmt::format("Started producer (pid {}): {}", child.native_handle(), command));

    LineSplitter data_lines;
    LineSplitter diag_lines;
    // handle_line logs and counts its own failures; the stream goes on.
    auto on_data = [this](const std::string& l) { handle_line(l); };
    auto on_diag = [this](const std::string& l) { handle_diagnostic_line(l); };
    std::vector<char> buf(PIPE_READ_BUF_SIZE);

    // Both pipes are watched together; each keeps its own line order.
    while (child.stdout_fd() >= 0) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {child.stdout_fd(), POLLIN, 0};
        if (child.stderr_fd() >= 0) fds[nfds++] = {child.stderr_fd(), POLLIN, 0};

        int ready = ::poll(fds, nfds, CONSUMER_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            child.terminate();
            return Result<int>::Err(fmt::format("poll failed: {}", err));
        }
        if (ready == 0) continue;

        if (nfds > 1 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read_some(child.stderr_fd(), buf);
            if (n > 0) {
                diag_lines.feed(buf.data(), static_cast<size_t>(n), on_diag);
            } else {
                diag_lines.finish(on_diag);
                child.close_stderr();
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read_some(child.stdout_fd(), buf);
            if (n > 0) {
                data_lines.feed(buf.data(), static_cast<size_t>(n), on_data);
            } else {
                if (n < 0) {
                    log_error(fmt::format("Read from producer failed: {}", std::strerror(errno)));
                }
                data_lines.finish(on_data);
                child.close_stdout();
            }
        }
    }

    // Data channel closed. Pick up whatever the producer already wrote to
    // stderr, then reap it.
    while (child.stderr_fd() >= 0) {
        struct pollfd pfd = {child.stderr_fd(), POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0) break;
        ssize_t n = read_some(child.stderr_fd(), buf);
        if (n <= 0) break;
        diag_lines.feed(buf.data(), static_cast<size_t>(n), on_diag);
    }
    diag_lines.finish(on_diag);
    child.close_stderr();

    int code = child.wait(CHILD_REAP_TIMEOUT_MS);
    if (code == -1 && child.running()) {
        log_warn("Producer still running after its output closed, terminating");
        child.terminate();
        code = child.wait(CHILD_REAP_TIMEOUT_MS);
    }
    log_info(fmt::format("Producer exited with code {}", code));
    return Result<int>::Ok(code);
}

Result<void> Consumer::run_fd(int fd) {
    LineSplitter lines;
    auto on_data = [this](const std::string& l) { handle_line(l); };
    std::vector<char> buf(PIPE_READ_BUF_SIZE);

    for (;;) {
        ssize_t n = read_some(fd, buf);
        if (n < 0) {
            std::string err = std::strerror(errno);
            lines.finish(on_data);
            return Result<void>::Err(fmt::format("read failed: {}", err));
        }
        if (n == 0) break;
        lines.feed(buf.data(), static_cast<size_t>(n), on_data);
    }
    lines.finish(on_data);
    return Result<void>::Ok();
}
