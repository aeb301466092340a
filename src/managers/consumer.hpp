#pragma once

#include <functional>
#include <string>
#include <core/types.hpp>
#include <model/cluster_state.hpp>
#include "state_db.hpp"

// Accumulates bytes from a pipe and hands out complete lines (without the
// trailing '\n' or '\r').
class LineSplitter {
public:
    using LineFn = std::function<void(const std::string&)>;

    void feed(const char* data, size_t len, const LineFn& on_line);

    // Emit a final unterminated line, if any.
    void finish(const LineFn& on_line);

private:
    std::string buf_;
};

// Reads diff lines and applies each one to an in-memory aggregate and to
// the durable store. Bad lines and store failures are logged and skipped.
class Consumer {
public:
    struct Stats {
        int applied = 0;       // diffs applied to memory
        int parse_errors = 0;
        int store_errors = 0;
        int diagnostics = 0;   // producer stderr lines
    };

    explicit Consumer(StateDB& store);

    // One line from the data channel. Blank lines are ignored.
    Result<void> handle_line(const std::string& line);

    // One line from the producer's stderr.
    void handle_diagnostic_line(const std::string& line);

    // Spawn `command` (split on whitespace) and consume its stdout as diffs
    // and its stderr as diagnostics until stdout closes. Returns the
    // producer's exit code.
    Result<int> run_command(const std::string& command);

    // Consume diffs from an already-open descriptor (e.g. stdin) until EOF.
    Result<void> run_fd(int fd);

    const ClusterState& state() const { return state_; }
    const Stats& stats() const { return stats_; }

private:
    StateDB& store_;
    ClusterState state_;
    Stats stats_;
};
