#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command execution result
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct ProducerConfig {
    int interval_secs = 30;
    bool mock = false;
    std::string scontrol = "scontrol";   // may be a wrapper, e.g. "ssh login1 scontrol"
    unsigned mock_seed = 0;              // 0 = seed from clock
    int max_ticks = -1;                  // -1 = run until killed
};

struct ConsumerConfig {
    std::string producer_cmd = "slurmsync produce --mock";
    std::string database;                // empty = ~/.slurmsync/cluster.db
    bool read_stdin = false;             // read diffs from our own stdin instead of spawning
};

struct LogConfig {
    std::string level = "info";
    std::string file;                    // empty = no log file
    bool to_stderr = true;
};

