#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Runs an external command to completion and captures its output. The
// collector talks to scontrol through this so tests can feed canned text.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // argv[0] is the program (PATH lookup), the rest are its arguments.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

// Spawns a local child process per call.
class LocalCommandRunner : public CommandRunner {
public:
    explicit LocalCommandRunner(int timeout_ms = -1) : timeout_ms_(timeout_ms) {}

    CommandResult run(const std::vector<std::string>& argv) override;

private:
    int timeout_ms_;
};
