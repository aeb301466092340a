#include "command_runner.hpp"
#include <platform/process.hpp>

CommandResult LocalCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        CommandResult r;
        r.exit_code = 127;
        r.stderr_data = "empty command";
        return r;
    }
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    return platform::run_capture(argv[0], args, timeout_ms_);
}
