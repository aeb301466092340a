#include <csignal>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <fmt/format.h>
#include "cli/status_view.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "core/utils.hpp"
#include "managers/command_runner.hpp"
#include "managers/consumer.hpp"
#include "managers/mock_source.hpp"
#include "managers/producer.hpp"
#include "managers/state_db.hpp"

namespace {

Producer* g_producer = nullptr;

void handle_stop_signal(int) {
    if (g_producer) g_producer->request_stop();
}

void print_usage() {
    auto row = [](const std::string& cmd, const std::string& args, const std::string& desc) {
        std::cout << theme::color::BLUE << "    slurmsync " << cmd << theme::color::RESET
                  << theme::color::BROWN << args << theme::color::RESET
                  << std::string(cmd.size() + args.size() < 34 ? 34 - cmd.size() - args.size() : 1, ' ')
                  << theme::color::DIM << desc << theme::color::RESET << "\n";
    };

    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    row("produce", " [--mock] [--interval N] [--ticks N]", "Emit cluster diffs on stdout");
    row("consume", " [--cmd \"...\"] [--stdin] [--db P]", "Apply diffs to the database");
    row("status", " [--db P]", "Summarize the stored state");
    row("init-config", "", "Write a default config file");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    All commands accept --config <path> and --log-level <level>.\n"
              << "    slurmsync --version     Show version\n"
              << "    slurmsync --help        Show this help"
              << theme::color::RESET << "\n\n";
}

// "--name value" options and bare "--flag" switches after the subcommand.
struct Options {
    std::map<std::string, std::string> values;
    std::map<std::string, bool> flags;

    bool flag(const std::string& name) const { return flags.count(name) > 0; }

    const std::string* value(const std::string& name) const {
        auto it = values.find(name);
        return it == values.end() ? nullptr : &it->second;
    }
};

Options parse_options(int argc, char** argv, int start,
                      const std::vector<std::string>& value_opts,
                      const std::vector<std::string>& flag_opts) {
    Options opts;
    for (int i = start; i < argc; i++) {
        std::string arg = argv[i];
        bool known = false;
        for (const auto& v : value_opts) {
            if (arg != v) continue;
            if (i + 1 >= argc) throw std::runtime_error("Missing value for " + arg);
            opts.values[arg] = argv[++i];
            known = true;
        }
        for (const auto& f : flag_opts) {
            if (arg != f) continue;
            opts.flags[arg] = true;
            known = true;
        }
        if (!known) throw std::runtime_error("Unknown option: " + arg);
    }
    return opts;
}

int require_int(const std::string& name, const std::string& text) {
    int fallback = -9999;
    int v = safe_stoi(text, fallback);
    if (v == fallback) throw std::runtime_error(fmt::format("{} expects a number, got '{}'", name, text));
    return v;
}

Config load_config(const Options& opts) {
    auto result = opts.value("--config") ? Config::load(expand_home(*opts.value("--config")))
                                         : Config::load();
    if (result.is_err()) throw std::runtime_error(result.error);
    Config config = result.value;

    if (opts.value("--log-level")) config.log().level = *opts.value("--log-level");
    set_log_level(parse_log_level(config.log().level));
    set_log_stderr(config.log().to_stderr);
    if (!config.log().file.empty()) set_log_file(expand_home(config.log().file).string());
    return config;
}

int run_produce(int argc, char** argv) {
    auto opts = parse_options(argc, argv, 2,
                              {"--interval", "--ticks", "--seed", "--config", "--log-level"},
                              {"--mock"});
    Config config = load_config(opts);
    ProducerConfig& pc = config.producer();
    if (opts.flag("--mock")) pc.mock = true;
    if (opts.value("--interval")) pc.interval_secs = require_int("--interval", *opts.value("--interval"));
    if (opts.value("--ticks")) pc.max_ticks = require_int("--ticks", *opts.value("--ticks"));
    if (opts.value("--seed")) {
        pc.mock_seed = static_cast<unsigned>(require_int("--seed", *opts.value("--seed")));
    }

    LocalCommandRunner runner(SCONTROL_TIMEOUT_MS);
    std::unique_ptr<SnapshotSource> source;
    if (pc.mock) {
        source = std::make_unique<MockSource>(pc.mock_seed);
    } else {
        source = std::make_unique<ScontrolSource>(runner, pc.scontrol);
    }

    log_info(fmt::format("Producing {} snapshots every {}s",
                         pc.mock ? "mock" : "scontrol", pc.interval_secs));

    Producer producer(*source, std::cout, pc.interval_secs, pc.max_ticks);
    g_producer = &producer;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
    producer.run();
    g_producer = nullptr;
    return 0;
}

int run_consume(int argc, char** argv) {
    auto opts = parse_options(argc, argv, 2, {"--cmd", "--db", "--config", "--log-level"},
                              {"--stdin"});
    Config config = load_config(opts);
    ConsumerConfig& cc = config.consumer();
    if (opts.value("--cmd")) cc.producer_cmd = *opts.value("--cmd");
    if (opts.value("--db")) cc.database = *opts.value("--db");
    if (opts.flag("--stdin")) cc.read_stdin = true;

    auto db_path = config.database_path().string();
    auto opened = StateDB::open(db_path);
    if (opened.is_err()) throw std::runtime_error(opened.error);
    auto store = std::move(opened.value);
    log_info(fmt::format("Writing cluster state to {}", db_path));

    Consumer consumer(*store);
    int code = 0;
    if (cc.read_stdin) {
        auto r = consumer.run_fd(STDIN_FILENO);
        if (r.is_err()) {
            log_error(r.error);
            code = 1;
        }
    } else {
        auto r = consumer.run_command(cc.producer_cmd);
        if (r.is_err()) {
            log_error(r.error);
            code = 1;
        } else if (r.value != 0) {
            code = 1;
        }
    }

    const auto& stats = consumer.stats();
    log_info(fmt::format("Consumer finished: {} applied, {} unparseable, {} store errors",
                         stats.applied, stats.parse_errors, stats.store_errors));
    return code;
}

int run_status(int argc, char** argv) {
    auto opts = parse_options(argc, argv, 2, {"--db", "--config", "--log-level"}, {});
    Config config = load_config(opts);
    if (opts.value("--db")) config.consumer().database = *opts.value("--db");

    auto opened = StateDB::open(config.database_path().string());
    if (opened.is_err()) throw std::runtime_error(opened.error);
    auto store = std::move(opened.value);

    auto state = store->load_state();
    if (state.is_err()) throw std::runtime_error(state.error);
    auto last = store->get_metadata(META_LAST_UPDATED);
    if (last.is_err()) throw std::runtime_error(last.error);

    std::cout << render_status(state.value, last.value, std::time(nullptr), isatty(STDOUT_FILENO));
    return 0;
}

int run_init_config(int argc, char** argv) {
    auto opts = parse_options(argc, argv, 2, {"--config"}, {});
    fs::path path = opts.value("--config") ? expand_home(*opts.value("--config"))
                                           : get_default_config_path();
    bool existed = fs::exists(path);
    auto r = create_default_config(path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << (existed ? theme::step("Config already exists: " + path.string())
                          : theme::ok("Wrote " + path.string()));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << "slurmsync version " << SLURMSYNC_VERSION << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        } else if (cmd == "produce") {
            return run_produce(argc, argv);
        } else if (cmd == "consume") {
            return run_consume(argc, argv);
        } else if (cmd == "status") {
            return run_status(argc, argv);
        } else if (cmd == "init-config") {
            return run_init_config(argc, argv);
        }

        std::cerr << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
