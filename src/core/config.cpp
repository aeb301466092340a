#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_default_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

fs::path Config::database_path() const {
    if (consumer_.database.empty()) {
        return get_config_dir() / DEFAULT_DB_NAME;
    }
    return expand_home(consumer_.database);
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    if (config_path.has_parent_path()) {
        fs::create_directories(config_path.parent_path());
    }

    const char* default_config = R"(# slurmsync configuration

producer:
  interval_secs: 30          # seconds between snapshots
  mock: false                # generate synthetic cluster state instead of calling scontrol
  scontrol: "scontrol"       # administration tool; may be wrapped, e.g. "ssh login1 scontrol"
  mock_seed: 0               # 0 = seed from the clock

consumer:
  producer_cmd: "slurmsync produce --mock"   # may be "ssh login1 slurmsync produce"
  database: "~/.slurmsync/cluster.db"

log:
  level: info                # debug | info | warn | error
  file: ""                   # also append log lines here
  stderr: true               # write log lines to stderr
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ProducerConfig parse_producer_config(const YAML::Node& node) {
    ProducerConfig p;
    p.interval_secs = node["interval_secs"].as<int>(DEFAULT_INTERVAL_SECS);
    p.mock = node["mock"].as<bool>(false);
    p.scontrol = node["scontrol"].as<std::string>("scontrol");
    p.mock_seed = node["mock_seed"].as<unsigned>(0);
    p.max_ticks = node["max_ticks"].as<int>(-1);
    return p;
}

static ConsumerConfig parse_consumer_config(const YAML::Node& node) {
    ConsumerConfig c;
    c.producer_cmd = node["producer_cmd"].as<std::string>(c.producer_cmd);
    c.database = node["database"].as<std::string>("");
    return c;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig l;
    l.level = node["level"].as<std::string>("info");
    l.file = node["file"].as<std::string>("");
    l.to_stderr = node["stderr"].as<bool>(true);
    return l;
}

static Config from_root(const YAML::Node& root, Config config) {
    if (root["producer"]) config.producer() = parse_producer_config(root["producer"]);
    if (root["consumer"]) config.consumer() = parse_consumer_config(root["consumer"]);
    if (root["log"]) config.log() = parse_log_config(root["log"]);

    if (config.producer().interval_secs <= 0) {
        config.producer().interval_secs = DEFAULT_INTERVAL_SECS;
    }
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }
        return Result<Config>::Ok(from_root(root, Config{}));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_default_config_path());
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping in " + path.string());
        }
        return Result<Config>::Ok(from_root(root, Config{}));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config ") + path.string() +
                                   ": " + e.what());
    }
}
