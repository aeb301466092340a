#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.slurmsync/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path. A missing file yields defaults.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly (used by load and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ProducerConfig& producer() const { return producer_; }
    const ConsumerConfig& consumer() const { return consumer_; }
    const LogConfig& log() const { return log_; }

    // Command-line overrides
    ProducerConfig& producer() { return producer_; }
    ConsumerConfig& consumer() { return consumer_; }
    LogConfig& log() { return log_; }

    // Database path with the default applied and "~/" expanded.
    fs::path database_path() const;

    Config() = default;

private:
    ProducerConfig producer_;
    ConsumerConfig consumer_;
    LogConfig log_;
};

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();

// Expand a leading "~/" to the home directory.
fs::path expand_home(const std::string& path);

// Write a commented default config if none exists at `path`.
Result<void> create_default_config(const fs::path& path = get_default_config_path());
