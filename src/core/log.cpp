#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
LogLevel g_min_level = LogLevel::Info;
std::string g_log_file;
bool g_to_stderr = true;

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_upper(name);
    if (n == "DEBUG") return LogLevel::Debug;
    if (n == "WARN" || n == "WARNING") return LogLevel::Warn;
    if (n == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_min_level = level;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = path;
    if (!path.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
}

void set_log_stderr(bool enabled) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_to_stderr = enabled;
}

void sync_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_min_level)) return;

    std::string line = fmt::format("[{}] {:<5} {}", timestamp_now(), log_level_name(level), msg);

    if (g_to_stderr) {
        std::cerr << line << "\n";
        std::cerr.flush();
    }
    if (!g_log_file.empty()) {
        std::ofstream out(g_log_file, std::ios::app);
        if (out) out << line << "\n";
    }
}
