#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <random>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                         std::to_string(dist(rng)));
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int64_t monotonic_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace platform
