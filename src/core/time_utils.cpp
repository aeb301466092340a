#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>

std::string format_duration(long seconds) {
    if (seconds < 0) seconds = 0;
    long hours = seconds / 3600;
    long mins = (seconds % 3600) / 60;
    long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_age(const std::string& iso_utc, std::time_t now) {
    if (iso_utc.empty()) return "-";

    std::time_t then = parse_iso_utc(iso_utc);
    if (then == 0) return "?";

    return format_duration(static_cast<long>(std::difftime(now, then)));
}
