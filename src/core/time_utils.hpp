#pragma once

#include <string>
#include <ctime>

// Format a number of seconds as "2h35m", "14m22s" or "8s". Negative values clamp to "0s".
std::string format_duration(long seconds);

// Age of an ISO UTC timestamp relative to `now`, formatted as by format_duration.
// Returns "-" if the timestamp is empty, "?" on parse failure.
std::string format_age(const std::string& iso_utc, std::time_t now = std::time(nullptr));
