#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ) for the current time.
std::string now_iso_utc();

// Format a time_t as an ISO 8601 UTC timestamp.
std::string format_iso_utc(std::time_t t);

// Parse an ISO 8601 timestamp (with or without trailing Z) as UTC. Returns 0 on failure.
std::time_t parse_iso_utc(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on runs of spaces/tabs. Empty input yields an empty vector.
std::vector<std::string> split_whitespace(const std::string& s);

// Split on a single delimiter, keeping empty pieces.
std::vector<std::string> split(const std::string& s, char delim);

// True if every byte sequence in s is well-formed UTF-8.
bool is_valid_utf8(const std::string& s);

std::string to_upper(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
