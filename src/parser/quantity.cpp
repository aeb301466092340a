#include "quantity.hpp"
#include "parse_error.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

ResourceQuantity parse_quantity(const std::string& text, const std::string& key) {
    std::string s = trimmed(text);
    if (s.empty()) throw ParseError(key, text, "empty resource quantity");

    double multiplier = 1.0;
    switch (s.back()) {
        case 'K': case 'k': multiplier = QTY_KILO; break;
        case 'M': case 'm': multiplier = QTY_MEGA; break;
        case 'G': case 'g': multiplier = QTY_GIGA; break;
        case 'T': case 't': multiplier = QTY_TERA; break;
        default: break;
    }
    if (multiplier != 1.0) s.pop_back();

    if (s.empty() || s[0] == '-' || s[0] == '+') {
        throw ParseError(key, text, "invalid resource quantity");
    }

    // Integers go through strtoull so large byte counts don't lose precision.
    if (s.find_first_of(".eE") == std::string::npos) {
        errno = 0;
        char* end = nullptr;
        unsigned long long n = std::strtoull(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0') {
            throw ParseError(key, text, "invalid resource quantity");
        }
        auto m = static_cast<uint64_t>(multiplier);
        if (m != 0 && n > std::numeric_limits<uint64_t>::max() / m) {
            throw ParseError(key, text, "resource quantity out of range");
        }
        return ResourceQuantity{static_cast<uint64_t>(n) * m};
    }

    errno = 0;
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0' || !std::isfinite(d) || d < 0) {
        throw ParseError(key, text, "invalid resource quantity");
    }
    double scaled = d * multiplier;
    if (scaled >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        throw ParseError(key, text, "resource quantity out of range");
    }
    return ResourceQuantity{static_cast<uint64_t>(scaled)};
}
