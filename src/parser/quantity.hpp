#pragma once

#include <cstdint>
#include <string>

// A trackable-resource amount as printed by scontrol: a bare number or a
// number with a unit suffix. Suffixes are decimal: K=10^3, M=10^6, G=10^9,
// T=10^12 (so "mem=15000M" is 15,000,000,000). Fractional mantissas such as
// "1.5G" are accepted and truncated.
struct ResourceQuantity {
    uint64_t value = 0;

    bool operator==(const ResourceQuantity& o) const { return value == o.value; }
    bool operator!=(const ResourceQuantity& o) const { return value != o.value; }
};

// Throws ParseError (keyed by `key`) on malformed or negative input.
ResourceQuantity parse_quantity(const std::string& text, const std::string& key = "");

// available = total - allocated, clamped at zero.
inline uint64_t saturating_sub(uint64_t total, uint64_t allocated) {
    return allocated >= total ? 0 : total - allocated;
}
