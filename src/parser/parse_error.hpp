#pragma once

#include <stdexcept>
#include <string>

// Raised when scheduler record text cannot be decoded into the requested type.
// Carries the offending key and raw value so callers can report or skip.
class ParseError : public std::runtime_error {
public:
    ParseError(std::string key, std::string value, const std::string& reason)
        : std::runtime_error(describe(key, value, reason)),
          key_(std::move(key)), value_(std::move(value)) {}

    const std::string& key() const { return key_; }
    const std::string& value() const { return value_; }

private:
    std::string key_;
    std::string value_;

    static std::string describe(const std::string& key, const std::string& value,
                                const std::string& reason) {
        std::string msg = reason;
        if (!key.empty()) msg += " (key " + key + ")";
        if (!value.empty()) {
            msg += ": '" + (value.size() > 120 ? value.substr(0, 120) + "..." : value) + "'";
        }
        return msg;
    }
};
