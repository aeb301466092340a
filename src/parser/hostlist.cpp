#include "hostlist.hpp"
#include "parse_error.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cstdlib>

namespace {

constexpr uint64_t MAX_RANGE_SPAN = 1000000;

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Split on commas that are not inside brackets.
std::vector<std::string> split_top_level(const std::string& expr) {
    std::vector<std::string> out;
    std::string current;
    int depth = 0;
    for (char c : expr) {
        if (c == '[') depth++;
        if (c == ']') {
            if (--depth < 0) throw ParseError("hostlist", expr, "unbalanced ']'");
        }
        if (c == ',' && depth == 0) {
            if (!current.empty()) out.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (depth != 0) throw ParseError("hostlist", expr, "unbalanced '['");
    if (!current.empty()) out.push_back(current);
    return out;
}

// "01-03,7" -> {"01","02","03","7"}
std::vector<std::string> expand_range_list(const std::string& body, const std::string& expr) {
    std::vector<std::string> out;
    for (const auto& piece : split(body, ',')) {
        auto dash = piece.find('-');
        if (dash == std::string::npos) {
            if (!all_digits(piece)) throw ParseError("hostlist", expr, "bad range element");
            out.push_back(piece);
            continue;
        }
        std::string lo_s = piece.substr(0, dash);
        std::string hi_s = piece.substr(dash + 1);
        if (!all_digits(lo_s) || !all_digits(hi_s)) {
            throw ParseError("hostlist", expr, "bad range element");
        }
        uint64_t lo = std::strtoull(lo_s.c_str(), nullptr, 10);
        uint64_t hi = std::strtoull(hi_s.c_str(), nullptr, 10);
        if (hi < lo || hi - lo > MAX_RANGE_SPAN) {
            throw ParseError("hostlist", expr, "bad range bounds");
        }
        size_t width = lo_s.size();
        for (uint64_t n = lo; n <= hi; n++) {
            out.push_back(fmt::format("{:0{}}", n, width));
        }
    }
    return out;
}

void expand_name(const std::string& name, const std::string& expr,
                 std::vector<std::string>& out) {
    auto open = name.find('[');
    if (open == std::string::npos) {
        out.push_back(name);
        return;
    }
    auto close = name.find(']', open);
    if (close == std::string::npos) throw ParseError("hostlist", expr, "unbalanced '['");

    std::string prefix = name.substr(0, open);
    std::string rest = name.substr(close + 1);
    for (const auto& id : expand_range_list(name.substr(open + 1, close - open - 1), expr)) {
        expand_name(prefix + id + rest, expr, out);
    }
}

} // namespace

std::vector<std::string> expand_hostlist(const std::string& expr) {
    std::vector<std::string> hosts;
    for (const auto& name : split_top_level(trimmed(expr))) {
        expand_name(name, expr, hosts);
    }
    return hosts;
}

uint64_t count_id_ranges(const std::string& ranges) {
    uint64_t count = 0;
    for (const auto& piece : split(trimmed(ranges), ',')) {
        if (piece.empty()) continue;
        auto dash = piece.find('-');
        if (dash == std::string::npos) {
            if (!all_digits(piece)) throw ParseError("CPU_IDs", ranges, "bad id");
            count++;
            continue;
        }
        std::string lo_s = piece.substr(0, dash);
        std::string hi_s = piece.substr(dash + 1);
        if (!all_digits(lo_s) || !all_digits(hi_s)) {
            throw ParseError("CPU_IDs", ranges, "bad id range");
        }
        uint64_t lo = std::strtoull(lo_s.c_str(), nullptr, 10);
        uint64_t hi = std::strtoull(hi_s.c_str(), nullptr, 10);
        if (hi < lo) throw ParseError("CPU_IDs", ranges, "bad id range");
        count += hi - lo + 1;
    }
    return count;
}
