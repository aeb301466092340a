#pragma once

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "parse_error.hpp"
#include "quantity.hpp"
#include "record_parser.hpp"

// ── Target-typed decoding ────────────────────────────────────
//
// The text carries no type information; the type a caller asks for decides
// how a field is read. Each Decoder<T> specialization knows three things:
//   from_text(key, text)    decode one scalar piece of text
//   from_field(key, field)  decode a whole field (single or repeated values)
//   absent(key)             what a missing field becomes (error unless optional)

namespace detail {

inline std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        auto pos = s.find(',', start);
        if (pos == std::string::npos) pos = s.size();
        std::string piece = trim_value(s.substr(start, pos - start));
        if (!piece.empty()) out.push_back(std::move(piece));
        start = pos + 1;
    }
    return out;
}

inline const std::string& single(const std::string& key, const FieldValue& field) {
    if (field.repeated()) {
        throw ParseError(key, field.values.front(),
                         "expected a single value, key appears more than once");
    }
    return field.first();
}

} // namespace detail

template <typename T, typename Enable = void>
struct Decoder;

// Scalars share the same field handling.
template <typename T>
struct ScalarDecoder {
    static T from_field(const std::string& key, const FieldValue& field) {
        return Decoder<T>::from_text(key, detail::single(key, field));
    }
    static T absent(const std::string& key) {
        throw ParseError(key, "", "missing required field");
    }
};

template <>
struct Decoder<std::string> : ScalarDecoder<std::string> {
    static std::string from_text(const std::string&, const std::string& text) {
        return text;
    }
};

template <>
struct Decoder<bool> : ScalarDecoder<bool> {
    static bool from_text(const std::string& key, const std::string& text) {
        if (text == "1") return true;
        if (text == "0") return false;
        std::string lower;
        for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "true") return true;
        if (lower == "false") return false;
        throw ParseError(key, text, "expected bool");
    }
};

template <typename T>
struct Decoder<T, std::enable_if_t<std::is_integral<T>::value && std::is_signed<T>::value>>
    : ScalarDecoder<T> {
    static T from_text(const std::string& key, const std::string& text) {
        errno = 0;
        char* end = nullptr;
        long long n = std::strtoll(text.c_str(), &end, 10);
        if (text.empty() || errno != 0 || *end != '\0' ||
            n < static_cast<long long>(std::numeric_limits<T>::min()) ||
            n > static_cast<long long>(std::numeric_limits<T>::max())) {
            throw ParseError(key, text, "expected integer");
        }
        return static_cast<T>(n);
    }
};

template <typename T>
struct Decoder<T, std::enable_if_t<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                   !std::is_same<T, bool>::value>>
    : ScalarDecoder<T> {
    static T from_text(const std::string& key, const std::string& text) {
        if (text.empty() || text[0] == '-') {
            throw ParseError(key, text, "expected unsigned integer");
        }
        errno = 0;
        char* end = nullptr;
        unsigned long long n = std::strtoull(text.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' ||
            n > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw ParseError(key, text, "expected unsigned integer");
        }
        return static_cast<T>(n);
    }
};

template <typename T>
struct Decoder<T, std::enable_if_t<std::is_floating_point<T>::value>> : ScalarDecoder<T> {
    static T from_text(const std::string& key, const std::string& text) {
        errno = 0;
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (text.empty() || errno != 0 || *end != '\0') {
            throw ParseError(key, text, "expected number");
        }
        return static_cast<T>(d);
    }
};

template <>
struct Decoder<ResourceQuantity> : ScalarDecoder<ResourceQuantity> {
    static ResourceQuantity from_text(const std::string& key, const std::string& text) {
        return parse_quantity(text, key);
    }
};

template <typename T>
struct Decoder<std::optional<T>> {
    static std::optional<T> from_text(const std::string& key, const std::string& text) {
        return Decoder<T>::from_text(key, text);
    }
    static std::optional<T> from_field(const std::string& key, const FieldValue& field) {
        return Decoder<T>::from_field(key, field);
    }
    static std::optional<T> absent(const std::string&) {
        return std::nullopt;
    }
};

// Sequence: one value split on commas, or the accumulated repeats as-is.
template <typename T>
struct Decoder<std::vector<T>> {
    static std::vector<T> from_text(const std::string& key, const std::string& text) {
        std::vector<T> out;
        for (const auto& piece : detail::split_commas(text)) {
            out.push_back(Decoder<T>::from_text(key, piece));
        }
        return out;
    }
    static std::vector<T> from_field(const std::string& key, const FieldValue& field) {
        if (!field.repeated()) return from_text(key, field.first());
        std::vector<T> out;
        for (const auto& v : field.values) out.push_back(Decoder<T>::from_text(key, v));
        return out;
    }
    static std::vector<T> absent(const std::string& key) {
        throw ParseError(key, "", "missing required field");
    }
};

// Nested mapping: "cpu=64,mem=1031314M" -> {cpu: 64, mem: 1031314M}.
template <typename T>
struct Decoder<std::map<std::string, T>> {
    static std::map<std::string, T> from_text(const std::string& key, const std::string& text) {
        std::map<std::string, T> out;
        add_pairs(key, text, out);
        return out;
    }
    static std::map<std::string, T> from_field(const std::string& key, const FieldValue& field) {
        std::map<std::string, T> out;
        for (const auto& v : field.values) add_pairs(key, v, out);
        return out;
    }
    static std::map<std::string, T> absent(const std::string& key) {
        throw ParseError(key, "", "missing required field");
    }

private:
    static void add_pairs(const std::string& key, const std::string& text,
                          std::map<std::string, T>& out) {
        for (const auto& piece : detail::split_commas(text)) {
            auto eq = piece.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw ParseError(key, piece, "invalid key=value pair");
            }
            std::string sub_key = piece.substr(0, eq);
            out[sub_key] = Decoder<T>::from_text(key + "." + sub_key, piece.substr(eq + 1));
        }
    }
};

// ── FieldReader ──────────────────────────────────────────────

// Pull-based view over one Record used by raw record types to describe
// their fields:
//
//   void decode(const FieldReader& r) {
//       r.field("NodeName", name);
//       r.field("FreeMem", free_mem);   // std::optional -> may be absent
//   }
class FieldReader {
public:
    explicit FieldReader(const Record& record) : record_(record) {}

    template <typename T>
    void field(const std::string& key, T& out) const {
        const FieldValue* v = record_.find(key);
        out = v ? Decoder<T>::from_field(key, *v) : Decoder<T>::absent(key);
    }

    // Like field(), but a missing key leaves `fallback` instead of failing.
    template <typename T>
    void field_or(const std::string& key, T& out, T fallback) const {
        const FieldValue* v = record_.find(key);
        out = v ? Decoder<T>::from_field(key, *v) : std::move(fallback);
    }

    bool has(const std::string& key) const { return record_.has(key); }
    const Record& record() const { return record_; }

private:
    const Record& record_;
};

// Decode a single text value as T (e.g. a TRES map on its own).
template <typename T>
T decode_text(const std::string& text, const std::string& key = "") {
    return Decoder<T>::from_text(key, trim_value(text));
}

// ── Whole-document entry points ──────────────────────────────

// Decode every block as one T (T must provide `void decode(const FieldReader&)`).
// With `skipped` null, the first bad block throws; otherwise bad blocks are
// recorded there and left out of the result.
template <typename T>
std::vector<T> parse_records(const std::string& text, std::vector<ParseError>* skipped = nullptr) {
    std::vector<T> out;
    for (const auto& block : split_blocks(text)) {
        try {
            Record record = tokenize_block(block);
            T item{};
            item.decode(FieldReader(record));
            out.push_back(std::move(item));
        } catch (const ParseError& e) {
            if (!skipped) throw;
            skipped->push_back(e);
        }
    }
    return out;
}

// Decode the first block as one T. Throws ParseError if the text holds no record.
template <typename T>
T parse_record(const std::string& text) {
    auto blocks = split_blocks(text);
    if (blocks.empty()) throw ParseError("", "", "no record found");
    Record record = tokenize_block(blocks.front());
    T item{};
    item.decode(FieldReader(record));
    return item;
}
