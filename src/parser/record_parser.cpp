#include "record_parser.hpp"
#include <core/utils.hpp>
#include <cctype>

// ── Record ───────────────────────────────────────────────────

void Record::add(const std::string& key, std::string value) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        index_[key] = fields_.size();
        fields_.push_back({key, FieldValue{{std::move(value)}}});
    } else {
        fields_[it->second].second.values.push_back(std::move(value));
    }
}

bool Record::has(const std::string& key) const {
    return index_.count(key) > 0;
}

const FieldValue* Record::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second].second;
}

const std::string& Record::get(const std::string& key) const {
    const FieldValue* v = find(key);
    if (!v) throw ParseError(key, "", "missing field");
    return v->first();
}

std::vector<std::string> Record::keys() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& f : fields_) out.push_back(f.first);
    return out;
}

// ── Helpers ──────────────────────────────────────────────────

bool is_sentinel(const std::string& value) {
    return value.empty() || value == "(null)" || value == "None";
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '/' || c == '-' || c == ':' || c == '.';
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim_value(const std::string& raw) {
    auto strip = [](char c) { return is_space(c) || c == ','; };
    size_t start = 0;
    while (start < raw.size() && strip(raw[start])) start++;
    size_t end = raw.size();
    while (end > start && strip(raw[end - 1])) end--;
    return raw.substr(start, end - start);
}

static bool is_blank_line(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) {
        if (text[i] != ' ' && text[i] != '\t' && text[i] != '\r') return false;
    }
    return true;
}

std::vector<std::string> split_blocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::string current;
    size_t pos = 0;

    auto flush = [&]() {
        std::string t = trimmed(current);
        if (!t.empty()) blocks.push_back(std::move(t));
        current.clear();
    };

    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = nl == std::string::npos ? text.size() : nl;
        if (is_blank_line(text, pos, end)) {
            flush();
        } else {
            current.append(text, pos, end - pos);
            current += '\n';
        }
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    flush();
    return blocks;
}

// ── Tokenizer ────────────────────────────────────────────────

namespace {

struct KeyToken {
    size_t start;       // first char of the key
    size_t value_start; // first char after '='
    std::string key;
};

std::vector<KeyToken> find_key_tokens(const std::string& block) {
    std::vector<KeyToken> tokens;
    size_t i = 0;
    while (i < block.size()) {
        bool at_boundary = (i == 0) || is_space(block[i - 1]);
        if (!at_boundary || !is_key_char(block[i])) {
            i++;
            continue;
        }
        size_t j = i;
        while (j < block.size() && is_key_char(block[j])) j++;
        if (j < block.size() && block[j] == '=') {
            tokens.push_back({i, j + 1, block.substr(i, j - i)});
            i = j + 1;
        } else {
            i = j;
        }
    }
    return tokens;
}

} // namespace

Record tokenize_block(const std::string& block) {
    auto tokens = find_key_tokens(block);
    if (tokens.empty()) {
        throw ParseError("", block, "no key=value field in record");
    }

    Record record;
    for (size_t t = 0; t < tokens.size(); t++) {
        size_t value_end = (t + 1 < tokens.size()) ? tokens[t + 1].start : block.size();
        std::string value = trim_value(
            block.substr(tokens[t].value_start, value_end - tokens[t].value_start));
        if (is_sentinel(value)) continue;
        record.add(tokens[t].key, std::move(value));
    }
    return record;
}
