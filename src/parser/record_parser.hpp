#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "parse_error.hpp"

// ── Raw record model ─────────────────────────────────────────
//
// scontrol prints one block per entity, blocks separated by blank lines:
//
//   NodeName=node4504 Arch=x86_64 CoresPerSocket=32
//      CPUAlloc=0 CPUTot=64 CPULoad=0.04
//      CfgTRES=cpu=64,mem=1031314M,billing=64
//
// A field starts at a `Key=` token preceded by whitespace (or the start of
// the block) and its value runs to the next key token. Values that are empty,
// "(null)" or "None" are absent. A key seen twice accumulates its values.

struct FieldValue {
    std::vector<std::string> values;

    bool repeated() const { return values.size() > 1; }
    const std::string& first() const { return values.front(); }
};

class Record {
public:
    void add(const std::string& key, std::string value);

    bool has(const std::string& key) const;
    const FieldValue* find(const std::string& key) const;

    // First value of a present key; throws ParseError if absent.
    const std::string& get(const std::string& key) const;

    // Keys in order of first appearance.
    std::vector<std::string> keys() const;
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

private:
    std::vector<std::pair<std::string, FieldValue>> fields_;
    std::map<std::string, size_t> index_;
};

// True for values scontrol uses to mean "no value".
bool is_sentinel(const std::string& value);

// True for characters allowed in a field key: [A-Za-z0-9_/\-:.]
bool is_key_char(char c);

// Split text into trimmed, non-empty blocks separated by blank lines.
std::vector<std::string> split_blocks(const std::string& text);

// Tokenize one block into a Record. Throws ParseError if the block has no
// recognizable key token.
Record tokenize_block(const std::string& block);

// Strip whitespace, line breaks and commas from both ends of a raw value.
std::string trim_value(const std::string& raw);
