#pragma once

#include <map>
#include <utility>
#include <vector>

// ── Keyed table ──────────────────────────────────────────────
//
// A mapping from a unique key to a value. V must provide:
//   using Key = ...;           ordered (operator<) and comparable (operator==)
//   Key key() const;
//   bool operator==(const V&) const;
//
// Rows are held ordered by key, so iteration (and therefore diff output and
// wire encoding) is deterministic.

template <typename V>
struct TableDiff {
    using Key = typename V::Key;

    std::vector<V> added;     // keys only in the new table, full value
    std::vector<V> changed;   // keys in both whose value differs, new value
    std::vector<Key> removed; // keys only in the old table

    bool empty() const { return added.empty() && changed.empty() && removed.empty(); }
    size_t size() const { return added.size() + changed.size() + removed.size(); }
};

template <typename V>
class Table {
public:
    using Key = typename V::Key;
    using const_iterator = typename std::map<Key, V>::const_iterator;

    Table() = default;

    // Later rows with a duplicate key overwrite earlier ones.
    explicit Table(std::vector<V> rows) {
        for (auto& row : rows) insert(std::move(row));
    }

    void insert(V value) {
        Key k = value.key();
        rows_[std::move(k)] = std::move(value);
    }

    bool erase(const Key& key) { return rows_.erase(key) > 0; }

    const V* find(const Key& key) const {
        auto it = rows_.find(key);
        return it == rows_.end() ? nullptr : &it->second;
    }

    bool contains(const Key& key) const { return rows_.count(key) > 0; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    void clear() { rows_.clear(); }

    const_iterator begin() const { return rows_.begin(); }
    const_iterator end() const { return rows_.end(); }

    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(rows_.size());
        for (const auto& [k, v] : rows_) out.push_back(v);
        return out;
    }

    // Changeset that turns *this into `next`. Entries present in both with
    // equal values are not emitted, so diff(t, t) is empty.
    TableDiff<V> diff(const Table& next) const {
        TableDiff<V> d;
        for (const auto& [key, value] : rows_) {
            const V* other = next.find(key);
            if (!other) {
                d.removed.push_back(key);
            } else if (!(*other == value)) {
                d.changed.push_back(*other);
            }
        }
        for (const auto& [key, value] : next.rows_) {
            if (!contains(key)) d.added.push_back(value);
        }
        return d;
    }

    // Upsert added and changed, then drop removed. The key sets of a diff are
    // disjoint, so the order does not matter, and reapplying is a no-op.
    void apply(const TableDiff<V>& d) {
        for (const auto& v : d.added) insert(v);
        for (const auto& v : d.changed) insert(v);
        for (const auto& k : d.removed) erase(k);
    }

    bool operator==(const Table& o) const { return rows_ == o.rows_; }
    bool operator!=(const Table& o) const { return !(*this == o); }

private:
    std::map<Key, V> rows_;
};
