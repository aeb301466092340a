#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <model/cluster_state.hpp>

struct sqlite3;

// Durable replica of the cluster state in SQLite: one table per entity
// table plus a key/value metadata table. Mutated only by applying diffs.
class StateDB {
public:
    // Open (creating if needed) the database at `path` and ensure the schema.
    // ":memory:" gives a private in-memory database.
    static Result<std::unique_ptr<StateDB>> open(const std::string& path);

    ~StateDB();
    StateDB(const StateDB&) = delete;
    StateDB& operator=(const StateDB&) = delete;

    // Per-table upserts for added/changed and deletes for removed, issued one
    // statement at a time with no wrapping transaction. Stops at the first
    // failing statement; earlier statements stay applied.
    Result<void> apply_diff(const ClusterDiff& diff);

    // Rebuild the aggregate. Node partition lists come from node_partitions;
    // updated_at is the newest per-row timestamp (absent for an empty store).
    Result<ClusterState> load_state();

    Result<void> set_metadata(const std::string& key, const std::string& value);
    Result<std::optional<std::string>> get_metadata(const std::string& key);

private:
    explicit StateDB(sqlite3* db) : db_(db) {}

    Result<void> create_schema();

    sqlite3* db_;
};
