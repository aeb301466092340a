#include "state_db.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <sqlite3.h>
#include <filesystem>
#include <map>

namespace {

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS partitions (
    name TEXT PRIMARY KEY,
    status TEXT NOT NULL,
    total_nodes INTEGER NOT NULL,
    total_cpus INTEGER NOT NULL,
    total_cpus_alloc INTEGER NOT NULL,
    total_cpus_idle INTEGER NOT NULL,
    total_memory INTEGER NOT NULL,
    total_memory_alloc INTEGER NOT NULL,
    total_memory_free INTEGER NOT NULL,
    access_qos TEXT,
    resource_qos TEXT,
    updated_at DATETIME NOT NULL
);

CREATE TABLE IF NOT EXISTS nodes (
    name TEXT PRIMARY KEY,
    status TEXT NOT NULL,
    cpus INTEGER NOT NULL,
    cpus_alloc INTEGER NOT NULL,
    cpus_idle INTEGER NOT NULL,
    memory INTEGER NOT NULL,
    memory_alloc INTEGER NOT NULL,
    memory_free INTEGER NOT NULL,
    updated_at DATETIME NOT NULL
);

CREATE TABLE IF NOT EXISTS node_partitions (
    node TEXT NOT NULL,
    partition TEXT NOT NULL,
    PRIMARY KEY (node, partition)
);

CREATE TABLE IF NOT EXISTS node_resources (
    node TEXT NOT NULL,
    resource TEXT NOT NULL,
    available INTEGER NOT NULL,
    total INTEGER NOT NULL,
    PRIMARY KEY (node, resource)
);

CREATE TABLE IF NOT EXISTS jobs (
    job_id INTEGER PRIMARY KEY,
    user TEXT NOT NULL,
    partition TEXT NOT NULL,
    status TEXT NOT NULL,
    time_limit TEXT,
    start_time TEXT,
    submit_time TEXT NOT NULL,
    updated_at DATETIME NOT NULL
);

CREATE TABLE IF NOT EXISTS job_resources (
    job_id INTEGER NOT NULL,
    resource TEXT NOT NULL,
    requested INTEGER NOT NULL,
    allocated INTEGER NOT NULL,
    PRIMARY KEY (job_id, resource)
);

CREATE TABLE IF NOT EXISTS job_allocations (
    job_id INTEGER NOT NULL,
    node TEXT NOT NULL,
    resource TEXT NOT NULL,
    used INTEGER NOT NULL,
    PRIMARY KEY (job_id, node, resource)
);

CREATE TABLE IF NOT EXISTS metadata (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)SQL";

// Prepared statement with named parameters (":name"). Bind failures are
// remembered and reported by step().
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            error_ = fmt::format("prepare: {}", sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(const char* name, const std::string& v) {
        if (!error_.empty()) return;
        check(sqlite3_bind_text(stmt_, index(name), v.c_str(), -1, SQLITE_TRANSIENT), name);
    }

    void bind_opt_text(const char* name, const std::optional<std::string>& v) {
        if (!error_.empty()) return;
        if (v) bind_text(name, *v);
        else check(sqlite3_bind_null(stmt_, index(name)), name);
    }

    void bind_int(const char* name, int64_t v) {
        if (!error_.empty()) return;
        check(sqlite3_bind_int64(stmt_, index(name), v), name);
    }

    // SQLITE_ROW -> Ok(true), SQLITE_DONE -> Ok(false).
    Result<bool> step() {
        if (!error_.empty()) return Result<bool>::Err(error_);
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return Result<bool>::Ok(true);
        if (rc == SQLITE_DONE) return Result<bool>::Ok(false);
        return Result<bool>::Err(fmt::format("step: {}", sqlite3_errmsg(db_)));
    }

    Result<void> run() {
        auto r = step();
        if (r.is_err()) return Result<void>::Err(r.error);
        return Result<void>::Ok();
    }

    std::string text(int col) const {
        auto p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }

    std::optional<std::string> opt_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string error_;

    int index(const char* name) { return sqlite3_bind_parameter_index(stmt_, name); }

    void check(int rc, const char* name) {
        if (rc != SQLITE_OK) error_ = fmt::format("bind({}): {}", name, sqlite3_errmsg(db_));
    }
};

// ── Upserts / deletes ────────────────────────────────────────

Result<void> upsert(sqlite3* db, const Partition& p) {
    Statement st(db, R"SQL(
        INSERT INTO partitions (name, status, total_nodes, total_cpus, total_cpus_alloc,
                                total_cpus_idle, total_memory, total_memory_alloc,
                                total_memory_free, access_qos, resource_qos, updated_at)
        VALUES (:name, :status, :total_nodes, :total_cpus, :total_cpus_alloc,
                :total_cpus_idle, :total_memory, :total_memory_alloc,
                :total_memory_free, :access_qos, :resource_qos, :updated_at)
        ON CONFLICT(name) DO UPDATE SET
            status = excluded.status,
            total_nodes = excluded.total_nodes,
            total_cpus = excluded.total_cpus,
            total_cpus_alloc = excluded.total_cpus_alloc,
            total_cpus_idle = excluded.total_cpus_idle,
            total_memory = excluded.total_memory,
            total_memory_alloc = excluded.total_memory_alloc,
            total_memory_free = excluded.total_memory_free,
            access_qos = excluded.access_qos,
            resource_qos = excluded.resource_qos,
            updated_at = excluded.updated_at
    )SQL");
    st.bind_text(":name", p.name);
    st.bind_text(":status", to_string(p.status));
    st.bind_int(":total_nodes", p.total_nodes);
    st.bind_int(":total_cpus", p.total_cpus);
    st.bind_int(":total_cpus_alloc", p.total_cpus_alloc);
    st.bind_int(":total_cpus_idle", p.total_cpus_idle);
    st.bind_int(":total_memory", p.total_memory);
    st.bind_int(":total_memory_alloc", p.total_memory_alloc);
    st.bind_int(":total_memory_free", p.total_memory_free);
    st.bind_opt_text(":access_qos", p.access_qos);
    st.bind_opt_text(":resource_qos", p.resource_qos);
    st.bind_text(":updated_at", p.updated_at);
    return st.run();
}

Result<void> delete_row(sqlite3* db, const std::string& name, const Partition*) {
    Statement st(db, "DELETE FROM partitions WHERE name = :name");
    st.bind_text(":name", name);
    return st.run();
}

Result<void> upsert(sqlite3* db, const Node& n) {
    Statement st(db, R"SQL(
        INSERT INTO nodes (name, status, cpus, cpus_alloc, cpus_idle,
                           memory, memory_alloc, memory_free, updated_at)
        VALUES (:name, :status, :cpus, :cpus_alloc, :cpus_idle,
                :memory, :memory_alloc, :memory_free, :updated_at)
        ON CONFLICT(name) DO UPDATE SET
            status = excluded.status,
            cpus = excluded.cpus,
            cpus_alloc = excluded.cpus_alloc,
            cpus_idle = excluded.cpus_idle,
            memory = excluded.memory,
            memory_alloc = excluded.memory_alloc,
            memory_free = excluded.memory_free,
            updated_at = excluded.updated_at
    )SQL");
    st.bind_text(":name", n.name);
    st.bind_text(":status", to_string(n.status));
    st.bind_int(":cpus", n.cpus);
    st.bind_int(":cpus_alloc", n.cpus_alloc);
    st.bind_int(":cpus_idle", n.cpus_idle);
    st.bind_int(":memory", n.memory);
    st.bind_int(":memory_alloc", n.memory_alloc);
    st.bind_int(":memory_free", n.memory_free);
    st.bind_text(":updated_at", n.updated_at);
    return st.run();
}

Result<void> delete_row(sqlite3* db, const std::string& name, const Node*) {
    Statement st(db, "DELETE FROM nodes WHERE name = :name");
    st.bind_text(":name", name);
    return st.run();
}

Result<void> upsert(sqlite3* db, const NodePartition& e) {
    Statement st(db, R"SQL(
        INSERT INTO node_partitions (node, partition) VALUES (:node, :partition)
        ON CONFLICT(node, partition) DO NOTHING
    )SQL");
    st.bind_text(":node", e.node);
    st.bind_text(":partition", e.partition);
    return st.run();
}

Result<void> delete_row(sqlite3* db, const NodePartitionKey& k, const NodePartition*) {
    Statement st(db, "DELETE FROM node_partitions WHERE node = :node AND partition = :partition");
    st.bind_text(":node", k.node);
    st.bind_text(":partition", k.partition);
    return st.run();
}

Result<void> upsert(sqlite3* db, const NodeResource& r) {
    Statement st(db, R"SQL(
        INSERT INTO node_resources (node, resource, available, total)
        VALUES (:node, :resource, :available, :total)
        ON CONFLICT(node, resource) DO UPDATE SET
            available = excluded.available,
            total = excluded.total
    )SQL");
    st.bind_text(":node", r.node);
    st.bind_text(":resource", r.resource);
    st.bind_int(":available", static_cast<int64_t>(r.available));
    st.bind_int(":total", static_cast<int64_t>(r.total));
    return st.run();
}

Result<void> delete_row(sqlite3* db, const NodeResourceKey& k, const NodeResource*) {
    Statement st(db, "DELETE FROM node_resources WHERE node = :node AND resource = :resource");
    st.bind_text(":node", k.node);
    st.bind_text(":resource", k.resource);
    return st.run();
}

Result<void> upsert(sqlite3* db, const Job& j) {
    Statement st(db, R"SQL(
        INSERT INTO jobs (job_id, user, partition, status, time_limit, start_time,
                          submit_time, updated_at)
        VALUES (:job_id, :user, :partition, :status, :time_limit, :start_time,
                :submit_time, :updated_at)
        ON CONFLICT(job_id) DO UPDATE SET
            user = excluded.user,
            partition = excluded.partition,
            status = excluded.status,
            time_limit = excluded.time_limit,
            start_time = excluded.start_time,
            submit_time = excluded.submit_time,
            updated_at = excluded.updated_at
    )SQL");
    st.bind_int(":job_id", j.job_id);
    st.bind_text(":user", j.user);
    st.bind_text(":partition", j.partition);
    st.bind_text(":status", to_string(j.status));
    st.bind_opt_text(":time_limit", j.time_limit);
    st.bind_opt_text(":start_time", j.start_time);
    st.bind_text(":submit_time", j.submit_time);
    st.bind_text(":updated_at", j.updated_at);
    return st.run();
}

Result<void> delete_row(sqlite3* db, const JobId& id, const Job*) {
    Statement st(db, "DELETE FROM jobs WHERE job_id = :job_id");
    st.bind_int(":job_id", id);
    return st.run();
}

Result<void> upsert(sqlite3* db, const JobResource& r) {
    Statement st(db, R"SQL(
        INSERT INTO job_resources (job_id, resource, requested, allocated)
        VALUES (:job_id, :resource, :requested, :allocated)
        ON CONFLICT(job_id, resource) DO UPDATE SET
            requested = excluded.requested,
            allocated = excluded.allocated
    )SQL");
    st.bind_int(":job_id", r.job_id);
    st.bind_text(":resource", r.resource);
    st.bind_int(":requested", static_cast<int64_t>(r.requested));
    st.bind_int(":allocated", static_cast<int64_t>(r.allocated));
    return st.run();
}

Result<void> delete_row(sqlite3* db, const JobResourceKey& k, const JobResource*) {
    Statement st(db, "DELETE FROM job_resources WHERE job_id = :job_id AND resource = :resource");
    st.bind_int(":job_id", k.job_id);
    st.bind_text(":resource", k.resource);
    return st.run();
}

Result<void> upsert(sqlite3* db, const JobAllocation& a) {
    Statement st(db, R"SQL(
        INSERT INTO job_allocations (job_id, node, resource, used)
        VALUES (:job_id, :node, :resource, :used)
        ON CONFLICT(job_id, node, resource) DO UPDATE SET
            used = excluded.used
    )SQL");
    st.bind_int(":job_id", a.job_id);
    st.bind_text(":node", a.node);
    st.bind_text(":resource", a.resource);
    st.bind_int(":used", static_cast<int64_t>(a.used));
    return st.run();
}

Result<void> delete_row(sqlite3* db, const JobAllocationKey& k, const JobAllocation*) {
    Statement st(db, R"SQL(
        DELETE FROM job_allocations
        WHERE job_id = :job_id AND node = :node AND resource = :resource
    )SQL");
    st.bind_int(":job_id", k.job_id);
    st.bind_text(":node", k.node);
    st.bind_text(":resource", k.resource);
    return st.run();
}

template <typename V>
Result<void> apply_table(sqlite3* db, const char* table, const TableDiff<V>& d) {
    for (const auto& v : d.added) {
        auto r = upsert(db, v);
        if (r.is_err()) return Result<void>::Err(fmt::format("{} upsert: {}", table, r.error));
    }
    for (const auto& v : d.changed) {
        auto r = upsert(db, v);
        if (r.is_err()) return Result<void>::Err(fmt::format("{} upsert: {}", table, r.error));
    }
    for (const auto& k : d.removed) {
        auto r = delete_row(db, k, static_cast<const V*>(nullptr));
        if (r.is_err()) return Result<void>::Err(fmt::format("{} delete: {}", table, r.error));
    }
    return Result<void>::Ok();
}

} // namespace

// ── StateDB ──────────────────────────────────────────────────

Result<std::unique_ptr<StateDB>> StateDB::open(const std::string& path) {
    if (path != ":memory:") {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Result<std::unique_ptr<StateDB>>::Err(
            fmt::format("Failed to open database {}: {}", path, err));
    }

    std::unique_ptr<StateDB> store(new StateDB(db));
    auto schema = store->create_schema();
    if (schema.is_err()) return Result<std::unique_ptr<StateDB>>::Err(schema.error);
    log_debug(fmt::format("Opened database {}", path));
    return Result<std::unique_ptr<StateDB>>::Ok(std::move(store));
}

StateDB::~StateDB() {
    sqlite3_close(db_);
}

Result<void> StateDB::create_schema() {
    char* err = nullptr;
    if (sqlite3_exec(db_, SCHEMA_SQL, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        return Result<void>::Err(fmt::format("Failed to create schema: {}", msg));
    }
    return Result<void>::Ok();
}

Result<void> StateDB::apply_diff(const ClusterDiff& diff) {
    Result<void> r = apply_table(db_, "partitions", diff.partitions);
    if (r.is_ok()) r = apply_table(db_, "nodes", diff.nodes);
    if (r.is_ok()) r = apply_table(db_, "node_partitions", diff.node_partitions);
    if (r.is_ok()) r = apply_table(db_, "node_resources", diff.node_resources);
    if (r.is_ok()) r = apply_table(db_, "jobs", diff.jobs);
    if (r.is_ok()) r = apply_table(db_, "job_resources", diff.job_resources);
    if (r.is_ok()) r = apply_table(db_, "job_allocations", diff.job_allocations);
    return r;
}

Result<ClusterState> StateDB::load_state() {
    ClusterState state;

    {
        Statement st(db_, R"SQL(
            SELECT name, status, total_nodes, total_cpus, total_cpus_alloc, total_cpus_idle,
                   total_memory, total_memory_alloc, total_memory_free, access_qos,
                   resource_qos, updated_at
            FROM partitions
        )SQL");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            Partition p;
            p.name = st.text(0);
            p.status = parse_partition_status(st.text(1));
            p.total_nodes = static_cast<uint32_t>(st.int64(2));
            p.total_cpus = static_cast<uint32_t>(st.int64(3));
            p.total_cpus_alloc = static_cast<uint32_t>(st.int64(4));
            p.total_cpus_idle = static_cast<uint32_t>(st.int64(5));
            p.total_memory = st.int64(6);
            p.total_memory_alloc = st.int64(7);
            p.total_memory_free = st.int64(8);
            p.access_qos = st.opt_text(9);
            p.resource_qos = st.opt_text(10);
            p.updated_at = st.text(11);
            state.partitions.insert(std::move(p));
        }
        if (row.is_err()) return Result<ClusterState>::Err("partitions: " + row.error);
    }

    std::map<std::string, std::vector<std::string>> memberships;
    {
        Statement st(db_, "SELECT node, partition FROM node_partitions ORDER BY node, partition");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            NodePartition e{st.text(0), st.text(1)};
            memberships[e.node].push_back(e.partition);
            state.node_partitions.insert(std::move(e));
        }
        if (row.is_err()) return Result<ClusterState>::Err("node_partitions: " + row.error);
    }

    {
        Statement st(db_, R"SQL(
            SELECT name, status, cpus, cpus_alloc, cpus_idle,
                   memory, memory_alloc, memory_free, updated_at
            FROM nodes
        )SQL");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            Node n;
            n.name = st.text(0);
            n.status = parse_node_status(st.text(1));
            n.cpus = static_cast<uint32_t>(st.int64(2));
            n.cpus_alloc = static_cast<uint32_t>(st.int64(3));
            n.cpus_idle = static_cast<uint32_t>(st.int64(4));
            n.memory = st.int64(5);
            n.memory_alloc = st.int64(6);
            n.memory_free = st.int64(7);
            n.updated_at = st.text(8);
            auto it = memberships.find(n.name);
            if (it != memberships.end()) n.partitions = it->second;
            state.nodes.insert(std::move(n));
        }
        if (row.is_err()) return Result<ClusterState>::Err("nodes: " + row.error);
    }

    {
        Statement st(db_, "SELECT node, resource, available, total FROM node_resources");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            state.node_resources.insert(NodeResource{st.text(0), st.text(1),
                                                     static_cast<uint64_t>(st.int64(2)),
                                                     static_cast<uint64_t>(st.int64(3))});
        }
        if (row.is_err()) return Result<ClusterState>::Err("node_resources: " + row.error);
    }

    {
        Statement st(db_, R"SQL(
            SELECT job_id, user, partition, status, time_limit, start_time,
                   submit_time, updated_at
            FROM jobs
        )SQL");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            Job j;
            j.job_id = st.int64(0);
            j.user = st.text(1);
            j.partition = st.text(2);
            j.status = parse_job_status(st.text(3));
            j.time_limit = st.opt_text(4);
            j.start_time = st.opt_text(5);
            j.submit_time = st.text(6);
            j.updated_at = st.text(7);
            state.jobs.insert(std::move(j));
        }
        if (row.is_err()) return Result<ClusterState>::Err("jobs: " + row.error);
    }

    {
        Statement st(db_, "SELECT job_id, resource, requested, allocated FROM job_resources");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            state.job_resources.insert(JobResource{st.int64(0), st.text(1),
                                                   static_cast<uint64_t>(st.int64(2)),
                                                   static_cast<uint64_t>(st.int64(3))});
        }
        if (row.is_err()) return Result<ClusterState>::Err("job_resources: " + row.error);
    }

    {
        Statement st(db_, "SELECT job_id, node, resource, used FROM job_allocations");
        Result<bool> row;
        while ((row = st.step()).is_ok() && row.value) {
            state.job_allocations.insert(JobAllocation{st.int64(0), st.text(1), st.text(2),
                                                       static_cast<uint64_t>(st.int64(3))});
        }
        if (row.is_err()) return Result<ClusterState>::Err("job_allocations: " + row.error);
    }

    {
        Statement st(db_, R"SQL(
            SELECT MAX(ts) FROM (
                SELECT MAX(updated_at) AS ts FROM partitions
                UNION ALL SELECT MAX(updated_at) FROM nodes
                UNION ALL SELECT MAX(updated_at) FROM jobs
            )
        )SQL");
        auto row = st.step();
        if (row.is_err()) return Result<ClusterState>::Err("freshness: " + row.error);
        if (row.value) state.updated_at = st.opt_text(0);
    }

    return Result<ClusterState>::Ok(std::move(state));
}

Result<void> StateDB::set_metadata(const std::string& key, const std::string& value) {
    Statement st(db_, R"SQL(
        INSERT INTO metadata (key, value) VALUES (:key, :value)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )SQL");
    st.bind_text(":key", key);
    st.bind_text(":value", value);
    auto r = st.run();
    if (r.is_err()) return Result<void>::Err(fmt::format("metadata {}: {}", key, r.error));
    return r;
}

Result<std::optional<std::string>> StateDB::get_metadata(const std::string& key) {
    Statement st(db_, "SELECT value FROM metadata WHERE key = :key");
    st.bind_text(":key", key);
    auto row = st.step();
    if (row.is_err()) {
        return Result<std::optional<std::string>>::Err(
            fmt::format("metadata {}: {}", key, row.error));
    }
    if (!row.value) return Result<std::optional<std::string>>::Ok(std::nullopt);
    return Result<std::optional<std::string>>::Ok(st.text(0));
}
