#include "wire_codec.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <stdexcept>

namespace {

struct WireError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Encoding ─────────────────────────────────────────────────

void emit_optional(YAML::Emitter& out, const std::optional<std::string>& v) {
    if (v) out << *v;
    else out << YAML::Null;
}

void emit(YAML::Emitter& out, const Partition& p) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << p.name;
    out << YAML::Key << "status" << YAML::Value << to_string(p.status);
    out << YAML::Key << "total_nodes" << YAML::Value << p.total_nodes;
    out << YAML::Key << "total_cpus" << YAML::Value << p.total_cpus;
    out << YAML::Key << "total_cpus_alloc" << YAML::Value << p.total_cpus_alloc;
    out << YAML::Key << "total_cpus_idle" << YAML::Value << p.total_cpus_idle;
    out << YAML::Key << "total_memory" << YAML::Value << p.total_memory;
    out << YAML::Key << "total_memory_alloc" << YAML::Value << p.total_memory_alloc;
    out << YAML::Key << "total_memory_free" << YAML::Value << p.total_memory_free;
    out << YAML::Key << "access_qos" << YAML::Value;
    emit_optional(out, p.access_qos);
    out << YAML::Key << "resource_qos" << YAML::Value;
    emit_optional(out, p.resource_qos);
    out << YAML::Key << "updated_at" << YAML::Value << p.updated_at;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const Node& n) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << n.name;
    out << YAML::Key << "status" << YAML::Value << to_string(n.status);
    out << YAML::Key << "cpus" << YAML::Value << n.cpus;
    out << YAML::Key << "cpus_alloc" << YAML::Value << n.cpus_alloc;
    out << YAML::Key << "cpus_idle" << YAML::Value << n.cpus_idle;
    out << YAML::Key << "memory" << YAML::Value << n.memory;
    out << YAML::Key << "memory_alloc" << YAML::Value << n.memory_alloc;
    out << YAML::Key << "memory_free" << YAML::Value << n.memory_free;
    out << YAML::Key << "partitions" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : n.partitions) out << p;
    out << YAML::EndSeq;
    out << YAML::Key << "updated_at" << YAML::Value << n.updated_at;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const NodePartition& e) {
    out << YAML::BeginMap;
    out << YAML::Key << "node" << YAML::Value << e.node;
    out << YAML::Key << "partition" << YAML::Value << e.partition;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const NodeResource& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "node" << YAML::Value << r.node;
    out << YAML::Key << "resource" << YAML::Value << r.resource;
    out << YAML::Key << "available" << YAML::Value << r.available;
    out << YAML::Key << "total" << YAML::Value << r.total;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const Job& j) {
    out << YAML::BeginMap;
    out << YAML::Key << "job_id" << YAML::Value << j.job_id;
    out << YAML::Key << "user" << YAML::Value << j.user;
    out << YAML::Key << "partition" << YAML::Value << j.partition;
    out << YAML::Key << "status" << YAML::Value << to_string(j.status);
    out << YAML::Key << "time_limit" << YAML::Value;
    emit_optional(out, j.time_limit);
    out << YAML::Key << "start_time" << YAML::Value;
    emit_optional(out, j.start_time);
    out << YAML::Key << "submit_time" << YAML::Value << j.submit_time;
    out << YAML::Key << "updated_at" << YAML::Value << j.updated_at;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const JobResource& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "job_id" << YAML::Value << r.job_id;
    out << YAML::Key << "resource" << YAML::Value << r.resource;
    out << YAML::Key << "requested" << YAML::Value << r.requested;
    out << YAML::Key << "allocated" << YAML::Value << r.allocated;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const JobAllocation& a) {
    out << YAML::BeginMap;
    out << YAML::Key << "job_id" << YAML::Value << a.job_id;
    out << YAML::Key << "node" << YAML::Value << a.node;
    out << YAML::Key << "resource" << YAML::Value << a.resource;
    out << YAML::Key << "used" << YAML::Value << a.used;
    out << YAML::EndMap;
}

void emit_key(YAML::Emitter& out, const std::string& k) { out << k; }
void emit_key(YAML::Emitter& out, JobId k) { out << k; }

void emit_key(YAML::Emitter& out, const NodePartitionKey& k) {
    out << YAML::BeginSeq << k.node << k.partition << YAML::EndSeq;
}

void emit_key(YAML::Emitter& out, const NodeResourceKey& k) {
    out << YAML::BeginSeq << k.node << k.resource << YAML::EndSeq;
}

void emit_key(YAML::Emitter& out, const JobResourceKey& k) {
    out << YAML::BeginSeq << k.job_id << k.resource << YAML::EndSeq;
}

void emit_key(YAML::Emitter& out, const JobAllocationKey& k) {
    out << YAML::BeginSeq << k.job_id << k.node << k.resource << YAML::EndSeq;
}

template <typename V>
void emit_table(YAML::Emitter& out, const char* name, const TableDiff<V>& d) {
    out << YAML::Key << name << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "added" << YAML::Value << YAML::BeginSeq;
    for (const auto& v : d.added) emit(out, v);
    out << YAML::EndSeq;
    out << YAML::Key << "changed" << YAML::Value << YAML::BeginSeq;
    for (const auto& v : d.changed) emit(out, v);
    out << YAML::EndSeq;
    out << YAML::Key << "removed" << YAML::Value << YAML::BeginSeq;
    for (const auto& k : d.removed) emit_key(out, k);
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

// ── Decoding ─────────────────────────────────────────────────

template <typename T>
T req(const YAML::Node& n, const char* key) {
    const YAML::Node v = n[key];
    if (!v || v.IsNull()) throw WireError(fmt::format("missing field '{}'", key));
    return v.as<T>();
}

std::optional<std::string> opt(const YAML::Node& n, const char* key) {
    const YAML::Node v = n[key];
    if (!v || v.IsNull()) return std::nullopt;
    return v.as<std::string>();
}

void expect_map(const YAML::Node& n, const char* what) {
    if (!n.IsMap()) throw WireError(fmt::format("{} must be an object", what));
}

void read(const YAML::Node& n, Partition& p) {
    expect_map(n, "partition");
    p.name = req<std::string>(n, "name");
    p.status = parse_partition_status(req<std::string>(n, "status"));
    p.total_nodes = req<uint32_t>(n, "total_nodes");
    p.total_cpus = req<uint32_t>(n, "total_cpus");
    p.total_cpus_alloc = req<uint32_t>(n, "total_cpus_alloc");
    p.total_cpus_idle = req<uint32_t>(n, "total_cpus_idle");
    p.total_memory = req<int64_t>(n, "total_memory");
    p.total_memory_alloc = req<int64_t>(n, "total_memory_alloc");
    p.total_memory_free = req<int64_t>(n, "total_memory_free");
    p.access_qos = opt(n, "access_qos");
    p.resource_qos = opt(n, "resource_qos");
    p.updated_at = req<std::string>(n, "updated_at");
}

void read(const YAML::Node& n, Node& node) {
    expect_map(n, "node");
    node.name = req<std::string>(n, "name");
    node.status = parse_node_status(req<std::string>(n, "status"));
    node.cpus = req<uint32_t>(n, "cpus");
    node.cpus_alloc = req<uint32_t>(n, "cpus_alloc");
    node.cpus_idle = req<uint32_t>(n, "cpus_idle");
    node.memory = req<int64_t>(n, "memory");
    node.memory_alloc = req<int64_t>(n, "memory_alloc");
    node.memory_free = req<int64_t>(n, "memory_free");
    if (n["partitions"] && n["partitions"].IsSequence()) {
        node.partitions = n["partitions"].as<std::vector<std::string>>();
    }
    node.updated_at = req<std::string>(n, "updated_at");
}

void read(const YAML::Node& n, NodePartition& e) {
    expect_map(n, "node_partition");
    e.node = req<std::string>(n, "node");
    e.partition = req<std::string>(n, "partition");
}

void read(const YAML::Node& n, NodeResource& r) {
    expect_map(n, "node_resource");
    r.node = req<std::string>(n, "node");
    r.resource = req<std::string>(n, "resource");
    r.available = req<uint64_t>(n, "available");
    r.total = req<uint64_t>(n, "total");
}

void read(const YAML::Node& n, Job& j) {
    expect_map(n, "job");
    j.job_id = req<JobId>(n, "job_id");
    j.user = req<std::string>(n, "user");
    j.partition = req<std::string>(n, "partition");
    j.status = parse_job_status(req<std::string>(n, "status"));
    j.time_limit = opt(n, "time_limit");
    j.start_time = opt(n, "start_time");
    j.submit_time = req<std::string>(n, "submit_time");
    j.updated_at = req<std::string>(n, "updated_at");
}

void read(const YAML::Node& n, JobResource& r) {
    expect_map(n, "job_resource");
    r.job_id = req<JobId>(n, "job_id");
    r.resource = req<std::string>(n, "resource");
    r.requested = req<uint64_t>(n, "requested");
    r.allocated = req<uint64_t>(n, "allocated");
}

void read(const YAML::Node& n, JobAllocation& a) {
    expect_map(n, "job_allocation");
    a.job_id = req<JobId>(n, "job_id");
    a.node = req<std::string>(n, "node");
    a.resource = req<std::string>(n, "resource");
    a.used = req<uint64_t>(n, "used");
}

void expect_tuple(const YAML::Node& n, size_t arity) {
    if (!n.IsSequence() || n.size() != arity) {
        throw WireError(fmt::format("composite key must be an array of {}", arity));
    }
}

void read_key(const YAML::Node& n, std::string& k) { k = n.as<std::string>(); }
void read_key(const YAML::Node& n, JobId& k) { k = n.as<JobId>(); }

void read_key(const YAML::Node& n, NodePartitionKey& k) {
    expect_tuple(n, 2);
    k.node = n[0].as<std::string>();
    k.partition = n[1].as<std::string>();
}

void read_key(const YAML::Node& n, NodeResourceKey& k) {
    expect_tuple(n, 2);
    k.node = n[0].as<std::string>();
    k.resource = n[1].as<std::string>();
}

void read_key(const YAML::Node& n, JobResourceKey& k) {
    expect_tuple(n, 2);
    k.job_id = n[0].as<JobId>();
    k.resource = n[1].as<std::string>();
}

void read_key(const YAML::Node& n, JobAllocationKey& k) {
    expect_tuple(n, 3);
    k.job_id = n[0].as<JobId>();
    k.node = n[1].as<std::string>();
    k.resource = n[2].as<std::string>();
}

template <typename V>
void read_values(const YAML::Node& n, std::vector<V>& out) {
    if (!n || n.IsNull()) return;
    if (!n.IsSequence()) throw WireError("added/changed must be an array");
    for (const auto& item : n) {
        V v;
        read(item, v);
        out.push_back(std::move(v));
    }
}

template <typename V>
void read_table(const YAML::Node& root, const char* name, TableDiff<V>& d) {
    const YAML::Node t = root[name];
    if (!t || t.IsNull()) return;
    if (!t.IsMap()) throw WireError(fmt::format("'{}' must be an object", name));
    read_values(t["added"], d.added);
    read_values(t["changed"], d.changed);
    const YAML::Node removed = t["removed"];
    if (removed && !removed.IsNull()) {
        if (!removed.IsSequence()) throw WireError("removed must be an array");
        for (const auto& item : removed) {
            typename V::Key k;
            read_key(item, k);
            d.removed.push_back(std::move(k));
        }
    }
}

} // namespace

std::string encode_diff(const ClusterDiff& diff) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);

    out << YAML::BeginMap;
    emit_table(out, "partitions", diff.partitions);
    emit_table(out, "nodes", diff.nodes);
    emit_table(out, "node_partitions", diff.node_partitions);
    emit_table(out, "node_resources", diff.node_resources);
    emit_table(out, "jobs", diff.jobs);
    emit_table(out, "job_resources", diff.job_resources);
    emit_table(out, "job_allocations", diff.job_allocations);
    out << YAML::Key << "updated_at" << YAML::Value;
    emit_optional(out, diff.updated_at);
    out << YAML::EndMap;

    std::string line = out.c_str();
    // The emitter may break long flow collections; a line-delimited stream
    // needs one physical line, and whitespace between tokens is insignificant.
    for (auto& c : line) {
        if (c == '\n') c = ' ';
    }
    return line;
}

Result<ClusterDiff> decode_diff(const std::string& line) {
    try {
        YAML::Node root = YAML::Load(line);
        if (!root.IsMap()) return Result<ClusterDiff>::Err("diff must be a JSON object");

        ClusterDiff diff;
        read_table(root, "partitions", diff.partitions);
        read_table(root, "nodes", diff.nodes);
        read_table(root, "node_partitions", diff.node_partitions);
        read_table(root, "node_resources", diff.node_resources);
        read_table(root, "jobs", diff.jobs);
        read_table(root, "job_resources", diff.job_resources);
        read_table(root, "job_allocations", diff.job_allocations);
        diff.updated_at = opt(root, "updated_at");
        return Result<ClusterDiff>::Ok(std::move(diff));
    } catch (const WireError& e) {
        return Result<ClusterDiff>::Err(e.what());
    } catch (const YAML::Exception& e) {
        return Result<ClusterDiff>::Err(fmt::format("malformed diff: {}", e.what()));
    }
}
