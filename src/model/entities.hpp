#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// ── Status enums ─────────────────────────────────────────────

enum class PartitionStatus { Up, Down, Unknown };
enum class NodeStatus { Idle, Alloc, Mix, Down, Unknown };
enum class JobStatus { Pending, Running, Completed, Failed, Cancelled, Unknown };

// Upper-case wire names ("UP", "IDLE", "RUNNING", ...).
const char* to_string(PartitionStatus s);
const char* to_string(NodeStatus s);
const char* to_string(JobStatus s);

// Exact wire names; anything else is Unknown.
PartitionStatus parse_partition_status(const std::string& s);
NodeStatus parse_node_status(const std::string& s);
JobStatus parse_job_status(const std::string& s);

using JobId = int64_t;

// ── Composite keys ───────────────────────────────────────────

struct NodePartitionKey {
    std::string node;
    std::string partition;

    bool operator<(const NodePartitionKey& o) const {
        return std::tie(node, partition) < std::tie(o.node, o.partition);
    }
    bool operator==(const NodePartitionKey& o) const {
        return std::tie(node, partition) == std::tie(o.node, o.partition);
    }
};

struct NodeResourceKey {
    std::string node;
    std::string resource;

    bool operator<(const NodeResourceKey& o) const {
        return std::tie(node, resource) < std::tie(o.node, o.resource);
    }
    bool operator==(const NodeResourceKey& o) const {
        return std::tie(node, resource) == std::tie(o.node, o.resource);
    }
};

struct JobResourceKey {
    JobId job_id = 0;
    std::string resource;

    bool operator<(const JobResourceKey& o) const {
        return std::tie(job_id, resource) < std::tie(o.job_id, o.resource);
    }
    bool operator==(const JobResourceKey& o) const {
        return std::tie(job_id, resource) == std::tie(o.job_id, o.resource);
    }
};

struct JobAllocationKey {
    JobId job_id = 0;
    std::string node;
    std::string resource;

    bool operator<(const JobAllocationKey& o) const {
        return std::tie(job_id, node, resource) < std::tie(o.job_id, o.node, o.resource);
    }
    bool operator==(const JobAllocationKey& o) const {
        return std::tie(job_id, node, resource) == std::tie(o.job_id, o.node, o.resource);
    }
};

// ── Entities ─────────────────────────────────────────────────
//
// CPU counts are cores; node and partition memory is in MB as scontrol
// reports RealMemory. Resource quantities are unit-less (mem in bytes).
// Timestamps are ISO-8601 UTC strings. Row equality ignores updated_at, so a
// row is only re-sent (and restamped downstream) when its payload changes.

struct Partition {
    using Key = std::string;

    std::string name;
    PartitionStatus status = PartitionStatus::Unknown;
    uint32_t total_nodes = 0;
    uint32_t total_cpus = 0;
    uint32_t total_cpus_alloc = 0;
    uint32_t total_cpus_idle = 0;
    int64_t total_memory = 0;
    int64_t total_memory_alloc = 0;
    int64_t total_memory_free = 0;
    std::optional<std::string> access_qos;    // AllowQos
    std::optional<std::string> resource_qos;  // QoS
    std::string updated_at;

    Key key() const { return name; }

    bool operator==(const Partition& o) const {
        return std::tie(name, status, total_nodes, total_cpus, total_cpus_alloc, total_cpus_idle,
                        total_memory, total_memory_alloc, total_memory_free, access_qos,
                        resource_qos) ==
               std::tie(o.name, o.status, o.total_nodes, o.total_cpus, o.total_cpus_alloc,
                        o.total_cpus_idle, o.total_memory, o.total_memory_alloc,
                        o.total_memory_free, o.access_qos, o.resource_qos);
    }
};

struct Node {
    using Key = std::string;

    std::string name;
    NodeStatus status = NodeStatus::Unknown;
    uint32_t cpus = 0;
    uint32_t cpus_alloc = 0;
    uint32_t cpus_idle = 0;
    int64_t memory = 0;
    int64_t memory_alloc = 0;
    int64_t memory_free = 0;
    std::vector<std::string> partitions;
    std::string updated_at;

    Key key() const { return name; }

    bool operator==(const Node& o) const {
        return std::tie(name, status, cpus, cpus_alloc, cpus_idle, memory, memory_alloc,
                        memory_free, partitions) ==
               std::tie(o.name, o.status, o.cpus, o.cpus_alloc, o.cpus_idle, o.memory,
                        o.memory_alloc, o.memory_free, o.partitions);
    }
};

// Membership edge, no payload beyond the key.
struct NodePartition {
    using Key = NodePartitionKey;

    std::string node;
    std::string partition;

    Key key() const { return {node, partition}; }
    bool operator==(const NodePartition& o) const { return key() == o.key(); }
};

struct NodeResource {
    using Key = NodeResourceKey;

    std::string node;
    std::string resource;
    uint64_t available = 0;
    uint64_t total = 0;

    Key key() const { return {node, resource}; }
    bool operator==(const NodeResource& o) const {
        return std::tie(node, resource, available, total) ==
               std::tie(o.node, o.resource, o.available, o.total);
    }
};

struct Job {
    using Key = JobId;

    JobId job_id = 0;
    std::string user;
    std::string partition;
    JobStatus status = JobStatus::Unknown;
    std::optional<std::string> time_limit;
    std::optional<std::string> start_time;
    std::string submit_time;
    std::string updated_at;

    Key key() const { return job_id; }

    bool operator==(const Job& o) const {
        return std::tie(job_id, user, partition, status, time_limit, start_time, submit_time) ==
               std::tie(o.job_id, o.user, o.partition, o.status, o.time_limit, o.start_time,
                        o.submit_time);
    }
};

struct JobResource {
    using Key = JobResourceKey;

    JobId job_id = 0;
    std::string resource;
    uint64_t requested = 0;
    uint64_t allocated = 0;

    Key key() const { return {job_id, resource}; }
    bool operator==(const JobResource& o) const {
        return std::tie(job_id, resource, requested, allocated) ==
               std::tie(o.job_id, o.resource, o.requested, o.allocated);
    }
};

struct JobAllocation {
    using Key = JobAllocationKey;

    JobId job_id = 0;
    std::string node;
    std::string resource;
    uint64_t used = 0;

    Key key() const { return {job_id, node, resource}; }
    bool operator==(const JobAllocation& o) const {
        return std::tie(job_id, node, resource, used) ==
               std::tie(o.job_id, o.node, o.resource, o.used);
    }
};
