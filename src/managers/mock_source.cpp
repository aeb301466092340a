#include "mock_source.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

MockSource::MockSource(unsigned seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {}

int MockSource::uniform(int lo, int hi) {
    return std::uniform_int_distribution<int>(lo, hi)(rng_);
}

ClusterState MockSource::snapshot(const ClusterState&) {
    ClusterState state;
    std::string now = now_iso_utc();
    state.updated_at = now;

    // ── Partitions ──
    auto make_partition = [&](const char* name, uint32_t cpus, int64_t memory) {
        Partition p;
        p.name = name;
        p.status = PartitionStatus::Up;
        p.total_cpus = cpus;
        p.total_cpus_idle = cpus;
        p.total_memory = memory;
        p.total_memory_free = memory;
        p.updated_at = now;
        return p;
    };
    Partition gpu = make_partition("gpu", 6400, 2560000);
    gpu.total_nodes = MOCK_NODE_COUNT / 2;
    gpu.access_qos = "gpu";
    gpu.resource_qos = "gpu";
    Partition standard = make_partition("standard", 12800, 5120000);
    standard.total_nodes = MOCK_NODE_COUNT;
    state.partitions.insert(gpu);
    state.partitions.insert(standard);

    // ── Nodes ──
    static const NodeStatus node_states[] = {
        NodeStatus::Idle, NodeStatus::Alloc, NodeStatus::Mix, NodeStatus::Down};

    for (int i = 1; i <= MOCK_NODE_COUNT; i++) {
        std::string name = fmt::format("node{:02}", i);
        bool has_gpu = i % 2 == 0;

        Node node;
        node.name = name;
        node.status = node_states[uniform(0, 3)];
        node.cpus = MOCK_NODE_CPUS;
        node.cpus_idle = MOCK_NODE_CPUS;
        node.memory = MOCK_NODE_MEMORY_MB;
        node.memory_free = MOCK_NODE_MEMORY_MB;
        node.partitions.push_back("standard");
        if (has_gpu) node.partitions.push_back("gpu");
        node.updated_at = now;
        state.nodes.insert(node);

        state.node_resources.insert(NodeResource{name, "cpu", MOCK_NODE_CPUS, MOCK_NODE_CPUS});
        state.node_partitions.insert(NodePartition{name, "standard"});
        if (has_gpu) {
            state.node_resources.insert(NodeResource{name, "gpu", 4, 4});
            state.node_partitions.insert(NodePartition{name, "gpu"});
        }
    }

    // ── Jobs ──
    for (int i = 1; i <= MOCK_JOB_COUNT; i++) {
        JobId id = 1000 + i;
        JobStatus status;
        switch (uniform(0, 2)) {
            case 0:  status = JobStatus::Pending; break;
            case 1:  status = JobStatus::Running; break;
            default: status = JobStatus::Completed; break;
        }
        bool running = status == JobStatus::Running;

        Job job;
        job.job_id = id;
        job.user = fmt::format("user{}", uniform(1, 4));
        job.partition = "gpu";
        job.status = status;
        job.time_limit = "12:00:00";
        if (status != JobStatus::Pending) job.start_time = now;
        job.submit_time = now;
        job.updated_at = now;
        state.jobs.insert(job);

        state.job_resources.insert(JobResource{
            id, "cpu", static_cast<uint64_t>(uniform(1, 127)), running ? 64u : 0u});

        if (running) {
            std::string node = fmt::format("node{:02}", uniform(1, MOCK_NODE_COUNT));
            state.job_allocations.insert(JobAllocation{id, node, "cpu", 64});
        }
    }

    return state;
}
