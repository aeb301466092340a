#pragma once

#include <optional>
#include <string>
#include "entities.hpp"
#include "table.hpp"

// Changeset between two snapshots: one TableDiff per table plus the newer
// snapshot's capture time.
struct ClusterDiff {
    TableDiff<Partition> partitions;
    TableDiff<Node> nodes;
    TableDiff<NodePartition> node_partitions;
    TableDiff<NodeResource> node_resources;
    TableDiff<Job> jobs;
    TableDiff<JobResource> job_resources;
    TableDiff<JobAllocation> job_allocations;
    std::optional<std::string> updated_at;

    // True when no table has any entry (a heartbeat).
    bool empty() const;
    size_t size() const;
};

// One full snapshot of the cluster. updated_at is when the producer captured
// it, not a maximum over rows.
struct ClusterState {
    Table<Partition> partitions;
    Table<Node> nodes;
    Table<NodePartition> node_partitions;
    Table<NodeResource> node_resources;
    Table<Job> jobs;
    Table<JobResource> job_resources;
    Table<JobAllocation> job_allocations;
    std::optional<std::string> updated_at;

    ClusterDiff diff(const ClusterState& next) const;

    // Applies every table diff and overwrites updated_at with the diff's,
    // even when that is older or absent.
    void apply(const ClusterDiff& d);

    bool operator==(const ClusterState& o) const;
    bool operator!=(const ClusterState& o) const { return !(*this == o); }
};
