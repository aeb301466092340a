#include "cluster_state.hpp"

bool ClusterDiff::empty() const {
    return partitions.empty() && nodes.empty() && node_partitions.empty() &&
           node_resources.empty() && jobs.empty() && job_resources.empty() &&
           job_allocations.empty();
}

size_t ClusterDiff::size() const {
    return partitions.size() + nodes.size() + node_partitions.size() + node_resources.size() +
           jobs.size() + job_resources.size() + job_allocations.size();
}

ClusterDiff ClusterState::diff(const ClusterState& next) const {
    ClusterDiff d;
    d.partitions = partitions.diff(next.partitions);
    d.nodes = nodes.diff(next.nodes);
    d.node_partitions = node_partitions.diff(next.node_partitions);
    d.node_resources = node_resources.diff(next.node_resources);
    d.jobs = jobs.diff(next.jobs);
    d.job_resources = job_resources.diff(next.job_resources);
    d.job_allocations = job_allocations.diff(next.job_allocations);
    d.updated_at = next.updated_at;
    return d;
}

void ClusterState::apply(const ClusterDiff& d) {
    partitions.apply(d.partitions);
    nodes.apply(d.nodes);
    node_partitions.apply(d.node_partitions);
    node_resources.apply(d.node_resources);
    jobs.apply(d.jobs);
    job_resources.apply(d.job_resources);
    job_allocations.apply(d.job_allocations);
    updated_at = d.updated_at;
}

bool ClusterState::operator==(const ClusterState& o) const {
    return partitions == o.partitions && nodes == o.nodes &&
           node_partitions == o.node_partitions && node_resources == o.node_resources &&
           jobs == o.jobs && job_resources == o.job_resources &&
           job_allocations == o.job_allocations && updated_at == o.updated_at;
}
