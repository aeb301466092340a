#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <model/cluster_state.hpp>
#include "command_runner.hpp"
#include "scontrol_records.hpp"

struct NodeTables {
    Table<Node> nodes;
    Table<NodeResource> node_resources;
    Table<NodePartition> node_partitions;
};

struct JobTables {
    Table<Job> jobs;
    Table<JobResource> job_resources;
    Table<JobAllocation> job_allocations;
};

// scontrol state text -> status. Unrecognized text is Unknown, never an error.
NodeStatus map_node_state(const std::string& state);
PartitionStatus map_partition_state(const std::string& state);

// Pure mappings from raw records to entity tables. `updated_at` stamps every row.
NodeTables map_nodes(const std::vector<NodeInfo>& infos, const std::string& updated_at);
Table<Partition> map_partitions(const std::vector<PartitionInfo>& infos,
                                const Table<Node>& nodes,
                                const std::string& updated_at);
JobTables map_jobs(const std::vector<JobInfo>& infos, const std::string& updated_at);

// Invokes scontrol once per resource class and maps the output. A class
// that fails (non-zero exit, invalid UTF-8, parse error) yields Err for that
// class alone.
class Collector {
public:
    // `scontrol` may carry a wrapper prefix, e.g. "ssh login1 scontrol".
    Collector(CommandRunner& runner, std::string scontrol = "scontrol");

    Result<NodeTables> collect_nodes(const std::string& updated_at);
    Result<Table<Partition>> collect_partitions(const Table<Node>& nodes,
                                                const std::string& updated_at);
    Result<JobTables> collect_jobs(const std::string& updated_at);

    // Full snapshot. Classes that fail keep `previous`'s tables and the
    // error is logged; partition totals aggregate over whatever node table
    // ends up in the snapshot.
    ClusterState collect(const ClusterState& previous);

    // Errors from the most recent collect(), one per failed class.
    const std::vector<std::string>& last_errors() const { return last_errors_; }

private:
    CommandRunner& runner_;
    std::vector<std::string> scontrol_argv_;
    std::vector<std::string> last_errors_;

    Result<std::string> run_show(const std::vector<std::string>& what);
};
