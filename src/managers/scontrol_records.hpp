#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <parser/decoder.hpp>
#include <parser/quantity.hpp>

// Raw records as printed by `scontrol show ...`, before mapping to the
// entity model. Only the fields the collector uses are decoded.

using TresMap = std::map<std::string, ResourceQuantity>;

// One block of `scontrol show nodes`.
struct NodeInfo {
    std::string name;                     // NodeName
    std::string state;                    // State, e.g. "MIXED+DRAIN"
    uint32_t cpu_alloc = 0;               // CPUAlloc
    uint32_t cpus = 0;                    // CPUTot
    int64_t real_memory = 0;              // RealMemory (MB)
    int64_t alloc_mem = 0;                // AllocMem (MB)
    std::vector<std::string> partitions;  // Partitions
    TresMap cfg_tres;                     // CfgTRES
    TresMap alloc_tres;                   // AllocTRES

    void decode(const FieldReader& r);
};

// One block of `scontrol show partitions`.
struct PartitionInfo {
    std::string name;                     // PartitionName
    std::string state;                    // State
    uint32_t total_cpus = 0;              // TotalCPUs
    uint32_t total_nodes = 0;             // TotalNodes
    std::optional<std::string> allow_qos; // AllowQos
    std::optional<std::string> qos;       // QoS

    void decode(const FieldReader& r);
};

// One per-node detail line of `scontrol show jobs --details`:
//   Nodes=node[01-02] CPU_IDs=0-15 Mem=64000 GRES=gpu:l40s:2(IDX:0-1)
struct AllocDetail {
    std::string nodes;                    // hostlist
    std::optional<std::string> cpu_ids;
    std::optional<uint64_t> mem_mb;
    std::optional<std::string> gres;

    void decode(const FieldReader& r);
};

// One block of `scontrol show jobs --details`.
struct JobInfo {
    int64_t job_id = 0;                   // JobId
    std::string user_id;                  // UserId, "alice(1000)"
    std::string partition;                // Partition
    std::string job_state;                // JobState
    std::optional<std::string> node_list; // NodeList
    TresMap req_tres;                     // ReqTRES
    TresMap alloc_tres;                   // AllocTRES
    std::string submit_time;              // SubmitTime
    std::optional<std::string> start_time;
    std::optional<std::string> time_limit;
    std::vector<AllocDetail> details;     // filled from the block's detail lines

    void decode(const FieldReader& r);

    // "alice(1000)" -> "alice"
    std::string user() const;
};

// Parse whole command outputs. Blocks that fail to decode are appended to
// `skipped` when given; otherwise the first failure throws ParseError.
std::vector<NodeInfo> parse_node_infos(const std::string& text,
                                       std::vector<ParseError>* skipped = nullptr);
std::vector<PartitionInfo> parse_partition_infos(const std::string& text,
                                                 std::vector<ParseError>* skipped = nullptr);
// Each job block is decoded as a whole; its lines starting with "Nodes=" are
// additionally decoded one by one into JobInfo::details.
std::vector<JobInfo> parse_job_infos(const std::string& text,
                                     std::vector<ParseError>* skipped = nullptr);

// "gpu:l40s:2(IDX:0-1),gpu:a100:1" -> {gres/gpu:l40s: 2, gres/gpu:a100: 1}
std::map<std::string, uint64_t> parse_gres(const std::string& gres);
