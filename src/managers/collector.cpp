#include "collector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <parser/hostlist.hpp>
#include <fmt/format.h>
#include <map>

// ── State mapping ────────────────────────────────────────────

NodeStatus map_node_state(const std::string& state) {
    // "MIXED+DRAIN" -> "MIXED", "IDLE*" -> "IDLE"
    std::string base = state.substr(0, state.find('+'));
    while (!base.empty() && std::string("*~#!%$@^-").find(base.back()) != std::string::npos) {
        base.pop_back();
    }
    base = to_upper(base);

    if (base == "IDLE") return NodeStatus::Idle;
    if (base == "ALLOC" || base == "ALLOCATED") return NodeStatus::Alloc;
    if (base == "MIX" || base == "MIXED") return NodeStatus::Mix;
    if (base == "DOWN" || base == "DRAIN" || base == "DRAINED" || base == "DRAINING" ||
        base == "FAIL" || base == "FAILING") {
        return NodeStatus::Down;
    }
    return NodeStatus::Unknown;
}

PartitionStatus map_partition_state(const std::string& state) {
    std::string s = to_upper(state);
    if (s == "UP") return PartitionStatus::Up;
    if (s == "DOWN" || s == "DRAIN" || s == "INACTIVE") return PartitionStatus::Down;
    return PartitionStatus::Unknown;
}

// ── Record -> entity mapping ─────────────────────────────────

NodeTables map_nodes(const std::vector<NodeInfo>& infos, const std::string& updated_at) {
    NodeTables t;
    for (const auto& info : infos) {
        Node node;
        node.name = info.name;
        node.status = map_node_state(info.state);
        node.cpus = info.cpus;
        node.cpus_alloc = info.cpu_alloc;
        node.cpus_idle = static_cast<uint32_t>(saturating_sub(info.cpus, info.cpu_alloc));
        node.memory = info.real_memory;
        node.memory_alloc = info.alloc_mem;
        node.memory_free = info.alloc_mem >= info.real_memory ? 0
                                                              : info.real_memory - info.alloc_mem;
        node.partitions = info.partitions;
        node.updated_at = updated_at;
        t.nodes.insert(node);

        for (const auto& p : info.partitions) {
            t.node_partitions.insert(NodePartition{info.name, p});
        }

        for (const auto& [res, total] : info.cfg_tres) {
            auto it = info.alloc_tres.find(res);
            uint64_t allocated = it == info.alloc_tres.end() ? 0 : it->second.value;
            t.node_resources.insert(
                NodeResource{info.name, res, saturating_sub(total.value, allocated), total.value});
        }
    }
    return t;
}

Table<Partition> map_partitions(const std::vector<PartitionInfo>& infos,
                                const Table<Node>& nodes,
                                const std::string& updated_at) {
    struct Totals {
        uint64_t cpus_alloc = 0;
        int64_t memory = 0;
        int64_t memory_alloc = 0;
    };
    std::map<std::string, Totals> totals;
    for (const auto& [name, node] : nodes) {
        for (const auto& p : node.partitions) {
            auto& t = totals[p];
            t.cpus_alloc += node.cpus_alloc;
            t.memory += node.memory;
            t.memory_alloc += node.memory_alloc;
        }
    }

    Table<Partition> table;
    for (const auto& info : infos) {
        Totals t;
        auto it = totals.find(info.name);
        if (it != totals.end()) t = it->second;

        Partition p;
        p.name = info.name;
        p.status = map_partition_state(info.state);
        p.total_nodes = info.total_nodes;
        p.total_cpus = info.total_cpus;
        p.total_cpus_alloc = static_cast<uint32_t>(t.cpus_alloc);
        p.total_cpus_idle = static_cast<uint32_t>(saturating_sub(info.total_cpus, t.cpus_alloc));
        p.total_memory = t.memory;
        p.total_memory_alloc = t.memory_alloc;
        p.total_memory_free = t.memory_alloc >= t.memory ? 0 : t.memory - t.memory_alloc;
        p.access_qos = info.allow_qos;
        p.resource_qos = info.qos;
        p.updated_at = updated_at;
        table.insert(p);
    }
    return table;
}

namespace {

// (node, resource) -> quantity used by one job.
using NodeUsage = std::map<std::pair<std::string, std::string>, uint64_t>;

NodeUsage allocation_usage(const JobInfo& info) {
    NodeUsage usage;
    for (const auto& d : info.details) {
        for (const auto& host : expand_hostlist(d.nodes)) {
            if (d.cpu_ids) {
                usage[{host, "cpu"}] += count_id_ranges(*d.cpu_ids);
            }
            if (d.mem_mb) {
                usage[{host, "mem"}] += *d.mem_mb * static_cast<uint64_t>(QTY_MEGA);
            }
            if (d.gres) {
                for (const auto& [res, count] : parse_gres(*d.gres)) {
                    usage[{host, res}] += count;
                }
            }
        }
    }

    // Without detail lines only a single-node job can be attributed.
    if (info.details.empty() && info.node_list) {
        auto hosts = expand_hostlist(*info.node_list);
        if (hosts.size() == 1) {
            for (const auto& [res, q] : info.alloc_tres) {
                if (res == "node" || res == "billing") continue;
                usage[{hosts.front(), res}] = q.value;
            }
        }
    }
    return usage;
}

} // namespace

JobTables map_jobs(const std::vector<JobInfo>& infos, const std::string& updated_at) {
    JobTables t;
    for (const auto& info : infos) {
        Job job;
        job.job_id = info.job_id;
        job.user = info.user();
        job.partition = info.partition;
        job.status = parse_job_status(to_upper(info.job_state));
        job.time_limit = info.time_limit;
        job.start_time = info.start_time;
        job.submit_time = info.submit_time;
        job.updated_at = updated_at;
        t.jobs.insert(job);

        std::map<std::string, JobResource> resources;
        for (const auto& [res, q] : info.req_tres) {
            auto& r = resources[res];
            r.job_id = info.job_id;
            r.resource = res;
            r.requested = q.value;
        }
        for (const auto& [res, q] : info.alloc_tres) {
            auto& r = resources[res];
            r.job_id = info.job_id;
            r.resource = res;
            r.allocated = q.value;
        }
        for (auto& [res, r] : resources) t.job_resources.insert(std::move(r));

        for (const auto& [key, used] : allocation_usage(info)) {
            t.job_allocations.insert(JobAllocation{info.job_id, key.first, key.second, used});
        }
    }
    return t;
}

// ── Collector ────────────────────────────────────────────────

Collector::Collector(CommandRunner& runner, std::string scontrol)
    : runner_(runner), scontrol_argv_(split_whitespace(scontrol)) {
    if (scontrol_argv_.empty()) scontrol_argv_.push_back("scontrol");
}

Result<std::string> Collector::run_show(const std::vector<std::string>& what) {
    std::vector<std::string> argv = scontrol_argv_;
    argv.push_back(SCONTROL_SHOW);
    argv.insert(argv.end(), what.begin(), what.end());

    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += a;
    }

    auto r = runner_.run(argv);
    if (r.failed()) {
        std::string err = trimmed(r.stderr_data);
        if (err.size() > static_cast<size_t>(LOG_PREVIEW_CHARS)) err.resize(LOG_PREVIEW_CHARS);
        return Result<std::string>::Err(
            fmt::format("'{}' exited with code {}: {}", cmd, r.exit_code, err));
    }
    if (!is_valid_utf8(r.stdout_data)) {
        return Result<std::string>::Err(fmt::format("'{}' produced invalid UTF-8", cmd));
    }
    return Result<std::string>::Ok(std::move(r.stdout_data));
}

Result<NodeTables> Collector::collect_nodes(const std::string& updated_at) {
    auto out = run_show({SCONTROL_NODES});
    if (out.is_err()) return Result<NodeTables>::Err(out.error);
    try {
        return Result<NodeTables>::Ok(map_nodes(parse_node_infos(out.value), updated_at));
    } catch (const ParseError& e) {
        return Result<NodeTables>::Err(fmt::format("nodes: {}", e.what()));
    }
}

Result<Table<Partition>> Collector::collect_partitions(const Table<Node>& nodes,
                                                       const std::string& updated_at) {
    auto out = run_show({SCONTROL_PARTITIONS});
    if (out.is_err()) return Result<Table<Partition>>::Err(out.error);
    try {
        return Result<Table<Partition>>::Ok(
            map_partitions(parse_partition_infos(out.value), nodes, updated_at));
    } catch (const ParseError& e) {
        return Result<Table<Partition>>::Err(fmt::format("partitions: {}", e.what()));
    }
}

Result<JobTables> Collector::collect_jobs(const std::string& updated_at) {
    auto out = run_show({SCONTROL_JOBS, SCONTROL_DETAILS});
    if (out.is_err()) return Result<JobTables>::Err(out.error);
    try {
        return Result<JobTables>::Ok(map_jobs(parse_job_infos(out.value), updated_at));
    } catch (const ParseError& e) {
        return Result<JobTables>::Err(fmt::format("jobs: {}", e.what()));
    }
}

ClusterState Collector::collect(const ClusterState& previous) {
    last_errors_.clear();
    ClusterState state;
    std::string now = now_iso_utc();
    state.updated_at = now;

    auto nodes = collect_nodes(now);
    if (nodes.is_ok()) {
        state.nodes = std::move(nodes.value.nodes);
        state.node_resources = std::move(nodes.value.node_resources);
        state.node_partitions = std::move(nodes.value.node_partitions);
    } else {
        log_error(fmt::format("Node collection failed, keeping previous: {}", nodes.error));
        last_errors_.push_back(nodes.error);
        state.nodes = previous.nodes;
        state.node_resources = previous.node_resources;
        state.node_partitions = previous.node_partitions;
    }

    auto partitions = collect_partitions(state.nodes, now);
    if (partitions.is_ok()) {
        state.partitions = std::move(partitions.value);
    } else {
        log_error(fmt::format("Partition collection failed, keeping previous: {}",
                              partitions.error));
        last_errors_.push_back(partitions.error);
        state.partitions = previous.partitions;
    }

    auto jobs = collect_jobs(now);
    if (jobs.is_ok()) {
        state.jobs = std::move(jobs.value.jobs);
        state.job_resources = std::move(jobs.value.job_resources);
        state.job_allocations = std::move(jobs.value.job_allocations);
    } else {
        log_error(fmt::format("Job collection failed, keeping previous: {}", jobs.error));
        last_errors_.push_back(jobs.error);
        state.jobs = previous.jobs;
        state.job_resources = previous.job_resources;
        state.job_allocations = previous.job_allocations;
    }

    log_debug(fmt::format("Collected {} nodes, {} partitions, {} jobs",
                          state.nodes.size(), state.partitions.size(), state.jobs.size()));
    return state;
}
