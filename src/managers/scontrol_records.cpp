#include "scontrol_records.hpp"
#include <core/utils.hpp>
#include <cctype>
#include <cstdlib>

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Split on commas outside parentheses: "a:1(IDX:0,2),b:1" -> "a:1(IDX:0,2)", "b:1"
std::vector<std::string> split_outside_parens(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    int depth = 0;
    for (char c : s) {
        if (c == '(') depth++;
        if (c == ')' && depth > 0) depth--;
        if (c == ',' && depth == 0) {
            if (!trimmed(current).empty()) out.push_back(trimmed(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trimmed(current).empty()) out.push_back(trimmed(current));
    return out;
}

} // namespace

// ── Decoders ─────────────────────────────────────────────────

void NodeInfo::decode(const FieldReader& r) {
    r.field("NodeName", name);
    r.field_or("State", state, std::string("UNKNOWN"));
    r.field("CPUAlloc", cpu_alloc);
    r.field("CPUTot", cpus);
    r.field("RealMemory", real_memory);
    r.field_or("AllocMem", alloc_mem, int64_t{0});

    r.field_or("Partitions", partitions, {});
    r.field_or("CfgTRES", cfg_tres, {});
    r.field_or("AllocTRES", alloc_tres, {});
}

void PartitionInfo::decode(const FieldReader& r) {
    r.field("PartitionName", name);
    r.field_or("State", state, std::string("UNKNOWN"));
    r.field_or("TotalCPUs", total_cpus, uint32_t{0});
    r.field_or("TotalNodes", total_nodes, uint32_t{0});
    r.field("AllowQos", allow_qos);
    r.field("QoS", qos);
}

void AllocDetail::decode(const FieldReader& r) {
    r.field("Nodes", nodes);
    r.field("CPU_IDs", cpu_ids);
    r.field("Mem", mem_mb);
    r.field("GRES", gres);
}

void JobInfo::decode(const FieldReader& r) {
    r.field("JobId", job_id);
    r.field_or("UserId", user_id, std::string());
    r.field_or("Partition", partition, std::string());
    r.field_or("JobState", job_state, std::string("UNKNOWN"));
    r.field("NodeList", node_list);
    r.field_or("ReqTRES", req_tres, {});
    r.field_or("AllocTRES", alloc_tres, {});
    r.field_or("SubmitTime", submit_time, std::string());
    r.field("StartTime", start_time);
    r.field("TimeLimit", time_limit);

    if (start_time && (*start_time == "Unknown" || *start_time == "N/A")) {
        start_time.reset();
    }
}

std::string JobInfo::user() const {
    auto paren = user_id.find('(');
    return paren == std::string::npos ? user_id : user_id.substr(0, paren);
}

// ── Whole outputs ────────────────────────────────────────────

std::vector<NodeInfo> parse_node_infos(const std::string& text,
                                       std::vector<ParseError>* skipped) {
    return parse_records<NodeInfo>(text, skipped);
}

std::vector<PartitionInfo> parse_partition_infos(const std::string& text,
                                                 std::vector<ParseError>* skipped) {
    return parse_records<PartitionInfo>(text, skipped);
}

std::vector<JobInfo> parse_job_infos(const std::string& text,
                                     std::vector<ParseError>* skipped) {
    std::vector<JobInfo> jobs;
    for (const auto& block : split_blocks(text)) {
        try {
            Record record = tokenize_block(block);
            JobInfo job;
            job.decode(FieldReader(record));

            // Detail lines repeat Nodes/CPU_IDs/Mem/GRES once per node set and
            // may omit GRES, so each line is decoded on its own.
            for (const auto& raw : split(block, '\n')) {
                std::string line = trimmed(raw);
                if (line.compare(0, 6, "Nodes=") != 0) continue;
                Record detail = tokenize_block(line);
                if (!detail.has("Nodes")) continue;
                AllocDetail d;
                d.decode(FieldReader(detail));
                job.details.push_back(std::move(d));
            }
            jobs.push_back(std::move(job));
        } catch (const ParseError& e) {
            if (!skipped) throw;
            skipped->push_back(e);
        }
    }
    return jobs;
}

std::map<std::string, uint64_t> parse_gres(const std::string& gres) {
    std::map<std::string, uint64_t> out;
    for (const auto& piece : split_outside_parens(gres)) {
        std::string spec = piece;
        std::string annotation;
        auto paren = spec.find('(');
        if (paren != std::string::npos) {
            annotation = spec.substr(paren + 1);
            if (!annotation.empty() && annotation.back() == ')') annotation.pop_back();
            spec = spec.substr(0, paren);
        }

        uint64_t count = 1;
        auto colon = spec.rfind(':');
        if (colon != std::string::npos && all_digits(spec.substr(colon + 1))) {
            count = std::strtoull(spec.substr(colon + 1).c_str(), nullptr, 10);
            spec = spec.substr(0, colon);
        } else if (annotation.compare(0, 4, "CNT:") == 0 && all_digits(annotation.substr(4))) {
            count = std::strtoull(annotation.substr(4).c_str(), nullptr, 10);
        }
        if (spec.empty()) continue;
        out["gres/" + spec] += count;
    }
    return out;
}
