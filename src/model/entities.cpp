#include "entities.hpp"

const char* to_string(PartitionStatus s) {
    switch (s) {
        case PartitionStatus::Up:   return "UP";
        case PartitionStatus::Down: return "DOWN";
        default:                    return "UNKNOWN";
    }
}

const char* to_string(NodeStatus s) {
    switch (s) {
        case NodeStatus::Idle:  return "IDLE";
        case NodeStatus::Alloc: return "ALLOC";
        case NodeStatus::Mix:   return "MIX";
        case NodeStatus::Down:  return "DOWN";
        default:                return "UNKNOWN";
    }
}

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Pending:   return "PENDING";
        case JobStatus::Running:   return "RUNNING";
        case JobStatus::Completed: return "COMPLETED";
        case JobStatus::Failed:    return "FAILED";
        case JobStatus::Cancelled: return "CANCELLED";
        default:                   return "UNKNOWN";
    }
}

PartitionStatus parse_partition_status(const std::string& s) {
    if (s == "UP") return PartitionStatus::Up;
    if (s == "DOWN") return PartitionStatus::Down;
    return PartitionStatus::Unknown;
}

NodeStatus parse_node_status(const std::string& s) {
    if (s == "IDLE") return NodeStatus::Idle;
    if (s == "ALLOC") return NodeStatus::Alloc;
    if (s == "MIX") return NodeStatus::Mix;
    if (s == "DOWN") return NodeStatus::Down;
    return NodeStatus::Unknown;
}

JobStatus parse_job_status(const std::string& s) {
    if (s == "PENDING") return JobStatus::Pending;
    if (s == "RUNNING") return JobStatus::Running;
    if (s == "COMPLETED") return JobStatus::Completed;
    if (s == "FAILED") return JobStatus::Failed;
    if (s == "CANCELLED") return JobStatus::Cancelled;
    return JobStatus::Unknown;
}
