#include "status_view.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

namespace {

std::string strip_ansi(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            while (i < s.size() && s[i] != 'm') i++;
            continue;
        }
        out += s[i];
    }
    return out;
}

std::string node_status_colored(NodeStatus s) {
    std::string name = to_string(s);
    switch (s) {
        case NodeStatus::Idle:  return theme::green(name);
        case NodeStatus::Mix:   return theme::yellow(name);
        case NodeStatus::Alloc: return theme::yellow(name);
        case NodeStatus::Down:  return theme::red(name);
        default:                return theme::dim(name);
    }
}

} // namespace

std::string render_status(const ClusterState& state,
                          const std::optional<std::string>& last_updated,
                          std::time_t now,
                          bool color) {
    std::string out;

    out += theme::section("Cluster");
    out += theme::kv("snapshot", state.updated_at
                                     ? fmt::format("{} ({} ago)", *state.updated_at,
                                                   format_age(*state.updated_at, now))
                                     : theme::dim("none"));
    out += theme::kv("last applied", last_updated
                                         ? fmt::format("{} ({} ago)", *last_updated,
                                                       format_age(*last_updated, now))
                                         : theme::dim("never"));

    out += theme::section("Tables");
    out += theme::kv("partitions", std::to_string(state.partitions.size()));
    out += theme::kv("nodes", std::to_string(state.nodes.size()));
    out += theme::kv("memberships", std::to_string(state.node_partitions.size()));
    out += theme::kv("node res", std::to_string(state.node_resources.size()));
    out += theme::kv("jobs", std::to_string(state.jobs.size()));
    out += theme::kv("job res", std::to_string(state.job_resources.size()));
    out += theme::kv("allocations", std::to_string(state.job_allocations.size()));

    if (!state.nodes.empty()) {
        std::map<NodeStatus, int> by_status;
        for (const auto& [name, node] : state.nodes) by_status[node.status]++;
        out += theme::section("Nodes");
        for (const auto& [status, count] : by_status) {
            // Pad by the plain name; the colored one carries escape codes.
            std::string name = to_string(status);
            out += "    " + node_status_colored(status) + std::string(14 - name.size(), ' ') +
                   std::to_string(count) + "\n";
        }
    }

    if (!state.jobs.empty()) {
        std::map<JobStatus, int> by_status;
        for (const auto& [id, job] : state.jobs) by_status[job.status]++;
        out += theme::section("Jobs");
        for (const auto& [status, count] : by_status) {
            out += theme::kv(to_string(status), std::to_string(count));
        }
    }

    if (!state.partitions.empty()) {
        size_t w = 9;
        for (const auto& [name, p] : state.partitions) w = std::max(w, name.size());

        std::string row = fmt::format("  {{:<{}}} {{:<8}} {{:>6}} {{:>8}} {{:>8}} {{:>8}}\n", w + 2);
        out += theme::section("Partitions");
        out += theme::color::DIM +
               fmt::format(fmt::runtime(row), "PARTITION", "STATUS", "NODES", "CPUS", "ALLOC", "IDLE") +
               theme::color::RESET;
        for (const auto& [name, p] : state.partitions) {
            out += fmt::format(fmt::runtime(row), name, to_string(p.status), p.total_nodes,
                               p.total_cpus, p.total_cpus_alloc, p.total_cpus_idle);
        }
    }
    out += "\n";

    return color ? out : strip_ansi(out);
}
