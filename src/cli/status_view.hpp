#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <model/cluster_state.hpp>

// Render the `slurmsync status` panel for a reconstructed cluster state:
// snapshot age, row counts, node and job status breakdowns and a partition
// table. `color` off strips ANSI codes (for tests and pipes).
std::string render_status(const ClusterState& state,
                          const std::optional<std::string>& last_updated,
                          std::time_t now = std::time(nullptr),
                          bool color = true);
