#pragma once

#include <string>
#include <core/types.hpp>
#include "cluster_state.hpp"

// ── Wire format ──────────────────────────────────────────────
//
// One ClusterDiff per line, as a single-line JSON object:
//
//   {"partitions": {"added": [...], "changed": [...], "removed": [...]},
//    "nodes": {...}, "node_partitions": {...}, "node_resources": {...},
//    "jobs": {...}, "job_resources": {...}, "job_allocations": {...},
//    "updated_at": "2026-01-30T21:22:26Z"}
//
// Added/changed entries are full records keyed by field name. Removed
// entries are keys: a string for partitions and nodes, a number for jobs,
// and an array of the components for composite keys (["node01", "cpu"]).
// Statuses use their upper-case names; absent optionals are null.

// Encode without a trailing newline. The result never contains '\n'.
std::string encode_diff(const ClusterDiff& diff);

// Decode one line. Missing tables decode as empty; a malformed document,
// a record missing a field or a value of the wrong type is an error.
Result<ClusterDiff> decode_diff(const std::string& line);
