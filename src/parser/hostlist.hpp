#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Expand a Slurm hostlist expression into individual host names.
//   "node[01-03,7],gpu5" -> node01 node02 node03 node7 gpu5
// Zero padding of range bounds is preserved. Several bracket groups in one
// name expand as a cartesian product. Throws ParseError on unbalanced
// brackets or malformed ranges.
std::vector<std::string> expand_hostlist(const std::string& expr);

// Count ids in a range list such as "0-3,8,10-11" (-> 7). Used for CPU_IDs.
uint64_t count_id_ranges(const std::string& ranges);
