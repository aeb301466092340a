#pragma once

#include <random>
#include "snapshot_source.hpp"

// Synthetic cluster for demos and tests: partitions "gpu" and "standard",
// ten 64-core nodes (even ones carry 4 GPUs and join "gpu") and five jobs
// with random states. Apart from timestamps, the sequence of snapshots
// depends only on the seed.
class MockSource : public SnapshotSource {
public:
    // seed 0 seeds from std::random_device.
    explicit MockSource(unsigned seed = 0);

    ClusterState snapshot(const ClusterState& previous) override;

private:
    std::mt19937 rng_;

    int uniform(int lo, int hi);  // inclusive
};
