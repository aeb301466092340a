#pragma once

#include <atomic>
#include <ostream>
#include <model/cluster_state.hpp>
#include "snapshot_source.hpp"

// Timer loop that snapshots the cluster, diffs against the previously
// emitted snapshot and writes the diff as one line to `out`. The previous
// snapshot is owned here and replaced after every tick, including ticks
// with an empty diff (heartbeats).
class Producer {
public:
    Producer(SnapshotSource& source, std::ostream& out, int interval_secs, int max_ticks = -1);

    // Snapshot, diff, emit, retain. Returns the emitted diff.
    ClusterDiff tick();

    // Tick immediately, then every interval, until max_ticks is reached,
    // request_stop() is called or the output stream fails.
    void run();

    // Safe to call from a signal handler.
    void request_stop() { stop_ = true; }

    const ClusterState& last_state() const { return last_; }
    int ticks() const { return ticks_; }

private:
    SnapshotSource& source_;
    std::ostream& out_;
    int interval_ms_;
    int max_ticks_;
    int ticks_ = 0;
    ClusterState last_;
    std::atomic<bool> stop_{false};
};
