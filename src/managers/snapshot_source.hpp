#pragma once

#include <model/cluster_state.hpp>
#include "collector.hpp"

// Where the producer gets each tick's full snapshot.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;

    // `previous` is the last emitted snapshot; sources that can fail per
    // resource class fall back to its tables.
    virtual ClusterState snapshot(const ClusterState& previous) = 0;
};

// Live cluster state via scontrol.
class ScontrolSource : public SnapshotSource {
public:
    ScontrolSource(CommandRunner& runner, const std::string& scontrol)
        : collector_(runner, scontrol) {}

    ClusterState snapshot(const ClusterState& previous) override {
        return collector_.collect(previous);
    }

private:
    Collector collector_;
};
