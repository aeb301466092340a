#include <gtest/gtest.h>
#include <cli/status_view.hpp>
#include <core/utils.hpp>

namespace {

ClusterState small_cluster() {
    ClusterState s;
    s.updated_at = "2026-01-30T21:00:00Z";

    Partition p;
    p.name = "batch";
    p.status = PartitionStatus::Up;
    p.total_nodes = 2;
    p.total_cpus = 128;
    p.total_cpus_alloc = 64;
    p.total_cpus_idle = 64;
    s.partitions.insert(p);

    Node a;
    a.name = "a";
    a.status = NodeStatus::Idle;
    Node b = a;
    b.name = "b";
    b.status = NodeStatus::Alloc;
    s.nodes.insert(a);
    s.nodes.insert(b);

    Job j;
    j.job_id = 1;
    j.status = JobStatus::Running;
    s.jobs.insert(j);
    return s;
}

} // namespace

TEST(StatusView, RendersSectionsWithoutColor) {
    std::time_t now = parse_iso_utc("2026-01-30T21:02:00Z");
    std::string out = render_status(small_cluster(), std::string("2026-01-30T21:01:30Z"), now, false);

    EXPECT_EQ(out.find('\033'), std::string::npos);
    EXPECT_NE(out.find("Cluster"), std::string::npos);
    EXPECT_NE(out.find("2026-01-30T21:00:00Z (2m0s ago)"), std::string::npos);
    EXPECT_NE(out.find("2026-01-30T21:01:30Z (30s ago)"), std::string::npos);
    EXPECT_NE(out.find("IDLE"), std::string::npos);
    EXPECT_NE(out.find("ALLOC"), std::string::npos);
    EXPECT_NE(out.find("RUNNING"), std::string::npos);
    EXPECT_NE(out.find("batch"), std::string::npos);
}

TEST(StatusView, EmptyStore) {
    std::string out = render_status(ClusterState{}, std::nullopt, std::time(nullptr), false);
    EXPECT_NE(out.find("none"), std::string::npos);
    EXPECT_NE(out.find("never"), std::string::npos);
    EXPECT_EQ(out.find("Partitions"), std::string::npos);
}

TEST(StatusView, ColorKeepsEscapes) {
    std::string out = render_status(small_cluster(), std::nullopt, std::time(nullptr), true);
    EXPECT_NE(out.find('\033'), std::string::npos);
}
