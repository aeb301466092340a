#include <gtest/gtest.h>
#include <managers/state_db.hpp>
#include <platform/platform.hpp>
#include <filesystem>

namespace {

std::unique_ptr<StateDB> open_memory() {
    auto r = StateDB::open(":memory:");
    EXPECT_TRUE(r.is_ok()) << r.error;
    return std::move(r.value);
}

ClusterState sample_state(const std::string& ts) {
    ClusterState s;
    s.updated_at = ts;

    Partition p;
    p.name = "batch";
    p.status = PartitionStatus::Up;
    p.total_nodes = 2;
    p.total_cpus = 96;
    p.total_cpus_alloc = 32;
    p.total_cpus_idle = 64;
    p.total_memory = 3000;
    p.total_memory_alloc = 1000;
    p.total_memory_free = 2000;
    p.access_qos = "ALL";
    p.resource_qos = "normal";
    p.updated_at = ts;
    s.partitions.insert(p);

    for (const char* name : {"a1", "a2"}) {
        Node n;
        n.name = name;
        n.status = NodeStatus::Mix;
        n.cpus = 48;
        n.cpus_alloc = 16;
        n.cpus_idle = 32;
        n.memory = 1500;
        n.memory_alloc = 500;
        n.memory_free = 1000;
        n.partitions = {"batch", "debug"};
        n.updated_at = ts;
        s.nodes.insert(n);
        s.node_partitions.insert(NodePartition{name, "batch"});
        s.node_partitions.insert(NodePartition{name, "debug"});
        s.node_resources.insert(NodeResource{name, "cpu", 32, 48});
        s.node_resources.insert(NodeResource{name, "mem", 1000000000ull, 1500000000ull});
    }

    Job j;
    j.job_id = 77;
    j.user = "carol";
    j.partition = "batch";
    j.status = JobStatus::Running;
    j.time_limit = "04:00:00";
    j.start_time = "2026-01-30T20:00:00";
    j.submit_time = "2026-01-30T19:59:00";
    j.updated_at = ts;
    s.jobs.insert(j);

    Job pending = j;
    pending.job_id = 78;
    pending.status = JobStatus::Pending;
    pending.time_limit.reset();
    pending.start_time.reset();
    s.jobs.insert(pending);

    s.job_resources.insert(JobResource{77, "cpu", 32, 32});
    s.job_allocations.insert(JobAllocation{77, "a1", "cpu", 16});
    s.job_allocations.insert(JobAllocation{77, "a2", "cpu", 16});
    return s;
}

} // namespace

TEST(StateDB, EmptyStore) {
    auto db = open_memory();
    auto state = db->load_state();
    ASSERT_TRUE(state.is_ok()) << state.error;
    EXPECT_TRUE(state.value.nodes.empty());
    EXPECT_FALSE(state.value.updated_at.has_value());
}

TEST(StateDB, ApplyThenLoadRestoresState) {
    auto db = open_memory();
    ClusterState target = sample_state("2026-01-30T21:00:00Z");
    ClusterDiff d = ClusterState{}.diff(target);
    ASSERT_TRUE(db->apply_diff(d).is_ok());

    auto loaded = db->load_state();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value, target);
    EXPECT_EQ(loaded.value.partitions.find("batch")->resource_qos,
              std::optional<std::string>("normal"));
}

TEST(StateDB, ChangesAndRemovals) {
    auto db = open_memory();
    ClusterState before = sample_state("2026-01-30T21:00:00Z");
    ASSERT_TRUE(db->apply_diff(ClusterState{}.diff(before)).is_ok());

    ClusterState after = sample_state("2026-01-30T21:00:30Z");
    after.nodes.erase("a2");
    after.node_partitions.erase({"a2", "batch"});
    after.node_partitions.erase({"a2", "debug"});
    after.node_resources.erase({"a2", "cpu"});
    after.node_resources.erase({"a2", "mem"});
    after.job_allocations.erase({77, "a2", "cpu"});
    after.jobs.erase(78);

    ASSERT_TRUE(db->apply_diff(before.diff(after)).is_ok());
    auto loaded = db->load_state();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value, after);
    EXPECT_FALSE(loaded.value.nodes.contains("a2"));
    EXPECT_EQ(loaded.value.jobs.size(), 1u);
}

TEST(StateDB, ReapplyingDiffIsHarmless) {
    auto db = open_memory();
    ClusterState target = sample_state("2026-01-30T21:00:00Z");
    ClusterDiff d = ClusterState{}.diff(target);
    ASSERT_TRUE(db->apply_diff(d).is_ok());
    ASSERT_TRUE(db->apply_diff(d).is_ok());
    EXPECT_EQ(db->load_state().value, target);
}

TEST(StateDB, FreshnessIsNewestRowTimestamp) {
    auto db = open_memory();
    ClusterState s = sample_state("2026-01-30T21:00:00Z");
    Job late = *s.jobs.find(77);
    late.updated_at = "2026-01-30T22:00:00Z";
    s.jobs.insert(late);
    ASSERT_TRUE(db->apply_diff(ClusterState{}.diff(s)).is_ok());

    auto loaded = db->load_state();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value.updated_at.has_value());
    EXPECT_EQ(*loaded.value.updated_at, "2026-01-30T22:00:00Z");
}

TEST(StateDB, Metadata) {
    auto db = open_memory();
    auto missing = db->get_metadata("last_updated");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value.has_value());

    ASSERT_TRUE(db->set_metadata("last_updated", "2026-01-30T21:00:00Z").is_ok());
    ASSERT_TRUE(db->set_metadata("last_updated", "2026-01-30T21:00:30Z").is_ok());
    auto got = db->get_metadata("last_updated");
    ASSERT_TRUE(got.is_ok());
    ASSERT_TRUE(got.value.has_value());
    EXPECT_EQ(*got.value, "2026-01-30T21:00:30Z");
}

TEST(StateDB, PersistsAcrossReopen) {
    auto dir = platform::temp_file("slurmsync-db");
    auto path = (dir / "nested" / "cluster.db").string();
    ClusterState target = sample_state("2026-01-30T21:00:00Z");
    {
        auto db = StateDB::open(path);
        ASSERT_TRUE(db.is_ok()) << db.error;
        ASSERT_TRUE(db.value->apply_diff(ClusterState{}.diff(target)).is_ok());
    }
    {
        auto db = StateDB::open(path);
        ASSERT_TRUE(db.is_ok()) << db.error;
        EXPECT_EQ(db.value->load_state().value, target);
    }
    std::filesystem::remove_all(dir);
}
