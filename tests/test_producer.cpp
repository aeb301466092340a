#include <gtest/gtest.h>
#include <managers/mock_source.hpp>
#include <managers/producer.hpp>
#include <model/wire_codec.hpp>
#include <sstream>

namespace {

// Returns the same snapshot every tick.
class FixedSource : public SnapshotSource {
public:
    explicit FixedSource(ClusterState state) : state_(std::move(state)) {}

    ClusterState snapshot(const ClusterState&) override {
        calls++;
        return state_;
    }

    int calls = 0;

private:
    ClusterState state_;
};

ClusterState one_node() {
    ClusterState s;
    s.updated_at = "2026-01-30T21:00:00Z";
    Node n;
    n.name = "n1";
    n.status = NodeStatus::Idle;
    n.cpus = 4;
    n.cpus_idle = 4;
    n.updated_at = "2026-01-30T21:00:00Z";
    s.nodes.insert(n);
    return s;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

} // namespace

TEST(Producer, FirstTickAddsEverything) {
    MockSource source(42);
    std::ostringstream out;
    Producer producer(source, out, 1);

    ClusterDiff d = producer.tick();
    EXPECT_EQ(d.partitions.added.size(), 2u);
    EXPECT_EQ(d.nodes.added.size(), 10u);
    EXPECT_EQ(d.node_partitions.added.size(), 15u);
    EXPECT_EQ(d.node_resources.added.size(), 15u);
    EXPECT_EQ(d.jobs.added.size(), 5u);
    EXPECT_EQ(d.job_resources.added.size(), 5u);
    EXPECT_TRUE(d.nodes.changed.empty());
    EXPECT_TRUE(d.nodes.removed.empty());

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 1u);
    auto decoded = decode_diff(lines[0]);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error;
    EXPECT_EQ(decoded.value.nodes.added.size(), 10u);
}

TEST(Producer, ReplayingLinesReproducesLastSnapshot) {
    MockSource source(7);
    std::ostringstream out;
    Producer producer(source, out, 1);
    for (int i = 0; i < 4; i++) producer.tick();
    EXPECT_EQ(producer.ticks(), 4);

    ClusterState replica;
    for (const auto& line : lines_of(out.str())) {
        auto d = decode_diff(line);
        ASSERT_TRUE(d.is_ok()) << d.error;
        replica.apply(d.value);
    }
    EXPECT_EQ(replica, producer.last_state());
}

TEST(Producer, SameSeedSameClusterShape) {
    MockSource a(99);
    MockSource b(99);
    ClusterState sa = a.snapshot(ClusterState{});
    ClusterState sb = b.snapshot(ClusterState{});
    ASSERT_EQ(sa.nodes.size(), sb.nodes.size());
    for (const auto& [name, node] : sa.nodes) {
        EXPECT_EQ(node.status, sb.nodes.find(name)->status);
    }
    for (const auto& [id, job] : sa.jobs) {
        EXPECT_EQ(job.status, sb.jobs.find(id)->status);
        EXPECT_EQ(job.user, sb.jobs.find(id)->user);
    }
}

TEST(Producer, UnchangedSnapshotEmitsHeartbeat) {
    FixedSource source(one_node());
    std::ostringstream out;
    Producer producer(source, out, 1);

    producer.tick();
    ClusterDiff second = producer.tick();
    EXPECT_TRUE(second.empty());

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), 2u);
    auto decoded = decode_diff(lines[1]);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error;
    EXPECT_TRUE(decoded.value.empty());
    EXPECT_EQ(*decoded.value.updated_at, "2026-01-30T21:00:00Z");
}

TEST(Producer, RunStopsAfterMaxTicks) {
    FixedSource source(one_node());
    std::ostringstream out;
    Producer producer(source, out, 1, 1);
    producer.run();
    EXPECT_EQ(producer.ticks(), 1);
    EXPECT_EQ(source.calls, 1);
}

TEST(Producer, RunStopsWhenRequested) {
    FixedSource source(one_node());
    std::ostringstream out;
    Producer producer(source, out, 1);
    producer.request_stop();
    producer.run();
    EXPECT_EQ(producer.ticks(), 0);
}

TEST(Producer, RunStopsWhenOutputFails) {
    FixedSource source(one_node());
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    Producer producer(source, out, 1);
    producer.run();
    EXPECT_EQ(producer.ticks(), 1);
}
