#include <gtest/gtest.h>
#include <model/entities.hpp>
#include <model/table.hpp>
#include <set>

namespace {

NodeResource res(const std::string& node, const std::string& r, uint64_t avail, uint64_t total) {
    return NodeResource{node, r, avail, total};
}

Table<NodeResource> sample_old() {
    return Table<NodeResource>({
        res("n1", "cpu", 64, 64),
        res("n1", "mem", 100, 100),
        res("n2", "cpu", 32, 32),
    });
}

Table<NodeResource> sample_new() {
    return Table<NodeResource>({
        res("n1", "cpu", 0, 64),      // changed
        res("n1", "mem", 100, 100),   // unchanged
        res("n3", "gres/gpu", 4, 4),  // added
    });
}

template <typename V>
void expect_disjoint(const TableDiff<V>& d) {
    std::set<typename V::Key> seen;
    for (const auto& v : d.added) EXPECT_TRUE(seen.insert(v.key()).second);
    for (const auto& v : d.changed) EXPECT_TRUE(seen.insert(v.key()).second);
    for (const auto& k : d.removed) EXPECT_TRUE(seen.insert(k).second);
}

} // namespace

TEST(Table, InsertOverwritesByKey) {
    Table<NodeResource> t;
    t.insert(res("n1", "cpu", 64, 64));
    t.insert(res("n1", "cpu", 10, 64));
    EXPECT_EQ(t.size(), 1u);
    ASSERT_NE(t.find({"n1", "cpu"}), nullptr);
    EXPECT_EQ(t.find({"n1", "cpu"})->available, 10u);
    EXPECT_TRUE(t.erase({"n1", "cpu"}));
    EXPECT_FALSE(t.erase({"n1", "cpu"}));
    EXPECT_TRUE(t.empty());
}

TEST(Table, DiffClassifiesKeys) {
    auto d = sample_old().diff(sample_new());

    ASSERT_EQ(d.added.size(), 1u);
    EXPECT_EQ(d.added[0].node, "n3");

    ASSERT_EQ(d.changed.size(), 1u);
    EXPECT_EQ(d.changed[0].node, "n1");
    EXPECT_EQ(d.changed[0].resource, "cpu");
    EXPECT_EQ(d.changed[0].available, 0u);

    ASSERT_EQ(d.removed.size(), 1u);
    EXPECT_EQ(d.removed[0], (NodeResourceKey{"n2", "cpu"}));

    expect_disjoint(d);
}

TEST(Table, RoundTrip) {
    auto a = sample_old();
    auto b = sample_new();
    a.apply(a.diff(b));
    EXPECT_EQ(a, b);

    // And back again.
    auto c = sample_new();
    c.apply(c.diff(sample_old()));
    EXPECT_EQ(c, sample_old());
}

TEST(Table, RoundTripFromEmpty) {
    Table<NodeResource> empty;
    auto b = sample_new();
    auto d = empty.diff(b);
    EXPECT_EQ(d.added.size(), b.size());
    EXPECT_TRUE(d.changed.empty());
    EXPECT_TRUE(d.removed.empty());
    empty.apply(d);
    EXPECT_EQ(empty, b);
}

TEST(Table, DiffWithSelfIsEmpty) {
    auto t = sample_old();
    auto d = t.diff(t);
    EXPECT_TRUE(d.empty());
    EXPECT_EQ(d.size(), 0u);
}

TEST(Table, ApplyIsIdempotent) {
    auto a = sample_old();
    auto d = a.diff(sample_new());
    a.apply(d);
    auto once = a;
    a.apply(d);
    EXPECT_EQ(a, once);
}

TEST(Table, ApplyDoesNotNeedExactBase) {
    // The receiver missed an earlier update and holds a stale n1/cpu plus a row
    // the producer never knew about.
    Table<NodeResource> receiver({res("n1", "cpu", 5, 64), res("n9", "cpu", 1, 1)});
    auto d = sample_old().diff(sample_new());
    receiver.apply(d);

    EXPECT_EQ(receiver.find({"n1", "cpu"})->available, 0u);
    EXPECT_TRUE(receiver.contains({"n3", "gres/gpu"}));
    EXPECT_TRUE(receiver.contains({"n9", "cpu"}));
    EXPECT_FALSE(receiver.contains({"n2", "cpu"}));
}

TEST(Table, IterationIsOrderedByKey) {
    Table<Job> jobs({Job{30}, Job{10}, Job{20}});
    std::vector<JobId> ids;
    for (const auto& [id, job] : jobs) ids.push_back(id);
    EXPECT_EQ(ids, (std::vector<JobId>{10, 20, 30}));
    EXPECT_EQ(jobs.values().front().job_id, 10);
}
