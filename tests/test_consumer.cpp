#include <gtest/gtest.h>
#include <core/constants.hpp>
#include <managers/consumer.hpp>
#include <managers/mock_source.hpp>
#include <managers/producer.hpp>
#include <model/wire_codec.hpp>
#include <platform/platform.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace {

std::unique_ptr<StateDB> open_memory() {
    auto r = StateDB::open(":memory:");
    EXPECT_TRUE(r.is_ok()) << r.error;
    return std::move(r.value);
}

Node idle_node(const std::string& name) {
    Node n;
    n.name = name;
    n.status = NodeStatus::Idle;
    n.updated_at = "2026-01-30T21:00:00Z";
    return n;
}

int count_rows(const std::string& path, const char* table) {
    sqlite3* raw = nullptr;
    int count = -1;
    if (sqlite3_open(path.c_str(), &raw) == SQLITE_OK) {
        std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(raw, sql.c_str(), -1, &st, nullptr) == SQLITE_OK &&
            sqlite3_step(st) == SQLITE_ROW) {
            count = sqlite3_column_int(st, 0);
        }
        sqlite3_finalize(st);
    }
    sqlite3_close(raw);
    return count;
}

// Three ticks of a seeded mock cluster, one diff per line.
std::string mock_stream(ClusterState* last = nullptr) {
    MockSource source(3);
    std::ostringstream out;
    Producer producer(source, out, 1);
    for (int i = 0; i < 3; i++) producer.tick();
    if (last) *last = producer.last_state();
    return out.str();
}

} // namespace

// ── LineSplitter ────────────────────────────────────────────

TEST(LineSplitter, SplitsAcrossChunks) {
    LineSplitter s;
    std::vector<std::string> lines;
    auto collect = [&](const std::string& l) { lines.push_back(l); };

    s.feed("ab", 2, collect);
    EXPECT_TRUE(lines.empty());
    s.feed("c\nde\r\nf", 7, collect);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[1], "de");

    s.finish(collect);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "f");

    s.finish(collect);
    EXPECT_EQ(lines.size(), 3u);
}

// ── Consumer ────────────────────────────────────────────────

TEST(Consumer, AppliesLinesToMemoryAndStore) {
    auto db = open_memory();
    Consumer consumer(*db);
    ClusterState expected;
    std::istringstream in(mock_stream(&expected));
    std::string line;
    while (std::getline(in, line)) {
        EXPECT_TRUE(consumer.handle_line(line).is_ok());
    }

    EXPECT_EQ(consumer.stats().applied, 3);
    EXPECT_EQ(consumer.state(), expected);

    auto stored = db->load_state();
    ASSERT_TRUE(stored.is_ok()) << stored.error;
    EXPECT_EQ(stored.value.nodes.size(), expected.nodes.size());
    EXPECT_EQ(stored.value.jobs, expected.jobs);
    EXPECT_EQ(stored.value.job_allocations, expected.job_allocations);

    auto last = db->get_metadata(META_LAST_UPDATED);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value.has_value());
}

TEST(Consumer, BadLineIsSkipped) {
    auto db = open_memory();
    Consumer consumer(*db);

    ClusterDiff d;
    d.updated_at = "2026-01-30T21:00:00Z";
    Node n;
    n.name = "n1";
    n.status = NodeStatus::Idle;
    n.updated_at = "2026-01-30T21:00:00Z";
    d.nodes.added.push_back(n);

    EXPECT_TRUE(consumer.handle_line("this is not a diff").is_err());
    EXPECT_TRUE(consumer.handle_line("").is_ok());
    EXPECT_TRUE(consumer.handle_line(encode_diff(d)).is_ok());

    EXPECT_EQ(consumer.stats().parse_errors, 1);
    EXPECT_EQ(consumer.stats().applied, 1);
    EXPECT_TRUE(consumer.state().nodes.contains("n1"));
}

TEST(Consumer, StoreFailureKeepsMemoryAndStreamGoesOn) {
    auto dir = platform::temp_file("slurmsync-consumer");
    std::filesystem::create_directories(dir);
    auto path = (dir / "cluster.db").string();
    auto opened = StateDB::open(path);
    ASSERT_TRUE(opened.is_ok()) << opened.error;
    auto db = std::move(opened.value);

    // Break the jobs table from outside the store.
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "DROP TABLE jobs", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    Consumer consumer(*db);

    ClusterDiff first;
    first.updated_at = "2026-01-30T21:00:00Z";
    first.nodes.added.push_back(idle_node("n1"));
    Job job;
    job.job_id = 5;
    job.user = "alice";
    job.status = JobStatus::Pending;
    job.updated_at = "2026-01-30T21:00:00Z";
    first.jobs.added.push_back(job);

    ClusterDiff second;
    second.updated_at = "2026-01-30T21:00:30Z";
    second.nodes.added.push_back(idle_node("n2"));

    EXPECT_TRUE(consumer.handle_line(encode_diff(first)).is_err());
    EXPECT_TRUE(consumer.handle_line(encode_diff(second)).is_ok());

    EXPECT_EQ(consumer.stats().store_errors, 1);
    EXPECT_EQ(consumer.stats().applied, 2);
    EXPECT_EQ(consumer.state().nodes.size(), 2u);
    EXPECT_TRUE(consumer.state().jobs.contains(5));

    // Tables written before the failing one keep their rows.
    EXPECT_EQ(count_rows(path, "nodes"), 2);

    db.reset();
    std::filesystem::remove_all(dir);
}

TEST(Consumer, DiagnosticsAreCounted) {
    auto db = open_memory();
    Consumer consumer(*db);
    consumer.handle_diagnostic_line("[12:00:00.000] INFO  Tick 1");
    EXPECT_EQ(consumer.stats().diagnostics, 1);
    EXPECT_EQ(consumer.stats().applied, 0);
}

TEST(Consumer, ReadsDescriptorUntilEof) {
    auto db = open_memory();
    Consumer consumer(*db);
    ClusterState expected;
    std::string stream = mock_stream(&expected);

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    // Mock diffs are small enough to fit in the pipe buffer.
    ASSERT_EQ(::write(fds[1], stream.data(), stream.size()),
              static_cast<ssize_t>(stream.size()));
    ::close(fds[1]);

    EXPECT_TRUE(consumer.run_fd(fds[0]).is_ok());
    ::close(fds[0]);
    EXPECT_EQ(consumer.stats().applied, 3);
    EXPECT_EQ(consumer.state(), expected);
}

TEST(Consumer, RunsProducerCommand) {
    auto path = platform::temp_file("slurmsync-stream");
    ClusterState expected;
    {
        std::ofstream f(path);
        f << mock_stream(&expected) << "garbage line\n";
    }

    auto db = open_memory();
    Consumer consumer(*db);
    auto r = consumer.run_command("cat " + path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 0);
    EXPECT_EQ(consumer.stats().applied, 3);
    EXPECT_EQ(consumer.stats().parse_errors, 1);
    EXPECT_EQ(consumer.state(), expected);
}

TEST(Consumer, ProducerStderrIsDiagnostic) {
    auto db = open_memory();
    Consumer consumer(*db);
    auto r = consumer.run_command("cat /nonexistent/slurmsync-missing");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_NE(r.value, 0);
    EXPECT_GE(consumer.stats().diagnostics, 1);
    EXPECT_EQ(consumer.stats().applied, 0);
}

TEST(Consumer, EmptyCommandIsAnError) {
    auto db = open_memory();
    Consumer consumer(*db);
    EXPECT_TRUE(consumer.run_command("   ").is_err());
}
