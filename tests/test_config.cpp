#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.producer().interval_secs, DEFAULT_INTERVAL_SECS);
    EXPECT_FALSE(r.value.producer().mock);
    EXPECT_EQ(r.value.producer().scontrol, "scontrol");
    EXPECT_EQ(r.value.producer().max_ticks, -1);
    EXPECT_EQ(r.value.consumer().producer_cmd, "slurmsync produce --mock");
    EXPECT_EQ(r.value.log().level, "info");
    EXPECT_TRUE(r.value.log().to_stderr);
}

TEST(Config, ParsesSections) {
    auto r = Config::parse(R"(
producer:
  interval_secs: 5
  mock: true
  scontrol: "ssh login1 scontrol"
  mock_seed: 11
  max_ticks: 3
consumer:
  producer_cmd: "ssh login1 slurmsync produce"
  database: /var/lib/slurmsync/state.db
log:
  level: debug
  file: /tmp/slurmsync.log
  stderr: false
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.producer().interval_secs, 5);
    EXPECT_TRUE(c.producer().mock);
    EXPECT_EQ(c.producer().scontrol, "ssh login1 scontrol");
    EXPECT_EQ(c.producer().mock_seed, 11u);
    EXPECT_EQ(c.producer().max_ticks, 3);
    EXPECT_EQ(c.consumer().producer_cmd, "ssh login1 slurmsync produce");
    EXPECT_EQ(c.database_path(), fs::path("/var/lib/slurmsync/state.db"));
    EXPECT_EQ(c.log().level, "debug");
    EXPECT_EQ(c.log().file, "/tmp/slurmsync.log");
    EXPECT_FALSE(c.log().to_stderr);
}

TEST(Config, NonPositiveIntervalFallsBack) {
    auto r = Config::parse("producer:\n  interval_secs: 0\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.producer().interval_secs, DEFAULT_INTERVAL_SECS);
}

TEST(Config, RejectsNonMappingRoot) {
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
    EXPECT_TRUE(Config::parse("producer: [unclosed").is_err());
}

TEST(Config, DefaultDatabaseUnderConfigDir) {
    Config c;
    EXPECT_EQ(c.database_path(), get_config_dir() / DEFAULT_DB_NAME);
}

TEST(Config, ExpandsHome) {
    EXPECT_EQ(expand_home("~/x.db"), platform::home_dir() / "x.db");
    EXPECT_EQ(expand_home("/abs/x.db"), fs::path("/abs/x.db"));
}

TEST(Config, DefaultFileRoundTrips) {
    auto dir = platform::temp_file("slurmsync-config");
    auto path = dir / "config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto loaded = Config::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.producer().interval_secs, 30);
    EXPECT_EQ(loaded.value.database_path(), platform::home_dir() / ".slurmsync" / "cluster.db");

    // Missing file: defaults, not an error.
    auto missing = Config::load(dir / "absent.yaml");
    EXPECT_TRUE(missing.is_ok());
    fs::remove_all(dir);
}
