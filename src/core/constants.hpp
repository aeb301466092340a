#pragma once

#include <cstdint>

// ── Version ─────────────────────────────────────────────────
constexpr const char* SLURMSYNC_VERSION = "0.2.0";

// ── Scheduler commands ──────────────────────────────────────
// Subcommands passed to the administration tool (scontrol by default).
constexpr const char* SCONTROL_SHOW           = "show";
constexpr const char* SCONTROL_NODES          = "nodes";
constexpr const char* SCONTROL_PARTITIONS     = "partitions";
constexpr const char* SCONTROL_JOBS           = "jobs";
constexpr const char* SCONTROL_DETAILS        = "--details";

// ── Timing ──────────────────────────────────────────────────
constexpr int DEFAULT_INTERVAL_SECS      = 30;    // Producer tick interval
constexpr int SCONTROL_TIMEOUT_MS        = 60000; // Max time for one scontrol call
constexpr int CONSUMER_POLL_MS           = 1000;  // poll(2) timeout in the consumer loop
constexpr int CHILD_REAP_TIMEOUT_MS      = 5000;  // Wait for the producer to exit after EOF

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE         = 65536;
constexpr int LOG_PREVIEW_CHARS          = 500;   // Truncate echoed payloads in logs

// ── Quantity multipliers (decimal) ──────────────────────────
constexpr double QTY_KILO = 1e3;
constexpr double QTY_MEGA = 1e6;
constexpr double QTY_GIGA = 1e9;
constexpr double QTY_TERA = 1e12;

// ── Mock cluster shape ──────────────────────────────────────
constexpr int MOCK_NODE_COUNT            = 10;
constexpr int MOCK_JOB_COUNT             = 5;
constexpr int MOCK_NODE_CPUS             = 64;
constexpr int64_t MOCK_NODE_MEMORY_MB    = 256000;

// ── Paths / metadata ────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME      = ".slurmsync";
constexpr const char* CONFIG_FILE_NAME     = "config.yaml";
constexpr const char* DEFAULT_DB_NAME      = "cluster.db";
constexpr const char* META_LAST_UPDATED    = "last_updated";
