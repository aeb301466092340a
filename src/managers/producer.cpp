#include "producer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <model/wire_codec.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {
constexpr int STOP_CHECK_MS = 200;
}

Producer::Producer(SnapshotSource& source, std::ostream& out, int interval_secs, int max_ticks)
    : source_(source),
      out_(out),
      interval_ms_((interval_secs > 0 ? interval_secs : DEFAULT_INTERVAL_SECS) * 1000),
      max_ticks_(max_ticks) {}

ClusterDiff Producer::tick() {
    ClusterState next = source_.snapshot(last_);
    ClusterDiff diff = last_.diff(next);

    out_ << encode_diff(diff) << '\n';
    out_.flush();

    last_ = std::move(next);
    ticks_++;

    if (diff.empty()) {
        log_debug(fmt::format("Tick {}: no changes", ticks_));
    } else {
        log_info(fmt::format("Tick {}: {} nodes, {} jobs, {} entries changed",
                             ticks_, last_.nodes.size(), last_.jobs.size(), diff.size()));
    }
    return diff;
}

void Producer::run() {
    int64_t next_deadline = platform::monotonic_ms();

    while (!stop_) {
        tick();
        if (!out_) {
            log_error("Output stream closed, stopping producer");
            return;
        }
        if (max_ticks_ >= 0 && ticks_ >= max_ticks_) return;

        // Fixed-rate schedule; a slow snapshot shortens the following wait.
        next_deadline += interval_ms_;
        while (!stop_) {
            int64_t remaining = next_deadline - platform::monotonic_ms();
            if (remaining <= 0) break;
            platform::sleep_ms(static_cast<int>(std::min<int64_t>(remaining, STOP_CHECK_MS)));
        }
    }
    log_info("Producer stopped");
}
