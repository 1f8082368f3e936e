#pragma once

#include <chrono>
#include <nlohmann/json_fwd.hpp>

namespace courier {

using namespace std::literals;

/// Tunables of the sync engine.  The defaults are the production values; hosts may override them
/// from a JSON document with `from_json`, e.g.
///
///     {"max_message_retries": 5, "retry_base_ms": 1000, "periodic_sync_ms": 30000}
struct SyncOptions {
    // Send attempts after which a message is demoted to the failed table.
    int max_message_retries = 5;

    // Default `max_retries` given to offline actions queued without an explicit limit.
    int default_action_retries = 3;

    // Retry delay is `min(retry_base * 2^retry_count, retry_max)`.
    std::chrono::milliseconds retry_base = 1s;
    std::chrono::milliseconds retry_max = 60s;

    // Interval of the fallback sync pass that runs while online.
    std::chrono::milliseconds periodic_sync = 30s;

    // Failed messages older than this are pruned at the end of each sync pass.
    std::chrono::milliseconds failed_message_ttl = 7 * 24h;

    /// API: options/SyncOptions::retry_delay
    ///
    /// Computes the backoff delay that follows the `retry_count`th failed attempt.
    ///
    /// Inputs:
    /// - `retry_count` -- number of failed attempts so far (1 after the first failure).
    ///
    /// Outputs:
    /// - the delay before the next attempt.
    std::chrono::milliseconds retry_delay(int retry_count) const;
};

struct MonitorOptions {
    std::chrono::milliseconds health_check_interval = 5s;

    // A conversation stuck in `syncing` for longer than this is forced into `error`.
    std::chrono::milliseconds stall_timeout = 5min;

    // `retry_failed_syncs` only re-arms conversations that have failed fewer times than this.
    int max_sync_retries = 3;

    // Advisory per-item cost used by `get_queue_health`.
    std::chrono::milliseconds estimated_time_per_item = 1s;
};

/// API: options/from_json
///
/// Parses option overrides out of a JSON object.  Keys that are absent keep their default value.
/// Durations are given in milliseconds under keys ending in `_ms`.
///
/// Inputs:
/// - `j` -- the JSON object to read.
/// - `opts` -- the options to update in place.
///
/// Throws std::invalid_argument if `j` is not an object, or if a key holds a value of the wrong
/// type or a non-positive number.
void from_json(const nlohmann::json& j, SyncOptions& opts);
void from_json(const nlohmann::json& j, MonitorOptions& opts);

}  // namespace courier
