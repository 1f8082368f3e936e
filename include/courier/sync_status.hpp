#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "channel.hpp"
#include "log.hpp"
#include "options.hpp"
#include "queue_store.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include "util.hpp"

namespace courier {

class SyncEngine;
struct SyncEvent;

struct QueueHealth {
    int total_pending = 0;
    int failed_messages = 0;  // conversations in the `error` state
    int in_progress = 0;      // conversations in the `syncing` state
    std::optional<sys_ms> oldest_pending;
    std::chrono::milliseconds estimated_time_to_sync{0};
};

/// Per-conversation sync state machine feeding the UI's sync indicators.
///
///     offline --> syncing --> synced
///        ^          |  ^        |
///        |          v  |        |
///        +------- error <-------+
///
/// Every transition persists the conversation's SyncStatus and publishes the new snapshot to
/// subscribers.  A periodic health check moves conversations that have been `syncing` for longer
/// than the stall timeout into `error`.
class SyncStatusMonitor {
  public:
    static constexpr std::string_view STALLED_MESSAGE = "Sync stalled (timeout)";

    SyncStatusMonitor(
            QueueStore& store,
            Scheduler& scheduler,
            MonitorOptions opts = {},
            clock_fn clock = now_ms);
    ~SyncStatusMonitor();

    SyncStatusMonitor(const SyncStatusMonitor&) = delete;
    SyncStatusMonitor& operator=(const SyncStatusMonitor&) = delete;

    logger_fn logger;

    // Called by `retry_failed_syncs` for each conversation it re-arms.
    void on_retry(std::function<void(std::string_view conversation_id)> hook) {
        retry_ = std::move(hook);
        retry_from_engine_ = false;
    }

    /// API: sync_status/SyncStatusMonitor::init
    ///
    /// Starts the periodic health check.
    void init();

    /// API: sync_status/SyncStatusMonitor::shutdown
    ///
    /// Stops the health check and detaches from any observed engine, including the `on_retry`
    /// hook that `observe()` installed.
    void shutdown();

    /// API: sync_status/SyncStatusMonitor::observe
    ///
    /// Follows the events of `engine` (which must outlive the subscription, i.e. this monitor or
    /// the next `shutdown()`), turning them into transitions:
    /// - queued: `syncing` when online, `offline` otherwise;
    /// - retry_scheduled: still `syncing`;
    /// - sent: `synced` once nothing is left pending, otherwise still `syncing`;
    /// - failed: `error` with the failure reason;
    /// - offline: every `syncing` conversation becomes `offline`;
    /// - online: every `offline` conversation with pending messages becomes `syncing`.
    ///
    /// Also installs an `on_retry` hook that asks the engine for a sync pass.
    void observe(SyncEngine& engine);

    // State transitions.
    SyncStatus set_syncing(std::string_view conversation_id, int pending_count);
    // `percent` is clamped to [0, 100].
    SyncStatus update_progress(std::string_view conversation_id, int percent);
    SyncStatus mark_synced(std::string_view conversation_id);
    SyncStatus mark_error(std::string_view conversation_id, std::string_view message);
    SyncStatus mark_offline(std::string_view conversation_id);

    std::optional<SyncStatus> get_status(std::string_view conversation_id);
    std::vector<SyncStatus> get_all_statuses();

    /// API: sync_status/SyncStatusMonitor::get_queue_health
    ///
    /// Aggregates the stored statuses.  `estimated_time_to_sync` is advisory: a fixed cost per
    /// pending message.
    QueueHealth get_queue_health();

    /// API: sync_status/SyncStatusMonitor::retry_failed_syncs
    ///
    /// Moves every `error` conversation that has failed fewer than `max_sync_retries` times back
    /// to `syncing` and invokes the `on_retry` hook for it.  Nothing is retransmitted here.
    ///
    /// Outputs:
    /// - the re-armed conversation ids.
    std::vector<std::string> retry_failed_syncs();

    /// API: sync_status/SyncStatusMonitor::check_health
    ///
    /// Runs one health check immediately: every `syncing` conversation whose last activity is
    /// older than the stall timeout is marked as an error.  Normally run by the periodic timer.
    ///
    /// Outputs:
    /// - the conversations that were found stalled.
    std::vector<std::string> check_health();

    [[nodiscard]] Subscription subscribe(Channel<SyncStatus>::callback_t fn) {
        return updates_.subscribe(std::move(fn));
    }

  private:
    QueueStore& store_;
    Scheduler& scheduler_;
    MonitorOptions opts_;
    clock_fn clock_;

    std::function<void(std::string_view)> retry_;
    bool retry_from_engine_ = false;
    std::optional<timer_id> health_timer_;
    Subscription engine_sub_;
    Channel<SyncStatus> updates_;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    void arm_health_check();
    void handle_event(const SyncEvent& ev);
    SyncStatus transition(std::string_view conversation_id, const mutator<SyncStatus>& fn);
};

}  // namespace courier
