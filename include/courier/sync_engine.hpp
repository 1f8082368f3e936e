#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "channel.hpp"
#include "log.hpp"
#include "options.hpp"
#include "queue_store.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "util.hpp"

namespace courier {

/// Notification published by the SyncEngine whenever something observable happens to the queue.
struct SyncEvent {
    enum class Type {
        queued,           // a message was added to the queue
        sent,             // a message was delivered and removed
        retry_scheduled,  // a message send failed and will be retried
        failed,           // a message was moved to the failed table
        action_failed,    // an offline action was dropped after its final failure
        sync_started,
        sync_finished,
        online,
        offline,
    };

    Type type;
    std::string conversation_id;
    std::string item_id;
    // Messages still queued for `conversation_id` after this event.
    int pending = 0;
    bool online = false;
    std::optional<std::string> error;
};

struct QueueStats {
    size_t pending = 0;
    size_t sending = 0;
    size_t failed = 0;
    size_t offline_actions = 0;
};

struct NetworkStatus {
    bool online;
    bool sync_in_progress;
    std::optional<sys_ms> last_sync_attempt;
};

/// Drives delivery of queued messages and offline actions through the transport hooks.
///
/// Messages go `pending -> sending -> removed` on success.  A failed attempt puts the message back
/// to `pending` and schedules a retry with exponential backoff; after `max_message_retries` failed
/// attempts, or immediately on a permanent (4xx other than 429) rejection, the message is moved to
/// the failed table.  Offline actions follow the same cycle but are dropped, not kept, when they
/// run out of retries.
///
/// Everything runs on the caller's thread: transport hooks may complete synchronously or at any
/// later time, and all timers come from the Scheduler passed at construction.  A full sync pass
/// drains pending messages one at a time, in creation order, then the offline actions, then prunes
/// expired failed messages; only one pass runs at a time.
class SyncEngine {
  public:
    /// API: sync_engine/SyncEngine::SyncEngine
    ///
    /// Constructs an engine.  `store` and `scheduler` must outlive it.  The engine starts offline
    /// and stopped; call `init()` and then `set_online(true)` once connectivity is known.
    SyncEngine(
            QueueStore& store,
            Scheduler& scheduler,
            SyncOptions opts = {},
            clock_fn clock = now_ms);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    logger_fn logger;

    /// API: sync_engine/SyncEngine::on_send
    ///
    /// Installs the hook that transmits a queued message.  Without one, every send attempt fails
    /// as a network error.
    void on_send(send_hook_t hook) { send_ = std::move(hook); }

    // Handlers for the offline action kinds.  An action whose kind has no handler fails.
    void on_mark_read(action_hook_t<action::mark_read> hook) { mark_read_ = std::move(hook); }
    void on_delete_message(action_hook_t<action::delete_message> hook) {
        delete_message_ = std::move(hook);
    }
    void on_leave_conversation(action_hook_t<action::leave_conversation> hook) {
        leave_conversation_ = std::move(hook);
    }

    /// API: sync_engine/SyncEngine::init
    ///
    /// Starts the engine: resets messages left in `sending` by a previous run back to `pending`,
    /// arms the periodic sync timer and, if already online, starts a sync pass.
    void init();

    /// API: sync_engine/SyncEngine::shutdown
    ///
    /// Stops the engine: cancels all timers and ignores any transport completion still
    /// outstanding.  Queued data stays in the store.  `init()` may be called again afterwards.
    void shutdown();

    bool running() const { return running_; }

    /// API: sync_engine/SyncEngine::queue_message
    ///
    /// Persists a new message and, if online, sends it straight away.  The send outcome is only
    /// reported through the queue, the sync status and the event stream; transmission problems
    /// never throw from here.  Neither do store failures: they are logged, and an online message
    /// is still sent once.
    ///
    /// Inputs:
    /// - `conversation_id` -- destination conversation.
    /// - `content` -- message payload, normally a serialized EncryptedEnvelope.
    /// - `content_type` -- kind of message.
    /// - `attachments` -- optional attachment references.
    ///
    /// Outputs:
    /// - the id of the new queue item.
    std::string queue_message(
            std::string_view conversation_id,
            std::string_view content,
            ContentType content_type = ContentType::text,
            std::vector<std::string> attachments = {});

    /// API: sync_engine/SyncEngine::queue_offline_action
    ///
    /// Persists an action and, if online, executes it straight away.
    ///
    /// Inputs:
    /// - `a` -- the action to replay.
    /// - `max_retries` -- attempts before the action is dropped; defaults to
    ///   `SyncOptions::default_action_retries`.
    ///
    /// Outputs:
    /// - the id of the new action.
    std::string queue_offline_action(action::any a, std::optional<int> max_retries = std::nullopt);

    /// API: sync_engine/SyncEngine::set_online
    ///
    /// Records a connectivity change.  Going online starts a sync pass; going offline only stops
    /// new attempts, in-flight ones complete (or fail) on their own.
    void set_online(bool online);

    bool is_online() const { return online_; }

    /// API: sync_engine/SyncEngine::sync_pending_messages
    ///
    /// Starts a full sync pass.  Does nothing if offline, stopped, or a pass is already running.
    ///
    /// Outputs:
    /// - true if a pass was started.
    bool sync_pending_messages();

    // Starts a sync pass right away if online; same as sync_pending_messages().
    bool force_sync();

    /// API: sync_engine/SyncEngine::retry_failed_message
    ///
    /// Moves a failed message back into the queue as a new `pending` item with a zero retry count,
    /// and sends it if online.
    ///
    /// Outputs:
    /// - false if there is no failed message with that id.
    bool retry_failed_message(std::string_view failed_id);

    // Counts of the queue tables; no side effects.
    QueueStats get_queue_stats();

    // Queued (pending or sending) messages of one conversation, oldest first.
    std::vector<QueueItem> get_pending_messages(std::string_view conversation_id);

    std::vector<FailedMessage> get_failed_messages();

    std::optional<SyncStatus> get_sync_status(std::string_view conversation_id);

    NetworkStatus get_network_status() const;

    /// API: sync_engine/SyncEngine::clear_all_queues
    ///
    /// Empties all four tables and cancels every pending retry (used on logout).
    void clear_all_queues();

    /// API: sync_engine/SyncEngine::subscribe
    ///
    /// Registers `fn` to receive every SyncEvent until the returned handle is released.
    [[nodiscard]] Subscription subscribe(Channel<SyncEvent>::callback_t fn) {
        return events_.subscribe(std::move(fn));
    }

  private:
    QueueStore& store_;
    Scheduler& scheduler_;
    SyncOptions opts_;
    clock_fn clock_;

    send_hook_t send_;
    action_hook_t<action::mark_read> mark_read_;
    action_hook_t<action::delete_message> delete_message_;
    action_hook_t<action::leave_conversation> leave_conversation_;

    bool running_ = false;
    bool online_ = false;
    bool sync_in_progress_ = false;
    std::optional<sys_ms> last_sync_attempt_;

    // Work remaining in the current sync pass.
    std::deque<std::string> pass_messages_;
    std::deque<std::string> pass_actions_;
    bool in_pass_loop_ = false;
    bool pass_resume_ = false;

    std::set<std::string, std::less<>> actions_in_flight_;
    RetryRegistry retries_;
    std::optional<timer_id> periodic_;

    // Transport callbacks hold a weak reference to this; it is reset on shutdown so late
    // completions are dropped.
    std::shared_ptr<bool> alive_;

    Channel<SyncEvent> events_;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    bool can_transmit() const { return running_ && online_; }

    void arm_periodic();
    void continue_pass();
    bool start_next_in_pass();
    void finish_pass();

    void send_item(const QueueItem& item, std::function<void()> then);
    void retry_message(const std::string& id);
    void handle_send_result(
            const std::string& id, bool success, int16_t status_code, const std::string& response);
    void handle_send_failure(const QueueItem& item, const std::string& reason, bool permanent);
    void demote(const QueueItem& item, const std::string& reason, int attempts);

    void execute_action(const OfflineAction& a, std::function<void()> then);
    void retry_action(const std::string& id);
    void handle_action_result(
            const std::string& id, bool success, int16_t status_code, const std::string& response);

    response_callback_t guarded(
            std::function<void(bool, int16_t, const std::string&)> handler,
            std::function<void()> then);

    int count_pending(std::string_view conversation_id);
    void record_delivery_state(
            std::string_view conversation_id,
            int pending,
            std::optional<std::string> error,
            bool touch);

    void publish(
            SyncEvent::Type type,
            std::string conversation_id = "",
            std::string item_id = "",
            int pending = 0,
            std::optional<std::string> error = std::nullopt);
};

}  // namespace courier
