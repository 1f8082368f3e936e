#include "courier/sync_engine.hpp"

#include <stdexcept>

#include "courier/random.hpp"

using namespace std::literals;

namespace courier {

namespace {

    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::string message_key(std::string_view id) {
        return "message:"s.append(id);
    }

    std::string action_key(std::string_view id) {
        return "action:"s.append(id);
    }

    // Short human readable description of a failed transport response.
    std::string failure_reason(int16_t status_code, const std::string& response) {
        if (status_code > 0)
            return "HTTP " + std::to_string(status_code);
        if (!response.empty())
            return response;
        return "Network error";
    }

}  // namespace

SyncEngine::SyncEngine(QueueStore& store, Scheduler& scheduler, SyncOptions opts, clock_fn clock) :
        store_{store},
        scheduler_{scheduler},
        opts_{std::move(opts)},
        clock_{std::move(clock)},
        retries_{scheduler} {}

SyncEngine::~SyncEngine() {
    shutdown();
}

void SyncEngine::init() {
    if (running_)
        return;

    size_t recovered = 0;
    try {
        for (auto& item : store_.items_by_status(QueueStatus::sending))
            if (store_.update_item(item.id, [](QueueItem& i) { i.status = QueueStatus::pending; }))
                recovered++;
    } catch (const std::exception& e) {
        log(LogLevel::error, "Failed to recover interrupted message sends: "s + e.what());
    }
    if (recovered > 0)
        log(LogLevel::info,
            "Recovered " + std::to_string(recovered) + " interrupted message send(s)");

    running_ = true;
    alive_ = std::make_shared<bool>(true);
    arm_periodic();
    log(LogLevel::debug, "Sync engine started");

    if (online_)
        sync_pending_messages();
}

void SyncEngine::shutdown() {
    if (!running_)
        return;
    running_ = false;
    if (alive_)
        *alive_ = false;
    alive_.reset();

    retries_.cancel_all();
    if (periodic_) {
        scheduler_.cancel(*periodic_);
        periodic_.reset();
    }

    sync_in_progress_ = false;
    pass_messages_.clear();
    pass_actions_.clear();
    in_pass_loop_ = false;
    pass_resume_ = false;
    actions_in_flight_.clear();
    log(LogLevel::debug, "Sync engine stopped");
}

void SyncEngine::arm_periodic() {
    periodic_ = scheduler_.schedule(opts_.periodic_sync, [this] {
        periodic_.reset();
        if (!running_)
            return;
        if (online_ && !sync_in_progress_) {
            log(LogLevel::debug, "Periodic sync");
            try {
                sync_pending_messages();
            } catch (const std::exception& e) {
                log(LogLevel::error, "Periodic sync failed: "s + e.what());
            }
        }
        arm_periodic();
    });
}

void SyncEngine::publish(
        SyncEvent::Type type,
        std::string conversation_id,
        std::string item_id,
        int pending,
        std::optional<std::string> error) {
    SyncEvent ev;
    ev.type = type;
    ev.conversation_id = std::move(conversation_id);
    ev.item_id = std::move(item_id);
    ev.pending = pending;
    ev.online = online_;
    ev.error = std::move(error);
    events_.publish(ev);
}

int SyncEngine::count_pending(std::string_view conversation_id) {
    return static_cast<int>(store_.items_by_conversation(conversation_id).size());
}

void SyncEngine::record_delivery_state(
        std::string_view conversation_id,
        int pending,
        std::optional<std::string> error,
        bool touch) {
    auto now = clock_();
    store_.update_status(conversation_id, [&](SyncStatus& s) {
        s.pending_messages = pending;
        s.error_message = std::move(error);
        if (touch)
            s.last_sync_time = now;
    });
}

response_callback_t SyncEngine::guarded(
        std::function<void(bool, int16_t, const std::string&)> handler,
        std::function<void()> then) {
    return [this,
            alive = std::weak_ptr<bool>{alive_},
            handler = std::move(handler),
            then = std::move(then)](bool success, int16_t status_code, std::string response) {
        auto token = alive.lock();
        if (!token || !*token)
            return;
        try {
            handler(success, status_code, response);
        } catch (const std::exception& e) {
            log(LogLevel::error, "Failed to record transport result: "s + e.what());
        }
        if (then)
            then();
    };
}

std::string SyncEngine::queue_message(
        std::string_view conversation_id,
        std::string_view content,
        ContentType content_type,
        std::vector<std::string> attachments) {
    QueueItem item;
    item.timestamp = clock_();
    item.id = random::unique_id(item.timestamp);
    item.conversation_id = conversation_id;
    item.content = content;
    item.content_type = content_type;
    item.status = can_transmit() ? QueueStatus::sending : QueueStatus::pending;
    item.attachments = std::move(attachments);

    // A store failure loses the queued copy but must not stop an online send.
    int pending = 1;
    try {
        store_.put_item(item);
        pending = count_pending(conversation_id);
        store_.update_status(
                conversation_id, [pending](SyncStatus& s) { s.pending_messages = pending; });
    } catch (const std::exception& e) {
        log(LogLevel::error, "Failed to persist message " + item.id + ": " + e.what());
    }
    log(LogLevel::debug,
        "Queued message " + item.id + " for conversation " + item.conversation_id + " (" +
                std::string{to_string(item.status)} + ")");
    publish(SyncEvent::Type::queued, item.conversation_id, item.id, pending);

    if (can_transmit())
        send_item(item, nullptr);

    return item.id;
}

std::string SyncEngine::queue_offline_action(action::any a, std::optional<int> max_retries) {
    OfflineAction action;
    action.timestamp = clock_();
    action.id = random::unique_id(action.timestamp);
    action.action = std::move(a);
    action.max_retries = max_retries.value_or(opts_.default_action_retries);
    if (action.max_retries <= 0)
        throw std::invalid_argument{"Invalid max_retries: must be positive"};

    try {
        store_.put_action(action);
    } catch (const std::exception& e) {
        log(LogLevel::error, "Failed to persist offline action " + action.id + ": " + e.what());
    }
    log(LogLevel::debug,
        "Queued offline action " + action.id + " (" +
                std::string{action::type_name(action.action)} + ")");

    if (can_transmit())
        execute_action(action, nullptr);

    return action.id;
}

void SyncEngine::set_online(bool online) {
    if (online == online_)
        return;
    online_ = online;
    log(LogLevel::info, online ? "Network online" : "Network offline");
    publish(online ? SyncEvent::Type::online : SyncEvent::Type::offline);

    if (online)
        sync_pending_messages();
}

bool SyncEngine::sync_pending_messages() {
    if (!can_transmit() || sync_in_progress_)
        return false;

    sync_in_progress_ = true;
    last_sync_attempt_ = clock_();

    pass_messages_.clear();
    pass_actions_.clear();
    try {
        for (auto& item : store_.items_by_status(QueueStatus::pending))
            pass_messages_.push_back(item.id);
        for (auto& a : store_.all_actions())
            pass_actions_.push_back(a.id);
    } catch (const std::exception& e) {
        log(LogLevel::error, "Sync pass not started: "s + e.what());
        pass_messages_.clear();
        pass_actions_.clear();
        sync_in_progress_ = false;
        return false;
    }

    log(LogLevel::debug,
        "Sync pass started: " + std::to_string(pass_messages_.size()) + " message(s), " +
                std::to_string(pass_actions_.size()) + " action(s)");
    publish(SyncEvent::Type::sync_started);

    continue_pass();
    return true;
}

bool SyncEngine::force_sync() {
    if (!online_) {
        log(LogLevel::debug, "Ignoring forced sync while offline");
        return false;
    }
    return sync_pending_messages();
}

void SyncEngine::continue_pass() {
    // Transport hooks may complete synchronously, re-entering here from inside
    // start_next_in_pass(); flatten that into the loop below instead of recursing.
    if (in_pass_loop_) {
        pass_resume_ = true;
        return;
    }
    in_pass_loop_ = true;
    do {
        pass_resume_ = false;
        if (!sync_in_progress_)
            break;
        bool started;
        try {
            started = start_next_in_pass();
        } catch (const std::exception& e) {
            // Whatever was not reached stays pending for the next pass.
            log(LogLevel::error, "Sync pass aborted: "s + e.what());
            pass_messages_.clear();
            pass_actions_.clear();
            started = false;
        }
        if (!started) {
            finish_pass();
            break;
        }
    } while (pass_resume_);
    in_pass_loop_ = false;
}

bool SyncEngine::start_next_in_pass() {
    if (!can_transmit()) {
        log(LogLevel::info, "Sync pass interrupted: offline");
        pass_messages_.clear();
        pass_actions_.clear();
        return false;
    }

    auto then = [this] { continue_pass(); };

    while (!pass_messages_.empty()) {
        auto id = std::move(pass_messages_.front());
        pass_messages_.pop_front();
        auto item = store_.get_item(id);
        // Already sent, demoted, cleared, or picked up by a retry timer in the meantime.
        if (!item || item->status != QueueStatus::pending)
            continue;
        send_item(*item, then);
        return true;
    }

    while (!pass_actions_.empty()) {
        auto id = std::move(pass_actions_.front());
        pass_actions_.pop_front();
        if (actions_in_flight_.count(id))
            continue;
        auto a = store_.get_action(id);
        if (!a)
            continue;
        execute_action(*a, then);
        return true;
    }

    return false;
}

void SyncEngine::finish_pass() {
    auto cutoff = clock_() - opts_.failed_message_ttl;
    try {
        if (auto pruned = store_.prune_failed(cutoff); pruned > 0)
            log(LogLevel::info,
                "Pruned " + std::to_string(pruned) + " expired failed message(s)");
    } catch (const std::exception& e) {
        log(LogLevel::error, "Failed to prune expired failed messages: "s + e.what());
    }

    sync_in_progress_ = false;
    log(LogLevel::debug, "Sync pass finished");
    publish(SyncEvent::Type::sync_finished);
}

void SyncEngine::send_item(const QueueItem& item, std::function<void()> then) {
    retries_.cancel(message_key(item.id));

    // Callers have already checked that the item is queued; it can only be missing here when the
    // store is unavailable, in which case the message is still worth sending.
    try {
        if (!store_.update_item(item.id, [](QueueItem& i) { i.status = QueueStatus::sending; }))
            log(LogLevel::debug, "Message " + item.id + " is not in the store; sending anyway");
    } catch (const std::exception& e) {
        log(LogLevel::error,
            "Failed to mark message " + item.id + " as sending; sending anyway: " + e.what());
    }

    auto on_response = guarded(
            [this, id = item.id](bool success, int16_t status_code, const std::string& response) {
                handle_send_result(id, success, status_code, response);
            },
            std::move(then));

    if (!send_) {
        log(LogLevel::warning, "No send hook installed; cannot deliver message " + item.id);
        on_response(false, 0, "No transport configured");
        return;
    }

    auto sending = item;
    sending.status = QueueStatus::sending;
    send_(sending, std::move(on_response));
}

void SyncEngine::retry_message(const std::string& id) {
    if (!can_transmit())
        return;
    std::optional<QueueItem> item;
    try {
        item = store_.get_item(id);
    } catch (const std::exception& e) {
        // Still pending in the store, so the next sync pass picks it up.
        log(LogLevel::error, "Retry of message " + id + " skipped: " + e.what());
        return;
    }
    if (!item || item->status != QueueStatus::pending)
        return;
    log(LogLevel::debug,
        "Retrying message " + id + " (attempt " + std::to_string(item->retry_count + 1) + ")");
    send_item(*item, nullptr);
}

void SyncEngine::handle_send_result(
        const std::string& id, bool success, int16_t status_code, const std::string& response) {
    auto item = store_.get_item(id);
    if (!item) {
        log(LogLevel::debug, "Dropping send result for message " + id + " no longer queued");
        return;
    }

    if (success) {
        store_.delete_item(id);
        retries_.cancel(message_key(id));
        auto pending = count_pending(item->conversation_id);
        record_delivery_state(item->conversation_id, pending, std::nullopt, true);
        log(LogLevel::debug, "Delivered message " + id);
        publish(SyncEvent::Type::sent, item->conversation_id, id, pending);
        return;
    }

    handle_send_failure(
            *item, failure_reason(status_code, response), is_permanent_failure(status_code));
}

void SyncEngine::handle_send_failure(
        const QueueItem& item, const std::string& reason, bool permanent) {
    int attempts = item.retry_count + 1;

    if (permanent || attempts >= opts_.max_message_retries) {
        log(LogLevel::warning,
            "Message " + item.id + " failed permanently after " + std::to_string(attempts) +
                    " attempt(s): " + reason);
        demote(item, reason, attempts);
        return;
    }

    store_.update_item(item.id, [attempts](QueueItem& i) {
        i.retry_count = attempts;
        i.status = QueueStatus::pending;
    });

    auto delay = opts_.retry_delay(attempts);
    retries_.schedule(message_key(item.id), delay, [this, id = item.id] { retry_message(id); });
    log(LogLevel::debug,
        "Message " + item.id + " failed (" + reason + "); retry " + std::to_string(attempts) +
                " in " + std::to_string(delay.count()) + "ms");
    publish(SyncEvent::Type::retry_scheduled,
            item.conversation_id,
            item.id,
            count_pending(item.conversation_id),
            reason);
}

void SyncEngine::demote(const QueueItem& item, const std::string& reason, int attempts) {
    retries_.cancel(message_key(item.id));

    auto now = clock_();
    FailedMessage failed;
    failed.id = random::unique_id(now);
    failed.original_message_id = item.id;
    failed.conversation_id = item.conversation_id;
    failed.content = item.content;
    failed.content_type = item.content_type;
    failed.original_timestamp = item.timestamp;
    failed.failure_reason = reason;
    failed.timestamp = now;
    failed.retry_count = attempts;

    if (!store_.move_to_failed(item.id, failed))
        return;

    auto pending = count_pending(item.conversation_id);
    record_delivery_state(item.conversation_id, pending, reason, false);
    publish(SyncEvent::Type::failed, item.conversation_id, item.id, pending, reason);
}

void SyncEngine::execute_action(const OfflineAction& a, std::function<void()> then) {
    retries_.cancel(action_key(a.id));
    actions_in_flight_.insert(a.id);

    auto on_response = guarded(
            [this, id = a.id](bool success, int16_t status_code, const std::string& response) {
                actions_in_flight_.erase(id);
                handle_action_result(id, success, status_code, response);
            },
            std::move(then));

    std::visit(
            overloaded{
                    [&](const action::mark_read& m) {
                        if (!mark_read_)
                            return on_response(false, 0, "No mark_read handler installed");
                        mark_read_(m, std::move(on_response));
                    },
                    [&](const action::delete_message& d) {
                        if (!delete_message_)
                            return on_response(false, 0, "No delete_message handler installed");
                        delete_message_(d, std::move(on_response));
                    },
                    [&](const action::leave_conversation& l) {
                        if (!leave_conversation_)
                            return on_response(
                                    false, 0, "No leave_conversation handler installed");
                        leave_conversation_(l, std::move(on_response));
                    },
                    [&](const action::unknown& u) {
                        log(LogLevel::warning, "Unknown offline action type: " + u.type);
                        on_response(false, 0, "Unknown action type " + u.type);
                    }},
            a.action);
}

void SyncEngine::retry_action(const std::string& id) {
    if (!can_transmit() || actions_in_flight_.count(id))
        return;
    std::optional<OfflineAction> a;
    try {
        a = store_.get_action(id);
    } catch (const std::exception& e) {
        log(LogLevel::error, "Retry of offline action " + id + " skipped: " + e.what());
        return;
    }
    if (!a)
        return;
    log(LogLevel::debug,
        "Retrying offline action " + id + " (attempt " + std::to_string(a->retry_count + 1) +
                ")");
    execute_action(*a, nullptr);
}

void SyncEngine::handle_action_result(
        const std::string& id, bool success, int16_t status_code, const std::string& response) {
    auto a = store_.get_action(id);
    if (!a)
        return;

    if (success) {
        store_.delete_action(id);
        retries_.cancel(action_key(id));
        log(LogLevel::debug, "Executed offline action " + id);
        return;
    }

    auto reason = failure_reason(status_code, response);
    int attempts = a->retry_count + 1;
    if (is_permanent_failure(status_code) || attempts >= a->max_retries) {
        store_.delete_action(id);
        retries_.cancel(action_key(id));
        log(LogLevel::error,
            "Offline action " + id + " (" + std::string{action::type_name(a->action)} +
                    ") failed permanently: " + reason);
        publish(SyncEvent::Type::action_failed, "", id, 0, reason);
        return;
    }

    store_.update_action(id, [attempts](OfflineAction& x) { x.retry_count = attempts; });
    retries_.schedule(
            action_key(id), opts_.retry_delay(attempts), [this, id] { retry_action(id); });
    log(LogLevel::debug, "Offline action " + id + " failed (" + reason + "); will retry");
}

bool SyncEngine::retry_failed_message(std::string_view failed_id) {
    auto failed = store_.get_failed(failed_id);
    if (!failed)
        return false;

    QueueItem item;
    item.timestamp = clock_();
    item.id = random::unique_id(item.timestamp);
    item.conversation_id = failed->conversation_id;
    item.content = failed->content;
    item.content_type = failed->content_type;
    item.retry_count = 0;
    item.status = QueueStatus::pending;

    if (!store_.requeue_failed(failed_id, item))
        return false;

    auto pending = count_pending(item.conversation_id);
    record_delivery_state(item.conversation_id, pending, std::nullopt, false);
    log(LogLevel::info, "Requeued failed message "s.append(failed_id) + " as " + item.id);
    publish(SyncEvent::Type::queued, item.conversation_id, item.id, pending);

    if (can_transmit())
        send_item(item, nullptr);
    return true;
}

QueueStats SyncEngine::get_queue_stats() {
    QueueStats stats;
    stats.pending = store_.count_items(QueueStatus::pending);
    stats.sending = store_.count_items(QueueStatus::sending);
    stats.failed = store_.count_failed();
    stats.offline_actions = store_.count_actions();
    return stats;
}

std::vector<QueueItem> SyncEngine::get_pending_messages(std::string_view conversation_id) {
    return store_.items_by_conversation(conversation_id);
}

std::vector<FailedMessage> SyncEngine::get_failed_messages() {
    return store_.all_failed();
}

std::optional<SyncStatus> SyncEngine::get_sync_status(std::string_view conversation_id) {
    return store_.get_status(conversation_id);
}

NetworkStatus SyncEngine::get_network_status() const {
    return {online_, sync_in_progress_, last_sync_attempt_};
}

void SyncEngine::clear_all_queues() {
    retries_.cancel_all();
    pass_messages_.clear();
    pass_actions_.clear();

    store_.clear_items();
    store_.clear_actions();
    store_.clear_failed();
    store_.clear_statuses();
    log(LogLevel::info, "Cleared all queues");
}

}  // namespace courier
