#include "courier/sync_status.hpp"

#include <algorithm>

#include "courier/sync_engine.hpp"

using namespace std::literals;

namespace courier {

SyncStatusMonitor::SyncStatusMonitor(
        QueueStore& store, Scheduler& scheduler, MonitorOptions opts, clock_fn clock) :
        store_{store}, scheduler_{scheduler}, opts_{std::move(opts)}, clock_{std::move(clock)} {}

SyncStatusMonitor::~SyncStatusMonitor() {
    shutdown();
}

void SyncStatusMonitor::init() {
    if (!health_timer_)
        arm_health_check();
}

void SyncStatusMonitor::shutdown() {
    if (health_timer_) {
        scheduler_.cancel(*health_timer_);
        health_timer_.reset();
    }
    engine_sub_.unsubscribe();
    if (retry_from_engine_) {
        retry_ = nullptr;
        retry_from_engine_ = false;
    }
}

void SyncStatusMonitor::arm_health_check() {
    health_timer_ = scheduler_.schedule(opts_.health_check_interval, [this] {
        health_timer_.reset();
        try {
            check_health();
        } catch (const std::exception& e) {
            log(LogLevel::error, "Sync health check failed: "s + e.what());
        }
        arm_health_check();
    });
}

void SyncStatusMonitor::observe(SyncEngine& engine) {
    engine_sub_ = engine.subscribe([this](const SyncEvent& ev) {
        try {
            handle_event(ev);
        } catch (const std::exception& e) {
            log(LogLevel::error, "Failed to update sync status: "s + e.what());
        }
    });
    on_retry([&engine](std::string_view) { engine.force_sync(); });
    retry_from_engine_ = true;
}

void SyncStatusMonitor::handle_event(const SyncEvent& ev) {
    using Type = SyncEvent::Type;
    switch (ev.type) {
        case Type::queued:
            if (ev.online)
                set_syncing(ev.conversation_id, ev.pending);
            else
                mark_offline(ev.conversation_id);
            break;

        case Type::retry_scheduled: set_syncing(ev.conversation_id, ev.pending); break;

        case Type::sent:
            if (ev.pending == 0)
                mark_synced(ev.conversation_id);
            else
                set_syncing(ev.conversation_id, ev.pending);
            break;

        case Type::failed:
            mark_error(ev.conversation_id, ev.error.value_or("Message delivery failed"));
            break;

        case Type::offline:
            for (auto& s : store_.all_statuses())
                if (s.status == SyncState::syncing)
                    mark_offline(s.conversation_id);
            break;

        case Type::online:
            for (auto& s : store_.all_statuses())
                if (s.status == SyncState::offline && s.pending_messages > 0)
                    set_syncing(s.conversation_id, s.pending_messages);
            break;

        case Type::action_failed:
        case Type::sync_started:
        case Type::sync_finished: break;
    }
}

SyncStatus SyncStatusMonitor::transition(
        std::string_view conversation_id, const mutator<SyncStatus>& fn) {
    auto s = store_.update_status(conversation_id, fn);
    log(LogLevel::debug,
        "Conversation " + s.conversation_id + " is now " + std::string{to_string(s.status)});
    updates_.publish(s);
    return s;
}

SyncStatus SyncStatusMonitor::set_syncing(std::string_view conversation_id, int pending_count) {
    auto now = clock_();
    return transition(conversation_id, [&](SyncStatus& s) {
        if (s.status != SyncState::syncing)
            s.progress = 0;
        s.status = SyncState::syncing;
        s.pending_messages = std::max(pending_count, 0);
        s.error_message.reset();
        s.last_sync_time = now;
    });
}

SyncStatus SyncStatusMonitor::update_progress(std::string_view conversation_id, int percent) {
    auto now = clock_();
    return transition(conversation_id, [&](SyncStatus& s) {
        s.progress = std::clamp(percent, 0, 100);
        s.last_sync_time = now;
    });
}

SyncStatus SyncStatusMonitor::mark_synced(std::string_view conversation_id) {
    auto now = clock_();
    return transition(conversation_id, [&](SyncStatus& s) {
        s.status = SyncState::synced;
        s.progress = 100;
        s.pending_messages = 0;
        s.error_message.reset();
        s.retry_count = 0;
        s.last_sync_time = now;
    });
}

SyncStatus SyncStatusMonitor::mark_error(
        std::string_view conversation_id, std::string_view message) {
    log(LogLevel::warning,
        "Sync error in conversation "s.append(conversation_id) + ": "s.append(message));
    return transition(conversation_id, [&](SyncStatus& s) {
        s.status = SyncState::error;
        s.error_message = std::string{message};
        s.retry_count++;
    });
}

SyncStatus SyncStatusMonitor::mark_offline(std::string_view conversation_id) {
    return transition(
            conversation_id, [](SyncStatus& s) { s.status = SyncState::offline; });
}

std::optional<SyncStatus> SyncStatusMonitor::get_status(std::string_view conversation_id) {
    return store_.get_status(conversation_id);
}

std::vector<SyncStatus> SyncStatusMonitor::get_all_statuses() {
    return store_.all_statuses();
}

QueueHealth SyncStatusMonitor::get_queue_health() {
    QueueHealth health;
    for (auto& s : store_.all_statuses()) {
        health.total_pending += s.pending_messages;
        if (s.status == SyncState::error)
            health.failed_messages++;
        else if (s.status == SyncState::syncing)
            health.in_progress++;
        if (s.pending_messages > 0 &&
            (!health.oldest_pending || s.last_sync_time < *health.oldest_pending))
            health.oldest_pending = s.last_sync_time;
    }
    health.estimated_time_to_sync = health.total_pending * opts_.estimated_time_per_item;
    return health;
}

std::vector<std::string> SyncStatusMonitor::retry_failed_syncs() {
    std::vector<std::string> rearmed;
    auto now = clock_();
    for (auto& s : store_.all_statuses()) {
        if (s.status != SyncState::error || s.retry_count >= opts_.max_sync_retries)
            continue;
        transition(s.conversation_id, [now](SyncStatus& x) {
            x.status = SyncState::syncing;
            x.error_message.reset();
            x.last_sync_time = now;
        });
        rearmed.push_back(s.conversation_id);
    }

    if (!rearmed.empty())
        log(LogLevel::info, "Retrying " + std::to_string(rearmed.size()) + " failed sync(s)");
    if (retry_)
        for (auto& id : rearmed)
            retry_(id);
    return rearmed;
}

std::vector<std::string> SyncStatusMonitor::check_health() {
    std::vector<std::string> stalled;
    auto now = clock_();
    for (auto& s : store_.all_statuses()) {
        if (s.status == SyncState::syncing && now - s.last_sync_time > opts_.stall_timeout) {
            log(LogLevel::warning, "Sync stalled in conversation " + s.conversation_id);
            mark_error(s.conversation_id, STALLED_MESSAGE);
            stalled.push_back(s.conversation_id);
        }
    }
    return stalled;
}

}  // namespace courier
