#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "courier/sync_engine.hpp"
#include "courier/sync_status.hpp"
#include "utils.hpp"

using namespace courier;

TEST_CASE("Sync status transitions", "[status][transitions]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    SyncStatusMonitor monitor{store, timers, MonitorOptions{}, clock.fn()};

    std::vector<SyncStatus> updates;
    auto sub = monitor.subscribe([&](const SyncStatus& s) { updates.push_back(s); });

    CHECK_FALSE(monitor.get_status("conv1"));

    auto s = monitor.set_syncing("conv1", 3);
    CHECK(s.status == SyncState::syncing);
    CHECK(s.pending_messages == 3);
    CHECK(s.progress == 0);
    CHECK(s.last_sync_time == clock.now);

    CHECK(monitor.update_progress("conv1", 40).progress == 40);
    CHECK(monitor.update_progress("conv1", 150).progress == 100);
    CHECK(monitor.update_progress("conv1", -5).progress == 0);
    CHECK(monitor.get_status("conv1")->status == SyncState::syncing);

    s = monitor.mark_error("conv1", "boom");
    CHECK(s.status == SyncState::error);
    CHECK(s.error_message == "boom");
    CHECK(s.retry_count == 1);

    clock.advance(1s);
    s = monitor.mark_synced("conv1");
    CHECK(s.status == SyncState::synced);
    CHECK(s.progress == 100);
    CHECK(s.pending_messages == 0);
    CHECK(s.retry_count == 0);
    CHECK_FALSE(s.error_message);
    CHECK(s.last_sync_time == clock.now);

    s = monitor.mark_offline("conv1");
    CHECK(s.status == SyncState::offline);

    CHECK(updates.size() == 7);
    CHECK(updates.back().status == SyncState::offline);
    CHECK(monitor.get_all_statuses().size() == 1);
    CHECK(store.get_status("conv1")->status == SyncState::offline);
}

TEST_CASE("Stalled syncs are detected", "[status][health]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    captured_logs logs;
    SyncStatusMonitor monitor{store, timers, MonitorOptions{}, clock.fn()};
    monitor.logger = logs.fn();
    monitor.init();
    CHECK(timers.size() == 1);

    monitor.set_syncing("conv1", 2);
    monitor.set_syncing("conv2", 1);
    monitor.mark_synced("conv2");

    clock.advance(4min);
    timers.process();
    CHECK(monitor.get_status("conv1")->status == SyncState::syncing);

    clock.advance(2min);
    timers.process();
    auto s = monitor.get_status("conv1");
    CHECK(s->status == SyncState::error);
    CHECK(s->error_message == "Sync stalled (timeout)");
    CHECK(s->retry_count == 1);
    CHECK(monitor.get_status("conv2")->status == SyncState::synced);
    CHECK(logs.count(LogLevel::warning) >= 1);

    // The health check keeps running
    CHECK(timers.size() == 1);
    CHECK(timers.next_due() == clock.now + 5s);

    monitor.shutdown();
    CHECK(timers.empty());
}

TEST_CASE("Explicit health checks", "[status][health]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    MonitorOptions opts;
    opts.stall_timeout = 10s;
    SyncStatusMonitor monitor{store, timers, opts, clock.fn()};

    monitor.set_syncing("a", 1);
    clock.advance(5s);
    monitor.set_syncing("b", 1);
    clock.advance(6s);
    CHECK(monitor.check_health() == std::vector<std::string>{"a"});
    CHECK(monitor.check_health().empty());
}

TEST_CASE("Queue health", "[status][health]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    SyncStatusMonitor monitor{store, timers, MonitorOptions{}, clock.fn()};

    auto empty = monitor.get_queue_health();
    CHECK(empty.total_pending == 0);
    CHECK_FALSE(empty.oldest_pending);
    CHECK(empty.estimated_time_to_sync == 0ms);

    auto t0 = clock.now;
    monitor.set_syncing("conv1", 2);
    clock.advance(1s);
    monitor.set_syncing("conv2", 1);
    monitor.mark_error("conv2", "HTTP 500");
    monitor.set_syncing("conv3", 4);
    monitor.mark_synced("conv3");

    auto h = monitor.get_queue_health();
    CHECK(h.total_pending == 3);
    CHECK(h.failed_messages == 1);
    CHECK(h.in_progress == 1);
    CHECK(h.oldest_pending == t0);
    CHECK(h.estimated_time_to_sync == 3s);
}

TEST_CASE("Retrying failed syncs", "[status][retry]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    MonitorOptions opts;
    opts.max_sync_retries = 2;
    SyncStatusMonitor monitor{store, timers, opts, clock.fn()};

    std::vector<std::string> retried;
    monitor.on_retry([&](std::string_view id) { retried.emplace_back(id); });

    monitor.mark_error("conv1", "x");
    monitor.mark_error("conv2", "x");
    monitor.mark_error("conv2", "x");
    monitor.set_syncing("conv3", 1);

    clock.advance(1s);
    CHECK(monitor.retry_failed_syncs() == std::vector<std::string>{"conv1"});
    CHECK(retried == std::vector<std::string>{"conv1"});

    auto s = monitor.get_status("conv1");
    CHECK(s->status == SyncState::syncing);
    CHECK_FALSE(s->error_message);
    CHECK(s->retry_count == 1);
    CHECK(s->last_sync_time == clock.now);
    CHECK(monitor.get_status("conv2")->status == SyncState::error);

    CHECK(monitor.retry_failed_syncs().empty());
}

TEST_CASE("Monitor follows the sync engine", "[status][observe]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    fake_transport net;
    SyncEngine engine{store, timers, SyncOptions{}, clock.fn()};
    SyncStatusMonitor monitor{store, timers, MonitorOptions{}, clock.fn()};
    engine.on_send(net.hook());
    monitor.observe(engine);
    engine.init();
    monitor.init();

    engine.queue_message("conv1", "a");
    engine.queue_message("conv1", "b");
    auto s = monitor.get_status("conv1");
    REQUIRE(s);
    CHECK(s->status == SyncState::offline);
    CHECK(s->pending_messages == 2);

    engine.set_online(true);
    CHECK(monitor.get_status("conv1")->status == SyncState::syncing);
    REQUIRE(net.outstanding.size() == 1);

    net.respond(200);
    s = monitor.get_status("conv1");
    CHECK(s->status == SyncState::syncing);
    CHECK(s->pending_messages == 1);

    net.respond(200);
    s = monitor.get_status("conv1");
    CHECK(s->status == SyncState::synced);
    CHECK(s->progress == 100);
    CHECK(s->pending_messages == 0);

    SECTION("failures") {
        net.auto_status = 400;
        engine.queue_message("conv2", "bad");
        s = monitor.get_status("conv2");
        CHECK(s->status == SyncState::error);
        CHECK(s->error_message == "HTTP 400");
        CHECK(s->retry_count == 1);

        clock.advance(1s);
        CHECK(monitor.retry_failed_syncs() == std::vector<std::string>{"conv2"});
        // The retry hook asked the engine for a sync pass
        CHECK(engine.get_network_status().last_sync_attempt == clock.now);
    }

    SECTION("going offline") {
        engine.queue_message("conv3", "c");
        CHECK(monitor.get_status("conv3")->status == SyncState::syncing);
        engine.set_online(false);
        CHECK(monitor.get_status("conv3")->status == SyncState::offline);
        CHECK(monitor.get_status("conv1")->status == SyncState::synced);
    }

    SECTION("detaching") {
        monitor.shutdown();
        engine.queue_message("conv4", "d");
        CHECK(monitor.get_status("conv4")->status == SyncState::offline);
        CHECK(monitor.get_status("conv4")->pending_messages == 1);

        // Retrying no longer reaches the engine
        auto attempted = engine.get_network_status().last_sync_attempt;
        clock.advance(1s);
        monitor.mark_error("conv4", "x");
        CHECK(monitor.retry_failed_syncs() == std::vector<std::string>{"conv4"});
        CHECK(engine.get_network_status().last_sync_attempt == attempted);
    }
}

TEST_CASE("Monitor outlives an engine it stopped observing", "[status][observe]") {
    fake_clock clock;
    MemoryQueueStore store;
    TimerQueue timers{clock.fn()};
    SyncStatusMonitor monitor{store, timers, MonitorOptions{}, clock.fn()};

    auto engine = std::make_unique<SyncEngine>(store, timers, SyncOptions{}, clock.fn());
    engine->init();
    engine->set_online(true);
    monitor.observe(*engine);
    monitor.shutdown();
    engine.reset();

    monitor.mark_error("conv1", "boom");
    CHECK(monitor.retry_failed_syncs() == std::vector<std::string>{"conv1"});
    CHECK(monitor.get_status("conv1")->status == SyncState::syncing);

    SECTION("hooks installed directly are kept") {
        std::vector<std::string> retried;
        monitor.on_retry([&](std::string_view id) { retried.emplace_back(id); });
        monitor.shutdown();
        monitor.mark_error("conv1", "boom");
        CHECK(monitor.retry_failed_syncs() == std::vector<std::string>{"conv1"});
        CHECK(retried == std::vector<std::string>{"conv1"});
    }
}
