#include <catch2/catch_test_macros.hpp>
#include <filesystem>

#include "courier/queue_store.hpp"
#include "courier/random.hpp"
#include "courier/sqlite_store.hpp"
#include "utils.hpp"

using namespace courier;

namespace {

QueueItem make_item(
        std::string id,
        std::string conv,
        courier::sys_ms ts,
        QueueStatus status = QueueStatus::pending) {
    QueueItem item;
    item.id = std::move(id);
    item.conversation_id = std::move(conv);
    item.content = "content of " + item.id;
    item.timestamp = ts;
    item.status = status;
    return item;
}

std::vector<std::string> ids(const std::vector<QueueItem>& items) {
    std::vector<std::string> out;
    for (auto& i : items)
        out.push_back(i.id);
    return out;
}

void check_queue_items(QueueStore& store) {
    fake_clock clock;
    auto t0 = clock.now;

    auto b = make_item("b", "conv1", t0);
    b.content_type = ContentType::image;
    b.attachments = {"upload-1", "upload-2"};
    b.content = std::string{"\0binary\xff", 8};
    store.put_item(make_item("z", "conv1", t0 - 1s));
    store.put_item(b);
    store.put_item(make_item("a", "conv1", t0));  // same timestamp as b, inserted later
    store.put_item(make_item("c", "conv2", t0 + 1s, QueueStatus::sending));

    CHECK(ids(store.all_items()) == std::vector<std::string>{"z", "b", "a", "c"});
    CHECK(ids(store.items_by_status(QueueStatus::pending)) == std::vector<std::string>{"z", "b", "a"});
    CHECK(ids(store.items_by_status(QueueStatus::sending)) == std::vector<std::string>{"c"});
    CHECK(ids(store.items_by_conversation("conv1")) == std::vector<std::string>{"z", "b", "a"});
    CHECK(store.items_by_conversation("nope").empty());
    CHECK(store.count_items(QueueStatus::pending) == 3);
    CHECK(store.count_items(QueueStatus::sending) == 1);

    auto got = store.get_item("b");
    REQUIRE(got);
    CHECK(got->conversation_id == "conv1");
    CHECK(got->content == b.content);
    CHECK(got->content_type == ContentType::image);
    CHECK(got->timestamp == t0);
    CHECK(got->attachments == b.attachments);
    CHECK_FALSE(store.get_item("missing"));

    CHECK(store.update_item("b", [](QueueItem& i) {
        i.status = QueueStatus::sending;
        i.retry_count = 2;
    }));
    CHECK_FALSE(store.update_item("missing", [](QueueItem&) {}));
    got = store.get_item("b");
    CHECK(got->status == QueueStatus::sending);
    CHECK(got->retry_count == 2);
    // Updating keeps the item's place in the queue
    CHECK(ids(store.all_items()) == std::vector<std::string>{"z", "b", "a", "c"});

    store.delete_item("z");
    store.delete_item("missing");
    CHECK(ids(store.all_items()) == std::vector<std::string>{"b", "a", "c"});

    store.clear_items();
    CHECK(store.all_items().empty());
}

void check_offline_actions(QueueStore& store) {
    fake_clock clock;

    OfflineAction read{"a1", action::mark_read{"conv1"}, clock.now};
    OfflineAction del{"a2", action::delete_message{"m1"}, clock.now + 1ms, 0, 5};
    OfflineAction leave{"a3", action::leave_conversation{"conv2"}, clock.now + 2ms};
    store.put_action(read);
    store.put_action(del);
    store.put_action(leave);

    auto all = store.all_actions();
    REQUIRE(all.size() == 3);
    CHECK(all[0].id == "a1");
    CHECK(std::get<action::mark_read>(all[0].action).conversation_id == "conv1");
    CHECK(std::get<action::delete_message>(all[1].action).message_id == "m1");
    CHECK(all[1].max_retries == 5);
    CHECK(std::holds_alternative<action::leave_conversation>(all[2].action));
    CHECK(store.count_actions() == 3);

    CHECK(store.update_action("a1", [](OfflineAction& a) { a.retry_count = 1; }));
    CHECK(store.get_action("a1")->retry_count == 1);
    CHECK_FALSE(store.update_action("nope", [](OfflineAction&) {}));

    store.delete_action("a2");
    CHECK_FALSE(store.get_action("a2"));
    CHECK(store.count_actions() == 2);

    store.clear_actions();
    CHECK(store.count_actions() == 0);
}

void check_failed_and_statuses(QueueStore& store) {
    fake_clock clock;

    store.put_item(make_item("m1", "conv1", clock.now));
    FailedMessage f;
    f.id = "f1";
    f.original_message_id = "m1";
    f.conversation_id = "conv1";
    f.content = "content of m1";
    f.original_timestamp = clock.now;
    f.failure_reason = "HTTP 400";
    f.timestamp = clock.now + 10s;
    f.retry_count = 1;

    CHECK(store.move_to_failed("m1", f));
    CHECK_FALSE(store.get_item("m1"));
    CHECK_FALSE(store.move_to_failed("m1", f));
    auto got = store.get_failed("f1");
    REQUIRE(got);
    CHECK(got->failure_reason == "HTTP 400");
    CHECK(got->original_message_id == "m1");
    CHECK(got->timestamp == clock.now + 10s);
    CHECK(store.count_failed() == 1);

    auto requeued = make_item("m2", "conv1", clock.now + 20s);
    CHECK(store.requeue_failed("f1", requeued));
    CHECK_FALSE(store.requeue_failed("f1", requeued));
    CHECK(store.count_failed() == 0);
    CHECK(store.get_item("m2"));

    f.id = "old";
    f.timestamp = clock.now;
    store.put_failed(f);
    f.id = "new";
    f.timestamp = clock.now + 1h;
    store.put_failed(f);
    CHECK(store.prune_failed(clock.now) == 1);
    CHECK(store.all_failed().size() == 1);
    CHECK(store.all_failed()[0].id == "new");
    store.delete_failed("new");
    CHECK(store.count_failed() == 0);

    CHECK_FALSE(store.get_status("conv1"));
    auto s = store.update_status("conv1", [&](SyncStatus& x) {
        x.status = SyncState::error;
        x.error_message = "boom";
        x.pending_messages = 3;
        x.last_sync_time = clock.now;
    });
    CHECK(s.conversation_id == "conv1");
    CHECK(s.progress == 0);
    auto stored = store.get_status("conv1");
    REQUIRE(stored);
    CHECK(stored->status == SyncState::error);
    CHECK(stored->error_message == "boom");
    CHECK(stored->pending_messages == 3);
    CHECK(stored->last_sync_time == clock.now);

    s = store.update_status("conv1", [](SyncStatus& x) { x.error_message.reset(); });
    CHECK(s.status == SyncState::error);
    CHECK_FALSE(store.get_status("conv1")->error_message);

    SyncStatus other;
    other.conversation_id = "conv2";
    other.status = SyncState::synced;
    store.put_status(other);
    CHECK(store.all_statuses().size() == 2);
    store.delete_status("conv2");
    CHECK(store.all_statuses().size() == 1);
    store.clear_statuses();
    CHECK(store.all_statuses().empty());
    store.clear_items();
}

}  // namespace

TEST_CASE("Enum names", "[queue][enums]") {
    CHECK(to_string(ContentType::post_share) == "post_share");
    CHECK(content_type_from_string("image") == ContentType::image);
    CHECK_THROWS_AS(content_type_from_string("video"), std::invalid_argument);
    CHECK(to_string(QueueStatus::sending) == "sending");
    CHECK(queue_status_from_string("pending") == QueueStatus::pending);
    CHECK(to_string(SyncState::offline) == "offline");
    CHECK(sync_state_from_string("synced") == SyncState::synced);
    CHECK_THROWS_AS(sync_state_from_string("sent"), std::invalid_argument);
}

TEST_CASE("Offline action payloads", "[queue][actions]") {
    action::any a = action::mark_read{"conv1"};
    CHECK(action::type_name(a) == "mark_read");
    CHECK(action::data_json(a) == R"({"conversationId":"conv1"})");

    a = action::delete_message{"m1"};
    CHECK(action::type_name(a) == "delete_message");
    CHECK(action::data_json(a) == R"({"messageId":"m1"})");

    auto p = action::parse("leave_conversation", R"({"conversationId":"c9"})");
    CHECK(std::get<action::leave_conversation>(p).conversation_id == "c9");

    auto u = action::parse("archive", R"({"x":1})");
    REQUIRE(std::holds_alternative<action::unknown>(u));
    CHECK(action::type_name(u) == "archive");
    CHECK(action::data_json(u) == R"({"x":1})");

    CHECK_THROWS_AS(action::parse("mark_read", "{}"), std::invalid_argument);
    CHECK_THROWS_AS(action::parse("mark_read", "[1]"), std::invalid_argument);
}

TEST_CASE("Memory queue store", "[queue][memory]") {
    MemoryQueueStore store;
    check_queue_items(store);
    check_offline_actions(store);
    check_failed_and_statuses(store);
}

TEST_CASE("SQLite queue store", "[queue][sqlite]") {
    SqliteDatabase db{":memory:"};
    REQUIRE(db.available());
    check_queue_items(db);
    check_offline_actions(db);
    check_failed_and_statuses(db);
}

TEST_CASE("SQLite store persists across reopen", "[queue][sqlite][persist]") {
    auto path = std::filesystem::temp_directory_path() /
                ("courier-test-" + to_hex(random::random(8)) + ".db");
    fake_clock clock;

    {
        SqliteDatabase db{path.string()};
        REQUIRE(db.available());
        db.put_item(make_item("m1", "conv1", clock.now));
        db.put_action({"a1", action::parse("archive", R"({"x":1})"), clock.now});
        db.put_key_pair({"alice", "pub"_bytes, "priv"_bytes, clock.now});
        db.put_public_key({"bob", "Ym9i", clock.now});
        db.update_status("conv1", [](SyncStatus& s) { s.status = SyncState::syncing; });
    }

    {
        SqliteDatabase db{path.string()};
        REQUIRE(db.available());
        CHECK(db.get_item("m1"));
        auto a = db.get_action("a1");
        REQUIRE(a);
        CHECK(action::type_name(a->action) == "archive");
        auto kp = db.get_key_pair("alice");
        REQUIRE(kp);
        CHECK(kp->private_key == "priv"_bytes);
        CHECK(kp->created_at == clock.now);
        CHECK(db.get_public_key("bob")->public_key == "Ym9i");
        CHECK(db.get_status("conv1")->status == SyncState::syncing);

        db.clear_keys();
        CHECK_FALSE(db.get_key_pair("alice"));
        CHECK_FALSE(db.get_public_key("bob"));
    }

    std::filesystem::remove(path);
}

TEST_CASE("Unavailable SQLite store", "[queue][sqlite][degraded]") {
    captured_logs logs;
    SqliteDatabase db{"/nonexistent-dir/queue.db", logs.fn()};
    CHECK_FALSE(db.available());
    CHECK(logs.count(LogLevel::warning) == 1);

    fake_clock clock;
    CHECK_NOTHROW(db.put_item(make_item("m1", "conv1", clock.now)));
    CHECK_FALSE(db.get_item("m1"));
    CHECK(db.all_items().empty());
    CHECK(db.count_items(QueueStatus::pending) == 0);
    CHECK_FALSE(db.update_item("m1", [](QueueItem&) {}));

    auto s = db.update_status("conv1", [](SyncStatus& x) { x.pending_messages = 2; });
    CHECK(s.conversation_id == "conv1");
    CHECK(s.pending_messages == 2);
    CHECK_FALSE(db.get_status("conv1"));
    CHECK(logs.count(LogLevel::warning) > 1);
}
