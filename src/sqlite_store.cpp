#include "courier/sqlite_store.hpp"

#include <sqlite3.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "courier/errors.hpp"
#include "courier/util.hpp"

using namespace std::literals;

namespace courier {

namespace {

    struct stmt_deleter {
        void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); }
    };

    storage_error sqlite_error(sqlite3* db, std::string_view what) {
        return storage_error{std::string{what} + ": " + sqlite3_errmsg(db)};
    }

    // Thin prepared-statement wrapper.  Parameters are bound in order with the `bind_*` calls.
    class statement {
        sqlite3* db_;
        std::unique_ptr<sqlite3_stmt, stmt_deleter> st_;
        int param_ = 0;

        void check_bind(int rc) {
            if (rc != SQLITE_OK)
                throw sqlite_error(db_, "Failed to bind statement parameter");
        }

      public:
        statement(sqlite3* db, const char* sql) : db_{db} {
            sqlite3_stmt* st = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK)
                throw sqlite_error(db_, "Failed to prepare statement");
            st_.reset(st);
        }

        statement& bind_text(std::string_view s) {
            check_bind(sqlite3_bind_text(
                    st_.get(), ++param_, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT));
            return *this;
        }
        statement& bind_blob(const void* data, size_t size) {
            check_bind(sqlite3_bind_blob(
                    st_.get(), ++param_, data, static_cast<int>(size), SQLITE_TRANSIENT));
            return *this;
        }
        statement& bind_blob(ustring_view b) { return bind_blob(b.data(), b.size()); }
        statement& bind_blob(std::string_view b) { return bind_blob(b.data(), b.size()); }
        statement& bind_int(int64_t v) {
            check_bind(sqlite3_bind_int64(st_.get(), ++param_, v));
            return *this;
        }
        statement& bind_time(sys_ms t) { return bind_int(epoch_ms(t)); }
        statement& bind_optional(const std::optional<std::string>& s) {
            if (s)
                return bind_text(*s);
            check_bind(sqlite3_bind_null(st_.get(), ++param_));
            return *this;
        }

        // Advances the statement; returns true while there is a row to read.
        bool step() {
            int rc = sqlite3_step(st_.get());
            if (rc == SQLITE_ROW)
                return true;
            if (rc == SQLITE_DONE)
                return false;
            throw sqlite_error(db_, "Failed to execute statement");
        }

        void run() {
            while (step()) {}
        }

        int changes() const { return sqlite3_changes(db_); }

        bool is_null(int col) const { return sqlite3_column_type(st_.get(), col) == SQLITE_NULL; }
        int64_t integer(int col) const { return sqlite3_column_int64(st_.get(), col); }
        int int32(int col) const { return sqlite3_column_int(st_.get(), col); }
        sys_ms time(int col) const { return from_epoch_ms(integer(col)); }
        std::string text(int col) const {
            auto* p = sqlite3_column_blob(st_.get(), col);
            auto n = sqlite3_column_bytes(st_.get(), col);
            return p ? std::string{static_cast<const char*>(p), static_cast<size_t>(n)}
                     : std::string{};
        }
        ustring blob(int col) const {
            auto* p = sqlite3_column_blob(st_.get(), col);
            auto n = sqlite3_column_bytes(st_.get(), col);
            return p ? ustring{static_cast<const unsigned char*>(p), static_cast<size_t>(n)}
                     : ustring{};
        }
    };

    // BEGIN IMMEDIATE ... COMMIT; rolls back unless `commit()` was reached.
    class transaction {
        sqlite3* db_;
        bool done_ = false;

      public:
        explicit transaction(sqlite3* db) : db_{db} {
            if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK)
                throw sqlite_error(db_, "Failed to begin transaction");
        }
        transaction(const transaction&) = delete;
        transaction& operator=(const transaction&) = delete;

        void commit() {
            if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
                throw sqlite_error(db_, "Failed to commit transaction");
            done_ = true;
        }

        ~transaction() {
            if (!done_)
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    };

    // How long a statement waits on a lock held by another connection before failing.
    constexpr int BUSY_TIMEOUT_MS = 5000;

    constexpr auto SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS key_pairs (
    user_id TEXT PRIMARY KEY,
    public_key BLOB NOT NULL,
    private_key BLOB NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS public_keys (
    user_id TEXT PRIMARY KEY,
    public_key TEXT NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS message_queue (
    id TEXT PRIMARY KEY,
    conversation_id TEXT NOT NULL,
    content BLOB NOT NULL,
    content_type TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    retry_count INTEGER NOT NULL DEFAULT 0,
    status TEXT NOT NULL,
    attachments TEXT NOT NULL DEFAULT '[]'
);
CREATE INDEX IF NOT EXISTS message_queue_conversation_idx ON message_queue(conversation_id);
CREATE INDEX IF NOT EXISTS message_queue_status_idx ON message_queue(status);
CREATE INDEX IF NOT EXISTS message_queue_timestamp_idx ON message_queue(timestamp);

CREATE TABLE IF NOT EXISTS offline_actions (
    id TEXT PRIMARY KEY,
    type TEXT NOT NULL,
    data TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    retry_count INTEGER NOT NULL DEFAULT 0,
    max_retries INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS offline_actions_timestamp_idx ON offline_actions(timestamp);

CREATE TABLE IF NOT EXISTS failed_messages (
    id TEXT PRIMARY KEY,
    original_message_id TEXT NOT NULL,
    conversation_id TEXT NOT NULL,
    content BLOB NOT NULL,
    content_type TEXT NOT NULL,
    original_timestamp INTEGER NOT NULL,
    failure_reason TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    retry_count INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS failed_messages_conversation_idx ON failed_messages(conversation_id);
CREATE INDEX IF NOT EXISTS failed_messages_timestamp_idx ON failed_messages(timestamp);

CREATE TABLE IF NOT EXISTS sync_status (
    conversation_id TEXT PRIMARY KEY,
    status TEXT NOT NULL,
    progress INTEGER NOT NULL,
    pending_messages INTEGER NOT NULL,
    last_sync_time INTEGER NOT NULL,
    error_message TEXT,
    retry_count INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS sync_status_status_idx ON sync_status(status);
)SQL";

    constexpr auto ITEM_SELECT =
            "SELECT id, conversation_id, content, content_type, timestamp, retry_count, status, "
            "attachments FROM message_queue ";

    QueueItem read_item(const statement& st) {
        QueueItem item;
        item.id = st.text(0);
        item.conversation_id = st.text(1);
        item.content = st.text(2);
        item.content_type = content_type_from_string(st.text(3));
        item.timestamp = st.time(4);
        item.retry_count = st.int32(5);
        item.status = queue_status_from_string(st.text(6));
        auto attachments = nlohmann::json::parse(st.text(7), nullptr, false);
        if (attachments.is_array())
            for (const auto& a : attachments)
                if (a.is_string())
                    item.attachments.push_back(a.get<std::string>());
        return item;
    }

    constexpr auto ACTION_SELECT =
            "SELECT id, type, data, timestamp, retry_count, max_retries FROM offline_actions ";

    OfflineAction read_action(const statement& st) {
        OfflineAction a;
        a.id = st.text(0);
        a.action = action::parse(st.text(1), st.text(2));
        a.timestamp = st.time(3);
        a.retry_count = st.int32(4);
        a.max_retries = st.int32(5);
        return a;
    }

    constexpr auto FAILED_SELECT =
            "SELECT id, original_message_id, conversation_id, content, content_type, "
            "original_timestamp, failure_reason, timestamp, retry_count FROM failed_messages ";

    FailedMessage read_failed(const statement& st) {
        FailedMessage f;
        f.id = st.text(0);
        f.original_message_id = st.text(1);
        f.conversation_id = st.text(2);
        f.content = st.text(3);
        f.content_type = content_type_from_string(st.text(4));
        f.original_timestamp = st.time(5);
        f.failure_reason = st.text(6);
        f.timestamp = st.time(7);
        f.retry_count = st.int32(8);
        return f;
    }

    constexpr auto STATUS_SELECT =
            "SELECT conversation_id, status, progress, pending_messages, last_sync_time, "
            "error_message, retry_count FROM sync_status ";

    SyncStatus read_status(const statement& st) {
        SyncStatus s;
        s.conversation_id = st.text(0);
        s.status = sync_state_from_string(st.text(1));
        s.progress = st.int32(2);
        s.pending_messages = st.int32(3);
        s.last_sync_time = st.time(4);
        if (!st.is_null(5))
            s.error_message = st.text(5);
        s.retry_count = st.int32(6);
        return s;
    }

    size_t count(sqlite3* db, const char* sql) {
        statement st{db, sql};
        return st.step() ? static_cast<size_t>(st.integer(0)) : 0;
    }

    void write_item(sqlite3* db, const QueueItem& item) {
        nlohmann::json attachments = item.attachments;
        statement{db,
                  "INSERT INTO message_queue (id, conversation_id, content, content_type, "
                  "timestamp, retry_count, status, attachments) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                  "ON CONFLICT(id) DO UPDATE SET conversation_id = excluded.conversation_id, "
                  "content = excluded.content, content_type = excluded.content_type, "
                  "timestamp = excluded.timestamp, retry_count = excluded.retry_count, "
                  "status = excluded.status, attachments = excluded.attachments"}
                .bind_text(item.id)
                .bind_text(item.conversation_id)
                .bind_blob(std::string_view{item.content})
                .bind_text(to_string(item.content_type))
                .bind_time(item.timestamp)
                .bind_int(item.retry_count)
                .bind_text(to_string(item.status))
                .bind_text(attachments.dump())
                .run();
    }

    void write_action(sqlite3* db, const OfflineAction& a) {
        statement{db,
                  "INSERT INTO offline_actions (id, type, data, timestamp, retry_count, "
                  "max_retries) VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT(id) DO UPDATE SET "
                  "type = excluded.type, data = excluded.data, timestamp = excluded.timestamp, "
                  "retry_count = excluded.retry_count, max_retries = excluded.max_retries"}
                .bind_text(a.id)
                .bind_text(action::type_name(a.action))
                .bind_text(action::data_json(a.action))
                .bind_time(a.timestamp)
                .bind_int(a.retry_count)
                .bind_int(a.max_retries)
                .run();
    }

    void write_failed(sqlite3* db, const FailedMessage& f) {
        statement{db,
                  "INSERT OR REPLACE INTO failed_messages (id, original_message_id, "
                  "conversation_id, content, content_type, original_timestamp, failure_reason, "
                  "timestamp, retry_count) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"}
                .bind_text(f.id)
                .bind_text(f.original_message_id)
                .bind_text(f.conversation_id)
                .bind_blob(std::string_view{f.content})
                .bind_text(to_string(f.content_type))
                .bind_time(f.original_timestamp)
                .bind_text(f.failure_reason)
                .bind_time(f.timestamp)
                .bind_int(f.retry_count)
                .run();
    }

    void write_status(sqlite3* db, const SyncStatus& s) {
        statement{db,
                  "INSERT OR REPLACE INTO sync_status (conversation_id, status, progress, "
                  "pending_messages, last_sync_time, error_message, retry_count) "
                  "VALUES (?, ?, ?, ?, ?, ?, ?)"}
                .bind_text(s.conversation_id)
                .bind_text(to_string(s.status))
                .bind_int(s.progress)
                .bind_int(s.pending_messages)
                .bind_time(s.last_sync_time)
                .bind_optional(s.error_message)
                .bind_int(s.retry_count)
                .run();
    }

    void delete_by_key(sqlite3* db, const char* sql, std::string_view key) {
        statement{db, sql}.bind_text(key).run();
    }

}  // namespace

SqliteDatabase::SqliteDatabase(const std::string& path, logger_fn logger_) :
        logger{std::move(logger_)} {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
            path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        log(LogLevel::warning,
            "Unable to open database " + path + ": " +
                    (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)) +
                    "; continuing without persistent storage");
        sqlite3_close(db);
        return;
    }
    db_ = db;
    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

    try {
        create_schema();
    } catch (const storage_error& e) {
        log(LogLevel::warning,
            "Unable to initialize database " + path + ": " + e.what() +
                    "; continuing without persistent storage");
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    log(LogLevel::debug, "Opened database " + path);
}

SqliteDatabase::~SqliteDatabase() {
    if (db_)
        sqlite3_close(db_);
}

bool SqliteDatabase::unavailable(std::string_view what) const {
    if (db_)
        return false;
    log(LogLevel::warning, "Database unavailable; skipping "s.append(what));
    return true;
}

void SqliteDatabase::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw storage_error{"SQL execution failed: " + msg};
    }
}

void SqliteDatabase::create_schema() {
    exec(SCHEMA);
}

// KeyStore

std::optional<KeyPair> SqliteDatabase::get_key_pair(std::string_view user_id) {
    if (unavailable("get_key_pair"))
        return std::nullopt;
    statement st{
            db_,
            "SELECT user_id, public_key, private_key, created_at FROM key_pairs WHERE user_id = ?"};
    st.bind_text(user_id);
    if (!st.step())
        return std::nullopt;
    return KeyPair{st.text(0), st.blob(1), st.blob(2), st.time(3)};
}

void SqliteDatabase::put_key_pair(const KeyPair& kp) {
    if (unavailable("put_key_pair"))
        return;
    statement{db_,
              "INSERT OR REPLACE INTO key_pairs (user_id, public_key, private_key, created_at) "
              "VALUES (?, ?, ?, ?)"}
            .bind_text(kp.user_id)
            .bind_blob(kp.public_key)
            .bind_blob(kp.private_key)
            .bind_time(kp.created_at)
            .run();
}

void SqliteDatabase::delete_key_pair(std::string_view user_id) {
    if (unavailable("delete_key_pair"))
        return;
    delete_by_key(db_, "DELETE FROM key_pairs WHERE user_id = ?", user_id);
}

std::optional<PublicKeyRecord> SqliteDatabase::get_public_key(std::string_view user_id) {
    if (unavailable("get_public_key"))
        return std::nullopt;
    statement st{db_, "SELECT user_id, public_key, created_at FROM public_keys WHERE user_id = ?"};
    st.bind_text(user_id);
    if (!st.step())
        return std::nullopt;
    return PublicKeyRecord{st.text(0), st.text(1), st.time(2)};
}

void SqliteDatabase::put_public_key(const PublicKeyRecord& rec) {
    if (unavailable("put_public_key"))
        return;
    statement{db_,
              "INSERT OR REPLACE INTO public_keys (user_id, public_key, created_at) "
              "VALUES (?, ?, ?)"}
            .bind_text(rec.user_id)
            .bind_text(rec.public_key)
            .bind_time(rec.created_at)
            .run();
}

void SqliteDatabase::delete_public_key(std::string_view user_id) {
    if (unavailable("delete_public_key"))
        return;
    delete_by_key(db_, "DELETE FROM public_keys WHERE user_id = ?", user_id);
}

void SqliteDatabase::clear_keys() {
    if (unavailable("clear_keys"))
        return;
    transaction tx{db_};
    exec("DELETE FROM key_pairs");
    exec("DELETE FROM public_keys");
    tx.commit();
}

// messageQueue

void SqliteDatabase::put_item(const QueueItem& item) {
    if (unavailable("put_item"))
        return;
    write_item(db_, item);
}

std::optional<QueueItem> SqliteDatabase::get_item(std::string_view id) {
    if (unavailable("get_item"))
        return std::nullopt;
    statement st{db_, (ITEM_SELECT + "WHERE id = ?"s).c_str()};
    st.bind_text(id);
    if (!st.step())
        return std::nullopt;
    return read_item(st);
}

std::vector<QueueItem> SqliteDatabase::all_items() {
    std::vector<QueueItem> out;
    if (unavailable("all_items"))
        return out;
    statement st{db_, (ITEM_SELECT + "ORDER BY timestamp, rowid"s).c_str()};
    while (st.step())
        out.push_back(read_item(st));
    return out;
}

std::vector<QueueItem> SqliteDatabase::items_by_status(QueueStatus status) {
    std::vector<QueueItem> out;
    if (unavailable("items_by_status"))
        return out;
    statement st{db_, (ITEM_SELECT + "WHERE status = ? ORDER BY timestamp, rowid"s).c_str()};
    st.bind_text(to_string(status));
    while (st.step())
        out.push_back(read_item(st));
    return out;
}

std::vector<QueueItem> SqliteDatabase::items_by_conversation(std::string_view conversation_id) {
    std::vector<QueueItem> out;
    if (unavailable("items_by_conversation"))
        return out;
    statement st{
            db_, (ITEM_SELECT + "WHERE conversation_id = ? ORDER BY timestamp, rowid"s).c_str()};
    st.bind_text(conversation_id);
    while (st.step())
        out.push_back(read_item(st));
    return out;
}

size_t SqliteDatabase::count_items(QueueStatus status) {
    if (unavailable("count_items"))
        return 0;
    statement st{db_, "SELECT COUNT(*) FROM message_queue WHERE status = ?"};
    st.bind_text(to_string(status));
    return st.step() ? static_cast<size_t>(st.integer(0)) : 0;
}

bool SqliteDatabase::update_item(std::string_view id, const mutator<QueueItem>& fn) {
    if (unavailable("update_item"))
        return false;
    transaction tx{db_};
    auto item = get_item(id);
    if (!item)
        return false;
    auto original_id = item->id;
    fn(*item);
    item->id = std::move(original_id);
    write_item(db_, *item);
    tx.commit();
    return true;
}

void SqliteDatabase::delete_item(std::string_view id) {
    if (unavailable("delete_item"))
        return;
    delete_by_key(db_, "DELETE FROM message_queue WHERE id = ?", id);
}

void SqliteDatabase::clear_items() {
    if (unavailable("clear_items"))
        return;
    exec("DELETE FROM message_queue");
}

// offlineActions

void SqliteDatabase::put_action(const OfflineAction& a) {
    if (unavailable("put_action"))
        return;
    write_action(db_, a);
}

std::optional<OfflineAction> SqliteDatabase::get_action(std::string_view id) {
    if (unavailable("get_action"))
        return std::nullopt;
    statement st{db_, (ACTION_SELECT + "WHERE id = ?"s).c_str()};
    st.bind_text(id);
    if (!st.step())
        return std::nullopt;
    return read_action(st);
}

std::vector<OfflineAction> SqliteDatabase::all_actions() {
    std::vector<OfflineAction> out;
    if (unavailable("all_actions"))
        return out;
    statement st{db_, (ACTION_SELECT + "ORDER BY timestamp, rowid"s).c_str()};
    while (st.step())
        out.push_back(read_action(st));
    return out;
}

size_t SqliteDatabase::count_actions() {
    if (unavailable("count_actions"))
        return 0;
    return count(db_, "SELECT COUNT(*) FROM offline_actions");
}

bool SqliteDatabase::update_action(std::string_view id, const mutator<OfflineAction>& fn) {
    if (unavailable("update_action"))
        return false;
    transaction tx{db_};
    auto a = get_action(id);
    if (!a)
        return false;
    auto original_id = a->id;
    fn(*a);
    a->id = std::move(original_id);
    write_action(db_, *a);
    tx.commit();
    return true;
}

void SqliteDatabase::delete_action(std::string_view id) {
    if (unavailable("delete_action"))
        return;
    delete_by_key(db_, "DELETE FROM offline_actions WHERE id = ?", id);
}

void SqliteDatabase::clear_actions() {
    if (unavailable("clear_actions"))
        return;
    exec("DELETE FROM offline_actions");
}

// failedMessages

void SqliteDatabase::put_failed(const FailedMessage& f) {
    if (unavailable("put_failed"))
        return;
    write_failed(db_, f);
}

std::optional<FailedMessage> SqliteDatabase::get_failed(std::string_view id) {
    if (unavailable("get_failed"))
        return std::nullopt;
    statement st{db_, (FAILED_SELECT + "WHERE id = ?"s).c_str()};
    st.bind_text(id);
    if (!st.step())
        return std::nullopt;
    return read_failed(st);
}

std::vector<FailedMessage> SqliteDatabase::all_failed() {
    std::vector<FailedMessage> out;
    if (unavailable("all_failed"))
        return out;
    statement st{db_, (FAILED_SELECT + "ORDER BY timestamp, rowid"s).c_str()};
    while (st.step())
        out.push_back(read_failed(st));
    return out;
}

size_t SqliteDatabase::count_failed() {
    if (unavailable("count_failed"))
        return 0;
    return count(db_, "SELECT COUNT(*) FROM failed_messages");
}

void SqliteDatabase::delete_failed(std::string_view id) {
    if (unavailable("delete_failed"))
        return;
    delete_by_key(db_, "DELETE FROM failed_messages WHERE id = ?", id);
}

size_t SqliteDatabase::prune_failed(sys_ms cutoff) {
    if (unavailable("prune_failed"))
        return 0;
    statement st{db_, "DELETE FROM failed_messages WHERE timestamp <= ?"};
    st.bind_time(cutoff).run();
    return static_cast<size_t>(st.changes());
}

void SqliteDatabase::clear_failed() {
    if (unavailable("clear_failed"))
        return;
    exec("DELETE FROM failed_messages");
}

// syncStatus

void SqliteDatabase::put_status(const SyncStatus& s) {
    if (unavailable("put_status"))
        return;
    write_status(db_, s);
}

std::optional<SyncStatus> SqliteDatabase::get_status(std::string_view conversation_id) {
    if (unavailable("get_status"))
        return std::nullopt;
    statement st{db_, (STATUS_SELECT + "WHERE conversation_id = ?"s).c_str()};
    st.bind_text(conversation_id);
    if (!st.step())
        return std::nullopt;
    return read_status(st);
}

std::vector<SyncStatus> SqliteDatabase::all_statuses() {
    std::vector<SyncStatus> out;
    if (unavailable("all_statuses"))
        return out;
    statement st{db_, (STATUS_SELECT + "ORDER BY conversation_id"s).c_str()};
    while (st.step())
        out.push_back(read_status(st));
    return out;
}

SyncStatus SqliteDatabase::update_status(
        std::string_view conversation_id, const mutator<SyncStatus>& fn) {
    SyncStatus s;
    s.conversation_id = conversation_id;
    if (unavailable("update_status")) {
        fn(s);
        s.conversation_id = conversation_id;
        return s;
    }
    transaction tx{db_};
    if (auto existing = get_status(conversation_id))
        s = std::move(*existing);
    fn(s);
    s.conversation_id = conversation_id;
    write_status(db_, s);
    tx.commit();
    return s;
}

void SqliteDatabase::delete_status(std::string_view conversation_id) {
    if (unavailable("delete_status"))
        return;
    delete_by_key(db_, "DELETE FROM sync_status WHERE conversation_id = ?", conversation_id);
}

void SqliteDatabase::clear_statuses() {
    if (unavailable("clear_statuses"))
        return;
    exec("DELETE FROM sync_status");
}

bool SqliteDatabase::move_to_failed(std::string_view item_id, const FailedMessage& failed) {
    if (unavailable("move_to_failed"))
        return false;
    transaction tx{db_};
    statement del{db_, "DELETE FROM message_queue WHERE id = ?"};
    del.bind_text(item_id).run();
    if (del.changes() == 0)
        return false;
    write_failed(db_, failed);
    tx.commit();
    return true;
}

bool SqliteDatabase::requeue_failed(std::string_view failed_id, const QueueItem& item) {
    if (unavailable("requeue_failed"))
        return false;
    transaction tx{db_};
    statement del{db_, "DELETE FROM failed_messages WHERE id = ?"};
    del.bind_text(failed_id).run();
    if (del.changes() == 0)
        return false;
    write_item(db_, item);
    tx.commit();
    return true;
}

}  // namespace courier
