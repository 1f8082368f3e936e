#pragma once

#include <string>

#include "key_store.hpp"
#include "log.hpp"
#include "queue_store.hpp"

struct sqlite3;

namespace courier {

/// SQLite-backed implementation of both the KeyStore and the QueueStore: a single database file
/// holding the `key_pairs`, `public_keys`, `message_queue`, `offline_actions`, `failed_messages`
/// and `sync_status` tables.
///
/// If the database cannot be opened (or its schema cannot be created) the object is still usable
/// but "unavailable": every read returns an empty result and every write is a no-op, each logged
/// at warning level.  Errors reported by an open database are thrown as `storage_error`.
class SqliteDatabase : public KeyStore, public QueueStore {
  public:
    /// API: sqlite_store/SqliteDatabase::SqliteDatabase
    ///
    /// Opens (creating if needed) the database at `path` and creates any missing tables.
    ///
    /// Inputs:
    /// - `path` -- filesystem path of the database, or ":memory:" for a private in-memory one.
    /// - `logger` -- optional logging hook; also installed as the `logger` member.
    explicit SqliteDatabase(const std::string& path, logger_fn logger = nullptr);
    ~SqliteDatabase() override;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    logger_fn logger;

    // True if the database was opened successfully.
    bool available() const { return db_ != nullptr; }

    // KeyStore
    std::optional<KeyPair> get_key_pair(std::string_view user_id) override;
    void put_key_pair(const KeyPair& kp) override;
    void delete_key_pair(std::string_view user_id) override;
    std::optional<PublicKeyRecord> get_public_key(std::string_view user_id) override;
    void put_public_key(const PublicKeyRecord& rec) override;
    void delete_public_key(std::string_view user_id) override;
    void clear_keys() override;

    // QueueStore
    void put_item(const QueueItem& item) override;
    std::optional<QueueItem> get_item(std::string_view id) override;
    std::vector<QueueItem> all_items() override;
    std::vector<QueueItem> items_by_status(QueueStatus status) override;
    std::vector<QueueItem> items_by_conversation(std::string_view conversation_id) override;
    size_t count_items(QueueStatus status) override;
    bool update_item(std::string_view id, const mutator<QueueItem>& fn) override;
    void delete_item(std::string_view id) override;
    void clear_items() override;

    void put_action(const OfflineAction& a) override;
    std::optional<OfflineAction> get_action(std::string_view id) override;
    std::vector<OfflineAction> all_actions() override;
    size_t count_actions() override;
    bool update_action(std::string_view id, const mutator<OfflineAction>& fn) override;
    void delete_action(std::string_view id) override;
    void clear_actions() override;

    void put_failed(const FailedMessage& f) override;
    std::optional<FailedMessage> get_failed(std::string_view id) override;
    std::vector<FailedMessage> all_failed() override;
    size_t count_failed() override;
    void delete_failed(std::string_view id) override;
    size_t prune_failed(sys_ms cutoff) override;
    void clear_failed() override;

    void put_status(const SyncStatus& s) override;
    std::optional<SyncStatus> get_status(std::string_view conversation_id) override;
    std::vector<SyncStatus> all_statuses() override;
    SyncStatus update_status(
            std::string_view conversation_id, const mutator<SyncStatus>& fn) override;
    void delete_status(std::string_view conversation_id) override;
    void clear_statuses() override;

    bool move_to_failed(std::string_view item_id, const FailedMessage& failed) override;
    bool requeue_failed(std::string_view failed_id, const QueueItem& item) override;

  private:
    sqlite3* db_ = nullptr;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    // Logs that `what` was skipped because the database is unavailable; returns true if so.
    bool unavailable(std::string_view what) const;

    void exec(const char* sql);
    void create_schema();
};

}  // namespace courier
