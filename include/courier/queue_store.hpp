#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "types.hpp"

namespace courier {

enum class ContentType { text, image, file, post_share };

std::string_view to_string(ContentType t);
// Throws std::invalid_argument for an unrecognised name.
ContentType content_type_from_string(std::string_view s);

// `sent` is not a status: a sent item is removed from the queue.
enum class QueueStatus { pending, sending };

std::string_view to_string(QueueStatus s);
QueueStatus queue_status_from_string(std::string_view s);

/// One outbound message awaiting delivery (`messageQueue` table).
struct QueueItem {
    std::string id;
    std::string conversation_id;
    std::string content;
    ContentType content_type = ContentType::text;
    sys_ms timestamp;
    int retry_count = 0;
    QueueStatus status = QueueStatus::pending;
    // Opaque attachment references (upload ids, urls) sent along with the content.
    std::vector<std::string> attachments;
};

namespace action {

    struct mark_read {
        std::string conversation_id;
    };

    struct delete_message {
        std::string message_id;
    };

    struct leave_conversation {
        std::string conversation_id;
    };

    // Loaded from a persisted record whose type this build does not know; never executes
    // successfully.
    struct unknown {
        std::string type;
        std::string data;  // raw JSON payload
    };

    using any = std::variant<mark_read, delete_message, leave_conversation, unknown>;

    /// Returns the persisted type tag, e.g. "mark_read".
    std::string_view type_name(const any& a);

    /// Serializes the payload of `a` as a JSON object, e.g. `{"conversationId":"abc"}`.
    std::string data_json(const any& a);

    /// Rebuilds an action from its type tag and JSON payload.  Unrecognised types produce an
    /// `unknown` action; a known type with a malformed payload throws std::invalid_argument.
    any parse(std::string_view type, std::string_view data);

}  // namespace action

/// A non-message side effect replayed when connectivity returns (`offlineActions` table).
struct OfflineAction {
    std::string id;
    action::any action;
    sys_ms timestamp;
    int retry_count = 0;
    int max_retries = 3;
};

/// A message that exhausted its retries or was rejected outright (`failedMessages` table).
struct FailedMessage {
    std::string id;
    std::string original_message_id;
    std::string conversation_id;
    std::string content;
    ContentType content_type = ContentType::text;
    sys_ms original_timestamp;
    std::string failure_reason;
    sys_ms timestamp;
    int retry_count = 0;
};

enum class SyncState { syncing, synced, error, offline };

std::string_view to_string(SyncState s);
SyncState sync_state_from_string(std::string_view s);

/// Per-conversation sync state (`syncStatus` table).
struct SyncStatus {
    std::string conversation_id;
    SyncState status = SyncState::offline;
    int progress = 0;  // 0-100
    int pending_messages = 0;
    sys_ms last_sync_time;
    std::optional<std::string> error_message;
    int retry_count = 0;
};

template <typename T>
using mutator = std::function<void(T&)>;

/// Persistence interface for the four delivery tables.  Each method is one transaction against
/// the backing store; the `update_*` methods and the two `move`/`requeue` helpers perform their
/// read-modify-write inside a single transaction so concurrent writers cannot lose updates.
///
/// Listing methods return queue items ordered by creation (timestamp, then insertion order).
class QueueStore {
  public:
    virtual ~QueueStore() = default;

    // messageQueue
    virtual void put_item(const QueueItem& item) = 0;
    virtual std::optional<QueueItem> get_item(std::string_view id) = 0;
    virtual std::vector<QueueItem> all_items() = 0;
    virtual std::vector<QueueItem> items_by_status(QueueStatus status) = 0;
    virtual std::vector<QueueItem> items_by_conversation(std::string_view conversation_id) = 0;
    virtual size_t count_items(QueueStatus status) = 0;
    // Applies `fn` to the stored item and writes it back; returns false if there is no such item.
    virtual bool update_item(std::string_view id, const mutator<QueueItem>& fn) = 0;
    virtual void delete_item(std::string_view id) = 0;
    virtual void clear_items() = 0;

    // offlineActions
    virtual void put_action(const OfflineAction& a) = 0;
    virtual std::optional<OfflineAction> get_action(std::string_view id) = 0;
    virtual std::vector<OfflineAction> all_actions() = 0;
    virtual size_t count_actions() = 0;
    virtual bool update_action(std::string_view id, const mutator<OfflineAction>& fn) = 0;
    virtual void delete_action(std::string_view id) = 0;
    virtual void clear_actions() = 0;

    // failedMessages
    virtual void put_failed(const FailedMessage& f) = 0;
    virtual std::optional<FailedMessage> get_failed(std::string_view id) = 0;
    virtual std::vector<FailedMessage> all_failed() = 0;
    virtual size_t count_failed() = 0;
    virtual void delete_failed(std::string_view id) = 0;
    // Deletes failed messages whose `timestamp` is at or before `cutoff`; returns the number
    // removed.
    virtual size_t prune_failed(sys_ms cutoff) = 0;
    virtual void clear_failed() = 0;

    // syncStatus
    virtual void put_status(const SyncStatus& s) = 0;
    virtual std::optional<SyncStatus> get_status(std::string_view conversation_id) = 0;
    virtual std::vector<SyncStatus> all_statuses() = 0;
    // Upsert: applies `fn` to the stored status (or a default one for the conversation if none is
    // stored yet), writes it back and returns the result.
    virtual SyncStatus update_status(
            std::string_view conversation_id, const mutator<SyncStatus>& fn) = 0;
    virtual void delete_status(std::string_view conversation_id) = 0;
    virtual void clear_statuses() = 0;

    // Atomically removes queue item `item_id` and inserts `failed`.  Returns false (and changes
    // nothing) if the item does not exist.
    virtual bool move_to_failed(std::string_view item_id, const FailedMessage& failed) = 0;

    // Atomically removes failed message `failed_id` and inserts `item`.  Returns false (and
    // changes nothing) if the failed message does not exist.
    virtual bool requeue_failed(std::string_view failed_id, const QueueItem& item) = 0;
};

/// Non-persistent QueueStore.  Single-threaded, so every call is trivially transactional.
class MemoryQueueStore : public QueueStore {
    template <typename T>
    struct row {
        uint64_t seq;
        T value;
    };

    uint64_t seq_ = 0;
    std::map<std::string, row<QueueItem>, std::less<>> items_;
    std::map<std::string, row<OfflineAction>, std::less<>> actions_;
    std::map<std::string, FailedMessage, std::less<>> failed_;
    std::map<std::string, SyncStatus, std::less<>> statuses_;

    std::vector<QueueItem> sorted_items(const std::function<bool(const QueueItem&)>& pred) const;

  public:
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
};

}  // namespace courier
