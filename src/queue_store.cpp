#include "courier/queue_store.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <tuple>

using namespace std::literals;

namespace courier {

std::string_view to_string(ContentType t) {
    switch (t) {
        case ContentType::text: return "text"sv;
        case ContentType::image: return "image"sv;
        case ContentType::file: return "file"sv;
        case ContentType::post_share: return "post_share"sv;
    }
    throw std::invalid_argument{"Invalid content type"};
}

ContentType content_type_from_string(std::string_view s) {
    if (s == "text")
        return ContentType::text;
    if (s == "image")
        return ContentType::image;
    if (s == "file")
        return ContentType::file;
    if (s == "post_share")
        return ContentType::post_share;
    throw std::invalid_argument{"Invalid content type: "s.append(s)};
}

std::string_view to_string(QueueStatus s) {
    switch (s) {
        case QueueStatus::pending: return "pending"sv;
        case QueueStatus::sending: return "sending"sv;
    }
    throw std::invalid_argument{"Invalid queue status"};
}

QueueStatus queue_status_from_string(std::string_view s) {
    if (s == "pending")
        return QueueStatus::pending;
    if (s == "sending")
        return QueueStatus::sending;
    throw std::invalid_argument{"Invalid queue status: "s.append(s)};
}

std::string_view to_string(SyncState s) {
    switch (s) {
        case SyncState::syncing: return "syncing"sv;
        case SyncState::synced: return "synced"sv;
        case SyncState::error: return "error"sv;
        case SyncState::offline: return "offline"sv;
    }
    throw std::invalid_argument{"Invalid sync state"};
}

SyncState sync_state_from_string(std::string_view s) {
    if (s == "syncing")
        return SyncState::syncing;
    if (s == "synced")
        return SyncState::synced;
    if (s == "error")
        return SyncState::error;
    if (s == "offline")
        return SyncState::offline;
    throw std::invalid_argument{"Invalid sync state: "s.append(s)};
}

namespace action {

    namespace {
        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        std::string required_field(const nlohmann::json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                throw std::invalid_argument{"Invalid action data: missing '"s + key + "'"};
            return it->get<std::string>();
        }
    }  // namespace

    std::string_view type_name(const any& a) {
        return std::visit(
                overloaded{
                        [](const mark_read&) { return "mark_read"sv; },
                        [](const delete_message&) { return "delete_message"sv; },
                        [](const leave_conversation&) { return "leave_conversation"sv; },
                        [](const unknown& u) { return std::string_view{u.type}; }},
                a);
    }

    std::string data_json(const any& a) {
        return std::visit(
                overloaded{
                        [](const mark_read& m) {
                            return nlohmann::json{{"conversationId", m.conversation_id}}.dump();
                        },
                        [](const delete_message& d) {
                            return nlohmann::json{{"messageId", d.message_id}}.dump();
                        },
                        [](const leave_conversation& l) {
                            return nlohmann::json{{"conversationId", l.conversation_id}}.dump();
                        },
                        [](const unknown& u) { return u.data; }},
                a);
    }

    any parse(std::string_view type, std::string_view data) {
        if (type != "mark_read" && type != "delete_message" && type != "leave_conversation")
            return unknown{std::string{type}, std::string{data}};

        auto j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw std::invalid_argument{"Invalid action data: not a JSON object"};

        if (type == "mark_read")
            return mark_read{required_field(j, "conversationId")};
        if (type == "delete_message")
            return delete_message{required_field(j, "messageId")};
        return leave_conversation{required_field(j, "conversationId")};
    }

}  // namespace action

std::vector<QueueItem> MemoryQueueStore::sorted_items(
        const std::function<bool(const QueueItem&)>& pred) const {
    std::vector<const row<QueueItem>*> rows;
    for (auto& [id, r] : items_)
        if (pred(r.value))
            rows.push_back(&r);
    std::sort(rows.begin(), rows.end(), [](auto* a, auto* b) {
        return std::tie(a->value.timestamp, a->seq) < std::tie(b->value.timestamp, b->seq);
    });
    std::vector<QueueItem> out;
    out.reserve(rows.size());
    for (auto* r : rows)
        out.push_back(r->value);
    return out;
}

void MemoryQueueStore::put_item(const QueueItem& item) {
    if (auto it = items_.find(item.id); it != items_.end())
        it->second.value = item;
    else
        items_.emplace(item.id, row<QueueItem>{seq_++, item});
}

std::optional<QueueItem> MemoryQueueStore::get_item(std::string_view id) {
    if (auto it = items_.find(id); it != items_.end())
        return it->second.value;
    return std::nullopt;
}

std::vector<QueueItem> MemoryQueueStore::all_items() {
    return sorted_items([](const QueueItem&) { return true; });
}

std::vector<QueueItem> MemoryQueueStore::items_by_status(QueueStatus status) {
    return sorted_items([status](const QueueItem& i) { return i.status == status; });
}

std::vector<QueueItem> MemoryQueueStore::items_by_conversation(std::string_view conversation_id) {
    return sorted_items(
            [conversation_id](const QueueItem& i) { return i.conversation_id == conversation_id; });
}

size_t MemoryQueueStore::count_items(QueueStatus status) {
    return std::count_if(items_.begin(), items_.end(), [status](const auto& kv) {
        return kv.second.value.status == status;
    });
}

bool MemoryQueueStore::update_item(std::string_view id, const mutator<QueueItem>& fn) {
    auto it = items_.find(id);
    if (it == items_.end())
        return false;
    auto copy = it->second.value;
    fn(copy);
    copy.id = it->second.value.id;
    it->second.value = std::move(copy);
    return true;
}

void MemoryQueueStore::delete_item(std::string_view id) {
    if (auto it = items_.find(id); it != items_.end())
        items_.erase(it);
}

void MemoryQueueStore::clear_items() {
    items_.clear();
}

void MemoryQueueStore::put_action(const OfflineAction& a) {
    if (auto it = actions_.find(a.id); it != actions_.end())
        it->second.value = a;
    else
        actions_.emplace(a.id, row<OfflineAction>{seq_++, a});
}

std::optional<OfflineAction> MemoryQueueStore::get_action(std::string_view id) {
    if (auto it = actions_.find(id); it != actions_.end())
        return it->second.value;
    return std::nullopt;
}

std::vector<OfflineAction> MemoryQueueStore::all_actions() {
    std::vector<const row<OfflineAction>*> rows;
    for (auto& [id, r] : actions_)
        rows.push_back(&r);
    std::sort(rows.begin(), rows.end(), [](auto* a, auto* b) {
        return std::tie(a->value.timestamp, a->seq) < std::tie(b->value.timestamp, b->seq);
    });
    std::vector<OfflineAction> out;
    out.reserve(rows.size());
    for (auto* r : rows)
        out.push_back(r->value);
    return out;
}

size_t MemoryQueueStore::count_actions() {
    return actions_.size();
}

bool MemoryQueueStore::update_action(std::string_view id, const mutator<OfflineAction>& fn) {
    auto it = actions_.find(id);
    if (it == actions_.end())
        return false;
    auto copy = it->second.value;
    fn(copy);
    copy.id = it->second.value.id;
    it->second.value = std::move(copy);
    return true;
}

void MemoryQueueStore::delete_action(std::string_view id) {
    if (auto it = actions_.find(id); it != actions_.end())
        actions_.erase(it);
}

void MemoryQueueStore::clear_actions() {
    actions_.clear();
}

void MemoryQueueStore::put_failed(const FailedMessage& f) {
    failed_.insert_or_assign(f.id, f);
}

std::optional<FailedMessage> MemoryQueueStore::get_failed(std::string_view id) {
    if (auto it = failed_.find(id); it != failed_.end())
        return it->second;
    return std::nullopt;
}

std::vector<FailedMessage> MemoryQueueStore::all_failed() {
    std::vector<FailedMessage> out;
    out.reserve(failed_.size());
    for (auto& [id, f] : failed_)
        out.push_back(f);
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

size_t MemoryQueueStore::count_failed() {
    return failed_.size();
}

void MemoryQueueStore::delete_failed(std::string_view id) {
    if (auto it = failed_.find(id); it != failed_.end())
        failed_.erase(it);
}

size_t MemoryQueueStore::prune_failed(sys_ms cutoff) {
    size_t removed = 0;
    for (auto it = failed_.begin(); it != failed_.end();) {
        if (it->second.timestamp <= cutoff) {
            it = failed_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryQueueStore::clear_failed() {
    failed_.clear();
}

void MemoryQueueStore::put_status(const SyncStatus& s) {
    statuses_.insert_or_assign(s.conversation_id, s);
}

std::optional<SyncStatus> MemoryQueueStore::get_status(std::string_view conversation_id) {
    if (auto it = statuses_.find(conversation_id); it != statuses_.end())
        return it->second;
    return std::nullopt;
}

std::vector<SyncStatus> MemoryQueueStore::all_statuses() {
    std::vector<SyncStatus> out;
    out.reserve(statuses_.size());
    for (auto& [id, s] : statuses_)
        out.push_back(s);
    return out;
}

SyncStatus MemoryQueueStore::update_status(
        std::string_view conversation_id, const mutator<SyncStatus>& fn) {
    auto it = statuses_.find(conversation_id);
    SyncStatus s;
    if (it != statuses_.end())
        s = it->second;
    else
        s.conversation_id = conversation_id;
    fn(s);
    s.conversation_id = conversation_id;
    statuses_.insert_or_assign(s.conversation_id, s);
    return s;
}

void MemoryQueueStore::delete_status(std::string_view conversation_id) {
    if (auto it = statuses_.find(conversation_id); it != statuses_.end())
        statuses_.erase(it);
}

void MemoryQueueStore::clear_statuses() {
    statuses_.clear();
}

bool MemoryQueueStore::move_to_failed(std::string_view item_id, const FailedMessage& failed) {
    auto it = items_.find(item_id);
    if (it == items_.end())
        return false;
    items_.erase(it);
    failed_.insert_or_assign(failed.id, failed);
    return true;
}

bool MemoryQueueStore::requeue_failed(std::string_view failed_id, const QueueItem& item) {
    auto it = failed_.find(failed_id);
    if (it == failed_.end())
        return false;
    failed_.erase(it);
    put_item(item);
    return true;
}

}  // namespace courier
