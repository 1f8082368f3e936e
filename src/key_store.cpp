#include "courier/key_store.hpp"

#include "courier/util.hpp"

namespace courier {

MemoryKeyStore::~MemoryKeyStore() {
    clear_keys();
}

std::optional<KeyPair> MemoryKeyStore::get_key_pair(std::string_view user_id) {
    if (auto it = key_pairs_.find(user_id); it != key_pairs_.end())
        return it->second;
    return std::nullopt;
}

void MemoryKeyStore::put_key_pair(const KeyPair& kp) {
    if (auto it = key_pairs_.find(kp.user_id); it != key_pairs_.end())
        sodium_zero_buffer(it->second.private_key.data(), it->second.private_key.size());
    key_pairs_.insert_or_assign(kp.user_id, kp);
}

void MemoryKeyStore::delete_key_pair(std::string_view user_id) {
    if (auto it = key_pairs_.find(user_id); it != key_pairs_.end()) {
        sodium_zero_buffer(it->second.private_key.data(), it->second.private_key.size());
        key_pairs_.erase(it);
    }
}

std::optional<PublicKeyRecord> MemoryKeyStore::get_public_key(std::string_view user_id) {
    if (auto it = public_keys_.find(user_id); it != public_keys_.end())
        return it->second;
    return std::nullopt;
}

void MemoryKeyStore::put_public_key(const PublicKeyRecord& rec) {
    public_keys_.insert_or_assign(rec.user_id, rec);
}

void MemoryKeyStore::delete_public_key(std::string_view user_id) {
    if (auto it = public_keys_.find(user_id); it != public_keys_.end())
        public_keys_.erase(it);
}

void MemoryKeyStore::clear_keys() {
    for (auto& [id, kp] : key_pairs_)
        sodium_zero_buffer(kp.private_key.data(), kp.private_key.size());
    key_pairs_.clear();
    public_keys_.clear();
}

}  // namespace courier
