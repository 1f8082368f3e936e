#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace courier {

/// A user's asymmetric key pair.  One pair is active per user; rotation replaces the whole record.
struct KeyPair {
    std::string user_id;
    ustring public_key;   // SPKI DER
    ustring private_key;  // PKCS#8 DER
    sys_ms created_at;
};

/// A cached copy of a peer's public key, as received over the wire (base64 SPKI).
struct PublicKeyRecord {
    std::string user_id;
    std::string public_key;
    sys_ms created_at;
};

/// Persistence interface for key material: the `keyPairs` and `publicKeys` tables.  Implementations
/// do no validation; the KeyManager owns all key logic.
class KeyStore {
  public:
    virtual ~KeyStore() = default;

    virtual std::optional<KeyPair> get_key_pair(std::string_view user_id) = 0;
    virtual void put_key_pair(const KeyPair& kp) = 0;
    virtual void delete_key_pair(std::string_view user_id) = 0;

    virtual std::optional<PublicKeyRecord> get_public_key(std::string_view user_id) = 0;
    virtual void put_public_key(const PublicKeyRecord& rec) = 0;
    virtual void delete_public_key(std::string_view user_id) = 0;

    // Removes every key pair and public key record.
    virtual void clear_keys() = 0;
};

/// Non-persistent KeyStore, used in tests and by hosts that keep keys elsewhere.
class MemoryKeyStore : public KeyStore {
    std::map<std::string, KeyPair, std::less<>> key_pairs_;
    std::map<std::string, PublicKeyRecord, std::less<>> public_keys_;

  public:
    ~MemoryKeyStore() override;

    std::optional<KeyPair> get_key_pair(std::string_view user_id) override;
    void put_key_pair(const KeyPair& kp) override;
    void delete_key_pair(std::string_view user_id) override;

    std::optional<PublicKeyRecord> get_public_key(std::string_view user_id) override;
    void put_public_key(const PublicKeyRecord& rec) override;
    void delete_public_key(std::string_view user_id) override;

    void clear_keys() override;
};

}  // namespace courier
