#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "envelope.hpp"
#include "key_store.hpp"
#include "log.hpp"
#include "types.hpp"
#include "util.hpp"

namespace courier {

struct EncryptionInfo {
    std::string algorithm;
    std::string key_id;  // "<conversation_id>_<epochMillis>"
    int version;

    struct {
        int rsa_key_size;
        int aes_key_size;
        int iv_size;
        sys_ms created_at;
    } metadata;
};

struct ConversationEncryptionStatus {
    // Always equal to `ready_for_encryption`; kept for callers that check this name.
    bool is_encrypted;
    std::vector<std::string> missing_keys;
    bool ready_for_encryption;
};

struct KeyExchangeResult {
    bool success;
    std::optional<std::string> public_key;
};

/// Owns every user's key pairs and the cache of peer public keys, and performs hybrid encryption
/// on top of them.  Key pairs are kept in an in-memory cache in front of the KeyStore so that a
/// store which is unavailable (or failing) does not prevent encryption within this session.
class KeyManager {
  public:
    static constexpr int BACKUP_VERSION = 1;

    /// API: key_manager/KeyManager::KeyManager
    ///
    /// Constructs a key manager on top of `store`, which must outlive it.
    ///
    /// Inputs:
    /// - `store` -- persistence for key pairs and public keys.
    /// - `clock` -- source of the current time; defaults to the system clock.
    ///
    /// Throws std::runtime_error if libsodium cannot be initialized.
    explicit KeyManager(KeyStore& store, clock_fn clock = now_ms);

    // Optional logging hook; see log.hpp.
    logger_fn logger;

    /// API: key_manager/KeyManager::generate_key_pair
    ///
    /// Generates a 2048-bit RSA-OAEP key pair for `user_id`, installs it as the user's active pair
    /// (replacing any previous one) and returns it.  A failure to persist the pair is logged but
    /// does not fail the call.
    ///
    /// Throws KeyGenerationError if key generation itself fails.
    KeyPair generate_key_pair(std::string_view user_id);

    /// API: key_manager/KeyManager::get_key_pair
    ///
    /// Returns the active key pair of `user_id`, looking at the cache first and then the store.
    std::optional<KeyPair> get_key_pair(std::string_view user_id);

    /// API: key_manager/KeyManager::export_public_key
    ///
    /// Returns the base64-encoded SPKI public key of `user_id`.
    ///
    /// Throws KeyNotFoundError if the user has no key pair.
    std::string export_public_key(std::string_view user_id);

    /// API: key_manager/KeyManager::import_public_key
    ///
    /// Decodes and validates a base64 SPKI RSA public key.
    ///
    /// Outputs:
    /// - the DER-encoded key.
    ///
    /// Throws PublicKeyImportError if the input is not valid base64 or not an RSA public key.
    ustring import_public_key(std::string_view public_key_b64);

    /// API: key_manager/KeyManager::encrypt_message
    ///
    /// Encrypts `content` for the recipient whose base64 public key is given.  Every call uses a
    /// new random AES-256 session key and IV.  Empty content yields an empty `encrypted_content`.
    ///
    /// Inputs:
    /// - `content` -- plaintext message; any size up to (at least) 1 MiB.
    /// - `recipient_public_key` -- base64 SPKI public key of the recipient.
    /// - `sender_id` -- sending user, for logging.
    ///
    /// Throws MessageEncryptionError wrapping the underlying cause on failure.
    EncryptedEnvelope encrypt_message(
            std::string_view content,
            std::string_view recipient_public_key,
            std::string_view sender_id);

    /// API: key_manager/KeyManager::decrypt_message
    ///
    /// Decrypts an envelope with the active private key of `recipient_id`.
    ///
    /// Throws MessageDecryptionError if the recipient has no key pair, the session key cannot be
    /// unwrapped or the content does not authenticate.
    std::string decrypt_message(const EncryptedEnvelope& envelope, std::string_view recipient_id);

    /// API: key_manager/KeyManager::verify_message_integrity
    ///
    /// Returns true if and only if `envelope` decrypts for `recipient_id` to exactly `original`.
    /// Never throws.
    bool verify_message_integrity(
            std::string_view original,
            const EncryptedEnvelope& envelope,
            std::string_view recipient_id);

    /// API: key_manager/KeyManager::generate_encryption_info
    ///
    /// Describes the scheme used for `conversation_id`; the key id embeds the current time.
    EncryptionInfo generate_encryption_info(std::string_view conversation_id) const;

    /// API: key_manager/KeyManager::get_conversation_encryption_status
    ///
    /// Checks which of `participants` have a stored public key.  A participant counts as present
    /// if we hold either a cached public key or a key pair for them.
    ConversationEncryptionStatus get_conversation_encryption_status(
            std::string_view conversation_id, const std::vector<std::string>& participants);

    /// API: key_manager/KeyManager::initialize_conversation_encryption
    ///
    /// Makes sure `self_id` has a key pair (generating one if needed), publishes its public key to
    /// the peer cache, and reports whether every participant is ready for encryption.
    bool initialize_conversation_encryption(
            std::string_view conversation_id,
            const std::vector<std::string>& participants,
            std::string_view self_id);

    /// API: key_manager/KeyManager::rotate_keys
    ///
    /// Replaces the active key pair of `user_id` with a freshly generated one.  Envelopes sealed
    /// for the old pair can no longer be decrypted through this manager.
    ///
    /// Outputs:
    /// - true on success, false if key generation failed.
    bool rotate_keys(std::string_view user_id);

    /// API: key_manager/KeyManager::backup_keys
    ///
    /// Produces a passphrase-protected export of the active key pair of `user_id`.  The key is
    /// derived with PBKDF2-HMAC-SHA256 (100000 iterations, random 16-byte salt) and the record is
    /// sealed with AES-256-GCM.
    ///
    /// Outputs:
    /// - base64 of `{"encryptedData":[...],"salt":[...],"iv":[...]}`.
    ///
    /// Throws KeyBackupError on any failure, including a missing key pair.
    std::string backup_keys(std::string_view user_id, std::string_view passphrase);

    /// API: key_manager/KeyManager::restore_keys
    ///
    /// Decrypts a backup produced by `backup_keys` and installs the contained key pair as the
    /// active pair of the user named inside it.
    ///
    /// Outputs:
    /// - true on success; false if the data is corrupt or the passphrase is wrong.
    bool restore_keys(std::string_view data, std::string_view passphrase);

    /// API: key_manager/KeyManager::exchange_keys
    ///
    /// Exports the public key of `self_id` for delivery to `other_id`.
    KeyExchangeResult exchange_keys(std::string_view self_id, std::string_view other_id);

    /// API: key_manager/KeyManager::store_public_key
    ///
    /// Caches a peer's base64 public key after validating it.
    ///
    /// Throws PublicKeyImportError if the key is invalid.
    void store_public_key(std::string_view user_id, std::string_view public_key_b64);

    /// API: key_manager/KeyManager::get_stored_public_key
    ///
    /// Returns a peer's cached base64 public key, if any.
    std::optional<std::string> get_stored_public_key(std::string_view user_id);

    /// API: key_manager/KeyManager::clear_all_keys
    ///
    /// Wipes every key pair and cached public key, both in memory and in the store.  Safe to call
    /// repeatedly.
    void clear_all_keys();

  private:
    KeyStore& store_;
    clock_fn clock_;
    std::map<std::string, KeyPair, std::less<>> key_pairs_;
    std::map<std::string, std::string, std::less<>> public_keys_;

    void log(LogLevel lvl, std::string msg) const {
        if (logger)
            logger(lvl, std::move(msg));
    }

    // Installs `kp` in the cache and the store; store failures are logged and swallowed.
    void install(const KeyPair& kp);
};

}  // namespace courier
