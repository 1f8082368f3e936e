#include "courier/key_manager.hpp"

#include <oxenc/base64.h>
#include <sodium/core.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "courier/errors.hpp"
#include "courier/hybrid_cipher.hpp"
#include "courier/random.hpp"
#include "internal.hpp"

using namespace std::literals;

namespace courier {

namespace {

    void wipe(KeyPair& kp) {
        sodium_zero_buffer(kp.private_key.data(), kp.private_key.size());
    }

}  // namespace

KeyManager::KeyManager(KeyStore& store, clock_fn clock) : store_{store}, clock_{std::move(clock)} {
    if (sodium_init() == -1)
        throw std::runtime_error{"libsodium initialization failed!"};
}

void KeyManager::install(const KeyPair& kp) {
    if (auto it = key_pairs_.find(kp.user_id); it != key_pairs_.end()) {
        wipe(it->second);
        it->second = kp;
    } else {
        key_pairs_.emplace(kp.user_id, kp);
    }

    try {
        store_.put_key_pair(kp);
    } catch (const std::exception& e) {
        log(LogLevel::warning,
            "Unable to persist key pair for " + kp.user_id + "; keeping it in memory only: " +
                    e.what());
    }
}

KeyPair KeyManager::generate_key_pair(std::string_view user_id) {
    hybrid::rsa_keypair rsa;
    try {
        rsa = hybrid::generate_rsa_keypair();
    } catch (const std::exception& e) {
        log(LogLevel::error, "Key pair generation failed for "s.append(user_id) + ": " + e.what());
        throw KeyGenerationError{e.what()};
    }

    KeyPair kp{
            std::string{user_id}, std::move(rsa.public_key), std::move(rsa.private_key), clock_()};
    install(kp);
    log(LogLevel::info, "Generated new key pair for "s.append(user_id));
    return kp;
}

std::optional<KeyPair> KeyManager::get_key_pair(std::string_view user_id) {
    if (auto it = key_pairs_.find(user_id); it != key_pairs_.end())
        return it->second;

    std::optional<KeyPair> kp;
    try {
        kp = store_.get_key_pair(user_id);
    } catch (const std::exception& e) {
        log(LogLevel::warning, "Unable to load key pair for "s.append(user_id) + ": " + e.what());
        return std::nullopt;
    }
    if (kp)
        key_pairs_.emplace(kp->user_id, *kp);
    return kp;
}

std::string KeyManager::export_public_key(std::string_view user_id) {
    auto kp = get_key_pair(user_id);
    if (!kp)
        throw KeyNotFoundError{std::string{user_id}};
    return oxenc::to_base64(kp->public_key.begin(), kp->public_key.end());
}

ustring KeyManager::import_public_key(std::string_view public_key_b64) {
    if (public_key_b64.empty() || !oxenc::is_base64(public_key_b64))
        throw PublicKeyImportError{"input is not valid base64"};

    ustring der;
    oxenc::from_base64(public_key_b64.begin(), public_key_b64.end(), std::back_inserter(der));
    try {
        hybrid::validate_public_key(der);
    } catch (const std::invalid_argument& e) {
        throw PublicKeyImportError{e.what()};
    }
    return der;
}

EncryptedEnvelope KeyManager::encrypt_message(
        std::string_view content,
        std::string_view recipient_public_key,
        std::string_view sender_id) {
    try {
        auto recipient = import_public_key(recipient_public_key);
        auto env = hybrid::encrypt(to_unsigned_sv(content), recipient);
        log(LogLevel::debug,
            "Encrypted " + std::to_string(content.size()) + "-byte message from "s.append(
                                                                   sender_id));
        return env;
    } catch (const std::exception& e) {
        log(LogLevel::error, "Message encryption failed: "s + e.what());
        throw MessageEncryptionError{e.what()};
    }
}

std::string KeyManager::decrypt_message(
        const EncryptedEnvelope& envelope, std::string_view recipient_id) {
    auto kp = get_key_pair(recipient_id);
    if (!kp)
        throw MessageDecryptionError{"no key pair for recipient "s.append(recipient_id)};

    try {
        auto plaintext = hybrid::decrypt(envelope, kp->private_key);
        std::string result{from_unsigned_sv(plaintext)};
        sodium_zero_buffer(plaintext.data(), plaintext.size());
        wipe(*kp);
        return result;
    } catch (const std::exception& e) {
        wipe(*kp);
        throw MessageDecryptionError{e.what()};
    }
}

bool KeyManager::verify_message_integrity(
        std::string_view original,
        const EncryptedEnvelope& envelope,
        std::string_view recipient_id) {
    try {
        return decrypt_message(envelope, recipient_id) == original;
    } catch (const std::exception& e) {
        log(LogLevel::debug, "Integrity check failed: "s + e.what());
        return false;
    }
}

EncryptionInfo KeyManager::generate_encryption_info(std::string_view conversation_id) const {
    auto now = clock_();
    EncryptionInfo info;
    info.algorithm = hybrid::ALGORITHM;
    info.key_id = std::string{conversation_id} + "_" + std::to_string(epoch_ms(now));
    info.version = 1;
    info.metadata.rsa_key_size = hybrid::RSA_KEY_BITS;
    info.metadata.aes_key_size = hybrid::AES_KEY_BITS;
    info.metadata.iv_size = static_cast<int>(hybrid::IV_SIZE);
    info.metadata.created_at = now;
    return info;
}

ConversationEncryptionStatus KeyManager::get_conversation_encryption_status(
        std::string_view conversation_id, const std::vector<std::string>& participants) {
    ConversationEncryptionStatus status;
    for (const auto& p : participants)
        if (!get_stored_public_key(p) && !get_key_pair(p))
            status.missing_keys.push_back(p);

    status.ready_for_encryption = status.missing_keys.empty();
    status.is_encrypted = status.ready_for_encryption;

    if (!status.ready_for_encryption)
        log(LogLevel::debug,
            "Conversation "s.append(conversation_id) + " is missing " +
                    std::to_string(status.missing_keys.size()) + " participant key(s)");
    return status;
}

bool KeyManager::initialize_conversation_encryption(
        std::string_view conversation_id,
        const std::vector<std::string>& participants,
        std::string_view self_id) {
    try {
        if (!get_key_pair(self_id))
            generate_key_pair(self_id);
        store_public_key(self_id, export_public_key(self_id));
    } catch (const crypto_error& e) {
        log(LogLevel::error,
            "Unable to initialize encryption for conversation "s.append(conversation_id) + ": " +
                    e.what());
        return false;
    }

    return get_conversation_encryption_status(conversation_id, participants).ready_for_encryption;
}

bool KeyManager::rotate_keys(std::string_view user_id) {
    bool published = get_stored_public_key(user_id).has_value();
    try {
        generate_key_pair(user_id);
        if (published)
            store_public_key(user_id, export_public_key(user_id));
    } catch (const crypto_error& e) {
        log(LogLevel::error, "Key rotation failed for "s.append(user_id) + ": " + e.what());
        return false;
    }
    log(LogLevel::info, "Rotated key pair for "s.append(user_id));
    return true;
}

std::string KeyManager::backup_keys(std::string_view user_id, std::string_view passphrase) {
    try {
        auto kp = get_key_pair(user_id);
        if (!kp)
            throw KeyNotFoundError{std::string{user_id}};

        nlohmann::json record{
                {"userId", kp->user_id},
                {"publicKey", bytes_to_json(kp->public_key)},
                {"privateKey", bytes_to_json(kp->private_key)},
                {"createdAt", to_iso8601(kp->created_at)},
                {"version", BACKUP_VERSION}};
        wipe(*kp);
        auto plaintext = record.dump();
        record.clear();

        auto salt = random::random(hybrid::SALT_SIZE);
        auto iv = random::random(hybrid::IV_SIZE);
        auto key = hybrid::derive_key(passphrase, salt);
        auto encrypted =
                hybrid::aes_gcm_encrypt({key.data(), key.size()}, iv, to_unsigned_sv(plaintext));
        sodium_zero_buffer(plaintext.data(), plaintext.size());

        nlohmann::json backup{
                {"encryptedData", bytes_to_json(encrypted)},
                {"salt", bytes_to_json(salt)},
                {"iv", bytes_to_json(iv)}};
        auto out = backup.dump();
        log(LogLevel::info, "Created key backup for "s.append(user_id));
        return oxenc::to_base64(out.begin(), out.end());
    } catch (const std::exception& e) {
        log(LogLevel::error, "Key backup failed for "s.append(user_id) + ": " + e.what());
        throw KeyBackupError{e.what()};
    }
}

bool KeyManager::restore_keys(std::string_view data, std::string_view passphrase) {
    try {
        if (data.empty() || !oxenc::is_base64(data))
            throw std::invalid_argument{"backup data is not valid base64"};
        auto backup = nlohmann::json::parse(oxenc::from_base64(data));
        if (!backup.is_object())
            throw std::invalid_argument{"backup data is not a JSON object"};

        auto encrypted = bytes_from_json(backup, "encryptedData");
        auto salt = bytes_from_json(backup, "salt");
        auto iv = bytes_from_json(backup, "iv");

        auto key = hybrid::derive_key(passphrase, salt);
        auto plaintext = hybrid::aes_gcm_decrypt({key.data(), key.size()}, iv, encrypted);
        auto record = nlohmann::json::parse(plaintext.begin(), plaintext.end());
        sodium_zero_buffer(plaintext.data(), plaintext.size());

        if (!record.is_object() || record.value("version", 0) != BACKUP_VERSION)
            throw std::invalid_argument{"unsupported backup version"};

        KeyPair kp;
        kp.user_id = record.at("userId").get<std::string>();
        kp.public_key = bytes_from_json(record, "publicKey");
        kp.private_key = bytes_from_json(record, "privateKey");
        kp.created_at = from_iso8601(record.at("createdAt").get<std::string>());
        if (kp.user_id.empty())
            throw std::invalid_argument{"backup has no user id"};
        hybrid::validate_public_key(kp.public_key);

        install(kp);
        wipe(kp);
        log(LogLevel::info, "Restored key pair for " + kp.user_id);
        return true;
    } catch (const std::exception& e) {
        log(LogLevel::warning, "Key restore failed: "s + e.what());
        return false;
    }
}

KeyExchangeResult KeyManager::exchange_keys(std::string_view self_id, std::string_view other_id) {
    try {
        auto public_key = export_public_key(self_id);
        log(LogLevel::debug,
            "Prepared key exchange from "s.append(self_id) + " to "s.append(other_id));
        return {true, std::move(public_key)};
    } catch (const crypto_error& e) {
        log(LogLevel::warning, "Key exchange failed: "s + e.what());
        return {false, std::nullopt};
    }
}

void KeyManager::store_public_key(std::string_view user_id, std::string_view public_key_b64) {
    import_public_key(public_key_b64);

    PublicKeyRecord rec{std::string{user_id}, std::string{public_key_b64}, clock_()};
    public_keys_.insert_or_assign(rec.user_id, rec.public_key);
    try {
        store_.put_public_key(rec);
    } catch (const std::exception& e) {
        log(LogLevel::warning, "Unable to persist public key for " + rec.user_id + ": " + e.what());
    }
}

std::optional<std::string> KeyManager::get_stored_public_key(std::string_view user_id) {
    if (auto it = public_keys_.find(user_id); it != public_keys_.end())
        return it->second;

    std::optional<PublicKeyRecord> rec;
    try {
        rec = store_.get_public_key(user_id);
    } catch (const std::exception& e) {
        log(LogLevel::warning, "Unable to load public key for "s.append(user_id) + ": " + e.what());
        return std::nullopt;
    }
    if (!rec)
        return std::nullopt;
    public_keys_.emplace(rec->user_id, rec->public_key);
    return rec->public_key;
}

void KeyManager::clear_all_keys() {
    for (auto& [id, kp] : key_pairs_)
        wipe(kp);
    key_pairs_.clear();
    public_keys_.clear();

    try {
        store_.clear_keys();
    } catch (const std::exception& e) {
        log(LogLevel::error, "Unable to clear persisted keys: "s + e.what());
        return;
    }
    log(LogLevel::info, "Cleared all keys");
}

}  // namespace courier
