#pragma once

#include <stdexcept>
#include <string>

namespace courier {

// Base class of every error raised by the key management and hybrid encryption layer.
struct crypto_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct KeyGenerationError : crypto_error {
    explicit KeyGenerationError(const std::string& cause) :
            crypto_error{"Key pair generation failed: " + cause} {}
};

struct PublicKeyImportError : crypto_error {
    explicit PublicKeyImportError(const std::string& cause) :
            crypto_error{"Public key import failed: " + cause} {}
};

struct MessageEncryptionError : crypto_error {
    explicit MessageEncryptionError(const std::string& cause) :
            crypto_error{"Message encryption failed: " + cause} {}
};

struct MessageDecryptionError : crypto_error {
    explicit MessageDecryptionError(const std::string& cause) :
            crypto_error{"Message decryption failed: " + cause} {}
};

struct KeyBackupError : crypto_error {
    explicit KeyBackupError(const std::string& cause) :
            crypto_error{"Key backup failed: " + cause} {}
};

// Thrown when an operation needs a key pair that the key manager does not hold.
struct KeyNotFoundError : crypto_error {
    explicit KeyNotFoundError(const std::string& user_id) :
            crypto_error{"No key pair found for user " + user_id} {}
};

// Raised by persistent store implementations when the underlying database reports an error.
struct storage_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}  // namespace courier
